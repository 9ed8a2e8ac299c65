#pragma once

#include <stddef.h>
#include <stdint.h>

#include "app_config.h"
#include "bandplan.h"
#include "tuner_ports.h"
#include "tuner_state.h"

namespace fmtuner {

struct FavoriteSlot {
  uint8_t used;
  uint16_t frequency10Khz;
};

struct FavoriteList {
  FavoriteSlot slots[kFavoriteCount];
  uint8_t writeIndex;
};

// Last-station and favourites persistence. Reads never fail loudly: anything that
// does not validate is reported as absent.
class StationStore {
 public:
  StationStore(KeyValueStore& store, FmBand band) : store_(store), band_(band) {}

  bool loadLastFrequency(uint16_t& frequency10Khz);
  TunerError saveFrequency(uint16_t frequency10Khz);
  bool eraseLastFrequency();

  bool loadFavorites(FavoriteList& favorites);
  // Writes into the slot at favorites.writeIndex and advances it round robin.
  TunerError saveFavorite(uint16_t frequency10Khz, FavoriteList& favorites);

 private:
  KeyValueStore& store_;
  FmBand band_;
};

inline void clearFavorites(FavoriteList& favorites) {
  for (uint8_t i = 0; i < kFavoriteCount; ++i) {
    favorites.slots[i].used = 0;
    favorites.slots[i].frequency10Khz = 0;
  }
  favorites.writeIndex = 0;
}

uint32_t checksumForBytes(const uint8_t* bytes, size_t length);

}  // namespace fmtuner
