#include "../../include/station_store.h"

namespace fmtuner {
namespace {

constexpr uint32_t kMagic = 0x464D5453;  // FMTS
constexpr uint16_t kSchemaV1 = 1;

struct PersistedLastStationV1 {
  // 32-bit fixed point, kHz.
  uint32_t frequencyKhz;
};

struct PersistedFavoritesV1 {
  uint32_t frequencyKhz[kFavoriteCount];
  uint8_t used[kFavoriteCount];
  uint8_t writeIndex;
  uint8_t reserved[3];
};

template <typename Payload>
struct PersistedBlob {
  uint32_t magic;
  uint16_t schema;
  uint16_t payloadSize;
  uint32_t checksum;
  Payload payload;
};

template <typename Payload>
bool readBlob(KeyValueStore& store, const char* key, Payload& payload) {
  if (store.getBytesLength(key) != sizeof(PersistedBlob<Payload>)) {
    return false;
  }

  PersistedBlob<Payload> blob{};
  if (store.getBytes(key, &blob, sizeof(blob)) != sizeof(blob)) {
    return false;
  }

  if (blob.magic != kMagic || blob.schema != kSchemaV1 || blob.payloadSize != sizeof(Payload)) {
    return false;
  }

  const uint32_t expectedChecksum = checksumForBytes(reinterpret_cast<const uint8_t*>(&blob.payload), sizeof(Payload));
  if (blob.checksum != expectedChecksum) {
    return false;
  }

  payload = blob.payload;
  return true;
}

template <typename Payload>
bool writeBlob(KeyValueStore& store, const char* key, const Payload& payload) {
  PersistedBlob<Payload> blob{};
  blob.magic = kMagic;
  blob.schema = kSchemaV1;
  blob.payloadSize = sizeof(Payload);
  blob.payload = payload;
  blob.checksum = checksumForBytes(reinterpret_cast<const uint8_t*>(&blob.payload), sizeof(Payload));

  return store.putBytes(key, &blob, sizeof(blob)) == sizeof(blob);
}

uint32_t toKhz(uint16_t frequency10Khz) { return static_cast<uint32_t>(frequency10Khz) * 10U; }

bool fromKhz(const FmBandDef& band, uint32_t frequencyKhz, uint16_t& frequency10Khz) {
  const uint32_t rounded = (frequencyKhz + 5U) / 10U;
  if (rounded > 0xFFFF || !isWithinBand(band, static_cast<uint16_t>(rounded))) {
    return false;
  }
  frequency10Khz = static_cast<uint16_t>(rounded);
  return true;
}

}  // namespace

uint32_t checksumForBytes(const uint8_t* bytes, size_t length) {
  uint32_t acc = 2166136261u;
  for (size_t i = 0; i < length; ++i) {
    acc ^= bytes[i];
    acc *= 16777619u;
  }
  return acc;
}

bool StationStore::loadLastFrequency(uint16_t& frequency10Khz) {
  PersistedLastStationV1 payload{};
  if (!readBlob(store_, kPrefsLastKey, payload)) {
    return false;
  }
  return fromKhz(bandDef(band_), payload.frequencyKhz, frequency10Khz);
}

TunerError StationStore::saveFrequency(uint16_t frequency10Khz) {
  PersistedLastStationV1 payload{};
  payload.frequencyKhz = toKhz(clampToBand(bandDef(band_), frequency10Khz));
  return writeBlob(store_, kPrefsLastKey, payload) ? TunerError::None : TunerError::PersistError;
}

bool StationStore::eraseLastFrequency() { return store_.remove(kPrefsLastKey); }

bool StationStore::loadFavorites(FavoriteList& favorites) {
  clearFavorites(favorites);

  PersistedFavoritesV1 payload{};
  if (!readBlob(store_, kPrefsFavoritesKey, payload)) {
    return false;
  }

  const FmBandDef& band = bandDef(band_);
  for (uint8_t i = 0; i < kFavoriteCount; ++i) {
    uint16_t frequency10Khz = 0;
    if (payload.used[i] && fromKhz(band, payload.frequencyKhz[i], frequency10Khz)) {
      favorites.slots[i].used = 1;
      favorites.slots[i].frequency10Khz = frequency10Khz;
    }
  }
  favorites.writeIndex = static_cast<uint8_t>(payload.writeIndex % kFavoriteCount);
  return true;
}

TunerError StationStore::saveFavorite(uint16_t frequency10Khz, FavoriteList& favorites) {
  FavoriteList next = favorites;
  const uint8_t slotIndex = static_cast<uint8_t>(next.writeIndex % kFavoriteCount);
  next.slots[slotIndex].used = 1;
  next.slots[slotIndex].frequency10Khz = clampToBand(bandDef(band_), frequency10Khz);
  next.writeIndex = static_cast<uint8_t>((slotIndex + 1) % kFavoriteCount);

  PersistedFavoritesV1 payload{};
  for (uint8_t i = 0; i < kFavoriteCount; ++i) {
    payload.used[i] = next.slots[i].used ? 1 : 0;
    payload.frequencyKhz[i] = next.slots[i].used ? toKhz(next.slots[i].frequency10Khz) : 0;
  }
  payload.writeIndex = next.writeIndex;

  if (!writeBlob(store_, kPrefsFavoritesKey, payload)) {
    return TunerError::PersistError;
  }

  favorites = next;
  return TunerError::None;
}

}  // namespace fmtuner
