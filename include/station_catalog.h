#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include "bandplan.h"

namespace fmtuner {

struct StationDef {
  const char* id;
  const char* name;
  uint16_t frequency10Khz;
};

// Paris-area broadcasters.
inline constexpr StationDef kStationCatalog[] = {
    {"france_inter", "France Inter", 8760},
    {"france_inter_2", "France Inter Test 2", 8780},
    {"nostalgie", "Nostalgie", 9040},
    {"cherie_fm", "Cherie FM", 9130},
    {"le_mouv", "Le Mouv", 9210},
    {"rire_et_chansons", "Rire & Chansons", 9740},
    {"radio_enghien", "Station Enghien", 9800},
    {"nrj", "NRJ", 10030},
    {"rmc", "RMC", 10310},
    {"europe_2", "Europe 2", 10350},
    {"rfm", "RFM", 10390},
    {"rtl", "RTL", 10430},
    {"europe_1", "Europe 1", 10470},
    {"fip", "FIP", 10510},
    {"france_info", "France Info", 10550},
    {"rtl_2", "RTL2", 10590},
    {"bfm_business", "BFM Business", 9640},
};

inline constexpr size_t kStationCatalogCount = sizeof(kStationCatalog) / sizeof(kStationCatalog[0]);

inline const StationDef* findStationById(const char* id) {
  if (id == nullptr) {
    return nullptr;
  }
  for (size_t i = 0; i < kStationCatalogCount; ++i) {
    if (strcmp(kStationCatalog[i].id, id) == 0) {
      return &kStationCatalog[i];
    }
  }
  return nullptr;
}

// Catalog index for an id, kNoStationIndex when unknown.
inline constexpr uint8_t kNoStationIndex = 0xFF;

inline uint8_t stationIndexById(const char* id) {
  const StationDef* station = findStationById(id);
  return station != nullptr ? static_cast<uint8_t>(station - kStationCatalog) : kNoStationIndex;
}

inline const StationDef* findStationByFrequency(const FmBandDef& band, uint16_t frequency10Khz) {
  if (!isWithinBand(band, frequency10Khz)) {
    return nullptr;
  }
  for (size_t i = 0; i < kStationCatalogCount; ++i) {
    if (kStationCatalog[i].frequency10Khz == frequency10Khz) {
      return &kStationCatalog[i];
    }
  }
  return nullptr;
}

}  // namespace fmtuner
