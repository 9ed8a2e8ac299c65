#include <gtest/gtest.h>

#include "../include/station_store.h"
#include "fakes.h"

namespace fmtuner {
namespace {

TEST(StationStore, EmptyStoreHasNoLastFrequency) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);

  uint16_t frequency = 1234;
  EXPECT_FALSE(store.loadLastFrequency(frequency));
  EXPECT_EQ(frequency, 1234);
}

TEST(StationStore, SavedFrequencyLoadsBack) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);

  for (uint16_t f : {8750, 9050, 10550, 10800}) {
    ASSERT_EQ(store.saveFrequency(f), TunerError::None);
    uint16_t loaded = 0;
    ASSERT_TRUE(store.loadLastFrequency(loaded));
    EXPECT_EQ(loaded, f);
  }
  EXPECT_EQ(kv.entries.size(), 1u);
  EXPECT_EQ(kv.entries.count(kPrefsLastKey), 1u);
}

TEST(StationStore, SaveClampsIntoBand) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);

  ASSERT_EQ(store.saveFrequency(11000), TunerError::None);
  uint16_t loaded = 0;
  ASSERT_TRUE(store.loadLastFrequency(loaded));
  EXPECT_EQ(loaded, 10800);
}

TEST(StationStore, FailedWriteIsPersistError) {
  fakes::MemoryStore kv;
  kv.failWrites = true;
  StationStore store(kv, FmBand::EuropeUs);

  EXPECT_EQ(store.saveFrequency(9000), TunerError::PersistError);
  uint16_t loaded = 0;
  EXPECT_FALSE(store.loadLastFrequency(loaded));
}

TEST(StationStore, CorruptBlobReadsAsAbsent) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);
  ASSERT_EQ(store.saveFrequency(9500), TunerError::None);

  std::vector<uint8_t>& raw = kv.entries[kPrefsLastKey];
  raw.back() ^= 0x01;

  uint16_t loaded = 0;
  EXPECT_FALSE(store.loadLastFrequency(loaded));
}

TEST(StationStore, WrongSizedBlobReadsAsAbsent) {
  fakes::MemoryStore kv;
  const uint8_t junk[] = {1, 2, 3};
  kv.putBytes(kPrefsLastKey, junk, sizeof(junk));
  StationStore store(kv, FmBand::EuropeUs);

  uint16_t loaded = 0;
  EXPECT_FALSE(store.loadLastFrequency(loaded));
}

TEST(StationStore, OutOfBandValueReadsAsAbsent) {
  fakes::MemoryStore kv;
  StationStore japan(kv, FmBand::Japan);
  ASSERT_EQ(japan.saveFrequency(7800), TunerError::None);

  StationStore europe(kv, FmBand::EuropeUs);
  uint16_t loaded = 0;
  EXPECT_FALSE(europe.loadLastFrequency(loaded));
  EXPECT_TRUE(japan.loadLastFrequency(loaded));
  EXPECT_EQ(loaded, 7800);
}

TEST(StationStore, EraseRemovesLastFrequency) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);
  ASSERT_EQ(store.saveFrequency(9500), TunerError::None);

  EXPECT_TRUE(store.eraseLastFrequency());
  uint16_t loaded = 0;
  EXPECT_FALSE(store.loadLastFrequency(loaded));
  EXPECT_FALSE(store.eraseLastFrequency());
}

TEST(StationStore, FavoritesFillRoundRobin) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);
  FavoriteList favorites{};
  clearFavorites(favorites);

  for (uint16_t i = 0; i < kFavoriteCount + 2; ++i) {
    ASSERT_EQ(store.saveFavorite(static_cast<uint16_t>(8800 + i * 100), favorites), TunerError::None);
  }

  // Slots 0 and 1 were overwritten by the ninth and tenth saves.
  EXPECT_EQ(favorites.writeIndex, 2);
  EXPECT_EQ(favorites.slots[0].frequency10Khz, 8800 + 8 * 100);
  EXPECT_EQ(favorites.slots[1].frequency10Khz, 8800 + 9 * 100);
  EXPECT_EQ(favorites.slots[2].frequency10Khz, 8800 + 2 * 100);

  FavoriteList loaded{};
  ASSERT_TRUE(store.loadFavorites(loaded));
  EXPECT_EQ(loaded.writeIndex, favorites.writeIndex);
  for (uint8_t i = 0; i < kFavoriteCount; ++i) {
    EXPECT_EQ(loaded.slots[i].used, 1);
    EXPECT_EQ(loaded.slots[i].frequency10Khz, favorites.slots[i].frequency10Khz);
  }
}

TEST(StationStore, FailedFavoriteWriteKeepsList) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);
  FavoriteList favorites{};
  clearFavorites(favorites);
  ASSERT_EQ(store.saveFavorite(9000, favorites), TunerError::None);

  kv.failWrites = true;
  EXPECT_EQ(store.saveFavorite(9500, favorites), TunerError::PersistError);
  EXPECT_EQ(favorites.writeIndex, 1);
  EXPECT_EQ(favorites.slots[1].used, 0);
}

TEST(StationStore, MissingFavoritesLoadCleared) {
  fakes::MemoryStore kv;
  StationStore store(kv, FmBand::EuropeUs);
  FavoriteList favorites{};
  favorites.slots[0].used = 1;
  favorites.writeIndex = 5;

  EXPECT_FALSE(store.loadFavorites(favorites));
  EXPECT_EQ(favorites.slots[0].used, 0);
  EXPECT_EQ(favorites.writeIndex, 0);
}

TEST(StationStore, ChecksumIsFnv1a) {
  EXPECT_EQ(checksumForBytes(nullptr, 0), 2166136261u);
  const uint8_t a[] = {'a'};
  EXPECT_EQ(checksumForBytes(a, 1), 0xE40C292Cu);
}

}  // namespace
}  // namespace fmtuner
