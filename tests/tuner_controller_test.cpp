#include <gtest/gtest.h>

#include "../include/tuner_controller.h"
#include "fakes.h"

namespace fmtuner {
namespace {

class TunerControllerTest : public ::testing::Test {
 protected:
  fakes::FakeChip chip;
  fakes::ManualClock clock;
  TunerConfig config = fakes::testConfig();
};

TEST_F(TunerControllerTest, StartsIdleWithoutFrequency) {
  TunerController controller(chip, clock, config);
  EXPECT_EQ(controller.state().phase, TuningPhase::Idle);
  EXPECT_EQ(controller.frequency10Khz(), 0);
  EXPECT_TRUE(chip.writes.empty());
}

TEST_F(TunerControllerTest, TuneToClampsIntoBand) {
  TunerController controller(chip, clock, config);

  EXPECT_EQ(controller.tuneTo(12000), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 10800);
  EXPECT_EQ(controller.state().phase, TuningPhase::Tuned);
  EXPECT_EQ(chip.frequency10Khz(), 10800);

  EXPECT_EQ(controller.tuneTo(100), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 8750);
  ASSERT_EQ(chip.writes.size(), 2u);
  EXPECT_FALSE(chip.writes.back().searchEnabled);
}

TEST_F(TunerControllerTest, TuneToBusErrorLeavesStateUnchanged) {
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9000), TunerError::None);

  chip.failWriteAt = 1;
  EXPECT_EQ(controller.tuneTo(9500), TunerError::BusError);
  EXPECT_EQ(controller.frequency10Khz(), 9000);
  EXPECT_EQ(controller.state().phase, TuningPhase::Tuned);
  EXPECT_EQ(controller.state().frequency10Khz, 9000);
}

TEST_F(TunerControllerTest, JapanBandSetsBandSelect) {
  config = fakes::testConfig(FmBand::Japan);
  fakes::FakeChip japanChip(FmBand::Japan);
  TunerController controller(japanChip, clock, config);

  ASSERT_EQ(controller.tuneTo(8000), TunerError::None);
  EXPECT_TRUE(japanChip.writes.back().japanBand);
  EXPECT_EQ(controller.tuneTo(9500), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 9100);
}

TEST_F(TunerControllerTest, StepFromNothingTunedUsesDefault) {
  config.defaultFrequency10Khz = 9000;
  TunerController controller(chip, clock, config);

  EXPECT_EQ(controller.stepFrequency(SeekDirection::Up, StepSize::Fine), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 9010);
}

TEST_F(TunerControllerTest, StepsStayInBandAndAreIdempotentAtEdges) {
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10750), TunerError::None);

  EXPECT_EQ(controller.stepFrequency(SeekDirection::Up, StepSize::Coarse), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 10800);
  const size_t writesAtEdge = chip.writes.size();

  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(controller.stepFrequency(SeekDirection::Up, StepSize::Fine), TunerError::None);
    EXPECT_EQ(controller.frequency10Khz(), 10800);
  }
  EXPECT_EQ(chip.writes.size(), writesAtEdge);

  ASSERT_EQ(controller.tuneTo(8780), TunerError::None);
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(controller.stepFrequency(SeekDirection::Down, StepSize::Coarse), TunerError::None);
    EXPECT_EQ(controller.frequency10Khz(), 8750);
  }
}

TEST_F(TunerControllerTest, SeekUpLandsOnNextStation) {
  chip.stations = {8800, 9520, 10410};
  chip.pollsUntilReady = 3;
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9000), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 9520);
  EXPECT_EQ(controller.state().phase, TuningPhase::Tuned);
  EXPECT_EQ(chip.reads, 3u);
  EXPECT_EQ(clock.now, 3u * config.pollIntervalMs);
  EXPECT_EQ(controller.lastSignalLevel(), 9);
  EXPECT_TRUE(controller.lastStereo());

  // The search starts one channel past the current station.
  const RegisterFields& search = chip.writes.back();
  EXPECT_TRUE(search.searchEnabled);
  EXPECT_TRUE(search.searchUp);
  EXPECT_EQ(search.frequency10Khz, 9010);
}

TEST_F(TunerControllerTest, SeekDownDoesNotReturnCurrentStation) {
  chip.stations = {8800, 9520, 10410};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9520), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Down), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 8800);
  EXPECT_FALSE(chip.writes.back().searchUp);
}

TEST_F(TunerControllerTest, SeekFromTopEdgeWrapsOnceToBottom) {
  chip.stations = {8800, 10000};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10790), TunerError::None);
  chip.writes.clear();

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 8800);

  ASSERT_EQ(chip.writes.size(), 3u);
  EXPECT_TRUE(chip.writes[0].searchEnabled);
  EXPECT_EQ(chip.writes[0].frequency10Khz, 10800);
  EXPECT_FALSE(chip.writes[1].searchEnabled);
  EXPECT_EQ(chip.writes[1].frequency10Khz, 8750);
  EXPECT_TRUE(chip.writes[2].searchEnabled);
  EXPECT_EQ(chip.writes[2].frequency10Khz, 8750);
}

TEST_F(TunerControllerTest, WrapAcceptsStationOnTheBottomEdge) {
  chip.stations = {8750};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10790), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 8750);
}

TEST_F(TunerControllerTest, SeekUpAcceptsStationOnTopEdge) {
  chip.stations = {10800};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10500), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 10800);
  EXPECT_EQ(chip.searchWrites(), 1u);
}

TEST_F(TunerControllerTest, SeekDownAcceptsStationOnBottomEdge) {
  chip.stations = {8750, 10000};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9000), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Down), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 8750);
  EXPECT_EQ(chip.searchWrites(), 1u);
}

TEST_F(TunerControllerTest, SeekFromEdgeWrapsBeforeSearching) {
  chip.stations = {9000};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10800), TunerError::None);
  chip.writes.clear();

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 9000);
  EXPECT_EQ(chip.searchWrites(), 1u);
  EXPECT_EQ(chip.writes.front().frequency10Khz, 8750);
}

TEST_F(TunerControllerTest, EmptyBandRestoresStartAfterOneWrap) {
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9500), TunerError::None);
  chip.writes.clear();

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::NoStationFound);
  EXPECT_EQ(chip.searchWrites(), 2u);
  EXPECT_EQ(controller.frequency10Khz(), 9500);
  EXPECT_EQ(controller.state().phase, TuningPhase::Tuned);
  EXPECT_EQ(chip.frequency10Khz(), 9500);
}

TEST_F(TunerControllerTest, WrapDisabledStopsAtEdge) {
  config.wrapOnEdge = false;
  chip.stations = {8800};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10700), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::NoStationFound);
  EXPECT_EQ(chip.searchWrites(), 1u);
  EXPECT_EQ(controller.frequency10Khz(), 10700);

  ASSERT_EQ(controller.tuneTo(10800), TunerError::None);
  chip.writes.clear();
  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::NoStationFound);
  EXPECT_TRUE(chip.writes.empty());
  EXPECT_EQ(controller.frequency10Khz(), 10800);
}

TEST_F(TunerControllerTest, ChipNaturalWrapIsAccepted) {
  chip.stations = {8800};
  chip.naturalWrap = true;
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10000), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 8800);
  EXPECT_EQ(chip.searchWrites(), 1u);
}

TEST_F(TunerControllerTest, SeekTimeoutGoesIdleAndKeepsFrequency) {
  chip.stations = {9500};
  chip.neverReady = true;
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9000), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::SearchTimeout);
  EXPECT_EQ(controller.state().phase, TuningPhase::Idle);
  EXPECT_EQ(controller.frequency10Khz(), 9000);
  EXPECT_EQ(chip.reads, config.maxPolls);
  EXPECT_EQ(clock.delays, config.maxPolls);
}

TEST_F(TunerControllerTest, SeekBusErrorLeavesStateUnchanged) {
  chip.stations = {9500};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9000), TunerError::None);

  chip.failReadAt = 1;
  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::BusError);
  EXPECT_EQ(controller.state().phase, TuningPhase::Tuned);
  EXPECT_EQ(controller.frequency10Khz(), 9000);

  chip.failWriteAt = 1;
  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::BusError);
  EXPECT_EQ(controller.state().phase, TuningPhase::Tuned);
  EXPECT_EQ(controller.frequency10Khz(), 9000);
}

TEST_F(TunerControllerTest, SeekWithNothingTunedStartsAtOppositeEdge) {
  chip.stations = {9500, 10200};
  TunerController controller(chip, clock, config);

  EXPECT_EQ(controller.seek(SeekDirection::Down), TunerError::None);
  EXPECT_EQ(chip.writes.front().frequency10Khz, 10800);
  EXPECT_EQ(controller.frequency10Khz(), 10200);
}

TEST_F(TunerControllerTest, StepAfterFailedSeekRewritesFrame) {
  chip.stations = {9000};
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(10800), TunerError::None);

  // The jump to the bottom edge lands, the search write after it fails.
  chip.failWriteAt = 2;
  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::BusError);
  EXPECT_EQ(controller.frequency10Khz(), 10800);
  EXPECT_EQ(chip.frequency10Khz(), 8750);

  const size_t writesBefore = chip.writes.size();
  EXPECT_EQ(controller.stepFrequency(SeekDirection::Up, StepSize::Coarse), TunerError::None);
  EXPECT_EQ(chip.writes.size(), writesBefore + 1);
  EXPECT_EQ(chip.frequency10Khz(), 10800);

  // Back in sync: edge stepping is write-free again.
  EXPECT_EQ(controller.stepFrequency(SeekDirection::Up, StepSize::Coarse), TunerError::None);
  EXPECT_EQ(chip.writes.size(), writesBefore + 1);
}

TEST_F(TunerControllerTest, MultiStepIsOneWrite) {
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(8750), TunerError::None);

  EXPECT_EQ(controller.stepFrequency(SeekDirection::Up, StepSize::Coarse, 3), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 9050);
  EXPECT_EQ(chip.writes.size(), 2u);

  EXPECT_EQ(controller.stepFrequency(SeekDirection::Down, StepSize::Fine, 200), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 8750);
}

TEST_F(TunerControllerTest, TuneToStationUsesCatalog) {
  TunerController controller(chip, clock, config);

  EXPECT_EQ(controller.tuneToStation("fip"), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 10510);
  EXPECT_EQ(chip.frequency10Khz(), 10510);

  EXPECT_EQ(controller.tuneToStation("no_such_station"), TunerError::NoStationFound);
  EXPECT_EQ(controller.tuneToStation(nullptr), TunerError::NoStationFound);
  EXPECT_EQ(controller.frequency10Khz(), 10510);
  EXPECT_EQ(chip.writes.size(), 1u);
}

TEST_F(TunerControllerTest, TuneToStationRejectsStationOutsideBand) {
  config = fakes::testConfig(FmBand::Japan);
  fakes::FakeChip japanChip(FmBand::Japan);
  TunerController controller(japanChip, clock, config);

  EXPECT_EQ(controller.tuneToStation("fip"), TunerError::NoStationFound);
  EXPECT_FALSE(controller.isTuned());
  EXPECT_TRUE(japanChip.writes.empty());

  EXPECT_EQ(controller.tuneToStation("nostalgie"), TunerError::None);
  EXPECT_EQ(controller.frequency10Khz(), 9040);
}

class BusyProbe : public SeekObserver {
 public:
  explicit BusyProbe(TunerController& controller) : controller_(controller) {}

  void onSeekPoll(uint16_t, uint8_t) override {
    ++polls;
    sawSeeking = controller_.isBusy();
    tuneResult = controller_.tuneTo(9000);
  }

  uint32_t polls = 0;
  bool sawSeeking = false;
  TunerError tuneResult = TunerError::None;

 private:
  TunerController& controller_;
};

TEST_F(TunerControllerTest, RejectsReentrantTuningWhileSeeking) {
  chip.stations = {9500};
  TunerController controller(chip, clock, config);
  BusyProbe probe(controller);
  controller.setSeekObserver(&probe);
  ASSERT_EQ(controller.tuneTo(8800), TunerError::None);

  EXPECT_EQ(controller.seek(SeekDirection::Up), TunerError::None);
  EXPECT_EQ(probe.polls, 1u);
  EXPECT_TRUE(probe.sawSeeking);
  EXPECT_EQ(probe.tuneResult, TunerError::Busy);
  EXPECT_EQ(controller.frequency10Khz(), 9500);
}

TEST_F(TunerControllerTest, MuteRewritesFrameWhenTuned) {
  TunerController controller(chip, clock, config);
  EXPECT_EQ(controller.setMuted(true), TunerError::None);
  EXPECT_TRUE(chip.writes.empty());

  ASSERT_EQ(controller.tuneTo(9500), TunerError::None);
  EXPECT_TRUE(chip.writes.back().muted);

  EXPECT_EQ(controller.setMuted(false), TunerError::None);
  EXPECT_FALSE(chip.writes.back().muted);
  EXPECT_EQ(chip.writes.back().frequency10Khz, 9500);
  EXPECT_FALSE(controller.muted());
}

TEST_F(TunerControllerTest, ReadStatusReportsSignal) {
  chip.signalLevel = 5;
  chip.stereo = false;
  TunerController controller(chip, clock, config);
  ASSERT_EQ(controller.tuneTo(9500), TunerError::None);

  RegisterFields status{};
  ASSERT_EQ(controller.readStatus(status), TunerError::None);
  EXPECT_EQ(status.frequency10Khz, 9500);
  EXPECT_EQ(status.signalLevel, 5);
  EXPECT_FALSE(controller.lastStereo());

  chip.failReadAt = 1;
  EXPECT_EQ(controller.readStatus(status), TunerError::BusError);
}

}  // namespace
}  // namespace fmtuner
