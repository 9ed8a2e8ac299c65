#pragma once

#include <stdint.h>

#include "app_config.h"
#include "station_store.h"
#include "tuner_controller.h"
#include "tuner_state.h"

namespace fmtuner {

enum class CommandType : uint8_t {
  SeekUp = 0,
  SeekDown = 1,
  SavePreset = 2,
  StepFreqUp = 3,
  StepFreqDown = 4,
  SaveFavorite = 5,
  RecallFavorite = 6,
  ToggleMute = 7,
  TuneStation = 8,
};

struct CommandEvent {
  CommandType type;
  StepSize step;         // StepFreqUp / StepFreqDown only
  uint8_t count;         // steps folded into one event
  uint8_t stationIndex;  // TuneStation only, index into kStationCatalog
};

inline constexpr CommandEvent makeCommand(CommandType type, StepSize step = StepSize::Fine) {
  return {type, step, 1, kNoStationIndex};
}

inline constexpr CommandEvent makeStepCommand(CommandType type, StepSize step, uint8_t count) {
  return {type, step, count, kNoStationIndex};
}

inline constexpr CommandEvent makeStationCommand(uint8_t stationIndex) {
  return {CommandType::TuneStation, StepSize::Fine, 1, stationIndex};
}

inline constexpr const char* commandName(CommandType type) {
  switch (type) {
    case CommandType::SeekUp:
      return "seek-up";
    case CommandType::SeekDown:
      return "seek-down";
    case CommandType::SavePreset:
      return "save-preset";
    case CommandType::StepFreqUp:
      return "step-up";
    case CommandType::StepFreqDown:
      return "step-down";
    case CommandType::SaveFavorite:
      return "save-favorite";
    case CommandType::RecallFavorite:
      return "recall-favorite";
    case CommandType::ToggleMute:
      return "toggle-mute";
    case CommandType::TuneStation:
      return "tune-station";
  }
  return "?";
}

struct DispatchRecord {
  CommandEvent event;
  TunerError result;
  uint16_t frequency10Khz;
};

class DispatchListener {
 public:
  virtual ~DispatchListener() = default;
  virtual void onDispatched(const DispatchRecord& record) = 0;
};

class CommandDispatcher {
 public:
  CommandDispatcher(TunerController& controller, StationStore& store);

  // Restores the last saved station, or tunes the configured default.
  TunerError start();

  // Runs one event now. Busy while a seek is in flight.
  TunerError dispatch(const CommandEvent& event);

  // Serial queue for input gathered by interrupts or callbacks. Events submitted while
  // the controller is seeking are dropped or kept according to config().busyPolicy.
  TunerError submit(const CommandEvent& event);

  // Drains the queue in arrival order; returns the number of events executed.
  uint8_t runPending();

  uint8_t pendingCount() const { return count_; }
  uint32_t droppedCount() const { return dropped_; }
  bool restoredFromStore() const { return restored_; }
  const FavoriteList& favorites() const { return favorites_; }

  void setListener(DispatchListener* listener) { listener_ = listener; }

 private:
  TunerError execute(const CommandEvent& event);
  TunerError recallNextFavorite();
  TunerError tuneStation(uint8_t stationIndex);
  bool push(const CommandEvent& event);
  bool pop(CommandEvent& event);

  TunerController& controller_;
  StationStore& store_;
  DispatchListener* listener_ = nullptr;

  FavoriteList favorites_{};
  uint8_t recallCursor_ = 0;
  bool restored_ = false;

  CommandEvent queue_[kEventQueueCapacity]{};
  uint8_t head_ = 0;
  uint8_t count_ = 0;
  uint32_t dropped_ = 0;
};

}  // namespace fmtuner
