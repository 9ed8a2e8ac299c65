#include "../../include/command_dispatcher.h"

namespace fmtuner {

CommandDispatcher::CommandDispatcher(TunerController& controller, StationStore& store)
    : controller_(controller), store_(store) {
  clearFavorites(favorites_);
}

TunerError CommandDispatcher::start() {
  if (!store_.loadFavorites(favorites_)) {
    clearFavorites(favorites_);
  }
  recallCursor_ = 0;

  uint16_t saved = 0;
  restored_ = store_.loadLastFrequency(saved);
  if (restored_) {
    return controller_.tuneTo(saved);
  }
  return controller_.tuneTo(controller_.config().defaultFrequency10Khz);
}

TunerError CommandDispatcher::execute(const CommandEvent& event) {
  switch (event.type) {
    case CommandType::SeekUp:
      return controller_.seek(SeekDirection::Up);
    case CommandType::SeekDown:
      return controller_.seek(SeekDirection::Down);
    case CommandType::SavePreset:
      if (!controller_.isTuned()) {
        return TunerError::NotTuned;
      }
      return store_.saveFrequency(controller_.frequency10Khz());
    case CommandType::StepFreqUp:
      return controller_.stepFrequency(SeekDirection::Up, event.step, event.count);
    case CommandType::StepFreqDown:
      return controller_.stepFrequency(SeekDirection::Down, event.step, event.count);
    case CommandType::SaveFavorite:
      if (!controller_.isTuned()) {
        return TunerError::NotTuned;
      }
      return store_.saveFavorite(controller_.frequency10Khz(), favorites_);
    case CommandType::RecallFavorite:
      return recallNextFavorite();
    case CommandType::ToggleMute:
      return controller_.setMuted(!controller_.muted());
    case CommandType::TuneStation:
      return tuneStation(event.stationIndex);
  }
  return TunerError::None;
}

TunerError CommandDispatcher::recallNextFavorite() {
  for (uint8_t i = 0; i < kFavoriteCount; ++i) {
    const uint8_t slotIndex = static_cast<uint8_t>((recallCursor_ + i) % kFavoriteCount);
    const FavoriteSlot& slot = favorites_.slots[slotIndex];
    if (!slot.used) {
      continue;
    }
    recallCursor_ = static_cast<uint8_t>((slotIndex + 1) % kFavoriteCount);
    return controller_.tuneTo(slot.frequency10Khz);
  }
  return TunerError::NoStationFound;
}

// Picking a named station also makes it the one restored at startup.
TunerError CommandDispatcher::tuneStation(uint8_t stationIndex) {
  if (stationIndex >= kStationCatalogCount) {
    return TunerError::NoStationFound;
  }
  const TunerError error = controller_.tuneToStation(kStationCatalog[stationIndex].id);
  if (error != TunerError::None) {
    return error;
  }
  return store_.saveFrequency(controller_.frequency10Khz());
}

TunerError CommandDispatcher::dispatch(const CommandEvent& event) {
  if (controller_.isBusy()) {
    return TunerError::Busy;
  }

  const TunerError result = execute(event);
  if (listener_ != nullptr) {
    listener_->onDispatched({event, result, controller_.frequency10Khz()});
  }
  return result;
}

TunerError CommandDispatcher::submit(const CommandEvent& event) {
  if (controller_.isBusy() && controller_.config().busyPolicy == BusyPolicy::Drop) {
    ++dropped_;
    return TunerError::Busy;
  }
  if (!push(event)) {
    ++dropped_;
    return TunerError::QueueFull;
  }
  return TunerError::None;
}

uint8_t CommandDispatcher::runPending() {
  uint8_t executed = 0;
  CommandEvent event{};
  while (!controller_.isBusy() && pop(event)) {
    // Per-event results reach the listener.
    (void)dispatch(event);
    ++executed;
  }
  return executed;
}

bool CommandDispatcher::push(const CommandEvent& event) {
  if (count_ >= kEventQueueCapacity) {
    return false;
  }
  queue_[(head_ + count_) % kEventQueueCapacity] = event;
  ++count_;
  return true;
}

bool CommandDispatcher::pop(CommandEvent& event) {
  if (count_ == 0) {
    return false;
  }
  event = queue_[head_];
  head_ = static_cast<uint8_t>((head_ + 1) % kEventQueueCapacity);
  --count_;
  return true;
}

}  // namespace fmtuner
