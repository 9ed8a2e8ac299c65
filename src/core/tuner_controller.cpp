#include "../../include/tuner_controller.h"

namespace fmtuner {

TunerController::TunerController(BusTransport& bus, Clock& clock, const TunerConfig& config)
    : bus_(bus), clock_(clock), config_(config) {
  sanitizeConfig(config_);
}

TunerError TunerController::writeFields(const RegisterFields& fields) {
  RegisterFrame frame{};
  const TunerError error = registers::encode(fields, frame);
  if (error != TunerError::None) {
    return error;
  }
  if (!bus_.write(frame.bytes, kRegisterFrameSize)) {
    return TunerError::BusError;
  }
  return TunerError::None;
}

TunerError TunerController::tuneTo(uint16_t frequency10Khz) {
  if (isBusy()) {
    return TunerError::Busy;
  }

  const uint16_t target = clampToBand(band(), frequency10Khz);
  const TunerError error = writeFields(makeTuneFields(target, config_, muted_));
  if (error != TunerError::None) {
    return error;
  }

  frequency10Khz_ = target;
  state_ = tunedState(target);
  chipOutOfSync_ = false;
  return TunerError::None;
}

TunerError TunerController::tuneToStation(const char* stationId) {
  const StationDef* station = findStationById(stationId);
  if (station == nullptr || !isWithinBand(band(), station->frequency10Khz)) {
    return TunerError::NoStationFound;
  }
  return tuneTo(station->frequency10Khz);
}

TunerError TunerController::stepFrequency(SeekDirection direction, StepSize size, uint8_t count) {
  if (isBusy()) {
    return TunerError::Busy;
  }

  const uint16_t base = frequency10Khz_ != 0 ? frequency10Khz_ : config_.defaultFrequency10Khz;
  const int32_t delta =
      static_cast<int32_t>(stepDelta10Khz(size)) * static_cast<int8_t>(direction) * (count == 0 ? 1 : count);
  const uint16_t target = clampToBand(band(), static_cast<int32_t>(base) + delta);

  if (isTuned() && !chipOutOfSync_ && target == frequency10Khz_) {
    return TunerError::None;
  }
  return tuneTo(target);
}

TunerError TunerController::runSearchPass(uint16_t fromFrequency10Khz,
                                          SeekDirection direction,
                                          RegisterFields& result) {
  const TunerError error = writeFields(makeSearchFields(fromFrequency10Khz, direction, config_, muted_));
  if (error != TunerError::None) {
    return error;
  }

  for (uint8_t poll = 0; poll < config_.maxPolls; ++poll) {
    clock_.delayMs(config_.pollIntervalMs);

    RegisterFrame frame{};
    if (!bus_.read(frame.bytes, kRegisterFrameSize)) {
      return TunerError::BusError;
    }

    result = registers::decode(frame);
    if (observer_ != nullptr) {
      observer_->onSeekPoll(result.frequency10Khz, poll);
    }
    if (result.ready) {
      return TunerError::None;
    }
  }

  return TunerError::SearchTimeout;
}

TunerError TunerController::seek(SeekDirection direction) {
  if (isBusy()) {
    return TunerError::Busy;
  }

  const FmBandDef& fmBand = band();
  const TuningState previousState = state_;
  const uint16_t previousFrequency = frequency10Khz_;
  const uint16_t oppositeEdge = direction == SeekDirection::Up ? fmBand.min10Khz : fmBand.max10Khz;

  bool wrapped = false;
  uint16_t searchFrom = oppositeEdge;
  if (previousFrequency != 0) {
    const int32_t next = static_cast<int32_t>(previousFrequency) +
                         static_cast<int32_t>(kChannelSpacing10Khz) * static_cast<int8_t>(direction);
    if (next >= fmBand.min10Khz && next <= fmBand.max10Khz) {
      searchFrom = static_cast<uint16_t>(next);
    } else if (config_.wrapOnEdge) {
      // Already parked on the edge: the wrap happens before the first pass.
      const TunerError error = writeFields(makeTuneFields(oppositeEdge, config_, muted_));
      if (error != TunerError::None) {
        chipOutOfSync_ = true;
        return error;
      }
      wrapped = true;
    } else {
      return TunerError::NoStationFound;
    }
  }

  state_ = seekingState(direction);

  for (;;) {
    RegisterFields result{};
    const TunerError error = runSearchPass(searchFrom, direction, result);
    if (error == TunerError::SearchTimeout) {
      state_ = idleState();
      return error;
    }
    if (error != TunerError::None) {
      restoreAfterFailedSeek(previousState, previousFrequency);
      return error;
    }

    // Only the chip's band-limit flag marks the edge; a station may sit on it.
    const uint16_t found = snapToChannel(fmBand, result.frequency10Khz);
    if (!result.bandLimit) {
      rememberSignal(result);
      frequency10Khz_ = found;
      state_ = tunedState(found);
      chipOutOfSync_ = false;
      return TunerError::None;
    }

    if (wrapped || !config_.wrapOnEdge) {
      break;
    }

    const TunerError jumpError = writeFields(makeTuneFields(oppositeEdge, config_, muted_));
    if (jumpError != TunerError::None) {
      restoreAfterFailedSeek(previousState, previousFrequency);
      return jumpError;
    }
    wrapped = true;
    searchFrom = oppositeEdge;
  }

  // Nothing receivable: go back to where the search started.
  const uint16_t restore = previousFrequency != 0 ? previousFrequency : config_.defaultFrequency10Khz;
  const TunerError restoreError = writeFields(makeTuneFields(restore, config_, muted_));
  if (restoreError != TunerError::None) {
    restoreAfterFailedSeek(previousState, previousFrequency);
    return restoreError;
  }
  frequency10Khz_ = restore;
  state_ = tunedState(restore);
  chipOutOfSync_ = false;
  return TunerError::NoStationFound;
}

void TunerController::restoreAfterFailedSeek(const TuningState& previousState, uint16_t previousFrequency) {
  state_ = previousState;
  frequency10Khz_ = previousFrequency;
  // The chip may be left on the far edge or in search mode; the next tune must rewrite the frame.
  chipOutOfSync_ = true;
}

TunerError TunerController::setMuted(bool muted) {
  if (isBusy()) {
    return TunerError::Busy;
  }
  if (!isTuned()) {
    muted_ = muted;
    return TunerError::None;
  }

  const TunerError error = writeFields(makeTuneFields(frequency10Khz_, config_, muted));
  if (error != TunerError::None) {
    return error;
  }
  muted_ = muted;
  chipOutOfSync_ = false;
  return TunerError::None;
}

TunerError TunerController::readStatus(RegisterFields& status) {
  RegisterFrame frame{};
  if (!bus_.read(frame.bytes, kRegisterFrameSize)) {
    return TunerError::BusError;
  }
  status = registers::decode(frame);
  rememberSignal(status);
  return TunerError::None;
}

void TunerController::rememberSignal(const RegisterFields& status) {
  lastSignalLevel_ = status.signalLevel;
  lastStereo_ = status.stereo;
}

}  // namespace fmtuner
