#pragma once

#include <stdint.h>

#include "app_config.h"
#include "bandplan.h"
#include "hardware_pins.h"
#include "station_catalog.h"

namespace fmtuner {

enum class TunerError : uint8_t {
  None = 0,
  BusError = 1,
  EncodeOutOfRange = 2,
  SearchTimeout = 3,
  PersistError = 4,
  NoStationFound = 5,
  NotTuned = 6,
  Busy = 7,
  QueueFull = 8,
};

inline constexpr const char* errorName(TunerError error) {
  switch (error) {
    case TunerError::None:
      return "ok";
    case TunerError::BusError:
      return "bus-error";
    case TunerError::EncodeOutOfRange:
      return "encode-out-of-range";
    case TunerError::SearchTimeout:
      return "search-timeout";
    case TunerError::PersistError:
      return "persist-error";
    case TunerError::NoStationFound:
      return "no-station-found";
    case TunerError::NotTuned:
      return "not-tuned";
    case TunerError::Busy:
      return "busy";
    case TunerError::QueueFull:
      return "queue-full";
  }
  return "?";
}

enum class SeekDirection : int8_t {
  Down = -1,
  Up = 1,
};

enum class StepSize : uint8_t {
  Fine = 0,
  Coarse = 1,
};

inline constexpr uint16_t stepDelta10Khz(StepSize size) {
  return size == StepSize::Coarse ? kCoarseStep10Khz : kFineStep10Khz;
}

enum class SearchStopLevel : uint8_t {
  Low = 1,
  Mid = 2,
  High = 3,
};

// What happens to commands that arrive while a seek is in flight.
enum class BusyPolicy : uint8_t {
  Drop = 0,
  Queue = 1,
};

enum class TuningPhase : uint8_t {
  Idle = 0,
  Seeking = 1,
  Tuned = 2,
};

struct TuningState {
  TuningPhase phase;
  SeekDirection direction;  // meaningful while Seeking
  uint16_t frequency10Khz;  // meaningful while Tuned
};

inline constexpr TuningState idleState() { return {TuningPhase::Idle, SeekDirection::Up, 0}; }

inline constexpr TuningState seekingState(SeekDirection direction) {
  return {TuningPhase::Seeking, direction, 0};
}

inline constexpr TuningState tunedState(uint16_t frequency10Khz) {
  return {TuningPhase::Tuned, SeekDirection::Up, frequency10Khz};
}

struct TunerConfig {
  FmBand band;
  uint16_t defaultFrequency10Khz;
  uint16_t pollIntervalMs;
  uint8_t maxPolls;
  SearchStopLevel stopLevel;
  bool wrapOnEdge;
  bool softMute;
  BusyPolicy busyPolicy;

  // Passed through to the bus transport untouched.
  uint8_t i2cSdaPin;
  uint8_t i2cSclPin;
  uint32_t i2cClockHz;
};

inline void sanitizeConfig(TunerConfig& config) {
  config.band = sanitizeBand(static_cast<uint8_t>(config.band));
  const FmBandDef& band = bandDef(config.band);
  if (!isWithinBand(band, config.defaultFrequency10Khz)) {
    config.defaultFrequency10Khz = band.default10Khz;
  }
  if (config.maxPolls == 0) {
    config.maxPolls = 1;
  }
  const uint8_t level = static_cast<uint8_t>(config.stopLevel);
  if (level < static_cast<uint8_t>(SearchStopLevel::Low) || level > static_cast<uint8_t>(SearchStopLevel::High)) {
    config.stopLevel = SearchStopLevel::Mid;
  }
}

inline TunerConfig makeDefaultTunerConfig() {
  TunerConfig config{};
  config.band = FmBand::EuropeUs;

  const StationDef* station = findStationById(kDefaultStationId);
  config.defaultFrequency10Khz = station != nullptr ? station->frequency10Khz : kFallbackDefaultFrequency10Khz;

  config.pollIntervalMs = kSeekPollIntervalMs;
  config.maxPolls = kSeekMaxPolls;
  config.stopLevel = SearchStopLevel::Mid;
  config.wrapOnEdge = kSeekWrapOnEdge;
  config.softMute = true;
  config.busyPolicy = BusyPolicy::Drop;
  config.i2cSdaPin = hw::kPinI2cSda;
  config.i2cSclPin = hw::kPinI2cScl;
  config.i2cClockHz = kTunerI2cClockHz;

  sanitizeConfig(config);
  return config;
}

}  // namespace fmtuner
