#pragma once

#include <stdint.h>

#include "tuner_ports.h"
#include "tuner_registers.h"
#include "tuner_state.h"

namespace fmtuner {

// Owns the tuning state and is the only writer on the tuner bus.
// Not thread safe: every call is expected from the single control loop.
class TunerController {
 public:
  TunerController(BusTransport& bus, Clock& clock, const TunerConfig& config);

  // Clamps to the active band, one bus write, Tuned(frequency) on success.
  TunerError tuneTo(uint16_t frequency10Khz);

  // Hardware search with bounded status polling. When the band edge is reached and
  // wrapOnEdge is set, jumps to the opposite edge and searches once more.
  TunerError seek(SeekDirection direction);

  // Catalog lookup by id; NoStationFound for an unknown id or one outside the band.
  TunerError tuneToStation(const char* stationId);

  // Manual step of count increments from the current frequency, one bus write.
  // Clamps at the band edges, never wraps.
  TunerError stepFrequency(SeekDirection direction, StepSize size, uint8_t count = 1);

  TunerError setMuted(bool muted);

  // One status read; does not change the tuning state.
  TunerError readStatus(RegisterFields& status);

  void setSeekObserver(SeekObserver* observer) { observer_ = observer; }

  const TuningState& state() const { return state_; }
  // Last frequency the chip was tuned to, 0 before the first tune.
  uint16_t frequency10Khz() const { return frequency10Khz_; }
  bool isTuned() const { return state_.phase == TuningPhase::Tuned; }
  bool isBusy() const { return state_.phase == TuningPhase::Seeking; }
  bool muted() const { return muted_; }
  const TunerConfig& config() const { return config_; }
  const FmBandDef& band() const { return bandDef(config_.band); }
  uint8_t lastSignalLevel() const { return lastSignalLevel_; }
  bool lastStereo() const { return lastStereo_; }

 private:
  TunerError writeFields(const RegisterFields& fields);
  TunerError runSearchPass(uint16_t fromFrequency10Khz, SeekDirection direction, RegisterFields& result);
  void restoreAfterFailedSeek(const TuningState& previousState, uint16_t previousFrequency);
  void rememberSignal(const RegisterFields& status);

  BusTransport& bus_;
  Clock& clock_;
  TunerConfig config_;
  SeekObserver* observer_ = nullptr;

  TuningState state_ = idleState();
  uint16_t frequency10Khz_ = 0;
  bool muted_ = false;
  bool chipOutOfSync_ = false;
  uint8_t lastSignalLevel_ = 0;
  bool lastStereo_ = false;
};

}  // namespace fmtuner
