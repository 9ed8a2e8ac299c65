#include <Arduino.h>

#include "../../include/app_config.h"
#include "../../include/app_services.h"
#include "../../include/hardware_pins.h"

namespace services::input {
namespace {

using fmtuner::CommandType;
using fmtuner::StepSize;

constexpr uint8_t kDirCw = 0x10;
constexpr uint8_t kDirCcw = 0x20;

constexpr uint8_t kRStart = 0x0;
constexpr uint8_t kRCwFinal = 0x1;
constexpr uint8_t kRCwBegin = 0x2;
constexpr uint8_t kRCwNext = 0x3;
constexpr uint8_t kRCcwBegin = 0x4;
constexpr uint8_t kRCcwFinal = 0x5;
constexpr uint8_t kRCcwNext = 0x6;
constexpr int16_t kMaxBufferedDelta = 16;
constexpr uint32_t kMinClickMs = 35;
constexpr size_t kStationIdCapacity = 24;

// Full-step decoder table from the Ben Buxton rotary state machine.
constexpr uint8_t kRotaryTable[7][4] = {
    {kRStart, kRCwBegin, kRCcwBegin, kRStart},
    {kRCwNext, kRStart, kRCwFinal, kRStart | kDirCw},
    {kRCwNext, kRCwBegin, kRStart, kRStart},
    {kRCwNext, kRCwBegin, kRCwFinal, kRStart},
    {kRCcwNext, kRStart, kRCcwBegin, kRStart},
    {kRCcwNext, kRCcwFinal, kRStart, kRStart | kDirCcw},
    {kRCcwNext, kRCcwFinal, kRCcwBegin, kRStart},
};

volatile int16_t g_fineDelta = 0;
volatile int16_t g_coarseDelta = 0;
volatile uint8_t g_rotaryState = kRStart;
volatile bool g_rotateWhileHeld = false;

bool g_initialized = false;

// Serial "t<station_id>\n" line being collected.
bool g_readingStationId = false;
char g_stationId[kStationIdCapacity] = "";
size_t g_stationIdLength = 0;

uint8_t g_lastRawButtonState = HIGH;
uint8_t g_stableButtonState = HIGH;
uint32_t g_lastDebounceMs = 0;
uint32_t g_pressStartMs = 0;
bool g_veryLongSent = false;

uint8_t g_pendingClicks = 0;
uint32_t g_lastClickReleaseMs = 0;

int16_t clampDelta(int16_t value) {
  if (value > kMaxBufferedDelta) {
    return kMaxBufferedDelta;
  }
  if (value < -kMaxBufferedDelta) {
    return static_cast<int16_t>(-kMaxBufferedDelta);
  }
  return value;
}

void IRAM_ATTR onEncoderChange() {
  const uint8_t pinState = (digitalRead(hw::kPinEncoderB) << 1) | digitalRead(hw::kPinEncoderA);
  g_rotaryState = kRotaryTable[g_rotaryState & 0x0F][pinState];
  const uint8_t edge = g_rotaryState & 0x30;

  if (edge != kDirCw && edge != kDirCcw) {
    return;
  }

  const int8_t dir = edge == kDirCw ? 1 : -1;
  if (digitalRead(hw::kPinEncoderButton) == LOW) {
    g_rotateWhileHeld = true;
    g_coarseDelta = clampDelta(static_cast<int16_t>(g_coarseDelta + dir));
  } else {
    g_fineDelta = clampDelta(static_cast<int16_t>(g_fineDelta + dir));
  }
}

void emitEvent(const fmtuner::CommandEvent& event) {
  const fmtuner::TunerError result = services::tuner::submit(event);
  if (result != fmtuner::TunerError::None) {
    Serial.printf("[input] %s not accepted: %s\n", fmtuner::commandName(event.type), fmtuner::errorName(result));
  }
}

void emit(CommandType type, StepSize step = StepSize::Fine) { emitEvent(fmtuner::makeCommand(type, step)); }

// A whole drained delta travels as one queued event.
void emitSteps(int16_t delta, StepSize step) {
  const CommandType type = delta > 0 ? CommandType::StepFreqUp : CommandType::StepFreqDown;
  emitEvent(fmtuner::makeStepCommand(type, step, static_cast<uint8_t>(abs(delta))));
}

void finishStationId() {
  g_readingStationId = false;
  g_stationId[g_stationIdLength] = '\0';
  g_stationIdLength = 0;

  const uint8_t index = fmtuner::stationIndexById(g_stationId);
  if (index == fmtuner::kNoStationIndex) {
    Serial.printf("[input] unknown station '%s'\n", g_stationId);
  }
  emitEvent(fmtuner::makeStationCommand(index));
}

bool collectStationId(char c) {
  if (!g_readingStationId) {
    return false;
  }
  if (c == '\r' || c == '\n') {
    finishStationId();
  } else if (c != ' ' && g_stationIdLength + 1 < kStationIdCapacity) {
    g_stationId[g_stationIdLength++] = c;
  }
  return true;
}

void drainEncoder() {
  noInterrupts();
  const int16_t fine = g_fineDelta;
  const int16_t coarse = g_coarseDelta;
  g_fineDelta = 0;
  g_coarseDelta = 0;
  interrupts();

  if (coarse != 0) {
    emitSteps(coarse, StepSize::Coarse);
  }
  if (fine != 0) {
    emitSteps(fine, StepSize::Fine);
  }
}

void finalizeClicksIfReady() {
  if (g_pendingClicks == 0) {
    return;
  }

  if (millis() - g_lastClickReleaseMs < fmtuner::kMultiClickWindowMs) {
    return;
  }

  const uint8_t clicks = g_pendingClicks;
  g_pendingClicks = 0;

  if (clicks >= 3) {
    emit(CommandType::RecallFavorite);
  } else if (clicks == 2) {
    emit(CommandType::SeekDown);
  } else {
    emit(CommandType::SeekUp);
  }
}

void setButtonState(uint8_t newState) {
  g_stableButtonState = newState;

  if (newState == LOW) {
    g_pressStartMs = millis();
    g_veryLongSent = false;
    g_rotateWhileHeld = false;
    return;
  }

  if (g_rotateWhileHeld || g_veryLongSent) {
    return;
  }

  // Long press fires on release so it never doubles up with a very long press.
  const uint32_t heldMs = millis() - g_pressStartMs;
  if (heldMs >= fmtuner::kLongPressMs) {
    g_pendingClicks = 0;
    emit(CommandType::SavePreset);
    return;
  }

  if (heldMs > kMinClickMs) {
    if (g_pendingClicks < 3) {
      ++g_pendingClicks;
    }
    g_lastClickReleaseMs = millis();
  }
}

void updateButton() {
  const uint8_t rawState = digitalRead(hw::kPinEncoderButton);
  if (rawState != g_lastRawButtonState) {
    g_lastRawButtonState = rawState;
    g_lastDebounceMs = millis();
  }

  if ((millis() - g_lastDebounceMs) > fmtuner::kInputDebounceMs && rawState != g_stableButtonState) {
    setButtonState(rawState);
  }

  if (g_stableButtonState == LOW && !g_rotateWhileHeld && !g_veryLongSent &&
      millis() - g_pressStartMs >= fmtuner::kVeryLongPressMs) {
    g_veryLongSent = true;
    g_pendingClicks = 0;
    emit(CommandType::SaveFavorite);
  }

  finalizeClicksIfReady();
}

void handleSerialCommand(char c) {
  if (collectStationId(c)) {
    return;
  }

  switch (c) {
    case '+':
      emit(CommandType::StepFreqUp, StepSize::Fine);
      break;
    case '-':
      emit(CommandType::StepFreqDown, StepSize::Fine);
      break;
    case '>':
      emit(CommandType::StepFreqUp, StepSize::Coarse);
      break;
    case '<':
      emit(CommandType::StepFreqDown, StepSize::Coarse);
      break;
    case 'u':
      emit(CommandType::SeekUp);
      break;
    case 'd':
      emit(CommandType::SeekDown);
      break;
    case 's':
      emit(CommandType::SavePreset);
      break;
    case 'f':
      emit(CommandType::SaveFavorite);
      break;
    case 'r':
      emit(CommandType::RecallFavorite);
      break;
    case 'm':
      emit(CommandType::ToggleMute);
      break;
    case 't':
      g_readingStationId = true;
      g_stationIdLength = 0;
      break;
    case '\r':
    case '\n':
      break;
    default:
      Serial.printf("[input] unknown command '%c'\n", c);
      break;
  }
}

void pollSerial() {
  while (Serial.available() > 0) {
    handleSerialCommand(static_cast<char>(Serial.read()));
  }
}

}  // namespace

bool begin() {
  pinMode(hw::kPinEncoderA, INPUT_PULLUP);
  pinMode(hw::kPinEncoderB, INPUT_PULLUP);
  pinMode(hw::kPinEncoderButton, INPUT_PULLUP);

  g_lastRawButtonState = digitalRead(hw::kPinEncoderButton);
  g_stableButtonState = g_lastRawButtonState;

  attachInterrupt(digitalPinToInterrupt(hw::kPinEncoderA), onEncoderChange, CHANGE);
  attachInterrupt(digitalPinToInterrupt(hw::kPinEncoderB), onEncoderChange, CHANGE);

  g_initialized = true;
  Serial.println("[input] initialized");
  return true;
}

void tick() {
  if (!g_initialized) {
    return;
  }

  drainEncoder();
  updateButton();
  pollSerial();
}

}  // namespace services::input
