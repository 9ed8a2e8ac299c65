#include <Arduino.h>
#include <Wire.h>

#include "../../include/app_config.h"
#include "../../include/app_services.h"
#include "../../include/hardware_pins.h"

namespace services::bus {
namespace {

class WireTransport : public fmtuner::BusTransport {
 public:
  bool write(const uint8_t* data, size_t length) override {
    Wire.beginTransmission(fmtuner::kTunerI2cAddress);
    const size_t queued = Wire.write(data, length);
    const uint8_t status = Wire.endTransmission();
    if (queued != length || status != 0) {
      Serial.printf("[bus] write failed (queued=%u status=%u)\n", static_cast<unsigned>(queued), status);
      return false;
    }
    return true;
  }

  bool read(uint8_t* data, size_t length) override {
    const size_t received = Wire.requestFrom(fmtuner::kTunerI2cAddress, static_cast<uint8_t>(length));
    if (received != length) {
      Serial.printf("[bus] short read %u/%u\n", static_cast<unsigned>(received), static_cast<unsigned>(length));
      while (Wire.available() > 0) {
        Wire.read();
      }
      return false;
    }
    for (size_t i = 0; i < length; ++i) {
      data[i] = static_cast<uint8_t>(Wire.read());
    }
    return true;
  }
};

class ArduinoClock : public fmtuner::Clock {
 public:
  void delayMs(uint32_t ms) override { ::delay(ms); }
};

WireTransport g_transport;
ArduinoClock g_clock;
bool g_ready = false;
bool g_wireStarted = false;
uint32_t g_powerOnMs = 0;

}  // namespace

bool begin(const fmtuner::TunerConfig& config) {
  pinMode(hw::kPinTunerPower, OUTPUT);
  digitalWrite(hw::kPinTunerPower, HIGH);
  g_powerOnMs = millis();

  if (!g_wireStarted) {
    Wire.begin(config.i2cSdaPin, config.i2cSclPin, config.i2cClockHz);
    Wire.setTimeOut(fmtuner::kI2cTimeoutMs);
    g_wireStarted = true;
  }

  const uint32_t elapsedMs = millis() - g_powerOnMs;
  if (elapsedMs < fmtuner::kTunerPowerSettleMs) {
    delay(fmtuner::kTunerPowerSettleMs - elapsedMs);
  }

  Wire.beginTransmission(fmtuner::kTunerI2cAddress);
  if (Wire.endTransmission() != 0) {
    g_ready = false;
    Serial.printf("[bus] tuner not found @0x%02X\n", fmtuner::kTunerI2cAddress);
    return false;
  }

  g_ready = true;
  Serial.printf("[bus] tuner @0x%02X sda=%u scl=%u %lu Hz\n",
                fmtuner::kTunerI2cAddress,
                config.i2cSdaPin,
                config.i2cSclPin,
                static_cast<unsigned long>(config.i2cClockHz));
  return true;
}

bool ready() { return g_ready; }

fmtuner::BusTransport& transport() { return g_transport; }

fmtuner::Clock& clock() { return g_clock; }

}  // namespace services::bus
