#include <Arduino.h>

#include "../include/app_config.h"
#include "../include/app_services.h"
#include "../include/tuner_state.h"

namespace {

fmtuner::TunerConfig g_config = fmtuner::makeDefaultTunerConfig();

}  // namespace

void setup() {
  Serial.begin(fmtuner::kSerialBaud);
  delay(120);
  Serial.printf("\n[%s] %s\n", fmtuner::kFirmwareName, fmtuner::kFirmwareVersion);

  if (services::settings::begin()) {
    services::settings::loadConfig(g_config);
  } else {
    Serial.println("[main] using default config");
    fmtuner::sanitizeConfig(g_config);
  }

  if (!services::bus::begin(g_config)) {
    Serial.println("[main] tuner not detected. Check wiring and power.");
    return;
  }

  services::input::begin();

  if (!services::tuner::begin(g_config)) {
    Serial.printf("[main] tuner init failed: %s\n", services::tuner::lastError());
  }
}

void loop() {
  if (!services::bus::ready()) {
    delay(100);
    return;
  }

  services::input::tick();
  services::tuner::tick();
  delay(2);
}
