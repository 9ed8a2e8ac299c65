#include <Arduino.h>
#include <Preferences.h>

#include "../../include/app_config.h"
#include "../../include/app_services.h"

namespace services::settings {
namespace {

Preferences g_prefs;
bool g_ready = false;

class PreferencesStore : public fmtuner::KeyValueStore {
 public:
  size_t getBytesLength(const char* key) override {
    if (!g_ready || !g_prefs.isKey(key)) {
      return 0;
    }
    return g_prefs.getBytesLength(key);
  }

  size_t getBytes(const char* key, void* buffer, size_t length) override {
    if (!g_ready) {
      return 0;
    }
    return g_prefs.getBytes(key, buffer, length);
  }

  size_t putBytes(const char* key, const void* data, size_t length) override {
    if (!g_ready) {
      return 0;
    }
    const size_t written = g_prefs.putBytes(key, data, length);
    if (written != length) {
      Serial.printf("[settings] write of '%s' failed\n", key);
    }
    return written;
  }

  bool remove(const char* key) override {
    if (!g_ready) {
      return false;
    }
    return g_prefs.remove(key);
  }
};

PreferencesStore g_store;

}  // namespace

bool begin() {
  if (!g_prefs.begin(fmtuner::kPrefsNamespace, false)) {
    g_ready = false;
    Serial.println("[settings] init failed");
    return false;
  }

  g_ready = true;
  Serial.println("[settings] initialized");
  return true;
}

void loadConfig(fmtuner::TunerConfig& config) {
  if (!g_ready) {
    fmtuner::sanitizeConfig(config);
    return;
  }

  config.band = fmtuner::sanitizeBand(g_prefs.getUChar(fmtuner::kPrefsBandKey, static_cast<uint8_t>(config.band)));
  config.wrapOnEdge = g_prefs.getBool(fmtuner::kPrefsWrapKey, config.wrapOnEdge);
  fmtuner::sanitizeConfig(config);

  Serial.printf("[settings] band=%s wrap=%s default=%u\n",
                fmtuner::bandDef(config.band).name,
                config.wrapOnEdge ? "on" : "off",
                static_cast<unsigned>(config.defaultFrequency10Khz));
}

fmtuner::KeyValueStore& store() { return g_store; }

}  // namespace services::settings
