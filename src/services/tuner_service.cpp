#include <Arduino.h>

#include "../../include/app_config.h"
#include "../../include/app_services.h"
#include "../../include/station_catalog.h"

namespace services::tuner {
namespace {

using fmtuner::TunerError;

class InputPumpObserver : public fmtuner::SeekObserver {
 public:
  void onSeekPoll(uint16_t frequency10Khz, uint8_t pollIndex) override {
    (void)frequency10Khz;
    (void)pollIndex;
    // Keeps the encoder and button responsive while a search blocks the loop.
    services::input::tick();
  }
};

class LogListener : public fmtuner::DispatchListener {
 public:
  void onDispatched(const fmtuner::DispatchRecord& record) override;
};

fmtuner::TunerController* g_controller = nullptr;
fmtuner::CommandDispatcher* g_dispatcher = nullptr;
InputPumpObserver g_observer;
LogListener g_listener;

char g_lastError[48] = "";

void setLastError(const char* context, TunerError error) {
  if (error == TunerError::None) {
    g_lastError[0] = '\0';
    return;
  }
  snprintf(g_lastError, sizeof(g_lastError), "%s: %s", context, fmtuner::errorName(error));
}

void logStation(const char* context, TunerError result, uint16_t frequency10Khz) {
  const fmtuner::StationDef* station =
      g_controller != nullptr ? fmtuner::findStationByFrequency(g_controller->band(), frequency10Khz) : nullptr;
  Serial.printf("[tuner] %s -> %s @ %u.%u MHz%s%s%s\n",
                context,
                fmtuner::errorName(result),
                frequency10Khz / 100,
                (frequency10Khz % 100) / 10,
                station != nullptr ? " (" : "",
                station != nullptr ? station->name : "",
                station != nullptr ? ")" : "");
}

void LogListener::onDispatched(const fmtuner::DispatchRecord& record) {
  setLastError(fmtuner::commandName(record.event.type), record.result);
  logStation(fmtuner::commandName(record.event.type), record.result, record.frequency10Khz);
}

}  // namespace

bool begin(const fmtuner::TunerConfig& config) {
  static fmtuner::TunerController controller(services::bus::transport(), services::bus::clock(), config);
  static fmtuner::StationStore store(services::settings::store(), config.band);
  static fmtuner::CommandDispatcher dispatcher(controller, store);

  g_controller = &controller;
  g_dispatcher = &dispatcher;

  controller.setSeekObserver(&g_observer);
  dispatcher.setListener(&g_listener);

  const TunerError result = dispatcher.start();
  setLastError("start", result);
  logStation(dispatcher.restoredFromStore() ? "restore" : "default", result, controller.frequency10Khz());

  if (result != TunerError::None) {
    Serial.printf("[tuner] init failed: %s\n", g_lastError);
    return false;
  }
  return true;
}

const char* lastError() { return g_lastError; }

TunerError submit(const fmtuner::CommandEvent& event) {
  if (g_dispatcher == nullptr) {
    return TunerError::NotTuned;
  }
  return g_dispatcher->submit(event);
}

void tick() {
  if (g_dispatcher == nullptr) {
    return;
  }
  g_dispatcher->runPending();
}

}  // namespace services::tuner
