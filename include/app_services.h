#pragma once

#include <stdint.h>

#include "command_dispatcher.h"
#include "tuner_ports.h"
#include "tuner_state.h"

namespace services {

namespace bus {
bool begin(const fmtuner::TunerConfig& config);
bool ready();
fmtuner::BusTransport& transport();
fmtuner::Clock& clock();
}  // namespace bus

namespace settings {
bool begin();
void loadConfig(fmtuner::TunerConfig& config);
fmtuner::KeyValueStore& store();
}  // namespace settings

namespace input {
bool begin();
void tick();
}  // namespace input

namespace tuner {
bool begin(const fmtuner::TunerConfig& config);
const char* lastError();
fmtuner::TunerError submit(const fmtuner::CommandEvent& event);
void tick();
}  // namespace tuner

}  // namespace services
