#pragma once

#include "common/config/config.hpp"

namespace common {

// Installs the process-wide spdlog logger. Safe to call more than once;
// later calls only change the level.
void initLogging(const config::LoggingConfig& cfg);

}
