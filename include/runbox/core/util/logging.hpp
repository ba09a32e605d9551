// include/runbox/core/util/logging.hpp
#pragma once

#include "runbox/core/config.hpp"
#include "runbox/core/status.hpp"

namespace runbox {

// Configures the default spdlog logger (stderr, so stdout stays clean for
// the JSON result). Unknown level names are rejected.
Status init_logging(const LoggingConfig& cfg);

}  // namespace runbox
