#pragma once

#include "config.hpp"

namespace codebox::core {

// Configure spdlog's default logger: stderr colour sink, plus a file sink
// when observability.log_file is set. Safe to call more than once.
Result<void, Error> init_logging(const ObservabilityConfig& config);

}  // namespace codebox::core
