#pragma once

#include "fcat/core/config.hpp"
#include "fcat/core/result.hpp"

namespace fcat::core {

/**
 * @brief Install the process-wide spdlog logger
 *
 * Console output always; a file sink is added when config.log_file is set.
 * Uses the "[%H:%M:%S] [level] message" pattern shared by all fcat tools.
 */
Result<void> configure_logging(const Config& config);

} // namespace fcat::core
