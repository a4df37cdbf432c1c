#include "fcat/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace fcat::core {

Result<void> configure_logging(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, false));
        } catch (const spdlog::spdlog_ex& e) {
            return Err<void>(Error::config("Cannot open log file " + config.log_file + ": " + e.what()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>("fcat", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return Ok();
}

} // namespace fcat::core
