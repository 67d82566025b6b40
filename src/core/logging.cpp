#include "codebox/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace codebox::core {

Result<void, Error> init_logging(const ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_file.empty()) {
        try {
            std::error_code ec;
            if (config.log_file.has_parent_path()) {
                fs::create_directories(config.log_file.parent_path(), ec);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.log_file.string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                std::string("Failed to open log file: ") + e.what(),
                config.log_file.string()
            );
        }
    }

    auto logger = std::make_shared<spdlog::logger>("codebox", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::set_default_logger(logger);

    return Result<void, Error>::ok();
}

}  // namespace codebox::core
