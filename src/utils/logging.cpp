/**
 * @file    logging.cpp
 * @brief   Logging Setup Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.10.01
 * @license MIT
 */

#include "utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace wit {

void setup_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, true));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("wit", sinks.begin(), sinks.end());
    spdlog::level::level_enum level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    spdlog::set_default_logger(std::move(logger));
}

}  // namespace wit
