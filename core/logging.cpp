#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void initLogging(spdlog::level::level_enum level, const std::optional<std::string>& logFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(level);
    console->set_pattern("[%H:%M:%S] %^%l%$ %v");
    sinks.push_back(console);

    if (logFile) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*logFile, false);
        file->set_level(spdlog::level::debug);
        file->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("provisioner", sinks.begin(), sinks.end());
    logger->set_level(logFile ? spdlog::level::debug : level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
