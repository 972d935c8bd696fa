#pragma once

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

// Installs the default logger: colour console at `level`, plus an optional
// detail file that always records debug output.
void initLogging(spdlog::level::level_enum level, const std::optional<std::string>& logFile = std::nullopt);
