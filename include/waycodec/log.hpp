#pragma once
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace waycodec {

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

/// Receives every message at or above the minimum level.
using LogHandler = std::function<void(LogLevel level, const std::string& logger,
                                      const std::string& message)>;

/// Install the process-wide sink. Passing nullptr discards messages (the default).
void set_log_handler(LogHandler handler);

void set_min_log_level(LogLevel level);
LogLevel min_log_level();

void log(LogLevel level, const std::string& logger, const std::string& message);

} // namespace waycodec
