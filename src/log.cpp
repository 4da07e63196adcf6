#include "waycodec/log.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace waycodec {

namespace {

struct LogState {
    std::mutex mutex;
    LogHandler handler;
    std::atomic<LogLevel> min_level{LogLevel::Info};
};

LogState& state() {
    static LogState s;
    return s;
}

} // anonymous namespace

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
        default:                  return "info";
    }
}

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug")     return LogLevel::Debug;
    if (s == "info")      return LogLevel::Info;
    if (s == "notice")    return LogLevel::Notice;
    if (s == "warning")   return LogLevel::Warning;
    if (s == "error")     return LogLevel::Error;
    if (s == "critical")  return LogLevel::Critical;
    if (s == "alert")     return LogLevel::Alert;
    if (s == "emergency") return LogLevel::Emergency;
    throw std::invalid_argument("Unknown log level: " + s);
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().handler = std::move(handler);
}

void set_min_log_level(LogLevel level) {
    state().min_level = level;
}

LogLevel min_log_level() {
    return state().min_level.load();
}

void log(LogLevel level, const std::string& logger, const std::string& message) {
    if (level < state().min_level.load()) return;

    // Copy out so the handler runs without the lock held
    LogHandler handler;
    {
        std::lock_guard<std::mutex> lock(state().mutex);
        handler = state().handler;
    }
    if (handler) handler(level, logger, message);
}

} // namespace waycodec
