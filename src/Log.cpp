#include "Log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace sealbox {

namespace {

constexpr LogLevel DEFAULT_LEVEL = LogLevel::Warn;
constexpr const char* LEVEL_VARIABLE = "SEALBOX_LOG_LEVEL";

std::atomic<LogLevel>& threshold() {
    static std::atomic<LogLevel> level([] {
        const char* value = std::getenv(LEVEL_VARIABLE);
        if (!value) {
            return DEFAULT_LEVEL;
        }
        return Log::parseLevel(value).value_or(DEFAULT_LEVEL);
    }());
    return level;
}

const char* levelName(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        default: return "OFF";
    }
}

}

void Log::debug(const std::string_view message) {
    write(LogLevel::Debug, message);
}

void Log::info(const std::string_view message) {
    write(LogLevel::Info, message);
}

void Log::warn(const std::string_view message) {
    write(LogLevel::Warn, message);
}

LogLevel Log::getLevel() {
    return threshold().load();
}

void Log::setLevel(const LogLevel level) {
    threshold().store(level);
}

std::optional<LogLevel> Log::parseLevel(const std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](const unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "off" || lower == "none") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void Log::write(const LogLevel level, const std::string_view message) {
    if (level == LogLevel::Off || level < getLevel()) {
        return;
    }
    static std::mutex mutex;
    const std::lock_guard lock(mutex);
    std::clog << "sealbox [" << levelName(level) << "] " << message << '\n';
}

}
