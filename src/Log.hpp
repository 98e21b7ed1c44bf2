#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sealbox {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warn,
    Off
};

// Minimal diagnostics to std::clog. The threshold is read once from
// SEALBOX_LOG_LEVEL (debug, info, warn, off) and defaults to warn.
// Never pass key material, passwords or plaintext.
class Log {
public:
    static void debug(std::string_view message);
    static void info(std::string_view message);
    static void warn(std::string_view message);

    [[nodiscard]] static LogLevel getLevel();
    static void setLevel(LogLevel level);

    [[nodiscard]] static std::optional<LogLevel> parseLevel(std::string_view name);

private:
    static void write(LogLevel level, std::string_view message);
};

}
