#pragma once

#include "config.hpp"

#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>

namespace stratmon {

/**
 * Process logging on top of spdlog.
 *
 * init() installs an async "stratmon" logger as the spdlog default (console
 * plus rotating file). When LogSettings::alarm_file is set, alarm() lines are
 * also written to a separate "alarms" trail that is flushed on every line.
 * The level helpers forward to the default logger, so they work before init()
 * as well, writing to spdlog's stock console logger.
 */
class Logger {
public:
    static bool init(const LogSettings& settings);
    static void shutdown();

    // Unknown names fall back to info
    static spdlog::level::level_enum parse_level(std::string_view name);
    static void set_level(std::string_view name);

    // Target reached/left lines: warn on the main log plus the alarm trail
    template<typename... Args>
    static void alarm(fmt::format_string<Args...> fmt, Args&&... args) {
        const std::string line = fmt::format(fmt, std::forward<Args>(args)...);
        spdlog::warn("[ALARM] {}", line);
        if (auto trail = spdlog::get(kAlarmLogger)) {
            trail->warn("{}", line);
        }
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        spdlog::debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        spdlog::info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        spdlog::warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        spdlog::error(fmt, std::forward<Args>(args)...);
    }

    static constexpr const char* kMainLogger = "stratmon";
    static constexpr const char* kAlarmLogger = "alarms";
};

// Hot-path debug lines; file and line are prepended in DEBUG builds
#ifdef DEBUG
#define LOG_DEBUG(...) spdlog::debug("[{}:{}] " __VA_ARGS__, __FILE__, __LINE__)
#else
#define LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#endif

} // namespace stratmon
