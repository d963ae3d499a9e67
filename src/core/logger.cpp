#include "stratmon/core/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

namespace stratmon {

bool Logger::init(const LogSettings& settings) {
    try {
        spdlog::init_thread_pool(static_cast<std::size_t>(std::max(settings.queue_size, 64)), 1);

        std::vector<spdlog::sink_ptr> sinks;
        if (settings.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (!settings.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file,
                static_cast<std::size_t>(std::max(settings.max_size_mb, 1)) * 1024 * 1024,
                static_cast<std::size_t>(std::max(settings.max_files, 1))));
        }

        // Quote threads must never wait on the log queue
        auto logger = std::make_shared<spdlog::async_logger>(
            kMainLogger, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        logger->set_level(parse_level(settings.level));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);

        if (!settings.alarm_file.empty()) {
            // Synchronous; an alarm line is on disk before the callback returns
            auto trail = spdlog::basic_logger_mt(kAlarmLogger, settings.alarm_file);
            trail->set_pattern("%Y-%m-%d %H:%M:%S.%e %v");
            trail->set_level(spdlog::level::trace);
            trail->flush_on(spdlog::level::trace);
        }

        spdlog::flush_every(std::chrono::seconds(1));
        spdlog::info("Logging at {} to {}{}", settings.level,
                     settings.file.empty() ? "console" : settings.file,
                     settings.alarm_file.empty() ? "" : ", alarms to " + settings.alarm_file);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    spdlog::shutdown();
}

spdlog::level::level_enum Logger::parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void Logger::set_level(std::string_view name) {
    spdlog::set_level(parse_level(name));
}

} // namespace stratmon
