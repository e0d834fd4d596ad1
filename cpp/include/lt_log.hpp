// laptrack C++ Core — logging
// Copyright (c) 2026 Nexellum d.o.o. — AGPL-3.0-or-later
#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lt {

// Single module-tagged spdlog logger shared by every tracking session
class Log {
public:
    static std::shared_ptr<spdlog::logger> get() {
        static std::shared_ptr<spdlog::logger> logger = create();
        return logger;
    }

    static void set_level(spdlog::level::level_enum level) { get()->set_level(level); }

    static void set_verbose(bool verbose) {
        set_level(verbose ? spdlog::level::info : spdlog::level::off);
    }

private:
    static std::shared_ptr<spdlog::logger> create() {
        if (auto existing = spdlog::get("laptrack")) return existing;
        auto logger = spdlog::stdout_color_mt("laptrack");
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::info);
        return logger;
    }
};

}  // namespace lt

#define LT_LOG_DEBUG(...) if (auto _log = ::lt::Log::get()) _log->debug(__VA_ARGS__)
#define LT_LOG_INFO(...)  if (auto _log = ::lt::Log::get()) _log->info(__VA_ARGS__)
#define LT_LOG_WARN(...)  if (auto _log = ::lt::Log::get()) _log->warn(__VA_ARGS__)
