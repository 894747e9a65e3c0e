#pragma once
#include <string>
#include <ctime>
#include <cstdlib>
#include <mutex>
#include <iostream>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include "../config/Config.hpp"

enum LogLevel {
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    CRIT,
    INFO,
    TRACE
};

namespace Debug {
    inline std::mutex logMutex;

    inline const char* levelPrefix(LogLevel level) {
        switch (level) {
            case LOG: return "[LOG] ";
            case WARN: return "[WARN] ";
            case ERR: return "[ERR] ";
            case CRIT: return "[CRITICAL] ";
            case INFO: return "[INFO] ";
            case TRACE: return "[TRACE] ";
            default: break;
        }
        return "";
    }

    inline void write(LogLevel level, const std::string& msg) {
        const std::time_t           NOW = std::time(nullptr);
        std::tm                     tm{};
        localtime_r(&NOW, &tm);
        const auto                  LINE = fmt::format("{:%Y-%m-%d %H:%M:%S} {}{}\n", tm, levelPrefix(level), msg);

        std::lock_guard<std::mutex> lg(logMutex);
        auto&                       stream = level == ERR || level == CRIT ? std::cerr : std::cout;
        stream << LINE << std::flush;
    }

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
        if (g_pConfig && !g_pConfig->m_config.trace_logging && level == TRACE)
            return;

        write(level, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    [[noreturn]] void die(fmt::format_string<Args...> fmt, Args&&... args) {
        write(CRIT, fmt::vformat(fmt, fmt::make_format_args(args...)));
        std::exit(1);
    }
};
