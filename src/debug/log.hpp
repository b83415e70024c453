#pragma once
#include <string>
#include <mutex>
#include <chrono>
#include <iostream>
#include <cstdlib>
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
    // worker threads log concurrently
    inline std::mutex logMutex;

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {

        if (g_pConfig && !g_pConfig->m_config.trace_logging && level == TRACE)
            return;

        std::string logMsg = fmt::format("[{:%H:%M:%S}] ", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));

        switch (level) {
            case LOG: logMsg += "[LOG] "; break;
            case WARN: logMsg += "[WARN] "; break;
            case ERR: logMsg += "[ERR] "; break;
            case CRIT: logMsg += "[CRITICAL] "; break;
            case INFO: logMsg += "[INFO] "; break;
            case TRACE: logMsg += "[TRACE] "; break;
            default: break;
        }

        logMsg += fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        std::lock_guard<std::mutex> lg(logMutex);
        std::cout << logMsg << "\n";
    }

    template <typename... Args>
    [[noreturn]] void die(fmt::format_string<Args...> fmt, Args&&... args) {
        const std::string logMsg = fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        {
            std::lock_guard<std::mutex> lg(logMutex);
            std::cout << "[ERR] " << logMsg << std::endl;
        }

        exit(1);
    }
};
