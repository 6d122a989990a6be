#pragma once

#include "norflash/utils/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace norflash {

class Logger {
public:
    enum class LogLevel {
        TRACE = 0,
        DEBUG_LEVEL = 1,
        INFO = 2,
        WARN = 3,
        ERROR_LEVEL = 4,
        OFF = 5
    };

    static Result<void> initialize(LogLevel level = LogLevel::INFO,
                                   const std::string& log_file = "",
                                   bool enable_console = true);

    static void shutdown();
    static bool is_initialized() { return initialized_; }

    static std::shared_ptr<spdlog::logger> get_logger();

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static LogLevel from_string(const std::string& level_str);

    template<typename... Args>
    static void log(spdlog::level::level_enum level, const std::string& format, Args&&... args) {
        if (auto logger = get_logger()) {
            if constexpr (sizeof...(Args) == 0) {
                logger->log(level, format);
            } else {
                logger->log(level, fmt::runtime(format), std::forward<Args>(args)...);
            }
        }
    }

    template<typename... Args>
    static void trace(const std::string& format, Args&&... args) {
        log(spdlog::level::trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(spdlog::level::info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(spdlog::level::err, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(const std::string& format, Args&&... args) {
        log(spdlog::level::critical, format, std::forward<Args>(args)...);
    }

private:
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    static bool initialized_;
    static LogLevel current_level_;
};

// Convenience macros for logging
#define LOG_TRACE(...) ::norflash::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::norflash::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...) ::norflash::Logger::info(__VA_ARGS__)
#define LOG_WARN(...) ::norflash::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) ::norflash::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::norflash::Logger::critical(__VA_ARGS__)

}  // namespace norflash
