#include "norflash/utils/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <algorithm>
#include <cctype>

namespace norflash {

bool Logger::initialized_ = false;
Logger::LogLevel Logger::current_level_ = Logger::LogLevel::INFO;

Result<void> Logger::initialize(Logger::LogLevel level, const std::string& log_file, bool enable_console) {
    try {
        if (initialized_) {
            return unexpected(MAKE_ERROR(ALREADY_INITIALIZED,
                "Logger already initialized"));
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (enable_console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);  // 10MB max size, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            sinks.push_back(file_sink);
        }

        if (sinks.empty()) {
            return unexpected(MAKE_ERROR(INVALID_PARAMETER,
                "At least one logging sink must be enabled"));
        }

        auto logger = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->flush_on(spdlog::level::warn);

        spdlog::drop("main");
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);

        current_level_ = level;
        initialized_ = true;

        LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
        return {};

    } catch (const spdlog::spdlog_ex& ex) {
        return unexpected(MAKE_ERROR(OPERATION_FAILED,
            "Failed to initialize logger: " + std::string(ex.what())));
    }
}

void Logger::shutdown() {
    if (initialized_) {
        LOG_DEBUG("Shutting down logger");
        spdlog::shutdown();
        initialized_ = false;
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger() {
    if (!initialized_) {
        // Library users that never initialize logging get silence
        return nullptr;
    }
    return spdlog::get("main");
}

void Logger::set_level(Logger::LogLevel level) {
    current_level_ = level;
    spdlog::set_level(to_spdlog_level(level));
}

Logger::LogLevel Logger::get_level() {
    return current_level_;
}

spdlog::level::level_enum Logger::to_spdlog_level(Logger::LogLevel level) {
    switch (level) {
        case Logger::LogLevel::TRACE: return spdlog::level::trace;
        case Logger::LogLevel::DEBUG_LEVEL: return spdlog::level::debug;
        case Logger::LogLevel::INFO: return spdlog::level::info;
        case Logger::LogLevel::WARN: return spdlog::level::warn;
        case Logger::LogLevel::ERROR_LEVEL: return spdlog::level::err;
        case Logger::LogLevel::OFF: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

Logger::LogLevel Logger::from_string(const std::string& level_str) {
    std::string lower = level_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Logger::LogLevel::TRACE;
    else if (lower == "debug") return Logger::LogLevel::DEBUG_LEVEL;
    else if (lower == "info") return Logger::LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") return Logger::LogLevel::WARN;
    else if (lower == "error" || lower == "err") return Logger::LogLevel::ERROR_LEVEL;
    else if (lower == "off" || lower == "none") return Logger::LogLevel::OFF;
    else return Logger::LogLevel::INFO; // default fallback
}

}  // namespace norflash
