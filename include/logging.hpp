#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <memory>
#include <string>

namespace ULIDLite {

    /**
     * Centralized logging utility
     * Uses spdlog with simple formatting.
     * Until initialize() is called there is no logger and the LOG_* helpers do nothing.
     */
    class Logger {
    public:
        static void initialize(const std::string& serviceName, const std::string& logLevel = "info", bool toStderr = false);
        static std::shared_ptr<spdlog::logger> get(const std::string& name = "default");
        static void shutdown();

        static void info(const std::string& message);
        static void error(const std::string& message);
        static void warn(const std::string& message);
        static void debug(const std::string& message);

    private:
        static std::shared_ptr<spdlog::logger> defaultLogger_;
    };

}

template<typename... Args>
inline void LOG_INFO(const std::string& format, Args&&... args) {
    if (auto logger = ULIDLite::Logger::get()) {
        logger->info(fmt::runtime(format), std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void LOG_ERROR(const std::string& format, Args&&... args) {
    if (auto logger = ULIDLite::Logger::get()) {
        logger->error(fmt::runtime(format), std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void LOG_WARN(const std::string& format, Args&&... args) {
    if (auto logger = ULIDLite::Logger::get()) {
        logger->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void LOG_DEBUG(const std::string& format, Args&&... args) {
    if (auto logger = ULIDLite::Logger::get()) {
        logger->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }
}
