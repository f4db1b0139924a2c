#include "logging.hpp"

namespace ULIDLite {

std::shared_ptr<spdlog::logger> Logger::defaultLogger_;

void Logger::initialize(const std::string& serviceName, const std::string& logLevel, bool toStderr) {
    auto logger = spdlog::get(serviceName);
    if (logger) {
        logger->set_level(spdlog::level::from_str(logLevel));
        defaultLogger_ = logger;
        return;
    }
    // stderr keeps stdout clean for tools that print identifiers
    spdlog::sink_ptr sink;
    if (toStderr)
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    else
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    defaultLogger_ = std::make_shared<spdlog::logger>(serviceName, sink);
    defaultLogger_->set_level(spdlog::level::from_str(logLevel));
    defaultLogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%n] [%l] %v");

    spdlog::register_logger(defaultLogger_);
    spdlog::set_default_logger(defaultLogger_);

    debug("Logger initialized for service: " + serviceName);
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& name) {
    if (name == "default") {
        return defaultLogger_;  // Can be nullptr if not initialized
    }

    auto logger = spdlog::get(name);
    if (!logger) {
        logger = defaultLogger_;
    }
    return logger;
}

void Logger::shutdown() {
    if (defaultLogger_) {
        defaultLogger_->flush();
        spdlog::drop(defaultLogger_->name());
    }
    defaultLogger_.reset();
}

void Logger::info(const std::string& message) {
    if (auto logger = get()) logger->info(message);
}

void Logger::error(const std::string& message) {
    if (auto logger = get()) logger->error(message);
}

void Logger::warn(const std::string& message) {
    if (auto logger = get()) logger->warn(message);
}

void Logger::debug(const std::string& message) {
    if (auto logger = get()) logger->debug(message);
}

}
