//
// Created by gregorian on 19/10/2026.
//

#include "insight/utils/logger.h"
#include "insight/utils/string_utils.h"
#include "insight/utils/time_utils.h"
#include <iostream>

namespace insight::utils {

std::string to_string(const LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel log_level_from_string(const std::string& str) {
    const std::string upper = to_upper(trim(str));
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const core::LoggingConfig& config) {
    std::lock_guard lock(mutex_);
    config_ = config;
    level_ = log_level_from_string(config.level);

    if (file_.is_open()) {
        file_.close();
    }
    if (!config_.file.empty()) {
        file_.open(config_.file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "insight: cannot open log file " << config_.file << "\n";
        }
    }
}

void Logger::set_level(const LogLevel level) {
    std::lock_guard lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard lock(mutex_);
    return level_;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard lock(mutex_);
    sink_ = std::move(sink);
}

bool Logger::should_log(const LogLevel level) const {
    std::lock_guard lock(mutex_);
    return level != LogLevel::OFF && level_ != LogLevel::OFF && level >= level_;
}

std::string Logger::render(const LogLevel level, const std::string_view source, const std::string_view message) const {
    std::string line = config_.format;
    line = replace_all(line, "{timestamp}", format_timestamp(now()));
    line = replace_all(line, "{level}", to_string(level));
    line = replace_all(line, "{source}", source);
    line = replace_all(line, "{message}", message);
    return line;
}

void Logger::log(const LogLevel level, const std::string_view source, const std::string_view message) {
    std::lock_guard lock(mutex_);
    const std::string line = render(level, source, message);

    if (sink_) {
        sink_(level, line);
        return;
    }

    if (config_.console) {
        std::cerr << line << '\n';
    }
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
}

}  // namespace insight::utils
