//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_LOGGER_H
#define INSIGHT_LOGGER_H

#include "insight/core/config.h"
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace insight::utils
{
    enum class LogLevel {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        OFF
    };

    std::string to_string(LogLevel level);

    /**
     * Parse "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" or "OFF" (any case).
     * Unrecognized names fall back to INFO.
     */
    LogLevel log_level_from_string(const std::string& str);

    /**
     * Process-wide log sink.
     *
     * Records below the configured level are dropped. Accepted records are
     * rendered with the LoggingConfig format (placeholders {timestamp}, {level},
     * {source} and {message}) and written to stderr and/or the configured file.
     * A custom sink replaces both outputs.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        static Logger& instance();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void configure(const core::LoggingConfig& config);

        void set_level(LogLevel level);
        [[nodiscard]] LogLevel level() const;

        /// Route rendered records to @p sink instead of stderr and the log file. An empty sink restores them.
        void set_sink(Sink sink);

        [[nodiscard]] bool should_log(LogLevel level) const;

        void log(LogLevel level, std::string_view source, std::string_view message);

    private:
        Logger() = default;

        [[nodiscard]] std::string render(LogLevel level, std::string_view source, std::string_view message) const;

        mutable std::mutex mutex_;
        core::LoggingConfig config_{};
        LogLevel level_ = LogLevel::INFO;
        std::ofstream file_;
        Sink sink_;
    };
}

#define INSIGHT_LOG(level, source, message)                                          \
    do {                                                                             \
        auto& insight_logger_ = ::insight::utils::Logger::instance();                \
        if (insight_logger_.should_log(level)) {                                     \
            insight_logger_.log(level, source, message);                             \
        }                                                                            \
    } while (false)

#define INSIGHT_LOG_DEBUG(source, message) INSIGHT_LOG(::insight::utils::LogLevel::DEBUG, source, message)
#define INSIGHT_LOG_INFO(source, message) INSIGHT_LOG(::insight::utils::LogLevel::INFO, source, message)
#define INSIGHT_LOG_WARNING(source, message) INSIGHT_LOG(::insight::utils::LogLevel::WARNING, source, message)
#define INSIGHT_LOG_ERROR(source, message) INSIGHT_LOG(::insight::utils::LogLevel::ERROR, source, message)

#endif //INSIGHT_LOGGER_H
