//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_ERROR_H
#define INSIGHT_ERROR_H

#include <cstdint>
#include <source_location>
#include <string>
#include <vector>

namespace insight::core {

    /**
     * Codes for the failures the analysis core can report: I/O, parsing,
     * persisted learning state, graph lookups and configuration.
     */
    enum class ErrorCode {
        SUCCESS = 0,

        FILE_NOT_FOUND,
        FILE_READ_ERROR,
        FILE_WRITE_ERROR,

        INVALID_ARGUMENT,
        INVALID_CONFIG,
        INVALID_FORMAT,

        PARSE_ERROR,
        JSON_PARSE_ERROR,

        STATE_CORRUPT,
        PATTERN_NOT_FOUND,
        STORAGE_ERROR,

        GRAPH_ERROR,
        NODE_NOT_FOUND,

        INTERNAL_ERROR
    };

    /**
     * Severity levels for errors or warnings.
     */
    enum class ErrorSeverity {
        WARNING,
        ERROR,
        FATAL
    };

    /**
     * An error condition with its code, message and the location that raised it.
     * Suggestions and context are optional extras for the person reading the report.
     */
    struct Error {
        ErrorCode code{};
        std::string message{};
        ErrorSeverity severity{};

        std::string file{};              ///< Source file that reported the error.
        uint_least32_t line{};
        std::string function{};

        std::vector<std::string> suggestions{};
        std::string context{};

        Error() = default;

        /**
         * @param code The error code.
         * @param message Description of what went wrong.
         * @param severity The severity (default is ERROR).
         * @param location Source location (default is the caller).
         */
        Error(ErrorCode code,
              std::string message,
              ErrorSeverity severity = ErrorSeverity::ERROR,
              std::source_location location = std::source_location::current());

        Error(ErrorCode code,
              std::string message,
              std::vector<std::string> suggestions,
              ErrorSeverity severity = ErrorSeverity::ERROR,
              std::source_location location = std::source_location::current());

        /**
         * Render the error as "[SEVERITY] Code: message" followed by context,
         * suggestions and the reporting location.
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] bool is_fatal() const;

        [[nodiscard]] bool is_recoverable() const;
    };

    /**
     * @return Display name for @p code.
     */
    const char* error_code_to_string(ErrorCode code);

    /**
     * Default severity for a code. Learning-state failures are warnings because
     * the analysis keeps running without history.
     */
    ErrorSeverity error_code_to_severity(ErrorCode code);

    Error make_error(ErrorCode code,
                     std::string message,
                     std::source_location location = std::source_location::current());

    Error make_error_with_suggestions(ErrorCode code,
                                      std::string message,
                                      std::vector<std::string> suggestions,
                                      std::source_location location = std::source_location::current());

}  // namespace insight::core

#endif //INSIGHT_ERROR_H
