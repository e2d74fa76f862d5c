//
// Created by gregorian on 19/10/2026.
//

#include "insight/core/error.h"
#include <sstream>
#include <unordered_map>

namespace insight::core {

    Error::Error(const ErrorCode code,
                 std::string message,
                 const ErrorSeverity severity,
                 const std::source_location location)
        : code(code)
        , message(std::move(message))
        , severity(severity)
        , file(location.file_name())
        , line(location.line())
        , function(location.function_name()) {
    }

    Error::Error(const ErrorCode code,
                 std::string message,
                 std::vector<std::string> suggestions,
                 const ErrorSeverity severity,
                 const std::source_location location)
        : code(code)
        , message(std::move(message))
        , severity(severity)
        , file(location.file_name())
        , line(location.line())
        , function(location.function_name())
        , suggestions(std::move(suggestions)) {
    }

    std::string Error::to_string() const {
        std::ostringstream ss;

        switch (severity) {
            case ErrorSeverity::WARNING:
                ss << "[WARNING] ";
                break;
            case ErrorSeverity::ERROR:
                ss << "[ERROR] ";
                break;
            case ErrorSeverity::FATAL:
                ss << "[FATAL] ";
                break;
        }

        ss << error_code_to_string(code) << ": " << message;

        if (!context.empty()) {
            ss << "\n  Context: " << context;
        }

        if (!suggestions.empty()) {
            ss << "\n  Suggestions:";
            for (const auto& suggestion : suggestions) {
                ss << "\n    - " << suggestion;
            }
        }

        ss << "\n  Location: " << file << ":" << line << " in " << function;

        return ss.str();
    }

    bool Error::is_fatal() const {
        return severity == ErrorSeverity::FATAL;
    }

    bool Error::is_recoverable() const {
        return severity != ErrorSeverity::FATAL;
    }

    const char* error_code_to_string(const ErrorCode code) {
        static const std::unordered_map<ErrorCode, const char*> error_strings = {
            {ErrorCode::SUCCESS, "Success"},

            {ErrorCode::FILE_NOT_FOUND, "File not found"},
            {ErrorCode::FILE_READ_ERROR, "File read error"},
            {ErrorCode::FILE_WRITE_ERROR, "File write error"},

            {ErrorCode::INVALID_ARGUMENT, "Invalid argument"},
            {ErrorCode::INVALID_CONFIG, "Invalid configuration"},
            {ErrorCode::INVALID_FORMAT, "Invalid format"},

            {ErrorCode::PARSE_ERROR, "Parse error"},
            {ErrorCode::JSON_PARSE_ERROR, "JSON parse error"},

            {ErrorCode::STATE_CORRUPT, "Learning state corrupt"},
            {ErrorCode::PATTERN_NOT_FOUND, "Pattern not found"},
            {ErrorCode::STORAGE_ERROR, "Storage error"},

            {ErrorCode::GRAPH_ERROR, "Graph error"},
            {ErrorCode::NODE_NOT_FOUND, "Node not found"},

            {ErrorCode::INTERNAL_ERROR, "Internal error"}
        };

        if (const auto it = error_strings.find(code); it != error_strings.end()) {
            return it->second;
        }
        return "Unknown error code";
    }

    ErrorSeverity error_code_to_severity(const ErrorCode code) {
        switch (code) {
            case ErrorCode::SUCCESS:
            case ErrorCode::FILE_NOT_FOUND:
            case ErrorCode::STATE_CORRUPT:
            case ErrorCode::PATTERN_NOT_FOUND:
            case ErrorCode::STORAGE_ERROR:
                return ErrorSeverity::WARNING;

            case ErrorCode::INTERNAL_ERROR:
                return ErrorSeverity::FATAL;

            default:
                return ErrorSeverity::ERROR;
        }
    }

    Error make_error(const ErrorCode code,
                     std::string message,
                     const std::source_location location) {
        return Error{code, std::move(message), error_code_to_severity(code), location};
    }

    Error make_error_with_suggestions(const ErrorCode code,
                                      std::string message,
                                      std::vector<std::string> suggestions,
                                      const std::source_location location) {
        return Error{code, std::move(message), std::move(suggestions),
                     error_code_to_severity(code), location};
    }

}  // namespace insight::core
