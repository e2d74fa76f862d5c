//
// Created by gregorian on 19/10/2026.
//

#include "insight/utils/time_utils.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace insight::utils {

std::string format_timestamp(const core::timestamp ts) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts - seconds).count();
    const auto time_t_val = std::chrono::system_clock::to_time_t(seconds);

    std::tm time_info{};
#ifdef _WIN32
    gmtime_s(&time_info, &time_t_val);
#else
    gmtime_r(&time_t_val, &time_info);
#endif

    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::optional<core::timestamp> parse_timestamp(const std::string& str) {
    std::tm tm = {};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (std::isdigit(ss.peek())) {
            const int digit = ss.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    if (ss.get() != 'Z') {
        return std::nullopt;
    }

#ifdef _WIN32
    const std::time_t seconds = _mkgmtime(&tm);
#else
    const std::time_t seconds = timegm(&tm);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

core::timestamp now() {
    return std::chrono::system_clock::now();
}

}  // namespace insight::utils
