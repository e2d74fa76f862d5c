//
// Created by gregorian on 19/10/2026.
//

#include "insight/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace insight::utils {

std::string join(const std::vector<std::string>& strings, const std::string_view separator) {
    if (strings.empty()) return "";

    std::ostringstream oss;
    oss << strings[0];

    for (size_t i = 1; i < strings.size(); ++i) {
        oss << separator << strings[i];
    }

    return oss.str();
}

std::string trim(const std::string_view str) {
    const auto start = std::ranges::find_if_not(str, [](const unsigned char ch) {
        return std::isspace(ch);
    });

    const auto end = std::find_if_not(str.rbegin(), str.rend(), [](const unsigned char ch) {
        return std::isspace(ch);
    }).base();

    return start < end ? std::string(start, end) : std::string();
}

bool contains(const std::string_view str, const std::string_view substr) {
    return str.find(substr) != std::string_view::npos;
}

std::string to_lower(const std::string_view str) {
    std::string result(str);
    std::ranges::transform(result, result.begin(),
                           [](const unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(const std::string_view str) {
    std::string result(str);
    std::ranges::transform(result, result.begin(),
                           [](const unsigned char c) { return std::toupper(c); });
    return result;
}

std::string replace_all(const std::string_view str, const std::string_view from, const std::string_view to) {
    if (from.empty()) return std::string(str);

    std::string result(str);
    size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

std::string format_fixed(const double value, const int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

bool glob_match(std::string_view pattern, std::string_view text) {
    while (!pattern.empty()) {
        if (pattern.starts_with("**")) {
            pattern.remove_prefix(2);
            if (pattern.starts_with('/') && glob_match(pattern.substr(1), text)) {
                return true;
            }
            for (size_t i = 0; i <= text.size(); ++i) {
                if (glob_match(pattern, text.substr(i))) {
                    return true;
                }
            }
            return false;
        }

        if (pattern.front() == '*') {
            pattern.remove_prefix(1);
            for (size_t i = 0; ; ++i) {
                if (glob_match(pattern, text.substr(i))) {
                    return true;
                }
                if (i == text.size() || text[i] == '/') {
                    return false;
                }
            }
        }

        if (text.empty()) {
            return false;
        }

        if (pattern.front() == '?') {
            if (text.front() == '/') {
                return false;
            }
        } else if (pattern.front() != text.front()) {
            return false;
        }

        pattern.remove_prefix(1);
        text.remove_prefix(1);
    }

    return text.empty();
}

}  // namespace insight::utils
