//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_STRING_UTILS_H
#define INSIGHT_STRING_UTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace insight::utils
{
    /**
     * Join `strings`, inserting `separator` between each pair.
     *
     * @return The concatenated result, or an empty string for an empty list.
     */
    std::string join(const std::vector<std::string>& strings, std::string_view separator);

    std::string trim(std::string_view str);

    bool contains(std::string_view str, std::string_view substr);

    std::string to_lower(std::string_view str);

    std::string to_upper(std::string_view str);

    std::string replace_all(std::string_view str, std::string_view from, std::string_view to);

    /**
     * Format `value` with a fixed number of decimals ("12.5" for 12.5 and 1).
     */
    std::string format_fixed(double value, int decimals);

    /**
     * Match `text` against a path glob.
     *
     * `**` matches any run of characters including '/', and `**` followed by '/'
     * may also match no directory at all. `*` matches any run of characters
     * except '/'. `?` matches one character except '/'. Everything else matches
     * literally.
     */
    bool glob_match(std::string_view pattern, std::string_view text);
}

#endif //INSIGHT_STRING_UTILS_H
