//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_TIME_UTILS_H
#define INSIGHT_TIME_UTILS_H

#include "insight/core/types.h"
#include <optional>
#include <string>

namespace insight::utils
{
    /**
     * ISO-8601 UTC with millisecond precision, e.g. "2026-10-19T08:15:30.120Z".
     */
    std::string format_timestamp(core::timestamp ts);

    /**
     * Parse the output of format_timestamp(). The fractional part is optional.
     *
     * @return std::nullopt when `str` is not an ISO-8601 UTC timestamp.
     */
    std::optional<core::timestamp> parse_timestamp(const std::string& str);

    core::timestamp now();
}

#endif //INSIGHT_TIME_UTILS_H
