//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_HASH_UTILS_H
#define INSIGHT_HASH_UTILS_H

#include <string>
#include <string_view>

namespace insight::utils
{
    /**
     * SHA-256 digest of `data` as 64 lowercase hex characters.
     *
     * @throws std::runtime_error if the OpenSSL digest context cannot be driven.
     */
    std::string compute_sha256(std::string_view data);
}

#endif //INSIGHT_HASH_UTILS_H
