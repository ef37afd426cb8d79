#pragma once

#include <openssl/evp.h>

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wolfcache::digest {

/**
 * @brief Lowercase hex MD5 of the input
 *
 * Only used to shorten oversized cache keys, never for anything security
 * relevant.
 */
[[nodiscard]] inline std::string md5_hex(std::string_view input) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_Digest(input.data(), input.size(),
                   hash, &hash_len,
                   EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }

    std::string out;
    out.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        out += std::format("{:02x}", hash[i]);
    }
    return out;
}

} // namespace wolfcache::digest
