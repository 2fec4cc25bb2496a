/**
 * @file checksum.h
 * @brief Digest utilities backed by OpenSSL EVP
 */

#ifndef KCENON_OBJECT_BATCH_CORE_CHECKSUM_H
#define KCENON_OBJECT_BATCH_CORE_CHECKSUM_H

#include <kcenon/object_batch/core/types.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::object_batch {

/**
 * @brief SHA-256 helpers used to derive stable identifiers
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 of a byte span
     * @param data Input data span
     * @return Lowercase hex digest, or error if the digest backend failed
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data)
        -> result<std::string>;

    /**
     * @brief Calculate SHA-256 of a string
     * @param text Input text (hashed as raw bytes)
     * @return Lowercase hex digest, or error if the digest backend failed
     */
    [[nodiscard]] static auto sha256(std::string_view text) -> result<std::string>;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_CORE_CHECKSUM_H
