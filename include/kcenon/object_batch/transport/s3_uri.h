/**
 * @file s3_uri.h
 * @brief Parsing and composition of s3://bucket/key URIs
 */

#ifndef KCENON_OBJECT_BATCH_TRANSPORT_S3_URI_H
#define KCENON_OBJECT_BATCH_TRANSPORT_S3_URI_H

#include <string>
#include <string_view>

#include "kcenon/object_batch/core/types.h"

namespace kcenon::object_batch {

/**
 * @brief A bucket plus an object key (or key prefix)
 *
 * @code
 * auto uri = s3_uri::parse("s3://gt-logs/zendesk-tickets/ZD-145980/");
 * // uri->bucket == "gt-logs", uri->key == "zendesk-tickets/ZD-145980/"
 * auto object = s3_uri::join(uri->to_string(), "debuginfo.tar.gz");
 * @endcode
 */
struct s3_uri {
    static constexpr std::string_view scheme = "s3://";

    std::string bucket;
    std::string key;

    /**
     * @brief Parse "s3://bucket[/key]"
     * @return The parsed URI or invalid_destination
     */
    [[nodiscard]] static auto parse(std::string_view uri) -> result<s3_uri>;

    /**
     * @brief Append a name to a prefix URI, inserting one '/' between them
     */
    [[nodiscard]] static auto join(std::string_view prefix, std::string_view name)
        -> std::string;

    [[nodiscard]] static auto is_s3_uri(std::string_view text) noexcept -> bool {
        return text.substr(0, scheme.size()) == scheme;
    }

    /**
     * @brief Last path component of the key ("" for a bucket root or a prefix)
     */
    [[nodiscard]] auto basename() const -> std::string;

    [[nodiscard]] auto to_string() const -> std::string;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_TRANSPORT_S3_URI_H
