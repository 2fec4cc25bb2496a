/**
 * @file s3_uri.cpp
 * @brief Implementation of s3_uri
 */

#include <kcenon/object_batch/transport/s3_uri.h>

namespace kcenon::object_batch {

auto s3_uri::parse(std::string_view uri) -> result<s3_uri> {
    if (!is_s3_uri(uri)) {
        return unexpected(error(error_code::invalid_destination,
            "not an s3:// URI: '" + std::string(uri) + "'"));
    }

    auto rest = uri.substr(scheme.size());
    auto slash = rest.find('/');

    s3_uri parsed;
    parsed.bucket = std::string(rest.substr(0, slash));
    if (slash != std::string_view::npos) {
        parsed.key = std::string(rest.substr(slash + 1));
    }

    if (parsed.bucket.empty()) {
        return unexpected(error(error_code::invalid_destination,
            "missing bucket name in '" + std::string(uri) + "'"));
    }
    return parsed;
}

auto s3_uri::join(std::string_view prefix, std::string_view name) -> std::string {
    while (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }

    std::string joined(prefix);
    if (!joined.empty() && joined.back() != '/') {
        joined += '/';
    }
    joined += name;
    return joined;
}

auto s3_uri::basename() const -> std::string {
    auto slash = key.rfind('/');
    if (slash == std::string::npos) {
        return key;
    }
    return key.substr(slash + 1);
}

auto s3_uri::to_string() const -> std::string {
    std::string out(scheme);
    out += bucket;
    if (!key.empty()) {
        out += '/';
        out += key;
    }
    return out;
}

}  // namespace kcenon::object_batch
