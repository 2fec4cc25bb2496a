/**
 * @file verifier.cpp
 * @brief Implementation of verifier
 */

#include <kcenon/object_batch/executor/verifier.h>
#include <kcenon/object_batch/transport/transport_interface.h>
#include <kcenon/object_batch/core/logging.h>

namespace kcenon::object_batch {

auto verifier::verify(const transfer_item& item, object_transport& transport)
    -> result<verification_result> {
    auto remote = transport.stat(item.target);
    if (!remote) {
        OB_LOG_WARN(log_category::verify,
            "Size query for " + item.target + " failed: " + remote.error().message);
        return unexpected(remote.error());
    }

    verification_result outcome;
    outcome.expected_size = item.size_bytes;
    if (!remote.value()) {
        outcome.remote_found = false;
        outcome.actual_size = 0;
        outcome.matched = false;
    } else {
        outcome.actual_size = *remote.value();
        outcome.matched = outcome.actual_size == outcome.expected_size;
    }

    if (outcome.matched) {
        OB_LOG_DEBUG(log_category::verify, item.target + ": " + outcome.describe());
    } else {
        OB_LOG_WARN(log_category::verify, item.target + ": " + outcome.describe());
    }
    return outcome;
}

}  // namespace kcenon::object_batch
