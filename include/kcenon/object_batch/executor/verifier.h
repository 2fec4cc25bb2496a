/**
 * @file verifier.h
 * @brief Post-upload size verification
 */

#ifndef KCENON_OBJECT_BATCH_EXECUTOR_VERIFIER_H
#define KCENON_OBJECT_BATCH_EXECUTOR_VERIFIER_H

#include "kcenon/object_batch/core/transfer_types.h"
#include "kcenon/object_batch/core/types.h"

namespace kcenon::object_batch {

class object_transport;

/**
 * @brief Compares the planned size of an uploaded item with the remote size
 */
class verifier {
public:
    /**
     * @brief Query the remote size of @p item's target and compare
     * @return The comparison (a missing object is a mismatch with remote
     *         size 0), or the transport error of a failed size query
     */
    [[nodiscard]] static auto verify(const transfer_item& item, object_transport& transport)
        -> result<verification_result>;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_EXECUTOR_VERIFIER_H
