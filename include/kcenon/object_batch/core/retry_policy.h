/**
 * @file retry_policy.h
 * @brief Bounded exponential backoff for failing batch items
 */

#ifndef KCENON_OBJECT_BATCH_CORE_RETRY_POLICY_H
#define KCENON_OBJECT_BATCH_CORE_RETRY_POLICY_H

#include <chrono>
#include <cstdint>

#include "types.h"

namespace kcenon::object_batch {

/**
 * @brief Retry policy configuration
 *
 * Stateless: maps an attempt count to a delay and to a retry decision. The
 * executor owns the sleeping and the re-invocation.
 *
 * With the defaults an item failing every time waits 1s, 2s and 4s and
 * becomes terminal after the fourth failed attempt.
 */
struct retry_policy {
    uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds delay_cap{60000};

    /**
     * @brief Delay to wait before retrying after the given failed attempt
     * @param attempt 1-based count of failed attempts so far
     * @return min(base_delay * multiplier^(attempt-1), delay_cap)
     */
    [[nodiscard]] auto backoff_delay(uint32_t attempt) const -> std::chrono::milliseconds;

    /**
     * @brief Whether another attempt is allowed after @p attempt failures
     */
    [[nodiscard]] auto is_retryable(uint32_t attempt) const noexcept -> bool {
        return attempt <= max_retries;
    }

    /**
     * @brief Validate the policy parameters
     * @return Success or invalid_configuration
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_CORE_RETRY_POLICY_H
