/**
 * @file retry_policy.cpp
 * @brief Implementation of retry_policy
 */

#include <kcenon/object_batch/core/retry_policy.h>

#include <algorithm>
#include <cmath>

namespace kcenon::object_batch {

auto retry_policy::backoff_delay(uint32_t attempt) const -> std::chrono::milliseconds {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }

    auto base = static_cast<double>(base_delay.count());
    auto cap = static_cast<double>(delay_cap.count());
    auto delay = base * std::pow(multiplier, static_cast<double>(attempt - 1));

    // pow() overflows to inf for large attempts; the cap still applies
    delay = std::min(delay, cap);
    return std::chrono::milliseconds{static_cast<int64_t>(delay)};
}

auto retry_policy::validate() const -> result<void> {
    if (base_delay.count() <= 0) {
        return unexpected(error(error_code::invalid_configuration,
            "base delay must be positive"));
    }
    if (multiplier < 1.0) {
        return unexpected(error(error_code::invalid_configuration,
            "backoff multiplier must be at least 1"));
    }
    if (delay_cap < base_delay) {
        return unexpected(error(error_code::invalid_configuration,
            "delay cap must not be smaller than the base delay"));
    }
    return {};
}

}  // namespace kcenon::object_batch
