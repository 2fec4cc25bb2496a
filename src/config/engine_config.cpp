/**
 * @file engine_config.cpp
 * @brief Implementation of engine_config and its builder
 */

#include <kcenon/object_batch/config/engine_config.h>

namespace kcenon::object_batch {

auto engine_config::validate() const -> result<void> {
    if (auto valid = retry.validate(); !valid) {
        return valid;
    }
    if (auto_cleanup && state_ttl.count() <= 0) {
        return unexpected(error(error_code::invalid_configuration,
            "state TTL must be positive when cleanup is enabled"));
    }
    return {};
}

auto engine_config::builder::with_retry_policy(const retry_policy& policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto engine_config::builder::with_max_retries(uint32_t max_retries) -> builder& {
    config_.retry.max_retries = max_retries;
    return *this;
}

auto engine_config::builder::with_verification(bool enable) -> builder& {
    config_.verify = enable;
    return *this;
}

auto engine_config::builder::with_resume(bool enable) -> builder& {
    config_.resume = enable;
    return *this;
}

auto engine_config::builder::with_state_directory(std::filesystem::path dir) -> builder& {
    config_.state_directory = std::move(dir);
    return *this;
}

auto engine_config::builder::with_keep_state(bool keep) -> builder& {
    config_.keep_state = keep;
    return *this;
}

auto engine_config::builder::with_quiet_progress(bool quiet) -> builder& {
    config_.quiet = quiet;
    return *this;
}

auto engine_config::builder::with_state_cleanup(bool enable, std::chrono::seconds ttl)
    -> builder& {
    config_.auto_cleanup = enable;
    config_.state_ttl = ttl;
    return *this;
}

auto engine_config::builder::build() -> result<engine_config> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    return config_;
}

}  // namespace kcenon::object_batch
