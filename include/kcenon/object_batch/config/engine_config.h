/**
 * @file engine_config.h
 * @brief Explicit configuration of the batch engine
 */

#ifndef KCENON_OBJECT_BATCH_CONFIG_ENGINE_CONFIG_H
#define KCENON_OBJECT_BATCH_CONFIG_ENGINE_CONFIG_H

#include <chrono>
#include <cstdint>
#include <filesystem>

#include "kcenon/object_batch/core/retry_policy.h"
#include "kcenon/object_batch/core/types.h"

namespace kcenon::object_batch {

/**
 * @brief Engine configuration
 *
 * Passed by value to the engine and the executor. There is no process-wide
 * configuration.
 */
struct engine_config {
    retry_policy retry;
    bool verify = false;                          ///< Size check after uploads
    bool resume = true;                           ///< Merge persisted state
    bool keep_state = false;                      ///< Keep state of finished batches
    bool quiet = false;                           ///< No progress display
    std::filesystem::path state_directory;        ///< Empty: state_store default
    bool auto_cleanup = true;                     ///< Drop stale state files on run
    std::chrono::seconds state_ttl{7 * 24 * 3600};

    /**
     * @brief Check the configuration
     * @return Success or invalid_configuration
     */
    [[nodiscard]] auto validate() const -> result<void>;

    class builder;
};

/**
 * @brief Builder for engine_config
 *
 * @code
 * auto config = engine_config::builder()
 *     .with_max_retries(5)
 *     .with_verification(true)
 *     .build();
 * @endcode
 */
class engine_config::builder {
public:
    builder() = default;

    /**
     * @brief Replace the whole retry policy
     * @param policy Backoff parameters and retry limit
     * @return Reference to builder for chaining
     */
    auto with_retry_policy(const retry_policy& policy) -> builder&;

    /**
     * @brief Override only the retry limit
     * @param max_retries Retries after the first failed attempt
     * @return Reference to builder for chaining
     */
    auto with_max_retries(uint32_t max_retries) -> builder&;

    auto with_verification(bool enable) -> builder&;

    auto with_resume(bool enable) -> builder&;

    auto with_state_directory(std::filesystem::path dir) -> builder&;

    auto with_keep_state(bool keep) -> builder&;

    auto with_quiet_progress(bool quiet) -> builder&;

    /**
     * @brief Configure removal of state files older than @p ttl
     * @return Reference to builder for chaining
     */
    auto with_state_cleanup(bool enable, std::chrono::seconds ttl) -> builder&;

    /**
     * @brief Build the configuration
     * @return Result containing the configuration or invalid_configuration
     */
    [[nodiscard]] auto build() -> result<engine_config>;

private:
    engine_config config_;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_CONFIG_ENGINE_CONFIG_H
