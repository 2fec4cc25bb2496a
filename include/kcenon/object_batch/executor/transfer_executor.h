/**
 * @file transfer_executor.h
 * @brief Drives batch items through the transfer state machine
 *
 * Items run strictly one after another. A failing item is retried with
 * backoff until it succeeds or exhausts its retries; it never stops the
 * batch. Every status change is persisted so an interrupted batch can be
 * resumed.
 */

#ifndef KCENON_OBJECT_BATCH_EXECUTOR_TRANSFER_EXECUTOR_H
#define KCENON_OBJECT_BATCH_EXECUTOR_TRANSFER_EXECUTOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "kcenon/object_batch/config/engine_config.h"
#include "kcenon/object_batch/core/transfer_types.h"
#include "kcenon/object_batch/core/types.h"

namespace kcenon::object_batch {

class authenticator;
class cancellation_token;
class object_transport;
class progress_parser;
class progress_reporter;
class state_store;

/**
 * @brief Outcome of one executor run
 */
struct execution_report {
    bool interrupted = false;          ///< Stopped by cancellation
    std::size_t items_run = 0;         ///< Items picked up in this run
    std::size_t copy_invocations = 0;  ///< Transport copy calls, retries included
    uint64_t bytes_transferred = 0;    ///< Bytes of items completed in this run
};

/**
 * @brief Blocks for a backoff delay
 *
 * Implementations should return early once @p cancel is set.
 */
using sleep_function =
    std::function<void(std::chrono::milliseconds delay, const cancellation_token& cancel)>;

/**
 * @brief Sequential transfer executor
 *
 * Processes items whose status is pending or failed_retryable, in plan
 * order:
 * 1. attempts + 1, in_progress, persist
 * 2. transport copy; output lines go through the progress parser
 * 3. on success: verifying + size check (uploads with verification), then
 *    completed, persist
 * 4. on failure: failed_retryable, persist, backoff, retry the same item
 *    while the retry policy allows it, otherwise failed, persist
 *
 * Cancellation leaves the current item failed_retryable with its attempt
 * count unchanged and stops the run.
 *
 * @code
 * transfer_executor executor(transport, &auth, &store, parser, reporter, config);
 * auto report = executor.execute(batch, cancel);
 * @endcode
 */
class transfer_executor {
public:
    /**
     * @param transport Performs copies and size queries
     * @param auth Consulted before the first copy; null to skip
     * @param store Receives every status change; null to run without state
     * @param parser Turns transport output into progress samples
     * @param reporter Displays progress
     * @param config Retry policy and verification switch
     */
    transfer_executor(object_transport& transport,
                      authenticator* auth,
                      state_store* store,
                      const progress_parser& parser,
                      progress_reporter& reporter,
                      engine_config config);

    /**
     * @brief Replace the backoff sleep (tests record delays instead)
     */
    void set_sleep_function(sleep_function sleeper);

    /**
     * @brief Run every runnable item of @p batch
     * @return The run report, or an authentication error when the session
     *         could not be established (no item is touched in that case)
     */
    [[nodiscard]] auto execute(transfer_batch& batch, const cancellation_token& cancel)
        -> result<execution_report>;

    /**
     * @brief Default sleep: sleeps in short slices, returning on cancel
     */
    static void interruptible_sleep(std::chrono::milliseconds delay,
                                    const cancellation_token& cancel);

    /**
     * @brief Log in through @p auth unless its session is already valid
     * @return authentication_failed (or the authenticator's own
     *         authentication error) when the login is rejected
     */
    [[nodiscard]] static auto establish_session(authenticator* auth) -> result<void>;

private:
    enum class item_outcome { finished, cancelled };

    auto ensure_authenticated() -> result<void>;
    auto run_item(transfer_batch& batch, std::size_t index,
                  const cancellation_token& cancel, execution_report& report) -> item_outcome;
    void transition(transfer_batch& batch, transfer_item& item, item_status status);

    object_transport& transport_;
    authenticator* auth_;
    state_store* store_;
    const progress_parser& parser_;
    progress_reporter& reporter_;
    engine_config config_;
    sleep_function sleep_;
    bool authenticated_ = false;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_EXECUTOR_TRANSFER_EXECUTOR_H
