/**
 * @file batch_engine.h
 * @brief Facade wiring planning, resume, execution and summary
 */

#ifndef KCENON_OBJECT_BATCH_ENGINE_BATCH_ENGINE_H
#define KCENON_OBJECT_BATCH_ENGINE_BATCH_ENGINE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "kcenon/object_batch/config/engine_config.h"
#include "kcenon/object_batch/core/transfer_types.h"
#include "kcenon/object_batch/core/types.h"
#include "kcenon/object_batch/executor/transfer_executor.h"
#include "kcenon/object_batch/report/summary_reporter.h"

namespace kcenon::object_batch {

class authenticator;
class cancellation_token;
class object_transport;
class progress_parser;

/**
 * @brief One invocation of the batch command
 *
 * Uploads take either explicit @ref sources or a @ref directory root.
 * Downloads take either explicit object URIs in @ref sources or a
 * @ref remote_prefix to list. The optional fields override the engine
 * configuration for this request only.
 */
struct batch_request {
    transfer_direction direction = transfer_direction::upload;
    std::vector<std::string> sources;
    std::optional<std::string> directory;      ///< Upload root to walk
    std::optional<std::string> remote_prefix;  ///< Download prefix to list
    std::string destination;                   ///< s3:// prefix or local directory
    std::vector<std::string> includes;
    std::vector<std::string> excludes;

    bool dry_run = false;
    std::optional<bool> verify;
    std::optional<uint32_t> max_retries;
    bool no_resume = false;
    bool clean_state = false;
    std::optional<bool> keep_state;
};

/**
 * @brief Batch transfer engine
 *
 * @code
 * aws_cli_transport transport(aws_config);
 * aws_cli_authenticator auth(aws_config);
 * batch_engine engine(config, transport, &auth, std::cerr);
 *
 * batch_request request;
 * request.directory = "~/support";
 * request.destination = "s3://gt-logs/zendesk-tickets/ZD-145980/";
 * request.includes = {"*.tar.gz"};
 *
 * auto summary = engine.run(request, cancel);
 * if (summary) {
 *     summary_reporter::render(summary.value(), std::cout);
 * }
 * @endcode
 */
class batch_engine {
public:
    /**
     * @param config Engine configuration
     * @param transport Copies, size queries and listings
     * @param auth Session check before download planning or the first
     *        copy; may be null
     * @param progress_out Stream for the progress line
     * @param parser Progress format of @p transport; defaults to the AWS CLI
     *        format
     */
    batch_engine(engine_config config,
                 object_transport& transport,
                 authenticator* auth,
                 std::ostream& progress_out,
                 std::unique_ptr<progress_parser> parser = nullptr);

    ~batch_engine();

    batch_engine(const batch_engine&) = delete;
    auto operator=(const batch_engine&) -> batch_engine& = delete;
    batch_engine(batch_engine&&) noexcept;
    auto operator=(batch_engine&&) noexcept -> batch_engine&;

    /**
     * @brief Plan a request without touching state or copying anything
     *
     * Downloads log in first, since planning them lists or stats remote
     * objects.
     */
    [[nodiscard]] auto plan(const batch_request& request) -> result<transfer_batch>;

    /**
     * @brief Plan, resume, execute and summarize a request
     * @return The summary, or a planning, configuration or authentication
     *         error. Per-item failures are part of the summary.
     */
    [[nodiscard]] auto run(const batch_request& request, const cancellation_token& cancel)
        -> result<batch_summary>;

    /**
     * @brief Remove the persisted state of a batch
     */
    [[nodiscard]] auto clean_state(const std::string& batch_id) -> result<void>;

    /**
     * @brief Identifiers of batches with persisted state
     */
    [[nodiscard]] auto list_resumable() const -> std::vector<std::string>;

    /**
     * @brief Replace the backoff sleep used by the executor
     */
    void set_sleep_function(sleep_function sleeper);

    [[nodiscard]] auto config() const -> const engine_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_ENGINE_BATCH_ENGINE_H
