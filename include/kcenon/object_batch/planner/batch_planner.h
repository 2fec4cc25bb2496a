/**
 * @file batch_planner.h
 * @brief Builds the ordered item list of a transfer batch
 *
 * The planner turns user-supplied sources (explicit files, a directory
 * tree, explicit object URIs or a remote prefix) into a transfer_batch.
 * Planning is strict: an invalid explicit source or a malformed pattern
 * aborts before any item exists. Entries discovered during a walk that
 * cannot be transferred are left out silently.
 */

#ifndef KCENON_OBJECT_BATCH_PLANNER_BATCH_PLANNER_H
#define KCENON_OBJECT_BATCH_PLANNER_BATCH_PLANNER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/object_batch/core/transfer_types.h"
#include "kcenon/object_batch/core/types.h"

namespace kcenon::object_batch {

class object_transport;

/**
 * @brief Aggregate view of a plan, as shown by a dry run
 */
struct plan_summary {
    std::size_t item_count = 0;
    std::size_t pending_count = 0;
    std::size_t skipped_count = 0;
    uint64_t total_bytes = 0;  ///< Sum over non-skipped items
};

/**
 * @brief Batch planner
 *
 * Download planning needs a transport for remote sizes and listings; upload
 * planning only touches the local filesystem.
 *
 * @code
 * batch_planner planner;
 * auto batch = planner.plan_upload_directory(
 *     "~/support", "s3://gt-logs/zendesk-tickets/ZD-145980/",
 *     {"*.tar.gz"}, {"*.debug.tar.gz"});
 * if (batch) {
 *     auto summary = batch_planner::summarize(batch.value());
 * }
 * @endcode
 */
class batch_planner {
public:
    /**
     * @param transport Used by the download operations; may be null when
     *        only uploads are planned
     */
    explicit batch_planner(object_transport* transport = nullptr);

    /**
     * @brief Plan an upload of explicitly named files
     * @param files Local paths; `~` is expanded and symlinks are resolved
     * @param destination s3:// prefix or ticket shorthand (see
     *        ticket_destination::resolve); target = prefix + file name
     * @return The batch, or the first invalid entry's planning error
     */
    [[nodiscard]] auto plan_upload_files(
        const std::vector<std::string>& files,
        const std::string& destination) -> result<transfer_batch>;

    /**
     * @brief Plan an upload of a directory tree
     *
     * Walks @p root in sorted order and keeps regular files whose
     * root-relative path passes the include/exclude filter. The relative
     * path becomes the key suffix below @p destination.
     */
    [[nodiscard]] auto plan_upload_directory(
        const std::string& root,
        const std::string& destination,
        const std::vector<std::string>& includes,
        const std::vector<std::string>& excludes) -> result<transfer_batch>;

    /**
     * @brief Plan a download of explicitly named objects
     * @param keys Full s3:// URIs or "bucket/key" strings
     * @param output_dir Local directory; target = output_dir / basename(key)
     */
    [[nodiscard]] auto plan_download_keys(
        const std::vector<std::string>& keys,
        const std::string& output_dir) -> result<transfer_batch>;

    /**
     * @brief Plan a download of every object below a remote prefix
     *
     * @p prefix_uri may be a ticket shorthand such as "ZD-145980".
     * Patterns apply to the key relative to the prefix. Targets are
     * flattened to output_dir / basename(key); objects whose names collide
     * are reported as duplicates.
     */
    [[nodiscard]] auto plan_download_prefix(
        const std::string& prefix_uri,
        const std::string& output_dir,
        const std::vector<std::string>& includes,
        const std::vector<std::string>& excludes) -> result<transfer_batch>;

    /**
     * @brief Count items and bytes of a plan
     */
    [[nodiscard]] static auto summarize(const transfer_batch& batch) -> plan_summary;

    /**
     * @brief Skip every item whose target was already claimed earlier
     * @return Number of items marked skipped
     *
     * The skipped item's last_error reads "duplicate of item N" with N the
     * 1-based position of the first occurrence.
     */
    static auto mark_duplicates(std::vector<transfer_item>& items) -> std::size_t;

    /**
     * @brief Expand a leading "~" or "~/" to the home directory
     */
    [[nodiscard]] static auto expand_user_path(std::string_view path) -> std::string;

private:
    /**
     * @param source_ids What the caller named: resolved explicit entries, or
     *        the walked root or listed prefix. The batch id is derived from
     *        these, so a tree that changes between runs keeps its id.
     */
    auto finalize(transfer_direction direction,
                  std::string destination,
                  std::vector<std::string> source_ids,
                  std::vector<transfer_item> items) -> result<transfer_batch>;

    object_transport* transport_;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_PLANNER_BATCH_PLANNER_H
