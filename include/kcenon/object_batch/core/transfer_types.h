/**
 * @file transfer_types.h
 * @brief Batch and item data structures for object_batch
 *
 * This file defines the transfer batch model shared by the planner, the
 * state store, the executor and the reporters.
 */

#ifndef KCENON_OBJECT_BATCH_CORE_TRANSFER_TYPES_H
#define KCENON_OBJECT_BATCH_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.h"

namespace kcenon::object_batch {

/**
 * @brief Transfer direction
 */
enum class transfer_direction {
    upload,    // Local -> object storage
    download,  // Object storage -> local
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) noexcept
    -> std::string_view {
    switch (dir) {
        case transfer_direction::upload:
            return "upload";
        case transfer_direction::download:
            return "download";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a direction name produced by to_string()
 */
[[nodiscard]] auto parse_direction(std::string_view name)
    -> std::optional<transfer_direction>;

/**
 * @brief Per-item status
 *
 * completed, failed and skipped are terminal within a batch run.
 */
enum class item_status {
    pending,
    in_progress,
    verifying,
    completed,
    failed_retryable,
    failed,
    skipped,
};

[[nodiscard]] constexpr auto to_string(item_status status) noexcept
    -> std::string_view {
    switch (status) {
        case item_status::pending:
            return "pending";
        case item_status::in_progress:
            return "in_progress";
        case item_status::verifying:
            return "verifying";
        case item_status::completed:
            return "completed";
        case item_status::failed_retryable:
            return "failed_retryable";
        case item_status::failed:
            return "failed";
        case item_status::skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a status name produced by to_string()
 */
[[nodiscard]] auto parse_status(std::string_view name) -> std::optional<item_status>;

/**
 * @brief Check if item status is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_status(item_status status) noexcept
    -> bool {
    return status == item_status::completed ||
           status == item_status::failed ||
           status == item_status::skipped;
}

/**
 * @brief Check if the executor should pick the item up
 */
[[nodiscard]] constexpr auto is_runnable_status(item_status status) noexcept
    -> bool {
    return status == item_status::pending ||
           status == item_status::failed_retryable;
}

/**
 * @brief A single file moving between local storage and object storage
 */
struct transfer_item {
    std::string source;                ///< Local path (upload) or remote URI (download)
    std::string target;                ///< Remote URI (upload) or local path (download)
    uint64_t size_bytes = 0;           ///< Size known at planning time
    item_status status = item_status::pending;
    uint32_t attempts = 0;             ///< Copy attempts made so far
    uint64_t bytes_transferred = 0;    ///< Last observed progress value
    std::optional<std::string> last_error;

    /// Completed in a previous run and taken over from persisted state.
    /// Not persisted.
    bool carried_over = false;

    transfer_item() = default;
    transfer_item(std::string src, std::string dst, uint64_t size)
        : source(std::move(src)), target(std::move(dst)), size_bytes(size) {}
};

using time_point = std::chrono::system_clock::time_point;

/**
 * @brief A set of items sharing one direction and one destination
 */
struct transfer_batch {
    std::string id;
    transfer_direction direction = transfer_direction::upload;
    std::string destination;
    std::vector<transfer_item> items;
    time_point created_at{};
    time_point updated_at{};

    /**
     * @brief Derive the stable batch identifier
     * @param direction Transfer direction
     * @param destination Destination prefix (upload) or directory (download)
     * @param sources Source identifiers in any order
     * @return 32 hex characters of the SHA-256 over the canonical form
     *
     * The sources are sorted before hashing, so the identifier does not
     * depend on the order in which they were given.
     */
    [[nodiscard]] static auto compute_id(
        transfer_direction direction,
        std::string_view destination,
        std::vector<std::string> sources) -> result<std::string>;

    [[nodiscard]] auto count(item_status status) const -> std::size_t;

    [[nodiscard]] auto all_terminal() const -> bool;

    [[nodiscard]] auto total_bytes() const -> uint64_t;
};

/**
 * @brief Outcome of a post-upload size check
 */
struct verification_result {
    uint64_t expected_size = 0;
    uint64_t actual_size = 0;
    bool matched = false;
    bool remote_found = true;

    [[nodiscard]] auto describe() const -> std::string;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_CORE_TRANSFER_TYPES_H
