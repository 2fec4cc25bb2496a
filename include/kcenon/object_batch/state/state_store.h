/**
 * @file state_store.h
 * @brief Durable per-batch item state for resuming interrupted batches
 *
 * This file defines the state_store class, which keeps one JSON state file
 * per batch identifier and merges persisted progress into a fresh plan.
 */

#ifndef KCENON_OBJECT_BATCH_STATE_STATE_STORE_H
#define KCENON_OBJECT_BATCH_STATE_STATE_STORE_H

#include <kcenon/object_batch/core/transfer_types.h>
#include <kcenon/object_batch/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_batch {

/**
 * @brief Configuration for state_store
 */
struct state_store_config {
    std::filesystem::path state_directory;  ///< Directory holding <id>.json files

    /**
     * @brief Use default_directory()
     */
    state_store_config();

    /**
     * @brief Construct with custom state directory
     */
    explicit state_store_config(std::filesystem::path dir);

    /**
     * @brief $XDG_STATE_HOME/object_batch, else ~/.local/state/object_batch
     */
    [[nodiscard]] static auto default_directory() -> std::filesystem::path;
};

/**
 * @brief Persistent store of batch state
 *
 * Writes are atomic: the new content goes to `<id>.json.tmp`, which is then
 * renamed over `<id>.json`, so a load never observes a half-written file.
 * State files are readable and writable by the owner only.
 *
 * @code
 * state_store store({"/tmp/object_batch_state"});
 *
 * auto persisted = store.load(batch.id);
 * if (persisted && persisted.value()) {
 *     state_store::reconcile(batch, *persisted.value());
 * }
 * auto saved = store.save(batch);
 * @endcode
 */
class state_store {
public:
    static constexpr int format_version = 1;

    explicit state_store(const state_store_config& config = state_store_config{});

    ~state_store();

    // Non-copyable but movable
    state_store(const state_store&) = delete;
    auto operator=(const state_store&) -> state_store& = delete;
    state_store(state_store&&) noexcept;
    auto operator=(state_store&&) noexcept -> state_store&;

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * @brief Load the persisted state of a batch
     * @return The batch, an empty optional when no state exists, or
     *         state_corrupted when the file cannot be read or parsed
     */
    [[nodiscard]] auto load(const std::string& batch_id)
        -> result<std::optional<transfer_batch>>;

    /**
     * @brief Atomically replace the persisted state of a batch
     * @return Success or state_write_failed
     */
    [[nodiscard]] auto save(const transfer_batch& batch) -> result<void>;

    /**
     * @brief Delete the persisted state of a batch (no-op if absent)
     */
    [[nodiscard]] auto clear(const std::string& batch_id) -> result<void>;

    [[nodiscard]] auto exists(const std::string& batch_id) const -> bool;

    /**
     * @brief Identifiers of every batch with a state file, sorted
     */
    [[nodiscard]] auto list_batches() const -> std::vector<std::string>;

    /**
     * @brief Remove state files not updated within @p ttl
     * @return Number of removed files
     */
    auto cleanup_expired(std::chrono::seconds ttl) -> std::size_t;

    [[nodiscard]] auto state_file_path(const std::string& batch_id) const
        -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const state_store_config&;

    // ========================================================================
    // Merging and encoding
    // ========================================================================

    /**
     * @brief Merge persisted progress into a freshly planned batch
     * @param planned Fresh plan, updated in place
     * @param persisted Previously saved state of the same batch id
     * @return Number of items carried over as completed
     *
     * Items are matched by target. A planned item whose persisted
     * counterpart completed is carried over as completed. Every other
     * non-skipped item restarts pending with zero attempts. Persisted items
     * missing from the plan are dropped.
     */
    static auto reconcile(transfer_batch& planned, const transfer_batch& persisted)
        -> std::size_t;

    [[nodiscard]] static auto serialize(const transfer_batch& batch) -> std::string;

    [[nodiscard]] static auto deserialize(std::string_view json) -> result<transfer_batch>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_STATE_STATE_STORE_H
