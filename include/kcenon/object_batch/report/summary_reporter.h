/**
 * @file summary_reporter.h
 * @brief End-of-run batch summary
 */

#ifndef KCENON_OBJECT_BATCH_REPORT_SUMMARY_REPORTER_H
#define KCENON_OBJECT_BATCH_REPORT_SUMMARY_REPORTER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "kcenon/object_batch/core/transfer_types.h"

namespace kcenon::object_batch {

/**
 * @brief A failed item as listed in the summary
 */
struct failed_item {
    std::string target;
    std::string error;
};

/**
 * @brief Counts and failures of one batch run
 *
 * completed + failed + skipped + pending == total. Pending is non-zero
 * only when the run was interrupted or was a dry run.
 */
struct batch_summary {
    std::string batch_id;
    transfer_direction direction = transfer_direction::upload;
    std::size_t total = 0;
    std::size_t completed_count = 0;
    std::size_t carried_over_count = 0;  ///< Part of completed_count
    std::size_t failed_count = 0;
    std::size_t skipped_count = 0;
    std::size_t pending_count = 0;
    bool interrupted = false;
    bool dry_run = false;
    std::vector<failed_item> failures;
    uint64_t total_bytes = 0;            ///< Skipped duplicates excluded
    uint64_t bytes_transferred = 0;      ///< Completed in this run
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief No failed item and not interrupted
     */
    [[nodiscard]] auto success() const -> bool {
        return failed_count == 0 && !interrupted;
    }

    /**
     * @brief Items completed by this run
     */
    [[nodiscard]] auto newly_completed() const -> std::size_t {
        return completed_count - carried_over_count;
    }
};

/**
 * @brief Builds and prints batch summaries
 */
class summary_reporter {
public:
    /**
     * @brief Count the batch's items by status
     * @param batch Batch after execution (or after planning, for dry runs)
     * @param interrupted Whether the run was cancelled
     * @param elapsed Wall time of the run
     */
    [[nodiscard]] static auto summarize(const transfer_batch& batch,
                                        bool interrupted,
                                        std::chrono::milliseconds elapsed) -> batch_summary;

    /**
     * @brief Print the summary block
     */
    static void render(const batch_summary& summary, std::ostream& out);

    /**
     * @brief Final status line ("SUCCESS", "COMPLETED WITH ERRORS", ...)
     */
    [[nodiscard]] static auto status_line(const batch_summary& summary) -> std::string;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_REPORT_SUMMARY_REPORTER_H
