/**
 * @file summary_reporter.cpp
 * @brief Implementation of summary_reporter
 */

#include <kcenon/object_batch/report/summary_reporter.h>
#include <kcenon/object_batch/progress/progress_reporter.h>

namespace kcenon::object_batch {

auto summary_reporter::summarize(const transfer_batch& batch,
                                 bool interrupted,
                                 std::chrono::milliseconds elapsed) -> batch_summary {
    batch_summary summary;
    summary.batch_id = batch.id;
    summary.direction = batch.direction;
    summary.total = batch.items.size();
    summary.interrupted = interrupted;
    summary.elapsed = elapsed;
    summary.total_bytes = batch.total_bytes();

    for (const auto& item : batch.items) {
        switch (item.status) {
            case item_status::completed:
                ++summary.completed_count;
                if (item.carried_over) {
                    ++summary.carried_over_count;
                } else {
                    summary.bytes_transferred += item.size_bytes;
                }
                break;
            case item_status::failed:
                ++summary.failed_count;
                summary.failures.push_back({item.target, item.last_error.value_or("unknown error")});
                break;
            case item_status::skipped:
                ++summary.skipped_count;
                break;
            default:
                ++summary.pending_count;
                break;
        }
    }
    return summary;
}

void summary_reporter::render(const batch_summary& summary, std::ostream& out) {
    out << "========================================\n";
    out << "  Batch " << to_string(summary.direction) << " summary"
        << (summary.dry_run ? " (dry run)" : "") << "\n";
    out << "========================================\n";
    out << "  Batch ID:      " << summary.batch_id << "\n";
    out << "  Total items:   " << summary.total << "\n";
    out << "  Completed:     " << summary.completed_count;
    if (summary.carried_over_count > 0) {
        out << " (" << summary.carried_over_count << " from previous run)";
    }
    out << "\n";
    out << "  Failed:        " << summary.failed_count << "\n";
    out << "  Skipped:       " << summary.skipped_count << "\n";
    if (summary.pending_count > 0) {
        out << "  Pending:       " << summary.pending_count << "\n";
    }
    out << "  Total size:    " << progress_reporter::format_bytes(summary.total_bytes) << "\n";
    if (!summary.dry_run) {
        out << "  Transferred:   " << progress_reporter::format_bytes(summary.bytes_transferred)
            << "\n";
        out << "  Elapsed:       "
            << progress_reporter::format_duration(
                   std::chrono::duration_cast<std::chrono::seconds>(summary.elapsed))
            << "\n";
    }

    if (!summary.failures.empty()) {
        out << "\n  Failed items:\n";
        for (const auto& failure : summary.failures) {
            out << "    " << failure.target << ": " << failure.error << "\n";
        }
    }

    out << "----------------------------------------\n";
    out << "  " << status_line(summary) << "\n";
    out.flush();
}

auto summary_reporter::status_line(const batch_summary& summary) -> std::string {
    if (summary.dry_run) {
        return "DRY RUN: " + std::to_string(summary.pending_count) + " item(s) would be transferred";
    }
    if (summary.interrupted) {
        return "INTERRUPTED: batch " + summary.batch_id + " can be resumed";
    }
    if (summary.failed_count > 0) {
        return "COMPLETED WITH ERRORS: " + std::to_string(summary.failed_count) +
               " of " + std::to_string(summary.total) + " item(s) failed";
    }
    return "SUCCESS";
}

}  // namespace kcenon::object_batch
