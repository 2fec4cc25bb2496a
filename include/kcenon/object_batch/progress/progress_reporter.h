/**
 * @file progress_reporter.h
 * @brief Single-line progress display for the item in flight
 */

#ifndef KCENON_OBJECT_BATCH_PROGRESS_PROGRESS_REPORTER_H
#define KCENON_OBJECT_BATCH_PROGRESS_PROGRESS_REPORTER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "kcenon/object_batch/core/transfer_types.h"
#include "progress_parser.h"

namespace kcenon::object_batch {

/**
 * @brief Renders "[I/N] name  done/total  pct  speed  ETA" on one line
 *
 * Each render starts with '\r' and is padded with spaces to the width of
 * the previous render, so a shorter line never leaves characters of a
 * longer one behind.
 *
 * @code
 * progress_reporter reporter(std::cerr);
 * reporter.begin_item(0, batch.items.size(), batch.items[0]);
 * reporter.update(sample);
 * reporter.end_item(item_status::completed);
 * @endcode
 */
class progress_reporter {
public:
    /**
     * @param out Stream receiving the display
     * @param quiet Track progress without rendering anything
     */
    explicit progress_reporter(std::ostream& out, bool quiet = false);

    /**
     * @brief Start displaying an item
     * @param index 0-based position of the item in the batch
     * @param count Number of items in the batch
     */
    void begin_item(std::size_t index, std::size_t count, const transfer_item& item);

    /**
     * @brief Record a sample and redraw the line
     */
    void update(const progress_sample& sample);

    /**
     * @brief Draw the item's final status and move to the next line
     */
    void end_item(item_status status);

    /**
     * @brief Bytes per second between the last two samples (0 if unknown)
     */
    [[nodiscard]] auto speed() const -> double { return speed_; }

    /**
     * @brief Estimated time to completion, if the speed is known
     */
    [[nodiscard]] auto eta() const -> std::optional<std::chrono::seconds>;

    /**
     * @brief The text that the next render would draw (no '\r', no padding)
     */
    [[nodiscard]] auto current_line() const -> std::string;

    [[nodiscard]] auto is_quiet() const -> bool { return quiet_; }

    /**
     * @brief Format a byte count with binary units ("1.50 MiB")
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    /**
     * @brief Format a duration as "MM:SS" or "H:MM:SS"
     */
    [[nodiscard]] static auto format_duration(std::chrono::seconds duration) -> std::string;

    /**
     * @brief Terminal columns of @p text, counted as UTF-8 code points
     */
    [[nodiscard]] static auto display_width(std::string_view text) noexcept -> std::size_t;

private:
    void render(const std::string& line, bool finish);

    std::ostream& out_;
    bool quiet_;

    std::size_t index_ = 0;
    std::size_t count_ = 0;
    std::string name_;
    uint64_t expected_size_ = 0;

    std::optional<progress_sample> last_sample_;
    double speed_ = 0.0;
    std::size_t previous_width_ = 0;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_PROGRESS_PROGRESS_REPORTER_H
