/**
 * @file progress_reporter.cpp
 * @brief Implementation of progress_reporter
 */

#include <kcenon/object_batch/progress/progress_reporter.h>

#include <array>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace kcenon::object_batch {

progress_reporter::progress_reporter(std::ostream& out, bool quiet)
    : out_(out), quiet_(quiet) {}

void progress_reporter::begin_item(std::size_t index, std::size_t count, const transfer_item& item) {
    index_ = index;
    count_ = count;
    name_ = std::filesystem::path(item.source).filename().string();
    if (name_.empty()) {
        name_ = item.source;
    }
    expected_size_ = item.size_bytes;
    last_sample_.reset();
    speed_ = 0.0;

    render(current_line(), false);
}

void progress_reporter::update(const progress_sample& sample) {
    if (last_sample_) {
        auto elapsed = std::chrono::duration<double>(sample.timestamp - last_sample_->timestamp);
        if (elapsed.count() > 0.0 && sample.bytes_done >= last_sample_->bytes_done) {
            speed_ = static_cast<double>(sample.bytes_done - last_sample_->bytes_done) /
                     elapsed.count();
        }
    }
    last_sample_ = sample;

    render(current_line(), false);
}

void progress_reporter::end_item(item_status status) {
    std::ostringstream oss;
    oss << "[" << index_ + 1 << "/" << count_ << "] " << name_ << "  " << to_string(status);
    render(oss.str(), true);
    last_sample_.reset();
    speed_ = 0.0;
}

auto progress_reporter::eta() const -> std::optional<std::chrono::seconds> {
    if (!last_sample_ || speed_ <= 0.0 || last_sample_->bytes_done >= last_sample_->total_bytes) {
        return std::nullopt;
    }
    auto remaining = static_cast<double>(last_sample_->total_bytes - last_sample_->bytes_done);
    return std::chrono::seconds{static_cast<int64_t>(remaining / speed_ + 0.5)};
}

auto progress_reporter::current_line() const -> std::string {
    std::ostringstream oss;
    oss << "[" << index_ + 1 << "/" << count_ << "] " << name_;

    if (!last_sample_) {
        if (expected_size_ > 0) {
            oss << "  " << format_bytes(expected_size_);
        }
        return oss.str();
    }

    const auto& sample = *last_sample_;
    oss << "  " << format_bytes(sample.bytes_done) << "/" << format_bytes(sample.total_bytes);

    if (sample.total_bytes > 0) {
        auto pct = static_cast<double>(sample.bytes_done) * 100.0 /
                   static_cast<double>(sample.total_bytes);
        oss << "  " << std::fixed << std::setprecision(1) << pct << "%";
    }
    if (speed_ > 0.0) {
        oss << "  " << format_bytes(static_cast<uint64_t>(speed_)) << "/s";
    }
    if (auto remaining = eta()) {
        oss << "  ETA " << format_duration(*remaining);
    }
    return oss.str();
}

auto progress_reporter::format_bytes(uint64_t bytes) -> std::string {
    constexpr std::array<const char*, 5> units = {"KiB", "MiB", "GiB", "TiB", "PiB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    auto value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

auto progress_reporter::format_duration(std::chrono::seconds duration) -> std::string {
    auto total = duration.count() < 0 ? 0 : duration.count();
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (hours > 0) {
        oss << hours << ":" << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    } else {
        oss << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    }
    return oss.str();
}

auto progress_reporter::display_width(std::string_view text) noexcept -> std::size_t {
    std::size_t width = 0;
    for (char c : text) {
        // Continuation bytes share the column of their lead byte
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

void progress_reporter::render(const std::string& line, bool finish) {
    if (quiet_) {
        return;
    }

    auto width = display_width(line);
    out_ << '\r' << line;
    if (width < previous_width_) {
        out_ << std::string(previous_width_ - width, ' ');
    }

    if (finish) {
        out_ << '\n';
        previous_width_ = 0;
    } else {
        previous_width_ = width;
    }
    out_.flush();
}

}  // namespace kcenon::object_batch
