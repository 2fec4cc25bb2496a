/**
 * @file progress_parser.cpp
 * @brief Implementation of progress parsers
 */

#include <kcenon/object_batch/progress/progress_parser.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

namespace kcenon::object_batch {

namespace {

constexpr std::string_view completed_marker = "Completed ";

constexpr std::array<std::pair<std::string_view, double>, 7> unit_factors = {{
    {"Bytes", 1.0},
    {"Byte", 1.0},
    {"KiB", 1024.0},
    {"MiB", 1024.0 * 1024.0},
    {"GiB", 1024.0 * 1024.0 * 1024.0},
    {"TiB", 1024.0 * 1024.0 * 1024.0 * 1024.0},
    {"PiB", 1024.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0},
}};

auto parse_uint(std::string_view text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Split "<amount> <unit>" and convert it to bytes
 */
auto parse_quantity(std::string_view text) -> std::optional<uint64_t> {
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    auto space = text.find(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }
    return aws_cli_progress_parser::to_bytes(text.substr(0, space), text.substr(space + 1));
}

}  // namespace

auto aws_cli_progress_parser::to_bytes(std::string_view amount, std::string_view unit)
    -> std::optional<uint64_t> {
    if (amount.empty()) {
        return std::nullopt;
    }

    std::string number(amount);
    char* end = nullptr;
    double value = std::strtod(number.c_str(), &end);
    if (end != number.c_str() + number.size() || !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }

    for (const auto& [name, factor] : unit_factors) {
        if (unit == name) {
            return static_cast<uint64_t>(std::llround(value * factor));
        }
    }
    return std::nullopt;
}

auto aws_cli_progress_parser::parse(std::string_view line) const
    -> std::optional<progress_sample> {
    auto marker = line.find(completed_marker);
    if (marker == std::string_view::npos) {
        return std::nullopt;
    }

    auto rest = line.substr(marker + completed_marker.size());
    auto end = rest.find(" (");
    if (end == std::string_view::npos) {
        end = rest.find(" with ");
    }
    rest = rest.substr(0, end);

    auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    auto done = parse_quantity(rest.substr(0, slash));
    auto total = parse_quantity(rest.substr(slash + 1));
    if (!done || !total) {
        return std::nullopt;
    }

    return progress_sample{*done, *total, std::chrono::steady_clock::now()};
}

auto byte_count_progress_parser::parse(std::string_view line) const
    -> std::optional<progress_sample> {
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        line.remove_prefix(1);
    }
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }

    auto slash = line.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    auto done = parse_uint(line.substr(0, slash));
    auto total = parse_uint(line.substr(slash + 1));
    if (!done || !total || *done > *total) {
        return std::nullopt;
    }

    return progress_sample{*done, *total, std::chrono::steady_clock::now()};
}

}  // namespace kcenon::object_batch
