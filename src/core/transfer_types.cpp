/**
 * @file transfer_types.cpp
 * @brief Implementation of batch model helpers
 */

#include <kcenon/object_batch/core/transfer_types.h>
#include <kcenon/object_batch/core/checksum.h>

#include <algorithm>
#include <array>
#include <numeric>

namespace kcenon::object_batch {

namespace {

constexpr std::size_t batch_id_length = 32;

constexpr std::array<item_status, 7> all_statuses = {
    item_status::pending,
    item_status::in_progress,
    item_status::verifying,
    item_status::completed,
    item_status::failed_retryable,
    item_status::failed,
    item_status::skipped,
};

}  // namespace

auto parse_direction(std::string_view name) -> std::optional<transfer_direction> {
    if (name == to_string(transfer_direction::upload)) {
        return transfer_direction::upload;
    }
    if (name == to_string(transfer_direction::download)) {
        return transfer_direction::download;
    }
    return std::nullopt;
}

auto parse_status(std::string_view name) -> std::optional<item_status> {
    for (auto status : all_statuses) {
        if (to_string(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

auto transfer_batch::compute_id(
    transfer_direction direction,
    std::string_view destination,
    std::vector<std::string> sources) -> result<std::string> {
    std::sort(sources.begin(), sources.end());

    std::string canonical;
    canonical += to_string(direction);
    canonical += '\n';
    canonical += destination;
    for (const auto& source : sources) {
        canonical += '\n';
        canonical += source;
    }

    auto digest = checksum::sha256(std::string_view(canonical));
    if (!digest) {
        return unexpected(digest.error());
    }
    return digest.value().substr(0, batch_id_length);
}

auto transfer_batch::count(item_status status) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        items.begin(), items.end(),
        [status](const transfer_item& item) { return item.status == status; }));
}

auto transfer_batch::all_terminal() const -> bool {
    return std::all_of(items.begin(), items.end(), [](const transfer_item& item) {
        return is_terminal_status(item.status);
    });
}

auto transfer_batch::total_bytes() const -> uint64_t {
    return std::accumulate(
        items.begin(), items.end(), uint64_t{0},
        [](uint64_t sum, const transfer_item& item) {
            return item.status == item_status::skipped ? sum : sum + item.size_bytes;
        });
}

auto verification_result::describe() const -> std::string {
    if (!remote_found) {
        return "size mismatch: local=" + std::to_string(expected_size) +
               " remote=0 (remote object not found)";
    }
    if (matched) {
        return "size verified: " + std::to_string(actual_size) + " bytes";
    }
    return "size mismatch: local=" + std::to_string(expected_size) +
           " remote=" + std::to_string(actual_size);
}

}  // namespace kcenon::object_batch
