/**
 * @file batch_planner.cpp
 * @brief Implementation of batch_planner
 */

#include <kcenon/object_batch/planner/batch_planner.h>
#include <kcenon/object_batch/planner/pattern_filter.h>
#include <kcenon/object_batch/transport/s3_uri.h>
#include <kcenon/object_batch/transport/ticket_destination.h>
#include <kcenon/object_batch/transport/transport_interface.h>
#include <kcenon/object_batch/core/logging.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <unordered_map>

namespace kcenon::object_batch {

namespace fs = std::filesystem;

namespace {

struct walk_entry {
    std::string relative;
    fs::path path;
};

/**
 * @brief Normalize an upload destination to "s3://bucket/prefix/"
 *
 * Ticket shorthands ("ZD-145980", "ZD-145980-RED-172041") name the ticket's
 * log prefix.
 */
auto normalize_prefix(const std::string& destination) -> result<std::string> {
    auto resolved = ticket_destination::resolve(destination);
    if (!resolved) {
        auto code = resolved.error().code == error_code::invalid_ticket_id
                        ? error_code::invalid_ticket_id
                        : error_code::invalid_destination;
        return unexpected(error(code, resolved.error().message));
    }
    return s3_uri::join(resolved.value().to_string(), "");
}

auto check_output_dir(const std::string& output_dir) -> result<fs::path> {
    if (output_dir.empty()) {
        return unexpected(error(error_code::invalid_destination, "empty output directory"));
    }

    fs::path dir(batch_planner::expand_user_path(output_dir));
    std::error_code ec;
    if (fs::exists(dir, ec) && !fs::is_directory(dir, ec)) {
        return unexpected(error(error_code::invalid_destination,
            "output path is not a directory: " + dir.string()));
    }
    return fs::absolute(dir, ec).lexically_normal();
}

/**
 * @brief Accept a full s3:// URI or the "bucket/key" shorthand
 *
 * A ticket shorthand names a prefix, not an object, and is rejected here.
 */
auto parse_object_reference(const std::string& reference) -> result<s3_uri> {
    auto parsed = ticket_destination::resolve(reference);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    if (parsed.value().key.empty() || parsed.value().key.back() == '/') {
        return unexpected(error(error_code::invalid_source,
            "not an object reference: '" + reference + "'"));
    }
    return parsed;
}

}  // namespace

batch_planner::batch_planner(object_transport* transport)
    : transport_(transport) {}

auto batch_planner::plan_upload_files(
    const std::vector<std::string>& files,
    const std::string& destination) -> result<transfer_batch> {
    auto prefix = normalize_prefix(destination);
    if (!prefix) {
        return unexpected(prefix.error());
    }

    std::vector<transfer_item> items;
    items.reserve(files.size());
    std::vector<std::string> source_ids;
    source_ids.reserve(files.size());

    for (const auto& file : files) {
        fs::path given(expand_user_path(file));
        std::error_code ec;

        auto status = fs::status(given, ec);
        if (ec || !fs::exists(status)) {
            return unexpected(error(error_code::source_not_found,
                "source not found: " + file));
        }
        if (fs::is_directory(status)) {
            return unexpected(error(error_code::source_is_directory,
                "source is a directory: " + file));
        }
        if (!fs::is_regular_file(status)) {
            return unexpected(error(error_code::invalid_source,
                "source is not a regular file: " + file));
        }

        auto resolved = fs::canonical(given, ec);
        if (ec) {
            return unexpected(error(error_code::source_not_found,
                "cannot resolve " + file + ": " + ec.message()));
        }
        auto size = fs::file_size(resolved, ec);
        if (ec) {
            return unexpected(error(error_code::source_not_found,
                "cannot stat " + file + ": " + ec.message()));
        }

        auto name = given.lexically_normal().filename().string();
        items.emplace_back(resolved.string(), s3_uri::join(prefix.value(), name), size);
        source_ids.push_back(resolved.string());
    }

    return finalize(transfer_direction::upload, prefix.value(), std::move(source_ids),
                    std::move(items));
}

auto batch_planner::plan_upload_directory(
    const std::string& root,
    const std::string& destination,
    const std::vector<std::string>& includes,
    const std::vector<std::string>& excludes) -> result<transfer_batch> {
    if (auto valid = pattern_filter::validate_patterns(includes); !valid) {
        return unexpected(valid.error());
    }
    if (auto valid = pattern_filter::validate_patterns(excludes); !valid) {
        return unexpected(valid.error());
    }

    auto prefix = normalize_prefix(destination);
    if (!prefix) {
        return unexpected(prefix.error());
    }

    std::error_code ec;
    fs::path root_path(expand_user_path(root));
    if (!fs::exists(root_path, ec)) {
        return unexpected(error(error_code::source_not_found,
            "directory not found: " + root));
    }
    if (!fs::is_directory(root_path, ec)) {
        return unexpected(error(error_code::invalid_source,
            "not a directory: " + root));
    }
    root_path = fs::canonical(root_path, ec);
    if (ec) {
        return unexpected(error(error_code::directory_walk_failed,
            "cannot resolve " + root + ": " + ec.message()));
    }

    fs::recursive_directory_iterator it(
        root_path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return unexpected(error(error_code::directory_walk_failed,
            "cannot open " + root_path.string() + ": " + ec.message()));
    }

    std::vector<walk_entry> entries;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return unexpected(error(error_code::directory_walk_failed,
                "walk of " + root_path.string() + " failed: " + ec.message()));
        }

        std::error_code entry_ec;
        // Dangling symlinks, sockets, fifos and directories are not transferred
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        entries.push_back(walk_entry{
            it->path().lexically_relative(root_path).generic_string(), it->path()});
    }
    if (ec) {
        return unexpected(error(error_code::directory_walk_failed,
            "walk of " + root_path.string() + " failed: " + ec.message()));
    }

    std::sort(entries.begin(), entries.end(),
              [](const walk_entry& a, const walk_entry& b) { return a.relative < b.relative; });

    std::vector<transfer_item> items;
    std::size_t filtered = 0;
    for (const auto& entry : entries) {
        if (!pattern_filter::accepts(entry.relative, includes, excludes)) {
            ++filtered;
            continue;
        }

        std::error_code entry_ec;
        auto resolved = fs::canonical(entry.path, entry_ec);
        if (entry_ec) {
            continue;
        }
        auto size = fs::file_size(resolved, entry_ec);
        if (entry_ec) {
            continue;
        }
        items.emplace_back(resolved.string(), s3_uri::join(prefix.value(), entry.relative), size);
    }

    OB_LOG_DEBUG(log_category::planner,
        "Walked " + root_path.string() + ": " + std::to_string(entries.size()) +
        " files, " + std::to_string(filtered) + " filtered out");

    // The tree may gain or lose files between runs; the root names the batch
    return finalize(transfer_direction::upload, prefix.value(), {root_path.string() + "/"},
                    std::move(items));
}

auto batch_planner::plan_download_keys(
    const std::vector<std::string>& keys,
    const std::string& output_dir) -> result<transfer_batch> {
    auto dir = check_output_dir(output_dir);
    if (!dir) {
        return unexpected(dir.error());
    }

    std::vector<transfer_item> items;
    items.reserve(keys.size());
    std::vector<std::string> source_ids;
    source_ids.reserve(keys.size());

    for (const auto& key : keys) {
        auto object = parse_object_reference(key);
        if (!object) {
            return unexpected(object.error());
        }

        auto uri = object.value().to_string();
        uint64_t size = 0;
        if (transport_ != nullptr) {
            auto remote = transport_->stat(uri);
            if (!remote) {
                OB_LOG_WARN(log_category::planner,
                    "Size of " + uri + " unknown: " + remote.error().message);
            } else if (!remote.value()) {
                return unexpected(error(error_code::source_not_found,
                    "remote object not found: " + uri));
            } else {
                size = *remote.value();
            }
        }

        auto target = (dir.value() / object.value().basename()).string();
        source_ids.push_back(uri);
        items.emplace_back(std::move(uri), std::move(target), size);
    }

    return finalize(transfer_direction::download, dir.value().string(), std::move(source_ids),
                    std::move(items));
}

auto batch_planner::plan_download_prefix(
    const std::string& prefix_uri,
    const std::string& output_dir,
    const std::vector<std::string>& includes,
    const std::vector<std::string>& excludes) -> result<transfer_batch> {
    if (auto valid = pattern_filter::validate_patterns(includes); !valid) {
        return unexpected(valid.error());
    }
    if (auto valid = pattern_filter::validate_patterns(excludes); !valid) {
        return unexpected(valid.error());
    }

    auto prefix = ticket_destination::resolve(prefix_uri);
    if (!prefix) {
        auto code = prefix.error().code == error_code::invalid_ticket_id
                        ? error_code::invalid_ticket_id
                        : error_code::invalid_source;
        return unexpected(error(code, prefix.error().message));
    }
    auto dir = check_output_dir(output_dir);
    if (!dir) {
        return unexpected(dir.error());
    }
    if (transport_ == nullptr) {
        return unexpected(error(error_code::invalid_configuration,
            "remote listing requires a transport"));
    }

    auto listing = transport_->list(prefix.value().to_string());
    if (!listing) {
        return unexpected(listing.error());
    }

    auto objects = std::move(listing.value());
    std::sort(objects.begin(), objects.end(),
              [](const remote_object& a, const remote_object& b) { return a.key < b.key; });

    const auto& prefix_key = prefix.value().key;
    std::vector<transfer_item> items;
    for (const auto& object : objects) {
        std::string_view relative(object.key);
        if (relative.substr(0, prefix_key.size()) == prefix_key) {
            relative.remove_prefix(prefix_key.size());
        }
        while (!relative.empty() && relative.front() == '/') {
            relative.remove_prefix(1);
        }
        if (relative.empty() || !pattern_filter::accepts(relative, includes, excludes)) {
            continue;
        }

        auto slash = object.key.rfind('/');
        auto name = slash == std::string::npos ? object.key : object.key.substr(slash + 1);
        items.emplace_back(object.uri, (dir.value() / name).string(), object.size_bytes);
    }

    OB_LOG_DEBUG(log_category::planner,
        "Listed " + std::to_string(objects.size()) + " objects under " + prefix_uri +
        ", " + std::to_string(items.size()) + " selected");

    return finalize(transfer_direction::download, dir.value().string(),
                    {s3_uri::join(prefix.value().to_string(), "")}, std::move(items));
}

auto batch_planner::summarize(const transfer_batch& batch) -> plan_summary {
    plan_summary summary;
    summary.item_count = batch.items.size();
    summary.pending_count = batch.count(item_status::pending);
    summary.skipped_count = batch.count(item_status::skipped);
    summary.total_bytes = batch.total_bytes();
    return summary;
}

auto batch_planner::mark_duplicates(std::vector<transfer_item>& items) -> std::size_t {
    std::unordered_map<std::string, std::size_t> first_seen;
    std::size_t skipped = 0;

    for (std::size_t i = 0; i < items.size(); ++i) {
        auto [it, inserted] = first_seen.emplace(items[i].target, i);
        if (!inserted) {
            items[i].status = item_status::skipped;
            items[i].last_error = "duplicate of item " + std::to_string(it->second + 1);
            ++skipped;
        }
    }
    return skipped;
}

auto batch_planner::expand_user_path(std::string_view path) -> std::string {
    if (path.empty() || path.front() != '~' || (path.size() > 1 && path[1] != '/')) {
        return std::string(path);
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::string(path);
    }
    return std::string(home) + std::string(path.substr(1));
}

auto batch_planner::finalize(transfer_direction direction,
                             std::string destination,
                             std::vector<std::string> source_ids,
                             std::vector<transfer_item> items) -> result<transfer_batch> {
    if (items.empty()) {
        return unexpected(error(error_code::no_sources,
            "nothing to " + std::string(to_string(direction)) + " for " + destination));
    }

    auto duplicates = mark_duplicates(items);

    auto id = transfer_batch::compute_id(direction, destination, std::move(source_ids));
    if (!id) {
        return unexpected(id.error());
    }

    transfer_batch batch;
    batch.id = std::move(id.value());
    batch.direction = direction;
    batch.destination = std::move(destination);
    batch.items = std::move(items);
    batch.created_at = std::chrono::system_clock::now();
    batch.updated_at = batch.created_at;

    transfer_log_context ctx;
    ctx.batch_id = batch.id;
    ctx.size_bytes = batch.total_bytes();
    OB_LOG_INFO_CTX(log_category::planner,
        "Planned " + std::to_string(batch.items.size()) + " items (" +
        std::to_string(duplicates) + " duplicates skipped)", ctx);

    return batch;
}

}  // namespace kcenon::object_batch
