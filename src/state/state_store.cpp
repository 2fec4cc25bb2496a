/**
 * @file state_store.cpp
 * @brief Implementation of state_store for batch state persistence
 */

#include <kcenon/object_batch/state/state_store.h>
#include <kcenon/object_batch/core/logging.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace kcenon::object_batch {

namespace fs = std::filesystem;

// ============================================================================
// state_store_config implementation
// ============================================================================

state_store_config::state_store_config()
    : state_directory(default_directory()) {
}

state_store_config::state_store_config(fs::path dir)
    : state_directory(std::move(dir)) {
}

auto state_store_config::default_directory() -> fs::path {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg != nullptr && *xdg != '\0') {
        return fs::path(xdg) / "object_batch";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return fs::path(home) / ".local" / "state" / "object_batch";
    }
    return fs::temp_directory_path() / "object_batch_state";
}

// ============================================================================
// JSON serialization helpers (simple implementation without external library)
// ============================================================================

namespace {

constexpr std::string_view state_file_extension = ".json";
constexpr std::string_view temp_file_suffix = ".tmp";

/**
 * @brief Index of the closing quote of a string starting after @p start
 */
auto find_string_end(std::string_view json, std::size_t start) -> std::size_t {
    for (auto i = start; i < json.size(); ++i) {
        if (json[i] == '\\') {
            ++i;
        } else if (json[i] == '"') {
            return i;
        }
    }
    return std::string_view::npos;
}

void append_utf8(std::string& out, uint32_t code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

auto unescape_json_string(std::string_view s) -> std::optional<std::string> {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            result += s[i];
            continue;
        }
        if (i + 1 >= s.size()) {
            return std::nullopt;
        }
        switch (s[++i]) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                if (i + 4 >= s.size()) {
                    return std::nullopt;
                }
                uint32_t code = 0;
                auto hex = s.substr(i + 1, 4);
                auto [end, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code, 16);
                if (ec != std::errc{} || end != hex.data() + hex.size()) {
                    return std::nullopt;
                }
                append_utf8(result, code);
                i += 4;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return result;
}

auto time_point_to_int64(time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto int64_to_time_point(int64_t ms) -> time_point {
    return time_point(std::chrono::milliseconds(ms));
}

struct json_token {
    bool is_string = false;
    std::string text;
};

/**
 * @brief Position of the ':' after the first occurrence of "key" as a key
 *
 * Strings are skipped whole, so a string value equal to @p key is not
 * mistaken for it.
 */
auto find_key_colon(std::string_view json, std::string_view key) -> std::size_t {
    std::size_t pos = 0;
    while ((pos = json.find('"', pos)) != std::string_view::npos) {
        auto string_end = find_string_end(json, pos + 1);
        if (string_end == std::string_view::npos) {
            return std::string_view::npos;
        }

        auto next = json.find_first_not_of(" \t\r\n", string_end + 1);
        if (next != std::string_view::npos && json[next] == ':' &&
            json.substr(pos + 1, string_end - pos - 1) == key) {
            return next;
        }
        pos = string_end + 1;
    }
    return std::string_view::npos;
}

/**
 * @brief Extract the value of "key" from a flat JSON object
 *
 * String values are returned unescaped; other values as raw text.
 */
auto extract_json_value(std::string_view json, std::string_view key)
    -> std::optional<json_token> {
    auto colon_pos = find_key_colon(json, key);
    if (colon_pos == std::string_view::npos) {
        return std::nullopt;
    }

    auto value_start = json.find_first_not_of(" \t\r\n", colon_pos + 1);
    if (value_start == std::string_view::npos) {
        return std::nullopt;
    }

    json_token token;
    if (json[value_start] == '"') {
        auto string_end = find_string_end(json, value_start + 1);
        if (string_end == std::string_view::npos) {
            return std::nullopt;
        }
        auto text = unescape_json_string(json.substr(value_start + 1, string_end - value_start - 1));
        if (!text) {
            return std::nullopt;
        }
        token.is_string = true;
        token.text = std::move(*text);
        return token;
    }

    auto value_end = json.find_first_of(",}\n", value_start);
    auto raw = json.substr(value_start, value_end == std::string_view::npos
                                            ? std::string_view::npos
                                            : value_end - value_start);
    while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\t' || raw.back() == '\r')) {
        raw.remove_suffix(1);
    }
    token.text = std::string(raw);
    return token;
}

auto get_string(std::string_view json, std::string_view key) -> std::optional<std::string> {
    auto token = extract_json_value(json, key);
    if (!token || !token->is_string) {
        return std::nullopt;
    }
    return std::move(token->text);
}

template <typename T>
auto get_number(std::string_view json, std::string_view key) -> std::optional<T> {
    auto token = extract_json_value(json, key);
    if (!token || token->is_string) {
        return std::nullopt;
    }
    T value{};
    const auto& text = token->text;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Locate the "items" array: [open bracket, close bracket]
 */
auto find_items_array(std::string_view json)
    -> std::optional<std::pair<std::size_t, std::size_t>> {
    auto colon_pos = find_key_colon(json, "items");
    if (colon_pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto open = json.find_first_not_of(" \t\r\n", colon_pos + 1);
    if (open == std::string_view::npos || json[open] != '[') {
        return std::nullopt;
    }

    for (auto i = open + 1; i < json.size(); ++i) {
        if (json[i] == '"') {
            i = find_string_end(json, i + 1);
            if (i == std::string_view::npos) {
                return std::nullopt;
            }
        } else if (json[i] == ']') {
            return std::make_pair(open, i);
        }
    }
    return std::nullopt;
}

/**
 * @brief Split the body of an array of flat objects into object texts
 */
auto split_objects(std::string_view body) -> std::optional<std::vector<std::string_view>> {
    std::vector<std::string_view> objects;
    std::size_t start = std::string_view::npos;

    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '"') {
            if (start == std::string_view::npos) {
                return std::nullopt;
            }
            i = find_string_end(body, i + 1);
            if (i == std::string_view::npos) {
                return std::nullopt;
            }
        } else if (c == '{') {
            if (start != std::string_view::npos) {
                return std::nullopt;
            }
            start = i;
        } else if (c == '}') {
            if (start == std::string_view::npos) {
                return std::nullopt;
            }
            objects.push_back(body.substr(start, i - start + 1));
            start = std::string_view::npos;
        } else if (start == std::string_view::npos && c != ',' && c != ' ' &&
                   c != '\n' && c != '\r' && c != '\t') {
            return std::nullopt;
        }
    }
    if (start != std::string_view::npos) {
        return std::nullopt;
    }
    return objects;
}

auto corrupted(const std::string& what) -> unexpected {
    return unexpected(error(error_code::state_corrupted, what));
}

auto deserialize_item(std::string_view json) -> result<transfer_item> {
    transfer_item item;

    auto source = get_string(json, "source");
    auto target = get_string(json, "target");
    auto size = get_number<uint64_t>(json, "size_bytes");
    auto status_name = get_string(json, "status");
    auto attempts = get_number<uint32_t>(json, "attempts");
    auto transferred = get_number<uint64_t>(json, "bytes_transferred");
    if (!source || !target || !size || !status_name || !attempts || !transferred) {
        return corrupted("item is missing a required field");
    }

    auto status = parse_status(*status_name);
    if (!status) {
        return corrupted("unknown item status '" + *status_name + "'");
    }

    item.source = std::move(*source);
    item.target = std::move(*target);
    item.size_bytes = *size;
    item.status = *status;
    item.attempts = *attempts;
    item.bytes_transferred = *transferred;
    item.last_error = get_string(json, "last_error");
    return item;
}

auto serialize_item(const transfer_item& item) -> std::string {
    std::ostringstream oss;
    oss << "{\"source\": \"" << detail::escape_json_string(item.source) << "\""
        << ", \"target\": \"" << detail::escape_json_string(item.target) << "\""
        << ", \"size_bytes\": " << item.size_bytes
        << ", \"status\": \"" << to_string(item.status) << "\""
        << ", \"attempts\": " << item.attempts
        << ", \"bytes_transferred\": " << item.bytes_transferred
        << ", \"last_error\": ";
    if (item.last_error) {
        oss << "\"" << detail::escape_json_string(*item.last_error) << "\"";
    } else {
        oss << "null";
    }
    oss << "}";
    return oss.str();
}

auto is_state_file(const fs::path& path) -> bool {
    return path.extension() == state_file_extension;
}

}  // namespace

// ============================================================================
// state_store::impl
// ============================================================================

class state_store::impl {
public:
    explicit impl(const state_store_config& cfg)
        : config_(cfg) {
    }

    auto load(const std::string& batch_id) -> result<std::optional<transfer_batch>> {
        auto path = file_path(batch_id);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            OB_LOG_DEBUG(log_category::state, "No state file: " + path.string());
            return std::optional<transfer_batch>{};
        }

        std::ifstream file(path);
        if (!file) {
            OB_LOG_ERROR(log_category::state,
                "Failed to open state file: " + path.string());
            return unexpected(error(error_code::state_corrupted,
                "cannot open state file " + path.string()));
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        auto batch = deserialize(oss.str());
        if (!batch) {
            OB_LOG_ERROR(log_category::state,
                "Failed to parse state file " + path.string() + ": " + batch.error().message);
            return unexpected(batch.error());
        }
        if (batch.value().id != batch_id) {
            return unexpected(error(error_code::state_corrupted,
                "state file " + path.string() + " belongs to batch " + batch.value().id));
        }

        OB_LOG_DEBUG(log_category::state,
            "State recovered: " + batch_id + " (" +
            std::to_string(batch.value().count(item_status::completed)) + "/" +
            std::to_string(batch.value().items.size()) + " items completed)");

        return std::optional<transfer_batch>(std::move(batch.value()));
    }

    auto save(const transfer_batch& batch) -> result<void> {
        if (auto dir = ensure_directory(); !dir) {
            return dir;
        }

        auto path = file_path(batch.id);
        auto temp_path = path;
        temp_path += temp_file_suffix;

        {
            std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
            if (!file) {
                OB_LOG_ERROR(log_category::state,
                    "Failed to open state file for writing: " + temp_path.string());
                return unexpected(error(error_code::state_write_failed,
                    "cannot open " + temp_path.string() + " for writing"));
            }

            std::error_code ec;
            fs::permissions(temp_path, fs::perms::owner_read | fs::perms::owner_write,
                            fs::perm_options::replace, ec);
            if (ec) {
                OB_LOG_WARN(log_category::state,
                    "Cannot restrict permissions of " + temp_path.string() + ": " + ec.message());
            }

            file << serialize(batch);
            file.flush();
            if (!file) {
                OB_LOG_ERROR(log_category::state,
                    "Failed to write state file: " + temp_path.string());
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                return unexpected(error(error_code::state_write_failed,
                    "failed to write " + temp_path.string()));
            }
        }

        std::error_code ec;
        fs::rename(temp_path, path, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return unexpected(error(error_code::state_write_failed,
                "cannot replace " + path.string() + ": " + ec.message()));
        }

        OB_LOG_TRACE(log_category::state, "State persisted to: " + path.string());
        return {};
    }

    auto clear(const std::string& batch_id) -> result<void> {
        OB_LOG_DEBUG(log_category::state, "Deleting batch state: " + batch_id);

        auto path = file_path(batch_id);
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            OB_LOG_ERROR(log_category::state,
                "Failed to delete state file: " + path.string() + " (" + ec.message() + ")");
            return unexpected(error(error_code::state_write_failed,
                "failed to delete state file: " + ec.message()));
        }

        auto temp_path = path;
        temp_path += temp_file_suffix;
        fs::remove(temp_path, ec);
        return {};
    }

    auto exists(const std::string& batch_id) const -> bool {
        std::error_code ec;
        return fs::exists(file_path(batch_id), ec);
    }

    auto list_batches() const -> std::vector<std::string> {
        std::vector<std::string> ids;

        std::error_code ec;
        if (!fs::is_directory(config_.state_directory, ec)) {
            return ids;
        }

        for (const auto& entry : fs::directory_iterator(config_.state_directory, ec)) {
            if (is_state_file(entry.path())) {
                ids.push_back(entry.path().stem().string());
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    auto cleanup_expired(std::chrono::seconds ttl) -> std::size_t {
        OB_LOG_DEBUG(log_category::state, "Starting expired state cleanup");

        auto now = std::chrono::system_clock::now();
        std::size_t removed = 0;

        for (const auto& id : list_batches()) {
            auto batch = load(id);
            if (!batch || !batch.value()) {
                continue;
            }
            if (now - batch.value()->updated_at > ttl) {
                OB_LOG_DEBUG(log_category::state, "State expired: " + id);
                if (clear(id)) {
                    ++removed;
                }
            }
        }

        OB_LOG_INFO(log_category::state,
            "Cleanup completed: " + std::to_string(removed) + " expired states removed");
        return removed;
    }

    auto file_path(const std::string& batch_id) const -> fs::path {
        return config_.state_directory / (batch_id + std::string(state_file_extension));
    }

    auto config() const -> const state_store_config& {
        return config_;
    }

private:
    auto ensure_directory() -> result<void> {
        std::error_code ec;
        if (fs::is_directory(config_.state_directory, ec)) {
            return {};
        }

        fs::create_directories(config_.state_directory, ec);
        if (ec) {
            return unexpected(error(error_code::state_write_failed,
                "cannot create " + config_.state_directory.string() + ": " + ec.message()));
        }
        fs::permissions(config_.state_directory, fs::perms::owner_all,
                        fs::perm_options::replace, ec);
        if (ec) {
            OB_LOG_WARN(log_category::state,
                "Cannot restrict permissions of " + config_.state_directory.string());
        }
        return {};
    }

    state_store_config config_;
};

// ============================================================================
// state_store public interface
// ============================================================================

state_store::state_store(const state_store_config& config)
    : impl_(std::make_unique<impl>(config)) {
}

state_store::~state_store() = default;

state_store::state_store(state_store&&) noexcept = default;

auto state_store::operator=(state_store&&) noexcept -> state_store& = default;

auto state_store::load(const std::string& batch_id) -> result<std::optional<transfer_batch>> {
    return impl_->load(batch_id);
}

auto state_store::save(const transfer_batch& batch) -> result<void> {
    return impl_->save(batch);
}

auto state_store::clear(const std::string& batch_id) -> result<void> {
    return impl_->clear(batch_id);
}

auto state_store::exists(const std::string& batch_id) const -> bool {
    return impl_->exists(batch_id);
}

auto state_store::list_batches() const -> std::vector<std::string> {
    return impl_->list_batches();
}

auto state_store::cleanup_expired(std::chrono::seconds ttl) -> std::size_t {
    return impl_->cleanup_expired(ttl);
}

auto state_store::state_file_path(const std::string& batch_id) const -> fs::path {
    return impl_->file_path(batch_id);
}

auto state_store::config() const -> const state_store_config& {
    return impl_->config();
}

auto state_store::reconcile(transfer_batch& planned, const transfer_batch& persisted)
    -> std::size_t {
    std::unordered_map<std::string, const transfer_item*> by_target;
    for (const auto& item : persisted.items) {
        if (item.status != item_status::skipped) {
            by_target.emplace(item.target, &item);
        }
    }

    std::size_t carried = 0;
    for (auto& item : planned.items) {
        if (item.status == item_status::skipped) {
            continue;
        }

        auto it = by_target.find(item.target);
        if (it != by_target.end() && it->second->status == item_status::completed) {
            item.status = item_status::completed;
            item.carried_over = true;
            item.size_bytes = it->second->size_bytes;
            item.attempts = it->second->attempts;
            item.bytes_transferred = it->second->bytes_transferred;
            item.last_error.reset();
            ++carried;
            continue;
        }

        item.status = item_status::pending;
        item.attempts = 0;
        item.bytes_transferred = 0;
        item.last_error.reset();
    }

    planned.created_at = persisted.created_at;

    OB_LOG_INFO(log_category::state,
        "Resuming batch " + planned.id + ": " + std::to_string(carried) + " of " +
        std::to_string(planned.items.size()) + " items already completed");
    return carried;
}

auto state_store::serialize(const transfer_batch& batch) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"version\": " << format_version << ",\n";
    oss << "  \"id\": \"" << detail::escape_json_string(batch.id) << "\",\n";
    oss << "  \"direction\": \"" << to_string(batch.direction) << "\",\n";
    oss << "  \"destination\": \"" << detail::escape_json_string(batch.destination) << "\",\n";
    oss << "  \"created_at\": " << time_point_to_int64(batch.created_at) << ",\n";
    oss << "  \"updated_at\": " << time_point_to_int64(batch.updated_at) << ",\n";
    oss << "  \"items\": [";
    for (std::size_t i = 0; i < batch.items.size(); ++i) {
        oss << (i == 0 ? "\n    " : ",\n    ") << serialize_item(batch.items[i]);
    }
    oss << "\n  ]\n";
    oss << "}\n";
    return oss.str();
}

auto state_store::deserialize(std::string_view json) -> result<transfer_batch> {
    auto first = json.find_first_not_of(" \t\r\n");
    auto last = json.find_last_not_of(" \t\r\n");
    if (first == std::string_view::npos || json[first] != '{' || json[last] != '}') {
        return corrupted("not a JSON object");
    }

    auto items_range = find_items_array(json);
    if (!items_range) {
        return corrupted("missing items array");
    }
    auto [open, close] = *items_range;

    // Header fields are looked up with the items array cut out
    std::string header(json.substr(0, open));
    header += json.substr(close + 1);

    auto version = get_number<int>(header, "version");
    if (!version || *version != format_version) {
        return corrupted("unsupported state format version");
    }

    auto id = get_string(header, "id");
    auto direction_name = get_string(header, "direction");
    auto destination = get_string(header, "destination");
    auto created = get_number<int64_t>(header, "created_at");
    auto updated = get_number<int64_t>(header, "updated_at");
    if (!id || id->empty() || !direction_name || !destination || !created || !updated) {
        return corrupted("batch header is missing a required field");
    }

    auto direction = parse_direction(*direction_name);
    if (!direction) {
        return corrupted("unknown direction '" + *direction_name + "'");
    }

    auto objects = split_objects(json.substr(open + 1, close - open - 1));
    if (!objects) {
        return corrupted("malformed items array");
    }

    transfer_batch batch;
    batch.id = std::move(*id);
    batch.direction = *direction;
    batch.destination = std::move(*destination);
    batch.created_at = int64_to_time_point(*created);
    batch.updated_at = int64_to_time_point(*updated);
    batch.items.reserve(objects->size());

    for (auto object : *objects) {
        auto item = deserialize_item(object);
        if (!item) {
            return unexpected(item.error());
        }
        batch.items.push_back(std::move(item.value()));
    }
    return batch;
}

}  // namespace kcenon::object_batch
