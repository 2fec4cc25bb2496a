/**
 * @file aws_cli_transport.cpp
 * @brief Implementation of aws_cli_transport and aws_cli_authenticator
 */

#include <kcenon/object_batch/transport/aws_cli_transport.h>
#include <kcenon/object_batch/transport/subprocess.h>
#include <kcenon/object_batch/core/logging.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>

namespace kcenon::object_batch {

namespace {

constexpr std::size_t max_stderr_tail = 4096;

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto to_lower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

auto contains(std::string_view haystack, std::string_view needle) -> bool {
    return haystack.find(needle) != std::string_view::npos;
}

auto parse_uint(std::string_view text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Pop the next whitespace-delimited token from @p text
 */
auto next_token(std::string_view& text) -> std::string_view {
    text = trim(text);
    auto end = text.find_first_of(" \t");
    auto token = text.substr(0, end);
    text.remove_prefix(end == std::string_view::npos ? text.size() : end);
    return token;
}

void append_profile_args(const aws_cli_config& config, std::vector<std::string>& argv) {
    if (!config.profile.empty()) {
        argv.emplace_back("--profile");
        argv.push_back(config.profile);
    }
    if (config.region) {
        argv.emplace_back("--region");
        argv.push_back(*config.region);
    }
}

}  // namespace

// ============================================================================
// aws_cli_transport
// ============================================================================

aws_cli_transport::aws_cli_transport(aws_cli_config config)
    : config_(std::move(config)) {}

auto aws_cli_transport::copy(
    const std::string& source,
    const std::string& target,
    const output_line_callback& on_output,
    const cancellation_token& cancel) -> result<void> {
    // Downloads land in directories that may not exist yet
    if (!s3_uri::is_s3_uri(target)) {
        auto parent = std::filesystem::path(target).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return unexpected(error(error_code::transport_failed,
                    "cannot create directory '" + parent.string() + "': " + ec.message()));
            }
        }
    }

    auto argv = copy_command(source, target);
    OB_LOG_DEBUG(log_category::transport, "Running: " + subprocess::describe(argv));

    auto child = subprocess::spawn(argv);
    if (!child) {
        return unexpected(child.error());
    }

    std::string stderr_tail;
    auto collect_stderr = [&stderr_tail](std::string_view line) {
        stderr_tail.append(line);
        stderr_tail += '\n';
        if (stderr_tail.size() > max_stderr_tail) {
            stderr_tail.erase(0, stderr_tail.size() - max_stderr_tail);
        }
    };

    auto outcome = child.value().pump(on_output, collect_stderr, &cancel,
                                      std::chrono::milliseconds{0});
    if (outcome != pump_outcome::finished) {
        child.value().terminate();
        return unexpected(error(error_code::transfer_cancelled,
            "copy of '" + source + "' cancelled"));
    }

    auto code = child.value().wait();
    if (!code) {
        return unexpected(code.error());
    }
    if (code.value() != 0) {
        auto message = "aws s3 cp exited with code " + std::to_string(code.value());
        auto detail = trim(stderr_tail);
        if (!detail.empty()) {
            message += ": " + std::string(detail);
        }
        return unexpected(error(classify_failure(stderr_tail), message));
    }
    return {};
}

auto aws_cli_transport::stat(const std::string& uri) -> result<std::optional<uint64_t>> {
    auto parsed = s3_uri::parse(uri);
    if (!parsed) {
        return unexpected(parsed.error());
    }

    auto argv = stat_command(parsed.value());
    OB_LOG_DEBUG(log_category::transport, "Running: " + subprocess::describe(argv));

    auto output = subprocess::run(argv, config_.command_timeout);
    if (!output) {
        return unexpected(output.error());
    }

    const auto& out = output.value();
    if (out.exit_code == 0) {
        auto size = parse_content_length(out.stdout_text);
        if (!size) {
            return unexpected(error(error_code::remote_stat_failed,
                "unexpected head-object output for " + uri + ": '" +
                std::string(trim(out.stdout_text)) + "'"));
        }
        return std::optional<uint64_t>(*size);
    }
    if (is_not_found(out.stderr_text)) {
        return std::optional<uint64_t>{};
    }
    return unexpected(error(error_code::remote_stat_failed,
        "head-object for " + uri + " exited with code " + std::to_string(out.exit_code) +
        ": " + std::string(trim(out.stderr_text))));
}

auto aws_cli_transport::list(const std::string& prefix_uri)
    -> result<std::vector<remote_object>> {
    auto parsed = s3_uri::parse(prefix_uri);
    if (!parsed) {
        return unexpected(parsed.error());
    }

    auto argv = list_command(parsed.value());
    OB_LOG_DEBUG(log_category::transport, "Running: " + subprocess::describe(argv));

    auto output = subprocess::run(argv, config_.command_timeout);
    if (!output) {
        return unexpected(output.error());
    }

    const auto& out = output.value();
    if (out.exit_code != 0) {
        // `aws s3 ls` exits 1 without a message when nothing matches
        if (out.exit_code == 1 && trim(out.stderr_text).empty()) {
            return std::vector<remote_object>{};
        }
        return unexpected(error(error_code::remote_list_failed,
            "listing " + prefix_uri + " exited with code " + std::to_string(out.exit_code) +
            ": " + std::string(trim(out.stderr_text))));
    }

    auto objects = parse_listing(out.stdout_text, parsed.value().bucket);
    OB_LOG_DEBUG(log_category::transport,
        "Listed " + std::to_string(objects.size()) + " objects under " + prefix_uri);
    return objects;
}

auto aws_cli_transport::copy_command(const std::string& source, const std::string& target) const
    -> std::vector<std::string> {
    std::vector<std::string> argv{config_.executable, "s3", "cp", source, target};
    append_profile_args(config_, argv);
    argv.insert(argv.end(), config_.extra_copy_args.begin(), config_.extra_copy_args.end());
    return argv;
}

auto aws_cli_transport::stat_command(const s3_uri& uri) const -> std::vector<std::string> {
    std::vector<std::string> argv{
        config_.executable, "s3api", "head-object",
        "--bucket", uri.bucket,
        "--key", uri.key,
        "--query", "ContentLength",
        "--output", "text"};
    append_profile_args(config_, argv);
    return argv;
}

auto aws_cli_transport::list_command(const s3_uri& prefix) const -> std::vector<std::string> {
    std::vector<std::string> argv{config_.executable, "s3", "ls", prefix.to_string(), "--recursive"};
    append_profile_args(config_, argv);
    return argv;
}

auto aws_cli_transport::parse_listing(std::string_view output, std::string_view bucket)
    -> std::vector<remote_object> {
    std::vector<remote_object> objects;

    while (!output.empty()) {
        auto eol = output.find('\n');
        auto line = output.substr(0, eol);
        output.remove_prefix(eol == std::string_view::npos ? output.size() : eol + 1);

        // "2024-01-15 10:30:45   12345678 path/to/file.tar.gz"
        auto rest = line;
        auto date = next_token(rest);
        auto time = next_token(rest);
        auto size = parse_uint(next_token(rest));
        auto key = trim(rest);

        if (date.empty() || time.empty() || !size || key.empty() || key.back() == '/') {
            continue;
        }

        remote_object object;
        object.key = std::string(key);
        object.uri = s3_uri{std::string(bucket), object.key}.to_string();
        object.size_bytes = *size;
        objects.push_back(std::move(object));
    }
    return objects;
}

auto aws_cli_transport::parse_content_length(std::string_view output)
    -> std::optional<uint64_t> {
    return parse_uint(trim(output));
}

auto aws_cli_transport::is_not_found(std::string_view stderr_text) -> bool {
    return contains(stderr_text, "Not Found") ||
           contains(stderr_text, "(404)") ||
           contains(stderr_text, "NoSuchKey");
}

auto aws_cli_transport::classify_failure(std::string_view stderr_text) -> error_code {
    auto lowered = to_lower(stderr_text);
    for (std::string_view marker : {"could not connect", "connection was closed",
                                    "connection reset", "endpointconnectionerror",
                                    "name resolution", "network is unreachable"}) {
        if (contains(lowered, marker)) {
            return error_code::network_error;
        }
    }
    if (contains(lowered, "timed out") || contains(lowered, "timeout")) {
        return error_code::transport_timeout;
    }
    return error_code::transport_failed;
}

// ============================================================================
// aws_cli_authenticator
// ============================================================================

aws_cli_authenticator::aws_cli_authenticator(aws_cli_config config)
    : config_(std::move(config)) {}

auto aws_cli_authenticator::is_authenticated() -> bool {
    auto output = subprocess::run(check_command(), config_.auth_check_timeout);
    if (!output) {
        OB_LOG_WARN(log_category::transport,
            "Session check failed: " + output.error().message);
        return false;
    }

    if (output.value().exit_code == 0) {
        return true;
    }
    if (contains(to_lower(output.value().stderr_text), "could not be found")) {
        OB_LOG_WARN(log_category::transport,
            "AWS profile '" + config_.profile + "' does not exist; configure it with: " +
            config_.executable + " configure sso --profile " + config_.profile);
    }
    return false;
}

auto aws_cli_authenticator::authenticate() -> result<void> {
    OB_LOG_INFO(log_category::transport,
        "Authenticating with AWS SSO (profile: " + config_.profile + ")");

    spawn_options options;
    options.capture_output = false;

    auto child = subprocess::spawn(login_command(), options);
    if (!child) {
        return unexpected(child.error());
    }

    auto code = child.value().wait();
    if (!code) {
        return unexpected(error(error_code::authentication_failed, code.error().message));
    }
    if (code.value() != 0) {
        return unexpected(error(error_code::authentication_failed,
            "aws sso login exited with code " + std::to_string(code.value())));
    }
    if (!is_authenticated()) {
        return unexpected(error(error_code::authentication_failed,
            "session for profile '" + config_.profile + "' is still not valid after login"));
    }
    return {};
}

auto aws_cli_authenticator::check_command() const -> std::vector<std::string> {
    std::vector<std::string> argv{config_.executable, "sts", "get-caller-identity"};
    append_profile_args(config_, argv);
    return argv;
}

auto aws_cli_authenticator::login_command() const -> std::vector<std::string> {
    std::vector<std::string> argv{config_.executable, "sso", "login"};
    append_profile_args(config_, argv);
    return argv;
}

}  // namespace kcenon::object_batch
