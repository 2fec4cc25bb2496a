/**
 * @file aws_cli_transport.h
 * @brief Object transport and authenticator backed by the AWS CLI
 *
 * Every operation runs one `aws` command as a child process. Copies stream
 * their progress output back to the caller line by line.
 */

#ifndef KCENON_OBJECT_BATCH_TRANSPORT_AWS_CLI_TRANSPORT_H
#define KCENON_OBJECT_BATCH_TRANSPORT_AWS_CLI_TRANSPORT_H

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "s3_uri.h"
#include "transport_interface.h"

namespace kcenon::object_batch {

/**
 * @brief AWS CLI invocation settings
 */
struct aws_cli_config {
    static constexpr std::string_view default_profile = "gt-logs";

    std::string executable = "aws";
    std::string profile = std::string(default_profile);
    std::optional<std::string> region;

    /// Appended to every `aws s3 cp` invocation
    std::vector<std::string> extra_copy_args;

    /// Deadline for stat and list commands (zero: none)
    std::chrono::milliseconds command_timeout{30000};

    /// Deadline for the session check
    std::chrono::milliseconds auth_check_timeout{10000};
};

/**
 * @brief object_transport running `aws s3 cp`, `aws s3api head-object` and
 *        `aws s3 ls`
 */
class aws_cli_transport : public object_transport {
public:
    explicit aws_cli_transport(aws_cli_config config = {});

    [[nodiscard]] auto name() const -> std::string_view override { return "aws-cli"; }

    [[nodiscard]] auto copy(
        const std::string& source,
        const std::string& target,
        const output_line_callback& on_output,
        const cancellation_token& cancel) -> result<void> override;

    [[nodiscard]] auto stat(const std::string& uri)
        -> result<std::optional<uint64_t>> override;

    [[nodiscard]] auto list(const std::string& prefix_uri)
        -> result<std::vector<remote_object>> override;

    [[nodiscard]] auto config() const -> const aws_cli_config& { return config_; }

    // Command lines, exposed for logging and tests

    [[nodiscard]] auto copy_command(const std::string& source, const std::string& target) const
        -> std::vector<std::string>;

    [[nodiscard]] auto stat_command(const s3_uri& uri) const -> std::vector<std::string>;

    [[nodiscard]] auto list_command(const s3_uri& prefix) const -> std::vector<std::string>;

    // Output parsing

    /**
     * @brief Parse `aws s3 ls --recursive` output
     *
     * Lines have the shape "DATE TIME SIZE KEY"; the key may contain spaces.
     * Folder placeholder keys (ending in '/') and unparseable lines are
     * skipped.
     */
    [[nodiscard]] static auto parse_listing(std::string_view output, std::string_view bucket)
        -> std::vector<remote_object>;

    /**
     * @brief Parse the ContentLength printed by head-object
     */
    [[nodiscard]] static auto parse_content_length(std::string_view output)
        -> std::optional<uint64_t>;

    /**
     * @brief Whether head-object stderr reports a missing object
     */
    [[nodiscard]] static auto is_not_found(std::string_view stderr_text) -> bool;

    /**
     * @brief Map a failed command's stderr to an error code
     *
     * Connection problems become network_error, timeouts transport_timeout,
     * anything else transport_failed.
     */
    [[nodiscard]] static auto classify_failure(std::string_view stderr_text) -> error_code;

private:
    aws_cli_config config_;
};

/**
 * @brief authenticator using `aws sts get-caller-identity` and
 *        `aws sso login`
 */
class aws_cli_authenticator : public authenticator {
public:
    explicit aws_cli_authenticator(aws_cli_config config = {});

    [[nodiscard]] auto is_authenticated() -> bool override;

    /**
     * @brief Run the interactive SSO login, then re-check the session
     */
    [[nodiscard]] auto authenticate() -> result<void> override;

    [[nodiscard]] auto check_command() const -> std::vector<std::string>;

    [[nodiscard]] auto login_command() const -> std::vector<std::string>;

private:
    aws_cli_config config_;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_TRANSPORT_AWS_CLI_TRANSPORT_H
