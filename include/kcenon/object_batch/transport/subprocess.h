/**
 * @file subprocess.h
 * @brief POSIX child process with line-oriented output capture
 */

#ifndef KCENON_OBJECT_BATCH_TRANSPORT_SUBPROCESS_H
#define KCENON_OBJECT_BATCH_TRANSPORT_SUBPROCESS_H

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/object_batch/core/types.h"
#include "transport_interface.h"

namespace kcenon::object_batch {

/**
 * @brief Options for spawning a child process
 */
struct spawn_options {
    /// Pipe stdout/stderr back to the parent. When false the child writes
    /// straight to the parent's terminal (interactive commands).
    bool capture_output = true;

    /// Delay between SIGTERM and SIGKILL in terminate()
    std::chrono::milliseconds kill_grace{2000};
};

/**
 * @brief Why a call to subprocess::pump() returned
 */
enum class pump_outcome {
    finished,   ///< Both output streams reached end of file
    cancelled,  ///< The cancellation token was set
    timed_out,  ///< The deadline passed
};

/**
 * @brief Collected output of a command run to completion
 */
struct command_output {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * @brief A running child process
 *
 * Output lines are split on both '\n' and '\r', so carriage-return driven
 * progress updates arrive as separate lines. Empty lines are dropped.
 *
 * The destructor terminates and reaps a child that is still running.
 *
 * @code
 * auto child = subprocess::spawn({"aws", "s3", "cp", src, dst});
 * if (child) {
 *     child->pump(on_line, on_error_line, &cancel, std::chrono::milliseconds{0});
 *     auto code = child->wait();
 * }
 * @endcode
 */
class subprocess {
public:
    using line_callback = std::function<void(std::string_view line)>;

    /**
     * @brief Fork and exec @p argv (argv[0] is looked up in PATH)
     * @return The running child, transport_unavailable when the executable
     *         cannot be started, or internal_error when fork/pipe fail
     */
    [[nodiscard]] static auto spawn(
        const std::vector<std::string>& argv,
        const spawn_options& options = {}) -> result<subprocess>;

    subprocess(subprocess&& other) noexcept;
    auto operator=(subprocess&& other) noexcept -> subprocess&;
    ~subprocess();

    subprocess(const subprocess&) = delete;
    auto operator=(const subprocess&) -> subprocess& = delete;

    [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

    /**
     * @brief Read output until both streams close, cancellation or timeout
     * @param on_stdout Receives each stdout line (may be empty)
     * @param on_stderr Receives each stderr line (may be empty)
     * @param cancel Optional token polled between reads
     * @param timeout Zero for no deadline
     */
    auto pump(const line_callback& on_stdout,
              const line_callback& on_stderr,
              const cancellation_token* cancel,
              std::chrono::milliseconds timeout) -> pump_outcome;

    /**
     * @brief SIGTERM, then SIGKILL after the grace period, then reap
     */
    void terminate();

    /**
     * @brief Block until the child exits
     * @return Exit status, or 128 + signal number for a signalled child
     */
    [[nodiscard]] auto wait() -> result<int>;

    /**
     * @brief Spawn, collect all output and wait
     * @return The collected output, transfer_cancelled, transport_timeout
     *         or a spawn error
     */
    [[nodiscard]] static auto run(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout,
        const cancellation_token* cancel = nullptr) -> result<command_output>;

    /**
     * @brief Render argv as a shell-like string for log messages
     */
    [[nodiscard]] static auto describe(const std::vector<std::string>& argv) -> std::string;

private:
    subprocess() = default;

    void close_pipes() noexcept;
    auto try_reap(bool block) -> bool;

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_code_;
    std::chrono::milliseconds kill_grace_{2000};
    std::string stdout_buffer_;
    std::string stderr_buffer_;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_TRANSPORT_SUBPROCESS_H
