/**
 * @file subprocess.cpp
 * @brief Implementation of subprocess
 */

#include <kcenon/object_batch/transport/subprocess.h>
#include <kcenon/object_batch/core/logging.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

namespace kcenon::object_batch {

namespace {

constexpr int poll_interval_ms = 100;
constexpr auto reap_interval = std::chrono::milliseconds{20};

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/**
 * @brief Append a chunk and emit every complete line ('\n' or '\r' ended)
 */
void feed_lines(std::string& buffer, const char* data, std::size_t size,
                const subprocess::line_callback& on_line) {
    buffer.append(data, size);

    std::size_t start = 0;
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        if (buffer[i] == '\n' || buffer[i] == '\r') {
            if (i > start && on_line) {
                on_line(std::string_view(buffer).substr(start, i - start));
            }
            start = i + 1;
        }
    }
    buffer.erase(0, start);
}

void flush_lines(std::string& buffer, const subprocess::line_callback& on_line) {
    if (!buffer.empty() && on_line) {
        on_line(buffer);
    }
    buffer.clear();
}

}  // namespace

auto subprocess::spawn(const std::vector<std::string>& argv, const spawn_options& options)
    -> result<subprocess> {
    if (argv.empty()) {
        return unexpected(error(error_code::internal_error, "empty command line"));
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
    };

    if (options.capture_output &&
        (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0)) {
        auto reason = std::string(std::strerror(errno));
        close_all();
        return unexpected(error(error_code::internal_error, "pipe failed: " + reason));
    }
    // Reports an exec failure back to the parent; closes itself on success
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        auto reason = std::string(std::strerror(errno));
        close_all();
        return unexpected(error(error_code::internal_error, "pipe failed: " + reason));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto reason = std::string(std::strerror(errno));
        close_all();
        return unexpected(error(error_code::internal_error, "fork failed: " + reason));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        if (options.capture_output) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
        }
        ::execvp(args[0], args.data());

        int exec_errno = errno;
        [[maybe_unused]] auto written = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_all();

        auto code = (exec_errno == ENOENT || exec_errno == EACCES)
                        ? error_code::transport_unavailable
                        : error_code::internal_error;
        return unexpected(error(code,
            "cannot execute '" + argv.front() + "': " + std::strerror(exec_errno)));
    }

    OB_LOG_TRACE(log_category::transport,
        "Spawned pid " + std::to_string(pid) + ": " + describe(argv));

    subprocess child;
    child.pid_ = pid;
    child.stdout_fd_ = out_pipe[0];
    child.stderr_fd_ = err_pipe[0];
    child.kill_grace_ = options.kill_grace;
    return std::move(child);
}

subprocess::subprocess(subprocess&& other) noexcept
    : pid_(other.pid_),
      stdout_fd_(other.stdout_fd_),
      stderr_fd_(other.stderr_fd_),
      exit_code_(other.exit_code_),
      kill_grace_(other.kill_grace_),
      stdout_buffer_(std::move(other.stdout_buffer_)),
      stderr_buffer_(std::move(other.stderr_buffer_)) {
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
    other.exit_code_.reset();
}

auto subprocess::operator=(subprocess&& other) noexcept -> subprocess& {
    if (this != &other) {
        if (pid_ > 0 && !exit_code_) {
            terminate();
        }
        close_pipes();

        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        exit_code_ = other.exit_code_;
        kill_grace_ = other.kill_grace_;
        stdout_buffer_ = std::move(other.stdout_buffer_);
        stderr_buffer_ = std::move(other.stderr_buffer_);

        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
        other.exit_code_.reset();
    }
    return *this;
}

subprocess::~subprocess() {
    if (pid_ > 0 && !exit_code_) {
        terminate();
    }
    close_pipes();
}

auto subprocess::pump(const line_callback& on_stdout,
                      const line_callback& on_stderr,
                      const cancellation_token* cancel,
                      std::chrono::milliseconds timeout) -> pump_outcome {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout.count() > 0) {
        deadline = std::chrono::steady_clock::now() + timeout;
    }

    std::array<char, 4096> chunk{};

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            return pump_outcome::cancelled;
        }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            return pump_outcome::timed_out;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (stdout_fd_ >= 0) {
            fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        }
        if (stderr_fd_ >= 0) {
            fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        }

        int ready = ::poll(fds.data(), count, poll_interval_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            OB_LOG_WARN(log_category::transport,
                std::string("poll failed: ") + std::strerror(errno));
            close_pipes();
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            bool is_stdout = fds[i].fd == stdout_fd_;
            auto& buffer = is_stdout ? stdout_buffer_ : stderr_buffer_;
            const auto& on_line = is_stdout ? on_stdout : on_stderr;
            int& fd = is_stdout ? stdout_fd_ : stderr_fd_;

            ssize_t n = ::read(fd, chunk.data(), chunk.size());
            if (n > 0) {
                feed_lines(buffer, chunk.data(), static_cast<std::size_t>(n), on_line);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                flush_lines(buffer, on_line);
                close_fd(fd);
            }
        }
    }

    return pump_outcome::finished;
}

void subprocess::terminate() {
    if (pid_ <= 0 || exit_code_) {
        return;
    }

    OB_LOG_DEBUG(log_category::transport,
        "Terminating pid " + std::to_string(pid_));

    ::kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + kill_grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap(false)) {
            close_pipes();
            return;
        }
        std::this_thread::sleep_for(reap_interval);
    }

    OB_LOG_WARN(log_category::transport,
        "pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
    ::kill(pid_, SIGKILL);
    try_reap(true);
    close_pipes();
}

auto subprocess::wait() -> result<int> {
    if (pid_ <= 0) {
        return unexpected(error(error_code::internal_error, "no child process"));
    }
    if (!exit_code_) {
        try_reap(true);
    }
    if (!exit_code_ || *exit_code_ < 0) {
        return unexpected(error(error_code::internal_error,
            "exit status of pid " + std::to_string(pid_) + " unavailable"));
    }
    return *exit_code_;
}

auto subprocess::run(const std::vector<std::string>& argv,
                     std::chrono::milliseconds timeout,
                     const cancellation_token* cancel) -> result<command_output> {
    auto child = spawn(argv);
    if (!child) {
        return unexpected(child.error());
    }

    command_output output;
    auto collect_into = [](std::string& sink) {
        return [&sink](std::string_view line) {
            sink.append(line);
            sink += '\n';
        };
    };

    auto outcome = child.value().pump(
        collect_into(output.stdout_text), collect_into(output.stderr_text), cancel, timeout);

    if (outcome == pump_outcome::cancelled) {
        child.value().terminate();
        return unexpected(error(error_code::transfer_cancelled,
            "cancelled: " + describe(argv)));
    }
    if (outcome == pump_outcome::timed_out) {
        child.value().terminate();
        return unexpected(error(error_code::transport_timeout,
            "timed out after " + std::to_string(timeout.count()) + " ms: " + describe(argv)));
    }

    auto code = child.value().wait();
    if (!code) {
        return unexpected(code.error());
    }
    output.exit_code = code.value();
    return output;
}

auto subprocess::describe(const std::vector<std::string>& argv) -> std::string {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

void subprocess::close_pipes() noexcept {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

auto subprocess::try_reap(bool block) -> bool {
    int status = 0;
    pid_t reaped = 0;
    do {
        reaped = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (reaped < 0 && errno == EINTR);

    if (reaped == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
        return true;
    }
    if (reaped < 0) {
        // ECHILD: nothing left to wait for
        exit_code_ = -1;
        return true;
    }
    return false;
}

}  // namespace kcenon::object_batch
