/**
 * @file transport_interface.h
 * @brief Object storage transport and authenticator abstractions
 *
 * This file defines the seams between the batch engine and the external
 * object storage command. The engine only sees single-item copies, size
 * queries and prefix listings; how bytes move is up to the implementation.
 */

#ifndef KCENON_OBJECT_BATCH_TRANSPORT_TRANSPORT_INTERFACE_H
#define KCENON_OBJECT_BATCH_TRANSPORT_TRANSPORT_INTERFACE_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/object_batch/core/types.h"

namespace kcenon::object_batch {

/**
 * @brief Cooperative cancellation flag
 *
 * Set from a signal handler or another thread; polled by the executor
 * between progress lines, before each item and during backoff.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    void cancel() noexcept { cancelled_.store(true); }

    void reset() noexcept { cancelled_.store(false); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief One entry of a remote prefix listing
 */
struct remote_object {
    std::string uri;         ///< Full object URI (s3://bucket/key)
    std::string key;         ///< Object key within the bucket
    uint64_t size_bytes = 0;
};

/**
 * @brief Callback receiving each line the transport prints during a copy
 */
using output_line_callback = std::function<void(std::string_view line)>;

/**
 * @brief Single-item object storage transport
 *
 * @code
 * cancellation_token cancel;
 * auto copied = transport.copy("/tmp/a.log", "s3://bucket/logs/a.log",
 *     [](std::string_view line) { std::cout << line << "\n"; }, cancel);
 * @endcode
 */
class object_transport {
public:
    virtual ~object_transport() = default;

    object_transport(const object_transport&) = delete;
    auto operator=(const object_transport&) -> object_transport& = delete;

    /**
     * @brief Transport identifier used in logs (e.g. "aws-cli")
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Copy one object
     * @param source Local path or object URI
     * @param target Object URI or local path
     * @param on_output Receives every output line while the copy runs
     * @param cancel Checked between output lines
     * @return Success, a transport error, or transfer_cancelled
     */
    [[nodiscard]] virtual auto copy(
        const std::string& source,
        const std::string& target,
        const output_line_callback& on_output,
        const cancellation_token& cancel) -> result<void> = 0;

    /**
     * @brief Query the size of a remote object
     * @return Size in bytes, an empty optional if the object does not exist,
     *         or remote_stat_failed when the query itself failed
     */
    [[nodiscard]] virtual auto stat(const std::string& uri)
        -> result<std::optional<uint64_t>> = 0;

    /**
     * @brief List every object below a prefix, recursively
     */
    [[nodiscard]] virtual auto list(const std::string& prefix_uri)
        -> result<std::vector<remote_object>> = 0;

protected:
    object_transport() = default;
};

/**
 * @brief Authentication precondition of a transport
 *
 * Consulted once per batch before the first copy.
 */
class authenticator {
public:
    virtual ~authenticator() = default;

    authenticator(const authenticator&) = delete;
    auto operator=(const authenticator&) -> authenticator& = delete;

    [[nodiscard]] virtual auto is_authenticated() -> bool = 0;

    /**
     * @brief Establish a session (may block on user interaction)
     * @return Success or authentication_failed
     */
    [[nodiscard]] virtual auto authenticate() -> result<void> = 0;

protected:
    authenticator() = default;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_TRANSPORT_TRANSPORT_INTERFACE_H
