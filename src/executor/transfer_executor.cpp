/**
 * @file transfer_executor.cpp
 * @brief Implementation of transfer_executor
 */

#include <kcenon/object_batch/executor/transfer_executor.h>
#include <kcenon/object_batch/executor/verifier.h>
#include <kcenon/object_batch/progress/progress_parser.h>
#include <kcenon/object_batch/progress/progress_reporter.h>
#include <kcenon/object_batch/state/state_store.h>
#include <kcenon/object_batch/transport/transport_interface.h>
#include <kcenon/object_batch/core/logging.h>

#include <algorithm>
#include <thread>

namespace kcenon::object_batch {

namespace {

constexpr auto sleep_slice = std::chrono::milliseconds{100};

auto make_context(const transfer_batch& batch, std::size_t index) -> transfer_log_context {
    const auto& item = batch.items[index];
    transfer_log_context ctx;
    ctx.batch_id = batch.id;
    ctx.item_index = index;
    ctx.source = item.source;
    ctx.target = item.target;
    ctx.attempt = item.attempts;
    ctx.size_bytes = item.size_bytes;
    return ctx;
}

}  // namespace

transfer_executor::transfer_executor(object_transport& transport,
                                     authenticator* auth,
                                     state_store* store,
                                     const progress_parser& parser,
                                     progress_reporter& reporter,
                                     engine_config config)
    : transport_(transport),
      auth_(auth),
      store_(store),
      parser_(parser),
      reporter_(reporter),
      config_(std::move(config)),
      sleep_(&transfer_executor::interruptible_sleep) {}

void transfer_executor::set_sleep_function(sleep_function sleeper) {
    sleep_ = sleeper ? std::move(sleeper) : sleep_function(&transfer_executor::interruptible_sleep);
}

auto transfer_executor::execute(transfer_batch& batch, const cancellation_token& cancel)
    -> result<execution_report> {
    execution_report report;

    OB_LOG_INFO(log_category::executor,
        "Executing batch " + batch.id + " (" + std::to_string(batch.items.size()) + " items, " +
        std::string(to_string(batch.direction)) + ")");

    for (std::size_t i = 0; i < batch.items.size(); ++i) {
        auto& item = batch.items[i];

        // Left over from a run that died mid-item
        if (item.status == item_status::in_progress || item.status == item_status::verifying) {
            item.status = item_status::pending;
        }
        if (!is_runnable_status(item.status)) {
            continue;
        }

        if (cancel.is_cancelled()) {
            report.interrupted = true;
            break;
        }

        if (auto authenticated = ensure_authenticated(); !authenticated) {
            return unexpected(authenticated.error());
        }

        ++report.items_run;
        reporter_.begin_item(i, batch.items.size(), item);
        if (run_item(batch, i, cancel, report) == item_outcome::cancelled) {
            report.interrupted = true;
            break;
        }
    }

    if (report.interrupted) {
        OB_LOG_WARN(log_category::executor,
            "Batch " + batch.id + " interrupted; it can be resumed");
    }
    return report;
}

void transfer_executor::interruptible_sleep(std::chrono::milliseconds delay,
                                            const cancellation_token& cancel) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (!cancel.is_cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, sleep_slice));
    }
}

auto transfer_executor::establish_session(authenticator* auth) -> result<void> {
    if (auth == nullptr || auth->is_authenticated()) {
        return {};
    }

    OB_LOG_INFO(log_category::executor, "Transport session not authenticated, logging in");
    auto login = auth->authenticate();
    if (!login) {
        auto code = is_authentication_error(login.error().code)
                        ? login.error().code
                        : error_code::authentication_failed;
        OB_LOG_ERROR(log_category::executor,
            "Authentication failed: " + login.error().message);
        return unexpected(error(code, login.error().message));
    }
    return {};
}

auto transfer_executor::ensure_authenticated() -> result<void> {
    if (authenticated_) {
        return {};
    }
    if (auto session = establish_session(auth_); !session) {
        return session;
    }
    authenticated_ = true;
    return {};
}

auto transfer_executor::run_item(transfer_batch& batch, std::size_t index,
                                 const cancellation_token& cancel, execution_report& report)
    -> item_outcome {
    auto& item = batch.items[index];

    auto on_output = [this, &item](std::string_view line) {
        if (auto sample = parser_.parse(line)) {
            item.bytes_transferred = sample->bytes_done;
            reporter_.update(*sample);
        } else {
            OB_LOG_TRACE(log_category::transport, std::string(line));
        }
    };

    while (true) {
        item.bytes_transferred = 0;
        ++item.attempts;
        transition(batch, item, item_status::in_progress);

        auto ctx = make_context(batch, index);
        OB_LOG_DEBUG_CTX(log_category::executor, "Copying item", ctx);

        ++report.copy_invocations;
        auto copied = transport_.copy(item.source, item.target, on_output, cancel);

        if (!copied && (copied.error().code == error_code::transfer_cancelled ||
                        cancel.is_cancelled())) {
            // An interrupted attempt does not count
            --item.attempts;
            item.last_error = "interrupted";
            transition(batch, item, item_status::failed_retryable);
            reporter_.end_item(item.status);
            return item_outcome::cancelled;
        }

        error failure;
        if (copied) {
            if (!config_.verify || batch.direction != transfer_direction::upload) {
                item.bytes_transferred = item.size_bytes;
                item.last_error.reset();
                transition(batch, item, item_status::completed);
                report.bytes_transferred += item.size_bytes;
                reporter_.end_item(item.status);
                return item_outcome::finished;
            }

            transition(batch, item, item_status::verifying);
            auto verified = verifier::verify(item, transport_);
            if (verified && verified.value().matched) {
                item.bytes_transferred = item.size_bytes;
                item.last_error.reset();
                transition(batch, item, item_status::completed);
                report.bytes_transferred += item.size_bytes;
                reporter_.end_item(item.status);
                return item_outcome::finished;
            }

            failure = verified
                ? error(verified.value().remote_found ? error_code::size_mismatch
                                                      : error_code::remote_object_not_found,
                        verified.value().describe())
                : verified.error();
        } else {
            failure = copied.error();
        }

        item.last_error = failure.message;

        ctx = make_context(batch, index);
        ctx.error_message = failure.message;

        if (is_retryable(failure.code) && config_.retry.is_retryable(item.attempts)) {
            auto delay = config_.retry.backoff_delay(item.attempts);
            ctx.delay_ms = static_cast<uint64_t>(delay.count());
            OB_LOG_WARN_CTX(log_category::executor, "Attempt failed, retrying", ctx);

            transition(batch, item, item_status::failed_retryable);
            sleep_(delay, cancel);
            if (cancel.is_cancelled()) {
                reporter_.end_item(item.status);
                return item_outcome::cancelled;
            }
            continue;
        }

        OB_LOG_ERROR_CTX(log_category::executor, "Item failed permanently", ctx);
        transition(batch, item, item_status::failed);
        reporter_.end_item(item.status);
        return item_outcome::finished;
    }
}

void transfer_executor::transition(transfer_batch& batch, transfer_item& item, item_status status) {
    item.status = status;
    batch.updated_at = std::chrono::system_clock::now();

    if (store_ == nullptr) {
        return;
    }
    if (auto saved = store_->save(batch); !saved) {
        OB_LOG_WARN(log_category::state,
            "Could not persist state of batch " + batch.id + ": " + saved.error().message);
    }
}

}  // namespace kcenon::object_batch
