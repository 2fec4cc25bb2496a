/**
 * @file batch_engine.cpp
 * @brief Implementation of batch_engine
 */

#include <kcenon/object_batch/engine/batch_engine.h>
#include <kcenon/object_batch/planner/batch_planner.h>
#include <kcenon/object_batch/planner/pattern_filter.h>
#include <kcenon/object_batch/progress/progress_parser.h>
#include <kcenon/object_batch/progress/progress_reporter.h>
#include <kcenon/object_batch/state/state_store.h>
#include <kcenon/object_batch/transport/transport_interface.h>
#include <kcenon/object_batch/core/logging.h>

#include <chrono>

namespace kcenon::object_batch {

namespace {

auto make_store_config(const engine_config& config) -> state_store_config {
    if (config.state_directory.empty()) {
        return state_store_config{};
    }
    return state_store_config{config.state_directory};
}

}  // namespace

class batch_engine::impl {
public:
    impl(engine_config cfg,
         object_transport& transport_ref,
         authenticator* auth_ptr,
         std::ostream& out,
         std::unique_ptr<progress_parser> progress)
        : config(std::move(cfg)),
          transport(transport_ref),
          auth(auth_ptr),
          progress_out(out),
          parser(progress ? std::move(progress) : std::make_unique<aws_cli_progress_parser>()),
          store(make_store_config(config)) {}

    auto effective_config(const batch_request& request) const -> result<engine_config> {
        engine_config effective = config;
        if (request.verify) {
            effective.verify = *request.verify;
        }
        if (request.max_retries) {
            effective.retry.max_retries = *request.max_retries;
        }
        if (request.keep_state) {
            effective.keep_state = *request.keep_state;
        }
        if (request.no_resume) {
            effective.resume = false;
        }
        if (auto valid = effective.validate(); !valid) {
            return unexpected(valid.error());
        }
        return effective;
    }

    auto plan(const batch_request& request) -> result<transfer_batch> {
        if (auto valid = pattern_filter::validate_patterns(request.includes); !valid) {
            return unexpected(valid.error());
        }
        if (auto valid = pattern_filter::validate_patterns(request.excludes); !valid) {
            return unexpected(valid.error());
        }

        // Download planning lists and stats remote objects
        if (request.direction == transfer_direction::download) {
            if (auto session = transfer_executor::establish_session(auth); !session) {
                return unexpected(session.error());
            }
            session_established = true;
        }

        batch_planner planner(&transport);
        if (request.direction == transfer_direction::upload) {
            if (request.directory) {
                if (!request.sources.empty()) {
                    return unexpected(error(error_code::invalid_configuration,
                        "explicit files and a directory cannot be combined"));
                }
                return planner.plan_upload_directory(
                    *request.directory, request.destination, request.includes, request.excludes);
            }
            return planner.plan_upload_files(request.sources, request.destination);
        }

        if (request.remote_prefix) {
            if (!request.sources.empty()) {
                return unexpected(error(error_code::invalid_configuration,
                    "explicit objects and a remote prefix cannot be combined"));
            }
            return planner.plan_download_prefix(
                *request.remote_prefix, request.destination, request.includes, request.excludes);
        }
        return planner.plan_download_keys(request.sources, request.destination);
    }

    // Merge persisted state into the fresh plan unless resume is off
    void resume(transfer_batch& batch, const engine_config& effective) {
        if (!effective.resume) {
            OB_LOG_INFO(log_category::engine,
                "Resume disabled, starting batch " + batch.id + " from scratch");
            return;
        }

        auto persisted = store.load(batch.id);
        if (!persisted) {
            OB_LOG_WARN(log_category::engine,
                "Ignoring unreadable state of batch " + batch.id + ": " +
                persisted.error().message);
            return;
        }
        if (!persisted.value()) {
            return;
        }

        state_store::reconcile(batch, *persisted.value());
    }

    auto run(const batch_request& request, const cancellation_token& cancel)
        -> result<batch_summary> {
        auto started = std::chrono::steady_clock::now();
        session_established = false;

        auto effective = effective_config(request);
        if (!effective) {
            return unexpected(effective.error());
        }

        auto planned = plan(request);
        if (!planned) {
            OB_LOG_ERROR(log_category::engine, "Planning failed: " + planned.error().message);
            return unexpected(planned.error());
        }
        auto& batch = planned.value();

        if (request.dry_run) {
            auto plan_totals = batch_planner::summarize(batch);
            batch_summary summary;
            summary.batch_id = batch.id;
            summary.direction = batch.direction;
            summary.dry_run = true;
            summary.total = plan_totals.item_count;
            summary.pending_count = plan_totals.pending_count;
            summary.skipped_count = plan_totals.skipped_count;
            summary.total_bytes = plan_totals.total_bytes;
            return summary;
        }

        if (effective.value().auto_cleanup) {
            auto removed = store.cleanup_expired(effective.value().state_ttl);
            if (removed > 0) {
                OB_LOG_INFO(log_category::engine,
                    "Removed " + std::to_string(removed) + " expired state file(s)");
            }
        }

        if (request.clean_state) {
            if (auto cleared = store.clear(batch.id); !cleared) {
                OB_LOG_WARN(log_category::engine,
                    "Could not clear state of batch " + batch.id + ": " + cleared.error().message);
            }
        }

        resume(batch, effective.value());

        if (auto saved = store.save(batch); !saved) {
            OB_LOG_WARN(log_category::engine,
                "Could not persist state of batch " + batch.id + ": " + saved.error().message);
        }

        progress_reporter reporter(progress_out, effective.value().quiet);
        transfer_executor executor(transport, session_established ? nullptr : auth, &store, *parser,
                                   reporter, effective.value());
        if (sleeper) {
            executor.set_sleep_function(sleeper);
        }

        auto report = executor.execute(batch, cancel);
        if (!report) {
            return unexpected(report.error());
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        auto summary = summary_reporter::summarize(batch, report.value().interrupted, elapsed);

        if (batch.all_terminal() && summary.failed_count == 0 && !effective.value().keep_state) {
            if (auto cleared = store.clear(batch.id); !cleared) {
                OB_LOG_WARN(log_category::engine,
                    "Could not remove state of batch " + batch.id + ": " +
                    cleared.error().message);
            }
        } else {
            OB_LOG_INFO(log_category::engine,
                "State of batch " + batch.id + " kept at " + store.state_file_path(batch.id).string());
        }

        OB_LOG_INFO(log_category::engine,
            "Batch " + batch.id + " finished: " + summary_reporter::status_line(summary));
        return summary;
    }

    engine_config config;
    object_transport& transport;
    authenticator* auth;
    std::ostream& progress_out;
    std::unique_ptr<progress_parser> parser;
    state_store store;
    sleep_function sleeper;
    bool session_established = false;
};

batch_engine::batch_engine(engine_config config,
                           object_transport& transport,
                           authenticator* auth,
                           std::ostream& progress_out,
                           std::unique_ptr<progress_parser> parser)
    : impl_(std::make_unique<impl>(std::move(config), transport, auth, progress_out,
                                   std::move(parser))) {}

batch_engine::~batch_engine() = default;

batch_engine::batch_engine(batch_engine&&) noexcept = default;

auto batch_engine::operator=(batch_engine&&) noexcept -> batch_engine& = default;

auto batch_engine::plan(const batch_request& request) -> result<transfer_batch> {
    return impl_->plan(request);
}

auto batch_engine::run(const batch_request& request, const cancellation_token& cancel)
    -> result<batch_summary> {
    return impl_->run(request, cancel);
}

auto batch_engine::clean_state(const std::string& batch_id) -> result<void> {
    return impl_->store.clear(batch_id);
}

auto batch_engine::list_resumable() const -> std::vector<std::string> {
    return impl_->store.list_batches();
}

void batch_engine::set_sleep_function(sleep_function sleeper) {
    impl_->sleeper = std::move(sleeper);
}

auto batch_engine::config() const -> const engine_config& {
    return impl_->config;
}

}  // namespace kcenon::object_batch
