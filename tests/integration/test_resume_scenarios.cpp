/**
 * @file test_resume_scenarios.cpp
 * @brief End-to-end batch runs through batch_engine against an in-memory
 *        object store
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <sstream>
#include <string>
#include <vector>

namespace kcenon::object_batch::test {

using std::chrono::milliseconds;

class ResumeScenarioTest : public TempDirectoryFixture {
protected:
    static constexpr const char* prefix = "s3://gt-logs/zendesk-tickets/ZD-145980/";

    auto make_engine(engine_config config = {}) -> batch_engine {
        config.state_directory = state_dir_;
        config.quiet = true;
        batch_engine engine(config, transport_, &auth_, progress_);
        engine.set_sleep_function(sleeps_.function());
        return engine;
    }

    auto upload_request(const std::vector<std::string>& names) -> batch_request {
        batch_request request;
        request.direction = transfer_direction::upload;
        request.destination = prefix;
        for (const auto& name : names) {
            request.sources.push_back((source_dir_ / name).string());
        }
        return request;
    }

    auto target(const std::string& name) const -> std::string {
        return std::string(prefix) + name;
    }

    auto store() -> state_store { return state_store(state_store_config{state_dir_}); }

    static void expect_counts_add_up(const batch_summary& summary) {
        EXPECT_EQ(summary.completed_count + summary.failed_count + summary.skipped_count +
                      summary.pending_count,
                  summary.total);
    }

    scripted_transport transport_;
    scripted_authenticator auth_;
    std::ostringstream progress_;
    recorded_sleeps sleeps_;
    cancellation_token cancel_;
};

/**
 * @brief Object store that rejects listings without a valid session
 */
class session_bound_transport : public scripted_transport {
public:
    explicit session_bound_transport(const scripted_authenticator& auth) : auth_(auth) {}

    auto list(const std::string& prefix_uri) -> result<std::vector<remote_object>> override {
        ++list_calls;
        if (!auth_.session_valid) {
            return unexpected(error(error_code::remote_list_failed,
                "Unable to locate credentials / Token has expired"));
        }
        return scripted_transport::list(prefix_uri);
    }

    int list_calls = 0;

private:
    const scripted_authenticator& auth_;
};

TEST_F(ResumeScenarioTest, UploadsEveryFileAndRemovesState) {
    create_file("f1.log", 100);
    create_file("f2.log", 200);
    auto engine = make_engine();

    auto summary = engine.run(upload_request({"f1.log", "f2.log"}), cancel_);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_TRUE(summary.value().success());
    EXPECT_EQ(summary.value().completed_count, 2u);
    EXPECT_EQ(summary.value().bytes_transferred, 300u);
    expect_counts_add_up(summary.value());

    EXPECT_EQ(transport_.objects.at(target("f1.log")), 100u);
    EXPECT_EQ(transport_.objects.at(target("f2.log")), 200u);
    EXPECT_FALSE(store().exists(summary.value().batch_id));
    EXPECT_TRUE(engine.list_resumable().empty());
}

TEST_F(ResumeScenarioTest, ResumedRunSkipsCompletedItems) {
    create_file("f1.log", 10);
    create_file("f2.log", 20);
    create_file("f3.log", 30);
    auto engine = make_engine();
    auto request = upload_request({"f1.log", "f2.log", "f3.log"});

    // A previous run completed f2 only
    auto planned = engine.plan(request);
    ASSERT_TRUE(planned.has_value());
    auto previous = planned.value();
    previous.items[1].status = item_status::completed;
    previous.items[1].attempts = 1;
    previous.items[2].status = item_status::failed_retryable;
    auto persist = store();
    ASSERT_TRUE(persist.save(previous));

    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(transport_.copy_count(target("f1.log")), 1u);
    EXPECT_EQ(transport_.copy_count(target("f2.log")), 0u);
    EXPECT_EQ(transport_.copy_count(target("f3.log")), 1u);

    EXPECT_EQ(summary.value().completed_count, 3u);
    EXPECT_EQ(summary.value().carried_over_count, 1u);
    EXPECT_EQ(summary.value().newly_completed(), 2u);
    EXPECT_EQ(summary.value().failed_count, 0u);
    EXPECT_EQ(summary.value().bytes_transferred, 40u);
}

TEST_F(ResumeScenarioTest, SourceOrderDoesNotChangeTheBatch) {
    create_file("f1.log", 10);
    create_file("f2.log", 20);
    auto engine = make_engine();

    auto forward = engine.plan(upload_request({"f1.log", "f2.log"}));
    auto reversed = engine.plan(upload_request({"f2.log", "f1.log"}));
    ASSERT_TRUE(forward.has_value() && reversed.has_value());
    EXPECT_EQ(forward.value().id, reversed.value().id);
}

TEST_F(ResumeScenarioTest, TransientFailureThenSuccess) {
    create_file("f1.log", 10);
    transport_.fail_next(target("f1.log"), error_code::network_error);
    engine_config config;
    config.keep_state = true;
    auto engine = make_engine(config);

    auto summary = engine.run(upload_request({"f1.log"}), cancel_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary.value().success());

    auto saved = store().load(summary.value().batch_id);
    ASSERT_TRUE(saved.has_value() && saved.value().has_value());
    EXPECT_EQ(saved.value()->items[0].status, item_status::completed);
    EXPECT_EQ(saved.value()->items[0].attempts, 2u);
}

TEST_F(ResumeScenarioTest, ExhaustedRetriesKeepStateForResume) {
    create_file("f1.log", 10);
    create_file("f2.log", 20);
    transport_.fail_always(target("f1.log"), error_code::transport_failed);
    auto engine = make_engine();

    auto summary = engine.run(upload_request({"f1.log", "f2.log"}), cancel_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_FALSE(summary.value().success());
    EXPECT_EQ(summary.value().failed_count, 1u);
    EXPECT_EQ(summary.value().completed_count, 1u);
    ASSERT_EQ(summary.value().failures.size(), 1u);
    EXPECT_EQ(summary.value().failures[0].target, target("f1.log"));
    expect_counts_add_up(summary.value());

    std::vector<milliseconds> expected{milliseconds{1000}, milliseconds{2000}, milliseconds{4000}};
    EXPECT_EQ(sleeps_.delays, expected);
    EXPECT_EQ(transport_.copy_count(target("f1.log")), 4u);

    EXPECT_TRUE(store().exists(summary.value().batch_id));
    auto resumable = engine.list_resumable();
    ASSERT_EQ(resumable.size(), 1u);
    EXPECT_EQ(resumable[0], summary.value().batch_id);

    // The next run retries only the failed item
    transport_.permanent_failures.clear();
    auto rerun = engine.run(upload_request({"f1.log", "f2.log"}), cancel_);
    ASSERT_TRUE(rerun.has_value());
    EXPECT_TRUE(rerun.value().success());
    EXPECT_EQ(rerun.value().carried_over_count, 1u);
    EXPECT_EQ(transport_.copy_count(target("f2.log")), 1u);
    EXPECT_FALSE(store().exists(rerun.value().batch_id));
}

TEST_F(ResumeScenarioTest, RequestOverridesRetryLimit) {
    create_file("f1.log", 10);
    transport_.fail_always(target("f1.log"), error_code::network_error);
    auto engine = make_engine();

    auto request = upload_request({"f1.log"});
    request.max_retries = 0;
    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().failed_count, 1u);
    EXPECT_EQ(transport_.copy_count(target("f1.log")), 1u);
    EXPECT_TRUE(sleeps_.delays.empty());
}

TEST_F(ResumeScenarioTest, VerificationMismatchFailsTheItem) {
    create_file("f1.log", 10);
    transport_.stored_size_override[target("f1.log")] = 3;
    auto engine = make_engine();

    auto request = upload_request({"f1.log"});
    request.verify = true;
    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(summary.value().failures.size(), 1u);
    EXPECT_EQ(summary.value().failures[0].error, "size mismatch: local=10 remote=3");
    EXPECT_EQ(transport_.copy_count(target("f1.log")), 4u);
}

TEST_F(ResumeScenarioTest, DryRunNeverCopies) {
    create_file("a.log", 10);
    create_file("sub/a.log", 10);
    auto engine = make_engine();

    batch_request request = upload_request({"a.log", "sub/a.log"});
    request.dry_run = true;
    auto dry = engine.run(request, cancel_);
    ASSERT_TRUE(dry.has_value());
    EXPECT_TRUE(dry.value().dry_run);
    EXPECT_TRUE(transport_.copies.empty());
    EXPECT_EQ(auth_.checks, 0);
    EXPECT_FALSE(store().exists(dry.value().batch_id));

    // Same planned set as a live run, duplicate included
    EXPECT_EQ(dry.value().total, 2u);
    EXPECT_EQ(dry.value().pending_count, 1u);
    EXPECT_EQ(dry.value().skipped_count, 1u);
    EXPECT_EQ(dry.value().total_bytes, 10u);
    EXPECT_EQ(summary_reporter::status_line(dry.value()),
              "DRY RUN: 1 item(s) would be transferred");

    request.dry_run = false;
    auto live = engine.run(request, cancel_);
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(live.value().batch_id, dry.value().batch_id);
    EXPECT_EQ(live.value().total, 2u);
    EXPECT_EQ(live.value().skipped_count, 1u);
    EXPECT_EQ(live.value().total_bytes, 10u);
    EXPECT_EQ(transport_.copies.size(), 1u);
}

TEST_F(ResumeScenarioTest, DirectoryFilterScenario) {
    create_file("a.tar.gz", 10);
    create_file("a.debug.tar.gz", 10);
    create_file("b.log", 10);
    auto engine = make_engine();

    batch_request request;
    request.directory = source_dir_.string();
    request.destination = prefix;
    request.includes = {"*.tar.gz"};
    request.excludes = {"*.debug.tar.gz"};

    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().total, 1u);
    ASSERT_EQ(transport_.copies.size(), 1u);
    EXPECT_EQ(transport_.copies[0].second, target("a.tar.gz"));
}

TEST_F(ResumeScenarioTest, DirectoryResumeAfterTreeGrows) {
    create_file("f1.log", 10);
    create_file("f2.log", 20);
    transport_.fail_always(target("f2.log"), error_code::transport_failed);
    auto engine = make_engine();

    batch_request request;
    request.directory = source_dir_.string();
    request.destination = prefix;

    auto first = engine.run(request, cancel_);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().completed_count, 1u);
    EXPECT_EQ(first.value().failed_count, 1u);

    create_file("f3.log", 30);
    transport_.permanent_failures.clear();
    auto second = engine.run(request, cancel_);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().batch_id, first.value().batch_id);
    EXPECT_TRUE(second.value().success());
    EXPECT_EQ(second.value().total, 3u);
    EXPECT_EQ(second.value().carried_over_count, 1u);

    EXPECT_EQ(transport_.copy_count(target("f1.log")), 1u);
    EXPECT_EQ(transport_.copy_count(target("f3.log")), 1u);
    EXPECT_TRUE(engine.list_resumable().empty());
}

TEST_F(ResumeScenarioTest, InvalidPatternIsRejectedBeforeAnyWork) {
    create_file("a.log", 10);
    auto engine = make_engine();

    batch_request request;
    request.directory = source_dir_.string();
    request.destination = prefix;
    request.includes = {"[a-"};

    auto summary = engine.run(request, cancel_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::invalid_pattern);
    EXPECT_TRUE(transport_.copies.empty());
}

TEST_F(ResumeScenarioTest, MixedSourcesAreRejected) {
    auto engine = make_engine();
    auto request = upload_request({"a.log"});
    request.directory = source_dir_.string();

    auto summary = engine.run(request, cancel_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::invalid_configuration);
}

TEST_F(ResumeScenarioTest, InterruptedRunResumes) {
    create_file("f1.log", 10);
    create_file("f2.log", 20);
    create_file("f3.log", 30);
    transport_.cancel_during(target("f2.log"), cancel_);
    auto engine = make_engine();
    auto request = upload_request({"f1.log", "f2.log", "f3.log"});

    auto first = engine.run(request, cancel_);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first.value().interrupted);
    EXPECT_EQ(first.value().completed_count, 1u);
    EXPECT_EQ(first.value().pending_count, 2u);
    expect_counts_add_up(first.value());
    EXPECT_EQ(summary_reporter::status_line(first.value()),
              "INTERRUPTED: batch " + first.value().batch_id + " can be resumed");
    EXPECT_TRUE(store().exists(first.value().batch_id));

    cancellation_token fresh;
    auto second = engine.run(request, fresh);
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second.value().success());
    EXPECT_EQ(second.value().carried_over_count, 1u);
    EXPECT_EQ(transport_.copy_count(target("f1.log")), 1u);
    EXPECT_EQ(transport_.copy_count(target("f2.log")), 2u);
    EXPECT_EQ(transport_.copy_count(target("f3.log")), 1u);
}

TEST_F(ResumeScenarioTest, NoResumeStartsOver) {
    create_file("f1.log", 10);
    auto engine = make_engine();
    auto request = upload_request({"f1.log"});

    auto planned = engine.plan(request);
    ASSERT_TRUE(planned.has_value());
    planned.value().items[0].status = item_status::completed;
    auto persist = store();
    ASSERT_TRUE(persist.save(planned.value()));

    request.no_resume = true;
    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().carried_over_count, 0u);
    EXPECT_EQ(transport_.copy_count(target("f1.log")), 1u);
}

TEST_F(ResumeScenarioTest, CleanStateDiscardsPersistedProgress) {
    create_file("f1.log", 10);
    auto engine = make_engine();
    auto request = upload_request({"f1.log"});

    auto planned = engine.plan(request);
    ASSERT_TRUE(planned.has_value());
    planned.value().items[0].status = item_status::completed;
    auto persist = store();
    ASSERT_TRUE(persist.save(planned.value()));
    ASSERT_EQ(engine.list_resumable().size(), 1u);

    ASSERT_TRUE(engine.clean_state(planned.value().id));
    EXPECT_TRUE(engine.list_resumable().empty());

    ASSERT_TRUE(persist.save(planned.value()));
    request.clean_state = true;
    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().carried_over_count, 0u);
    EXPECT_EQ(transport_.copy_count(target("f1.log")), 1u);
}

TEST_F(ResumeScenarioTest, CorruptedStateIsIgnored) {
    create_file("f1.log", 10);
    auto engine = make_engine();
    auto request = upload_request({"f1.log"});

    auto planned = engine.plan(request);
    ASSERT_TRUE(planned.has_value());
    std::filesystem::create_directories(state_dir_);
    {
        std::ofstream corrupt(store().state_file_path(planned.value().id));
        corrupt << "{ not json";
    }

    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary.value().success());
    EXPECT_EQ(transport_.copy_count(target("f1.log")), 1u);
}

TEST_F(ResumeScenarioTest, AuthenticationFailureStopsBeforeCopying) {
    create_file("f1.log", 10);
    auth_.session_valid = false;
    auth_.login_succeeds = false;
    auto engine = make_engine();

    auto summary = engine.run(upload_request({"f1.log"}), cancel_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::authentication_failed);
    EXPECT_TRUE(transport_.copies.empty());
}

TEST_F(ResumeScenarioTest, DownloadFromPrefix) {
    transport_.objects[target("a.tar.gz")] = 40;
    transport_.objects[target("nested/b.tar.gz")] = 50;
    transport_.objects[target("c.log")] = 60;
    auto engine = make_engine();

    batch_request request;
    request.direction = transfer_direction::download;
    request.remote_prefix = prefix;
    request.destination = download_dir_.string();
    request.includes = {"*.tar.gz"};

    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_TRUE(summary.value().success());
    EXPECT_EQ(summary.value().total, 2u);
    EXPECT_EQ(std::filesystem::file_size(download_dir_ / "a.tar.gz"), 40u);
    EXPECT_EQ(std::filesystem::file_size(download_dir_ / "b.tar.gz"), 50u);
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "c.log"));
    EXPECT_EQ(auth_.checks, 1);
}

TEST_F(ResumeScenarioTest, ExpiredSessionLogsInBeforeListing) {
    session_bound_transport transport(auth_);
    transport.objects[target("a.tar.gz")] = 40;
    auth_.session_valid = false;

    engine_config config;
    config.state_directory = state_dir_;
    config.quiet = true;
    batch_engine engine(config, transport, &auth_, progress_);

    batch_request request;
    request.direction = transfer_direction::download;
    request.remote_prefix = prefix;
    request.destination = download_dir_.string();

    auto summary = engine.run(request, cancel_);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_TRUE(summary.value().success());
    EXPECT_EQ(auth_.logins, 1);
    EXPECT_EQ(auth_.checks, 1);
    EXPECT_EQ(transport.list_calls, 1);
    EXPECT_EQ(std::filesystem::file_size(download_dir_ / "a.tar.gz"), 40u);
}

TEST_F(ResumeScenarioTest, RejectedLoginStopsDownloadPlanning) {
    session_bound_transport transport(auth_);
    transport.objects[target("a.tar.gz")] = 40;
    auth_.session_valid = false;
    auth_.login_succeeds = false;

    engine_config config;
    config.state_directory = state_dir_;
    config.quiet = true;
    batch_engine engine(config, transport, &auth_, progress_);

    batch_request request;
    request.direction = transfer_direction::download;
    request.remote_prefix = prefix;
    request.destination = download_dir_.string();

    auto planned = engine.plan(request);
    ASSERT_FALSE(planned.has_value());
    EXPECT_EQ(planned.error().code, error_code::authentication_failed);

    auto summary = engine.run(request, cancel_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::authentication_failed);
    EXPECT_EQ(transport.list_calls, 0);
    EXPECT_TRUE(transport.copies.empty());
}

TEST_F(ResumeScenarioTest, DownloadListingFailureIsAnError) {
    transport_.list_failure = error(error_code::remote_list_failed, "AccessDenied");
    auto engine = make_engine();

    batch_request request;
    request.direction = transfer_direction::download;
    request.remote_prefix = prefix;
    request.destination = download_dir_.string();

    auto summary = engine.run(request, cancel_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::remote_list_failed);
}

}  // namespace kcenon::object_batch::test
