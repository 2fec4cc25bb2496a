/**
 * @file test_state_store.cpp
 * @brief Unit tests for batch state persistence and reconciliation
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace kcenon::object_batch::test {

namespace fs = std::filesystem;

class StateStoreTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        store_ = std::make_unique<state_store>(state_store_config{state_dir_});
    }

    static auto make_batch(const std::string& id) -> transfer_batch {
        transfer_batch batch;
        batch.id = id;
        batch.direction = transfer_direction::upload;
        batch.destination = "s3://bucket/p/";
        batch.items.emplace_back("/data/f1", "s3://bucket/p/f1", 100);
        batch.items.emplace_back("/data/f2", "s3://bucket/p/f2", 200);
        batch.items.emplace_back("/data/f3 \"quoted\"", "s3://bucket/p/f3", 300);
        batch.created_at = std::chrono::system_clock::now();
        batch.updated_at = batch.created_at;
        return batch;
    }

    std::unique_ptr<state_store> store_;
};

// =============================================================================
// Persistence
// =============================================================================

TEST_F(StateStoreTest, LoadOfUnknownBatchIsEmpty) {
    auto loaded = store_->load("0123456789abcdef");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded.value().has_value());
}

TEST_F(StateStoreTest, SaveThenLoadKeepsItems) {
    auto batch = make_batch("batch-1");
    batch.items[0].status = item_status::completed;
    batch.items[0].bytes_transferred = 100;
    batch.items[1].status = item_status::failed;
    batch.items[1].attempts = 4;
    batch.items[1].last_error = "exit code 1: Could not connect";

    ASSERT_TRUE(store_->save(batch));
    EXPECT_TRUE(store_->exists("batch-1"));

    auto loaded = store_->load("batch-1");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded.value().has_value());

    const auto& restored = *loaded.value();
    EXPECT_EQ(restored.destination, "s3://bucket/p/");
    ASSERT_EQ(restored.items.size(), 3u);
    EXPECT_EQ(restored.items[0].status, item_status::completed);
    EXPECT_EQ(restored.items[0].bytes_transferred, 100u);
    EXPECT_EQ(restored.items[1].attempts, 4u);
    EXPECT_EQ(restored.items[1].last_error, "exit code 1: Could not connect");
    EXPECT_FALSE(restored.items[2].last_error.has_value());
    EXPECT_EQ(restored.items[2].source, "/data/f3 \"quoted\"");
    EXPECT_EQ(restored.items[2].size_bytes, 300u);
}

TEST_F(StateStoreTest, ValuesNamedLikeKeysLoad) {
    auto batch = make_batch("batch-keys");
    batch.destination = "items";
    batch.items[0].source = "size_bytes";
    batch.items[0].target = "created_at";
    batch.items[1].status = item_status::failed;
    batch.items[1].last_error = "attempts";
    batch.items[1].attempts = 2;

    ASSERT_TRUE(store_->save(batch));
    auto loaded = store_->load("batch-keys");
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    ASSERT_TRUE(loaded.value().has_value());

    const auto& restored = *loaded.value();
    EXPECT_EQ(restored.destination, "items");
    ASSERT_EQ(restored.items.size(), 3u);
    EXPECT_EQ(restored.items[0].source, "size_bytes");
    EXPECT_EQ(restored.items[0].target, "created_at");
    EXPECT_EQ(restored.items[0].size_bytes, 100u);
    EXPECT_EQ(restored.items[1].last_error, "attempts");
    EXPECT_EQ(restored.items[1].attempts, 2u);
}

TEST_F(StateStoreTest, FileIsOwnerOnlyAndTempFileIsGone) {
    ASSERT_TRUE(store_->save(make_batch("batch-2")));

    auto path = store_->state_file_path("batch-2");
    ASSERT_TRUE(fs::exists(path));
    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

    auto temp = path;
    temp += ".tmp";
    EXPECT_FALSE(fs::exists(temp));
}

TEST_F(StateStoreTest, CorruptedFileIsReported) {
    fs::create_directories(state_dir_);
    std::ofstream(state_dir_ / "broken.json") << "{ \"version\": 1, \"items\": [";

    auto loaded = store_->load("broken");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::state_corrupted);
}

TEST_F(StateStoreTest, MismatchedIdIsCorrupted) {
    ASSERT_TRUE(store_->save(make_batch("real-id")));
    fs::copy_file(store_->state_file_path("real-id"), state_dir_ / "other-id.json");

    auto loaded = store_->load("other-id");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::state_corrupted);
}

TEST_F(StateStoreTest, ClearAndList) {
    ASSERT_TRUE(store_->save(make_batch("b")));
    ASSERT_TRUE(store_->save(make_batch("a")));

    auto ids = store_->list_batches();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "a");
    EXPECT_EQ(ids[1], "b");

    ASSERT_TRUE(store_->clear("a"));
    EXPECT_FALSE(store_->exists("a"));
    EXPECT_TRUE(store_->clear("never-saved"));
    EXPECT_EQ(store_->list_batches().size(), 1u);
}

TEST_F(StateStoreTest, CleanupRemovesOnlyExpiredStates) {
    auto old_batch = make_batch("old");
    old_batch.updated_at = std::chrono::system_clock::now() - std::chrono::hours(48);
    ASSERT_TRUE(store_->save(old_batch));
    ASSERT_TRUE(store_->save(make_batch("fresh")));

    auto removed = store_->cleanup_expired(std::chrono::hours(24));
    EXPECT_EQ(removed, 1u);
    EXPECT_FALSE(store_->exists("old"));
    EXPECT_TRUE(store_->exists("fresh"));
}

TEST_F(StateStoreTest, DeserializeRejectsUnknownStatus) {
    auto json = state_store::serialize(make_batch("x"));
    auto pos = json.find("\"pending\"");
    ASSERT_NE(pos, std::string::npos);
    json.replace(pos, 9, "\"paused\"");

    auto batch = state_store::deserialize(json);
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, error_code::state_corrupted);
}

// =============================================================================
// Reconciliation
// =============================================================================

class ReconcileTest : public ::testing::Test {
protected:
    static auto planned() -> transfer_batch {
        transfer_batch batch;
        batch.id = "id";
        batch.items.emplace_back("/d/f1", "s3://b/f1", 10);
        batch.items.emplace_back("/d/f2", "s3://b/f2", 20);
        batch.items.emplace_back("/d/f3", "s3://b/f3", 30);
        batch.items.emplace_back("/e/f3", "s3://b/f3", 30);
        batch.items[3].status = item_status::skipped;
        batch.items[3].last_error = "duplicate of item 3";
        return batch;
    }
};

TEST_F(ReconcileTest, CompletedItemsCarryOver) {
    auto batch = planned();

    transfer_batch persisted;
    persisted.id = "id";
    persisted.created_at = std::chrono::system_clock::time_point{std::chrono::hours(1)};
    persisted.items.emplace_back("/d/f1", "s3://b/f1", 11);
    persisted.items[0].status = item_status::completed;
    persisted.items[0].attempts = 1;
    persisted.items.emplace_back("/d/f2", "s3://b/f2", 20);
    persisted.items[1].status = item_status::failed;
    persisted.items[1].attempts = 4;
    persisted.items[1].last_error = "network";
    persisted.items.emplace_back("/d/gone", "s3://b/gone", 1);
    persisted.items[2].status = item_status::completed;

    auto carried = state_store::reconcile(batch, persisted);
    EXPECT_EQ(carried, 1u);

    EXPECT_EQ(batch.items[0].status, item_status::completed);
    EXPECT_TRUE(batch.items[0].carried_over);
    EXPECT_EQ(batch.items[0].size_bytes, 11u);
    EXPECT_EQ(batch.items[0].attempts, 1u);

    EXPECT_EQ(batch.items[1].status, item_status::pending);
    EXPECT_EQ(batch.items[1].attempts, 0u);
    EXPECT_FALSE(batch.items[1].last_error.has_value());

    EXPECT_EQ(batch.items[2].status, item_status::pending);
    EXPECT_EQ(batch.items[3].status, item_status::skipped);
    EXPECT_EQ(batch.items.size(), 4u);
    EXPECT_EQ(batch.created_at, persisted.created_at);
}

TEST_F(ReconcileTest, InterruptedItemRestarts) {
    auto batch = planned();

    transfer_batch persisted;
    persisted.id = "id";
    persisted.items.emplace_back("/d/f3", "s3://b/f3", 30);
    persisted.items[0].status = item_status::in_progress;
    persisted.items[0].attempts = 2;

    EXPECT_EQ(state_store::reconcile(batch, persisted), 0u);
    EXPECT_EQ(batch.items[2].status, item_status::pending);
    EXPECT_EQ(batch.items[2].attempts, 0u);
}

}  // namespace kcenon::object_batch::test
