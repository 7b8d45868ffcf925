/**
 * @file test_transfer_state.cpp
 * @brief Unit tests for transfer_state and chunk_ledger
 */

#include <gtest/gtest.h>

#include <kcenon/object_storage/transfer/transfer_state.h>

#include <thread>
#include <vector>

namespace kcenon::object_storage::test {

class TransferStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        transfer_fingerprint fp;
        fp.size = 10;
        fp.last_modified = "1";
        state_ = transfer_state::create("bucket", "key", "/tmp/file.bin",
                                        transfer_direction::upload, 10, 4, fp);
    }

    transfer_state state_;
};

TEST_F(TransferStateTest, CreateLaysOutPendingChunks) {
    ASSERT_EQ(state_.chunks.size(), 3u);
    EXPECT_EQ(state_.chunks[2].range, byte_range(8, 2));
    EXPECT_EQ(state_.chunks[2].part_number(), 3u);
    EXPECT_TRUE(state_.is_consistent());
    EXPECT_FALSE(state_.is_complete());
    EXPECT_EQ(state_.pending_indices(), (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_DOUBLE_EQ(state_.completion_percentage(), 0.0);
}

TEST_F(TransferStateTest, CompletionNeedsStatusAndBytes) {
    state_.chunks[0].status = chunk_status::completed;
    EXPECT_FALSE(state_.chunks[0].is_completed());

    state_.chunks[0].bytes_transferred = 4;
    EXPECT_TRUE(state_.chunks[0].is_completed());
    EXPECT_EQ(state_.completed_count(), 1u);
    EXPECT_EQ(state_.bytes_completed(), 4u);
    EXPECT_DOUBLE_EQ(state_.completion_percentage(), 40.0);
}

TEST_F(TransferStateTest, ResetInterruptedKeepsFinishedChunks) {
    chunk_ledger ledger(state_);
    ledger.mark_completed(0, "etag-0");
    ledger.mark_in_flight(1);
    ledger.mark_failed(2, error{error_code::server_error, "boom"});

    state_.reset_interrupted();
    EXPECT_EQ(state_.chunks[0].status, chunk_status::completed);
    EXPECT_EQ(state_.chunks[1].status, chunk_status::pending);
    EXPECT_EQ(state_.chunks[2].status, chunk_status::pending);
    EXPECT_EQ(state_.pending_indices(), (std::vector<uint32_t>{1, 2}));
}

TEST_F(TransferStateTest, ResetProgressClearsUploadId) {
    state_.upload_id = "upload-1";
    chunk_ledger(state_).mark_completed(1, "etag");

    state_.reset_progress();
    EXPECT_TRUE(state_.upload_id.empty());
    EXPECT_EQ(state_.completed_count(), 0u);
    EXPECT_TRUE(state_.chunks[1].etag.empty());
}

TEST_F(TransferStateTest, CompletedPartsAreOrdered) {
    chunk_ledger ledger(state_);
    ledger.mark_completed(2, "c");
    ledger.mark_completed(0, "a");

    auto parts = state_.completed_parts();
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].part_number, 1u);
    EXPECT_EQ(parts[0].etag, "a");
    EXPECT_EQ(parts[1].part_number, 3u);
    EXPECT_EQ(parts[1].etag, "c");
}

TEST_F(TransferStateTest, InconsistentLayoutDetected) {
    state_.chunks[1].range = byte_range(5, 3);
    EXPECT_FALSE(state_.is_consistent());

    SetUp();
    state_.chunks[1].index = 7;
    EXPECT_FALSE(state_.is_consistent());
}

TEST(ChunkStatusTest, StringRoundTrip) {
    for (auto status : {chunk_status::pending, chunk_status::in_flight,
                        chunk_status::completed, chunk_status::failed}) {
        EXPECT_EQ(chunk_status_from_string(to_string(status)), status);
    }
    EXPECT_FALSE(chunk_status_from_string("paused").has_value());
}

// ============================================================================
// chunk_ledger
// ============================================================================

TEST_F(TransferStateTest, LedgerCountsEachChunkOnce) {
    chunk_ledger ledger(state_);
    ledger.mark_completed(0, "a");
    ledger.mark_completed(0, "a2");
    EXPECT_EQ(ledger.completed_count(), 1u);
    EXPECT_EQ(ledger.bytes_completed(), 4u);
    EXPECT_EQ(ledger.record(0).etag, "a2");
}

TEST_F(TransferStateTest, LedgerStartsFromExistingProgress) {
    chunk_ledger(state_).mark_completed(1, "b");

    chunk_ledger resumed(state_);
    EXPECT_EQ(resumed.completed_count(), 1u);
    EXPECT_EQ(resumed.bytes_completed(), 4u);
}

TEST_F(TransferStateTest, LedgerRecordsRetries) {
    chunk_ledger ledger(state_);
    EXPECT_EQ(ledger.record_retry(1, error{error_code::throttled, "slow"}), 1u);
    EXPECT_EQ(ledger.record_retry(1, error{error_code::throttled, "slower"}), 2u);
    EXPECT_EQ(ledger.record(1).last_error, "slower");
}

TEST_F(TransferStateTest, LedgerSnapshotIsIndependent) {
    chunk_ledger ledger(state_);
    ledger.mark_completed(0, "a");
    auto copy = ledger.snapshot();
    ledger.mark_completed(1, "b");

    EXPECT_EQ(copy.completed_count(), 1u);
    EXPECT_EQ(state_.completed_count(), 2u);
    EXPECT_EQ(copy.bucket, "bucket");
}

TEST(ChunkLedgerTest, ConcurrentCompletion) {
    auto state = transfer_state::create("b", "k", "/tmp/x", transfer_direction::download,
                                        64 * 1024, 1024, {});
    chunk_ledger ledger(state);

    std::vector<std::thread> workers;
    for (uint32_t t = 0; t < 4; ++t) {
        workers.emplace_back([&ledger, t] {
            for (uint32_t i = t; i < 64; i += 4) {
                ledger.mark_in_flight(i);
                ledger.mark_completed(i);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(ledger.completed_count(), 64u);
    EXPECT_TRUE(state.is_complete());
}

}  // namespace kcenon::object_storage::test
