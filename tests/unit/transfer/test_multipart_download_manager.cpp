/**
 * @file test_multipart_download_manager.cpp
 * @brief Unit tests for multipart_download_manager
 */

#include <gtest/gtest.h>

#include <kcenon/object_storage/storage/storage_client.h>
#include <kcenon/object_storage/transfer/multipart_download_manager.h>
#include <kcenon/object_storage/transfer/progress_collector.h>
#include <kcenon/object_storage/transfer/resume_store.h>

#include "in_memory_s3.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>

namespace kcenon::object_storage::test {

namespace {

constexpr uint64_t MiB = 1024ULL * 1024;

auto make_payload(uint64_t size, uint8_t seed) -> std::vector<uint8_t> {
    std::vector<uint8_t> data(size);
    for (uint64_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xff);
    }
    return data;
}

auto range_start(const recorded_request& r) -> std::optional<uint64_t> {
    auto range = r.header("Range");
    if (!range || range->rfind("bytes=", 0) != 0) {
        return std::nullopt;
    }
    return std::stoull(range->substr(6, range->find('-') - 6));
}

}  // namespace

class MultipartDownloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("download_manager_test_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(test_dir_);

        backend_ = std::make_shared<in_memory_s3>();
        backend_->add_bucket("media");

        credentials creds;
        creds.access_key = "AKIDEXAMPLE";
        creds.secret_key = "secret";
        creds.endpoint = "localhost:9000";
        creds.use_tls = false;
        storage_ = std::make_unique<storage_client>(creds, backend_);

        store_ = std::make_unique<resume_store>(resume_store_config(test_dir_ / "resume"));

        options_.download_chunk_size = 4 * MiB;
        options_.max_parallel_downloads = 3;
        options_.poll_interval = std::chrono::milliseconds(10);
        manager_ = std::make_unique<multipart_download_manager>(*storage_, store_.get(),
                                                                options_);

        payload_ = make_payload(10 * MiB, 7);
        backend_->put("media", "video.mp4", payload_);
        destination_ = test_dir_ / "out" / "video.mp4";
    }

    void TearDown() override {
        manager_.reset();
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto read_destination() -> std::vector<uint8_t> {
        std::ifstream in(destination_, std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    }

    auto ranged_gets() -> std::multiset<uint64_t> {
        std::multiset<uint64_t> starts;
        for (const auto& r : backend_->requests()) {
            if (r.method == http_method::get) {
                if (auto start = range_start(r)) {
                    starts.insert(*start);
                }
            }
        }
        return starts;
    }

    auto record_exists() -> bool {
        return std::filesystem::exists(store_->record_path(
            "media", "video.mp4", destination_, transfer_direction::download));
    }

    /// First run that stops after range 0 with range 4194304 failing
    auto interrupted_run(download_options& options) -> download_result {
        backend_->fail_range(4194304, 1, 500);
        options.max_parallel = 1;
        options.max_retries = 0;
        return manager_->download("media", "video.mp4", destination_, options);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path destination_;
    std::vector<uint8_t> payload_;
    std::shared_ptr<in_memory_s3> backend_;
    std::unique_ptr<storage_client> storage_;
    std::unique_ptr<resume_store> store_;
    connection_options options_;
    std::unique_ptr<multipart_download_manager> manager_;
};

TEST_F(MultipartDownloadManagerTest, DownloadsAllRanges) {
    progress_collector progress;
    auto result = manager_->download("media", "video.mp4", destination_, {}, &progress);

    ASSERT_TRUE(result.success()) << result.failure->message;
    EXPECT_EQ(result.total_size, 10 * MiB);
    EXPECT_EQ(result.total_chunks, 3u);
    EXPECT_EQ(result.completed_chunks, 3u);
    EXPECT_EQ(result.bytes_transferred, 10 * MiB);
    EXPECT_FALSE(result.etag.empty());
    EXPECT_EQ(read_destination(), payload_);
    EXPECT_EQ(ranged_gets(), (std::multiset<uint64_t>{0, 4194304, 8388608}));
    EXPECT_FALSE(record_exists());

    auto events = progress.drain();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, progress_event_kind::transfer_completed);
}

TEST_F(MultipartDownloadManagerTest, ConcurrencyIsCapped) {
    backend_->set_latency(std::chrono::milliseconds(20));
    download_options options;
    options.chunk_size = 1 * MiB;
    options.max_parallel = 64;

    auto result = manager_->download("media", "video.mp4", destination_, options);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.total_chunks, 10u);
    EXPECT_LE(backend_->max_concurrency(), max_parallel_downloads_limit);
}

TEST_F(MultipartDownloadManagerTest, RangeFailureIsRetried) {
    backend_->fail_range(8388608, 2, 503);

    auto result = manager_->download("media", "video.mp4", destination_);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(ranged_gets().count(8388608), 3u);
    EXPECT_EQ(read_destination(), payload_);
}

TEST_F(MultipartDownloadManagerTest, ServerIgnoringRangeStillWorks) {
    backend_->set_ignore_range(true);

    auto result = manager_->download("media", "video.mp4", destination_);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(read_destination(), payload_);
}

TEST_F(MultipartDownloadManagerTest, MissingObjectFails) {
    auto result = manager_->download("media", "absent.bin", destination_);

    EXPECT_FALSE(result.success());
    ASSERT_TRUE(result.failure);
    EXPECT_EQ(result.failure->code, error_code::object_not_found);
    EXPECT_FALSE(std::filesystem::exists(destination_));
}

TEST_F(MultipartDownloadManagerTest, EmptyObjectCreatesEmptyFile) {
    backend_->put("media", "empty.bin", std::vector<uint8_t>{});

    auto result = manager_->download("media", "empty.bin", destination_);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.total_chunks, 0u);
    ASSERT_TRUE(std::filesystem::exists(destination_));
    EXPECT_EQ(std::filesystem::file_size(destination_), 0u);
}

TEST_F(MultipartDownloadManagerTest, ResumeFetchesOnlyMissingRanges) {
    download_options options;
    auto first = interrupted_run(options);
    ASSERT_FALSE(first.success());
    EXPECT_EQ(first.completed_chunks, 1u);
    ASSERT_TRUE(record_exists());

    backend_->clear_requests();
    auto second = manager_->download("media", "video.mp4", destination_, options);

    ASSERT_TRUE(second.success()) << second.failure->message;
    EXPECT_TRUE(second.was_resumed);
    EXPECT_EQ(second.bytes_transferred, 6 * MiB);
    EXPECT_EQ(ranged_gets(), (std::multiset<uint64_t>{4194304, 8388608}));
    EXPECT_EQ(read_destination(), payload_);
    EXPECT_FALSE(record_exists());
}

TEST_F(MultipartDownloadManagerTest, ChangedObjectInvalidatesResume) {
    download_options options;
    ASSERT_FALSE(interrupted_run(options).success());

    auto replacement = make_payload(10 * MiB, 99);
    backend_->put("media", "video.mp4", replacement);
    backend_->clear_requests();

    auto second = manager_->download("media", "video.mp4", destination_, options);

    ASSERT_TRUE(second.success());
    EXPECT_FALSE(second.was_resumed);
    EXPECT_TRUE(second.resume_invalidated);
    EXPECT_EQ(ranged_gets(), (std::multiset<uint64_t>{0, 4194304, 8388608}));
    EXPECT_EQ(read_destination(), replacement);
}

TEST_F(MultipartDownloadManagerTest, TruncatedDestinationInvalidatesResume) {
    download_options options;
    ASSERT_FALSE(interrupted_run(options).success());

    std::filesystem::resize_file(destination_, 1024);
    auto second = manager_->download("media", "video.mp4", destination_, options);

    ASSERT_TRUE(second.success());
    EXPECT_TRUE(second.resume_invalidated);
    EXPECT_EQ(read_destination(), payload_);
}

TEST_F(MultipartDownloadManagerTest, CancellationLeavesResumeRecord) {
    download_options options;
    options.max_parallel = 1;
    backend_->set_on_request([&options](const http_request& request) {
        if (request.headers.count("Range") != 0) {
            options.cancel.cancel();
        }
    });

    auto result = manager_->download("media", "video.mp4", destination_, options);

    ASSERT_TRUE(result.failure);
    EXPECT_EQ(result.failure->code, error_code::transfer_cancelled);
    EXPECT_TRUE(record_exists());
}

}  // namespace kcenon::object_storage::test
