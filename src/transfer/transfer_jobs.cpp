/**
 * @file transfer_jobs.cpp
 * @brief Implementation of chunk job types for thread_system integration
 */

#include "kcenon/object_storage/transfer/transfer_jobs.h"

#include "kcenon/object_storage/core/error_codes.h"
#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/storage/storage_client.h"

#include <kcenon/thread/core/error_handling.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <fstream>

namespace kcenon::object_storage {

namespace {

auto make_event(progress_event_kind kind,
                const chunk_batch& batch,
                uint32_t index,
                uint64_t bytes,
                uint64_t total,
                std::string message = {}) -> progress_event {
    progress_event event;
    event.kind = kind;
    event.key = batch.key;
    event.chunk_index = index;
    event.bytes_transferred = bytes;
    event.total_bytes = total;
    event.message = std::move(message);
    return event;
}

}  // namespace

// ----------------------------------------------------------------------------
// chunk_batch implementation
// ----------------------------------------------------------------------------

void chunk_batch::post(progress_event event) const noexcept {
    if (progress) {
        progress->enqueue(std::move(event));
    }
}

void chunk_batch::fail(const error& err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            failure_ = err;
        }
    }
    stopped_.store(true);
}

auto chunk_batch::failure() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

void chunk_batch::job_added() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++outstanding_;
}

void chunk_batch::job_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ > 0) {
            --outstanding_;
        }
    }
    cv_.notify_all();
}

void chunk_batch::wait(std::chrono::milliseconds poll_interval,
                       const std::function<void()>& on_tick) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (outstanding_ > 0) {
        if (cv_.wait_for(lock, poll_interval, [this] { return outstanding_ == 0; })) {
            break;
        }
        if (on_tick) {
            lock.unlock();
            on_tick();
            lock.lock();
        }
    }
}

// ----------------------------------------------------------------------------
// chunk_job_base implementation
// ----------------------------------------------------------------------------

chunk_job_base::chunk_job_base(const std::string& name,
                               std::shared_ptr<chunk_batch> batch,
                               uint32_t index,
                               std::string_view category)
    : kcenon::thread::job(name)
    , batch_(std::move(batch))
    , index_(index)
    , category_(category) {}

chunk_job_base::~chunk_job_base() {
    // Jobs dropped from the queue without running still count as finished.
    if (batch_) {
        batch_->job_finished();
    }
}

auto chunk_job_base::run_attempts(const std::function<result<void>()>& attempt)
    -> common::VoidResult {
    auto& ledger = *batch_->ledger;
    const auto total = ledger.range(index_).length;

    for (std::size_t tries = 0;; ++tries) {
        if (batch_->cancel.is_cancelled()) {
            ledger.mark_failed(index_, error{error_code::transfer_cancelled});
            return thread::make_error_result(
                thread::error_code::operation_canceled,
                "Chunk " + std::to_string(index_) + " cancelled");
        }

        auto outcome = attempt();
        if (outcome) {
            return common::ok();
        }

        const auto& err = outcome.error();
        const bool retryable = is_retryable(err);
        if (!retryable || tries >= batch_->max_retries) {
            error final_error = err;
            if (retryable) {
                final_error = error{error_code::chunk_retries_exhausted,
                    "chunk " + std::to_string(index_) + " failed after " +
                    std::to_string(tries + 1) + " attempts: " + err.message};
                final_error.detail = err.detail;
            }

            transfer_log_context ctx;
            ctx.bucket = batch_->bucket;
            ctx.key = batch_->key;
            ctx.chunk_index = index_;
            ctx.error_message = final_error.message;
            if (err.detail) {
                ctx.http_status = err.detail->http_status;
                ctx.request_id = err.detail->request_id;
            }
            OBJSTORE_LOG_ERROR_CTX(category_, "Chunk failed", ctx);

            ledger.mark_failed(index_, final_error);
            batch_->post(make_event(progress_event_kind::chunk_failed, *batch_, index_,
                                    0, total, final_error.message));
            batch_->fail(final_error);
            return thread::make_error_result(
                thread::error_code::job_execution_failed, final_error.message);
        }

        auto retries = ledger.record_retry(index_, err);
        OBJSTORE_LOG_WARN(category_,
            "Chunk " + std::to_string(index_) + " attempt " + std::to_string(retries) +
            " failed (" + err.message + "), retrying");
    }
}

// ----------------------------------------------------------------------------
// part_upload_job implementation
// ----------------------------------------------------------------------------

part_upload_job::part_upload_job(std::shared_ptr<chunk_batch> batch, uint32_t index)
    : chunk_job_base("part_upload_job", std::move(batch), index, log_category::upload) {}

auto part_upload_job::do_work() -> common::VoidResult {
    if (batch_->should_stop()) {
        return thread::make_error_result(
            thread::error_code::operation_canceled,
            "Part upload skipped, transfer is stopping");
    }

    auto& ledger = *batch_->ledger;
    const auto range = ledger.range(index_);
    const auto part_number = index_ + 1;

    ledger.mark_in_flight(index_);
    batch_->post(make_event(progress_event_kind::chunk_started, *batch_, index_,
                            0, range.length));

    std::ifstream file(batch_->local_path, std::ios::binary);
    if (!file) {
        error err{error_code::file_access_denied,
            "cannot open " + batch_->local_path.string() + " for reading"};
        OBJSTORE_LOG_ERROR(log_category::upload,
            "Part " + std::to_string(part_number) + " failed: " + err.message);
        ledger.mark_failed(index_, err);
        batch_->post(make_event(progress_event_kind::chunk_failed, *batch_, index_,
                                0, range.length, err.message));
        batch_->fail(err);
        return thread::make_error_result(
            thread::error_code::job_execution_failed, err.message);
    }

    std::vector<uint8_t> buffer(static_cast<std::size_t>(range.length));

    return run_attempts([&]() -> result<void> {
        file.clear();
        file.seekg(static_cast<std::streamoff>(range.offset));
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        if (file.bad()) {
            return unexpected{error{error_code::file_read_error,
                "read failed for part " + std::to_string(part_number)}};
        }
        if (static_cast<uint64_t>(file.gcount()) != range.length) {
            return unexpected{error{error_code::size_mismatch,
                "short read for part " + std::to_string(part_number) + ": " +
                std::to_string(file.gcount()) + " of " + std::to_string(range.length) +
                " bytes"}};
        }

        auto part = batch_->storage->upload_part(
            batch_->bucket, batch_->key, batch_->upload_id, part_number, buffer,
            [this, &range](uint64_t sent) {
                batch_->post(make_event(progress_event_kind::chunk_progress, *batch_,
                                        index_, sent, range.length));
            });
        if (!part) {
            return unexpected{part.error()};
        }

        ledger.mark_completed(index_, part.value().etag, part.value().md5);
        batch_->bytes_this_run.fetch_add(range.length);
        batch_->completed_this_run.fetch_add(1);
        batch_->post(make_event(progress_event_kind::chunk_completed, *batch_, index_,
                                range.length, range.length));

        OBJSTORE_LOG_DEBUG(log_category::upload,
            "Part " + std::to_string(part_number) + " uploaded (" +
            std::to_string(range.length) + " bytes, etag " + part.value().etag + ")");
        return {};
    });
}

// ----------------------------------------------------------------------------
// range_download_job implementation
// ----------------------------------------------------------------------------

range_download_job::range_download_job(std::shared_ptr<chunk_batch> batch, uint32_t index)
    : chunk_job_base("range_download_job", std::move(batch), index, log_category::download) {}

auto range_download_job::do_work() -> common::VoidResult {
    if (batch_->should_stop()) {
        return thread::make_error_result(
            thread::error_code::operation_canceled,
            "Range download skipped, transfer is stopping");
    }

    auto& ledger = *batch_->ledger;
    const auto range = ledger.range(index_);

    ledger.mark_in_flight(index_);
    batch_->post(make_event(progress_event_kind::chunk_started, *batch_, index_,
                            0, range.length));

    return run_attempts([&]() -> result<void> {
        auto data = batch_->storage->get_object_range(batch_->bucket, batch_->key, range);
        if (!data) {
            return unexpected{data.error()};
        }
        if (data.value().size() != range.length) {
            return unexpected{error{error_code::size_mismatch,
                "range " + std::to_string(range.offset) + "-" + std::to_string(range.last()) +
                " returned " + std::to_string(data.value().size()) + " bytes"}};
        }

        // Each job opens its own handle and writes at an absolute offset.
        std::fstream out(batch_->local_path, std::ios::in | std::ios::out | std::ios::binary);
        if (!out) {
            return unexpected{error{error_code::file_write_error,
                "cannot open " + batch_->local_path.string() + " for writing"}};
        }
        out.seekp(static_cast<std::streamoff>(range.offset));
        out.write(reinterpret_cast<const char*>(data.value().data()),
                  static_cast<std::streamsize>(data.value().size()));
        out.flush();
        if (!out) {
            return unexpected{error{error_code::file_write_error,
                "write failed at offset " + std::to_string(range.offset)}};
        }

        ledger.mark_completed(index_);
        batch_->bytes_this_run.fetch_add(range.length);
        batch_->completed_this_run.fetch_add(1);
        batch_->post(make_event(progress_event_kind::chunk_completed, *batch_, index_,
                                range.length, range.length));

        OBJSTORE_LOG_TRACE(log_category::download,
            "Range " + std::to_string(range.offset) + "-" + std::to_string(range.last()) +
            " written");
        return {};
    });
}

// ----------------------------------------------------------------------------
// Pool driver
// ----------------------------------------------------------------------------

auto run_chunk_jobs(
    const std::shared_ptr<chunk_batch>& batch,
    const std::vector<uint32_t>& indices,
    std::size_t max_parallel,
    const std::string& pool_name,
    const std::function<std::unique_ptr<kcenon::thread::job>(uint32_t)>& make_job,
    std::chrono::milliseconds poll_interval,
    const std::function<void()>& on_tick) -> result<void> {
    if (indices.empty()) {
        return {};
    }

    const auto workers = std::clamp<std::size_t>(max_parallel, 1, indices.size());
    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (std::size_t i = 0; i < workers; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto added = pool->enqueue(std::move(worker));
        if (!added.is_ok()) {
            return unexpected{error{error_code::internal_error,
                "failed to add worker to " + pool_name}};
        }
    }

    auto started = pool->start();
    if (started.is_err()) {
        return unexpected{error{error_code::internal_error,
            "failed to start " + pool_name}};
    }

    OBJSTORE_LOG_DEBUG(log_category::client,
        pool_name + " started with " + std::to_string(workers) + " workers for " +
        std::to_string(indices.size()) + " chunks");

    for (auto index : indices) {
        if (batch->should_stop()) {
            break;
        }
        batch->job_added();
        auto enqueued = pool->enqueue(make_job(index));
        if (!enqueued.is_ok()) {
            batch->fail(error{error_code::internal_error,
                "failed to enqueue job for chunk " + std::to_string(index)});
            break;
        }
    }

    batch->wait(poll_interval, on_tick);

    auto stopped = pool->stop(false);
    if (stopped.is_err()) {
        OBJSTORE_LOG_WARN(log_category::client, "Failed to stop " + pool_name + " cleanly");
    }
    return {};
}

}  // namespace kcenon::object_storage
