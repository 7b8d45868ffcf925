/**
 * @file transfer_jobs.h
 * @brief Chunk job types for thread_system integration
 *
 * Defines job classes that inherit from kcenon::thread::job and move one
 * chunk each through a storage_client:
 * - part_upload_job: reads a byte range of the source and uploads it as a part
 * - range_download_job: fetches a byte range and writes it at its offset
 *
 * Jobs of one transfer share a chunk_batch, which owns the retry budget,
 * the failure/stop flag and the outstanding-job count the waiting thread
 * blocks on.
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_JOBS_H
#define KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_JOBS_H

#include "kcenon/object_storage/config/client_config.h"
#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/transfer/progress_collector.h"
#include "kcenon/object_storage/transfer/transfer_state.h"

#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/job.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_storage {

class storage_client;

/**
 * @brief Shared context for the chunk jobs of one transfer
 */
struct chunk_batch {
    storage_client* storage = nullptr;
    chunk_ledger* ledger = nullptr;
    progress_collector* progress = nullptr;   ///< optional

    std::string bucket;
    std::string key;
    std::string upload_id;                    ///< uploads only
    std::filesystem::path local_path;
    uint64_t total_size = 0;

    /// Extra attempts after a transient failure
    std::size_t max_retries = 3;

    cancellation_token cancel;

    /// Bytes moved by this run, excluding chunks completed earlier
    std::atomic<uint64_t> bytes_this_run{0};

    /// Chunks completed by this run
    std::atomic<uint32_t> completed_this_run{0};

    /**
     * @brief Post a progress event if a collector is attached
     */
    void post(progress_event event) const noexcept;

    /**
     * @brief Record a chunk failure that ends the transfer
     *
     * The first failure wins; later ones are dropped. Jobs that have
     * not started yet see should_stop() and leave their chunk pending.
     */
    void fail(const error& err);

    [[nodiscard]] auto should_stop() const -> bool {
        return cancel.is_cancelled() || stopped_.load();
    }

    [[nodiscard]] auto failure() const -> std::optional<error>;

    /// Register a job about to be enqueued
    void job_added();

    /// Called exactly once per registered job, whether or not it ran
    void job_finished();

    /**
     * @brief Block until every registered job has finished
     *
     * Wakes every poll_interval to run on_tick on the calling thread.
     */
    void wait(std::chrono::milliseconds poll_interval, const std::function<void()>& on_tick);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t outstanding_ = 0;
    std::optional<error> failure_;
    std::atomic<bool> stopped_{false};
};

/**
 * @brief Base for jobs that own one chunk index
 */
class chunk_job_base : public kcenon::thread::job {
public:
    ~chunk_job_base() override;

    [[nodiscard]] auto index() const -> uint32_t { return index_; }

protected:
    chunk_job_base(const std::string& name,
                   std::shared_ptr<chunk_batch> batch,
                   uint32_t index,
                   std::string_view category);

    /**
     * @brief Run attempt until it succeeds, fails permanently or runs out of retries
     *
     * Transient errors are retried on the same index without sleeping.
     * The final error is recorded on the ledger and the batch.
     */
    auto run_attempts(const std::function<result<void>()>& attempt) -> common::VoidResult;

    std::shared_ptr<chunk_batch> batch_;
    uint32_t index_;
    std::string_view category_;
};

/**
 * @brief Upload one part of a multipart upload
 */
class part_upload_job : public chunk_job_base {
public:
    part_upload_job(std::shared_ptr<chunk_batch> batch, uint32_t index);

    auto do_work() -> common::VoidResult override;
};

/**
 * @brief Download one byte range into the preallocated destination
 */
class range_download_job : public chunk_job_base {
public:
    range_download_job(std::shared_ptr<chunk_batch> batch, uint32_t index);

    auto do_work() -> common::VoidResult override;
};

/**
 * @brief Run one job per index on a dedicated thread pool and wait for all of them
 *
 * The pool gets min(max_parallel, indices.size()) workers and is stopped
 * before returning. Errors here concern the pool itself; chunk failures
 * are reported through the batch.
 *
 * @param make_job Creates the job for an index
 */
[[nodiscard]] auto run_chunk_jobs(
    const std::shared_ptr<chunk_batch>& batch,
    const std::vector<uint32_t>& indices,
    std::size_t max_parallel,
    const std::string& pool_name,
    const std::function<std::unique_ptr<kcenon::thread::job>(uint32_t)>& make_job,
    std::chrono::milliseconds poll_interval,
    const std::function<void()>& on_tick) -> result<void>;

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_JOBS_H
