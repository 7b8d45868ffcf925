/**
 * @file multipart_download_manager.cpp
 * @brief Implementation of multipart_download_manager
 */

#include "kcenon/object_storage/transfer/multipart_download_manager.h"

#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/storage/storage_client.h"
#include "kcenon/object_storage/transfer/chunk_plan.h"
#include "kcenon/object_storage/transfer/resume_store.h"
#include "kcenon/object_storage/transfer/transfer_jobs.h"
#include "kcenon/object_storage/transfer/transfer_state.h"

#include <fstream>
#include <system_error>

namespace kcenon::object_storage {

namespace {

auto resumable(const transfer_state& prior,
               const transfer_fingerprint& fingerprint,
               uint64_t chunk_size,
               const std::filesystem::path& destination) -> bool {
    if (prior.direction != transfer_direction::download ||
        !(prior.fingerprint == fingerprint) ||
        prior.chunk_size != chunk_size ||
        prior.total_size != fingerprint.size ||
        !prior.is_consistent()) {
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(destination, ec)) {
        return false;
    }
    auto size = std::filesystem::file_size(destination, ec);
    return !ec && size == fingerprint.size;
}

/**
 * @brief Create (or truncate) the destination and size it to the object
 */
auto preallocate(const std::filesystem::path& destination, uint64_t size) -> result<void> {
    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                "cannot create directory " + destination.parent_path().string() + ": " +
                ec.message()}};
        }
    }

    {
        std::ofstream file(destination, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected{error{error_code::file_access_denied,
                "cannot create " + destination.string()}};
        }
    }

    std::filesystem::resize_file(destination, size, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
            "cannot preallocate " + destination.string() + ": " + ec.message()}};
    }
    return {};
}

}  // namespace

multipart_download_manager::multipart_download_manager(storage_client& storage,
                                                       resume_store* store,
                                                       connection_options options)
    : storage_(storage), store_(store), options_(std::move(options)) {}

auto multipart_download_manager::download(const std::string& bucket,
                                          const std::string& key,
                                          const std::filesystem::path& destination,
                                          const download_options& options,
                                          progress_collector* progress) -> download_result {
    const auto started = std::chrono::steady_clock::now();
    const bool persist = store_ != nullptr && options_.enable_resume;

    download_result out;
    out.bucket = bucket;
    out.key = key;
    out.destination = destination;

    auto finish = [&](std::optional<error> failure) {
        out.failure = std::move(failure);
        out.completed = !out.failure;
        out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        out.average_throughput = throughput(out.bytes_transferred, out.duration);

        transfer_log_context ctx;
        ctx.bucket = bucket;
        ctx.key = key;
        ctx.total_size = out.total_size;
        ctx.total_chunks = out.total_chunks;
        ctx.bytes_transferred = out.bytes_transferred;
        ctx.duration_ms = static_cast<uint64_t>(out.duration.count());
        ctx.rate_mbps = out.average_throughput / (1024.0 * 1024.0);
        if (out.failure) {
            ctx.error_message = out.failure->message;
            OBJSTORE_LOG_ERROR_CTX(log_category::download, "Download failed", ctx);
        } else {
            OBJSTORE_LOG_INFO_CTX(log_category::download, "Download completed", ctx);
        }
        return out;
    };

    auto checkpoint = [&](const transfer_state& snapshot) {
        if (!persist) {
            return;
        }
        auto saved = store_->save(snapshot);
        if (!saved) {
            OBJSTORE_LOG_WARN(log_category::download,
                "Checkpoint failed: " + saved.error().message);
        }
    };

    auto forget = [&](const transfer_state& state) {
        if (!persist) {
            return;
        }
        auto removed = store_->remove(state);
        if (!removed) {
            OBJSTORE_LOG_WARN(log_category::download, removed.error().message);
        }
    };

    auto head = storage_.head_object(bucket, key);
    if (!head) {
        return finish(head.error());
    }
    if (!head.value()) {
        return finish(error{error_code::object_not_found, bucket + "/" + key + " does not exist"});
    }

    const auto& object = *head.value();
    const auto fingerprint = transfer_fingerprint::of_object(object);
    const auto total_size = object.size;
    const auto chunk_size = effective_download_chunk_size(
        options.chunk_size != 0 ? options.chunk_size : options_.download_chunk_size);
    const auto max_parallel = clamp_parallelism(
        options.max_parallel != 0 ? options.max_parallel : options_.max_parallel_downloads,
        max_parallel_downloads_limit);

    out.etag = object.etag;
    out.total_size = total_size;
    out.chunk_size = chunk_size;

    // Resume check
    transfer_state state;
    if (persist && options.resume) {
        if (auto prior = store_->load(bucket, key, destination, transfer_direction::download)) {
            if (resumable(*prior, fingerprint, chunk_size, destination)) {
                state = std::move(*prior);
                state.reset_interrupted();
                out.was_resumed = true;
                OBJSTORE_LOG_INFO(log_category::download,
                    "Resuming download of " + bucket + "/" + key + " with " +
                    std::to_string(state.completed_count()) + "/" +
                    std::to_string(state.chunks.size()) + " ranges done");
            } else {
                OBJSTORE_LOG_WARN(log_category::download,
                    "Discarding resume data for " + bucket + "/" + key +
                    ": object or destination changed");
                out.resume_invalidated = true;
                forget(*prior);
            }
        }
    }

    if (!out.was_resumed) {
        auto prepared = preallocate(destination, total_size);
        if (!prepared) {
            return finish(prepared.error());
        }
        state = transfer_state::create(bucket, key, destination, transfer_direction::download,
                                       total_size, chunk_size, fingerprint);
    }
    out.total_chunks = static_cast<uint32_t>(state.chunks.size());

    if (total_size == 0) {
        forget(state);
        return finish(std::nullopt);
    }

    checkpoint(state);

    chunk_ledger ledger(state);

    auto batch = std::make_shared<chunk_batch>();
    batch->storage = &storage_;
    batch->ledger = &ledger;
    batch->progress = progress;
    batch->bucket = bucket;
    batch->key = key;
    batch->local_path = destination;
    batch->total_size = total_size;
    batch->max_retries = options.max_retries.value_or(options_.max_retries);
    batch->cancel = options.cancel;

    uint32_t last_checkpoint = 0;
    auto on_tick = [&] {
        if (options.on_poll && progress) {
            options.on_poll(*progress);
        }
        auto done = batch->completed_this_run.load();
        if (done - last_checkpoint >= options_.checkpoint_interval) {
            last_checkpoint = done;
            checkpoint(ledger.snapshot());
        }
    };

    auto ran = run_chunk_jobs(
        batch, state.pending_indices(), max_parallel, "multipart_download_pool",
        [&batch](uint32_t index) -> std::unique_ptr<kcenon::thread::job> {
            return std::make_unique<range_download_job>(batch, index);
        },
        options_.poll_interval, on_tick);

    out.bytes_transferred = batch->bytes_this_run.load();
    out.completed_chunks = state.completed_count();

    std::optional<error> failure;
    if (!ran) {
        failure = ran.error();
    } else if (auto chunk_failure = batch->failure()) {
        failure = std::move(chunk_failure);
    } else if (options.cancel.is_cancelled()) {
        failure = error{error_code::transfer_cancelled, "download cancelled"};
    } else if (!state.is_complete()) {
        failure = error{error_code::incomplete_transfer,
            std::to_string(out.completed_chunks) + " of " + std::to_string(out.total_chunks) +
            " ranges downloaded"};
    }

    if (failure) {
        checkpoint(state);
        return finish(failure);
    }

    forget(state);

    if (progress) {
        progress_event done;
        done.kind = progress_event_kind::transfer_completed;
        done.key = key;
        done.bytes_transferred = total_size;
        done.total_bytes = total_size;
        progress->enqueue(std::move(done));
    }

    return finish(std::nullopt);
}

}  // namespace kcenon::object_storage
