/**
 * @file multipart_upload_manager.cpp
 * @brief Implementation of multipart_upload_manager
 */

#include "kcenon/object_storage/transfer/multipart_upload_manager.h"

#include "kcenon/object_storage/core/error_codes.h"
#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/storage/storage_client.h"
#include "kcenon/object_storage/transfer/chunk_plan.h"
#include "kcenon/object_storage/transfer/resume_store.h"
#include "kcenon/object_storage/transfer/transfer_jobs.h"

#include <sstream>

namespace kcenon::object_storage {

namespace {

auto make_context(const upload_result& out) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.bucket = out.bucket;
    ctx.key = out.key;
    if (!out.upload_id.empty()) {
        ctx.upload_id = out.upload_id;
    }
    ctx.total_size = out.total_size;
    ctx.total_chunks = out.total_parts;
    return ctx;
}

/**
 * @brief Why a prior state cannot be resumed, or empty when it can
 */
auto resume_mismatch(const transfer_state& prior,
                     const std::string& bucket,
                     const std::string& key,
                     const transfer_fingerprint& fingerprint,
                     uint64_t chunk_size) -> std::string {
    if (prior.direction != transfer_direction::upload) {
        return "direction differs";
    }
    if (prior.bucket != bucket || prior.key != key) {
        return "bucket or key differs";
    }
    if (!(prior.fingerprint == fingerprint)) {
        return "source file changed";
    }
    if (prior.chunk_size != chunk_size) {
        return "chunk size differs";
    }
    if (prior.upload_id.empty()) {
        return "no upload id";
    }
    if (prior.total_size != fingerprint.size || !prior.is_consistent()) {
        return "chunk layout is inconsistent";
    }
    return {};
}

}  // namespace

multipart_upload_manager::multipart_upload_manager(storage_client& storage,
                                                   resume_store* store,
                                                   connection_options options)
    : storage_(storage), store_(store), options_(std::move(options)) {}

auto multipart_upload_manager::upload(const std::string& bucket,
                                      const std::string& key,
                                      const std::filesystem::path& local_path,
                                      const upload_options& options,
                                      progress_collector* progress,
                                      std::optional<transfer_state> prior) -> upload_result {
    const auto started = std::chrono::steady_clock::now();
    const bool persist = store_ != nullptr && options_.enable_resume;

    upload_result out;
    out.bucket = bucket;
    out.key = key;
    out.local_path = local_path;

    auto finish = [&](std::optional<error> failure, multipart_upload_state final_state) {
        out.state = final_state;
        out.failure = std::move(failure);
        out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        out.average_throughput = throughput(out.bytes_transferred, out.duration);

        auto ctx = make_context(out);
        ctx.bytes_transferred = out.bytes_transferred;
        ctx.duration_ms = static_cast<uint64_t>(out.duration.count());
        ctx.rate_mbps = out.average_throughput / (1024.0 * 1024.0);
        if (out.failure) {
            ctx.error_message = out.failure->message;
            OBJSTORE_LOG_ERROR_CTX(log_category::upload,
                std::string("Upload ended in state ") + to_string(final_state), ctx);
        } else {
            OBJSTORE_LOG_INFO_CTX(log_category::upload, "Upload completed", ctx);
        }
        return out;
    };

    // ------------------------------------------------------------------------
    // Validate
    // ------------------------------------------------------------------------

    auto fingerprint = transfer_fingerprint::of_local_file(local_path);
    if (!fingerprint) {
        return finish(fingerprint.error(), multipart_upload_state::failed);
    }

    const auto total_size = fingerprint.value().size;
    const auto chunk_size = effective_upload_chunk_size(
        total_size, options.chunk_size != 0 ? options.chunk_size : options_.upload_chunk_size);
    const auto max_parallel = clamp_parallelism(
        options.max_parallel != 0 ? options.max_parallel : options_.max_parallel_uploads,
        max_parallel_uploads_limit);
    const auto max_retries = options.max_retries.value_or(options_.max_retries);

    out.total_size = total_size;
    out.chunk_size = chunk_size;

    put_object_options put_options;
    put_options.content_type = options.content_type;
    put_options.metadata = options.metadata;

    // Empty sources cannot be uploaded as parts.
    if (total_size == 0) {
        std::istringstream empty;
        auto etag = storage_.put_object(bucket, key, empty, put_options);
        if (!etag) {
            return finish(etag.error(), multipart_upload_state::failed);
        }
        out.etag = etag.value();
        if (persist) {
            auto removed = store_->remove(bucket, key, local_path, transfer_direction::upload);
            if (!removed) {
                OBJSTORE_LOG_WARN(log_category::upload, removed.error().message);
            }
        }
        return finish(std::nullopt, multipart_upload_state::completed);
    }

    // ------------------------------------------------------------------------
    // Resume check
    // ------------------------------------------------------------------------

    if (!prior && persist && options.resume) {
        prior = store_->load(bucket, key, local_path, transfer_direction::upload);
    }

    transfer_state state;
    if (prior) {
        auto mismatch = resume_mismatch(*prior, bucket, key, fingerprint.value(), chunk_size);
        if (mismatch.empty()) {
            state = std::move(*prior);
            state.reset_interrupted();
            out.was_resumed = true;
            out.upload_id = state.upload_id;
            OBJSTORE_LOG_INFO(log_category::upload,
                "Resuming upload " + state.upload_id + " of " + bucket + "/" + key +
                " with " + std::to_string(state.completed_count()) + "/" +
                std::to_string(state.chunks.size()) + " parts done");
        } else {
            OBJSTORE_LOG_WARN(log_category::upload,
                "Discarding resume data for " + bucket + "/" + key + ": " + mismatch);
            out.resume_invalidated = true;
            // A record for another object still belongs to that object's transfer
            const bool same_object = prior->bucket == bucket && prior->key == key;
            if (same_object && !prior->upload_id.empty()) {
                auto aborted = storage_.abort_multipart_upload(bucket, key, prior->upload_id);
                if (!aborted) {
                    OBJSTORE_LOG_DEBUG(log_category::upload,
                        "Stale upload " + prior->upload_id + " not aborted: " +
                        aborted.error().message);
                }
            }
            if (persist && same_object) {
                auto removed = store_->remove(*prior);
                if (!removed) {
                    OBJSTORE_LOG_WARN(log_category::upload, removed.error().message);
                }
            }
        }
    }

    if (!out.was_resumed) {
        state = transfer_state::create(bucket, key, local_path, transfer_direction::upload,
                                       total_size, chunk_size, fingerprint.value());
    }
    out.total_parts = static_cast<uint32_t>(state.chunks.size());

    auto checkpoint = [&](const transfer_state& snapshot) {
        if (!persist) {
            return;
        }
        auto saved = store_->save(snapshot);
        if (!saved) {
            OBJSTORE_LOG_WARN(log_category::upload,
                "Checkpoint failed: " + saved.error().message);
        }
    };

    // ------------------------------------------------------------------------
    // Initiate
    // ------------------------------------------------------------------------

    if (!out.was_resumed) {
        auto upload_id = storage_.initiate_multipart_upload(bucket, key, put_options);
        if (!upload_id) {
            error err{error_code::multipart_initiate_failed,
                "cannot start multipart upload: " + upload_id.error().message};
            err.detail = upload_id.error().detail;
            return finish(err, multipart_upload_state::failed);
        }
        state.upload_id = upload_id.value();
        out.upload_id = state.upload_id;
        auto ctx = make_context(out);
        OBJSTORE_LOG_INFO_CTX(log_category::upload, "Multipart upload initiated", ctx);
    }
    out.state = multipart_upload_state::initiated;
    checkpoint(state);

    // ------------------------------------------------------------------------
    // Upload parts
    // ------------------------------------------------------------------------

    out.state = multipart_upload_state::uploading;
    chunk_ledger ledger(state);

    auto batch = std::make_shared<chunk_batch>();
    batch->storage = &storage_;
    batch->ledger = &ledger;
    batch->progress = progress;
    batch->bucket = bucket;
    batch->key = key;
    batch->upload_id = state.upload_id;
    batch->local_path = local_path;
    batch->total_size = total_size;
    batch->max_retries = max_retries;
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
        batch, state.pending_indices(), max_parallel, "multipart_upload_pool",
        [&batch](uint32_t index) -> std::unique_ptr<kcenon::thread::job> {
            return std::make_unique<part_upload_job>(batch, index);
        },
        options_.poll_interval, on_tick);

    out.bytes_transferred = batch->bytes_this_run.load();
    out.completed_parts = state.completed_count();

    std::optional<error> failure;
    if (!ran) {
        failure = ran.error();
    } else if (auto chunk_failure = batch->failure()) {
        failure = std::move(chunk_failure);
    } else if (options.cancel.is_cancelled()) {
        failure = error{error_code::transfer_cancelled, "upload cancelled"};
    } else if (!state.is_complete()) {
        failure = error{error_code::incomplete_transfer,
            std::to_string(out.completed_parts) + " of " + std::to_string(out.total_parts) +
            " parts uploaded"};
    }

    if (failure) {
        if (options.abort_on_failure) {
            auto aborted = abort_upload(state);
            if (!aborted) {
                OBJSTORE_LOG_WARN(log_category::upload,
                    "Abort after failure did not succeed: " + aborted.error().message);
                checkpoint(state);
                return finish(failure, multipart_upload_state::failed);
            }
            return finish(failure, multipart_upload_state::aborted);
        }
        checkpoint(state);
        return finish(failure, multipart_upload_state::failed);
    }

    // ------------------------------------------------------------------------
    // Complete
    // ------------------------------------------------------------------------

    out.state = multipart_upload_state::completing;
    result<std::string> completed = unexpected{error{error_code::internal_error}};
    for (std::size_t attempt = 0; attempt <= max_retries; ++attempt) {
        completed = storage_.complete_multipart_upload(bucket, key, state.upload_id,
                                                       state.completed_parts());
        if (completed || !is_retryable(completed.error())) {
            break;
        }
        OBJSTORE_LOG_WARN(log_category::upload,
            "CompleteMultipartUpload attempt " + std::to_string(attempt + 1) +
            " failed: " + completed.error().message);
    }

    if (!completed) {
        error err{error_code::multipart_complete_failed,
            "cannot complete multipart upload: " + completed.error().message};
        err.detail = completed.error().detail;
        checkpoint(state);
        return finish(err, multipart_upload_state::failed);
    }

    out.etag = completed.value();
    if (persist) {
        auto removed = store_->remove(state);
        if (!removed) {
            OBJSTORE_LOG_WARN(log_category::upload, removed.error().message);
        }
    }

    progress_event done;
    done.kind = progress_event_kind::transfer_completed;
    done.key = key;
    done.bytes_transferred = total_size;
    done.total_bytes = total_size;
    if (progress) {
        progress->enqueue(std::move(done));
    }

    return finish(std::nullopt, multipart_upload_state::completed);
}

auto multipart_upload_manager::abort_upload(const transfer_state& state) -> result<void> {
    if (state.upload_id.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "state has no upload id to abort"}};
    }

    auto aborted = storage_.abort_multipart_upload(state.bucket, state.key, state.upload_id);
    if (!aborted) {
        return aborted;
    }

    if (store_ != nullptr) {
        auto removed = store_->remove(state);
        if (!removed) {
            return removed;
        }
    }
    return {};
}

}  // namespace kcenon::object_storage
