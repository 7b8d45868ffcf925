/**
 * @file multipart_upload_manager.h
 * @brief Parallel, resumable multipart uploads
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_MULTIPART_UPLOAD_MANAGER_H
#define KCENON_OBJECT_STORAGE_TRANSFER_MULTIPART_UPLOAD_MANAGER_H

#include "kcenon/object_storage/config/client_config.h"
#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/transfer/progress_collector.h"
#include "kcenon/object_storage/transfer/transfer_result.h"
#include "kcenon/object_storage/transfer/transfer_state.h"

#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::object_storage {

class resume_store;
class storage_client;

/**
 * @brief Uploads a local file as a multipart upload on a per-call worker pool
 *
 * Each call validates the source, reuses a matching resume record when one
 * exists, uploads the pending parts in parallel and completes the upload.
 * On failure the upload id and completed parts are kept in the resume
 * store so a later call can continue where this one stopped.
 *
 * @code
 * multipart_upload_manager uploads(storage, &store, options);
 * auto result = uploads.upload("media", "video.mp4", "/data/video.mp4");
 * if (!result.success()) {
 *     // result.completed_parts of result.total_parts are kept for resume
 * }
 * @endcode
 */
class multipart_upload_manager {
public:
    /**
     * @param storage Client used for every request; must outlive the manager
     * @param store Resume store, or nullptr to disable persistence
     * @param options Client-wide defaults
     */
    multipart_upload_manager(storage_client& storage,
                             resume_store* store,
                             connection_options options);

    /**
     * @brief Upload a file, resuming a previous attempt when possible
     *
     * @param prior Explicit state to resume; when absent the resume store is consulted
     * @return Result describing the final state; never throws for transfer errors
     */
    [[nodiscard]] auto upload(const std::string& bucket,
                              const std::string& key,
                              const std::filesystem::path& local_path,
                              const upload_options& options = {},
                              progress_collector* progress = nullptr,
                              std::optional<transfer_state> prior = std::nullopt)
        -> upload_result;

    /**
     * @brief Abort the remote upload recorded in state and forget its resume record
     */
    [[nodiscard]] auto abort_upload(const transfer_state& state) -> result<void>;

private:
    storage_client& storage_;
    resume_store* store_;
    connection_options options_;
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_MULTIPART_UPLOAD_MANAGER_H
