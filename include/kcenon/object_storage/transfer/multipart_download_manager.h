/**
 * @file multipart_download_manager.h
 * @brief Parallel, resumable ranged downloads
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_MULTIPART_DOWNLOAD_MANAGER_H
#define KCENON_OBJECT_STORAGE_TRANSFER_MULTIPART_DOWNLOAD_MANAGER_H

#include "kcenon/object_storage/config/client_config.h"
#include "kcenon/object_storage/transfer/progress_collector.h"
#include "kcenon/object_storage/transfer/transfer_result.h"

#include <filesystem>
#include <string>

namespace kcenon::object_storage {

class resume_store;
class storage_client;

/**
 * @brief Downloads an object as concurrent byte ranges into a preallocated file
 *
 * The object's size, ETag and Last-Modified form the resume fingerprint;
 * a stored record is reused only while all three match and the partial
 * destination file is still in place.
 */
class multipart_download_manager {
public:
    multipart_download_manager(storage_client& storage,
                               resume_store* store,
                               connection_options options);

    [[nodiscard]] auto download(const std::string& bucket,
                                const std::string& key,
                                const std::filesystem::path& destination,
                                const download_options& options = {},
                                progress_collector* progress = nullptr) -> download_result;

private:
    storage_client& storage_;
    resume_store* store_;
    connection_options options_;
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_MULTIPART_DOWNLOAD_MANAGER_H
