/**
 * @file object_storage_client.h
 * @brief Connected handle bundling the storage client, resume store and transfer managers
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_CLIENT_OBJECT_STORAGE_CLIENT_H
#define KCENON_OBJECT_STORAGE_CLIENT_OBJECT_STORAGE_CLIENT_H

#include "kcenon/object_storage/config/client_config.h"
#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/http/http_transport.h"
#include "kcenon/object_storage/transfer/progress_collector.h"
#include "kcenon/object_storage/transfer/transfer_result.h"
#include "kcenon/object_storage/transfer/transfer_state.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::object_storage {

class storage_client;

/**
 * @brief Client for an S3-compatible endpoint
 *
 * Obtained from connect(). Every operation goes through this handle; the
 * handle owns the transport, the storage client and the resume store.
 *
 * @code
 * auto client = connect("https://s3.example.com", access_key, secret_key);
 * if (client) {
 *     progress_collector progress;
 *     upload_options opts;
 *     opts.on_poll = [](progress_collector& p) {
 *         p.drain([](const progress_event& e) { render(e); });
 *     };
 *     auto uploaded = client.value().upload_file("media", "a.bin", "/tmp/a.bin",
 *                                                opts, &progress);
 * }
 * @endcode
 */
class object_storage_client {
public:
    ~object_storage_client();

    object_storage_client(const object_storage_client&) = delete;
    auto operator=(const object_storage_client&) -> object_storage_client& = delete;
    object_storage_client(object_storage_client&&) noexcept;
    auto operator=(object_storage_client&&) noexcept -> object_storage_client&;

    [[nodiscard]] auto list_buckets() -> result<std::vector<bucket_descriptor>>;

    /**
     * @brief Direct access to single-request bucket and object operations
     */
    [[nodiscard]] auto storage() -> storage_client&;

    /**
     * @brief Upload a local file with parallel parts, resuming when possible
     *
     * Blocks until the upload completes or fails.
     */
    [[nodiscard]] auto upload_file(const std::string& bucket,
                                   const std::string& key,
                                   const std::filesystem::path& local_path,
                                   const upload_options& options = {},
                                   progress_collector* progress = nullptr) -> upload_result;

    /**
     * @brief Download an object with parallel ranged requests, resuming when possible
     */
    [[nodiscard]] auto download_file(const std::string& bucket,
                                     const std::string& key,
                                     const std::filesystem::path& destination,
                                     const download_options& options = {},
                                     progress_collector* progress = nullptr) -> download_result;

    /**
     * @brief Abort an unfinished upload and delete its resume record
     */
    [[nodiscard]] auto abort_upload(const transfer_state& state) -> result<void>;

    /**
     * @brief Unfinished transfers recorded in the resume directory
     */
    [[nodiscard]] auto resume_states() -> std::vector<transfer_state>;

    [[nodiscard]] auto options() const -> const connection_options&;

private:
    friend auto connect(const std::string& endpoint,
                        const std::string& access_key,
                        const std::string& secret_key,
                        std::shared_ptr<http_transport> transport,
                        const connection_options& options)
        -> result<object_storage_client>;

    struct impl;
    explicit object_storage_client(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief Connect to an endpoint over the network transport
 *
 * @param endpoint host[:port], optionally prefixed with http:// or https://;
 *                 the scheme overrides options.use_tls
 */
[[nodiscard]] auto connect(const std::string& endpoint,
                           const std::string& access_key,
                           const std::string& secret_key,
                           const connection_options& options = {})
    -> result<object_storage_client>;

/**
 * @brief Connect through a caller-supplied transport
 */
[[nodiscard]] auto connect(const std::string& endpoint,
                           const std::string& access_key,
                           const std::string& secret_key,
                           std::shared_ptr<http_transport> transport,
                           const connection_options& options = {})
    -> result<object_storage_client>;

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_CLIENT_OBJECT_STORAGE_CLIENT_H
