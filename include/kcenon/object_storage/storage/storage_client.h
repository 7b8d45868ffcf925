/**
 * @file storage_client.h
 * @brief S3 REST operations over an http_transport
 * @version 0.1.0
 *
 * storage_client issues one signed request per operation and maps every
 * non-2xx response to a storage error carrying the HTTP status, backend
 * code and request id. Buckets and keys are addressed path-style
 * (/bucket/key).
 */

#ifndef KCENON_OBJECT_STORAGE_STORAGE_STORAGE_CLIENT_H
#define KCENON_OBJECT_STORAGE_STORAGE_STORAGE_CLIENT_H

#include "kcenon/object_storage/config/client_config.h"
#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/http/http_transport.h"
#include "kcenon/object_storage/storage/storage_types.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace kcenon::object_storage {

/// Buffer size for streamed object bodies
inline constexpr std::size_t stream_buffer_size = 64 * 1024;

/// Largest ranged GET issued by get_object; bounds its memory use
inline constexpr uint64_t stream_range_size = 1024 * 1024;

/**
 * @brief Low-level S3 client
 *
 * Thread-safe: concurrent calls share only the immutable credentials and
 * the transport, which is itself required to be thread-safe.
 */
class storage_client {
public:
    using clock_function = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Construct a client
     * @param creds Credentials and endpoint
     * @param transport Transport used for every request
     * @param clock Time source for signing; defaults to system_clock::now
     */
    storage_client(credentials creds,
                   std::shared_ptr<http_transport> transport,
                   clock_function clock = {});

    ~storage_client();

    storage_client(const storage_client&) = delete;
    auto operator=(const storage_client&) -> storage_client& = delete;
    storage_client(storage_client&&) noexcept;
    auto operator=(storage_client&&) noexcept -> storage_client&;

    [[nodiscard]] auto get_credentials() const -> const credentials&;

    // ========================================================================
    // Buckets
    // ========================================================================

    [[nodiscard]] auto list_buckets() -> result<std::vector<bucket_descriptor>>;

    /**
     * @brief Check bucket existence; 404 is false, not an error
     */
    [[nodiscard]] auto bucket_exists(const std::string& bucket) -> result<bool>;

    /**
     * @brief Create a bucket, adding a LocationConstraint outside us-east-1
     */
    [[nodiscard]] auto create_bucket(
        const std::string& bucket,
        const std::optional<std::string>& region = std::nullopt) -> result<void>;

    [[nodiscard]] auto delete_bucket(const std::string& bucket) -> result<void>;

    // ========================================================================
    // Objects
    // ========================================================================

    /**
     * @brief List objects with ListObjectsV2, following continuation tokens
     */
    [[nodiscard]] auto list_objects(
        const std::string& bucket,
        const list_objects_options& options = {})
        -> result<std::vector<object_descriptor>>;

    /**
     * @brief HEAD an object; 404 yields std::nullopt
     */
    [[nodiscard]] auto head_object(const std::string& bucket, const std::string& key)
        -> result<std::optional<object_descriptor>>;

    /**
     * @brief Upload a stream
     *
     * A stream that fits in options.part_size goes up in one PUT. A longer
     * one becomes a multipart upload of part_size parts, read one part at a
     * time, and is aborted if any part fails. on_progress receives the
     * cumulative bytes after each request.
     *
     * @return ETag without quotes
     */
    [[nodiscard]] auto put_object(
        const std::string& bucket,
        const std::string& key,
        std::istream& source,
        const put_object_options& options = {},
        const transfer_progress_callback& on_progress = {}) -> result<std::string>;

    [[nodiscard]] auto put_object(
        const std::string& bucket,
        const std::string& key,
        std::span<const uint8_t> data,
        const put_object_options& options = {}) -> result<std::string>;

    /**
     * @brief Download an object to a file, creating parent directories
     *
     * The body is fetched as ranged GETs of at most stream_range_size bytes,
     * each pinned to the ETag seen by an initial HEAD, and written out in
     * stream_buffer_size slices. A replaced object fails with
     * precondition_failed.
     *
     * @return Bytes written
     */
    [[nodiscard]] auto get_object(
        const std::string& bucket,
        const std::string& key,
        const std::filesystem::path& destination,
        const transfer_progress_callback& on_progress = {}) -> result<uint64_t>;

    [[nodiscard]] auto get_object(
        const std::string& bucket,
        const std::string& key,
        std::ostream& destination,
        const transfer_progress_callback& on_progress = {}) -> result<uint64_t>;

    /**
     * @brief Fetch one byte range (Range: bytes=first-last)
     */
    [[nodiscard]] auto get_object_range(
        const std::string& bucket,
        const std::string& key,
        const byte_range& range) -> result<std::vector<uint8_t>>;

    /**
     * @brief Delete an object; deleting a missing key succeeds
     */
    [[nodiscard]] auto delete_object(const std::string& bucket, const std::string& key)
        -> result<void>;

    /**
     * @brief Server-side copy
     * @return ETag of the new object
     */
    [[nodiscard]] auto copy_object(
        const std::string& source_bucket,
        const std::string& source_key,
        const std::string& destination_bucket,
        const std::string& destination_key) -> result<std::string>;

    // ========================================================================
    // Folders and statistics
    // ========================================================================

    /**
     * @brief Create zero-byte "name/" markers for every level of a folder path
     *
     * Slashes and backslashes both separate levels; empty levels are
     * dropped. Existing markers are left alone.
     *
     * @return Marker keys that were created, outermost first
     */
    [[nodiscard]] auto create_folder(const std::string& bucket, const std::string& folder)
        -> result<std::vector<std::string>>;

    /**
     * @brief Remove a folder
     *
     * Without recursive only the marker is removed, and a folder holding
     * other objects fails with prefix_not_empty. With recursive every object
     * under the folder is deleted. A missing folder removes nothing.
     *
     * @return Number of objects deleted
     */
    [[nodiscard]] auto delete_prefix(const std::string& bucket,
                                     const std::string& folder,
                                     bool recursive) -> result<std::size_t>;

    /**
     * @brief Count objects and bytes under a prefix (the whole bucket if empty)
     * @param max_objects Stop after this many entries; 0 counts everything
     */
    [[nodiscard]] auto bucket_stats(const std::string& bucket,
                                    const std::string& prefix = {},
                                    std::size_t max_objects = 0)
        -> result<bucket_statistics>;

    // ========================================================================
    // Bucket policy
    // ========================================================================

    /**
     * @brief Fetch the bucket policy; a bucket without one yields std::nullopt
     */
    [[nodiscard]] auto get_bucket_policy(const std::string& bucket)
        -> result<std::optional<std::string>>;

    [[nodiscard]] auto set_bucket_policy(const std::string& bucket,
                                         const std::string& policy_json) -> result<void>;

    [[nodiscard]] auto delete_bucket_policy(const std::string& bucket) -> result<void>;

    // ========================================================================
    // Presigned URLs
    // ========================================================================

    /**
     * @brief Generate a presigned URL
     *
     * The expiry is clamped to [1s, 7d] with a warning before signing.
     */
    [[nodiscard]] auto generate_presigned_url(
        http_method method,
        const std::string& bucket,
        const std::string& key,
        std::chrono::seconds expiry) -> result<presigned_url>;

    // ========================================================================
    // Multipart primitives
    // ========================================================================

    [[nodiscard]] auto initiate_multipart_upload(
        const std::string& bucket,
        const std::string& key,
        const put_object_options& options = {}) -> result<std::string>;

    /**
     * @brief Upload one part with a Content-MD5 header
     * @param part_number 1-based part number
     */
    [[nodiscard]] auto upload_part(
        const std::string& bucket,
        const std::string& key,
        const std::string& upload_id,
        uint32_t part_number,
        std::span<const uint8_t> data,
        const transfer_progress_callback& on_progress = {}) -> result<uploaded_part>;

    /**
     * @brief Complete an upload; parts are sorted by part number first
     * @return ETag of the assembled object
     */
    [[nodiscard]] auto complete_multipart_upload(
        const std::string& bucket,
        const std::string& key,
        const std::string& upload_id,
        std::vector<completed_part> parts) -> result<std::string>;

    [[nodiscard]] auto abort_multipart_upload(
        const std::string& bucket,
        const std::string& key,
        const std::string& upload_id) -> result<void>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_STORAGE_STORAGE_CLIENT_H
