/**
 * @file storage_types.h
 * @brief Option and result types for storage_client operations
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_STORAGE_STORAGE_TYPES_H
#define KCENON_OBJECT_STORAGE_STORAGE_STORAGE_TYPES_H

#include "kcenon/object_storage/http/http_types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace kcenon::object_storage {

/**
 * @brief Options for list_objects
 */
struct list_objects_options {
    std::string prefix;

    /// false lists one level only and reports sub-prefixes with is_prefix set
    bool recursive = true;

    /// Stop after this many entries; 0 lists everything
    std::size_t max_keys = 0;
};

/**
 * @brief Options for put_object and initiate_multipart_upload
 */
struct put_object_options {
    std::string content_type;                      ///< empty: guess from key
    std::map<std::string, std::string> metadata;   ///< sent as x-amz-meta-*

    /// Streams longer than this are sent as a multipart upload in parts of
    /// this size (raised to min_upload_chunk_size). Only put_object reads it.
    uint64_t part_size = 8ULL * 1024 * 1024;
};

/**
 * @brief Object count and total size of a bucket, or of a prefix within it
 */
struct bucket_statistics {
    std::string bucket;
    std::string prefix;
    uint64_t object_count = 0;
    uint64_t folder_count = 0;   ///< zero-byte "name/" markers, not in object_count
    uint64_t total_size = 0;
    bool truncated = false;      ///< stopped at max_objects

    [[nodiscard]] auto average_object_size() const -> double {
        return object_count == 0 ? 0.0
                                 : static_cast<double>(total_size) /
                                       static_cast<double>(object_count);
    }
};

/**
 * @brief Presigned URL with its validity window
 */
struct presigned_url {
    std::string url;
    http_method method = http_method::get;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point expires_at;
    std::chrono::seconds expiry{0};

    [[nodiscard]] auto is_expired(std::chrono::system_clock::time_point now) const -> bool {
        return now >= expires_at;
    }
};

/**
 * @brief Part entry for complete_multipart_upload
 */
struct completed_part {
    uint32_t part_number = 0;
    std::string etag;
};

/**
 * @brief Result of upload_part
 */
struct uploaded_part {
    std::string etag;   ///< quotes stripped
    std::string md5;    ///< base64 Content-MD5 sent with the part
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_STORAGE_STORAGE_TYPES_H
