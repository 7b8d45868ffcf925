/**
 * @file types.h
 * @brief Core type definitions for object_storage_system
 */

#ifndef KCENON_OBJECT_STORAGE_CORE_TYPES_H
#define KCENON_OBJECT_STORAGE_CORE_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::object_storage {

/**
 * @brief Error codes for object storage operations
 *
 * Ranges:
 * - -100 to -119: Signing errors
 * - -200 to -259: Storage (non-2xx response) errors
 * - -260 to -279: Network errors
 * - -300 to -339: Transfer errors
 * - -400 to -419: Resume data errors
 * - -500 to -539: Local I/O errors
 * - -600 to -619: Configuration and argument errors
 * - -700 to -719: Internal errors
 */
enum class error_code {
    success = 0,

    // Signing errors (-100 to -119)
    missing_credentials = -100,
    malformed_request = -101,
    missing_host_header = -102,
    invalid_expiry = -103,

    // Storage errors (-200 to -259)
    storage_request_failed = -200,
    bucket_not_found = -201,
    object_not_found = -202,
    access_denied = -203,
    throttled = -204,
    server_error = -205,
    invalid_response = -206,
    bucket_already_exists = -207,
    bucket_not_empty = -208,
    request_timeout = -209,
    prefix_not_empty = -210,
    precondition_failed = -211,

    // Network errors (-260 to -279)
    connection_failed = -260,
    connection_timeout = -261,
    connection_reset = -262,

    // Transfer errors (-300 to -339)
    chunk_retries_exhausted = -300,
    source_changed = -301,
    size_mismatch = -302,
    transfer_cancelled = -303,
    multipart_initiate_failed = -304,
    multipart_complete_failed = -305,
    incomplete_transfer = -306,

    // Resume data errors (-400 to -419)
    resume_data_invalid = -400,
    resume_data_not_found = -401,

    // Local I/O errors (-500 to -539)
    file_not_found = -500,
    file_access_denied = -501,
    file_read_error = -502,
    file_write_error = -503,

    // Configuration errors (-600 to -619)
    invalid_configuration = -600,
    invalid_argument = -601,

    // Internal errors (-700 to -719)
    internal_error = -700,
    not_initialized = -701,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::missing_credentials:
            return "missing credentials";
        case error_code::malformed_request:
            return "malformed request";
        case error_code::missing_host_header:
            return "missing host header";
        case error_code::invalid_expiry:
            return "invalid expiry";
        case error_code::storage_request_failed:
            return "storage request failed";
        case error_code::bucket_not_found:
            return "bucket not found";
        case error_code::object_not_found:
            return "object not found";
        case error_code::access_denied:
            return "access denied";
        case error_code::throttled:
            return "request throttled";
        case error_code::server_error:
            return "server error";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::bucket_already_exists:
            return "bucket already exists";
        case error_code::bucket_not_empty:
            return "bucket not empty";
        case error_code::request_timeout:
            return "request timeout";
        case error_code::prefix_not_empty:
            return "prefix not empty";
        case error_code::precondition_failed:
            return "precondition failed";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_reset:
            return "connection reset";
        case error_code::chunk_retries_exhausted:
            return "chunk retries exhausted";
        case error_code::source_changed:
            return "source changed";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::multipart_initiate_failed:
            return "multipart initiate failed";
        case error_code::multipart_complete_failed:
            return "multipart complete failed";
        case error_code::incomplete_transfer:
            return "incomplete transfer";
        case error_code::resume_data_invalid:
            return "resume data invalid";
        case error_code::resume_data_not_found:
            return "resume data not found";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Backend details attached to errors raised by non-2xx responses
 */
struct storage_error_detail {
    int http_status = 0;
    std::string backend_code;   ///< <Code> element, e.g. "NoSuchKey"
    std::string request_id;     ///< <RequestId> or x-amz-request-id
    std::string resource;
};

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;
    std::optional<storage_error_detail> detail;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, storage_error_detail d)
        : code(c), message(std::move(msg)), detail(std::move(d)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto http_status() const noexcept -> int {
        return detail ? detail->http_status : 0;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Half-open byte range [offset, offset + length)
 */
struct byte_range {
    uint64_t offset = 0;
    uint64_t length = 0;

    byte_range() = default;
    byte_range(uint64_t off, uint64_t len) : offset(off), length(len) {}

    [[nodiscard]] auto end() const -> uint64_t { return offset + length; }

    /// Last byte position, as used by the HTTP Range header
    [[nodiscard]] auto last() const -> uint64_t { return offset + length - 1; }

    [[nodiscard]] auto operator==(const byte_range& other) const -> bool = default;
};

/**
 * @brief Direction of a chunked transfer
 */
enum class transfer_direction {
    upload,
    download
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) -> const char* {
    return dir == transfer_direction::upload ? "upload" : "download";
}

/**
 * @brief Snapshot of an object from list or head calls
 */
struct object_descriptor {
    std::string bucket;
    std::string key;
    uint64_t size = 0;
    std::string etag;
    std::string last_modified;
    std::string content_type;
    bool is_prefix = false;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Bucket entry returned by list_buckets
 */
struct bucket_descriptor {
    std::string name;
    std::string creation_date;
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_CORE_TYPES_H
