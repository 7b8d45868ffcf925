/**
 * @file error_codes.h
 * @brief Error classification helpers for object_storage_system
 * @version 0.1.0
 *
 * Groups error_code values into the categories callers act on:
 * signing failures are never retried, throttling and server errors are,
 * and local I/O failures abort the whole operation.
 */

#ifndef KCENON_OBJECT_STORAGE_CORE_ERROR_CODES_H
#define KCENON_OBJECT_STORAGE_CORE_ERROR_CODES_H

#include "kcenon/object_storage/core/types.h"

#include <string_view>

namespace kcenon::object_storage {

/**
 * @brief Coarse error category
 */
enum class error_category {
    none,
    signing,
    storage,
    network,
    transfer,
    resume,
    local_io,
    configuration,
    internal
};

[[nodiscard]] constexpr auto is_signing_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v >= -119;
}

[[nodiscard]] constexpr auto is_storage_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -200 && v >= -259;
}

[[nodiscard]] constexpr auto is_network_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -260 && v >= -279;
}

[[nodiscard]] constexpr auto is_transfer_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -300 && v >= -339;
}

[[nodiscard]] constexpr auto is_resume_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -400 && v >= -419;
}

[[nodiscard]] constexpr auto is_local_io_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -500 && v >= -539;
}

[[nodiscard]] constexpr auto is_configuration_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -600 && v >= -619;
}

[[nodiscard]] constexpr auto categorize(error_code code) noexcept -> error_category {
    if (code == error_code::success) return error_category::none;
    if (is_signing_error(code)) return error_category::signing;
    if (is_storage_error(code)) return error_category::storage;
    if (is_network_error(code)) return error_category::network;
    if (is_transfer_error(code)) return error_category::transfer;
    if (is_resume_error(code)) return error_category::resume;
    if (is_local_io_error(code)) return error_category::local_io;
    if (is_configuration_error(code)) return error_category::configuration;
    return error_category::internal;
}

[[nodiscard]] constexpr auto to_string(error_category category) noexcept
    -> std::string_view {
    switch (category) {
        case error_category::none: return "none";
        case error_category::signing: return "signing";
        case error_category::storage: return "storage";
        case error_category::network: return "network";
        case error_category::transfer: return "transfer";
        case error_category::resume: return "resume";
        case error_category::local_io: return "local_io";
        case error_category::configuration: return "configuration";
        case error_category::internal: return "internal";
        default: return "unknown";
    }
}

/**
 * @brief Check whether an HTTP status is worth retrying
 *
 * 408, 429 and every 5xx are transient. Other 4xx are not.
 */
[[nodiscard]] constexpr auto is_retryable_status(int status_code) noexcept -> bool {
    return status_code == 408 || status_code == 429 ||
           (status_code >= 500 && status_code < 600);
}

/**
 * @brief Check whether a chunk-level error may be retried on the same index
 */
[[nodiscard]] inline auto is_retryable(const error& err) noexcept -> bool {
    switch (err.code) {
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_reset:
        case error_code::throttled:
        case error_code::server_error:
        case error_code::request_timeout:
        case error_code::size_mismatch:
            return true;
        default:
            break;
    }
    if (is_storage_error(err.code) && err.detail) {
        return is_retryable_status(err.detail->http_status);
    }
    return false;
}

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_CORE_ERROR_CODES_H
