/**
 * @file request_signer.h
 * @brief AWS Signature Version 4 signing for S3-compatible requests
 * @version 0.1.0
 *
 * The signer is a pure function of (request, credentials, timestamp): it
 * performs no I/O and keeps no state, so signing the same input twice
 * yields byte-identical Authorization headers.
 */

#ifndef KCENON_OBJECT_STORAGE_AUTH_REQUEST_SIGNER_H
#define KCENON_OBJECT_STORAGE_AUTH_REQUEST_SIGNER_H

#include "kcenon/object_storage/config/client_config.h"
#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/http/http_types.h"

#include <chrono>
#include <string>

namespace kcenon::object_storage {

/// Payload hash sentinel for bodies that are streamed rather than hashed
inline constexpr const char* unsigned_payload = "UNSIGNED-PAYLOAD";

inline constexpr const char* sigv4_algorithm = "AWS4-HMAC-SHA256";

/// Longest expiry accepted for presigned URLs (7 days)
inline constexpr std::chrono::seconds max_presign_expiry{7 * 24 * 60 * 60};
inline constexpr std::chrono::seconds min_presign_expiry{1};

/**
 * @brief How the payload hash is computed
 */
enum class payload_mode {
    unsigned_payload,  ///< x-amz-content-sha256: UNSIGNED-PAYLOAD
    signed_payload     ///< SHA-256 of the body
};

/**
 * @brief Request with signing headers attached, plus the intermediate values
 */
struct signed_request {
    http_request request;
    std::string canonical_request;
    std::string string_to_sign;
    std::string credential_scope;
    std::string signed_headers;
    std::string signature;
    std::string authorization;
};

/**
 * @brief SigV4 signer
 */
class request_signer {
public:
    /**
     * @brief Sign a request
     *
     * Adds host, x-amz-date, x-amz-content-sha256 and Authorization
     * headers. Every header present on the request is signed.
     *
     * @return signed_request, or missing_credentials / missing_host_header /
     *         malformed_request
     */
    [[nodiscard]] static auto sign(
        const http_request& request,
        const credentials& creds,
        std::chrono::system_clock::time_point timestamp,
        payload_mode mode = payload_mode::unsigned_payload)
        -> result<signed_request>;

    /**
     * @brief Build a presigned URL with the signature in the query string
     *
     * @param expiry Must lie within [1s, 7d]; anything else is invalid_expiry
     */
    [[nodiscard]] static auto presign(
        http_method method,
        const std::string& host,
        const std::string& path,
        const credentials& creds,
        std::chrono::system_clock::time_point timestamp,
        std::chrono::seconds expiry) -> result<std::string>;

    /**
     * @brief Derive the signing key (kDate -> kRegion -> kService -> kSigning)
     */
    [[nodiscard]] static auto derive_signing_key(
        const std::string& secret_key,
        const std::string& date_stamp,
        const std::string& region) -> std::vector<uint8_t>;
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_AUTH_REQUEST_SIGNER_H
