/**
 * @file request_signer.cpp
 * @brief AWS Signature Version 4 implementation
 * @version 0.1.0
 */

#include "kcenon/object_storage/auth/request_signer.h"
#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/core/storage_utils.h"

#include <map>
#include <sstream>

namespace kcenon::object_storage {

namespace {

constexpr const char* service_name = "s3";
constexpr const char* scope_terminator = "aws4_request";

auto validate_credentials(const credentials& creds) -> result<void> {
    if (!creds.has_keys()) {
        return unexpected{error{error_code::missing_credentials,
            "access key and secret key are required for signing"}};
    }
    if (creds.region.empty()) {
        return unexpected{error{error_code::missing_credentials,
            "region is required for signing"}};
    }
    return {};
}

auto make_scope(const std::string& date_stamp, const std::string& region) -> std::string {
    return date_stamp + "/" + region + "/" + service_name + "/" + scope_terminator;
}

auto make_string_to_sign(const std::string& amz_date,
                         const std::string& scope,
                         const std::string& canonical_request) -> std::string {
    std::ostringstream oss;
    oss << sigv4_algorithm << '\n'
        << amz_date << '\n'
        << scope << '\n'
        << storage_utils::sha256_hex(canonical_request);
    return oss.str();
}

}  // namespace

auto request_signer::derive_signing_key(
    const std::string& secret_key,
    const std::string& date_stamp,
    const std::string& region) -> std::vector<uint8_t> {
    const std::string seed = "AWS4" + secret_key;
    auto k_date = storage_utils::hmac_sha256(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(seed.data()), seed.size()),
        date_stamp);
    auto k_region = storage_utils::hmac_sha256(k_date, region);
    auto k_service = storage_utils::hmac_sha256(k_region, service_name);
    return storage_utils::hmac_sha256(k_service, scope_terminator);
}

auto request_signer::sign(
    const http_request& request,
    const credentials& creds,
    std::chrono::system_clock::time_point timestamp,
    payload_mode mode) -> result<signed_request> {
    auto valid = validate_credentials(creds);
    if (!valid) {
        return unexpected{valid.error()};
    }

    if (request.path.empty() || request.path.front() != '/') {
        return unexpected{error{error_code::malformed_request,
            "request path must start with '/'"}};
    }

    // Collect headers under lower-case names; an explicit host header
    // wins over the request's host field.
    std::map<std::string, std::string> canonical;
    for (const auto& [name, value] : request.headers) {
        canonical[storage_utils::to_lower(name)] = storage_utils::trim_header_value(value);
    }
    if (canonical.find("host") == canonical.end()) {
        if (request.host.empty()) {
            return unexpected{error{error_code::missing_host_header,
                "request has no host"}};
        }
        canonical["host"] = request.host;
    } else if (canonical["host"].empty()) {
        return unexpected{error{error_code::missing_host_header,
            "host header is empty"}};
    }

    const auto amz_date = storage_utils::format_amz_date(timestamp);
    const auto date_stamp = storage_utils::format_date_stamp(timestamp);
    const std::string payload_hash = mode == payload_mode::unsigned_payload
        ? std::string(unsigned_payload)
        : storage_utils::sha256_hex(std::span<const uint8_t>(request.body));

    canonical["x-amz-date"] = amz_date;
    canonical["x-amz-content-sha256"] = payload_hash;

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : canonical) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) {
            signed_headers += ';';
        }
        signed_headers += name;
    }

    std::ostringstream creq;
    creq << to_string(request.method) << '\n'
         << request.path << '\n'
         << request.canonical_query() << '\n'
         << canonical_headers << '\n'
         << signed_headers << '\n'
         << payload_hash;

    signed_request out;
    out.canonical_request = creq.str();
    out.credential_scope = make_scope(date_stamp, creds.region);
    out.string_to_sign = make_string_to_sign(amz_date, out.credential_scope,
                                             out.canonical_request);

    auto signing_key = derive_signing_key(creds.secret_key, date_stamp, creds.region);
    out.signature = storage_utils::bytes_to_hex(
        storage_utils::hmac_sha256(signing_key, out.string_to_sign));
    out.signed_headers = signed_headers;
    out.authorization = std::string(sigv4_algorithm) +
        " Credential=" + creds.access_key + "/" + out.credential_scope +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + out.signature;

    out.request = request;
    out.request.headers["Host"] = canonical["host"];
    out.request.headers["x-amz-date"] = amz_date;
    out.request.headers["x-amz-content-sha256"] = payload_hash;
    out.request.headers["Authorization"] = out.authorization;

    return out;
}

auto request_signer::presign(
    http_method method,
    const std::string& host,
    const std::string& path,
    const credentials& creds,
    std::chrono::system_clock::time_point timestamp,
    std::chrono::seconds expiry) -> result<std::string> {
    auto valid = validate_credentials(creds);
    if (!valid) {
        return unexpected{valid.error()};
    }
    if (host.empty()) {
        return unexpected{error{error_code::missing_host_header,
            "presigned URL requires a host"}};
    }
    if (path.empty() || path.front() != '/') {
        return unexpected{error{error_code::malformed_request,
            "request path must start with '/'"}};
    }
    if (expiry < min_presign_expiry || expiry > max_presign_expiry) {
        return unexpected{error{error_code::invalid_expiry,
            "expiry must be between 1 second and 7 days, got " +
            std::to_string(expiry.count()) + "s"}};
    }

    const auto amz_date = storage_utils::format_amz_date(timestamp);
    const auto date_stamp = storage_utils::format_date_stamp(timestamp);
    const auto scope = make_scope(date_stamp, creds.region);

    http_request request;
    request.method = method;
    request.scheme = creds.scheme();
    request.host = host;
    request.path = path;
    request.query["X-Amz-Algorithm"] = sigv4_algorithm;
    request.query["X-Amz-Credential"] = creds.access_key + "/" + scope;
    request.query["X-Amz-Date"] = amz_date;
    request.query["X-Amz-Expires"] = std::to_string(expiry.count());
    request.query["X-Amz-SignedHeaders"] = "host";

    std::ostringstream creq;
    creq << to_string(method) << '\n'
         << path << '\n'
         << request.canonical_query() << '\n'
         << "host:" << host << "\n\n"
         << "host\n"
         << unsigned_payload;

    auto string_to_sign = make_string_to_sign(amz_date, scope, creq.str());
    auto signing_key = derive_signing_key(creds.secret_key, date_stamp, creds.region);
    request.query["X-Amz-Signature"] = storage_utils::bytes_to_hex(
        storage_utils::hmac_sha256(signing_key, string_to_sign));

    OBJSTORE_LOG_DEBUG(log_category::signer,
        "Presigned " + std::string(to_string(method)) + " " + path +
        " valid for " + std::to_string(expiry.count()) + "s");

    return request.url();
}

}  // namespace kcenon::object_storage
