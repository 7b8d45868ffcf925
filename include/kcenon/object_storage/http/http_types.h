/**
 * @file http_types.h
 * @brief HTTP request/response value types used by the signer and transport
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_HTTP_HTTP_TYPES_H
#define KCENON_OBJECT_STORAGE_HTTP_HTTP_TYPES_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_storage {

/**
 * @brief HTTP methods used by the S3 REST protocol
 */
enum class http_method {
    get,
    put,
    post,
    del,
    head
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::post: return "POST";
        case http_method::del: return "DELETE";
        case http_method::head: return "HEAD";
        default: return "GET";
    }
}

/**
 * @brief Cumulative byte callback; must not block on further I/O
 */
using transfer_progress_callback = std::function<void(uint64_t bytes_so_far)>;

/**
 * @brief Outbound request before or after signing
 *
 * Query values are stored raw; encoding happens when the canonical
 * query string is built, so the signed query and the wire query are the
 * same bytes.
 */
struct http_request {
    http_method method = http_method::get;
    std::string scheme = "https";
    std::string host;                              ///< host[:port]
    std::string path = "/";                        ///< already URI-encoded
    std::map<std::string, std::string> query;      ///< raw keys and values
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Canonical (sorted, RFC 3986 encoded) query string
     */
    [[nodiscard]] auto canonical_query() const -> std::string;

    /**
     * @brief Full URL including the canonical query string
     */
    [[nodiscard]] auto url() const -> std::string;
};

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };

        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_HTTP_HTTP_TYPES_H
