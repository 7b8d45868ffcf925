/**
 * @file http_types.cpp
 * @brief URL and canonical query construction for http_request
 */

#include "kcenon/object_storage/http/http_types.h"
#include "kcenon/object_storage/core/storage_utils.h"

namespace kcenon::object_storage {

auto http_request::canonical_query() const -> std::string {
    // std::map keeps raw keys sorted; encoding preserves that order for the
    // unreserved character set used by S3 parameter names.
    std::string out;
    for (const auto& [key, value] : query) {
        if (!out.empty()) {
            out += '&';
        }
        out += storage_utils::url_encode(key, true);
        out += '=';
        out += storage_utils::url_encode(value, true);
    }
    return out;
}

auto http_request::url() const -> std::string {
    std::string out = scheme + "://" + host + path;
    auto q = canonical_query();
    if (!q.empty()) {
        out += '?';
        out += q;
    }
    return out;
}

}  // namespace kcenon::object_storage
