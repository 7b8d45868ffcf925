/**
 * @file network_http_transport.cpp
 * @brief http_transport implementation over network_system
 * @version 0.1.0
 */

#include "kcenon/object_storage/http/http_transport.h"
#include "kcenon/object_storage/core/logging.h"

#include <kcenon/network/core/http_client.h>

#include <map>
#include <string>

namespace kcenon::object_storage {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
    std::shared_ptr<kcenon::network::core::http_client> client;

    explicit impl(std::chrono::milliseconds timeout)
        : client(std::make_shared<kcenon::network::core::http_client>(timeout)) {}

    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        for (const auto& [name, value] : resp.headers) {
            result.headers[name] = value;
        }
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

network_http_transport::network_http_transport(network_http_transport&&) noexcept = default;
auto network_http_transport::operator=(network_http_transport&&) noexcept
    -> network_http_transport& = default;

// ============================================================================
// Request execution
// ============================================================================

auto network_http_transport::execute(
    const http_request& request,
    const transfer_progress_callback& on_progress)
    -> result<http_response> {
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not initialized"}};
    }

    // The query is already part of the URL in canonical form, so the
    // separate query map handed to network_system stays empty.
    const auto url = request.url();
    const std::map<std::string, std::string> no_query;
    const auto& headers = request.headers;

    OBJSTORE_LOG_TRACE(log_category::transport,
        std::string(to_string(request.method)) + " " + request.host + request.path);

    auto response = [&] {
        switch (request.method) {
            case http_method::put:
                return impl_->client->put(
                    url, std::string(request.body.begin(), request.body.end()), headers);
            case http_method::post:
                return impl_->client->post(url, request.body, headers);
            case http_method::del:
                return impl_->client->del(url, headers);
            case http_method::head:
                return impl_->client->head(url, headers);
            case http_method::get:
            default:
                return impl_->client->get(url, no_query, headers);
        }
    }();

    if (response.is_err()) {
        OBJSTORE_LOG_WARN(log_category::transport,
            std::string("HTTP ") + to_string(request.method) + " request to " +
            request.host + " failed");
        return unexpected{error{error_code::connection_failed,
            std::string("HTTP ") + to_string(request.method) + " request failed"}};
    }

    if (on_progress && !request.body.empty()) {
        on_progress(request.body.size());
    }

    return impl_->convert_response(response.value());
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_network_transport(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_transport> {
    return std::make_shared<network_http_transport>(timeout);
}

}  // namespace kcenon::object_storage
