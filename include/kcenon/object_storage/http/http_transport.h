/**
 * @file http_transport.h
 * @brief HTTP transport interface and the network_system implementation
 * @version 0.1.0
 *
 * The storage client talks to the network only through http_transport.
 * Production code uses network_http_transport; tests substitute an
 * in-memory backend.
 */

#ifndef KCENON_OBJECT_STORAGE_HTTP_HTTP_TRANSPORT_H
#define KCENON_OBJECT_STORAGE_HTTP_HTTP_TRANSPORT_H

#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/http/http_types.h"

#include <chrono>
#include <memory>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::object_storage {

/**
 * @brief Abstract transport for already-signed requests
 *
 * A non-2xx status is a successful exchange and is returned as a
 * response. Errors are reserved for failures to obtain a response at all.
 *
 * @note Implementations must be safe for concurrent execute() calls.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    /**
     * @brief Execute one request
     * @param request Signed request
     * @param on_progress Receives cumulative request body bytes sent
     */
    [[nodiscard]] virtual auto execute(
        const http_request& request,
        const transfer_progress_callback& on_progress = {})
        -> result<http_response> = 0;
};

/**
 * @brief http_transport backed by network_system's HTTP client
 */
class network_http_transport : public http_transport {
public:
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;
    network_http_transport(network_http_transport&&) noexcept;
    auto operator=(network_http_transport&&) noexcept -> network_http_transport&;

    [[nodiscard]] auto execute(
        const http_request& request,
        const transfer_progress_callback& on_progress = {})
        -> result<http_response> override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create a network-backed transport
 */
[[nodiscard]] auto make_network_transport(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_transport>;

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_HTTP_HTTP_TRANSPORT_H
