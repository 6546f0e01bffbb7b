#pragma once

#include "core/error.hpp"
#include "http/http_types.hpp"

namespace vaultclient {

/**
 * @brief Sends a single HTTP request to the Vault server
 *
 * Any HTTP status counts as a successful exchange; only failing to obtain a
 * response (connect, TLS, timeout) is an error, tagged TRANSPORT_ERROR.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace vaultclient
