#pragma once

#include "core/url.hpp"
#include "http/ihttp_transport.hpp"

#include <chrono>
#include <string>

namespace vaultclient {

struct HttpConfig {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{30000};
    int max_retries = 3;
    std::chrono::milliseconds retry_base_delay{100};
    std::chrono::milliseconds retry_max_delay{2000};
    bool verify_tls = true;
    std::string ca_cert_file;
};

/**
 * @brief cpp-httplib backed transport bound to one Vault base URL
 *
 * The base URL's path (if any) is prefixed to every request path, so a
 * Vault mounted behind "https://gw.example.com/vault" works unchanged.
 */
class HttplibTransport : public IHttpTransport {
public:
    // Throws VaultClientException(CONFIGURATION_ERROR) on an invalid URL
    HttplibTransport(const std::string& base_url, HttpConfig config);

    [[nodiscard]] Result<HttpResponse> send(const HttpRequest& request) override;

    [[nodiscard]] const ParsedUrl& base_url() const { return base_url_; }

private:
    ParsedUrl base_url_;
    HttpConfig config_;
};

} // namespace vaultclient
