#include "http/httplib_transport.hpp"
#include "http/http_constants.hpp"
#include "core/utils.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace vaultclient {

HttplibTransport::HttplibTransport(const std::string& base_url, HttpConfig config)
    : config_(std::move(config)) {
    auto parsed = parse_url(base_url);
    if (!parsed) {
        throw VaultClientException(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Invalid Vault URL: '{}'", base_url));
    }
    base_url_ = std::move(*parsed);
}

Result<HttpResponse> HttplibTransport::send(const HttpRequest& request) {
    std::string path = base_url_.base_path + request.path;
    if (request.method == HttpMethod::LIST) {
        path += (path.find('?') == std::string::npos) ? "?list=true" : "&list=true";
    }

    httplib::Headers headers;
    for (const auto& [key, value] : request.headers) {
        headers.emplace(key, value);
    }

    const utils::Timer timer;
    try {
        httplib::Client cli(base_url_.origin());
        cli.set_connection_timeout(config_.connect_timeout);
        cli.set_read_timeout(config_.read_timeout);
        cli.set_write_timeout(config_.read_timeout);
        if (base_url_.use_ssl()) {
            cli.enable_server_certificate_verification(config_.verify_tls);
            if (!config_.ca_cert_file.empty()) {
                cli.set_ca_cert_path(config_.ca_cert_file);
            }
        }

        httplib::Result res;
        switch (request.method) {
            case HttpMethod::GET:
            case HttpMethod::LIST:
                res = cli.Get(path, headers);
                break;
            case HttpMethod::POST:
                res = cli.Post(path, headers, request.body, http::kJsonContentType);
                break;
            case HttpMethod::PUT:
                res = cli.Put(path, headers, request.body, http::kJsonContentType);
                break;
            case HttpMethod::DELETE:
                res = cli.Delete(path, headers);
                break;
        }

        if (!res) {
            return Result<HttpResponse>::error(ErrorCategory::TRANSPORT_ERROR,
                std::format("{} {}{} failed: {}", http_method_to_string(request.method),
                            base_url_.origin(), path, httplib::to_string(res.error())));
        }

        HttpResponse response;
        response.status = res->status;
        response.body = res->body;
        for (const auto& [key, value] : res->headers) {
            response.headers.emplace(key, value);
        }

        utils::log::debug(std::format("{} {} -> {} ({} ms)",
            http_method_to_string(request.method), path, response.status,
            timer.elapsed_ms().count()));
        return Result<HttpResponse>::ok(std::move(response));
    } catch (const std::exception& e) {
        return Result<HttpResponse>::error(ErrorCategory::TRANSPORT_ERROR,
            std::format("{} {}{} failed: {}", http_method_to_string(request.method),
                        base_url_.origin(), path, e.what()));
    }
}

} // namespace vaultclient
