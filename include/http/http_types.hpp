#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace vaultclient {

enum class HttpMethod : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    LIST    // Vault's LIST verb, sent as GET ?list=true
};

[[nodiscard]] inline const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::POST:   return "POST";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::LIST:   return "LIST";
        default:                 return "UNKNOWN";
    }
}

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;                           // Absolute API path, e.g. "/v1/secret/app"
    std::map<std::string, std::string> headers;
    std::string body;                           // JSON; empty for GET/LIST/DELETE
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    [[nodiscard]] bool is_success() const { return status >= 200 && status < 300; }
};

} // namespace vaultclient
