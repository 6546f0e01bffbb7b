#include "client/vault_client.hpp"
#include "http/http_constants.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>

namespace vaultclient {

namespace {

template<typename T>
Result<T> server_error(const HttpResponse& response) {
    const auto errors = parse_error_messages(response.body);
    return Result<T>::error(ErrorCategory::SERVER_ERROR,
        std::format("Response from Vault: status={}, errors=[{}]",
                    response.status, utils::join(errors, ", ")));
}

bool status_in(const HttpResponse& response, std::initializer_list<int> codes) {
    return std::find(codes.begin(), codes.end(), response.status) != codes.end();
}

// Map a response with no payload: success statuses -> ok, else server error
Result<void> expect_no_content(const Result<HttpResponse>& sent) {
    if (sent.is_error()) return Result<void>::error_from(sent);
    if (!status_in(sent.value(), {200, 204})) return server_error<void>(sent.value());
    return Result<void>::ok();
}

template<typename T, typename Parser>
Result<T> expect_body(const Result<HttpResponse>& sent, Parser parser) {
    if (sent.is_error()) return Result<T>::error_from(sent);
    if (sent.value().status != 200) return server_error<T>(sent.value());
    return parser(sent.value().body);
}

// Policy names are a single path segment
std::string policy_path(const std::string& name) {
    return "sys/policy/" + encode_path_segment(name);
}

} // anonymous namespace

VaultClient::VaultClient(const std::string& base_url,
                         std::shared_ptr<ICredentialsProvider> credentials_provider,
                         std::shared_ptr<IHttpTransport> transport)
    : credentials_provider_(std::move(credentials_provider)),
      transport_(std::move(transport)) {
    auto parsed = parse_url(base_url);
    if (!parsed) {
        throw VaultClientException(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Invalid Vault URL: '{}'", base_url));
    }
    if (!credentials_provider_ || !transport_) {
        throw VaultClientException(ErrorCategory::CONFIGURATION_ERROR,
            "VaultClient requires a credentials provider and an HTTP transport");
    }
    base_url_ = std::move(*parsed);
}

Result<std::string> VaultClient::api_path(const std::string& path) {
    const auto start = path.find_first_not_of('/');
    if (start == std::string::npos) {
        return Result<std::string>::error(ErrorCategory::CONFIGURATION_ERROR,
                                          "Vault path must not be empty");
    }
    return Result<std::string>::ok(http::kApiPrefix + path.substr(start));
}

Result<HttpResponse> VaultClient::execute(HttpMethod method,
                                          const std::string& path,
                                          std::string body,
                                          Auth auth) {
    auto full_path = api_path(path);
    if (full_path.is_error()) return Result<HttpResponse>::error_from(full_path);

    HttpRequest request;
    request.method = method;
    request.path = std::move(full_path.value());
    request.body = std::move(body);
    request.headers.emplace(http::kVaultRequestHeader, "true");

    if (auth == Auth::REQUIRED) {
        auto credentials = credentials_provider_->get_credentials();
        if (credentials.is_error()) {
            return Result<HttpResponse>::error_from(credentials);
        }
        if (!credentials.value().has_token()) {
            return Result<HttpResponse>::error(ErrorCategory::RESOLUTION_ERROR,
                std::format("Credentials provider {} returned a blank token",
                            credentials_provider_->name()));
        }
        request.headers.emplace(http::kVaultTokenHeader, credentials.value().token());
    }

    return transport_->send(request);
}

// ============================================================================
// Secrets
// ============================================================================

Result<VaultResponse> VaultClient::read(const std::string& path) {
    return expect_body<VaultResponse>(
        execute(HttpMethod::GET, path, {}, Auth::REQUIRED), parse_vault_response);
}

Result<VaultListResponse> VaultClient::list(const std::string& path) {
    const auto sent = execute(HttpMethod::LIST, path, {}, Auth::REQUIRED);
    if (sent.is_ok() && sent.value().status == 404) {
        return Result<VaultListResponse>::ok(VaultListResponse{});
    }
    return expect_body<VaultListResponse>(sent, parse_list_response);
}

Result<void> VaultClient::write(const std::string& path,
                                const std::map<std::string, std::string>& data) {
    JsonValue body = JsonValue::object();
    for (const auto& [key, value] : data) {
        body.set(key, value);
    }
    return expect_no_content(execute(HttpMethod::POST, path, body.dump(), Auth::REQUIRED));
}

Result<void> VaultClient::remove(const std::string& path) {
    return expect_no_content(execute(HttpMethod::DELETE, path, {}, Auth::REQUIRED));
}

// ============================================================================
// System
// ============================================================================

Result<VaultInitResponse> VaultClient::init(int secret_shares, int secret_threshold) {
    if (secret_shares < 1 || secret_threshold < 1 || secret_threshold > secret_shares) {
        return Result<VaultInitResponse>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Invalid init parameters: shares={}, threshold={}",
                        secret_shares, secret_threshold));
    }

    JsonValue body = JsonValue::object();
    body.set("secret_shares", secret_shares);
    body.set("secret_threshold", secret_threshold);
    return expect_body<VaultInitResponse>(
        execute(HttpMethod::PUT, "sys/init", body.dump(), Auth::NONE), parse_init_response);
}

Result<VaultSealStatusResponse> VaultClient::seal_status() {
    return expect_body<VaultSealStatusResponse>(
        execute(HttpMethod::GET, "sys/seal-status", {}, Auth::NONE),
        parse_seal_status_response);
}

Result<VaultSealStatusResponse> VaultClient::unseal(const std::string& key) {
    JsonValue body = JsonValue::object();
    body.set("key", key);
    return expect_body<VaultSealStatusResponse>(
        execute(HttpMethod::PUT, "sys/unseal", body.dump(), Auth::NONE),
        parse_seal_status_response);
}

Result<VaultHealthResponse> VaultClient::health() {
    const auto sent = execute(HttpMethod::GET, "sys/health", {}, Auth::NONE);
    if (sent.is_error()) return Result<VaultHealthResponse>::error_from(sent);

    // 429 standby, 472 DR secondary, 473 perf standby, 501 uninitialised, 503 sealed
    if (!status_in(sent.value(), {200, 429, 472, 473, 501, 503})) {
        return server_error<VaultHealthResponse>(sent.value());
    }
    return parse_health_response(sent.value().body);
}

// ============================================================================
// Policies
// ============================================================================

Result<std::vector<std::string>> VaultClient::list_policies() {
    return expect_body<std::vector<std::string>>(
        execute(HttpMethod::GET, "sys/policy", {}, Auth::REQUIRED),
        parse_policy_list_response);
}

Result<VaultPolicy> VaultClient::read_policy(const std::string& name) {
    if (utils::is_blank(name)) {
        return Result<VaultPolicy>::error(ErrorCategory::CONFIGURATION_ERROR,
                                          "Policy name must not be empty");
    }
    auto policy = expect_body<VaultPolicy>(
        execute(HttpMethod::GET, policy_path(name), {}, Auth::REQUIRED),
        parse_policy_response);
    if (policy.is_ok() && policy.value().name.empty()) {
        policy.value().name = name;
    }
    return policy;
}

Result<void> VaultClient::write_policy(const std::string& name, const std::string& rules) {
    if (utils::is_blank(name)) {
        return Result<void>::error(ErrorCategory::CONFIGURATION_ERROR,
                                   "Policy name must not be empty");
    }
    JsonValue body = JsonValue::object();
    body.set("rules", rules);
    return expect_no_content(
        execute(HttpMethod::PUT, policy_path(name), body.dump(), Auth::REQUIRED));
}

Result<void> VaultClient::delete_policy(const std::string& name) {
    if (utils::is_blank(name)) {
        return Result<void>::error(ErrorCategory::CONFIGURATION_ERROR,
                                   "Policy name must not be empty");
    }
    return expect_no_content(
        execute(HttpMethod::DELETE, policy_path(name), {}, Auth::REQUIRED));
}

// ============================================================================
// Token
// ============================================================================

Result<VaultTokenInfo> VaultClient::lookup_self() {
    return expect_body<VaultTokenInfo>(
        execute(HttpMethod::GET, "auth/token/lookup-self", {}, Auth::REQUIRED),
        parse_token_lookup_response);
}

} // namespace vaultclient
