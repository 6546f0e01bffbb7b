#include "auth/approle_credentials_provider.hpp"
#include "http/http_constants.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultclient {

AppRoleCredentialsProvider::AppRoleCredentialsProvider(
    AppRoleConfig config, std::shared_ptr<IHttpTransport> transport,
    LoginSession::Clock clock)
    : config_(std::move(config)),
      session_(std::move(transport),
               std::format("{}auth/{}/login", http::kApiPrefix, config_.mount),
               "approle", std::move(clock)) {}

Result<VaultCredentials> AppRoleCredentialsProvider::get_credentials() {
    if (utils::is_blank(config_.role_id)) {
        return Result<VaultCredentials>::error(ErrorCategory::RESOLUTION_ERROR,
                                               "No approle role_id configured");
    }

    JsonValue body = JsonValue::object();
    body.set("role_id", config_.role_id);
    if (!config_.secret_id.empty()) {
        body.set("secret_id", config_.secret_id);
    }
    return session_.get_credentials(body.dump());
}

std::string AppRoleCredentialsProvider::name() const {
    return "approle@" + config_.mount;
}

} // namespace vaultclient
