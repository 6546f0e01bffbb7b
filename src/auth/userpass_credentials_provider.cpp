#include "auth/userpass_credentials_provider.hpp"
#include "http/http_constants.hpp"
#include "core/url.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultclient {

UserPassCredentialsProvider::UserPassCredentialsProvider(
    UserPassConfig config, std::shared_ptr<IHttpTransport> transport,
    LoginSession::Clock clock)
    : config_(std::move(config)),
      session_(std::move(transport),
               std::format("{}auth/{}/login/{}", http::kApiPrefix,
                           config_.mount, encode_path_segment(config_.username)),
               "userpass", std::move(clock)) {}

Result<VaultCredentials> UserPassCredentialsProvider::get_credentials() {
    if (utils::is_blank(config_.username)) {
        return Result<VaultCredentials>::error(ErrorCategory::RESOLUTION_ERROR,
                                               "No userpass username configured");
    }

    JsonValue body = JsonValue::object();
    body.set("password", config_.password);
    return session_.get_credentials(body.dump());
}

std::string UserPassCredentialsProvider::name() const {
    return std::format("userpass:{}@{}", config_.username, config_.mount);
}

} // namespace vaultclient
