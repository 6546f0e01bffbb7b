#pragma once

#include "auth/icredentials_provider.hpp"
#include "auth/login_session.hpp"

#include <memory>
#include <string>

namespace vaultclient {

struct AppRoleConfig {
    std::string role_id;
    std::string secret_id;   // May be empty when the role does not bind secret ids
    std::string mount = "approle";
};

/**
 * @brief Logs in with the AppRole auth method
 *
 * POST /v1/auth/<mount>/login {"role_id": "...", "secret_id": "..."}
 */
class AppRoleCredentialsProvider : public ICredentialsProvider {
public:
    AppRoleCredentialsProvider(AppRoleConfig config,
                               std::shared_ptr<IHttpTransport> transport,
                               LoginSession::Clock clock = {});

    [[nodiscard]] Result<VaultCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override;

private:
    AppRoleConfig config_;
    LoginSession session_;
};

} // namespace vaultclient
