#pragma once

#include "auth/icredentials_provider.hpp"
#include "auth/login_session.hpp"

#include <memory>
#include <string>

namespace vaultclient {

struct UserPassConfig {
    std::string username;
    std::string password;
    std::string mount = "userpass";
};

/**
 * @brief Logs in with the userpass auth method
 *
 * POST /v1/auth/<mount>/login/<username> {"password": "..."}
 */
class UserPassCredentialsProvider : public ICredentialsProvider {
public:
    UserPassCredentialsProvider(UserPassConfig config,
                                std::shared_ptr<IHttpTransport> transport,
                                LoginSession::Clock clock = {});

    [[nodiscard]] Result<VaultCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override;

private:
    UserPassConfig config_;
    LoginSession session_;
};

} // namespace vaultclient
