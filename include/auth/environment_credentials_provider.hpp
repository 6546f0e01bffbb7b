#pragma once

#include "auth/icredentials_provider.hpp"

#include <string>

namespace vaultclient {

inline constexpr const char* kVaultTokenEnvVar = "VAULT_TOKEN";

/**
 * @brief Reads the token from an environment variable (VAULT_TOKEN by default)
 */
class EnvironmentCredentialsProvider : public ICredentialsProvider {
public:
    explicit EnvironmentCredentialsProvider(std::string env_var = kVaultTokenEnvVar);

    [[nodiscard]] Result<VaultCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override;

private:
    std::string env_var_;
};

} // namespace vaultclient
