#pragma once

#include "auth/icredentials_provider.hpp"
#include "config/system_properties.hpp"

#include <string>

namespace vaultclient {

inline constexpr const char* kVaultTokenProperty = "vault.token";

/**
 * @brief Reads the token from the process property store ("vault.token" by default)
 */
class SystemPropertiesCredentialsProvider : public ICredentialsProvider {
public:
    explicit SystemPropertiesCredentialsProvider(
        std::string property = kVaultTokenProperty,
        const SystemProperties& properties = SystemProperties::instance());

    [[nodiscard]] Result<VaultCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override;

private:
    std::string property_;
    const SystemProperties& properties_;
};

} // namespace vaultclient
