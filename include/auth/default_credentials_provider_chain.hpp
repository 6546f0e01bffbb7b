#pragma once

#include "auth/credentials_provider_chain.hpp"
#include "config/system_properties.hpp"

#include <memory>

namespace vaultclient {

/**
 * @brief Chain of [VAULT_TOKEN env, "vault.token" property]
 */
[[nodiscard]] std::shared_ptr<CredentialsProviderChain> make_default_credentials_provider_chain(
    const SystemProperties& properties = SystemProperties::instance());

} // namespace vaultclient
