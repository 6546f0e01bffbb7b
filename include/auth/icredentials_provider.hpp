#pragma once

#include "auth/vault_credentials.hpp"
#include "core/error.hpp"

#include <string>

namespace vaultclient {

/**
 * @brief Interface for credential sources
 *
 * Each provider reads a token from one source (environment, property store,
 * explicit value, login endpoint). CredentialsProviderChain tries providers
 * in order until one yields a non-blank token.
 *
 * Failure tagging:
 * - ErrorCategory::RESOLUTION_ERROR: the source simply has nothing to offer
 * - any other category: something went wrong (network, malformed response)
 */
class ICredentialsProvider {
public:
    virtual ~ICredentialsProvider() = default;

    [[nodiscard]] virtual Result<VaultCredentials> get_credentials() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace vaultclient
