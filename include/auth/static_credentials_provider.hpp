#pragma once

#include "auth/icredentials_provider.hpp"

#include <string>

namespace vaultclient {

/**
 * @brief Returns a token supplied at construction
 */
class StaticCredentialsProvider : public ICredentialsProvider {
public:
    explicit StaticCredentialsProvider(std::string token);

    [[nodiscard]] Result<VaultCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override { return "static"; }

private:
    std::string token_;
};

} // namespace vaultclient
