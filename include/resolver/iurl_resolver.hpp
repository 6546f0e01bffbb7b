#pragma once

#include "core/error.hpp"

#include <string>

namespace vaultclient {

/**
 * @brief Determines the Vault base URL
 *
 * Fails with CONFIGURATION_ERROR when no source yields a valid URL.
 */
class IUrlResolver {
public:
    virtual ~IUrlResolver() = default;

    [[nodiscard]] virtual Result<std::string> resolve() const = 0;
};

} // namespace vaultclient
