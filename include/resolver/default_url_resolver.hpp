#pragma once

#include "config/system_properties.hpp"
#include "resolver/iurl_resolver.hpp"

namespace vaultclient {

inline constexpr const char* kVaultAddrEnvVar = "VAULT_ADDR";
inline constexpr const char* kVaultAddrProperty = "vault.addr";

/**
 * @brief Resolves the URL from VAULT_ADDR, then the "vault.addr" property
 *
 * A source is used only if it is non-blank and parses as an absolute
 * http/https URL. No caching: every call re-reads both sources.
 */
class DefaultUrlResolver : public IUrlResolver {
public:
    explicit DefaultUrlResolver(const SystemProperties& properties = SystemProperties::instance());

    [[nodiscard]] Result<std::string> resolve() const override;

private:
    const SystemProperties& properties_;
};

} // namespace vaultclient
