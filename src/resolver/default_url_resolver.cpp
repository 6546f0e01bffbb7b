#include "resolver/default_url_resolver.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

namespace vaultclient {

namespace {

bool is_usable(const std::optional<std::string>& value) {
    return value && !utils::is_blank(*value) && parse_url(*value).has_value();
}

} // anonymous namespace

DefaultUrlResolver::DefaultUrlResolver(const SystemProperties& properties)
    : properties_(properties) {}

Result<std::string> DefaultUrlResolver::resolve() const {
    const auto env_url = utils::get_env(kVaultAddrEnvVar);
    if (is_usable(env_url)) {
        return Result<std::string>::ok(*env_url);
    }

    const auto prop_url = properties_.get(kVaultAddrProperty);
    if (is_usable(prop_url)) {
        return Result<std::string>::ok(*prop_url);
    }

    return Result<std::string>::error(ErrorCategory::CONFIGURATION_ERROR,
        "Failed to resolve the Vault URL from the environment and/or system properties.");
}

} // namespace vaultclient
