#include "auth/system_properties_credentials_provider.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultclient {

SystemPropertiesCredentialsProvider::SystemPropertiesCredentialsProvider(
    std::string property, const SystemProperties& properties)
    : property_(std::move(property)), properties_(properties) {}

Result<VaultCredentials> SystemPropertiesCredentialsProvider::get_credentials() {
    const auto token = properties_.get(property_);
    if (!token || utils::is_blank(*token)) {
        return Result<VaultCredentials>::error(ErrorCategory::RESOLUTION_ERROR,
            std::format("System property {} is not set", property_));
    }
    return Result<VaultCredentials>::ok(VaultCredentials(*token));
}

std::string SystemPropertiesCredentialsProvider::name() const {
    return "property:" + property_;
}

} // namespace vaultclient
