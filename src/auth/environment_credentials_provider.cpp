#include "auth/environment_credentials_provider.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultclient {

EnvironmentCredentialsProvider::EnvironmentCredentialsProvider(std::string env_var)
    : env_var_(std::move(env_var)) {}

Result<VaultCredentials> EnvironmentCredentialsProvider::get_credentials() {
    const auto token = utils::get_env(env_var_);
    if (!token || utils::is_blank(*token)) {
        return Result<VaultCredentials>::error(ErrorCategory::RESOLUTION_ERROR,
            std::format("Environment variable {} is not set", env_var_));
    }
    return Result<VaultCredentials>::ok(VaultCredentials(*token));
}

std::string EnvironmentCredentialsProvider::name() const {
    return "env:" + env_var_;
}

} // namespace vaultclient
