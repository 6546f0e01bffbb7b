#include "auth/static_credentials_provider.hpp"
#include "core/utils.hpp"

namespace vaultclient {

StaticCredentialsProvider::StaticCredentialsProvider(std::string token)
    : token_(std::move(token)) {}

Result<VaultCredentials> StaticCredentialsProvider::get_credentials() {
    if (utils::is_blank(token_)) {
        return Result<VaultCredentials>::error(ErrorCategory::RESOLUTION_ERROR,
                                               "No static token configured");
    }
    return Result<VaultCredentials>::ok(VaultCredentials(token_));
}

} // namespace vaultclient
