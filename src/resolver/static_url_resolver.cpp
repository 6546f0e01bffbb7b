#include "resolver/static_url_resolver.hpp"
#include "core/url.hpp"

#include <format>

namespace vaultclient {

Result<std::string> StaticUrlResolver::resolve() const {
    if (!parse_url(url_)) {
        return Result<std::string>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Configured Vault URL is not valid: '{}'", url_));
    }
    return Result<std::string>::ok(url_);
}

} // namespace vaultclient
