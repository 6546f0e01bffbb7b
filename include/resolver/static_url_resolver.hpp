#pragma once

#include "resolver/iurl_resolver.hpp"

#include <string>

namespace vaultclient {

/**
 * @brief Returns a fixed URL (e.g. from the config file) after validation
 */
class StaticUrlResolver : public IUrlResolver {
public:
    explicit StaticUrlResolver(std::string url) : url_(std::move(url)) {}

    [[nodiscard]] Result<std::string> resolve() const override;

private:
    std::string url_;
};

} // namespace vaultclient
