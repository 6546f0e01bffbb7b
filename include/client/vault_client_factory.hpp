#pragma once

#include "client/vault_client.hpp"
#include "config/config_loader.hpp"
#include "resolver/iurl_resolver.hpp"

#include <memory>

namespace vaultclient {

/**
 * @brief Assembles VaultClient instances from resolvers, providers and config
 *
 * The transport is a RetryingTransport over an HttplibTransport bound to
 * the resolved URL. URL resolution failures come back as CONFIGURATION_ERROR.
 */
class VaultClientFactory {
public:
    // DefaultUrlResolver + default credentials chain + default HTTP settings
    [[nodiscard]] static Result<std::shared_ptr<VaultClient>> create();

    [[nodiscard]] static Result<std::shared_ptr<VaultClient>> create(
        const IUrlResolver& url_resolver,
        std::shared_ptr<ICredentialsProvider> credentials_provider,
        const HttpConfig& http_config = {});

    /**
     * @brief Build a client from a loaded config file
     *
     * Applies the log level and [properties] first, then builds the chain
     * [static token, VAULT_TOKEN, vault.token, userpass, approle], keeping
     * only the entries the config enables.
     */
    [[nodiscard]] static Result<std::shared_ptr<VaultClient>> create_from_config(
        const ClientConfig& config,
        SystemProperties& properties = SystemProperties::instance());

    [[nodiscard]] static std::shared_ptr<IHttpTransport> make_transport(
        const std::string& base_url, const HttpConfig& http_config);
};

} // namespace vaultclient
