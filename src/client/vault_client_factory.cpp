#include "client/vault_client_factory.hpp"
#include "auth/approle_credentials_provider.hpp"
#include "auth/credentials_provider_chain.hpp"
#include "auth/default_credentials_provider_chain.hpp"
#include "auth/environment_credentials_provider.hpp"
#include "auth/static_credentials_provider.hpp"
#include "auth/system_properties_credentials_provider.hpp"
#include "auth/userpass_credentials_provider.hpp"
#include "http/retrying_transport.hpp"
#include "resolver/default_url_resolver.hpp"
#include "resolver/static_url_resolver.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultclient {

using ClientResult = Result<std::shared_ptr<VaultClient>>;

std::shared_ptr<IHttpTransport> VaultClientFactory::make_transport(
    const std::string& base_url, const HttpConfig& http_config) {
    auto inner = std::make_shared<HttplibTransport>(base_url, http_config);
    return std::make_shared<RetryingTransport>(std::move(inner),
        RetryingTransport::Config{
            .max_retries = http_config.max_retries,
            .base_delay = http_config.retry_base_delay,
            .max_delay = http_config.retry_max_delay,
        });
}

ClientResult VaultClientFactory::create() {
    return create(DefaultUrlResolver(), make_default_credentials_provider_chain());
}

ClientResult VaultClientFactory::create(const IUrlResolver& url_resolver,
                                        std::shared_ptr<ICredentialsProvider> credentials_provider,
                                        const HttpConfig& http_config) {
    const auto url = url_resolver.resolve();
    if (url.is_error()) return ClientResult::error_from(url);

    try {
        auto transport = make_transport(url.value(), http_config);
        return ClientResult::ok(std::make_shared<VaultClient>(
            url.value(), std::move(credentials_provider), std::move(transport)));
    } catch (const VaultClientException& e) {
        return ClientResult::error(e.category(), e.what());
    }
}

ClientResult VaultClientFactory::create_from_config(const ClientConfig& config,
                                                    SystemProperties& properties) {
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
    config.apply_properties(properties);

    const auto url = config.vault.address.empty()
        ? DefaultUrlResolver(properties).resolve()
        : StaticUrlResolver(config.vault.address).resolve();
    if (url.is_error()) return ClientResult::error_from(url);

    try {
        auto transport = make_transport(url.value(), config.http);

        std::vector<std::shared_ptr<ICredentialsProvider>> providers;
        if (!config.vault.token.empty()) {
            providers.push_back(std::make_shared<StaticCredentialsProvider>(config.vault.token));
        }
        providers.push_back(std::make_shared<EnvironmentCredentialsProvider>());
        providers.push_back(std::make_shared<SystemPropertiesCredentialsProvider>(
            kVaultTokenProperty, properties));
        if (config.auth.userpass) {
            providers.push_back(std::make_shared<UserPassCredentialsProvider>(
                *config.auth.userpass, transport));
        }
        if (config.auth.approle) {
            providers.push_back(std::make_shared<AppRoleCredentialsProvider>(
                *config.auth.approle, transport));
        }

        auto chain = std::make_shared<CredentialsProviderChain>(std::move(providers));
        chain->set_reuse_last_provider(config.auth.reuse_last_provider);

        utils::log::debug(std::format("Vault client for {} using {}", url.value(), chain->name()));
        return ClientResult::ok(std::make_shared<VaultClient>(
            url.value(), std::move(chain), std::move(transport)));
    } catch (const VaultClientException& e) {
        return ClientResult::error(e.category(), e.what());
    }
}

} // namespace vaultclient
