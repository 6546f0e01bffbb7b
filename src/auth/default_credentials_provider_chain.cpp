#include "auth/default_credentials_provider_chain.hpp"
#include "auth/environment_credentials_provider.hpp"
#include "auth/system_properties_credentials_provider.hpp"

namespace vaultclient {

std::shared_ptr<CredentialsProviderChain> make_default_credentials_provider_chain(
    const SystemProperties& properties) {
    return std::make_shared<CredentialsProviderChain>(
        std::vector<std::shared_ptr<ICredentialsProvider>>{
            std::make_shared<EnvironmentCredentialsProvider>(),
            std::make_shared<SystemPropertiesCredentialsProvider>(kVaultTokenProperty, properties),
        });
}

} // namespace vaultclient
