#include "auth/credentials_provider_chain.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultclient {

namespace {

std::vector<std::shared_ptr<ICredentialsProvider>> validated(
    std::vector<std::shared_ptr<ICredentialsProvider>> providers) {
    if (providers.empty()) {
        throw VaultClientException(ErrorCategory::CONFIGURATION_ERROR,
                                   "No credentials providers specified");
    }
    for (const auto& provider : providers) {
        if (!provider) {
            throw VaultClientException(ErrorCategory::CONFIGURATION_ERROR,
                                       "Null credentials provider in chain");
        }
    }
    return providers;
}

} // anonymous namespace

CredentialsProviderChain::CredentialsProviderChain(
    std::vector<std::shared_ptr<ICredentialsProvider>> providers)
    : providers_(validated(std::move(providers))) {}

Result<VaultCredentials> CredentialsProviderChain::invoke(ICredentialsProvider& provider) {
    try {
        return provider.get_credentials();
    } catch (const std::exception& e) {
        return Result<VaultCredentials>::error(ErrorCategory::UNEXPECTED_ERROR, e.what());
    } catch (...) {
        return Result<VaultCredentials>::error(ErrorCategory::UNEXPECTED_ERROR,
            std::format("Credentials provider {} threw a non-standard exception",
                        provider.name()));
    }
}

CredentialsProviderChain::Outcome CredentialsProviderChain::classify(
    const Result<VaultCredentials>& result) {
    if (result.is_ok()) {
        return result.value().has_token() ? Outcome::SUCCESS : Outcome::BLANK_TOKEN;
    }
    return result.error_category() == ErrorCategory::RESOLUTION_ERROR
        ? Outcome::RESOLUTION_ERROR
        : Outcome::UNEXPECTED_ERROR;
}

Result<VaultCredentials> CredentialsProviderChain::get_credentials() {
    if (reuse_last_provider()) {
        if (auto last = last_used_provider()) {
            return invoke(*last);
        }
    }

    for (const auto& provider : providers_) {
        auto result = invoke(*provider);

        switch (classify(result)) {
            case Outcome::SUCCESS: {
                std::lock_guard lock(last_used_mutex_);
                last_used_provider_ = provider;
                return result;
            }
            case Outcome::BLANK_TOKEN:
                utils::log::debug(std::format(
                    "Credentials provider {} returned a blank token, moving on to next provider",
                    provider->name()));
                break;
            case Outcome::RESOLUTION_ERROR:
                utils::log::debug(std::format(
                    "Failed to resolve Vault credentials with provider {}: {}. "
                    "Moving on to next provider",
                    provider->name(), result.error_message()));
                break;
            case Outcome::UNEXPECTED_ERROR:
                utils::log::warn(std::format(
                    "Unexpected error getting credentials with provider {} ({}): {}",
                    provider->name(), error_category_to_string(result.error_category()),
                    result.error_message()));
                break;
        }
    }

    return Result<VaultCredentials>::error(ErrorCategory::CREDENTIALS_EXHAUSTED,
        "Unable to find credentials from any provider in the specified chain");
}

std::string CredentialsProviderChain::name() const {
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& provider : providers_) {
        names.emplace_back(provider->name());
    }
    return std::format("chain[{}]", utils::join(names, ", "));
}

std::shared_ptr<ICredentialsProvider> CredentialsProviderChain::last_used_provider() const {
    std::lock_guard lock(last_used_mutex_);
    return last_used_provider_;
}

} // namespace vaultclient
