#pragma once

#include "auth/icredentials_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace vaultclient {

/**
 * @brief Ordered chain of credentials providers with memoisation
 *
 * Providers are tried in construction order; the first one returning a
 * non-blank token wins and is remembered. While reuse_last_provider is set
 * (the default), later calls go straight to the remembered provider and
 * return whatever it returns, failures included, without walking the
 * chain again.
 *
 * Individual provider failures never escape the walk. The only error the
 * chain originates is CREDENTIALS_EXHAUSTED once every provider has failed.
 *
 * Thread-safe: the remembered provider is guarded by a mutex and providers
 * are invoked outside of it. When two callers race on the first discovery
 * the slot ends up holding one of the winners.
 */
class CredentialsProviderChain : public ICredentialsProvider {
public:
    // Throws VaultClientException(CONFIGURATION_ERROR) if empty or holding null
    explicit CredentialsProviderChain(
        std::vector<std::shared_ptr<ICredentialsProvider>> providers);

    [[nodiscard]] Result<VaultCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] bool reuse_last_provider() const {
        return reuse_last_provider_.load(std::memory_order_acquire);
    }
    void set_reuse_last_provider(bool reuse) {
        reuse_last_provider_.store(reuse, std::memory_order_release);
    }

    // Provider that last produced credentials during a walk, or nullptr
    [[nodiscard]] std::shared_ptr<ICredentialsProvider> last_used_provider() const;

    [[nodiscard]] size_t provider_count() const { return providers_.size(); }

private:
    enum class Outcome { SUCCESS, BLANK_TOKEN, RESOLUTION_ERROR, UNEXPECTED_ERROR };

    // Invoke one provider; exceptions become UNEXPECTED_ERROR results
    [[nodiscard]] static Result<VaultCredentials> invoke(ICredentialsProvider& provider);
    [[nodiscard]] static Outcome classify(const Result<VaultCredentials>& result);

    const std::vector<std::shared_ptr<ICredentialsProvider>> providers_;
    std::atomic<bool> reuse_last_provider_{true};
    std::shared_ptr<ICredentialsProvider> last_used_provider_;
    mutable std::mutex last_used_mutex_;
};

} // namespace vaultclient
