#pragma once

#include "http/ihttp_transport.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace vaultclient {

/**
 * @brief Decorator retrying transient failures with exponential backoff
 *
 * Retried: transport errors and status 500/502/503/504. Delay before retry
 * n (0-based) is min(base_delay * 2^n, max_delay). The last outcome is
 * returned unchanged once retries are used up.
 */
class RetryingTransport : public IHttpTransport {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Config {
        int max_retries = 3;
        std::chrono::milliseconds base_delay{100};
        std::chrono::milliseconds max_delay{2000};
    };

    RetryingTransport(std::shared_ptr<IHttpTransport> inner, Config config,
                      Sleeper sleeper = {});

    [[nodiscard]] Result<HttpResponse> send(const HttpRequest& request) override;

    [[nodiscard]] static bool is_retryable_status(int status);
    [[nodiscard]] std::chrono::milliseconds backoff_delay(int attempt) const;

private:
    std::shared_ptr<IHttpTransport> inner_;
    Config config_;
    Sleeper sleeper_;
};

} // namespace vaultclient
