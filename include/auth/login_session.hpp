#pragma once

#include "auth/vault_credentials.hpp"
#include "core/error.hpp"
#include "http/ihttp_transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vaultclient {

/**
 * @brief Performs a Vault auth-method login and caches the resulting token
 *
 * Shared by the login-based providers. The token is reused until 90% of its
 * lease has elapsed (lease_duration 0 never expires). Logins are serialised
 * so concurrent callers trigger at most one request.
 *
 * Error tagging follows ICredentialsProvider: a 4xx rejection is a
 * RESOLUTION_ERROR (this method is not usable), everything else that goes
 * wrong is UNEXPECTED_ERROR.
 */
class LoginSession {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    // An empty clock reads std::chrono::steady_clock
    LoginSession(std::shared_ptr<IHttpTransport> transport,
                 std::string login_path,
                 std::string method_label,
                 Clock clock = {});

    /**
     * @param request_body JSON login body, sent only when no valid token is cached
     */
    [[nodiscard]] Result<VaultCredentials> get_credentials(const std::string& request_body);

private:
    std::shared_ptr<IHttpTransport> transport_;
    std::string login_path_;
    std::string method_label_;
    Clock clock_;

    std::optional<VaultCredentials> cached_;
    std::optional<std::chrono::steady_clock::time_point> refresh_at_;
    std::mutex mutex_;
};

} // namespace vaultclient
