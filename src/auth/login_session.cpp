#include "auth/login_session.hpp"
#include "http/http_constants.hpp"
#include "model/vault_models.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace vaultclient {

namespace {

// Longer leases are treated as this long when scheduling the refresh
constexpr int64_t kMaxLeaseSeconds = int64_t{10} * 365 * 24 * 3600;

} // anonymous namespace

LoginSession::LoginSession(std::shared_ptr<IHttpTransport> transport,
                           std::string login_path,
                           std::string method_label,
                           Clock clock)
    : transport_(std::move(transport)),
      login_path_(std::move(login_path)),
      method_label_(std::move(method_label)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (!transport_) {
        throw VaultClientException(ErrorCategory::CONFIGURATION_ERROR,
            std::format("{} login requires an HTTP transport", method_label_));
    }
}

Result<VaultCredentials> LoginSession::get_credentials(const std::string& request_body) {
    std::lock_guard lock(mutex_);

    const auto now = clock_();
    if (cached_ && (!refresh_at_ || now < *refresh_at_)) {
        return Result<VaultCredentials>::ok(*cached_);
    }
    cached_.reset();
    refresh_at_.reset();

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.path = login_path_;
    request.headers.emplace(http::kVaultRequestHeader, "true");
    request.body = request_body;

    const auto sent = transport_->send(request);
    if (sent.is_error()) {
        return Result<VaultCredentials>::error(ErrorCategory::UNEXPECTED_ERROR,
            std::format("{} login failed: {}", method_label_, sent.error_message()));
    }

    const auto& response = sent.value();
    if (!response.is_success()) {
        const auto errors = parse_error_messages(response.body);
        const auto category = (response.status >= 400 && response.status < 500)
            ? ErrorCategory::RESOLUTION_ERROR
            : ErrorCategory::UNEXPECTED_ERROR;
        return Result<VaultCredentials>::error(category,
            std::format("{} login rejected: status={}, errors=[{}]",
                        method_label_, response.status, utils::join(errors, ", ")));
    }

    auto auth = parse_auth_response(response.body);
    if (auth.is_error()) {
        return Result<VaultCredentials>::error(ErrorCategory::UNEXPECTED_ERROR,
            std::format("{} login: {}", method_label_, auth.error_message()));
    }
    if (utils::is_blank(auth.value().client_token)) {
        return Result<VaultCredentials>::error(ErrorCategory::UNEXPECTED_ERROR,
            std::format("{} login returned no client token", method_label_));
    }

    auto& a = auth.value();
    LeaseInfo lease;
    lease.accessor = a.accessor;
    lease.lease_duration_seconds = a.lease_duration;
    lease.renewable = a.renewable;
    lease.policies = a.policies;

    if (a.lease_duration > 0) {
        // Refresh at 90% of the lease
        const int64_t lease_seconds = std::min(a.lease_duration, kMaxLeaseSeconds);
        refresh_at_ = now + std::chrono::milliseconds(lease_seconds * 900);
    }
    cached_.emplace(std::move(a.client_token), std::move(lease));

    utils::log::info(std::format("{} login succeeded (lease {}s)",
                                 method_label_, a.lease_duration));
    return Result<VaultCredentials>::ok(*cached_);
}

} // namespace vaultclient
