#include "http/retrying_transport.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace vaultclient {

RetryingTransport::RetryingTransport(std::shared_ptr<IHttpTransport> inner, Config config,
                                     Sleeper sleeper)
    : inner_(std::move(inner)), config_(config), sleeper_(std::move(sleeper)) {
    if (!inner_) {
        throw VaultClientException(ErrorCategory::CONFIGURATION_ERROR,
                                   "RetryingTransport requires an inner transport");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

bool RetryingTransport::is_retryable_status(int status) {
    return status == 500 || status == 502 || status == 503 || status == 504;
}

std::chrono::milliseconds RetryingTransport::backoff_delay(int attempt) const {
    // Cap the shift; the max_delay clamp below makes larger exponents moot
    const int shift = std::clamp(attempt, 0, 20);
    const auto delay = config_.base_delay * (int64_t{1} << shift);
    return std::min<std::chrono::milliseconds>(delay, config_.max_delay);
}

Result<HttpResponse> RetryingTransport::send(const HttpRequest& request) {
    const int max_retries = std::max(0, config_.max_retries);

    for (int attempt = 0;; ++attempt) {
        auto result = inner_->send(request);

        const bool retryable = result.is_error()
            ? result.error_category() == ErrorCategory::TRANSPORT_ERROR
            : is_retryable_status(result.value().status);

        if (!retryable || attempt >= max_retries) {
            return result;
        }

        const auto delay = backoff_delay(attempt);
        utils::log::warn(std::format("{} {} attempt {}/{} failed ({}), retrying in {} ms",
            http_method_to_string(request.method), request.path, attempt + 1, max_retries + 1,
            result.is_error() ? result.error_message()
                              : std::format("status {}", result.value().status),
            delay.count()));
        sleeper_(delay);
    }
}

} // namespace vaultclient
