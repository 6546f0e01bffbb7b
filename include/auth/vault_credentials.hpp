#pragma once

#include "core/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vaultclient {

/**
 * @brief Lease metadata returned alongside a login token
 */
struct LeaseInfo {
    std::string accessor;
    int64_t lease_duration_seconds = 0;  // 0 = does not expire
    bool renewable = false;
    std::vector<std::string> policies;
};

/**
 * @brief Opaque Vault token plus optional lease metadata. Immutable.
 */
class VaultCredentials {
public:
    explicit VaultCredentials(std::string token,
                              std::optional<LeaseInfo> lease = std::nullopt)
        : token_(std::move(token)), lease_(std::move(lease)) {}

    [[nodiscard]] const std::string& token() const { return token_; }
    [[nodiscard]] const std::optional<LeaseInfo>& lease() const { return lease_; }

    // A blank token is never usable
    [[nodiscard]] bool has_token() const { return !utils::is_blank(token_); }

private:
    std::string token_;
    std::optional<LeaseInfo> lease_;
};

} // namespace vaultclient
