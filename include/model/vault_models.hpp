#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vaultclient {

// ============================================================================
// Response DTOs
// ============================================================================

// Generic secret read (GET /v1/<path>)
struct VaultResponse {
    std::string request_id;
    std::string lease_id;
    bool renewable = false;
    int64_t lease_duration = 0;
    // Non-string values are kept as compact JSON text
    std::map<std::string, std::string> data;
};

// LIST /v1/<path>
struct VaultListResponse {
    std::vector<std::string> keys;
};

// PUT /v1/sys/init
struct VaultInitResponse {
    std::vector<std::string> keys;
    std::vector<std::string> keys_base64;
    std::string root_token;
};

// GET /v1/sys/seal-status, PUT /v1/sys/unseal
struct VaultSealStatusResponse {
    bool initialized = false;
    bool sealed = true;
    int threshold = 0;    // "t"
    int shares = 0;       // "n"
    int progress = 0;
    std::string version;
};

// GET /v1/sys/health
struct VaultHealthResponse {
    bool initialized = false;
    bool sealed = false;
    bool standby = false;
    int64_t server_time_utc = 0;
    std::string version;
    std::string cluster_name;
};

// GET /v1/sys/policy/<name>
struct VaultPolicy {
    std::string name;
    std::string rules;
};

// GET /v1/auth/token/lookup-self
struct VaultTokenInfo {
    std::string accessor;
    std::string display_name;
    std::vector<std::string> policies;
    int64_t ttl = 0;
    bool renewable = false;
};

// "auth" block of a login response
struct VaultAuthResponse {
    std::string client_token;
    std::string accessor;
    std::vector<std::string> policies;
    int64_t lease_duration = 0;
    bool renewable = false;
};

// ============================================================================
// Parsers (body text -> DTO). Invalid JSON or wrong shape -> PARSE_ERROR.
// ============================================================================

[[nodiscard]] Result<VaultResponse> parse_vault_response(const std::string& body);
[[nodiscard]] Result<VaultListResponse> parse_list_response(const std::string& body);
[[nodiscard]] Result<VaultInitResponse> parse_init_response(const std::string& body);
[[nodiscard]] Result<VaultSealStatusResponse> parse_seal_status_response(const std::string& body);
[[nodiscard]] Result<VaultHealthResponse> parse_health_response(const std::string& body);
[[nodiscard]] Result<std::vector<std::string>> parse_policy_list_response(const std::string& body);
[[nodiscard]] Result<VaultPolicy> parse_policy_response(const std::string& body);
[[nodiscard]] Result<VaultTokenInfo> parse_token_lookup_response(const std::string& body);
[[nodiscard]] Result<VaultAuthResponse> parse_auth_response(const std::string& body);

/**
 * @brief Extract the "errors" array of a Vault error body
 * @return Empty when the body is not JSON or carries no errors
 */
[[nodiscard]] std::vector<std::string> parse_error_messages(const std::string& body);

} // namespace vaultclient
