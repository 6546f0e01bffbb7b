#pragma once

#include "auth/approle_credentials_provider.hpp"
#include "auth/userpass_credentials_provider.hpp"
#include "config/system_properties.hpp"
#include "http/httplib_transport.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace vaultclient {

// ============================================================================
// Vault server
// ============================================================================

struct VaultServerConfig {
    std::string address;   // Empty -> DefaultUrlResolver
    std::string token;     // Empty -> no static provider in the chain
};

// ============================================================================
// Authentication
// ============================================================================

struct AuthConfig {
    bool reuse_last_provider = true;
    std::optional<UserPassConfig> userpass;
    std::optional<AppRoleConfig> approle;
};

// ============================================================================
// Logging
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// ClientConfig - Complete parsed configuration
// ============================================================================

struct ClientConfig {
    VaultServerConfig vault;
    HttpConfig http;
    AuthConfig auth;
    LoggingConfig logging;
    std::unordered_map<std::string, std::string> properties;

    // Copy [properties] into a property store
    void apply_properties(SystemProperties& store) const;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string.
 *
 *   [vault]
 *   address = "https://vault.example.com:8200"
 *   token = "${VAULT_TOKEN}"
 *
 *   [http]
 *   connect_timeout_ms = 5000
 *   max_retries = 3
 *
 *   [auth.userpass]
 *   username = "deploy"
 *   password = "${DEPLOY_PASSWORD}"
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ClientConfig config;

        static LoadResult ok(ClientConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace vaultclient
