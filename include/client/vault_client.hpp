#pragma once

#include "auth/icredentials_provider.hpp"
#include "core/error.hpp"
#include "core/url.hpp"
#include "http/ihttp_transport.hpp"
#include "model/vault_models.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vaultclient {

/**
 * @brief Facade over the Vault HTTP API
 *
 * Secret paths are relative to /v1/ ("secret/app/db", leading slashes are
 * ignored). Authenticated operations obtain credentials from the provider
 * before every request and fail without sending anything when no non-blank
 * token is available. sys/init, sys/seal-status, sys/unseal and sys/health
 * are sent without a token.
 *
 * Unexpected HTTP statuses become SERVER_ERROR carrying the status and the
 * server's "errors" list; undecodable bodies become PARSE_ERROR.
 */
class VaultClient {
public:
    // Throws VaultClientException(CONFIGURATION_ERROR) on an invalid base URL
    // or a null collaborator.
    //
    // Requests go wherever the transport is bound; base_url is only validated
    // and reported by base_url(). Callers pass the URL the transport was built
    // with, as VaultClientFactory does.
    VaultClient(const std::string& base_url,
                std::shared_ptr<ICredentialsProvider> credentials_provider,
                std::shared_ptr<IHttpTransport> transport);

    // ---- Secrets -----------------------------------------------------------

    [[nodiscard]] Result<VaultResponse> read(const std::string& path);

    // A 404 yields an empty key list
    [[nodiscard]] Result<VaultListResponse> list(const std::string& path);

    [[nodiscard]] Result<void> write(const std::string& path,
                                     const std::map<std::string, std::string>& data);

    [[nodiscard]] Result<void> remove(const std::string& path);

    // ---- System ------------------------------------------------------------

    [[nodiscard]] Result<VaultInitResponse> init(int secret_shares, int secret_threshold);
    [[nodiscard]] Result<VaultSealStatusResponse> seal_status();
    [[nodiscard]] Result<VaultSealStatusResponse> unseal(const std::string& key);

    // Accepts Vault's non-200 health codes (standby, sealed, uninitialised)
    [[nodiscard]] Result<VaultHealthResponse> health();

    // ---- Policies ----------------------------------------------------------

    [[nodiscard]] Result<std::vector<std::string>> list_policies();
    [[nodiscard]] Result<VaultPolicy> read_policy(const std::string& name);
    [[nodiscard]] Result<void> write_policy(const std::string& name, const std::string& rules);
    [[nodiscard]] Result<void> delete_policy(const std::string& name);

    // ---- Token -------------------------------------------------------------

    [[nodiscard]] Result<VaultTokenInfo> lookup_self();

    [[nodiscard]] const ParsedUrl& base_url() const { return base_url_; }
    [[nodiscard]] ICredentialsProvider& credentials_provider() { return *credentials_provider_; }

private:
    enum class Auth { REQUIRED, NONE };

    [[nodiscard]] Result<HttpResponse> execute(HttpMethod method,
                                               const std::string& path,
                                               std::string body,
                                               Auth auth);

    [[nodiscard]] static Result<std::string> api_path(const std::string& path);

    ParsedUrl base_url_;
    std::shared_ptr<ICredentialsProvider> credentials_provider_;
    std::shared_ptr<IHttpTransport> transport_;
};

} // namespace vaultclient
