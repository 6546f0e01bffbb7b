#pragma once

#include <string>

namespace vaultclient::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kVaultTokenHeader = "X-Vault-Token";
inline const std::string kVaultRequestHeader = "X-Vault-Request";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kApiPrefix = "/v1/";

} // namespace vaultclient::http
