#include "model/vault_models.hpp"
#include "core/json.hpp"

#include <format>
#include <optional>

namespace vaultclient {

namespace {

// Parse body into an object; nullopt when not a JSON object
std::optional<JsonValue> parse_object(const std::string& body) {
    try {
        auto root = JsonValue::parse(body);
        if (!root.is_object()) return std::nullopt;
        return root;
    } catch (const JsonValue::parse_error&) {
        return std::nullopt;
    }
}

template<typename T>
Result<T> parse_failure(std::string_view what) {
    return Result<T>::error(ErrorCategory::PARSE_ERROR,
        std::format("Malformed {} response from Vault", what));
}

// Non-negative integer member. Absent or null gives the fallback; any other
// value that is not an integer in [0, max(T)] gives nullopt.
template<typename T>
std::optional<T> count_field(const JsonValue& obj, std::string_view key, T fallback) {
    const auto node = obj[key];
    if (node.is_null()) return fallback;
    const auto n = node.as_integer<T>();
    if (!n || *n < 0) return std::nullopt;
    return n;
}

// Vault nests some payloads under "data" depending on endpoint and version
JsonValue data_or_root(const JsonValue& root) {
    const auto data = root["data"];
    return data.is_object() ? data : root;
}

} // anonymous namespace

Result<VaultResponse> parse_vault_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root) return parse_failure<VaultResponse>("read");

    VaultResponse response;
    response.request_id = root->value("request_id", std::string{});
    response.lease_id = root->value("lease_id", std::string{});
    response.renewable = root->value("renewable", false);
    const auto lease = count_field<int64_t>(*root, "lease_duration", 0);
    if (!lease) return parse_failure<VaultResponse>("read");
    response.lease_duration = *lease;

    const auto data = (*root)["data"];
    if (!data.is_null() && !data.is_object()) {
        return parse_failure<VaultResponse>("read");
    }
    for (const auto& [key, val] : data.items()) {
        if (val.is_string()) {
            response.data.emplace(key, val.get<std::string>());
        } else {
            response.data.emplace(key, val.dump());
        }
    }
    return Result<VaultResponse>::ok(std::move(response));
}

Result<VaultListResponse> parse_list_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root) return parse_failure<VaultListResponse>("list");

    const auto data = (*root)["data"];
    if (!data["keys"].is_array()) return parse_failure<VaultListResponse>("list");

    VaultListResponse response;
    response.keys = data.string_array("keys");
    return Result<VaultListResponse>::ok(std::move(response));
}

Result<VaultInitResponse> parse_init_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root || !(*root)["root_token"].is_string()) {
        return parse_failure<VaultInitResponse>("init");
    }

    VaultInitResponse response;
    response.keys = root->string_array("keys");
    response.keys_base64 = root->string_array("keys_base64");
    response.root_token = (*root)["root_token"].get<std::string>();
    return Result<VaultInitResponse>::ok(std::move(response));
}

Result<VaultSealStatusResponse> parse_seal_status_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root || !(*root)["sealed"].is_boolean()) {
        return parse_failure<VaultSealStatusResponse>("seal status");
    }

    VaultSealStatusResponse response;
    response.initialized = root->value("initialized", false);
    response.sealed = (*root)["sealed"].get<bool>();
    const auto threshold = count_field<int>(*root, "t", 0);
    const auto shares = count_field<int>(*root, "n", 0);
    const auto progress = count_field<int>(*root, "progress", 0);
    if (!threshold || !shares || !progress) {
        return parse_failure<VaultSealStatusResponse>("seal status");
    }
    response.threshold = *threshold;
    response.shares = *shares;
    response.progress = *progress;
    response.version = root->value("version", std::string{});
    return Result<VaultSealStatusResponse>::ok(std::move(response));
}

Result<VaultHealthResponse> parse_health_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root || !(*root)["initialized"].is_boolean()) {
        return parse_failure<VaultHealthResponse>("health");
    }

    VaultHealthResponse response;
    response.initialized = (*root)["initialized"].get<bool>();
    response.sealed = root->value("sealed", false);
    response.standby = root->value("standby", false);
    const auto server_time = count_field<int64_t>(*root, "server_time_utc", 0);
    if (!server_time) return parse_failure<VaultHealthResponse>("health");
    response.server_time_utc = *server_time;
    response.version = root->value("version", std::string{});
    response.cluster_name = root->value("cluster_name", std::string{});
    return Result<VaultHealthResponse>::ok(std::move(response));
}

Result<std::vector<std::string>> parse_policy_list_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root) return parse_failure<std::vector<std::string>>("policy list");

    // Newer servers also mirror the list under data.keys
    const auto payload = data_or_root(*root);
    if (payload["policies"].is_array()) {
        return Result<std::vector<std::string>>::ok(payload.string_array("policies"));
    }
    if (payload["keys"].is_array()) {
        return Result<std::vector<std::string>>::ok(payload.string_array("keys"));
    }
    return parse_failure<std::vector<std::string>>("policy list");
}

Result<VaultPolicy> parse_policy_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root) return parse_failure<VaultPolicy>("policy");

    const auto payload = data_or_root(*root);
    if (!payload["rules"].is_string()) return parse_failure<VaultPolicy>("policy");

    VaultPolicy policy;
    policy.name = payload.value("name", std::string{});
    policy.rules = payload["rules"].get<std::string>();
    return Result<VaultPolicy>::ok(std::move(policy));
}

Result<VaultTokenInfo> parse_token_lookup_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root || !(*root)["data"].is_object()) {
        return parse_failure<VaultTokenInfo>("token lookup");
    }

    const auto data = (*root)["data"];
    VaultTokenInfo info;
    info.accessor = data.value("accessor", std::string{});
    info.display_name = data.value("display_name", std::string{});
    info.policies = data.string_array("policies");
    const auto ttl = count_field<int64_t>(data, "ttl", 0);
    if (!ttl) return parse_failure<VaultTokenInfo>("token lookup");
    info.ttl = *ttl;
    info.renewable = data.value("renewable", false);
    return Result<VaultTokenInfo>::ok(std::move(info));
}

Result<VaultAuthResponse> parse_auth_response(const std::string& body) {
    const auto root = parse_object(body);
    if (!root || !(*root)["auth"].is_object()) {
        return parse_failure<VaultAuthResponse>("login");
    }

    const auto auth = (*root)["auth"];
    VaultAuthResponse response;
    response.client_token = auth.value("client_token", std::string{});
    response.accessor = auth.value("accessor", std::string{});
    response.policies = auth.string_array("policies");
    const auto lease = count_field<int64_t>(auth, "lease_duration", 0);
    if (!lease) return parse_failure<VaultAuthResponse>("login");
    response.lease_duration = *lease;
    response.renewable = auth.value("renewable", false);
    return Result<VaultAuthResponse>::ok(std::move(response));
}

std::vector<std::string> parse_error_messages(const std::string& body) {
    const auto root = parse_object(body);
    if (!root) return {};
    return root->string_array("errors");
}

} // namespace vaultclient
