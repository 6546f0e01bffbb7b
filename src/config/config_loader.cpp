#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace vaultclient {

namespace {

// ============================================================================
// Environment expansion
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (auto* s = val.as_string()) {
            *s = expand_env_vars(s->get());
        } else if (auto* sub = val.as_table()) {
            expand_env_vars_recursive(*sub);
        }
    }
}

// ============================================================================
// Section extractors
// ============================================================================

std::chrono::milliseconds non_negative_ms(const toml::table& tbl, std::string_view key,
                                          int64_t default_ms) {
    const int64_t value = tbl[key].value_or(default_ms);
    if (value < 0) {
        throw std::runtime_error(std::format("http.{} must not be negative", key));
    }
    return std::chrono::milliseconds(value);
}

VaultServerConfig extract_vault(const toml::table& root) {
    VaultServerConfig cfg;
    if (const auto* vault = root["vault"].as_table()) {
        cfg.address = (*vault)["address"].value_or(""s);
        cfg.token = (*vault)["token"].value_or(""s);
    }
    return cfg;
}

HttpConfig extract_http(const toml::table& root) {
    HttpConfig cfg;
    const auto* http = root["http"].as_table();
    if (!http) return cfg;
    const auto& h = *http;

    cfg.connect_timeout = non_negative_ms(h, "connect_timeout_ms", 5000);
    cfg.read_timeout = non_negative_ms(h, "read_timeout_ms", 30000);
    cfg.retry_base_delay = non_negative_ms(h, "retry_base_delay_ms", 100);
    cfg.retry_max_delay = non_negative_ms(h, "retry_max_delay_ms", 2000);

    const int64_t retries = h["max_retries"].value_or(int64_t{3});
    if (retries < 0) {
        throw std::runtime_error("http.max_retries must not be negative");
    }
    if (retries > std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::format("http.max_retries must be at most {}",
                                             std::numeric_limits<int>::max()));
    }
    cfg.max_retries = static_cast<int>(retries);

    cfg.verify_tls = h["verify_tls"].value_or(true);
    cfg.ca_cert_file = h["ca_cert_file"].value_or(""s);
    return cfg;
}

AuthConfig extract_auth(const toml::table& root) {
    AuthConfig cfg;
    const auto* auth = root["auth"].as_table();
    if (!auth) return cfg;
    const auto& a = *auth;

    cfg.reuse_last_provider = a["reuse_last_provider"].value_or(true);

    if (const auto* up = a["userpass"].as_table()) {
        UserPassConfig userpass;
        userpass.username = (*up)["username"].value_or(""s);
        userpass.password = (*up)["password"].value_or(""s);
        userpass.mount = (*up)["mount"].value_or("userpass"s);
        if (utils::is_blank(userpass.username)) {
            throw std::runtime_error("auth.userpass requires a username");
        }
        cfg.userpass = std::move(userpass);
    }

    if (const auto* ar = a["approle"].as_table()) {
        AppRoleConfig approle;
        approle.role_id = (*ar)["role_id"].value_or(""s);
        approle.secret_id = (*ar)["secret_id"].value_or(""s);
        approle.mount = (*ar)["mount"].value_or("approle"s);
        if (utils::is_blank(approle.role_id)) {
            throw std::runtime_error("auth.approle requires a role_id");
        }
        cfg.approle = std::move(approle);
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    if (!utils::log::parse_level(cfg.level)) {
        throw std::runtime_error(std::format("Unknown logging.level '{}'", cfg.level));
    }
    return cfg;
}

std::unordered_map<std::string, std::string> extract_properties(const toml::table& root) {
    std::unordered_map<std::string, std::string> props;
    const auto* table = root["properties"].as_table();
    if (!table) return props;

    for (auto&& [key, val] : *table) {
        const std::string name(key.str());
        if (const auto* s = val.as_string()) {
            props.emplace(name, s->get());
        } else if (const auto* i = val.as_integer()) {
            props.emplace(name, std::to_string(i->get()));
        } else if (const auto* b = val.as_boolean()) {
            props.emplace(name, utils::booltostr(b->get()));
        } else {
            throw std::runtime_error(
                std::format("properties.{} must be a string, integer or boolean", name));
        }
    }
    return props;
}

ConfigLoader::LoadResult extract_all(toml::table& root) {
    try {
        expand_env_vars_recursive(root);

        ClientConfig config;
        config.vault = extract_vault(root);
        config.http = extract_http(root);
        config.auth = extract_auth(root);
        config.logging = extract_logging(root);
        config.properties = extract_properties(root);
        return ConfigLoader::LoadResult::ok(std::move(config));
    } catch (const std::exception& e) {
        return ConfigLoader::LoadResult::error(e.what());
    }
}

} // anonymous namespace

void ClientConfig::apply_properties(SystemProperties& store) const {
    for (const auto& [key, value] : properties) {
        store.set(key, value);
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto root = toml::parse_file(config_path);
        return extract_all(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse {}: {}",
                                             config_path, e.description()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        return extract_all(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    }
}

} // namespace vaultclient
