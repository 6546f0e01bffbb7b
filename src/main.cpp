#include "cli/command_line.hpp"
#include "client/vault_client_factory.hpp"
#include "config/config_loader.hpp"
#include "config/system_properties.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace vaultclient;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage: vault-cli [-c config.toml] [-D key=value]... <command> [args]\n"
        "\n"
        "Commands:\n"
        "  read <path>                    Read a secret\n"
        "  list <path>                    List keys under a path\n"
        "  write <path> key=value...      Write a secret\n"
        "  delete <path>                  Delete a secret\n"
        "  init <shares> <threshold>      Initialise the vault\n"
        "  seal-status                    Show seal status\n"
        "  unseal <key>                   Submit an unseal key share\n"
        "  health                         Show server health\n"
        "  policies                       List policy names\n"
        "  policy-read <name>             Show a policy\n"
        "  policy-write <name> <file>     Create or replace a policy from a file\n"
        "  policy-delete <name>           Delete a policy\n"
        "  whoami                         Look up the current token\n"
        "\n"
        "The Vault address comes from the config file, VAULT_ADDR, or -D vault.addr=...\n"
        "The token comes from the config file, VAULT_TOKEN, -D vault.token=..., or a\n"
        "configured login method.\n";
}

JsonValue string_list(const std::vector<std::string>& items) {
    JsonValue arr = JsonValue::array();
    for (const auto& item : items) arr.push_back(item);
    return arr;
}

void print_json(const JsonValue& value) {
    std::cout << value.dump() << '\n';
}

template<typename T>
bool report_error(const Result<T>& result) {
    if (result.is_ok()) return false;
    std::cerr << std::format("Error ({}): {}\n",
                             error_category_to_string(result.error_category()),
                             result.error_message());
    return true;
}

// Arguments were checked by cli::validate_usage
int run_command(VaultClient& client, const std::string& command,
                const std::vector<std::string>& args) {

    if (command == "read") {
        const auto result = client.read(args[0]);
        if (report_error(result)) return kExitFailure;
        JsonValue data = JsonValue::object();
        for (const auto& [key, value] : result.value().data) data.set(key, value);
        JsonValue out = JsonValue::object();
        out.set("lease_id", result.value().lease_id);
        out.set("lease_duration", static_cast<long long>(result.value().lease_duration));
        out.set("renewable", result.value().renewable);
        out.set("data", data);
        print_json(out);
        return kExitOk;
    }

    if (command == "list") {
        const auto result = client.list(args[0]);
        if (report_error(result)) return kExitFailure;
        print_json(string_list(result.value().keys));
        return kExitOk;
    }

    if (command == "write") {
        std::map<std::string, std::string> data;
        for (size_t i = 1; i < args.size(); ++i) {
            const auto eq = args[i].find('=');
            data[utils::trim(args[i].substr(0, eq))] = args[i].substr(eq + 1);
        }
        const auto result = client.write(args[0], data);
        if (report_error(result)) return kExitFailure;
        return kExitOk;
    }

    if (command == "delete") {
        const auto result = client.remove(args[0]);
        if (report_error(result)) return kExitFailure;
        return kExitOk;
    }

    if (command == "init") {
        const auto result = client.init(*cli::parse_positive(args[0]),
                                        *cli::parse_positive(args[1]));
        if (report_error(result)) return kExitFailure;
        JsonValue out = JsonValue::object();
        out.set("keys", string_list(result.value().keys));
        out.set("keys_base64", string_list(result.value().keys_base64));
        out.set("root_token", result.value().root_token);
        print_json(out);
        return kExitOk;
    }

    if (command == "seal-status" || command == "unseal") {
        const auto result = command == "unseal" ? client.unseal(args[0]) : client.seal_status();
        if (report_error(result)) return kExitFailure;
        const auto& s = result.value();
        JsonValue out = JsonValue::object();
        out.set("initialized", s.initialized);
        out.set("sealed", s.sealed);
        out.set("t", s.threshold);
        out.set("n", s.shares);
        out.set("progress", s.progress);
        out.set("version", s.version);
        print_json(out);
        return kExitOk;
    }

    if (command == "health") {
        const auto result = client.health();
        if (report_error(result)) return kExitFailure;
        const auto& h = result.value();
        JsonValue out = JsonValue::object();
        out.set("initialized", h.initialized);
        out.set("sealed", h.sealed);
        out.set("standby", h.standby);
        out.set("server_time_utc", static_cast<long long>(h.server_time_utc));
        out.set("version", h.version);
        out.set("cluster_name", h.cluster_name);
        print_json(out);
        return kExitOk;
    }

    if (command == "policies") {
        const auto result = client.list_policies();
        if (report_error(result)) return kExitFailure;
        print_json(string_list(result.value()));
        return kExitOk;
    }

    if (command == "policy-read") {
        const auto result = client.read_policy(args[0]);
        if (report_error(result)) return kExitFailure;
        JsonValue out = JsonValue::object();
        out.set("name", result.value().name);
        out.set("rules", result.value().rules);
        print_json(out);
        return kExitOk;
    }

    if (command == "policy-write") {
        std::ifstream in(args[1]);
        if (!in) {
            std::cerr << std::format("Cannot read policy file '{}'\n", args[1]);
            return kExitFailure;
        }
        std::ostringstream rules;
        rules << in.rdbuf();
        const auto result = client.write_policy(args[0], rules.str());
        if (report_error(result)) return kExitFailure;
        return kExitOk;
    }

    if (command == "policy-delete") {
        const auto result = client.delete_policy(args[0]);
        if (report_error(result)) return kExitFailure;
        return kExitOk;
    }

    if (command == "whoami") {
        const auto result = client.lookup_self();
        if (report_error(result)) return kExitFailure;
        const auto& t = result.value();
        JsonValue out = JsonValue::object();
        out.set("display_name", t.display_name);
        out.set("accessor", t.accessor);
        out.set("policies", string_list(t.policies));
        out.set("ttl", static_cast<long long>(t.ttl));
        out.set("renewable", t.renewable);
        print_json(out);
        return kExitOk;
    }

    std::cerr << std::format("Unknown command '{}'\n", command);
    return kExitUsage;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = cli::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    if (parsed.is_error()) {
        std::cerr << parsed.error_message() << "\n\n";
        print_usage();
        return kExitUsage;
    }
    const auto& cmd = parsed.value();
    if (cmd.help) {
        print_usage();
        return kExitOk;
    }

    for (const auto& assignment : cmd.properties) {
        (void)SystemProperties::instance().set_from_assignment(assignment);
    }

    ClientConfig config;
    if (!cmd.config_file.empty()) {
        auto loaded = ConfigLoader::load_from_file(cmd.config_file);
        if (!loaded.success) {
            utils::log::error(std::format("Config error: {}", loaded.error_message));
            return kExitFailure;
        }
        config = std::move(loaded.config);
    }

    auto client = VaultClientFactory::create_from_config(config);
    if (report_error(client)) return kExitFailure;

    return run_command(*client.value(), cmd.command, cmd.args);
}
