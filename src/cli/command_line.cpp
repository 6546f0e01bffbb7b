#include "cli/command_line.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <format>
#include <unordered_map>

namespace vaultclient::cli {

namespace {

struct CommandArity {
    size_t min_args;
    bool variadic;
};

const std::unordered_map<std::string, CommandArity>& commands() {
    static const std::unordered_map<std::string, CommandArity> table = {
        {"read",          {1, false}},
        {"list",          {1, false}},
        {"write",         {2, true}},
        {"delete",        {1, false}},
        {"init",          {2, false}},
        {"seal-status",   {0, false}},
        {"unseal",        {1, false}},
        {"health",        {0, false}},
        {"policies",      {0, false}},
        {"policy-read",   {1, false}},
        {"policy-write",  {2, false}},
        {"policy-delete", {1, false}},
        {"whoami",        {0, false}},
    };
    return table;
}

Result<void> usage_error(std::string message) {
    return Result<void>::error(ErrorCategory::CONFIGURATION_ERROR, std::move(message));
}

bool is_assignment(const std::string& text) {
    const auto eq = text.find('=');
    return eq != std::string::npos && !utils::trim(text.substr(0, eq)).empty();
}

} // anonymous namespace

std::optional<int> parse_positive(const std::string& text) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 1) {
        return std::nullopt;
    }
    return value;
}

Result<void> validate_usage(const std::string& command, const std::vector<std::string>& args) {
    const auto it = commands().find(command);
    if (it == commands().end()) {
        return usage_error(std::format("Unknown command '{}'", command));
    }

    const auto& arity = it->second;
    if (args.size() < arity.min_args || (!arity.variadic && args.size() > arity.min_args)) {
        return usage_error(std::format("'{}' expects {}{} argument(s), got {}",
            command, arity.variadic ? "at least " : "", arity.min_args, args.size()));
    }

    if (command == "write") {
        for (size_t i = 1; i < args.size(); ++i) {
            if (!is_assignment(args[i])) {
                return usage_error(std::format("Expected key=value, got '{}'", args[i]));
            }
        }
    } else if (command == "init") {
        if (!parse_positive(args[0]) || !parse_positive(args[1])) {
            return usage_error("init expects two positive integers");
        }
    }
    return Result<void>::ok();
}

Result<CommandLine> parse_command_line(const std::vector<std::string>& argv) {
    CommandLine cmd;
    std::vector<std::string> positional;

    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
            return Result<CommandLine>::ok(std::move(cmd));
        }

        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argv.size()) {
                return Result<CommandLine>::error(ErrorCategory::CONFIGURATION_ERROR,
                    std::format("{} requires a file argument", arg));
            }
            cmd.config_file = argv[++i];
        } else if (arg == "-D" || (arg.starts_with("-D") && arg.size() > 2)) {
            if (arg == "-D" && i + 1 >= argv.size()) {
                return Result<CommandLine>::error(ErrorCategory::CONFIGURATION_ERROR,
                                                  "-D requires a key=value argument");
            }
            std::string assignment = arg == "-D" ? argv[++i] : arg.substr(2);
            if (!is_assignment(assignment)) {
                return Result<CommandLine>::error(ErrorCategory::CONFIGURATION_ERROR,
                    std::format("Invalid property '{}', expected key=value", assignment));
            }
            cmd.properties.push_back(std::move(assignment));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return Result<CommandLine>::error(ErrorCategory::CONFIGURATION_ERROR,
                                          "No command given");
    }

    cmd.command = positional.front();
    cmd.args.assign(positional.begin() + 1, positional.end());

    const auto usage = validate_usage(cmd.command, cmd.args);
    if (usage.is_error()) return Result<CommandLine>::error_from(usage);
    return Result<CommandLine>::ok(std::move(cmd));
}

} // namespace vaultclient::cli
