#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vaultclient::cli {

/**
 * @brief Parsed vault-cli invocation
 *
 * vault-cli [-c config.toml] [-D key=value]... <command> [args]
 */
struct CommandLine {
    bool help = false;
    std::string config_file;
    std::vector<std::string> properties;   // "key=value" assignments from -D
    std::string command;
    std::vector<std::string> args;
};

/**
 * @brief Parse arguments (without argv[0])
 *
 * Malformed flags, a missing command, unknown commands and wrong argument
 * counts are CONFIGURATION_ERROR. Nothing here touches the network or the
 * property store, so usage errors are reported before a client is built.
 */
[[nodiscard]] Result<CommandLine> parse_command_line(const std::vector<std::string>& argv);

// Check a command name and its arguments
[[nodiscard]] Result<void> validate_usage(const std::string& command,
                                          const std::vector<std::string>& args);

// Strictly positive decimal integer
[[nodiscard]] std::optional<int> parse_positive(const std::string& text);

} // namespace vaultclient::cli
