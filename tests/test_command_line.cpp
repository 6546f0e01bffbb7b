#include <catch2/catch_test_macros.hpp>
#include "cli/command_line.hpp"

using namespace vaultclient;
using namespace vaultclient::cli;

namespace {

Result<CommandLine> parse(std::vector<std::string> argv) {
    return parse_command_line(argv);
}

} // anonymous namespace

TEST_CASE("CLI: full invocation", "[cli]") {
    auto result = parse({"-c", "vault.toml", "-D", "vault.addr=http://a:8200",
                         "-Dvault.token=s.x", "read", "secret/app"});
    REQUIRE(result.is_ok());

    const auto& cmd = result.value();
    CHECK_FALSE(cmd.help);
    CHECK(cmd.config_file == "vault.toml");
    REQUIRE(cmd.properties.size() == 2);
    CHECK(cmd.properties[0] == "vault.addr=http://a:8200");
    CHECK(cmd.properties[1] == "vault.token=s.x");
    CHECK(cmd.command == "read");
    REQUIRE(cmd.args.size() == 1);
    CHECK(cmd.args[0] == "secret/app");
}

TEST_CASE("CLI: flags may follow the command", "[cli]") {
    auto result = parse({"write", "secret/app", "--config", "vault.toml", "user=admin", "pass=a=b"});
    REQUIRE(result.is_ok());
    CHECK(result.value().config_file == "vault.toml");
    CHECK(result.value().command == "write");
    CHECK(result.value().args == std::vector<std::string>{"secret/app", "user=admin", "pass=a=b"});
}

TEST_CASE("CLI: help short-circuits", "[cli]") {
    auto result = parse({"-h", "frobnicate"});
    REQUIRE(result.is_ok());
    CHECK(result.value().help);

    auto long_form = parse({"--help"});
    REQUIRE(long_form.is_ok());
    CHECK(long_form.value().help);
}

TEST_CASE("CLI: malformed flags", "[cli]") {
    SECTION("config flag without a file") {
        auto result = parse({"read", "secret/app", "-c"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
        CHECK(result.error_message().find("-c") != std::string::npos);
    }

    SECTION("long config flag without a file") {
        auto result = parse({"health", "--config"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    }

    SECTION("property flag without a value") {
        auto result = parse({"health", "-D"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    }

    SECTION("property without an equals sign") {
        auto result = parse({"-D", "vault.addr", "health"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    }

    SECTION("property with an empty key") {
        auto result = parse({"-D=value", "health"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    }
}

TEST_CASE("CLI: missing command", "[cli]") {
    auto result = parse({"-c", "vault.toml"});
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    CHECK(result.error_message() == "No command given");

    CHECK(parse({}).is_error());
}

TEST_CASE("CLI: unknown command is a usage error", "[cli]") {
    auto result = parse({"frobnicate"});
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    CHECK(result.error_message() == "Unknown command 'frobnicate'");
}

TEST_CASE("CLI: argument counts", "[cli]") {
    SECTION("read without a path") {
        auto result = validate_usage("read", {});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    }

    SECTION("extra arguments are rejected") {
        CHECK(validate_usage("read", {"a", "b"}).is_error());
        CHECK(validate_usage("health", {"now"}).is_error());
        CHECK(validate_usage("policy-write", {"ops", "ops.hcl", "extra"}).is_error());
    }

    SECTION("exact counts pass") {
        CHECK(validate_usage("read", {"secret/app"}).is_ok());
        CHECK(validate_usage("list", {"secret/"}).is_ok());
        CHECK(validate_usage("delete", {"secret/app"}).is_ok());
        CHECK(validate_usage("seal-status", {}).is_ok());
        CHECK(validate_usage("unseal", {"key"}).is_ok());
        CHECK(validate_usage("policies", {}).is_ok());
        CHECK(validate_usage("policy-read", {"ops"}).is_ok());
        CHECK(validate_usage("policy-write", {"ops", "ops.hcl"}).is_ok());
        CHECK(validate_usage("policy-delete", {"ops"}).is_ok());
        CHECK(validate_usage("whoami", {}).is_ok());
    }

    SECTION("unseal without a key") {
        CHECK(parse({"unseal"}).is_error());
    }
}

TEST_CASE("CLI: write needs key=value pairs", "[cli]") {
    CHECK(validate_usage("write", {"secret/app", "user=admin"}).is_ok());
    CHECK(validate_usage("write", {"secret/app", "a=1", "b="}).is_ok());
    CHECK(validate_usage("write", {"secret/app"}).is_error());

    auto result = validate_usage("write", {"secret/app", "user"});
    REQUIRE(result.is_error());
    CHECK(result.error_message() == "Expected key=value, got 'user'");

    CHECK(validate_usage("write", {"secret/app", "=admin"}).is_error());
}

TEST_CASE("CLI: init needs positive integers", "[cli]") {
    CHECK(validate_usage("init", {"5", "3"}).is_ok());
    CHECK(validate_usage("init", {"5"}).is_error());
    CHECK(validate_usage("init", {"0", "3"}).is_error());
    CHECK(validate_usage("init", {"5", "-1"}).is_error());
    CHECK(validate_usage("init", {"five", "3"}).is_error());
}

TEST_CASE("CLI: parse_positive", "[cli]") {
    CHECK(parse_positive("1") == 1);
    CHECK(parse_positive("42") == 42);
    CHECK_FALSE(parse_positive("0").has_value());
    CHECK_FALSE(parse_positive("-3").has_value());
    CHECK_FALSE(parse_positive("").has_value());
    CHECK_FALSE(parse_positive("12abc").has_value());
    CHECK_FALSE(parse_positive(" 7").has_value());
    CHECK_FALSE(parse_positive("99999999999").has_value());
}
