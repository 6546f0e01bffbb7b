#include <catch2/catch_test_macros.hpp>
#include "auth/approle_credentials_provider.hpp"
#include "auth/default_credentials_provider_chain.hpp"
#include "auth/environment_credentials_provider.hpp"
#include "auth/static_credentials_provider.hpp"
#include "auth/system_properties_credentials_provider.hpp"
#include "auth/userpass_credentials_provider.hpp"
#include "mocks/mock_http_transport.hpp"

#include <chrono>
#include <cstdlib>
#include <format>

using namespace vaultclient;
using vaultclient::testing::MockHttpTransport;

namespace {

constexpr const char* kLoginBody = R"({
    "request_id": "7f1c",
    "auth": {
        "client_token": "s.login-token",
        "accessor": "acc-1",
        "policies": ["default", "deploy"],
        "lease_duration": 3600,
        "renewable": true
    }
})";

// Test clock advanced by hand
struct ManualClock {
    std::chrono::steady_clock::time_point now{std::chrono::hours(1)};

    LoginSession::Clock fn() {
        return [this] { return now; };
    }
};

std::string login_body(const std::string& token, int64_t lease_seconds) {
    return std::format(R"({{"auth":{{"client_token":"{}","lease_duration":{}}}}})",
                       token, lease_seconds);
}

} // anonymous namespace

// ============================================================================
// Environment / property / static
// ============================================================================

TEST_CASE("EnvironmentCredentialsProvider - reads token", "[auth][provider][env]") {
    ::setenv("TEST_VC_TOKEN", "env-token", 1);
    EnvironmentCredentialsProvider provider("TEST_VC_TOKEN");

    const auto result = provider.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "env-token");
    CHECK_FALSE(result.value().lease().has_value());
    CHECK(provider.name() == "env:TEST_VC_TOKEN");

    ::unsetenv("TEST_VC_TOKEN");
}

TEST_CASE("EnvironmentCredentialsProvider - unset or blank is a resolution error", "[auth][provider][env]") {
    ::unsetenv("TEST_VC_TOKEN_MISSING");
    EnvironmentCredentialsProvider missing("TEST_VC_TOKEN_MISSING");
    const auto r1 = missing.get_credentials();
    REQUIRE(r1.is_error());
    CHECK(r1.error_category() == ErrorCategory::RESOLUTION_ERROR);

    ::setenv("TEST_VC_TOKEN_BLANK", "   ", 1);
    EnvironmentCredentialsProvider blank("TEST_VC_TOKEN_BLANK");
    const auto r2 = blank.get_credentials();
    REQUIRE(r2.is_error());
    CHECK(r2.error_category() == ErrorCategory::RESOLUTION_ERROR);
    ::unsetenv("TEST_VC_TOKEN_BLANK");
}

TEST_CASE("SystemPropertiesCredentialsProvider - reads injected store", "[auth][provider][property]") {
    SystemProperties props;
    SystemPropertiesCredentialsProvider provider(kVaultTokenProperty, props);

    const auto before = provider.get_credentials();
    REQUIRE(before.is_error());
    CHECK(before.error_category() == ErrorCategory::RESOLUTION_ERROR);

    props.set("vault.token", "prop-token");
    const auto after = provider.get_credentials();
    REQUIRE(after.is_ok());
    CHECK(after.value().token() == "prop-token");

    props.set("vault.token", "");
    CHECK(provider.get_credentials().is_error());
}

TEST_CASE("StaticCredentialsProvider - blank token is a resolution error", "[auth][provider][static]") {
    StaticCredentialsProvider good("s.static");
    REQUIRE(good.get_credentials().is_ok());
    CHECK(good.get_credentials().value().token() == "s.static");

    StaticCredentialsProvider blank("");
    const auto result = blank.get_credentials();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::RESOLUTION_ERROR);
}

TEST_CASE("SystemProperties - assignments and unset values", "[config][properties]") {
    SystemProperties props;
    CHECK(props.set_from_assignment("vault.addr=https://vault:8200"));
    CHECK(props.get("vault.addr") == "https://vault:8200");

    CHECK(props.set_from_assignment("key=a=b"));
    CHECK(props.get("key") == "a=b");

    CHECK_FALSE(props.set_from_assignment("no-equals"));
    CHECK_FALSE(props.set_from_assignment("=value"));

    props.erase("key");
    CHECK_FALSE(props.get("key").has_value());
    CHECK(props.size() == 1);
    props.clear();
    CHECK(props.size() == 0);
}

TEST_CASE("Default chain - env first, then property", "[auth][chain][default]") {
    SystemProperties props;
    props.set("vault.token", "prop-token");
    ::unsetenv("VAULT_TOKEN");

    auto chain = make_default_credentials_provider_chain(props);
    REQUIRE(chain->provider_count() == 2);

    const auto result = chain->get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "prop-token");

    ::setenv("VAULT_TOKEN", "env-token", 1);
    auto fresh = make_default_credentials_provider_chain(props);
    CHECK(fresh->get_credentials().value().token() == "env-token");
    ::unsetenv("VAULT_TOKEN");
}

// ============================================================================
// Login providers
// ============================================================================

TEST_CASE("UserPass - successful login builds credentials with lease", "[auth][provider][userpass]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, kLoginBody);

    UserPassCredentialsProvider provider({.username = "deploy", .password = "hunter2"}, transport);
    const auto result = provider.get_credentials();

    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "s.login-token");
    REQUIRE(result.value().lease().has_value());
    CHECK(result.value().lease()->accessor == "acc-1");
    CHECK(result.value().lease()->lease_duration_seconds == 3600);
    CHECK(result.value().lease()->renewable);
    CHECK(result.value().lease()->policies.size() == 2);

    const auto request = transport->last_request();
    CHECK(request.method == HttpMethod::POST);
    CHECK(request.path == "/v1/auth/userpass/login/deploy");
    CHECK(request.body.find("\"password\":\"hunter2\"") != std::string::npos);
    CHECK(request.headers.count("X-Vault-Token") == 0);
}

TEST_CASE("UserPass - token is cached within its lease", "[auth][provider][userpass]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, kLoginBody);

    UserPassCredentialsProvider provider({.username = "deploy", .password = "pw"}, transport);
    REQUIRE(provider.get_credentials().is_ok());
    REQUIRE(provider.get_credentials().is_ok());
    CHECK(transport->request_count() == 1);
}

TEST_CASE("UserPass - token is refreshed at 90% of its lease", "[auth][provider][userpass]") {
    using namespace std::chrono_literals;
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, login_body("s.first", 10));
    transport->enqueue_response(200, login_body("s.second", 10));

    ManualClock clock;
    UserPassCredentialsProvider provider({.username = "deploy", .password = "pw"},
                                         transport, clock.fn());
    REQUIRE(provider.get_credentials().value().token() == "s.first");

    clock.now += 8900ms;
    CHECK(provider.get_credentials().value().token() == "s.first");
    CHECK(transport->request_count() == 1);

    clock.now += 100ms;
    const auto refreshed = provider.get_credentials();
    REQUIRE(refreshed.is_ok());
    CHECK(refreshed.value().token() == "s.second");
    CHECK(transport->request_count() == 2);
    CHECK(transport->last_request().path == "/v1/auth/userpass/login/deploy");
}

TEST_CASE("UserPass - rejected re-login is a resolution error", "[auth][provider][userpass]") {
    using namespace std::chrono_literals;
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, login_body("s.first", 10));
    transport->enqueue_response(403, R"({"errors":["permission denied"]})");
    transport->enqueue_response(200, login_body("s.third", 10));

    ManualClock clock;
    UserPassCredentialsProvider provider({.username = "deploy", .password = "pw"},
                                         transport, clock.fn());
    REQUIRE(provider.get_credentials().is_ok());

    clock.now += 9s;
    const auto rejected = provider.get_credentials();
    REQUIRE(rejected.is_error());
    CHECK(rejected.error_category() == ErrorCategory::RESOLUTION_ERROR);

    // The expired token is not served after a failed refresh
    const auto retried = provider.get_credentials();
    REQUIRE(retried.is_ok());
    CHECK(retried.value().token() == "s.third");
    CHECK(transport->request_count() == 3);
}

TEST_CASE("UserPass - very long lease stays cached", "[auth][provider][userpass]") {
    using namespace std::chrono_literals;
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, login_body("s.long", 1'000'000'000'000'000));

    ManualClock clock;
    UserPassCredentialsProvider provider({.username = "deploy", .password = "pw"},
                                         transport, clock.fn());
    REQUIRE(provider.get_credentials().is_ok());

    clock.now += 24h * 365;
    CHECK(provider.get_credentials().value().token() == "s.long");
    CHECK(transport->request_count() == 1);
}

TEST_CASE("UserPass - out-of-range lease is an unexpected error", "[auth][provider][userpass]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, R"({"auth":{"client_token":"s.x","lease_duration":1e19}})");
    transport->enqueue_response(200, R"({"auth":{"client_token":"s.x","lease_duration":-5}})");

    UserPassCredentialsProvider provider({.username = "deploy", .password = "pw"}, transport);
    for (int i = 0; i < 2; ++i) {
        const auto result = provider.get_credentials();
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::UNEXPECTED_ERROR);
    }
}

TEST_CASE("UserPass - username is percent-encoded and mount honoured", "[auth][provider][userpass]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, kLoginBody);

    UserPassCredentialsProvider provider(
        {.username = "jane doe/ops", .password = "pw", .mount = "ldap-users"}, transport);
    REQUIRE(provider.get_credentials().is_ok());
    CHECK(transport->last_request().path == "/v1/auth/ldap-users/login/jane%20doe%2Fops");
}

TEST_CASE("UserPass - rejection is a resolution error", "[auth][provider][userpass]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(400, R"({"errors":["invalid username or password"]})");

    UserPassCredentialsProvider provider({.username = "deploy", .password = "wrong"}, transport);
    const auto result = provider.get_credentials();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::RESOLUTION_ERROR);
    CHECK(result.error_message().find("invalid username or password") != std::string::npos);
}

TEST_CASE("UserPass - transport and server failures are unexpected", "[auth][provider][userpass]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_transport_error();
    transport->enqueue_response(503, R"({"errors":["Vault is sealed"]})");
    transport->enqueue_response(200, "not json");
    transport->enqueue_response(200, R"({"auth":{"client_token":""}})");

    UserPassCredentialsProvider provider({.username = "deploy", .password = "pw"}, transport);
    for (int i = 0; i < 4; ++i) {
        const auto result = provider.get_credentials();
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::UNEXPECTED_ERROR);
    }
}

TEST_CASE("UserPass - missing username never calls the server", "[auth][provider][userpass]") {
    auto transport = std::make_shared<MockHttpTransport>();
    UserPassCredentialsProvider provider({}, transport);

    const auto result = provider.get_credentials();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::RESOLUTION_ERROR);
    CHECK(transport->request_count() == 0);
}

TEST_CASE("AppRole - login body and path", "[auth][provider][approle]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, kLoginBody);

    AppRoleCredentialsProvider provider({.role_id = "role-1", .secret_id = "secret-1"}, transport);
    const auto result = provider.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "s.login-token");

    const auto request = transport->last_request();
    CHECK(request.path == "/v1/auth/approle/login");
    CHECK(request.body.find("\"role_id\":\"role-1\"") != std::string::npos);
    CHECK(request.body.find("\"secret_id\":\"secret-1\"") != std::string::npos);
}

TEST_CASE("AppRole - secret_id omitted when empty", "[auth][provider][approle]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, kLoginBody);

    AppRoleCredentialsProvider provider({.role_id = "role-1"}, transport);
    REQUIRE(provider.get_credentials().is_ok());
    CHECK(transport->last_request().body.find("secret_id") == std::string::npos);
}

TEST_CASE("AppRole - non-expiring lease stays cached", "[auth][provider][approle]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->enqueue_response(200, R"({"auth":{"client_token":"s.root-like","lease_duration":0}})");

    AppRoleCredentialsProvider provider({.role_id = "role-1"}, transport);
    for (int i = 0; i < 3; ++i) {
        const auto result = provider.get_credentials();
        REQUIRE(result.is_ok());
        CHECK(result.value().token() == "s.root-like");
    }
    CHECK(transport->request_count() == 1);
}
