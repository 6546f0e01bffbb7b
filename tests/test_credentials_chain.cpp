#include <catch2/catch_test_macros.hpp>
#include "auth/credentials_provider_chain.hpp"
#include "mocks/mock_credentials_provider.hpp"

#include <thread>
#include <vector>

using namespace vaultclient;
using vaultclient::testing::MockCredentialsProvider;
using Mode = MockCredentialsProvider::Mode;

namespace {

std::shared_ptr<MockCredentialsProvider> mock(std::string label, Mode mode,
                                              std::string token = "") {
    return std::make_shared<MockCredentialsProvider>(std::move(label), mode, std::move(token));
}

} // anonymous namespace

TEST_CASE("Chain - empty provider list is a configuration error", "[auth][chain]") {
    try {
        CredentialsProviderChain chain(std::vector<std::shared_ptr<ICredentialsProvider>>{});
        FAIL("expected VaultClientException");
    } catch (const VaultClientException& e) {
        CHECK(e.category() == ErrorCategory::CONFIGURATION_ERROR);
    }
}

TEST_CASE("Chain - null provider is a configuration error", "[auth][chain]") {
    std::vector<std::shared_ptr<ICredentialsProvider>> providers{
        mock("a", Mode::TOKEN, "tok"), nullptr};
    CHECK_THROWS_AS(CredentialsProviderChain(providers), VaultClientException);
}

TEST_CASE("Chain - skips failing and blank providers, memoizes winner", "[auth][chain]") {
    auto a = mock("a", Mode::RESOLUTION_ERROR);
    auto b = mock("b", Mode::TOKEN, "");
    auto c = mock("c", Mode::TOKEN, "tok123");
    CredentialsProviderChain chain({a, b, c});

    const auto result = chain.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "tok123");
    CHECK(chain.last_used_provider() == c);
    CHECK(a->call_count() == 1);
    CHECK(b->call_count() == 1);
    CHECK(c->call_count() == 1);
}

TEST_CASE("Chain - whitespace token counts as blank", "[auth][chain]") {
    auto a = mock("a", Mode::TOKEN, "  \t ");
    auto b = mock("b", Mode::TOKEN, "real");
    CredentialsProviderChain chain({a, b});

    const auto result = chain.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "real");
    CHECK(chain.last_used_provider() == b);
}

TEST_CASE("Chain - stops at the first success", "[auth][chain]") {
    auto a = mock("a", Mode::TOKEN, "first");
    auto b = mock("b", Mode::TOKEN, "second");
    CredentialsProviderChain chain({a, b});

    const auto result = chain.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "first");
    CHECK(b->call_count() == 0);
}

TEST_CASE("Chain - reuse goes straight to the memoized provider", "[auth][chain]") {
    auto a = mock("a", Mode::RESOLUTION_ERROR);
    auto b = mock("b", Mode::TOKEN, "");
    auto c = mock("c", Mode::TOKEN, "tok123");
    CredentialsProviderChain chain({a, b, c});
    REQUIRE(chain.reuse_last_provider());

    REQUIRE(chain.get_credentials().is_ok());

    // Earlier providers would now succeed, but are not consulted
    a->set_mode(Mode::TOKEN);
    a->set_token("from-a");
    b->set_token("from-b");

    const auto second = chain.get_credentials();
    REQUIRE(second.is_ok());
    CHECK(second.value().token() == "tok123");
    CHECK(a->call_count() == 1);
    CHECK(b->call_count() == 1);
    CHECK(c->call_count() == 2);
}

TEST_CASE("Chain - memoized provider failure is returned as is", "[auth][chain]") {
    auto a = mock("a", Mode::RESOLUTION_ERROR);
    auto b = mock("b", Mode::TOKEN, "tok");
    CredentialsProviderChain chain({a, b});
    REQUIRE(chain.get_credentials().is_ok());

    a->set_mode(Mode::TOKEN);
    a->set_token("would-work");
    b->set_mode(Mode::UNEXPECTED_ERROR);

    const auto result = chain.get_credentials();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::UNEXPECTED_ERROR);
    CHECK(a->call_count() == 1);
}

TEST_CASE("Chain - memoized provider exception becomes an error result", "[auth][chain]") {
    auto a = mock("a", Mode::TOKEN, "tok");
    CredentialsProviderChain chain({a});
    REQUIRE(chain.get_credentials().is_ok());

    a->set_mode(Mode::THROW);
    const auto result = chain.get_credentials();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::UNEXPECTED_ERROR);
}

TEST_CASE("Chain - reuse disabled walks the whole list every time", "[auth][chain]") {
    auto a = mock("a", Mode::RESOLUTION_ERROR);
    auto b = mock("b", Mode::TOKEN, "tok-b");
    CredentialsProviderChain chain({a, b});
    chain.set_reuse_last_provider(false);
    CHECK_FALSE(chain.reuse_last_provider());

    REQUIRE(chain.get_credentials().is_ok());
    REQUIRE(chain.get_credentials().is_ok());
    CHECK(a->call_count() == 2);
    CHECK(b->call_count() == 2);

    // Earlier provider now wins
    a->set_mode(Mode::TOKEN);
    a->set_token("tok-a");
    const auto third = chain.get_credentials();
    REQUIRE(third.is_ok());
    CHECK(third.value().token() == "tok-a");
    CHECK(b->call_count() == 2);
    CHECK(chain.last_used_provider() == a);
}

TEST_CASE("Chain - unexpected errors and exceptions do not stop the walk", "[auth][chain]") {
    auto a = mock("a", Mode::UNEXPECTED_ERROR);
    auto b = mock("b", Mode::THROW);
    auto c = mock("c", Mode::TOKEN, "tok");
    CredentialsProviderChain chain({a, b, c});

    const auto result = chain.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "tok");
    CHECK(b->call_count() == 1);
}

TEST_CASE("Chain - non-standard exception does not stop the walk", "[auth][chain]") {
    auto a = mock("a", Mode::THROW_NON_STANDARD);
    auto b = mock("b", Mode::TOKEN, "tok");
    CredentialsProviderChain chain({a, b});

    const auto result = chain.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "tok");
    CHECK(chain.last_used_provider() == b);
}

TEST_CASE("Chain - memoized provider throwing a non-standard exception", "[auth][chain]") {
    auto a = mock("a", Mode::TOKEN, "tok");
    CredentialsProviderChain chain({a});
    REQUIRE(chain.get_credentials().is_ok());

    a->set_mode(Mode::THROW_NON_STANDARD);
    const auto result = chain.get_credentials();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::UNEXPECTED_ERROR);
    CHECK(result.error_message().find("mock:a") != std::string::npos);
}

TEST_CASE("Chain - exhaustion is terminal and memoizes nothing", "[auth][chain]") {
    auto a = mock("a", Mode::RESOLUTION_ERROR);
    auto b = mock("b", Mode::TOKEN, "");
    auto c = mock("c", Mode::THROW);
    CredentialsProviderChain chain({a, b, c});

    const auto result = chain.get_credentials();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CREDENTIALS_EXHAUSTED);
    CHECK(result.error_message().find("any provider") != std::string::npos);
    CHECK(chain.last_used_provider() == nullptr);

    // Nothing memoized: the next call walks again
    REQUIRE(chain.get_credentials().is_error());
    CHECK(a->call_count() == 2);
}

TEST_CASE("Chain - value_or_throw surfaces exhaustion as an exception", "[auth][chain]") {
    CredentialsProviderChain chain({mock("a", Mode::RESOLUTION_ERROR)});
    try {
        (void)chain.get_credentials().value_or_throw();
        FAIL("expected VaultClientException");
    } catch (const VaultClientException& e) {
        CHECK(e.category() == ErrorCategory::CREDENTIALS_EXHAUSTED);
    }
}

TEST_CASE("Chain - chains nest", "[auth][chain]") {
    auto inner = std::make_shared<CredentialsProviderChain>(
        std::vector<std::shared_ptr<ICredentialsProvider>>{
            mock("x", Mode::RESOLUTION_ERROR), mock("y", Mode::TOKEN, "nested")});
    CredentialsProviderChain outer({mock("a", Mode::RESOLUTION_ERROR), inner});

    const auto result = outer.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().token() == "nested");
    CHECK(outer.last_used_provider() == inner);
    CHECK(outer.name().find("chain[mock:x, mock:y]") != std::string::npos);
}

TEST_CASE("Chain - concurrent callers agree on one memoized provider", "[auth][chain][concurrency]") {
    auto a = mock("a", Mode::RESOLUTION_ERROR);
    auto b = mock("b", Mode::TOKEN, "tok-b");
    CredentialsProviderChain chain({a, b});

    constexpr int kThreads = 8;
    constexpr int kCallsPerThread = 200;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kCallsPerThread; ++i) {
                const auto result = chain.get_credentials();
                if (result.is_error() || result.value().token() != "tok-b") {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(failures.load() == 0);
    CHECK(chain.last_used_provider() == b);
    CHECK(b->call_count() == kThreads * kCallsPerThread);
    // Only callers racing on the first discovery walked past a
    CHECK(a->call_count() <= static_cast<uint64_t>(kThreads));
}
