/**
 * @file test_token_refresher.cpp
 * @brief Unit tests for TokenRefresher
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "auth/token_refresher.hpp"
#include "fake_transport.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace taskstream;
using namespace taskstream::testing;

namespace {

ClientConfig test_config() {
    ClientConfig config;
    config.base_url = "http://backend.test";
    config.credentials_path.clear();
    config.fixed_access_token.clear();
    config.fixed_refresh_token.clear();
    return config;
}

} // namespace

TEST_CASE("TokenRefresher attaches the bearer credential", "[token_refresher]") {
    FakeTransport transport;
    MemoryCredentialStore store;
    ClientConfig config = test_config();

    RequestDescriptor request;
    request.url = "http://backend.test/api/v1/tasks";

    SECTION("Stored access token") {
        store.set(Credential{"access-1", "refresh-1"});
        TokenRefresher auth(transport, store, config);

        auto authorized = auth.authorize(request);
        REQUIRE(authorized.access_token == "access-1");
        REQUIRE(bearer_of(authorized.request) == "Bearer access-1");
        REQUIRE(request.headers.empty());
    }

    SECTION("Falls back to the configured token") {
        config.fixed_access_token = "fixed-access";
        TokenRefresher auth(transport, store, config);
        REQUIRE(bearer_of(auth.authorize(request).request) == "Bearer fixed-access");
    }

    SECTION("No credential, no header") {
        TokenRefresher auth(transport, store, config);
        auto authorized = auth.authorize(request);
        REQUIRE(authorized.access_token.empty());
        REQUIRE(authorized.request.headers.count("Authorization") == 0);
    }
}

TEST_CASE("TokenRefresher refresh outcomes", "[token_refresher]") {
    FakeTransport transport;
    MemoryCredentialStore store(Credential{"access-old", "refresh-old"});
    TokenRefresher auth(transport, store, test_config());

    SECTION("Success stores the new pair") {
        transport.queue_refresh(refresh_ok("access-new", "refresh-new"));

        Credential fresh = auth.refresh("access-old");
        REQUIRE(fresh == Credential{"access-new", "refresh-new"});
        REQUIRE(store.get() == std::optional<Credential>(fresh));
        REQUIRE(auth.refresh_count() == 1);

        auto sent = transport.refresh_requests();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].method == HttpMethod::POST);
        REQUIRE(sent[0].url == "http://backend.test/api/v1/refresh-token");
        auto body = nlohmann::json::parse(*sent[0].body);
        REQUIRE(body["refresh_token"] == "refresh-old");
    }

    SECTION("Rejection clears the store") {
        transport.queue_refresh(json_response(401, {{"detail", "expired"}}));

        REQUIRE_THROWS_AS(auth.refresh("access-old"), AuthError);
        REQUIRE_FALSE(store.get().has_value());
    }

    SECTION("Unreachable endpoint is an authentication failure") {
        transport.queue_refresh_failure(TransportErrorKind::TIMEOUT);

        REQUIRE_THROWS_AS(auth.refresh("access-old"), AuthError);
        REQUIRE_FALSE(store.get().has_value());
        REQUIRE(auth.refresh_count() == 1);
    }

    SECTION("Malformed response") {
        HttpResponse garbage;
        garbage.status_code = 200;
        garbage.body = "{\"payload\":{}}";
        transport.queue_refresh(garbage);

        REQUIRE_THROWS_WITH(auth.refresh("access-old"),
                            Catch::Matchers::ContainsSubstring("Failed to parse refresh response"));
        REQUIRE_FALSE(store.get().has_value());
    }

    SECTION("Refresh call carries the caller's cancellation token") {
        transport.queue_refresh(refresh_ok("access-new", "refresh-new"));
        auto signal = make_cancellation_token();

        auth.refresh("access-old", signal);
        auto sent = transport.refresh_requests();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].signal == signal);
    }

    SECTION("Cancelled refresh leaves the store untouched") {
        transport.queue_refresh_failure(TransportErrorKind::TIMEOUT);
        auto signal = make_cancellation_token();
        transport.on_refresh = [signal] { signal->cancel(); };

        REQUIRE_THROWS_AS(auth.refresh("access-old", signal), CancelledError);
        REQUIRE(store.get() == std::optional<Credential>(Credential{"access-old", "refresh-old"}));
    }

    SECTION("Missing refresh token fails without a network call") {
        store.clear();
        REQUIRE_THROWS_AS(auth.refresh(), AuthError);
        REQUIRE(auth.refresh_count() == 0);
        REQUIRE(transport.refresh_requests().empty());
    }

    SECTION("Stale rejection reuses the stored pair") {
        store.set(Credential{"access-newer", "refresh-newer"});

        Credential current = auth.refresh("access-old");
        REQUIRE(current.access_token == "access-newer");
        REQUIRE(auth.refresh_count() == 0);
    }
}

TEST_CASE("TokenRefresher collapses concurrent refreshes", "[token_refresher]") {
    FakeTransport transport;
    MemoryCredentialStore store(Credential{"access-old", "refresh-old"});
    TokenRefresher auth(transport, store, test_config());

    transport.queue_refresh(refresh_ok("access-new", "refresh-new"));
    transport.on_refresh = [] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    };

    const int callers = 8;
    std::vector<Credential> results(callers);
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&, i] { results[i] = auth.refresh("access-old"); });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(auth.refresh_count() == 1);
    REQUIRE(transport.refresh_requests().size() == 1);
    for (const auto& result : results) {
        REQUIRE(result.access_token == "access-new");
    }
}

TEST_CASE("TokenRefresher shares a failed refresh", "[token_refresher]") {
    FakeTransport transport;
    MemoryCredentialStore store(Credential{"access-old", "refresh-old"});
    TokenRefresher auth(transport, store, test_config());

    transport.queue_refresh(json_response(401, {{"detail", "revoked"}}));
    transport.on_refresh = [] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    };

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            try {
                auth.refresh("access-old");
            } catch (const AuthError&) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Late callers find an empty store and fail without a second network call
    REQUIRE(failures.load() == 4);
    REQUIRE(auth.refresh_count() == 1);
}
