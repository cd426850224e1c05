#include <catch2/catch_test_macros.hpp>
#include "../src/price_api.hpp"
#include "../../freshness/tests/test_support.hpp"
#include "../../pricing/tests/fakes.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {

const std::string kProxy = "https://proxy.test/okx-dex";

struct Harness {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeDexPairProvider> dex = std::make_shared<FakeDexPairProvider>();
    std::shared_ptr<FakeSymbolProvider> symbols = std::make_shared<FakeSymbolProvider>();
    std::shared_ptr<PriceResolver> resolver = std::make_shared<PriceResolver>(dex, symbols);
    std::shared_ptr<DexApiClient> dex_api = std::make_shared<DexApiClient>(transport, kProxy);
};

} // namespace

TEST_CASE("Price lookups", "[price_api]") {
    Harness h;
    InlineExecutor executor;
    ManualClock clock;
    PriceApi api(executor, h.resolver, h.dex_api, 500, clock.fn());

    SECTION("Known prices are resolved without the cache") {
        auto body = api.get_price("1", "0xABC", "FOO", 2.0);
        REQUIRE(body["price"] == 2.0);
        REQUIRE(body["source"] == "api");
        REQUIRE(body["from_cache"] == false);
        REQUIRE(api.price_cache().size() == 0);
        REQUIRE(h.transport->requested.empty());
    }

    SECTION("Only ASCII letters in the address are lowercased") {
        auto body = api.get_price("1", "0xAB\xc3\x84" "C", "FOO", 2.0);
        REQUIRE(body["address"] == "0xab\xc3\x84" "c");
    }

    SECTION("Miss fetches once, then serves from cache") {
        h.transport->responses[kProxy] = {200, R"({"price": "0.5"})"};

        auto first = api.get_price("1", "0xABC", "FOO");
        REQUIRE(first["price"] == 0.5);
        REQUIRE(first["source"] == "api");
        REQUIRE(first["address"] == "0xabc");
        REQUIRE(first["from_cache"] == false);

        auto second = api.get_price("1", "0xabc", "FOO");
        REQUIRE(second["from_cache"] == true);
        REQUIRE(h.transport->requested.size() == 1);
        REQUIRE(api.price_cache().contains("price:1:0xabc"));
    }

    SECTION("Falls through to the chain when the DEX API has no price") {
        h.transport->responses[kProxy] = {500, "{}"};
        h.dex->prices["0xabc"] = 0.42;

        auto body = api.get_price("56", "0xabc", "FOO");
        REQUIRE(body["price"] == 0.42);
        REQUIRE(body["source"] == "dex-pair");
    }

    SECTION("Unknown price is cached as null") {
        auto body = api.get_price("1", "0xdead", "MYSTERY");
        REQUIRE(body["price"].is_null());
        REQUIRE(body["source"].is_null());
        REQUIRE(api.price_cache().contains("price:1:0xdead"));
    }

    SECTION("Prefix invalidation leaves other chains alone") {
        api.price_cache().set("price:1:0xa", ResolvedPrice{1.0, PriceSource::Api});
        api.price_cache().set("price:1:0xb", ResolvedPrice{2.0, PriceSource::Api});
        api.price_cache().set("price:56:0xa", ResolvedPrice{3.0, PriceSource::Api});

        REQUIRE(api.invalidate_prefix("price:1:") == 2);
        REQUIRE_FALSE(api.price_cache().contains("price:1:0xa"));
        REQUIRE(api.price_cache().contains("price:56:0xa"));
    }

    SECTION("Clear empties both caches") {
        api.price_cache().set("price:1:0xa", ResolvedPrice{1.0, PriceSource::Api});
        api.token_cache().set("token-list:1", {});
        api.clear();

        auto stats = api.stats();
        REQUIRE(stats["price"]["size"] == 0);
        REQUIRE(stats["token_list"]["size"] == 0);
        REQUIRE(stats["price"]["tier"] == "price");
        REQUIRE(stats["price"]["stale_ms"] == 10000);
        REQUIRE(stats["token_list"]["tier"] == "token-list");
        REQUIRE(stats["token_list"]["max_age_ms"] == 1800000);
    }
}

TEST_CASE("Stale prices are served while refreshing", "[price_api]") {
    Harness h;
    ManualExecutor executor;
    ManualClock clock;
    PriceApi api(executor, h.resolver, h.dex_api, 500, clock.fn());

    api.price_cache().set("price:1:0xabc", ResolvedPrice{1.0, PriceSource::DexPair});
    clock.advance(11s);
    h.transport->responses[kProxy] = {200, R"({"price": "1.25"})"};

    auto body = api.get_price("1", "0xabc", "FOO");
    REQUIRE(body["price"] == 1.0);
    REQUIRE(body["from_cache"] == true);
    REQUIRE(executor.queued() == 1);

    executor.run_pending();
    auto refreshed = api.price_cache().get("price:1:0xabc");
    REQUIRE(refreshed.data.has_value());
    REQUIRE((*refreshed.data)->price == 1.25);
    REQUIRE_FALSE(refreshed.is_stale);
}

TEST_CASE("Token lists", "[price_api]") {
    Harness h;
    InlineExecutor executor;
    PriceApi api(executor, h.resolver, h.dex_api);

    SECTION("Fetched and cached per chain") {
        h.transport->responses[kProxy] = {200, R"([
            {"tokenContractAddress": "0xabc", "tokenSymbol": "FOO", "tokenName": "Foo",
             "decimals": "18", "tokenLogoUrl": ""}
        ])"};

        auto body = api.get_tokens("1");
        REQUIRE(body["count"] == 1);
        REQUIRE(body["tokens"][0]["symbol"] == "FOO");
        REQUIRE(body["from_cache"] == false);
        REQUIRE(api.get_tokens("1")["from_cache"] == true);
        REQUIRE(api.token_cache().contains("token-list:1"));
    }

    SECTION("Upstream failure on a miss propagates") {
        REQUIRE_THROWS_AS(api.get_tokens("1"), std::runtime_error);
        REQUIRE(api.token_cache().pending_count() == 0);
    }

    SECTION("Only token list keys can be fetched") {
        REQUIRE_THROWS_AS(api.fetch_token_list("price:1:0xabc"), std::invalid_argument);
        REQUIRE_THROWS_AS(api.fetch_token_list("token-list:"), std::invalid_argument);
    }
}
