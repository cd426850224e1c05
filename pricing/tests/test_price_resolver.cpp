#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/price_resolver.hpp"
#include "fakes.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using Catch::Matchers::WithinRel;

namespace {

const std::string kUsdtMainnet = "0xdac17f958d2ee523a2206206994597c13d831ec7";
const std::string kXbtc = "0xb7c00000bcdeef966b20b3d884b98e64d2b06b4f";

class CountingStrategy : public PriceStrategy {
public:
    CountingStrategy(std::optional<double> price, bool blocking, int& calls)
        : price_(price), blocking_(blocking), calls_(calls) {}

    std::optional<double> try_resolve(const PriceQuery&) override {
        ++calls_;
        return price_;
    }
    PriceSource source() const override { return PriceSource::DexPair; }
    bool is_blocking() const override { return blocking_; }

private:
    std::optional<double> price_;
    bool blocking_;
    int& calls_;
};

// Fails with a value that is not a std::exception
class RaisingStrategy : public PriceStrategy {
public:
    explicit RaisingStrategy(bool blocking) : blocking_(blocking) {}

    std::optional<double> try_resolve(const PriceQuery&) override { throw 1; }
    PriceSource source() const override { return PriceSource::SymbolAggregator; }
    bool is_blocking() const override { return blocking_; }

private:
    bool blocking_;
};

} // namespace

TEST_CASE("Price resolution chain", "[price_resolver]") {
    auto dex = std::make_shared<FakeDexPairProvider>();
    auto symbols = std::make_shared<FakeSymbolProvider>();
    PriceResolver resolver(dex, symbols);

    REQUIRE(resolver.strategy_count() == 7);

    SECTION("Registered stablecoin resolves to 1.0 without provider calls") {
        auto resolved = resolver.resolve_with_source({"1", kUsdtMainnet, "USDT", std::nullopt, std::nullopt});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->price == 1.0);
        REQUIRE(resolved->source == PriceSource::StablecoinRegistry);
        REQUIRE(dex->calls == 0);
        REQUIRE(symbols->asked.empty());
    }

    SECTION("Known API price wins over everything") {
        dex->prices[kUsdtMainnet] = 0.99;
        auto price = resolver.resolve("1", kUsdtMainnet, "USDT", 1.0005, 0.998);
        REQUIRE(price == std::optional<double>(1.0005));
    }

    SECTION("Router price used when API price is absent or invalid") {
        REQUIRE(resolver.resolve("1", "0xabc", "FOO", std::nullopt, 2.5) == std::optional<double>(2.5));
        REQUIRE(resolver.resolve("1", "0xabc", "FOO", 0.0, 2.5) == std::optional<double>(2.5));
        REQUIRE(resolver.resolve("1", "0xabc", "FOO", -3.0, 2.5) == std::optional<double>(2.5));
        REQUIRE(resolver.resolve("1", "0xabc", "FOO",
                                 std::numeric_limits<double>::quiet_NaN(), 2.5) == std::optional<double>(2.5));
    }

    SECTION("Dex pair provider consulted on a supported chain") {
        dex->prices["0xabc"] = 0.42;
        auto resolved = resolver.resolve_with_source({"56", "0xabc", "FOO", std::nullopt, std::nullopt});
        REQUIRE(resolved.has_value());
        REQUIRE_THAT(resolved->price, WithinRel(0.42));
        REQUIRE(resolved->source == PriceSource::DexPair);
        REQUIRE(symbols->asked.empty());
    }

    SECTION("Dex pair provider skipped on an unsupported chain") {
        dex->prices["0xabc"] = 0.42;
        symbols->prices["foo"] = 0.40;
        auto resolved = resolver.resolve_with_source({"196", "0xabc", "FOO", std::nullopt, std::nullopt});
        REQUIRE(dex->calls == 0);
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->source == PriceSource::SymbolAggregator);
        REQUIRE_THAT(resolved->price, WithinRel(0.40));
    }

    SECTION("Symbol aggregator is asked with a lowercased ticker") {
        symbols->prices["link"] = 14.2;
        auto price = resolver.resolve("1", "0x514910771af9ca656af840dff83e8264ecf986ca", "LINK");
        REQUIRE(price.has_value());
        REQUIRE_THAT(*price, WithinRel(14.2));
        REQUIRE(symbols->asked == std::vector<std::string>{"link"});
    }

    SECTION("Wrapped asset priced via its underlying") {
        symbols->prices["btc"] = 65000.0;
        auto resolved = resolver.resolve_with_source({"196", kXbtc, "XBTC", std::nullopt, std::nullopt});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->price == 65000.0);
        REQUIRE(resolved->source == PriceSource::WrappedUnderlying);
        REQUIRE(symbols->asked == std::vector<std::string>{"xbtc", "btc"});
    }

    SECTION("Stablecoin ticker is the last resort") {
        symbols->prices["usdt"] = 0.9991;
        auto aggregated = resolver.resolve_with_source({"56", "0xunlisted", "USDT", std::nullopt, std::nullopt});
        REQUIRE(aggregated->source == PriceSource::SymbolAggregator);

        symbols->prices.clear();
        auto heuristic = resolver.resolve_with_source({"56", "0xunlisted", "usdt", std::nullopt, std::nullopt});
        REQUIRE(heuristic.has_value());
        REQUIRE(heuristic->price == 1.0);
        REQUIRE(heuristic->source == PriceSource::StablecoinSymbol);
    }

    SECTION("Unknown token resolves to nothing") {
        REQUIRE_FALSE(resolver.resolve("1", "0xdeadbeef", "MYSTERY").has_value());
    }

    SECTION("Failing providers are treated as no price") {
        dex->fail = true;
        symbols->fail = true;
        REQUIRE_FALSE(resolver.resolve("1", "0xabc", "FOO").has_value());
        REQUIRE(resolver.resolve("1", "0xabc", "USDC") == std::optional<double>(1.0));
    }

    SECTION("Non-positive provider prices are skipped") {
        dex->prices["0xabc"] = 0.0;
        symbols->prices["foo"] = -1.0;
        REQUIRE_FALSE(resolver.resolve("1", "0xabc", "FOO").has_value());
        REQUIRE(dex->calls == 1);
    }

    SECTION("Sync resolution never touches providers") {
        dex->prices["0xabc"] = 0.42;
        symbols->prices["btc"] = 65000.0;

        REQUIRE(resolver.resolve_sync("1", kUsdtMainnet, "USDT") == std::optional<double>(1.0));
        REQUIRE(resolver.resolve_sync("1", "0xabc", "FOO", 3.0) == std::optional<double>(3.0));
        REQUIRE(resolver.resolve_sync("1", "0xabc", "FOO", std::nullopt, 4.0) == std::optional<double>(4.0));
        REQUIRE(resolver.resolve_sync("56", "0xabc", "busd") == std::optional<double>(1.0));
        REQUIRE_FALSE(resolver.resolve_sync("1", "0xabc", "FOO").has_value());
        REQUIRE_FALSE(resolver.resolve_sync("196", kXbtc, "XBTC").has_value());

        REQUIRE(dex->calls == 0);
        REQUIRE(symbols->asked.empty());
    }
}

TEST_CASE("Custom strategy lists", "[price_resolver]") {
    SECTION("First valid strategy short-circuits the rest") {
        int first = 0, second = 0;
        std::vector<std::unique_ptr<PriceStrategy>> strategies;
        strategies.push_back(std::make_unique<CountingStrategy>(5.0, false, first));
        strategies.push_back(std::make_unique<CountingStrategy>(7.0, false, second));
        PriceResolver resolver(std::move(strategies));

        REQUIRE(resolver.resolve("1", "0xabc", "FOO") == std::optional<double>(5.0));
        REQUIRE(first == 1);
        REQUIRE(second == 0);
    }

    SECTION("A strategy throwing a non-standard type is skipped") {
        int next = 0;
        std::vector<std::unique_ptr<PriceStrategy>> strategies;
        strategies.push_back(std::make_unique<RaisingStrategy>(false));
        strategies.push_back(std::make_unique<CountingStrategy>(3.5, false, next));
        PriceResolver resolver(std::move(strategies));

        std::optional<double> price;
        REQUIRE_NOTHROW(price = resolver.resolve("1", "0xabc", "FOO"));
        REQUIRE(price == std::optional<double>(3.5));
        REQUIRE_NOTHROW(price = resolver.resolve_sync("1", "0xabc", "FOO"));
        REQUIRE(price == std::optional<double>(3.5));
        REQUIRE(next == 2);
    }

    SECTION("Sync resolution skips blocking strategies") {
        int blocking = 0, local = 0;
        std::vector<std::unique_ptr<PriceStrategy>> strategies;
        strategies.push_back(std::make_unique<CountingStrategy>(5.0, true, blocking));
        strategies.push_back(std::make_unique<CountingStrategy>(std::nullopt, false, local));
        PriceResolver resolver(std::move(strategies));

        REQUIRE_FALSE(resolver.resolve_sync("1", "0xabc", "FOO").has_value());
        REQUIRE(blocking == 0);
        REQUIRE(local == 1);
    }

    SECTION("Null strategy is rejected") {
        std::vector<std::unique_ptr<PriceStrategy>> strategies;
        strategies.push_back(nullptr);
        REQUIRE_THROWS_AS(PriceResolver(std::move(strategies)), std::invalid_argument);
    }

    SECTION("Null provider is rejected") {
        REQUIRE_THROWS_AS(PriceResolver(nullptr, std::make_shared<FakeSymbolProvider>()),
                          std::invalid_argument);
    }
}
