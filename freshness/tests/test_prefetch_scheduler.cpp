#include <catch2/catch_test_macros.hpp>
#include "../src/prefetch_scheduler.hpp"
#include "test_support.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("Prefetch warms tiers in order", "[prefetch]") {
    ManualExecutor executor;
    SwrCache<std::string> cache(executor, FreshnessTier::TokenList);
    std::map<std::string, int> fetched;
    auto fetcher = [&fetched](const std::string& key) {
        fetched[key]++;
        return "tokens for " + key;
    };
    const FreshnessOptions options{60s, 5min};

    PrefetchScheduler<std::string> scheduler(
        cache, executor,
        {"token-list:1", "token-list:196"},
        {"token-list:10"},
        fetcher, options);

    SECTION("Nothing happens before the initial delay") {
        scheduler.start();
        REQUIRE(scheduler.is_started());

        executor.advance(499ms);
        REQUIRE(fetched.empty());
        REQUIRE_FALSE(scheduler.is_complete());
    }

    SECTION("Secondary tier waits for the priority tier plus its delay") {
        scheduler.start();

        executor.advance(500ms);
        REQUIRE(fetched.size() == 2);
        REQUIRE(cache.contains("token-list:1"));
        REQUIRE(cache.contains("token-list:196"));
        REQUIRE(fetched.count("token-list:10") == 0);
        REQUIRE_FALSE(scheduler.is_complete());

        executor.advance(2999ms);
        REQUIRE(fetched.count("token-list:10") == 0);

        executor.advance(1ms);
        REQUIRE(fetched["token-list:10"] == 1);
        REQUIRE(cache.get("token-list:10").data == "tokens for token-list:10");
        REQUIRE(scheduler.is_complete());
    }

    SECTION("Keys already cached are skipped") {
        cache.set("token-list:1", "warm");
        scheduler.start();
        executor.advance(500ms);
        executor.advance(3000ms);

        REQUIRE(fetched.count("token-list:1") == 0);
        REQUIRE(fetched["token-list:196"] == 1);
        REQUIRE(cache.get("token-list:1").data == "warm");
        REQUIRE(scheduler.is_complete());
    }

    SECTION("Start is idempotent") {
        scheduler.start();
        scheduler.start();
        REQUIRE(executor.delayed() == 1);

        executor.advance(500ms);
        REQUIRE(fetched["token-list:1"] == 1);
    }

    SECTION("Manual prefetch warms one key once") {
        scheduler.prefetch("token-list:8453");
        scheduler.prefetch("token-list:8453");
        executor.run_pending();

        REQUIRE(fetched["token-list:8453"] == 1);

        scheduler.prefetch("token-list:8453");
        REQUIRE(executor.queued() == 0);
    }
}

TEST_CASE("Prefetch failures are not surfaced", "[prefetch]") {
    ManualExecutor executor;
    SwrCache<int> cache(executor, FreshnessTier::TokenList);

    PrefetchScheduler<int> scheduler(
        cache, executor,
        {"token-list:1", "token-list:56"},
        {"token-list:501"},
        [](const std::string& key) -> int {
            if (key == "token-list:56") {
                throw std::runtime_error("rate limited");
            }
            return 1;
        },
        tier_options(FreshnessTier::TokenList));

    scheduler.start();
    REQUIRE_NOTHROW(executor.advance(500ms));
    REQUIRE_NOTHROW(executor.advance(3000ms));

    REQUIRE(scheduler.is_complete());
    REQUIRE(cache.contains("token-list:1"));
    REQUIRE_FALSE(cache.contains("token-list:56"));
    REQUIRE(cache.contains("token-list:501"));
    REQUIRE(cache.pending_count() == 0);
}

TEST_CASE("Prefetch survives fetchers throwing non-standard types", "[prefetch]") {
    ManualExecutor executor;
    SwrCache<int> cache(executor, FreshnessTier::TokenList);

    PrefetchScheduler<int> scheduler(
        cache, executor,
        {"token-list:1"},
        {"token-list:56"},
        [](const std::string&) -> int { throw 429; },
        tier_options(FreshnessTier::TokenList));

    scheduler.start();
    REQUIRE_NOTHROW(executor.advance(500ms));
    REQUIRE_NOTHROW(executor.advance(3000ms));
    REQUIRE(scheduler.is_complete());

    REQUIRE_NOTHROW(scheduler.prefetch("token-list:10"));
    REQUIRE_NOTHROW(executor.run_pending());
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.pending_count() == 0);
}

TEST_CASE("Empty tiers complete immediately after their delays", "[prefetch]") {
    ManualExecutor executor;
    SwrCache<int> cache(executor);
    PrefetchScheduler<int> scheduler(cache, executor, {}, {},
                                     [](const std::string&) { return 0; },
                                     tier_options(FreshnessTier::Default),
                                     PrefetchTiming{10ms, 20ms});

    scheduler.start();
    executor.advance(10ms);
    REQUIRE_FALSE(scheduler.is_complete());
    executor.advance(20ms);
    REQUIRE(scheduler.is_complete());
}
