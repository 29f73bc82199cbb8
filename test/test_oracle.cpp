// Reference price ingestion and interval caching

#include <catch2/catch_test_macros.hpp>
#include "bonding/oracle.hpp"

#include <cstdint>

using namespace bonding;

TEST_CASE("OracleCache refresh", "[oracle]") {
    StaticPriceFeed feed(8, static_cast<I128>(3000) * 100000000, 50);
    OracleCache oracle(feed, 3600);

    SECTION("Empty cache is stale") {
        REQUIRE(oracle.is_stale(0));
    }

    SECTION("Answer is scaled to 18 decimals") {
        OracleReading r = oracle.refresh(1000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.refreshed);
        REQUIRE(r.price_x18 == x18::from_int(3000));
        REQUIRE(oracle.cache() == PriceCache{x18::from_int(3000), 1000});
    }

    SECTION("refresh_if_stale honors the interval") {
        oracle.refresh(1000);
        feed.set_answer(static_cast<I128>(4000) * 100000000);

        OracleReading cached = oracle.refresh_if_stale(1000 + 3599);
        REQUIRE_FALSE(cached.refreshed);
        REQUIRE(cached.price_x18 == x18::from_int(3000));

        OracleReading fresh = oracle.refresh_if_stale(1000 + 3600);
        REQUIRE(fresh.refreshed);
        REQUIRE(fresh.price_x18 == x18::from_int(4000));
        REQUIRE(oracle.cache().last_refresh == 4600);
    }

    SECTION("Huge interval keeps the cache fresh") {
        oracle.refresh(1000);
        oracle.set_update_interval(UINT64_MAX - 10);
        REQUIRE_FALSE(oracle.is_stale(1000 + 3600));
        REQUIRE_FALSE(oracle.refresh_if_stale(UINT64_MAX - 100).refreshed);
        REQUIRE(oracle.is_stale(UINT64_MAX));
    }

    SECTION("current_price reads through without writing the cache") {
        oracle.refresh(1000);
        feed.set_answer(static_cast<I128>(4000) * 100000000);
        uint64_t reads = feed.reads();

        REQUIRE(oracle.current_price(2000).price_x18 == x18::from_int(3000));
        REQUIRE(feed.reads() == reads);

        OracleReading stale = oracle.current_price(9000);
        REQUIRE(stale.price_x18 == x18::from_int(4000));
        REQUIRE_FALSE(stale.refreshed);
        REQUIRE(oracle.cache().price_x18 == x18::from_int(3000));
    }

    SECTION("Non-positive answer leaves the cache untouched") {
        oracle.refresh(1000);
        feed.set_answer(0);
        REQUIRE(oracle.refresh(9000).status == errors::INVALID_PRICE);
        feed.set_answer(-5);
        REQUIRE(oracle.refresh(9000).status == errors::INVALID_PRICE);
        REQUIRE(oracle.cache() == PriceCache{x18::from_int(3000), 1000});
    }

    SECTION("Silent source") {
        feed.set_available(false);
        REQUIRE(oracle.refresh(1000).status == errors::ORACLE_SOURCE_UNAVAILABLE);
        REQUIRE(oracle.current_price(1000).status == errors::ORACLE_SOURCE_UNAVAILABLE);
    }
}

TEST_CASE("Feed decimals above 18", "[oracle]") {
    StaticPriceFeed feed(20, static_cast<I128>(3000) * math::pow10(20));
    OracleCache oracle(feed, 60);
    REQUIRE(oracle.refresh(1).price_x18 == x18::from_int(3000));
}
