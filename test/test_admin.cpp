// Capability-gated settings

#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

#include <stdexcept>

using namespace bonding;
using namespace bonding::test;

TEST_CASE("Admin capability", "[admin]") {
    ManualClock clock;
    Market market(CurveConfig{}, options_at(clock));
    CurveEngine& engine = market.engine();
    market.fund(ALICE, tokens(10));

    auto cap = engine.take_admin_capability();
    REQUIRE(cap.has_value());
    REQUIRE_FALSE(engine.take_admin_capability().has_value());

    SECTION("Foreign capability is refused") {
        Market other(CurveConfig{}, options_at(clock));
        auto foreign = other.engine().take_admin_capability();
        REQUIRE(foreign.has_value());
        REQUIRE(engine.set_fee_percent(*foreign, 0) == errors::UNAUTHORIZED);
        REQUIRE(engine.set_fee_collector(*foreign, BOB) == errors::UNAUTHORIZED);
        REQUIRE(engine.fee_percent() == 1);
    }

    SECTION("Fee percent") {
        REQUIRE(engine.set_fee_percent(*cap, MAX_FEE_PERCENT + 1) == errors::INVALID_CONFIG);
        REQUIRE(engine.set_fee_percent(*cap, 5) == errors::OK);
        BuyResult r = engine.buy(ALICE, X18_ONE);
        REQUIRE(r.fee == X18_ONE / 20);

        REQUIRE(engine.set_fee_percent(*cap, 0) == errors::OK);
        REQUIRE(engine.buy(ALICE, X18_ONE).fee == 0);
    }

    SECTION("Fee collector") {
        REQUIRE(engine.set_fee_collector(*cap, addresses::ZERO) == errors::INVALID_CONFIG);
        REQUIRE(engine.set_fee_collector(*cap, BOB) == errors::OK);
        REQUIRE(engine.buy(ALICE, X18_ONE).ok());
        REQUIRE(market.value().balance_of(BOB) == X18_ONE / 100);
        REQUIRE(market.value().balance_of(accounts::FEE_COLLECTOR) == 0);
    }

    SECTION("Liquidity collector") {
        REQUIRE(engine.set_liquidity_collector(*cap, BOB) == errors::OK);
        REQUIRE(engine.liquidity_collector() == BOB);
    }

    SECTION("Update interval") {
        REQUIRE(engine.set_update_interval(*cap, 0) == errors::OK);
        REQUIRE(engine.buy(ALICE, X18_ONE).ok());
        REQUIRE(engine.buy(ALICE, X18_ONE).ok());
        REQUIRE(market.events().filter(EventKind::PRICE_REFRESHED).size() == 2);
    }

    SECTION("Settings cannot change mid-operation") {
        int32_t status = errors::OK;
        market.value().set_receive_hook(accounts::FEE_COLLECTOR, [&](const Address&, I128) {
            status = engine.set_fee_percent(*cap, 0);
            return true;
        });
        REQUIRE(engine.buy(ALICE, X18_ONE).ok());
        REQUIRE(status == errors::REENTRANCY);
        REQUIRE(engine.fee_percent() == 1);
    }
}

TEST_CASE("Invalid configuration is refused at construction", "[admin][config]") {
    CurveConfig cfg;
    cfg.fee_percent = MAX_FEE_PERCENT + 1;
    REQUIRE_THROWS_AS(Market(cfg), std::invalid_argument);
}
