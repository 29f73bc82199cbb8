// Pricing, quotes, buy/sell execution, failure rollback and reentrancy

#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

#include <vector>

using namespace bonding;
using namespace bonding::test;

namespace {

// 3000 USD per settlement unit, 1e6 price precision
I128 units_at(I128 settlement, I128 price) {
    return settlement * 3000 * 1000000 / price;
}

} // namespace

TEST_CASE("Launch pricing", "[curve]") {
    ManualClock clock;
    Market market(CurveConfig{}, options_at(clock));
    const CurveEngine& engine = market.engine();

    REQUIRE(engine.oracle_price().amount == x18::from_int(3000));
    REQUIRE(engine.initial_price().amount == 7);
    REQUIRE(engine.final_price().amount == 75);
    REQUIRE(engine.current_price().amount == 7);
    REQUIRE(engine.market_cap_usd().amount == x18::from_int(7000));
    REQUIRE(engine.unsold_inventory() == tokens(1000000000));
    REQUIRE(engine.sold_units() == 0);
    REQUIRE_FALSE(engine.target_reached());

    SECTION("Quotes") {
        QuoteResult q = engine.quote_buy(X18_ONE);
        REQUIRE(q.ok());
        REQUIRE(q.amount == units_at(X18_ONE, 7));
        REQUIRE(q.price == 7);

        REQUIRE(engine.quote_buy(0).status == errors::ZERO_INPUT);
        REQUIRE(engine.quote_sell(0).status == errors::EMPTY_INPUT);
        REQUIRE(engine.quote_sell(tokens(1)).status == errors::NO_INVENTORY_SOLD);
        REQUIRE(engine.quote_buy(tokens(1000000)).status == errors::INSUFFICIENT_INVENTORY);
    }

    SECTION("Views do not touch the cache") {
        REQUIRE(engine.price_cache() == PriceCache{0, 0});
        REQUIRE(market.events().size() == 0);
    }
}

TEST_CASE("Buy", "[curve]") {
    ManualClock clock;
    Market market(CurveConfig{}, options_at(clock));
    CurveEngine& engine = market.engine();
    market.fund(ALICE, tokens(100));

    SECTION("Single purchase") {
        I128 expected = units_at(X18_ONE, 7);
        BuyResult r = engine.buy(ALICE, X18_ONE);
        REQUIRE(r.ok());
        REQUIRE(r.units_out == expected);
        REQUIRE(r.fee == X18_ONE / 100);
        REQUIRE(r.price == 7);
        REQUIRE_FALSE(r.deployed_liquidity);

        REQUIRE(market.asset().balance_of(ALICE) == expected);
        REQUIRE(market.value().balance_of(ALICE) == tokens(99));
        REQUIRE(market.value().balance_of(accounts::FEE_COLLECTOR) == X18_ONE / 100);
        REQUIRE(market.value().balance_of(accounts::CURVE) == X18_ONE - X18_ONE / 100);
        REQUIRE(engine.unsold_inventory() == tokens(1000000000) - expected);
        REQUIRE(engine.raised_usd() == x18::from_int(3000));
        REQUIRE(engine.current_price().amount == 43);
        REQUIRE(engine.stats().total_buys == 1);

        const auto& records = market.events().records();
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].kind == EventKind::PRICE_REFRESHED);
        REQUIRE(records[0].price == x18::from_int(3000));
        REQUIRE(records[1].kind == EventKind::PURCHASE_EXECUTED);
        REQUIRE(records[1].account == ALICE);
        REQUIRE(records[1].units == expected);
        REQUIRE(records[1].settlement == X18_ONE);
        REQUIRE(records[1].seq > records[0].seq);
    }

    SECTION("Price rises with every purchase") {
        std::vector<I128> prices;
        for (int i = 0; i < 7; ++i) {
            BuyResult r = engine.buy(ALICE, X18_ONE);
            REQUIRE(r.ok());
            prices.push_back(r.price);
        }
        REQUIRE(prices == std::vector<I128>{7, 43, 49, 54, 59, 63, 67});
        REQUIRE(engine.current_price().amount == 71);
        REQUIRE(engine.sold_units() == *units::parse("758361540.432518948352416853"));
        REQUIRE(engine.raised_usd() == x18::from_int(21000));
        REQUIRE(engine.target_reached());
        REQUIRE_FALSE(engine.liquidity_deployed());
    }

    SECTION("Beneficiary receives the units") {
        BuyResult r = engine.buy(ALICE, X18_ONE, BOB);
        REQUIRE(r.ok());
        REQUIRE(market.asset().balance_of(BOB) == r.units_out);
        REQUIRE(market.asset().balance_of(ALICE) == 0);
        REQUIRE(market.events().filter(EventKind::PURCHASE_EXECUTED)[0].account == BOB);
    }

    SECTION("Fee is exact for odd amounts") {
        for (I128 amount : {I128(1), I128(99), I128(101), I128(12345678901234567)}) {
            I128 fees_before = market.value().balance_of(accounts::FEE_COLLECTOR);
            I128 curve_before = market.value().balance_of(accounts::CURVE);
            BuyResult r = engine.buy(ALICE, amount);
            REQUIRE(r.ok());
            REQUIRE(r.fee == amount / 100);
            I128 fee_delta = market.value().balance_of(accounts::FEE_COLLECTOR) - fees_before;
            I128 curve_delta = market.value().balance_of(accounts::CURVE) - curve_before;
            REQUIRE(fee_delta == r.fee);
            REQUIRE(fee_delta + curve_delta == amount);
        }
    }
}

TEST_CASE("Rejected buys leave no trace", "[curve]") {
    ManualClock clock;
    Market market(CurveConfig{}, options_at(clock));
    CurveEngine& engine = market.engine();
    market.fund(ALICE, tokens(10));

    CurveState before = engine.state();
    size_t events_before = market.events().size();

    auto unchanged = [&] {
        REQUIRE(engine.state() == before);
        REQUIRE(market.events().size() == events_before);
        REQUIRE(market.value().balance_of(ALICE) == tokens(10));
        REQUIRE(market.asset().balance_of(ALICE) == 0);
        REQUIRE(market.value().balance_of(accounts::FEE_COLLECTOR) == 0);
        REQUIRE(engine.price_cache() == PriceCache{0, 0});
    };

    SECTION("Zero settlement") {
        REQUIRE(engine.buy(ALICE, 0).status == errors::ZERO_INPUT);
        unchanged();
    }

    SECTION("Payer cannot cover the settlement") {
        REQUIRE(engine.buy(ALICE, tokens(11)).status == errors::SETTLEMENT_TRANSFER_FAILED);
        unchanged();
    }

    SECTION("Slippage bound") {
        I128 quoted = engine.quote_buy(X18_ONE).amount;
        BuyResult r = engine.buy(ALICE, X18_ONE, ALICE, quoted + 1);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(r.units_out == 0);
        unchanged();

        REQUIRE(engine.buy(ALICE, X18_ONE, ALICE, quoted).ok());
    }

    SECTION("Oracle source unavailable") {
        market.feed().set_available(false);
        REQUIRE(engine.buy(ALICE, X18_ONE).status == errors::ORACLE_SOURCE_UNAVAILABLE);
        unchanged();
    }

    SECTION("Non-positive oracle answer") {
        market.feed().set_answer(0);
        REQUIRE(engine.buy(ALICE, X18_ONE).status == errors::INVALID_PRICE);
        unchanged();
    }

    SECTION("Fee collector refuses the fee") {
        market.value().set_receive_hook(accounts::FEE_COLLECTOR,
                                        [](const Address&, I128) { return false; });
        REQUIRE(engine.buy(ALICE, X18_ONE).status == errors::FEE_TRANSFER_FAILED);
        unchanged();
    }
}

TEST_CASE("Oracle cache is reused within the interval", "[curve][oracle]") {
    ManualClock clock;
    Market market(CurveConfig{}, options_at(clock));
    CurveEngine& engine = market.engine();
    market.fund(ALICE, tokens(10));

    REQUIRE(engine.buy(ALICE, X18_ONE).ok());
    market.feed().set_answer(static_cast<I128>(6000) * 100000000);

    clock.now += 10;
    BuyResult second = engine.buy(ALICE, X18_ONE);
    REQUIRE(second.ok());
    REQUIRE(second.units_out == units_at(X18_ONE, 43));
    REQUIRE(market.events().filter(EventKind::PRICE_REFRESHED).size() == 1);
    REQUIRE(engine.price_cache().price_x18 == x18::from_int(3000));

    clock.now += 3600;
    REQUIRE(engine.buy(ALICE, X18_ONE).ok());
    REQUIRE(market.events().filter(EventKind::PRICE_REFRESHED).size() == 2);
    REQUIRE(engine.oracle_price().amount == x18::from_int(6000));

    SECTION("Explicit refresh inside the window keeps the cache") {
        market.feed().set_answer(static_cast<I128>(5000) * 100000000);
        PriceCache cached = engine.price_cache();

        clock.now += 10;
        OracleReading r = engine.refresh_price();
        REQUIRE(r.status == errors::OK);
        REQUIRE_FALSE(r.refreshed);
        REQUIRE(r.price_x18 == x18::from_int(6000));
        REQUIRE(engine.price_cache() == cached);
        REQUIRE(market.events().filter(EventKind::PRICE_REFRESHED).size() == 2);
    }

    SECTION("Explicit refresh after the window reads the feed") {
        market.feed().set_answer(static_cast<I128>(5000) * 100000000);

        clock.now += 3600;
        OracleReading r = engine.refresh_price();
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.refreshed);
        REQUIRE(r.price_x18 == x18::from_int(5000));
        REQUIRE(engine.price_cache() == PriceCache{x18::from_int(5000), clock.now});
        REQUIRE(market.events().filter(EventKind::PRICE_REFRESHED).size() == 3);
    }

    SECTION("Failed explicit refresh keeps the cache") {
        market.feed().set_available(false);
        clock.now += 3600;
        REQUIRE(engine.refresh_price().status == errors::ORACLE_SOURCE_UNAVAILABLE);
        REQUIRE(engine.price_cache().price_x18 == x18::from_int(6000));
    }
}

TEST_CASE("Sell", "[curve]") {
    ManualClock clock;
    Market market(CurveConfig{}, options_at(clock));
    CurveEngine& engine = market.engine();
    market.fund(ALICE, tokens(10));

    SECTION("Nothing sold yet") {
        market.asset().transfer(accounts::CURVE, BOB, tokens(1));
        market.approve_curve(BOB, tokens(1));
        REQUIRE(engine.sell(BOB, tokens(1)).status == errors::NO_INVENTORY_SOLD);
    }

    REQUIRE(engine.buy(ALICE, X18_ONE).ok());
    I128 held = market.asset().balance_of(ALICE);
    CurveState before = engine.state();

    SECTION("Sale at the current price") {
        market.approve_curve(ALICE, tokens(10000000));
        SellResult r = engine.sell(ALICE, tokens(10000000));
        REQUIRE(r.ok());
        REQUIRE(r.price == 43);
        REQUIRE(r.settlement_out == 143333333333333333);
        REQUIRE(r.fee == 1433333333333333);
        REQUIRE(r.net_out == 141900000000000000);
        REQUIRE(r.fee + r.net_out == r.settlement_out);

        REQUIRE(market.value().balance_of(ALICE) == tokens(9) + r.net_out);
        REQUIRE(market.asset().balance_of(ALICE) == held - tokens(10000000));
        REQUIRE(engine.unsold_inventory() == before.unsold_inventory + tokens(10000000));
        REQUIRE(engine.raised_usd() == before.raised_usd_x18);
        REQUIRE(engine.stats().total_sells == 1);

        auto sales = market.events().filter(EventKind::SALE_EXECUTED);
        REQUIRE(sales.size() == 1);
        REQUIRE(sales[0].account == ALICE);
        REQUIRE(sales[0].settlement == r.settlement_out);
    }

    SECTION("Inventory is conserved") {
        market.approve_curve(ALICE, held / 2);
        REQUIRE(engine.sell(ALICE, held / 2).ok());
        REQUIRE(market.asset().balance_of(accounts::CURVE) == engine.unsold_inventory());
        REQUIRE(engine.unsold_inventory() + market.asset().balance_of(ALICE) ==
                engine.config().total_supply);
    }

    SECTION("Rejections") {
        size_t events_before = market.events().size();

        REQUIRE(engine.sell(ALICE, 0).status == errors::ZERO_INPUT);

        // No allowance
        REQUIRE(engine.sell(ALICE, tokens(1)).status == errors::LEDGER_TRANSFER_FAILED);

        market.approve_curve(ALICE, held + 1);
        REQUIRE(engine.sell(ALICE, held + 1).status == errors::INSUFFICIENT_INVENTORY);

        // 100M units are worth more than the 0.99 settlement in reserve
        REQUIRE(engine.sell(ALICE, tokens(100000000)).status == errors::INSUFFICIENT_RESERVE);

        REQUIRE(engine.state() == before);
        REQUIRE(market.events().size() == events_before);
        REQUIRE(market.asset().balance_of(ALICE) == held);
        REQUIRE(market.value().balance_of(ALICE) == tokens(9));
    }
}

TEST_CASE("Reentrant calls are rejected", "[curve]") {
    ManualClock clock;
    Market market(CurveConfig{}, options_at(clock));
    CurveEngine& engine = market.engine();
    market.fund(ALICE, tokens(10));
    market.fund(BOB, tokens(10));

    std::vector<int32_t> inner;
    market.value().set_receive_hook(accounts::FEE_COLLECTOR, [&](const Address&, I128) {
        inner.push_back(engine.buy(BOB, X18_ONE).status);
        inner.push_back(engine.sell(BOB, 1).status);
        inner.push_back(engine.refresh_price().status);
        return true;
    });

    BuyResult r = engine.buy(ALICE, X18_ONE);
    REQUIRE(r.ok());
    REQUIRE(inner == std::vector<int32_t>{errors::REENTRANCY, errors::REENTRANCY, errors::REENTRANCY});
    REQUIRE(market.value().balance_of(BOB) == tokens(10));
    REQUIRE(market.events().filter(EventKind::PURCHASE_EXECUTED).size() == 1);

    // The flag is released once the outer call returns
    market.value().clear_receive_hook(accounts::FEE_COLLECTOR);
    REQUIRE(engine.buy(BOB, X18_ONE).ok());
}

TEST_CASE("Raise accounting and price clamping", "[curve][policy]") {
    ManualClock clock;

    SECTION("Net raise excludes the fee") {
        CurveConfig cfg;
        cfg.raise_accounting = RaiseAccounting::NET;
        Market market(cfg, options_at(clock));
        market.fund(ALICE, tokens(10));
        REQUIRE(market.engine().buy(ALICE, X18_ONE).ok());
        REQUIRE(market.engine().raised_usd() == x18::from_int(2970));
    }

    SECTION("Past the threshold") {
        // Target out of reach so the curve never deploys
        CurveConfig cfg = flat_config();
        cfg.final_multiplier = 9;
        cfg.raise_target_usd_x18 = tokens(1000000);

        CurveConfig clamped = cfg;
        clamped.clamp_price_at_threshold = true;

        Market open(cfg, options_at(clock, ONE_DOLLAR_8DP));
        Market capped(clamped, options_at(clock, ONE_DOLLAR_8DP));

        for (Market* m : {&open, &capped}) {
            m->fund(ALICE, tokens(10000));
            REQUIRE(m->engine().buy(ALICE, tokens(800)).units_out == tokens(800));
            REQUIRE(m->engine().current_price().amount == 9);
            REQUIRE(m->engine().buy(ALICE, tokens(900)).units_out == tokens(100));
            REQUIRE(m->engine().sold_units() == tokens(900));
        }

        REQUIRE(open.engine().current_price().amount == 10);
        REQUIRE(capped.engine().current_price().amount == 9);
    }
}
