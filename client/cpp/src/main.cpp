// bonding-cli - Bonding curve simulator
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Runs the curve engine against in-memory ledgers, a static price feed and
// the pool liquidity sink. Results are printed as JSON.

#include "bonding/bonding.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace bonding;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Config {
    std::string config_path;
    std::string oracle_price = "3000";
    bool verbose = false;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Output
//------------------------------------------------------------------------------

class PrintListener : public EventListener {
public:
    explicit PrintListener(bool verbose) : verbose_(verbose) {}

    void on_event(const EventRecord& r) override {
        if (!verbose_ && r.kind == EventKind::PRICE_REFRESHED) return;
        std::cout << "[" << r.seq << "] " << event_kind_name(r.kind)
                  << " account=" << addresses::to_hex(r.account)
                  << " units=" << units::format(r.units)
                  << " settlement=" << units::format(r.settlement)
                  << " price=" << units::to_string(r.price) << "\n";
    }

private:
    bool verbose_;
};

json status_json(int32_t status) {
    json j;
    j["status"] = error_name(status);
    j["code"] = status;
    return j;
}

json state_json(const CurveEngine& engine) {
    json j;
    j["unsold_inventory"] = units::format(engine.unsold_inventory());
    j["sold_units"] = units::format(engine.sold_units());
    j["raised_usd"] = units::format(engine.raised_usd());
    j["target_reached"] = engine.target_reached();
    j["liquidity_deployed"] = engine.liquidity_deployed();
    return j;
}

// Curve prices are integers in 1 / price_precision USD
std::string usd_price(I128 price, I128 precision) {
    uint32_t decimals = 0;
    for (I128 p = precision; p > 1; p /= 10) ++decimals;
    return units::format(price, decimals);
}

[[noreturn]] void fail(const std::string& what) {
    std::cerr << what << "\n";
    std::exit(1);
}

I128 parse_amount(const std::string& text, const char* what) {
    auto amount = units::parse(text);
    if (!amount) fail(std::string("Invalid ") + what + ": " + text);
    return *amount;
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

void cmd_price(Market& market) {
    const CurveEngine& engine = market.engine();
    I128 precision = engine.config().price_precision;

    QuoteResult oracle = engine.oracle_price();
    if (!oracle.ok()) {
        std::cout << status_json(oracle.status).dump(2) << "\n";
        std::exit(1);
    }

    json j = state_json(engine);
    j["oracle_price"] = units::format(oracle.amount);
    j["initial_price"] = usd_price(engine.initial_price().amount, precision);
    j["final_price"] = usd_price(engine.final_price().amount, precision);
    j["current_price"] = usd_price(engine.current_price().amount, precision);
    j["market_cap_usd"] = units::format(engine.market_cap_usd().amount);
    std::cout << j.dump(2) << "\n";
}

void cmd_quote_buy(Market& market, const std::string& amount) {
    I128 settlement_in = parse_amount(amount, "settlement amount");
    QuoteResult quote = market.engine().quote_buy(settlement_in);

    json j = status_json(quote.status);
    j["settlement_in"] = units::format(settlement_in);
    j["units_out"] = units::format(quote.amount);
    j["price"] = usd_price(quote.price, market.engine().config().price_precision);
    std::cout << j.dump(2) << "\n";
    if (!quote.ok()) std::exit(1);
}

void cmd_quote_sell(Market& market, const std::string& amount) {
    I128 units_in = parse_amount(amount, "unit amount");
    QuoteResult quote = market.engine().quote_sell(units_in);

    json j = status_json(quote.status);
    j["units_in"] = units::format(units_in);
    j["settlement_out"] = units::format(quote.amount);
    j["price"] = usd_price(quote.price, market.engine().config().price_precision);
    std::cout << j.dump(2) << "\n";
    if (!quote.ok()) std::exit(1);
}

// Buy 1 unit of settlement at a time until the next purchase would cross
// the sale threshold, then land exactly on it.
void cmd_scenario(Market& market, bool verbose) {
    CurveEngine& engine = market.engine();
    const CurveConfig& cfg = engine.config();
    const Address buyer = addresses::from_id(0xB001);

    PrintListener listener(verbose);
    market.events().set_listener(&listener);
    market.fund(buyer, static_cast<I128>(1000) * X18_ONE);

    const I128 chunk = X18_ONE;
    while (!engine.liquidity_deployed()) {
        QuoteResult quote = engine.quote_buy(chunk);
        if (!quote.ok()) fail(std::string("Quote failed: ") + error_name(quote.status));
        if (engine.sold_units() + quote.amount >= cfg.sale_threshold) break;

        BuyResult r = engine.buy(buyer, chunk);
        if (!r.ok()) fail(std::string("Buy failed: ") + error_name(r.status));
    }

    if (!engine.liquidity_deployed()) {
        // units_out = settlement * k / price where k = oracle_usd * precision.
        // Shift the sold count with dust sales until the remainder is
        // reachable exactly, then buy it.
        QuoteResult oracle = engine.oracle_price();
        if (!oracle.ok() || oracle.amount % X18_ONE != 0) {
            fail("Scenario needs a whole-dollar oracle price");
        }
        int64_t k = static_cast<int64_t>((oracle.amount / X18_ONE) * cfg.price_precision);

        I128 price = 0;
        for (int attempt = 0; attempt < 8; ++attempt) {
            price = engine.current_price().amount;
            int64_t g = k / std::gcd(k, static_cast<int64_t>(price));
            I128 remaining = cfg.sale_threshold - engine.sold_units();
            I128 dust = (g - remaining % g) % g;
            if (dust == 0) break;

            market.approve_curve(buyer, dust);
            SellResult s = engine.sell(buyer, dust);
            if (!s.ok()) fail(std::string("Alignment sale failed: ") + error_name(s.status));
        }

        I128 remaining = cfg.sale_threshold - engine.sold_units();
        I128 settlement = remaining * price / k;
        BuyResult r = engine.buy(buyer, settlement);
        if (!r.ok()) {
            std::string reason = r.sink_reason.empty() ? "" : " (" + r.sink_reason + ")";
            fail(std::string("Final buy failed: ") + error_name(r.status) + reason);
        }
    }

    market.events().set_listener(nullptr);

    json j = state_json(engine);
    j["buyer_units"] = units::format(market.asset().balance_of(buyer));
    j["buyer_settlement"] = units::format(market.value().balance_of(buyer));
    j["fee_collector"] = units::format(market.value().balance_of(engine.fee_collector()));
    j["venue_units"] = units::format(market.asset().balance_of(accounts::VENUE));
    j["venue_settlement"] = units::format(market.value().balance_of(accounts::VENUE));
    j["buys"] = engine.stats().total_buys;
    j["sells"] = engine.stats().total_sells;
    std::cout << j.dump(2) << "\n";
}

void run_command(Market& market, const Config& config) {
    const auto& args = config.command_args;
    if (args.empty()) {
        fail("No command specified. Use -h for help.");
    }

    const std::string& cmd = args[0];
    if (cmd == "price") {
        cmd_price(market);
    } else if (cmd == "quote-buy") {
        if (args.size() < 2) fail("Usage: bonding-cli quote-buy <settlement>");
        cmd_quote_buy(market, args[1]);
    } else if (cmd == "quote-sell") {
        if (args.size() < 2) fail("Usage: bonding-cli quote-sell <units>");
        cmd_quote_sell(market, args[1]);
    } else if (cmd == "scenario") {
        cmd_scenario(market, config.verbose);
    } else if (cmd == "config") {
        std::cout << market.engine().config().to_json() << "\n";
    } else {
        fail("Unknown command: " + cmd);
    }
}

//------------------------------------------------------------------------------
// Arguments
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "Bonding curve simulator\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON curve configuration\n"
              << "  -p, --price <usd>    Oracle price of the settlement asset (default: 3000)\n"
              << "  -v, --verbose        Verbose output\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  price                  Oracle, curve and market cap figures\n"
              << "  quote-buy <amount>     Units received for a settlement amount\n"
              << "  quote-sell <units>     Settlement received for units (nothing sold yet)\n"
              << "  scenario               Buy until liquidity deploys, print the audit log\n"
              << "  config                 Print the effective configuration\n\n"
              << "Examples:\n"
              << "  " << prog << " price\n"
              << "  " << prog << " quote-buy 1.5\n"
              << "  " << prog << " -c examples/curve.json -v scenario\n";
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) fail("Missing config file argument");
            config.config_path = argv[++i];
        } else if (arg == "-p" || arg == "--price") {
            if (i + 1 >= argc) fail("Missing price argument");
            config.oracle_price = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg[0] != '-') {
            // Command and its arguments
            while (i < argc) {
                config.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            fail("Unknown option: " + arg);
        }
        ++i;
    }

    return config;
}

int main(int argc, char* argv[]) {
    Config config = parse_args(argc, argv);

    CurveConfig curve;
    try {
        if (!config.config_path.empty()) {
            curve = CurveConfig::from_file(config.config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    Market::Options options;
    auto answer = units::parse(config.oracle_price, options.feed_decimals);
    if (!answer || *answer <= 0) {
        std::cerr << "Invalid oracle price: " << config.oracle_price << "\n";
        return 1;
    }
    options.feed_answer = *answer;

    try {
        Market market(curve, options);
        if (config.verbose) {
            std::cout << "Curve " << addresses::to_hex(accounts::CURVE)
                      << " token " << market.asset().symbol()
                      << " supply " << units::format(market.asset().total_supply()) << "\n";
        }
        run_command(market, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Setup error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
