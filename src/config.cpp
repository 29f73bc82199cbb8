// =============================================================================
// config.cpp - Curve configuration loading and validation
// =============================================================================

#include "bonding/config.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bonding {

using json = nlohmann::json;

namespace {

// Decimal amount in whole units: "800000000", "0.5" or an integer literal
I128 read_amount(const json& doc, const char* key, I128 fallback, uint32_t decimals = 18) {
    auto it = doc.find(key);
    if (it == doc.end()) return fallback;

    std::string text;
    if (it->is_string()) {
        text = it->get<std::string>();
    } else if (it->is_number_integer()) {
        if (!it->is_number_unsigned() && it->get<int64_t>() < 0) {
            throw std::invalid_argument(std::string("negative amount for ") + key);
        }
        text = std::to_string(it->get<uint64_t>());
    } else {
        throw std::invalid_argument(std::string("amount expected for ") + key);
    }

    auto parsed = units::parse(text, decimals);
    if (!parsed) {
        throw std::invalid_argument(std::string("invalid amount for ") + key + ": " + text);
    }
    return *parsed;
}

I128 read_integer(const json& doc, const char* key, I128 fallback) {
    return read_amount(doc, key, fallback, 0);
}

Address read_address(const json& doc, const char* key, const Address& fallback) {
    auto it = doc.find(key);
    if (it == doc.end()) return fallback;
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("address expected for ") + key);
    }
    auto addr = addresses::from_hex(it->get<std::string>());
    if (!addr) {
        throw std::invalid_argument(std::string("invalid address for ") + key);
    }
    return *addr;
}

} // namespace

int32_t CurveConfig::validate() const {
    if (total_supply <= 0 || sale_threshold <= 0 || sale_threshold > total_supply) {
        return errors::INVALID_CONFIG;
    }
    if (initial_multiplier <= 0 || final_multiplier < initial_multiplier) {
        return errors::INVALID_CONFIG;
    }
    if (price_normalizer_x18 <= 0 || price_precision <= 0) {
        return errors::INVALID_CONFIG;
    }
    if (raise_target_usd_x18 < 0 || fee_percent > MAX_FEE_PERCENT) {
        return errors::INVALID_CONFIG;
    }
    if (deploy_units < 0 || deploy_units > total_supply - sale_threshold) {
        return errors::INVALID_CONFIG;
    }
    if (deploy_settlement < 0 || deploy_fee_settlement < 0) {
        return errors::INVALID_CONFIG;
    }
    if (addresses::is_zero(fee_collector) || addresses::is_zero(liquidity_collector)) {
        return errors::INVALID_CONFIG;
    }
    return errors::OK;
}

CurveConfig CurveConfig::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("config is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw std::invalid_argument("config root must be an object");
    }

    CurveConfig cfg;
    cfg.total_supply = read_amount(doc, "total_supply", cfg.total_supply);
    cfg.sale_threshold = read_amount(doc, "sale_threshold", cfg.sale_threshold);
    cfg.raise_target_usd_x18 = read_amount(doc, "raise_target_usd", cfg.raise_target_usd_x18);
    cfg.initial_multiplier = read_integer(doc, "initial_multiplier", cfg.initial_multiplier);
    cfg.final_multiplier = read_integer(doc, "final_multiplier", cfg.final_multiplier);
    cfg.price_normalizer_x18 = read_amount(doc, "price_normalizer", cfg.price_normalizer_x18);
    cfg.price_precision = read_integer(doc, "price_precision", cfg.price_precision);
    cfg.deploy_units = read_amount(doc, "deploy_units", cfg.deploy_units);
    cfg.deploy_settlement = read_amount(doc, "deploy_settlement", cfg.deploy_settlement);
    cfg.deploy_fee_settlement = read_amount(doc, "deploy_fee_settlement", cfg.deploy_fee_settlement);
    cfg.fee_collector = read_address(doc, "fee_collector", cfg.fee_collector);
    cfg.liquidity_collector = read_address(doc, "liquidity_collector", cfg.liquidity_collector);

    try {
        cfg.fee_percent = doc.value("fee_percent", cfg.fee_percent);
        cfg.update_interval = doc.value("update_interval", cfg.update_interval);
        cfg.clamp_price_at_threshold =
            doc.value("clamp_price_at_threshold", cfg.clamp_price_at_threshold);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("config type error: ") + e.what());
    }

    if (doc.contains("raise_accounting")) {
        std::string mode = doc["raise_accounting"].is_string()
            ? doc["raise_accounting"].get<std::string>() : "";
        if (mode == "gross") cfg.raise_accounting = RaiseAccounting::GROSS;
        else if (mode == "net") cfg.raise_accounting = RaiseAccounting::NET;
        else throw std::invalid_argument("raise_accounting must be \"gross\" or \"net\"");
    }

    return cfg;
}

CurveConfig CurveConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

std::string CurveConfig::to_json() const {
    json doc;
    doc["total_supply"] = units::format(total_supply);
    doc["sale_threshold"] = units::format(sale_threshold);
    doc["raise_target_usd"] = units::format(raise_target_usd_x18);
    doc["initial_multiplier"] = units::to_string(initial_multiplier);
    doc["final_multiplier"] = units::to_string(final_multiplier);
    doc["price_normalizer"] = units::format(price_normalizer_x18);
    doc["price_precision"] = units::to_string(price_precision);
    doc["fee_percent"] = fee_percent;
    doc["deploy_units"] = units::format(deploy_units);
    doc["deploy_settlement"] = units::format(deploy_settlement);
    doc["deploy_fee_settlement"] = units::format(deploy_fee_settlement);
    doc["update_interval"] = update_interval;
    doc["fee_collector"] = addresses::to_hex(fee_collector);
    doc["liquidity_collector"] = addresses::to_hex(liquidity_collector);
    doc["clamp_price_at_threshold"] = clamp_price_at_threshold;
    doc["raise_accounting"] = raise_accounting == RaiseAccounting::NET ? "net" : "gross";
    return doc.dump(2);
}

} // namespace bonding
