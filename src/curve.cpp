// =============================================================================
// curve.cpp - Bonding-curve pricing, trading and liquidity deployment
// =============================================================================

#include "bonding/curve.hpp"

#include <atomic>
#include <stdexcept>

namespace bonding {

namespace {

std::atomic<uint64_t> next_engine_id{1};

// Holds the engine's busy flag for the duration of one mutating call
class BusyGuard {
public:
    explicit BusyGuard(bool& flag) : flag_(flag), acquired_(!flag) {
        if (acquired_) flag_ = true;
    }
    ~BusyGuard() {
        if (acquired_) flag_ = false;
    }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    bool& flag_;
    bool acquired_;
};

std::optional<I128> percent_of(I128 amount, uint32_t percent) {
    return math::mul_div(amount, static_cast<I128>(percent), 100);
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

CurveEngine::CurveEngine(const Address& self, const CurveConfig& config,
                         CurveCollaborators collaborators, ExecutionContext& ctx,
                         Clock clock)
    : self_(self)
    , config_(config)
    , asset_(collaborators.asset)
    , value_(collaborators.value)
    , sink_(collaborators.sink)
    , events_(collaborators.events)
    , ctx_(ctx)
    , clock_(std::move(clock))
    , oracle_(collaborators.feed, config.update_interval)
    , state_{config.total_supply, 0, false}
    , settings_{config.fee_collector, config.liquidity_collector,
                config.fee_percent, config.update_interval}
    , engine_id_(next_engine_id.fetch_add(1)) {
    if (config_.validate() != errors::OK) {
        throw std::invalid_argument("invalid curve configuration");
    }
    if (addresses::is_zero(self_)) {
        throw std::invalid_argument("curve account must not be the zero address");
    }
    if (!clock_) clock_ = system_seconds;
    ctx_.enlist(this);
}

CurveEngine::~CurveEngine() {
    ctx_.delist(this);
}

// =============================================================================
// Journal
// =============================================================================

void CurveEngine::checkpoint() {
    journal_.push(Snapshot{state_, oracle_.cache(), settings_, stats_});
}

void CurveEngine::commit() {
    journal_.pop();
}

void CurveEngine::rollback() {
    if (journal_.depth() == 0) return;
    Snapshot snap{state_, oracle_.cache(), settings_, stats_};
    journal_.restore(snap);
    state_ = snap.state;
    oracle_.restore(snap.cache);
    settings_ = snap.settings;
    oracle_.set_update_interval(settings_.update_interval);
    stats_ = snap.stats;
}

// =============================================================================
// Pricing
// =============================================================================

std::optional<I128> CurveEngine::initial_price_at(I128 oracle_x18) const {
    return math::mul_div(config_.initial_multiplier, oracle_x18, config_.price_normalizer_x18);
}

std::optional<I128> CurveEngine::final_price_at(I128 oracle_x18) const {
    return math::mul_div(config_.final_multiplier, oracle_x18, config_.price_normalizer_x18);
}

std::optional<I128> CurveEngine::price_at(I128 oracle_x18, I128 unsold) const {
    auto initial = initial_price_at(oracle_x18);
    if (!initial) return std::nullopt;

    I128 sold = config_.total_supply - unsold;
    if (sold <= 0) return initial;

    auto final_price = final_price_at(oracle_x18);
    if (!final_price) return std::nullopt;

    if (config_.clamp_price_at_threshold && sold > config_.sale_threshold) {
        sold = config_.sale_threshold;
    }

    // Linear interpolation, truncated
    auto delta = math::mul_div(*final_price - *initial, sold, config_.sale_threshold);
    if (!delta) return std::nullopt;
    return *initial + *delta;
}

QuoteResult CurveEngine::quote_buy_at(I128 oracle_x18, I128 price, I128 settlement_in) const {
    if (price <= 0) return {errors::INVALID_PRICE, 0, price};

    auto usd = math::mul_div(settlement_in, oracle_x18, X18_ONE);
    if (!usd) return {errors::ARITHMETIC_OVERFLOW, 0, price};
    auto units_out = math::mul_div(*usd, config_.price_precision, price);
    if (!units_out) return {errors::ARITHMETIC_OVERFLOW, 0, price};

    if (*units_out > available_inventory()) {
        return {errors::INSUFFICIENT_INVENTORY, *units_out, price};
    }
    return {errors::OK, *units_out, price};
}

I128 CurveEngine::available_inventory() const {
    // The deployment slice leaves the curve's holdings without touching the
    // price's notion of unsold units
    I128 held = asset_.balance_of(self_);
    return held < state_.unsold_inventory ? held : state_.unsold_inventory;
}

QuoteResult CurveEngine::quote_sell_at(I128 oracle_x18, I128 price, I128 units_in) const {
    if (units_in <= 0) return {errors::EMPTY_INPUT, 0, price};

    I128 sold = sold_units();
    if (sold <= 0) return {errors::NO_INVENTORY_SOLD, 0, price};
    if (units_in > sold) return {errors::INSUFFICIENT_INVENTORY, 0, price};
    if (price <= 0) return {errors::INVALID_PRICE, 0, price};

    auto usd = math::mul_div(units_in, price, config_.price_precision);
    if (!usd) return {errors::ARITHMETIC_OVERFLOW, 0, price};
    auto settlement_out = math::mul_div(*usd, X18_ONE, oracle_x18);
    if (!settlement_out) return {errors::ARITHMETIC_OVERFLOW, 0, price};

    return {errors::OK, *settlement_out, price};
}

// =============================================================================
// Views
// =============================================================================

QuoteResult CurveEngine::oracle_price() const {
    OracleReading reading = oracle_.current_price(clock_());
    return {reading.status, reading.price_x18, 0};
}

QuoteResult CurveEngine::initial_price() const {
    OracleReading reading = oracle_.current_price(clock_());
    if (reading.status != errors::OK) return {reading.status, 0, 0};
    auto price = initial_price_at(reading.price_x18);
    if (!price) return {errors::ARITHMETIC_OVERFLOW, 0, 0};
    return {errors::OK, *price, *price};
}

QuoteResult CurveEngine::final_price() const {
    OracleReading reading = oracle_.current_price(clock_());
    if (reading.status != errors::OK) return {reading.status, 0, 0};
    auto price = final_price_at(reading.price_x18);
    if (!price) return {errors::ARITHMETIC_OVERFLOW, 0, 0};
    return {errors::OK, *price, *price};
}

QuoteResult CurveEngine::current_price() const {
    OracleReading reading = oracle_.current_price(clock_());
    if (reading.status != errors::OK) return {reading.status, 0, 0};
    auto price = price_at(reading.price_x18, state_.unsold_inventory);
    if (!price) return {errors::ARITHMETIC_OVERFLOW, 0, 0};
    return {errors::OK, *price, *price};
}

QuoteResult CurveEngine::market_cap_usd() const {
    QuoteResult price = current_price();
    if (!price.ok()) return price;
    auto cap = math::mul_div(price.amount, config_.total_supply, config_.price_precision);
    if (!cap) return {errors::ARITHMETIC_OVERFLOW, 0, price.amount};
    return {errors::OK, *cap, price.amount};
}

QuoteResult CurveEngine::quote_buy(I128 settlement_in) const {
    if (settlement_in <= 0) return {errors::ZERO_INPUT, 0, 0};

    OracleReading reading = oracle_.current_price(clock_());
    if (reading.status != errors::OK) return {reading.status, 0, 0};
    auto price = price_at(reading.price_x18, state_.unsold_inventory);
    if (!price) return {errors::ARITHMETIC_OVERFLOW, 0, 0};
    return quote_buy_at(reading.price_x18, *price, settlement_in);
}

QuoteResult CurveEngine::quote_sell(I128 units_in) const {
    OracleReading reading = oracle_.current_price(clock_());
    if (reading.status != errors::OK) return {reading.status, 0, 0};
    auto price = price_at(reading.price_x18, state_.unsold_inventory);
    if (!price) return {errors::ARITHMETIC_OVERFLOW, 0, 0};
    return quote_sell_at(reading.price_x18, *price, units_in);
}

// =============================================================================
// Oracle
// =============================================================================

OracleReading CurveEngine::sync_oracle(uint64_t now) {
    OracleReading reading = oracle_.refresh_if_stale(now);
    if (reading.status == errors::OK && reading.refreshed) {
        emit(EventKind::PRICE_REFRESHED, now, self_, 0, 0, reading.price_x18);
    }
    return reading;
}

OracleReading CurveEngine::refresh_price() {
    BusyGuard guard(busy_);
    if (!guard.acquired()) return {errors::REENTRANCY, 0, 0, false};

    Transaction tx = ctx_.begin();
    OracleReading reading = sync_oracle(clock_());
    if (reading.status != errors::OK) return reading;
    tx.commit();
    return reading;
}

// =============================================================================
// Buy
// =============================================================================

BuyResult CurveEngine::buy(const Address& payer, I128 settlement_in,
                           const Address& beneficiary, I128 min_units_out) {
    BuyResult result{};
    BusyGuard guard(busy_);
    if (!guard.acquired()) {
        result.status = errors::REENTRANCY;
        return result;
    }

    if (settlement_in <= 0) {
        result.status = errors::ZERO_INPUT;
        return result;
    }
    if (available_inventory() <= 0) {
        result.status = errors::SUPPLY_EXHAUSTED;
        return result;
    }

    Transaction tx = ctx_.begin();
    result.status = execute_buy(payer, settlement_in, beneficiary, min_units_out, result);
    if (result.status == errors::OK) {
        tx.commit();
    } else {
        result.units_out = 0;
        result.fee = 0;
        result.deployed_liquidity = false;
    }
    return result;
}

int32_t CurveEngine::execute_buy(const Address& payer, I128 settlement_in,
                                 const Address& beneficiary, I128 min_units_out,
                                 BuyResult& result) {
    uint64_t now = clock_();

    // 1. Collect payment
    if (!value_.transfer(payer, self_, settlement_in)) {
        return errors::SETTLEMENT_TRANSFER_FAILED;
    }

    // 2. Reference price
    OracleReading reading = sync_oracle(now);
    if (reading.status != errors::OK) return reading.status;
    I128 oracle_x18 = reading.price_x18;

    // 3. Quote
    auto price = price_at(oracle_x18, state_.unsold_inventory);
    if (!price) return errors::ARITHMETIC_OVERFLOW;
    QuoteResult quote = quote_buy_at(oracle_x18, *price, settlement_in);
    if (!quote.ok()) return quote.status;
    if (quote.amount == 0) return errors::ZERO_INPUT;
    if (quote.amount < min_units_out) return errors::SLIPPAGE_EXCEEDED;

    result.price = *price;
    result.units_out = quote.amount;

    // 4. Fee
    auto fee = percent_of(settlement_in, settings_.fee_percent);
    if (!fee) return errors::ARITHMETIC_OVERFLOW;
    result.fee = *fee;
    if (*fee > 0 && !value_.transfer(self_, settings_.fee_collector, *fee)) {
        return errors::FEE_TRANSFER_FAILED;
    }

    // 5. Deliver units
    if (!asset_.transfer(self_, beneficiary, quote.amount)) {
        return errors::LEDGER_TRANSFER_FAILED;
    }

    // 6. Counters
    I128 raise_basis = settlement_in;
    if (config_.raise_accounting == RaiseAccounting::NET) raise_basis -= *fee;
    auto raised = math::mul_div(raise_basis, oracle_x18, X18_ONE);
    if (!raised) return errors::ARITHMETIC_OVERFLOW;

    state_.unsold_inventory -= quote.amount;
    state_.raised_usd_x18 += *raised;

    stats_.total_buys++;
    stats_.units_bought += quote.amount;
    stats_.settlement_in += settlement_in;
    stats_.fees_collected += *fee;

    // 7. Threshold transition
    if (deployment_ready()) {
        int32_t rc = deploy_liquidity(now, result);
        if (rc != errors::OK) return rc;
    }

    emit(EventKind::PURCHASE_EXECUTED, now, beneficiary, quote.amount, settlement_in, *price);
    return errors::OK;
}

// =============================================================================
// Sell
// =============================================================================

SellResult CurveEngine::sell(const Address& seller, I128 units_in) {
    SellResult result{};
    BusyGuard guard(busy_);
    if (!guard.acquired()) {
        result.status = errors::REENTRANCY;
        return result;
    }

    if (units_in <= 0) {
        result.status = errors::ZERO_INPUT;
        return result;
    }

    Transaction tx = ctx_.begin();
    result.status = execute_sell(seller, units_in, result);
    if (result.status == errors::OK) {
        tx.commit();
    } else {
        result.settlement_out = 0;
        result.fee = 0;
        result.net_out = 0;
    }
    return result;
}

int32_t CurveEngine::execute_sell(const Address& seller, I128 units_in, SellResult& result) {
    uint64_t now = clock_();

    OracleReading reading = sync_oracle(now);
    if (reading.status != errors::OK) return reading.status;

    auto price = price_at(reading.price_x18, state_.unsold_inventory);
    if (!price) return errors::ARITHMETIC_OVERFLOW;
    QuoteResult quote = quote_sell_at(reading.price_x18, *price, units_in);
    if (!quote.ok()) return quote.status;

    I128 settlement_out = quote.amount;
    if (value_.balance_of(self_) < settlement_out) {
        return errors::INSUFFICIENT_RESERVE;
    }

    // Return units to inventory
    if (!asset_.transfer_from(self_, seller, self_, units_in)) {
        return errors::LEDGER_TRANSFER_FAILED;
    }
    state_.unsold_inventory += units_in;

    auto fee = percent_of(settlement_out, settings_.fee_percent);
    if (!fee) return errors::ARITHMETIC_OVERFLOW;
    I128 net_out = settlement_out - *fee;

    if (*fee > 0 && !value_.transfer(self_, settings_.fee_collector, *fee)) {
        return errors::FEE_TRANSFER_FAILED;
    }
    if (net_out > 0 && !value_.transfer(self_, seller, net_out)) {
        return errors::SETTLEMENT_TRANSFER_FAILED;
    }

    result.price = *price;
    result.settlement_out = settlement_out;
    result.fee = *fee;
    result.net_out = net_out;

    stats_.total_sells++;
    stats_.units_sold += units_in;
    stats_.settlement_out += settlement_out;
    stats_.fees_collected += *fee;

    emit(EventKind::SALE_EXECUTED, now, seller, units_in, settlement_out, *price);
    return errors::OK;
}

// =============================================================================
// Liquidity Deployment
// =============================================================================

bool CurveEngine::deployment_ready() const {
    return !state_.liquidity_deployed &&
           state_.raised_usd_x18 >= config_.raise_target_usd_x18 &&
           sold_units() >= config_.sale_threshold;
}

int32_t CurveEngine::deploy_liquidity(uint64_t now, BuyResult& result) {
    I128 settlement_needed = config_.deploy_settlement + config_.deploy_fee_settlement;
    if (value_.balance_of(self_) < settlement_needed ||
        asset_.balance_of(self_) < config_.deploy_units) {
        return errors::INSUFFICIENT_RESERVE_FOR_DEPLOYMENT;
    }

    Address sink_account = sink_.address();
    if (!asset_.approve(self_, sink_account, config_.deploy_units)) {
        return errors::LEDGER_TRANSFER_FAILED;
    }
    if (!value_.transfer(self_, sink_account, config_.deploy_settlement)) {
        return errors::SETTLEMENT_TRANSFER_FAILED;
    }

    SinkResult sunk = sink_.deploy(self_, asset_.address(), config_.deploy_units,
                                   settings_.liquidity_collector, config_.deploy_settlement);
    if (!sunk.ok) {
        result.sink_reason = sunk.reason;
        return errors::LIQUIDITY_SINK_FAILED;
    }

    if (config_.deploy_fee_settlement > 0 &&
        !value_.transfer(self_, settings_.fee_collector, config_.deploy_fee_settlement)) {
        return errors::FEE_TRANSFER_FAILED;
    }

    // Latch last
    state_.liquidity_deployed = true;
    result.deployed_liquidity = true;

    emit(EventKind::LIQUIDITY_DEPLOYED, now, settings_.liquidity_collector,
         config_.deploy_units, config_.deploy_settlement, result.price);
    return errors::OK;
}

// =============================================================================
// Events
// =============================================================================

void CurveEngine::emit(EventKind kind, uint64_t now, const Address& account,
                       I128 units, I128 settlement, I128 price) {
    EventRecord record{};
    record.timestamp = now;
    record.kind = kind;
    record.emitter = self_;
    record.account = account;
    record.units = units;
    record.settlement = settlement;
    record.price = price;
    events_.emit(record);
}

} // namespace bonding
