#ifndef BONDING_BONDING_HPP
#define BONDING_BONDING_HPP

// =============================================================================
// Bonding - Linear bonding-curve issuance engine
//
//   types    addresses, X18 fixed point, 256-bit mul_div, error codes
//   journal  all-or-nothing execution context
//   ledger   issued-asset and settlement-value ledgers
//   oracle   reference price feed with interval caching
//   events   journaled audit log
//   sink     one-shot liquidity venue adapter
//   curve    pricing, trading and liquidity deployment
//   market   in-memory wiring of all of the above
// =============================================================================

#include "types.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "events.hpp"
#include "sink.hpp"
#include "config.hpp"
#include "curve.hpp"
#include "market.hpp"

#endif // BONDING_BONDING_HPP
