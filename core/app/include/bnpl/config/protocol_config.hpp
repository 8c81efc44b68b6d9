#pragma once

#include "bnpl/domain/protocol_limits.hpp"
#include "bnpl/domain/types.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace bnpl {

// -----------------------------------------------------------------------------
// ProtocolConfig: startup parameters for a ProtocolNode
// -----------------------------------------------------------------------------
//
// @brief  Everything the node needs to compose the four components: their
//         addresses, the admin, the economic parameters, the IPC endpoints,
//         and (simulation mode) genesis custody balances.
//
// @details
// Loaded from JSON. Every field is optional and falls back to the default
// below. Example:
//
//   {
//     "admin": "admin",
//     "addresses": {
//       "orchestrator":     "bnpl.orchestrator",
//       "credit_ledger":    "bnpl.credit",
//       "liquidity_ledger": "bnpl.liquidity",
//       "default_detector": "bnpl.detector"
//     },
//     "repayment_window_days": 14,
//     "fee_rate_bps": 50,
//     "grace_period_days": 3,
//     "ipc": { "cmd_endpoint": "tcp://127.0.0.1:5556",
//              "pub_endpoint": "tcp://127.0.0.1:5557" },
//     "genesis_balances": { "lp": 100000, "alice": 5000 }
//   }
//
// An empty IPC endpoint disables the IPC server (tests use this).
//
// Errors:
//   parse()/loadFile() throw ValidationError for malformed JSON, wrong field
//   types, and values that fail validate().
// -----------------------------------------------------------------------------
struct ProtocolConfig {
  domain::Address admin{"admin"};
  domain::Address orchestrator_address{"bnpl.orchestrator"};
  domain::Address credit_ledger_address{"bnpl.credit"};
  domain::Address liquidity_ledger_address{"bnpl.liquidity"};
  domain::Address default_detector_address{"bnpl.detector"};

  std::int64_t repayment_window_days{domain::kDefaultRepaymentWindowDays};
  domain::BasisPoints fee_rate_bps{domain::kDefaultFeeRateBps};
  std::int64_t grace_period_days{domain::kDefaultGracePeriodDays};

  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};

  std::map<domain::Address, domain::Amount> genesis_balances;

  // Throws ValidationError on an empty or duplicated address, or a parameter
  // out of range.
  void validate() const;

  static ProtocolConfig parse(const std::string& json_text);
  static ProtocolConfig loadFile(const std::string& path);
};

}  // namespace bnpl
