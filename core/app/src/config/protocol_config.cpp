#include "bnpl/config/protocol_config.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace bnpl {

namespace {

void readAddress(const nlohmann::json& j, const char* key,
                 domain::Address& out) {
  if (j.contains(key)) {
    out = j.at(key).get<std::string>();
  }
}

std::int64_t readInteger(const nlohmann::json& j, const char* key,
                         std::int64_t fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const nlohmann::json& v = j.at(key);
  if (!v.is_number_integer()) {
    throw ValidationError(std::string("ProtocolConfig: '") + key +
                          "' must be an integer");
  }
  return v.get<std::int64_t>();
}

}  // namespace

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
void ProtocolConfig::validate() const {
  const domain::Address* addresses[] = {
      &admin, &orchestrator_address, &credit_ledger_address,
      &liquidity_ledger_address, &default_detector_address};

  std::set<domain::Address> seen;
  for (const domain::Address* a : addresses) {
    if (!domain::isValidAddress(*a)) {
      throw ValidationError("ProtocolConfig: addresses must be non-empty");
    }
    if (!seen.insert(*a).second) {
      throw ValidationError("ProtocolConfig: address '" + *a +
                            "' is used more than once");
    }
  }

  if (repayment_window_days <= 0 ||
      repayment_window_days > domain::kMaxPeriodDays) {
    throw ValidationError("ProtocolConfig: repayment_window_days out of range");
  }
  if (fee_rate_bps > domain::kBpsDenominator) {
    throw ValidationError("ProtocolConfig: fee_rate_bps must be 0..10000");
  }
  if (grace_period_days < 0 || grace_period_days > domain::kMaxPeriodDays) {
    throw ValidationError("ProtocolConfig: grace_period_days out of range");
  }
  for (const auto& [account, amount] : genesis_balances) {
    if (!domain::isValidAddress(account)) {
      throw ValidationError("ProtocolConfig: genesis account must be named");
    }
  }
}

// -----------------------------------------------------------------------------
// parse(): JSON text -> validated config
// -----------------------------------------------------------------------------
ProtocolConfig ProtocolConfig::parse(const std::string& json_text) {
  ProtocolConfig config;

  try {
    const nlohmann::json j = nlohmann::json::parse(json_text);
    if (!j.is_object()) {
      throw ValidationError("ProtocolConfig: top level must be an object");
    }

    readAddress(j, "admin", config.admin);
    if (j.contains("addresses")) {
      const nlohmann::json& a = j.at("addresses");
      readAddress(a, "orchestrator", config.orchestrator_address);
      readAddress(a, "credit_ledger", config.credit_ledger_address);
      readAddress(a, "liquidity_ledger", config.liquidity_ledger_address);
      readAddress(a, "default_detector", config.default_detector_address);
    }

    config.repayment_window_days = readInteger(
        j, "repayment_window_days", config.repayment_window_days);
    const std::int64_t fee = readInteger(j, "fee_rate_bps", config.fee_rate_bps);
    if (fee < 0 || fee > domain::kBpsDenominator) {
      throw ValidationError("ProtocolConfig: fee_rate_bps must be 0..10000");
    }
    config.fee_rate_bps = static_cast<domain::BasisPoints>(fee);
    config.grace_period_days =
        readInteger(j, "grace_period_days", config.grace_period_days);

    if (j.contains("ipc")) {
      const nlohmann::json& ipc = j.at("ipc");
      readAddress(ipc, "cmd_endpoint", config.cmd_endpoint);
      readAddress(ipc, "pub_endpoint", config.pub_endpoint);
    }

    if (j.contains("genesis_balances")) {
      for (const auto& [account, amount] : j.at("genesis_balances").items()) {
        if (!amount.is_number_unsigned()) {
          throw ValidationError("ProtocolConfig: genesis balance for '" +
                                account + "' must be a non-negative integer");
        }
        config.genesis_balances[account] = amount.get<domain::Amount>();
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("ProtocolConfig: ") + e.what());
  }

  config.validate();
  return config;
}

ProtocolConfig ProtocolConfig::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("ProtocolConfig: cannot open '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

}  // namespace bnpl
