#include "bnpl/engine/protocol_node.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>
#include <vector>

namespace bnpl {

namespace {

using nlohmann::json;

ProtocolConfig validated(ProtocolConfig config) {
  config.validate();
  return config;
}

// --- Request field readers ---------------------------------------------------
// Missing fields surface as json::out_of_range and mistyped ones as
// json::type_error; both are reported as validation errors by the caller.

std::string str(const json& req, const char* key) {
  return req.at(key).get<std::string>();
}

domain::Amount amount(const json& req, const char* key) {
  const json& v = req.at(key);
  if (!v.is_number_unsigned()) {
    throw ValidationError(std::string("'") + key +
                          "' must be a non-negative integer");
  }
  return v.get<domain::Amount>();
}

std::int64_t integer(const json& req, const char* key) {
  const json& v = req.at(key);
  if (!v.is_number_integer()) {
    throw ValidationError(std::string("'") + key + "' must be an integer");
  }
  return v.get<std::int64_t>();
}

std::vector<domain::Amount> amounts(const json& req, const char* key) {
  std::vector<domain::Amount> out;
  for (const json& v : req.at(key)) {
    if (!v.is_number_unsigned()) {
      throw ValidationError(std::string("'") + key +
                            "' must hold non-negative integers");
    }
    out.push_back(v.get<domain::Amount>());
  }
  return out;
}

Role delegatedRole(const std::string& name) {
  if (name == roleToString(Role::Orchestrator)) return Role::Orchestrator;
  if (name == roleToString(Role::DefaultDetector)) return Role::DefaultDetector;
  throw ValidationError("role must be 'orchestrator' or 'default_detector'");
}

json poolJson(const LiquidityLedger& liquidity) {
  const domain::LiquidityPoolState pool = liquidity.poolState();
  json j;
  j["total_liquidity"] = pool.total_liquidity;
  j["outstanding_credit"] = pool.outstanding_credit;
  j["protocol_fees"] = pool.protocol_fees;
  j["available_liquidity"] = pool.available();
  j["utilization_bps"] = liquidity.utilizationBps();
  j["custody_balance"] = liquidity.custodyBalance();
  return j;
}

json loanJson(const domain::Loan& loan) {
  json j;
  j["loan_id"] = loan.id;
  j["borrower"] = loan.borrower;
  j["merchant"] = loan.merchant;
  j["principal"] = loan.principal;
  j["fee"] = loan.fee;
  j["created_at_ms"] = loan.created_at_ms;
  j["due_at_ms"] = loan.due_at_ms;
  j["state"] = domain::loanStateToString(loan.state());
  j["is_repaid"] = loan.is_repaid;
  j["is_defaulted"] = loan.is_defaulted;
  return j;
}

json errorJson(const char* kind, const std::string& message) {
  json j;
  j["status"] = "error";
  j["kind"] = kind;
  j["message"] = message;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: compose and wire
// -----------------------------------------------------------------------------
ProtocolNode::ProtocolNode(const ITimeProvider& clock, ICustodyAsset& custody,
                           ProtocolConfig config)
    : config_(validated(std::move(config))),
      clock_(clock),
      custody_(custody),
      mirror_(bus_, journal_, clock_),
      credit_(config_.credit_ledger_address, config_.admin, journal_,
              mirror_),
      liquidity_(config_.liquidity_ledger_address, config_.admin, custody_,
                 journal_, mirror_),
      orchestrator_(config_.orchestrator_address, config_.admin, credit_,
                    liquidity_, custody_, clock_, journal_, mirror_,
                    config_.repayment_window_days, config_.fee_rate_bps),
      detector_(config_.default_detector_address, config_.admin,
                orchestrator_, credit_, custody_, clock_, journal_, mirror_,
                config_.grace_period_days) {
  wireRoles();
}

ProtocolNode::~ProtocolNode() { stop(); }

void ProtocolNode::wireRoles() {
  const domain::Address& admin = config_.admin;
  credit_.permissions().assign(admin, Role::Orchestrator,
                               config_.orchestrator_address);
  credit_.permissions().assign(admin, Role::DefaultDetector,
                               config_.default_detector_address);
  liquidity_.permissions().assign(admin, Role::Orchestrator,
                                  config_.orchestrator_address);
  orchestrator_.permissions().assign(admin, Role::DefaultDetector,
                                     config_.default_detector_address);
  detector_.permissions().assign(admin, Role::Orchestrator,
                                 config_.orchestrator_address);
}

// -----------------------------------------------------------------------------
// start(): IPC server and telemetry bridge
// -----------------------------------------------------------------------------
void ProtocolNode::start() {
  if (running_) {
    return;
  }

  if (!config_.cmd_endpoint.empty() && !config_.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.cmd_endpoint, config_.pub_endpoint);
    {
      // Events publish under mutex_ (inside executeCommand); the telemetry
      // subscription and ipc_server_ change under it too.
      std::lock_guard lock(mutex_);
      telemetry_subscription_ = bus_.subscribe(
          [this](const Event& e) { ipc_server_->pushTelemetry(e); });
    }
    ipc_server_->start();
  }

  running_ = true;
  std::cout << "[ProtocolNode] started"
            << (ipc_server_ ? "" : " (IPC disabled)") << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): join the IPC thread, then detach telemetry
// -----------------------------------------------------------------------------
void ProtocolNode::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Join the worker first, outside mutex_: its in-flight command holds
  // mutex_ and may still be publishing to the telemetry subscriber.
  if (ipc_server_) {
    ipc_server_->stop();
  }

  {
    // Direct executeCommand() callers on other threads publish under
    // mutex_; none may see the subscriber with ipc_server_ gone.
    std::lock_guard lock(mutex_);
    if (telemetry_subscription_) {
      bus_.unsubscribe(*telemetry_subscription_);
      telemetry_subscription_.reset();
    }
    ipc_server_.reset();
  }

  std::cout << "[ProtocolNode] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, map errors
// -----------------------------------------------------------------------------
std::string ProtocolNode::executeCommand(const std::string& request) {
  std::lock_guard lock(mutex_);

  json response;
  try {
    const json req = json::parse(request);
    const std::string cmd = str(req, "cmd");
    const std::string caller = req.value("caller", std::string{});

    response["status"] = "ok";

    if (cmd == "ping") {
      response["response"] = "pong";
    } else if (cmd == "status") {
      response["pool"] = poolJson(liquidity_);
      response["loan_count"] = orchestrator_.loanCount();
      response["events_published"] = mirror_.publishedCount();
      response["fee_rate_bps"] = orchestrator_.feeRateBps();
      response["repayment_window_days"] = orchestrator_.repaymentWindowDays();
      response["grace_period_days"] = detector_.gracePeriodDays();
      response["now_ms"] = clock_.now_ms();
    } else if (cmd == "pool") {
      response["pool"] = poolJson(liquidity_);
    } else if (cmd == "credit") {
      const std::string user = str(req, "user");
      const domain::CreditAccount acct = credit_.account(user);
      response["user"] = user;
      response["limit"] = acct.limit;
      response["used"] = acct.used;
      response["available"] = acct.available();
      response["defaulted"] = acct.defaulted;
      response["has_active_credit"] = acct.has_active_credit;
      response["utilization_bps"] = credit_.utilizationBps(user);
      response["active_loan_id"] = orchestrator_.activeLoanOf(user);
    } else if (cmd == "loan") {
      const domain::LoanId id = amount(req, "loan_id");
      const std::optional<domain::Loan> loan = orchestrator_.loan(id);
      if (!loan) {
        throw ValidationError("unknown loan " + std::to_string(id));
      }
      response["loan"] = loanJson(*loan);
    } else if (cmd == "eligibility") {
      const domain::Amount value = amount(req, "amount");
      response["eligible"] = orchestrator_.isEligible(
          str(req, "borrower"), str(req, "merchant"), value);
      response["fee"] = orchestrator_.feeFor(value);
    } else if (cmd == "set_limit") {
      credit_.setLimit(caller, str(req, "user"), amount(req, "limit"));
    } else if (cmd == "batch_set_limits") {
      credit_.batchSetLimits(
          caller, req.at("users").get<std::vector<std::string>>(),
          amounts(req, "limits"));
    } else if (cmd == "unblock") {
      const std::string user = str(req, "user");
      credit_.unblock(caller, user);
      if (req.value("lift_freeze", true)) {
        response["unfrozen"] = detector_.liftFreeze(caller, user);
      }
    } else if (cmd == "deposit") {
      liquidity_.depositLiquidity(caller, amount(req, "amount"));
    } else if (cmd == "withdraw_liquidity") {
      liquidity_.withdrawLiquidity(caller, amount(req, "amount"),
                                   str(req, "recipient"));
    } else if (cmd == "withdraw_fees") {
      liquidity_.withdrawFees(caller, amount(req, "amount"),
                              str(req, "recipient"));
    } else if (cmd == "create_loan") {
      const std::string borrower = req.value("borrower", caller);
      response["loan_id"] = orchestrator_.createLoan(
          caller, borrower, str(req, "merchant"), amount(req, "amount"));
    } else if (cmd == "repay_loan") {
      orchestrator_.repayLoan(caller, amount(req, "loan_id"));
    } else if (cmd == "raise_dispute") {
      orchestrator_.raiseDispute(caller, amount(req, "loan_id"),
                                 str(req, "reason"));
    } else if (cmd == "check_default") {
      response["defaulted"] = detector_.checkAndProcessDefault(
          caller, str(req, "user"), amount(req, "loan_id"));
    } else if (cmd == "batch_check_defaults") {
      response["count"] = detector_.batchCheckDefaults(
          caller, req.at("users").get<std::vector<std::string>>(),
          amounts(req, "loan_ids"));
    } else if (cmd == "assign_role") {
      const std::string component = str(req, "component");
      PermissionTable* table = nullptr;
      if (component == "credit_ledger") {
        table = &credit_.permissions();
      } else if (component == "liquidity_ledger") {
        table = &liquidity_.permissions();
      } else if (component == "orchestrator") {
        table = &orchestrator_.permissions();
      } else if (component == "default_detector") {
        table = &detector_.permissions();
      } else {
        throw ValidationError("unknown component '" + component + "'");
      }
      const Role role = delegatedRole(str(req, "role"));
      table->assign(caller, role, str(req, "address"));
      response["holder"] = table->holder(role);
    } else if (cmd == "set_fee_rate") {
      const domain::Amount bps = amount(req, "fee_rate_bps");
      if (bps > domain::kBpsDenominator) {
        throw ValidationError("fee_rate_bps must be 0..10000");
      }
      orchestrator_.setFeeRateBps(caller,
                                  static_cast<domain::BasisPoints>(bps));
    } else if (cmd == "set_repayment_window") {
      orchestrator_.setRepaymentWindowDays(caller, integer(req, "days"));
    } else if (cmd == "set_grace_period") {
      detector_.setGracePeriodDays(caller, integer(req, "days"));
    } else {
      throw ValidationError("unknown command '" + cmd + "'");
    }
  } catch (const ProtocolError& e) {
    response = errorJson(errorKindToString(e.kind()), e.what());
  } catch (const json::exception& e) {
    response = errorJson(errorKindToString(ErrorKind::Validation), e.what());
  } catch (const std::exception& e) {
    // Below the protocol's error types: a collaborator (custody) failed.
    std::cerr << "[ProtocolNode] command failed: " << e.what() << "\n";
    response = errorJson(errorKindToString(ErrorKind::External), e.what());
  }

  return response.dump();
}

}  // namespace bnpl
