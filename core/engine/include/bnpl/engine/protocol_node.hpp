#pragma once

#include "bnpl/config/protocol_config.hpp"
#include "bnpl/credit/credit_ledger.hpp"
#include "bnpl/custody/i_custody_asset.hpp"
#include "bnpl/eventbus/event_bus.hpp"
#include "bnpl/eventbus/event_mirror.hpp"
#include "bnpl/ledger/journal.hpp"
#include "bnpl/liquidity/liquidity_ledger.hpp"
#include "bnpl/loan/loan_orchestrator.hpp"
#include "bnpl/network/ipc_server.hpp"
#include "bnpl/risk/default_detector.hpp"
#include "bnpl/time/i_time_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace bnpl {

// -----------------------------------------------------------------------------
// ProtocolNode
// -----------------------------------------------------------------------------
//
// @brief  Composition root: builds the shared Journal, EventBus and
//         EventMirror, the four protocol components, wires their roles, and
//         exposes the whole protocol as JSON commands over IPC.
//
// @details
// Wiring (all granted by the configured admin at construction):
//
//   CreditLedger      Orchestrator    -> config.orchestrator_address
//                     DefaultDetector -> config.default_detector_address
//   LiquidityLedger   Orchestrator    -> config.orchestrator_address
//   LoanOrchestrator  DefaultDetector -> config.default_detector_address
//   DefaultDetector   Orchestrator    -> config.orchestrator_address
//
// The admin can rewire any role later through the components' permission
// tables; the object graph itself is fixed.
//
// Command surface (executeCommand):
//
//   Request   {"cmd": "<name>", "caller": "<address>", ...arguments}
//   Success   {"status": "ok", ...results}
//   Failure   {"status": "error", "kind": "<error kind>", "message": "..."}
//
//   Queries   ping, status, pool, credit, loan, eligibility
//   Admin     set_limit, batch_set_limits, unblock, withdraw_liquidity,
//             withdraw_fees, set_fee_rate, set_repayment_window,
//             set_grace_period, assign_role
//   Keeper    check_default, batch_check_defaults
//   Users     deposit, create_loan, repay_loan, raise_dispute
//
// Thread model:
//   executeCommand() takes mutex_ for the whole command, so commands from the
//   IPC thread and from any other caller run strictly one at a time, and the
//   components observe a single serial caller. The component accessors are
//   for single-threaded use (tests, the owning thread before start()).
//
// Telemetry:
//   start() subscribes the IPC server to the EventBus; every committed event
//   is published on the PUB socket.
//
// Ownership:
//   ProtocolNode
//    ├── journal_, bus_, mirror_     (value members, constructed first)
//    ├── credit_, liquidity_         (value members)
//    ├── orchestrator_, detector_    (value members)
//    └── ipc_server_                 (unique_ptr, created by start())
//   The clock and the custody asset are owned by the caller and must outlive
//   the node.
// -----------------------------------------------------------------------------
class ProtocolNode {
 public:
  // Throws ValidationError if the config fails validation.
  ProtocolNode(const ITimeProvider& clock, ICustodyAsset& custody,
               ProtocolConfig config);

  // Destructor calls stop().
  ~ProtocolNode();

  ProtocolNode(const ProtocolNode&) = delete;
  ProtocolNode& operator=(const ProtocolNode&) = delete;
  ProtocolNode(ProtocolNode&&) = delete;
  ProtocolNode& operator=(ProtocolNode&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // @brief  Bring the IPC server up or down. Both idempotent. With an empty
  //         cmd or pub endpoint in the config, start() runs without IPC and
  //         the node is driven through executeCommand() directly.
  //
  //         stop() joins the IPC thread before it detaches telemetry, and
  //         detaches it under mutex_, so no in-flight command can publish to
  //         a server that is being destroyed. Call start()/stop() from one
  //         owning thread.
  // -------------------------------------------------------------------------
  void start();
  void stop();

  bool isRunning() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // @brief  Runs one JSON command and returns the JSON response.
  //
  // @details
  // Never throws: malformed JSON and missing or mistyped fields come back as
  // "validation" errors, protocol failures carry their ErrorKind, and any
  // other std::exception (a failing collaborator) comes back as "external".
  //
  // Thread-safety: Safe from any thread; serialized on mutex_.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  EventBus& eventBus() { return bus_; }
  const ProtocolConfig& config() const { return config_; }

  CreditLedger& credit() { return credit_; }
  LiquidityLedger& liquidity() { return liquidity_; }
  LoanOrchestrator& orchestrator() { return orchestrator_; }
  DefaultDetector& detector() { return detector_; }
  const EventMirror& mirror() const { return mirror_; }
  ICustodyAsset& custody() { return custody_; }

 private:
  void wireRoles();

  ProtocolConfig config_;
  const ITimeProvider& clock_;
  ICustodyAsset& custody_;

  Journal journal_;
  EventBus bus_;
  EventMirror mirror_;

  CreditLedger credit_;
  LiquidityLedger liquidity_;
  LoanOrchestrator orchestrator_;
  DefaultDetector detector_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  std::mutex mutex_;
  std::atomic<bool> running_{false};
};

}  // namespace bnpl
