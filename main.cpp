// -----------------------------------------------------------------------------
// bnpl_node: single executable entry point.
//
// Simulation mode:
//   1) Load ProtocolConfig from the JSON file named on the command line, or
//      use the defaults when none is given.
//   2) Create a MockCustodyAsset and mint the configured genesis balances so
//      liquidity providers and borrowers have something to move.
//   3) Build the ProtocolNode on the live clock and start it. The node binds
//      its REP (commands) and PUB (telemetry) sockets.
//   4) Log every committed protocol event to stdout.
//   5) Idle until SIGINT, then shut down cleanly.
//
// Drive it with any ZeroMQ REQ client, e.g.
//   {"cmd":"deposit","caller":"lp","amount":10000}
//   {"cmd":"set_limit","caller":"admin","user":"alice","limit":1000}
//   {"cmd":"create_loan","caller":"alice","merchant":"shop","amount":500}
// -----------------------------------------------------------------------------

#include "bnpl/config/protocol_config.hpp"
#include "bnpl/custody/mock_custody_asset.hpp"
#include "bnpl/engine/protocol_node.hpp"
#include "bnpl/errors/protocol_error.hpp"
#include "bnpl/events/event.hpp"
#include "bnpl/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Set by the SIGINT handler, polled by main(). The only global in the program.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_stop_requested = 0;

static void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  bnpl::ProtocolConfig config;
  try {
    if (argc > 1) {
      config = bnpl::ProtocolConfig::loadFile(argv[1]);
      std::cout << "[main] Loaded config from " << argv[1] << "\n";
    } else {
      config.validate();
      std::cout << "[main] No config file given, using defaults.\n";
    }
  } catch (const bnpl::ProtocolError& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Simulated custody seeded from genesis balances.
  // -------------------------------------------------------------------------
  bnpl::MockCustodyAsset custody;
  for (const auto& [account, balance] : config.genesis_balances) {
    custody.mint(account, balance);
    std::cout << "[main] genesis " << account << " = " << balance << "\n";
  }

  // -------------------------------------------------------------------------
  // 3) Node on the live clock.
  // -------------------------------------------------------------------------
  bnpl::LiveTimeProvider clock;
  bnpl::ProtocolNode node(clock, custody, config);

  // -------------------------------------------------------------------------
  // 4) Event log. Subscribed before start() so nothing is missed.
  // -------------------------------------------------------------------------
  node.eventBus().subscribe<bnpl::LoanCreatedEvent>(
      [](const bnpl::LoanCreatedEvent& e) {
        std::cout << "[Event] loan_created seq=" << e.sequence_id
                  << " loan=" << e.loan_id << " user=" << e.user
                  << " merchant=" << e.merchant << " amount=" << e.amount
                  << " due_at_ms=" << e.due_at_ms << "\n";
      });
  node.eventBus().subscribe<bnpl::RepaymentEvent>(
      [](const bnpl::RepaymentEvent& e) {
        std::cout << "[Event] repayment seq=" << e.sequence_id
                  << " loan=" << e.loan_id << " user=" << e.user
                  << " amount=" << e.amount << "\n";
      });
  node.eventBus().subscribe<bnpl::DefaultEvent>(
      [](const bnpl::DefaultEvent& e) {
        std::cout << "[Event] default seq=" << e.sequence_id
                  << " loan=" << e.loan_id << " user=" << e.user
                  << " overdue=" << e.overdue_amount
                  << " days=" << e.days_overdue << "\n";
      });
  node.eventBus().subscribe<bnpl::DisputeEvent>(
      [](const bnpl::DisputeEvent& e) {
        std::cout << "[Event] dispute seq=" << e.sequence_id
                  << " loan=" << e.loan_id << " reason=" << e.reason << "\n";
      });

  // -------------------------------------------------------------------------
  // 5) Run until Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  try {
    node.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot bind IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] bnpl_node running. Commands on "
            << config.cmd_endpoint << ", telemetry on " << config.pub_endpoint
            << ".\n[main] Press Ctrl-C to shut down.\n";

  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  node.stop();
  return 0;
}
