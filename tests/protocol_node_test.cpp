// =============================================================================
// protocol_node_test.cpp
// =============================================================================
// Integration tests for bnpl::ProtocolNode: the JSON command surface that
// the IPC server forwards, driven in-process with IPC disabled.
//
// Validates:
//   - Lifecycle: start/stop are idempotent without sockets
//   - A full loan lifecycle through commands
//   - Errors come back as {"status":"error","kind":...}, never as exceptions
//   - Default processing on simulated time
//   - Admin role re-pointing
//   - Custody failures outside the protocol's error types stay contained
//   - stop() racing with commands on another thread
//   - Telemetry formatting of committed events
// =============================================================================

#include "bnpl/custody/mock_custody_asset.hpp"
#include "bnpl/engine/protocol_node.hpp"
#include "bnpl/network/ipc_server.hpp"
#include "bnpl/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using nlohmann::json;

class ProtocolNodeTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kStartMs = 1'700'000'000'000;

  bnpl::SimulationTimeProvider clock{kStartMs};
  bnpl::MockCustodyAsset custody;
  bnpl::ProtocolNode node{clock, custody, makeConfig()};

  static bnpl::ProtocolConfig makeConfig() {
    bnpl::ProtocolConfig config;
    config.cmd_endpoint.clear();
    config.pub_endpoint.clear();
    return config;
  }

  json run(const json& request) {
    return json::parse(node.executeCommand(request.dump()));
  }

  static void expectOk(const json& response) {
    EXPECT_EQ(response.at("status"), "ok") << response.dump();
  }

  static void expectError(const json& response, const char* kind) {
    EXPECT_EQ(response.at("status"), "error") << response.dump();
    EXPECT_EQ(response.at("kind"), kind) << response.dump();
  }

  // lp funds the pool, alice gets a limit and repayment funds.
  void seed() {
    custody.mint("lp", 10'000);
    custody.mint("alice", 1'000);
    expectOk(run({{"cmd", "deposit"}, {"caller", "lp"}, {"amount", 10'000}}));
    expectOk(run({{"cmd", "set_limit"},
                  {"caller", "admin"},
                  {"user", "alice"},
                  {"limit", 1'000}}));
  }
};

// -----------------------------------------------------------------------------
// 1. With no endpoints the node runs without sockets; start/stop repeat
//    harmlessly.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, LifecycleWithoutIpc) {
  EXPECT_FALSE(node.isRunning());
  node.start();
  node.start();
  EXPECT_TRUE(node.isRunning());
  node.stop();
  node.stop();
  EXPECT_FALSE(node.isRunning());
}

TEST_F(ProtocolNodeTest, PingAndStatus) {
  const json pong = run({{"cmd", "ping"}});
  expectOk(pong);
  EXPECT_EQ(pong.at("response"), "pong");

  const json status = run({{"cmd", "status"}});
  expectOk(status);
  EXPECT_EQ(status.at("loan_count"), 0);
  EXPECT_EQ(status.at("fee_rate_bps"), 50);
  EXPECT_EQ(status.at("repayment_window_days"), 14);
  EXPECT_EQ(status.at("grace_period_days"), 3);
  EXPECT_EQ(status.at("now_ms"), kStartMs);
}

// -----------------------------------------------------------------------------
// 2. Loan lifecycle: create, inspect, repay.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, LoanLifecycle) {
  seed();

  const json eligibility = run({{"cmd", "eligibility"},
                                {"borrower", "alice"},
                                {"merchant", "shop"},
                                {"amount", 1'000}});
  expectOk(eligibility);
  EXPECT_TRUE(eligibility.at("eligible").get<bool>());
  EXPECT_EQ(eligibility.at("fee"), 5);

  const json created = run({{"cmd", "create_loan"},
                            {"caller", "alice"},
                            {"merchant", "shop"},
                            {"amount", 1'000}});
  expectOk(created);
  const auto loan_id = created.at("loan_id").get<std::uint64_t>();
  EXPECT_EQ(loan_id, 1u);
  EXPECT_EQ(custody.balanceOf("shop"), 995u);

  const json credit = run({{"cmd", "credit"}, {"user", "alice"}});
  expectOk(credit);
  EXPECT_EQ(credit.at("used"), 1'000);
  EXPECT_EQ(credit.at("available"), 0);
  EXPECT_EQ(credit.at("active_loan_id"), loan_id);

  const json loan = run({{"cmd", "loan"}, {"loan_id", loan_id}});
  expectOk(loan);
  EXPECT_EQ(loan.at("loan").at("state"), "Active");
  EXPECT_EQ(loan.at("loan").at("fee"), 5);

  expectOk(run({{"cmd", "repay_loan"}, {"caller", "alice"},
                {"loan_id", loan_id}}));

  const json pool = run({{"cmd", "pool"}});
  expectOk(pool);
  EXPECT_EQ(pool.at("pool").at("outstanding_credit"), 0);
  EXPECT_EQ(pool.at("pool").at("protocol_fees"), 5);
  EXPECT_EQ(pool.at("pool").at("custody_balance"), 10'005);

  // limit set, deposit, loan created, repayment
  EXPECT_EQ(run({{"cmd", "status"}}).at("events_published"), 4);
}

// -----------------------------------------------------------------------------
// 3. Error mapping: each failure class reports its kind.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, ErrorsAreReportedByKind) {
  seed();

  expectError(run({{"cmd", "set_limit"},
                   {"caller", "mallory"},
                   {"user", "alice"},
                   {"limit", 5}}),
              "authorization");
  expectError(run({{"cmd", "create_loan"},
                   {"caller", "alice"},
                   {"merchant", "shop"},
                   {"amount", 0}}),
              "validation");
  expectError(run({{"cmd", "create_loan"},
                   {"caller", "alice"},
                   {"merchant", "shop"},
                   {"amount", 1'001}}),
              "state_conflict");
  expectError(run({{"cmd", "loan"}, {"loan_id", 9}}), "validation");
  expectError(run({{"cmd", "no_such_command"}}), "validation");
  expectError(run({{"cmd", "set_limit"}, {"caller", "admin"}}), "validation");
  expectError(run({{"cmd", "deposit"}, {"caller", "lp"}, {"amount", -1}}),
              "validation");

  custody.failTransfersTo("shop");
  expectError(run({{"cmd", "create_loan"},
                   {"caller", "alice"},
                   {"merchant", "shop"},
                   {"amount", 100}}),
              "external");
  EXPECT_EQ(run({{"cmd", "status"}}).at("loan_count"), 0);
}

TEST_F(ProtocolNodeTest, MalformedRequestIsValidationError) {
  const json response = json::parse(node.executeCommand("{ nope"));
  expectError(response, "validation");
  expectError(json::parse(node.executeCommand("{}")), "validation");
}

// -----------------------------------------------------------------------------
// 4. Default on simulated time, then admin recovery through unblock.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, DefaultAndUnblock) {
  seed();
  const json created = run({{"cmd", "create_loan"},
                            {"caller", "alice"},
                            {"merchant", "shop"},
                            {"amount", 400}});
  const auto loan_id = created.at("loan_id").get<std::uint64_t>();

  const json early = run({{"cmd", "check_default"},
                          {"caller", "admin"},
                          {"user", "alice"},
                          {"loan_id", loan_id}});
  expectError(early, "state_conflict");

  clock.advance_by(20 * bnpl::domain::kMsPerDay);
  const json batch = run({{"cmd", "batch_check_defaults"},
                          {"caller", "admin"},
                          {"users", json::array({"alice"})},
                          {"loan_ids", json::array({loan_id})}});
  expectOk(batch);
  EXPECT_EQ(batch.at("count"), 1);
  EXPECT_TRUE(custody.isFrozen("alice"));

  const json loan = run({{"cmd", "loan"}, {"loan_id", loan_id}});
  EXPECT_EQ(loan.at("loan").at("state"), "Defaulted");
  EXPECT_TRUE(run({{"cmd", "credit"}, {"user", "alice"}})
                  .at("defaulted")
                  .get<bool>());

  const json unblocked =
      run({{"cmd", "unblock"}, {"caller", "admin"}, {"user", "alice"}});
  expectOk(unblocked);
  EXPECT_TRUE(unblocked.at("unfrozen").get<bool>());
  EXPECT_FALSE(custody.isFrozen("alice"));
  EXPECT_FALSE(run({{"cmd", "credit"}, {"user", "alice"}})
                   .at("defaulted")
                   .get<bool>());
}

// -----------------------------------------------------------------------------
// 5. Admin parameter commands.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, AdminParameters) {
  expectOk(run({{"cmd", "set_fee_rate"},
                {"caller", "admin"},
                {"fee_rate_bps", 100}}));
  expectOk(run({{"cmd", "set_repayment_window"},
                {"caller", "admin"},
                {"days", 30}}));
  expectOk(run({{"cmd", "set_grace_period"}, {"caller", "admin"},
                {"days", 0}}));
  expectError(run({{"cmd", "set_fee_rate"},
                   {"caller", "admin"},
                   {"fee_rate_bps", 20'000}}),
              "validation");
  expectError(run({{"cmd", "set_grace_period"},
                   {"caller", "lp"},
                   {"days", 1}}),
              "authorization");

  const json status = run({{"cmd", "status"}});
  EXPECT_EQ(status.at("fee_rate_bps"), 100);
  EXPECT_EQ(status.at("repayment_window_days"), 30);
  EXPECT_EQ(status.at("grace_period_days"), 0);
}

// -----------------------------------------------------------------------------
// 6. Role re-pointing: once the credit ledger's orchestrator role moves away,
//    the node's own orchestrator can no longer draw credit.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, AssignRole) {
  seed();

  const json moved = run({{"cmd", "assign_role"},
                          {"caller", "admin"},
                          {"component", "credit_ledger"},
                          {"role", "orchestrator"},
                          {"address", "elsewhere"}});
  expectOk(moved);
  EXPECT_EQ(moved.at("holder"), "elsewhere");

  expectError(run({{"cmd", "create_loan"},
                   {"caller", "alice"},
                   {"merchant", "shop"},
                   {"amount", 100}}),
              "authorization");

  expectError(run({{"cmd", "assign_role"},
                   {"caller", "alice"},
                   {"component", "credit_ledger"},
                   {"role", "orchestrator"},
                   {"address", "alice"}}),
              "authorization");
  expectError(run({{"cmd", "assign_role"},
                   {"caller", "admin"},
                   {"component", "credit_ledger"},
                   {"role", "admin"},
                   {"address", "alice"}}),
              "validation");
  expectError(run({{"cmd", "assign_role"},
                   {"caller", "admin"},
                   {"component", "vault"},
                   {"role", "orchestrator"},
                   {"address", "alice"}}),
              "validation");

  expectOk(run({{"cmd", "assign_role"},
                {"caller", "admin"},
                {"component", "credit_ledger"},
                {"role", "orchestrator"},
                {"address", "bnpl.orchestrator"}}));
  expectOk(run({{"cmd", "create_loan"},
                {"caller", "alice"},
                {"merchant", "shop"},
                {"amount", 100}}));
}

// -----------------------------------------------------------------------------
// 7. Failures below the protocol's error types never escape executeCommand.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, UnreachableCustodyFreezeStillDefaults) {
  seed();
  const auto loan_id = run({{"cmd", "create_loan"},
                            {"caller", "alice"},
                            {"merchant", "shop"},
                            {"amount", 400}})
                           .at("loan_id")
                           .get<std::uint64_t>();
  clock.advance_by(20 * bnpl::domain::kMsPerDay);
  custody.setFreezeUnreachable(true);

  const json checked = run({{"cmd", "check_default"},
                            {"caller", "admin"},
                            {"user", "alice"},
                            {"loan_id", loan_id}});
  expectOk(checked);
  EXPECT_TRUE(checked.at("defaulted").get<bool>());

  const json unblocked =
      run({{"cmd", "unblock"}, {"caller", "admin"}, {"user", "alice"}});
  expectOk(unblocked);
  EXPECT_FALSE(unblocked.at("unfrozen").get<bool>());
}

TEST_F(ProtocolNodeTest, ForeignExceptionIsReportedAsExternal) {
  seed();
  custody.setTransferHook(
      [](const std::string&, const std::string& to, bnpl::domain::Amount) {
        if (to == "shop") {
          throw std::runtime_error("custody node unreachable");
        }
      });

  std::string raw;
  EXPECT_NO_THROW(raw = node.executeCommand(json({{"cmd", "create_loan"},
                                                  {"caller", "alice"},
                                                  {"merchant", "shop"},
                                                  {"amount", 100}})
                                                .dump()));
  expectError(json::parse(raw), "external");

  const json status = run({{"cmd", "status"}});
  EXPECT_EQ(status.at("loan_count"), 0);
  EXPECT_EQ(status.at("pool").at("outstanding_credit"), 0);
  EXPECT_EQ(run({{"cmd", "credit"}, {"user", "alice"}}).at("used"), 0);
}

// -----------------------------------------------------------------------------
// 8. stop() while another thread is mid-command: the IPC worker is joined and
//    telemetry detached under the command lock, so no publish can reach a
//    destroyed server. Commands keep working afterwards.
// -----------------------------------------------------------------------------
TEST(ProtocolNodeIpcTest, StopDuringConcurrentCommands) {
  bnpl::SimulationTimeProvider clock{1'700'000'000'000};
  bnpl::MockCustodyAsset custody;
  bnpl::ProtocolConfig config;
  config.cmd_endpoint = "inproc://bnpl-node-test-cmd";
  config.pub_endpoint = "inproc://bnpl-node-test-pub";
  bnpl::ProtocolNode node{clock, custody, config};

  constexpr int kDeposits = 200;
  custody.mint("lp", kDeposits);
  node.start();
  ASSERT_TRUE(node.isRunning());

  std::atomic<int> ok{0};
  std::thread producer([&node, &ok] {
    const std::string deposit =
        json({{"cmd", "deposit"}, {"caller", "lp"}, {"amount", 1}}).dump();
    for (int i = 0; i < kDeposits; ++i) {
      if (json::parse(node.executeCommand(deposit)).at("status") == "ok") {
        ++ok;
      }
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(1));
  node.stop();
  EXPECT_FALSE(node.isRunning());
  producer.join();

  EXPECT_EQ(ok.load(), kDeposits);
  const json status = json::parse(node.executeCommand(R"({"cmd":"status"})"));
  EXPECT_EQ(status.at("pool").at("total_liquidity"), kDeposits);
  EXPECT_EQ(status.at("events_published"), kDeposits);
}

// -----------------------------------------------------------------------------
// 9. Telemetry: committed events carry type, sequence and payload.
// -----------------------------------------------------------------------------
TEST_F(ProtocolNodeTest, TelemetryFormatting) {
  std::vector<std::string> lines;
  node.eventBus().subscribe([&lines](const bnpl::Event& e) {
    lines.push_back(bnpl::IpcServer::formatTelemetry(e));
  });

  seed();
  ASSERT_EQ(lines.size(), 2u);

  const json deposit = json::parse(lines[0]);
  EXPECT_EQ(deposit.at("type"), "pool_activity");
  EXPECT_EQ(deposit.at("activity"), "deposit");
  EXPECT_EQ(deposit.at("seq"), 1);
  EXPECT_EQ(deposit.at("time_ms"), kStartMs);
  EXPECT_EQ(deposit.at("amount"), 10'000);

  const json limit = json::parse(lines[1]);
  EXPECT_EQ(limit.at("type"), "credit_limit_set");
  EXPECT_EQ(limit.at("seq"), 2);
  EXPECT_EQ(limit.at("user"), "alice");
}
