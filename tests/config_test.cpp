// =============================================================================
// config_test.cpp
// =============================================================================
// Unit tests for bnpl::ProtocolConfig JSON loading and validation.
// =============================================================================

#include "bnpl/config/protocol_config.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

// -----------------------------------------------------------------------------
// 1. Defaults are valid and carry the documented protocol parameters.
// -----------------------------------------------------------------------------
TEST(ProtocolConfigTest, DefaultsAreValid) {
  bnpl::ProtocolConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.repayment_window_days, 14);
  EXPECT_EQ(config.fee_rate_bps, 50u);
  EXPECT_EQ(config.grace_period_days, 3);
  EXPECT_TRUE(config.genesis_balances.empty());
}

// -----------------------------------------------------------------------------
// 2. Every key is read; missing keys keep their defaults.
// -----------------------------------------------------------------------------
TEST(ProtocolConfigTest, ParsesAllSections) {
  const auto config = bnpl::ProtocolConfig::parse(R"({
    "admin": "ops",
    "addresses": {
      "orchestrator": "orch",
      "credit_ledger": "credit",
      "liquidity_ledger": "pool",
      "default_detector": "detector"
    },
    "repayment_window_days": 30,
    "fee_rate_bps": 125,
    "grace_period_days": 0,
    "ipc": { "cmd_endpoint": "inproc://cmd", "pub_endpoint": "" },
    "genesis_balances": { "lp": 100000, "alice": 0 }
  })");

  EXPECT_EQ(config.admin, "ops");
  EXPECT_EQ(config.orchestrator_address, "orch");
  EXPECT_EQ(config.credit_ledger_address, "credit");
  EXPECT_EQ(config.liquidity_ledger_address, "pool");
  EXPECT_EQ(config.default_detector_address, "detector");
  EXPECT_EQ(config.repayment_window_days, 30);
  EXPECT_EQ(config.fee_rate_bps, 125u);
  EXPECT_EQ(config.grace_period_days, 0);
  EXPECT_EQ(config.cmd_endpoint, "inproc://cmd");
  EXPECT_TRUE(config.pub_endpoint.empty());
  ASSERT_EQ(config.genesis_balances.size(), 2u);
  EXPECT_EQ(config.genesis_balances.at("lp"), 100000u);
}

TEST(ProtocolConfigTest, EmptyObjectYieldsDefaults) {
  const auto config = bnpl::ProtocolConfig::parse("{}");
  const bnpl::ProtocolConfig defaults;
  EXPECT_EQ(config.admin, defaults.admin);
  EXPECT_EQ(config.cmd_endpoint, defaults.cmd_endpoint);
  EXPECT_EQ(config.fee_rate_bps, defaults.fee_rate_bps);
}

// -----------------------------------------------------------------------------
// 3. Out-of-range and ill-typed values are validation errors.
// -----------------------------------------------------------------------------
TEST(ProtocolConfigTest, RejectsBadValues) {
  using bnpl::ProtocolConfig;
  EXPECT_THROW(ProtocolConfig::parse(R"({"repayment_window_days": 0})"),
               bnpl::ValidationError);
  EXPECT_THROW(ProtocolConfig::parse(R"({"repayment_window_days": 36501})"),
               bnpl::ValidationError);
  EXPECT_THROW(ProtocolConfig::parse(R"({"fee_rate_bps": 10001})"),
               bnpl::ValidationError);
  EXPECT_THROW(ProtocolConfig::parse(R"({"fee_rate_bps": -1})"),
               bnpl::ValidationError);
  EXPECT_THROW(ProtocolConfig::parse(R"({"grace_period_days": -1})"),
               bnpl::ValidationError);
  EXPECT_THROW(ProtocolConfig::parse(R"({"grace_period_days": "3"})"),
               bnpl::ValidationError);
  EXPECT_THROW(ProtocolConfig::parse(R"({"genesis_balances": {"lp": -5}})"),
               bnpl::ValidationError);
  EXPECT_THROW(ProtocolConfig::parse(R"({"admin": 7})"),
               bnpl::ValidationError);
}

TEST(ProtocolConfigTest, RejectsEmptyOrDuplicateAddresses) {
  EXPECT_THROW(bnpl::ProtocolConfig::parse(R"({"admin": ""})"),
               bnpl::ValidationError);
  EXPECT_THROW(bnpl::ProtocolConfig::parse(
                   R"({"addresses": {"orchestrator": "bnpl.credit"}})"),
               bnpl::ValidationError);
}

TEST(ProtocolConfigTest, RejectsMalformedJson) {
  EXPECT_THROW(bnpl::ProtocolConfig::parse("{ not json"),
               bnpl::ValidationError);
  EXPECT_THROW(bnpl::ProtocolConfig::parse("[1, 2, 3]"),
               bnpl::ValidationError);
}

// -----------------------------------------------------------------------------
// 4. loadFile reads from disk and reports unreadable paths.
// -----------------------------------------------------------------------------
TEST(ProtocolConfigTest, LoadFile) {
  const std::string path = ::testing::TempDir() + "bnpl_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"fee_rate_bps": 75})";
  }
  const auto config = bnpl::ProtocolConfig::loadFile(path);
  EXPECT_EQ(config.fee_rate_bps, 75u);
  std::remove(path.c_str());

  EXPECT_THROW(bnpl::ProtocolConfig::loadFile(path), bnpl::ValidationError);
}
