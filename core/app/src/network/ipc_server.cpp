#include "bnpl/network/ipc_server.hpp"
#include "bnpl/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace bnpl {

namespace {

// Fields every mirrored record carries.
template <typename E>
nlohmann::json envelope(const char* type, const E& e) {
  nlohmann::json j;
  j["type"] = type;
  j["seq"] = e.sequence_id;
  j["time_ms"] = timestamp_to_ms(e.timestamp);
  return j;
}

nlohmann::json toJson(const LoanCreatedEvent& e) {
  nlohmann::json j = envelope("loan_created", e);
  j["user"] = e.user;
  j["merchant"] = e.merchant;
  j["loan_id"] = e.loan_id;
  j["amount"] = e.amount;
  j["due_at_ms"] = e.due_at_ms;
  return j;
}

nlohmann::json toJson(const RepaymentEvent& e) {
  nlohmann::json j = envelope("repayment", e);
  j["user"] = e.user;
  j["merchant"] = e.merchant;
  j["loan_id"] = e.loan_id;
  j["amount"] = e.amount;
  j["success"] = e.success;
  return j;
}

nlohmann::json toJson(const DefaultEvent& e) {
  nlohmann::json j = envelope("default", e);
  j["user"] = e.user;
  j["loan_id"] = e.loan_id;
  j["overdue_amount"] = e.overdue_amount;
  j["days_overdue"] = e.days_overdue;
  return j;
}

nlohmann::json toJson(const DisputeEvent& e) {
  nlohmann::json j = envelope("dispute", e);
  j["user"] = e.user;
  j["merchant"] = e.merchant;
  j["loan_id"] = e.loan_id;
  j["reason"] = e.reason;
  return j;
}

nlohmann::json toJson(const CreditLimitSetEvent& e) {
  nlohmann::json j = envelope("credit_limit_set", e);
  j["user"] = e.user;
  j["limit"] = e.limit;
  return j;
}

nlohmann::json toJson(const UserUnblockedEvent& e) {
  nlohmann::json j = envelope("user_unblocked", e);
  j["user"] = e.user;
  return j;
}

nlohmann::json toJson(const PoolActivityEvent& e) {
  nlohmann::json j = envelope("pool_activity", e);
  j["activity"] = poolActivityToString(e.activity);
  j["account"] = e.account;
  j["amount"] = e.amount;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish whatever committed before shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*maybe_event);
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REQ/REP exchange, or a timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch the variant to the per-type encoders
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit([](const auto& e) { return toJson(e).dump(); }, event);
}

}  // namespace bnpl
