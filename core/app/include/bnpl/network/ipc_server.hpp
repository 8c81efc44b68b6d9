#pragma once

#include "bnpl/concurrent/thread_safe_queue.hpp"
#include "bnpl/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace bnpl {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry gateway for a ProtocolNode
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers JSON commands on a REP socket
//         and broadcasts committed protocol events as JSON on a PUB socket.
//
// @details
// Two sockets, one thread:
//
//   1. REP (cmd_endpoint, default tcp://127.0.0.1:5556):
//      Each request is a JSON command string. It is handed to the command
//      handler (bound to ProtocolNode::executeCommand) and the returned JSON
//      string is sent back. ZMQ_RCVTIMEO bounds each recv so the loop can
//      alternate between commands and telemetry.
//
//   2. PUB (pub_endpoint, default tcp://127.0.0.1:5557):
//      Events arrive through pushTelemetry() from the EventBus subscriber
//      the node installs, are buffered in a ThreadSafeQueue, and are
//      published as one JSON object per message:
//
//        {"type":"loan_created","seq":1,"time_ms":...,"user":...,...}
//
// Thread model:
//   start()/stop() on the owning thread. The handler runs on the IPC thread;
//   ProtocolNode serializes it against every other caller.
//
// Ownership:
//   Owned by ProtocolNode via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Stores parameters; no sockets are opened until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker thread.
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker, joins it within kPollTimeoutMs, closes the
  //         sockets. Idempotent; safe if never started.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues an event for the PUB socket. Safe from any thread.
  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  JSON encoding of one mirrored event, as published on PUB.
  //
  // @details
  // Every event type has a formatter; "type" names the record, "seq" and
  // "time_ms" carry the mirror sequence id and timestamp.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then poll for one command.
  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace bnpl
