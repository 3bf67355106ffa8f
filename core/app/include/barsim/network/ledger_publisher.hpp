#pragma once

#include "barsim/backtest/ledger.hpp"

#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// LedgerPublisher — ZeroMQ PUB bridge for finished runs
// -----------------------------------------------------------------------------
//
// @brief  Broadcasts a ledger as one JSON message on a PUB socket so external
//         plotting and metrics tools (typically Python) can consume it.
//
// @details
// start() creates the context, binds the PUB socket and then waits
// `settle` before returning: a PUB socket drops messages for subscribers
// that have not finished connecting, and a backtest publishes once, right
// after the run. LINGER is set so a message still queued at stop() gets
// flushed for up to kLingerMs.
//
// The message body is toJson(ledger).dump(), with "type": "ledger".
//
// Thread model:
//   Single-threaded; owned and driven by main(). No worker thread, unlike
//   a long-lived telemetry server, since there is exactly one message.
//
// Ownership:
//   Owns the ZMQ context and socket. stop() (also run by the destructor)
//   closes the socket before the context.
// -----------------------------------------------------------------------------
class LedgerPublisher {
 public:
  explicit LedgerPublisher(
      std::string endpoint,
      std::chrono::milliseconds settle = std::chrono::milliseconds(200));
  ~LedgerPublisher();

  LedgerPublisher(const LedgerPublisher&) = delete;
  LedgerPublisher& operator=(const LedgerPublisher&) = delete;
  LedgerPublisher(LedgerPublisher&&) = delete;
  LedgerPublisher& operator=(LedgerPublisher&&) = delete;

  // Binds the socket. Idempotent. Throws zmq::error_t if the bind fails.
  void start();

  // Idempotent; safe if never started.
  void stop();

  bool running() const { return socket_ != nullptr; }

  // -------------------------------------------------------------------------
  // publish(ledger)
  // -------------------------------------------------------------------------
  // @return true if the message was queued, false if it would have blocked.
  // @throws std::logic_error if start() was not called.
  // -------------------------------------------------------------------------
  bool publish(const Ledger& ledger);

  // Raw payload variant, used by publish(ledger).
  bool publishPayload(const std::string& payload);

  const std::string& endpoint() const { return endpoint_; }

 private:
  static constexpr int kLingerMs = 1000;

  const std::string endpoint_;
  const std::chrono::milliseconds settle_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace barsim
