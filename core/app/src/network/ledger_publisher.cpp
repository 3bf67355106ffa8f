#include "barsim/network/ledger_publisher.hpp"
#include "barsim/report/ledger_json.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace barsim {

LedgerPublisher::LedgerPublisher(std::string endpoint,
                                 std::chrono::milliseconds settle)
    : endpoint_(std::move(endpoint)), settle_(settle) {}

LedgerPublisher::~LedgerPublisher() { stop(); }

// -----------------------------------------------------------------------------
// start(): context, PUB socket, bind, settle
// -----------------------------------------------------------------------------
void LedgerPublisher::start() {
  if (socket_) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  socket_->set(zmq::sockopt::linger, kLingerMs);
  socket_->bind(endpoint_);

  std::cout << "[LedgerPublisher] bound PUB=" << endpoint_ << "\n";

  if (settle_.count() > 0) {
    std::this_thread::sleep_for(settle_);
  }
}

// -----------------------------------------------------------------------------
// stop(): socket before context
// -----------------------------------------------------------------------------
void LedgerPublisher::stop() {
  if (!socket_ && !context_) {
    return;
  }
  socket_.reset();
  context_.reset();
  std::cout << "[LedgerPublisher] stopped.\n";
}

bool LedgerPublisher::publishPayload(const std::string& payload) {
  if (!socket_) {
    throw std::logic_error("LedgerPublisher::publish called before start()");
  }
  zmq::message_t msg(payload.data(), payload.size());
  const auto sent = socket_->send(msg, zmq::send_flags::dontwait);
  return sent.has_value();
}

bool LedgerPublisher::publish(const Ledger& ledger) {
  const bool sent = publishPayload(toJson(ledger).dump());
  if (sent) {
    std::cout << "[LedgerPublisher] published ledger (" << ledger.size()
              << " rows)\n";
  } else {
    std::cerr << "[LedgerPublisher] WARNING: ledger not sent, socket would "
                 "block\n";
  }
  return sent;
}

}  // namespace barsim
