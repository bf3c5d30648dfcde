#pragma once

#include "src/pairlink/server_config.h"
#include "src/pairlink/session_supervisor.h"
#include "src/pairlink/stun_responder.h"

#include <utility>
#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace pairlink {

// Accepts signaling connections and hosts the STUN responder on one
// io_context. listen() throws boost::system::system_error if a bind fails.
class SignalingServer {
 public:
  SignalingServer(boost::asio::io_context& io, ServerConfig config);
  ~SignalingServer();

  SignalingServer(const SignalingServer&) = delete;
  SignalingServer& operator=(const SignalingServer&) = delete;

  void listen();
  void stop();

  boost::asio::ip::tcp::endpoint signal_endpoint() const;
  boost::asio::ip::udp::endpoint stun_endpoint() const;

  SessionSupervisor& supervisor() { return supervisor_; }
  const ServerConfig& config() const { return config_; }

 private:
  void do_accept();

  boost::asio::io_context& io_;
  ServerConfig config_;
  boost::asio::ip::tcp::acceptor acceptor_;
  SessionSupervisor supervisor_;
  std::unique_ptr<StunResponder> stun_;
  std::atomic<uint64_t> next_participant_id_{1};
};

// Runs `io` on `threads` workers until it stops.
class IoThreadPool {
 public:
  IoThreadPool(boost::asio::io_context& io, unsigned threads);
  ~IoThreadPool();

  void join();

 private:
  boost::asio::io_context& io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::vector<std::thread> threads_;
};

} // namespace pairlink
