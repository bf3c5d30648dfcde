#include "src/pairlink/signaling_server.h"

#include "common/util.hpp"
#include "src/pairlink/signaling_channel.h"

#include <string>
#include <utility>

using boost::asio::ip::tcp;
using boost::asio::ip::udp;

namespace pairlink {

SignalingServer::SignalingServer(boost::asio::io_context& io, ServerConfig config)
    : io_(io),
      config_(std::move(config)),
      acceptor_(io),
      supervisor_(io, config_.table_options(), config_.sweep_interval) {}

SignalingServer::~SignalingServer() { stop(); }

void SignalingServer::listen() {
  const auto addr = boost::asio::ip::make_address(config_.bind_address);

  const tcp::endpoint ep(addr, config_.signal_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  common::log("signaling listening on " + common::endpoint_to_string(acceptor_.local_endpoint()));

  if (config_.stun_enabled) {
    stun_ = std::make_unique<StunResponder>(io_);
    stun_->listen(udp::endpoint(addr, config_.stun_port));
  }

  supervisor_.start();
  do_accept();
}

void SignalingServer::stop() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
  if (stun_) stun_->stop();
  supervisor_.stop();
}

tcp::endpoint SignalingServer::signal_endpoint() const {
  boost::system::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? tcp::endpoint() : ep;
}

udp::endpoint SignalingServer::stun_endpoint() const {
  return stun_ ? stun_->local_endpoint() : udp::endpoint();
}

void SignalingServer::do_accept() {
  acceptor_.async_accept(boost::asio::make_strand(io_), [this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        common::log(std::string("accept error: ") + ec.message());
      }
      if (!acceptor_.is_open()) return;
      return do_accept();
    }
    boost::system::error_code opt_ec;
    socket.set_option(tcp::no_delay(true), opt_ec);
    auto channel = std::make_shared<SignalingChannel>(supervisor_, std::move(socket), next_participant_id_++,
                                                      config_.channel_options());
    channel->start();
    do_accept();
  });
}

IoThreadPool::IoThreadPool(boost::asio::io_context& io, unsigned threads)
    : io_(io), work_(boost::asio::make_work_guard(io)) {
  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (unsigned i = 0; i < threads; ++i) {
    threads_.emplace_back([this] { io_.run(); });
  }
}

IoThreadPool::~IoThreadPool() {
  io_.stop();
  join();
}

void IoThreadPool::join() {
  work_.reset();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

} // namespace pairlink
