#include "common/framing.hpp"
#include "common/util.hpp"
#include "src/pairlink/session_id.h"
#include "src/pairlink/signal_message.h"
#include "src/pairlink/stun_responder.h"

#include <utility>
#include <boost/asio.hpp>

#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

using boost::asio::ip::tcp;
using boost::asio::ip::udp;

namespace {

bool random_bytes(uint8_t* out, std::size_t n) {
  return RAND_bytes(out, static_cast<int>(n)) == 1;
}

std::optional<pairlink::SessionId> random_session_id() {
  std::array<uint8_t, pairlink::SessionId::kWireSize> buf{};
  if (!random_bytes(buf.data(), buf.size())) return std::nullopt;
  return pairlink::SessionId::read(buf.data());
}

class Peer {
 public:
  Peer(boost::asio::io_context& io, std::string name) : socket_(io), name_(std::move(name)) {}

  bool connect(const tcp::endpoint& ep) {
    boost::system::error_code ec;
    socket_.connect(ep, ec);
    if (ec) std::cerr << name_ << ": connect failed: " << ec.message() << "\n";
    return !ec;
  }

  bool send(const pairlink::SignalMessage& msg) {
    const auto body = pairlink::encode_message(msg);
    boost::system::error_code ec;
    common::write_frame(socket_, body, ec);
    if (ec) std::cerr << name_ << ": send failed: " << ec.message() << "\n";
    return !ec;
  }

  std::optional<pairlink::SignalMessage> receive() {
    boost::system::error_code ec;
    const auto body = common::read_frame(socket_, ec);
    if (ec) {
      std::cerr << name_ << ": receive failed: " << ec.message() << "\n";
      return std::nullopt;
    }
    pairlink::DecodeError err{};
    auto msg = pairlink::decode_message(body, &err);
    if (!msg) std::cerr << name_ << ": undecodable message: " << pairlink::decode_error_name(err) << "\n";
    return msg;
  }

  template <class T>
  std::optional<T> expect() {
    auto msg = receive();
    if (!msg) return std::nullopt;
    if (auto* m = std::get_if<T>(&*msg)) return *m;
    std::cerr << name_ << ": unexpected " << pairlink::message_name(*msg);
    if (auto* e = std::get_if<pairlink::Error>(&*msg)) std::cerr << " (" << e->reason << ")";
    std::cerr << "\n";
    return std::nullopt;
  }

  bool expect_eof() {
    std::array<uint8_t, 1> b{};
    boost::system::error_code ec;
    socket_.read_some(boost::asio::buffer(b), ec);
    return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset;
  }

 private:
  tcp::socket socket_;
  std::string name_;
};

bool run_session(boost::asio::io_context& io, const tcp::endpoint& ep, const pairlink::SessionId& id) {
  Peer a(io, "A");
  Peer b(io, "B");
  if (!a.connect(ep) || !b.connect(ep)) return false;

  if (!a.send(pairlink::JoinSession{id})) return false;
  if (!a.expect<pairlink::SessionWaiting>()) return false;

  if (!b.send(pairlink::JoinSession{id})) return false;
  const auto pa = a.expect<pairlink::SessionPaired>();
  const auto pb = b.expect<pairlink::SessionPaired>();
  if (!pa || !pb || !pa->initiator || pb->initiator) return false;
  std::cout << "paired session " << id.to_string() << "\n";

  const pairlink::Bytes offer = {'v', '=', '0'};
  if (!a.send(pairlink::Offer{offer})) return false;
  const auto got_offer = b.expect<pairlink::Offer>();
  if (!got_offer || got_offer->payload != offer) return false;

  const pairlink::Bytes answer = {'v', '=', '1'};
  if (!b.send(pairlink::Answer{answer})) return false;
  const auto got_answer = a.expect<pairlink::Answer>();
  if (!got_answer || got_answer->payload != answer) return false;
  std::cout << "offer/answer relayed\n";

  if (!a.send(pairlink::ConnectionEstablished{})) return false;
  if (!b.send(pairlink::ConnectionEstablished{})) return false;
  if (!a.expect<pairlink::CloseSession>() || !b.expect<pairlink::CloseSession>()) return false;
  if (!a.expect_eof() || !b.expect_eof()) return false;
  std::cout << "both channels closed by server\n";
  return true;
}

bool run_stun_check(boost::asio::io_context& io, const udp::endpoint& ep, int timeout_ms) {
  std::array<uint8_t, pairlink::stun::kTransactionIdSize> txid{};
  if (!random_bytes(txid.data(), txid.size())) return false;

  udp::socket sock(io);
  sock.open(ep.protocol());
  const auto request = pairlink::stun::build_binding_request(txid);
  sock.send_to(boost::asio::buffer(request), ep);

  std::array<uint8_t, pairlink::stun::kMaxDatagram> buf{};
  udp::endpoint from;
  std::optional<udp::endpoint> mapped;
  sock.async_receive_from(boost::asio::buffer(buf), from,
                          [&](const boost::system::error_code& ec, std::size_t n) {
                            if (ec) return;
                            mapped = pairlink::stun::parse_binding_response(
                                std::span<const uint8_t>(buf.data(), n), &txid);
                          });
  io.restart();
  io.run_for(std::chrono::milliseconds(timeout_ms));
  if (!mapped) {
    std::cerr << "stun: no valid response\n";
    return false;
  }
  std::cout << "stun mapped address " << common::endpoint_to_string(*mapped) << "\n";
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::string server = "127.0.0.1:9003";
  std::string stun = "127.0.0.1:9004";
  std::string session;
  int timeout_ms = 3000;
  bool skip_stun = false;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need_val = [&](const char* flag) -> std::optional<std::string> {
      if (a != flag) return std::nullopt;
      if (i + 1 >= argc) return std::nullopt;
      return std::string(argv[++i]);
    };
    if (auto v = need_val("--server")) {
      server = *v;
      continue;
    }
    if (auto v = need_val("--stun")) {
      stun = *v;
      continue;
    }
    if (auto v = need_val("--session")) {
      session = *v;
      continue;
    }
    if (auto v = need_val("--timeout-ms")) {
      try {
        timeout_ms = std::stoi(*v);
      } catch (const std::exception&) {
        timeout_ms = 0;
      }
      if (timeout_ms < 100) timeout_ms = 3000;
      continue;
    }
    if (a == "--no-stun") {
      skip_stun = true;
      continue;
    }
    if (a == "--help" || a == "-h") {
      std::cout << "Usage: pairlink_smoke [--server host:port] [--stun host:port] [--session <hex id>]"
                   " [--timeout-ms N] [--no-stun]\n";
      return 0;
    }
    std::cerr << "Unknown arg: " << a << "\n";
    return 2;
  }

  const auto server_hp = common::parse_host_port(server);
  const auto stun_hp = common::parse_host_port(stun);
  if (!server_hp || !stun_hp) {
    std::cerr << "invalid --server or --stun\n";
    return 2;
  }

  std::optional<pairlink::SessionId> id = session.empty() ? random_session_id() : pairlink::SessionId::parse(session);
  if (!id) {
    std::cerr << "invalid --session (or no randomness available)\n";
    return 2;
  }

  boost::asio::io_context io;
  boost::system::error_code ec;
  const auto server_addr = boost::asio::ip::make_address(server_hp->host, ec);
  if (ec) {
    std::cerr << "invalid server address: " << ec.message() << "\n";
    return 2;
  }
  const auto stun_addr = boost::asio::ip::make_address(stun_hp->host, ec);
  if (ec) {
    std::cerr << "invalid stun address: " << ec.message() << "\n";
    return 2;
  }

  if (!run_session(io, tcp::endpoint(server_addr, server_hp->port), *id)) {
    std::cerr << "FAIL: signaling session\n";
    return 1;
  }
  if (!skip_stun && !run_stun_check(io, udp::endpoint(stun_addr, stun_hp->port), timeout_ms)) {
    std::cerr << "FAIL: stun check\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
