#pragma once

#include "common/framing.hpp"
#include "src/pairlink/session_table.h"
#include "src/pairlink/signal_message.h"

#include <utility>
#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pairlink {

class SessionSupervisor;

struct ChannelOptions {
  // Malformed messages tolerated before the channel is dropped.
  std::size_t max_decode_errors = 3;
  std::size_t max_frame_size = common::kMaxFrameSize;
  // Upper bound for flushing the final messages on close.
  std::chrono::steady_clock::duration close_timeout = std::chrono::seconds(5);
};

// One client connection. Everything runs on the socket's strand; deliver()
// and close() may be called from any thread.
class SignalingChannel : public Participant, public std::enable_shared_from_this<SignalingChannel> {
 public:
  SignalingChannel(SessionSupervisor& supervisor,
                   boost::asio::ip::tcp::socket socket,
                   uint64_t participant_id,
                   ChannelOptions options = {});

  void start();

  uint64_t participant_id() const override { return participant_id_; }
  void deliver(SignalMessage msg) override;
  void close(std::optional<SignalMessage> final_message) override;

 private:
  void do_read();
  void handle_frame(std::vector<uint8_t> body);
  void handle_message(SignalMessage msg);
  void send_now(const SignalMessage& msg);
  void protocol_violation(std::string reason);
  void do_close(std::optional<SignalMessage> final_message);
  void finish_close();

  SessionSupervisor& supervisor_;
  boost::asio::ip::tcp::socket socket_;
  std::shared_ptr<common::FrameWriteQueue<boost::asio::ip::tcp::socket>> writer_;
  boost::asio::steady_timer close_timer_;
  const uint64_t participant_id_;
  const ChannelOptions options_;
  std::string remote_;

  std::optional<SessionId> session_id_;
  bool joined_ = false;
  bool rejected_ = false;
  bool closing_ = false;
  bool closed_ = false;
  std::size_t decode_errors_ = 0;
};

} // namespace pairlink
