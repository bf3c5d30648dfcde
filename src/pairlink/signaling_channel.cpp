#include "src/pairlink/signaling_channel.h"

#include "common/util.hpp"
#include "src/pairlink/session_supervisor.h"

#include <utility>
#include <variant>

using boost::asio::ip::tcp;

namespace pairlink {

SignalingChannel::SignalingChannel(SessionSupervisor& supervisor,
                                   tcp::socket socket,
                                   uint64_t participant_id,
                                   ChannelOptions options)
    : supervisor_(supervisor),
      socket_(std::move(socket)),
      close_timer_(socket_.get_executor()),
      participant_id_(participant_id),
      options_(options) {
  writer_ = std::make_shared<common::FrameWriteQueue<tcp::socket>>(socket_);
}

void SignalingChannel::start() {
  boost::system::error_code ec;
  const auto ep = socket_.remote_endpoint(ec);
  remote_ = ec ? std::string("unknown") : common::endpoint_to_string(ep);
  common::log("client connected participant=" + std::to_string(participant_id_) + " from " + remote_);

  auto self = shared_from_this();
  boost::asio::dispatch(socket_.get_executor(), [self] { self->do_read(); });
}

void SignalingChannel::deliver(SignalMessage msg) {
  auto self = shared_from_this();
  boost::asio::post(socket_.get_executor(), [self, msg = std::move(msg)] {
    if (self->closing_) return;
    self->send_now(msg);
  });
}

void SignalingChannel::close(std::optional<SignalMessage> final_message) {
  auto self = shared_from_this();
  boost::asio::post(socket_.get_executor(), [self, final_message = std::move(final_message)]() mutable {
    self->do_close(std::move(final_message));
  });
}

void SignalingChannel::do_read() {
  auto self = shared_from_this();
  common::async_read_frame(socket_, options_.max_frame_size,
                           [self](const boost::system::error_code& ec, std::vector<uint8_t> body) {
                             if (self->closing_) return;
                             if (ec == boost::asio::error::message_size) {
                               self->protocol_violation("frame exceeds maximum size");
                               return;
                             }
                             if (ec) {
                               if (ec != boost::asio::error::operation_aborted && ec != boost::asio::error::eof) {
                                 common::log("client read error participant=" +
                                             std::to_string(self->participant_id_) + ": " + ec.message());
                               }
                               self->finish_close();
                               return;
                             }
                             self->handle_frame(std::move(body));
                             if (!self->closing_ && !self->rejected_) self->do_read();
                           });
}

void SignalingChannel::handle_frame(std::vector<uint8_t> body) {
  DecodeError err = DecodeError::Empty;
  auto msg = decode_message(body, &err);
  if (!msg) {
    if (!joined_) {
      protocol_violation(std::string("undecodable first message: ") + decode_error_name(err));
      return;
    }
    ++decode_errors_;
    if (decode_errors_ > options_.max_decode_errors) {
      protocol_violation("too many malformed messages");
      return;
    }
    send_now(make_error(ErrorCode::DecodeError, decode_error_name(err)));
    return;
  }
  handle_message(std::move(*msg));
}

void SignalingChannel::handle_message(SignalMessage msg) {
  if (!session_id_) {
    const auto* join = std::get_if<JoinSession>(&msg);
    if (!join) {
      protocol_violation(std::string("expected join_session, got ") + message_name(msg));
      return;
    }
    session_id_ = join->session_id;
    joined_ = supervisor_.join(*session_id_, shared_from_this());
    // Rejected joins already have a close queued; read nothing further.
    if (!joined_) rejected_ = true;
    return;
  }

  if (std::holds_alternative<JoinSession>(msg)) {
    protocol_violation("already joined a session");
    return;
  }
  if (std::holds_alternative<ConnectionEstablished>(msg)) {
    supervisor_.report_established(*session_id_, shared_from_this());
    return;
  }
  if (is_relayable(msg)) {
    supervisor_.relay(*session_id_, shared_from_this(), std::move(msg));
    return;
  }
  protocol_violation(std::string("unexpected ") + message_name(msg) + " from client");
}

void SignalingChannel::send_now(const SignalMessage& msg) {
  const Bytes body = encode_message(msg);
  if (!writer_->send(body)) {
    common::log("send failed participant=" + std::to_string(participant_id_) +
                " message=" + message_name(msg));
  }
}

void SignalingChannel::protocol_violation(std::string reason) {
  common::log("protocol_violation participant=" + std::to_string(participant_id_) + " " + reason);
  do_close(make_error(ErrorCode::ProtocolViolation, reason));
}

void SignalingChannel::do_close(std::optional<SignalMessage> final_message) {
  if (closing_) return;
  closing_ = true;
  if (final_message) send_now(*final_message);

  auto self = shared_from_this();
  close_timer_.expires_after(options_.close_timeout);
  close_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec) return;
    self->finish_close();
  });
  writer_->on_drained([self](const boost::system::error_code&) { self->finish_close(); });
}

void SignalingChannel::finish_close() {
  if (closed_) return;
  closed_ = true;
  closing_ = true;
  close_timer_.cancel();

  boost::system::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
  common::log("client disconnected participant=" + std::to_string(participant_id_) + " from " + remote_);

  if (joined_) {
    joined_ = false;
    supervisor_.leave(*session_id_, participant_id_);
  }
}

} // namespace pairlink
