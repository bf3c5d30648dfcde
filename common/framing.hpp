#pragma once

#include <utility>
#include <boost/asio.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace common {

static constexpr std::size_t kMaxFrameSize = 64 * 1024;

inline void write_u16_be(uint16_t v, uint8_t out[2]) {
  out[0] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[1] = static_cast<uint8_t>(v & 0xFF);
}

inline uint16_t read_u16_be(const uint8_t in[2]) {
  return static_cast<uint16_t>((static_cast<uint16_t>(in[0]) << 8) | static_cast<uint16_t>(in[1]));
}

inline void write_u32_be(uint32_t v, uint8_t out[4]) {
  out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(v & 0xFF);
}

inline uint32_t read_u32_be(const uint8_t in[4]) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

// Prefix a body with its u32 big-endian length.
inline std::optional<std::vector<uint8_t>> frame_bytes(std::span<const uint8_t> body,
                                                       std::size_t max_len = kMaxFrameSize) {
  if (body.empty() || body.size() > max_len) return std::nullopt;
  std::vector<uint8_t> out(4 + body.size());
  write_u32_be(static_cast<uint32_t>(body.size()), out.data());
  std::memcpy(out.data() + 4, body.data(), body.size());
  return out;
}

template <class AsyncReadStream, class Handler>
inline void async_read_frame(AsyncReadStream& stream,
                             std::shared_ptr<std::array<uint8_t, 4>> header_buf,
                             std::shared_ptr<std::vector<uint8_t>> body_buf,
                             std::size_t max_len,
                             Handler&& handler) {
  boost::asio::async_read(
      stream,
      boost::asio::buffer(*header_buf),
      [&stream, header_buf, body_buf, max_len, handler = std::forward<Handler>(handler)](
          const boost::system::error_code& ec, std::size_t) mutable {
        if (ec) return handler(ec, std::vector<uint8_t>{});
        const uint32_t len = read_u32_be(header_buf->data());
        if (len == 0 || len > max_len) {
          return handler(boost::asio::error::message_size, std::vector<uint8_t>{});
        }
        body_buf->assign(len, 0);
        boost::asio::async_read(
            stream,
            boost::asio::buffer(*body_buf),
            [body_buf, handler = std::move(handler)](const boost::system::error_code& ec2,
                                                     std::size_t) mutable {
              if (ec2) return handler(ec2, std::vector<uint8_t>{});
              return handler(ec2, std::move(*body_buf));
            });
      });
}

template <class AsyncReadStream, class Handler>
inline void async_read_frame(AsyncReadStream& stream, std::size_t max_len, Handler&& handler) {
  async_read_frame(stream,
                   std::make_shared<std::array<uint8_t, 4>>(),
                   std::make_shared<std::vector<uint8_t>>(),
                   max_len,
                   std::forward<Handler>(handler));
}

// Blocking counterparts, used by command-line clients.
template <class SyncWriteStream>
inline void write_frame(SyncWriteStream& stream, std::span<const uint8_t> body, boost::system::error_code& ec) {
  auto framed = frame_bytes(body);
  if (!framed) {
    ec = boost::asio::error::message_size;
    return;
  }
  boost::asio::write(stream, boost::asio::buffer(*framed), ec);
}

template <class SyncReadStream>
inline std::vector<uint8_t> read_frame(SyncReadStream& stream,
                                       boost::system::error_code& ec,
                                       std::size_t max_len = kMaxFrameSize) {
  std::array<uint8_t, 4> header{};
  boost::asio::read(stream, boost::asio::buffer(header), ec);
  if (ec) return {};
  const uint32_t len = read_u32_be(header.data());
  if (len == 0 || len > max_len) {
    ec = boost::asio::error::message_size;
    return {};
  }
  std::vector<uint8_t> body(len);
  boost::asio::read(stream, boost::asio::buffer(body), ec);
  if (ec) return {};
  return body;
}

// A tiny write-queue for framed messages. Not thread-safe: call it from the
// stream's strand only.
template <class AsyncWriteStream>
class FrameWriteQueue : public std::enable_shared_from_this<FrameWriteQueue<AsyncWriteStream>> {
 public:
  using DrainHandler = std::function<void(const boost::system::error_code&)>;

  explicit FrameWriteQueue(AsyncWriteStream& stream) : stream_(stream) {}

  bool send(std::span<const uint8_t> body) {
    if (failed_) return false;
    auto framed = frame_bytes(body);
    if (!framed) return false;
    pending_.push_back(std::make_shared<std::vector<uint8_t>>(std::move(*framed)));
    if (writing_) return true;
    writing_ = true;
    do_write();
    return true;
  }

  // Fires once every queued frame is written, or on the first write error.
  void on_drained(DrainHandler handler) {
    if (!writing_) {
      handler(last_error_);
      return;
    }
    drain_handlers_.push_back(std::move(handler));
  }

 private:
  void do_write() {
    if (pending_.empty()) {
      writing_ = false;
      notify_drained();
      return;
    }
    auto self = this->shared_from_this();
    auto buf = std::move(pending_.front());
    pending_.pop_front();
    boost::asio::async_write(stream_,
                             boost::asio::buffer(*buf),
                             [self, buf](const boost::system::error_code& ec, std::size_t) {
                               if (ec) {
                                 self->failed_ = true;
                                 self->last_error_ = ec;
                                 self->pending_.clear();
                                 self->writing_ = false;
                                 self->notify_drained();
                                 return;
                               }
                               self->do_write();
                             });
  }

  void notify_drained() {
    auto handlers = std::move(drain_handlers_);
    drain_handlers_.clear();
    for (auto& fn : handlers) {
      if (fn) fn(last_error_);
    }
  }

  AsyncWriteStream& stream_;
  std::deque<std::shared_ptr<std::vector<uint8_t>>> pending_;
  std::vector<DrainHandler> drain_handlers_;
  boost::system::error_code last_error_;
  bool writing_ = false;
  bool failed_ = false;
};

} // namespace common
