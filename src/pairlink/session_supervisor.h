#pragma once

#include "src/pairlink/session_table.h"

#include <utility>
#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace pairlink {

// Owns the session table and applies its outcomes: every delivery and close
// instruction is issued after the table call returns, through the
// participants' own executors.
class SessionSupervisor {
 public:
  SessionSupervisor(boost::asio::io_context& io,
                    SessionTableOptions options,
                    std::chrono::steady_clock::duration sweep_interval = std::chrono::seconds(5));
  ~SessionSupervisor();

  SessionSupervisor(const SessionSupervisor&) = delete;
  SessionSupervisor& operator=(const SessionSupervisor&) = delete;

  void start();
  void stop();

  // Replies to `participant` with SessionWaiting or SessionPaired, or closes
  // it with an error. Returns true when the participant now belongs to `id`.
  bool join(const SessionId& id, const std::shared_ptr<Participant>& participant);

  void relay(const SessionId& id, const std::shared_ptr<Participant>& from, SignalMessage msg);
  void report_established(const SessionId& id, const std::shared_ptr<Participant>& from);

  // Called exactly once by a joined participant when its channel is gone.
  void leave(const SessionId& id, uint64_t participant_id);

  std::size_t sweep_now(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  SessionTable& table() { return table_; }
  const SessionTable& table() const { return table_; }

 private:
  void cancel_grace_timers();
  bool stopped();
  void schedule_sweep();
  void arm_closing_grace(const SessionId& id, uint64_t generation);
  void on_closing_grace_expired(const SessionId& id, uint64_t generation);

  boost::asio::io_context& io_;
  SessionTable table_;
  std::chrono::steady_clock::duration sweep_interval_;
  boost::asio::steady_timer sweep_timer_;

  std::mutex timers_mutex_;
  std::unordered_map<uint64_t, std::shared_ptr<boost::asio::steady_timer>> grace_timers_;
  bool stopped_ = false;
};

} // namespace pairlink
