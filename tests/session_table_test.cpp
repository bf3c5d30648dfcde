#include "src/pairlink/session_table.h"
#include "tests/fake_participant.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <variant>
#include <vector>

using namespace pairlink;
using pairlink::testing::make_fake;
using Clock = std::chrono::steady_clock;

namespace {

const SessionId kSession{0, 1};

void test_pairing_scenario() {
  SessionTable table;
  auto a = make_fake(1);
  auto b = make_fake(2);

  auto ra = table.register_participant(kSession, a);
  assert(ra.status == RegisterOutcome::Status::Waiting);
  assert(table.phase(kSession) == SessionPhase::Waiting);
  assert(table.participant_count(kSession) == 1);

  // Nobody to relay to yet.
  auto early = table.relay(kSession, 1, Offer{{1}});
  assert(early.status == RelayOutcome::Status::NoCounterpart);

  auto rb = table.register_participant(kSession, b);
  assert(rb.status == RegisterOutcome::Status::Paired);
  assert(rb.counterpart.lock() == a);
  assert(rb.flushed.empty());
  assert(rb.generation == ra.generation);
  assert(table.phase(kSession) == SessionPhase::Paired);
  assert(table.finish_pairing(kSession, rb.generation).empty());

  auto fwd = table.relay(kSession, 1, Offer{{0xAA}});
  assert(fwd.status == RelayOutcome::Status::Forward);
  assert(fwd.counterpart.lock() == b);
  auto back = table.relay(kSession, 2, Answer{{0xBB}});
  assert(back.status == RelayOutcome::Status::Forward);
  assert(back.counterpart.lock() == a);

  auto e1 = table.report_established(kSession, 1);
  assert(e1.status == EstablishedOutcome::Status::Recorded);
  assert(table.phase(kSession) == SessionPhase::Paired);
  // Repeating the report from the same side changes nothing.
  assert(table.report_established(kSession, 1).status == EstablishedOutcome::Status::Recorded);

  auto e2 = table.report_established(kSession, 2);
  assert(e2.status == EstablishedOutcome::Status::Closing);
  assert(e2.participants[0].lock() == a);
  assert(e2.participants[1].lock() == b);
  assert(table.phase(kSession) == SessionPhase::Closing);

  assert(table.relay(kSession, 1, Candidate{{1}}).status == RelayOutcome::Status::SessionClosing);
  assert(table.report_established(kSession, 2).status == EstablishedOutcome::Status::AlreadyClosing);

  assert(table.unregister(kSession, 1).status == LeaveOutcome::Status::ClosingHalf);
  assert(table.unregister(kSession, 2).status == LeaveOutcome::Status::Closed);
  assert(table.phase(kSession) == SessionPhase::Empty);
  assert(table.size() == 0);
}

void test_third_participant_rejected() {
  SessionTable table;
  auto a = make_fake(1);
  auto b = make_fake(2);
  auto c = make_fake(3);
  table.register_participant(kSession, a);
  table.register_participant(kSession, b);
  auto rc = table.register_participant(kSession, c);
  assert(rc.status == RegisterOutcome::Status::SessionFull);
  assert(table.participant_count(kSession) == 2);
  assert(table.relay(kSession, 3, Offer{}).status == RelayOutcome::Status::NotAParticipant);
  assert(table.report_established(kSession, 3).status == EstablishedOutcome::Status::NotAParticipant);
  assert(table.unregister(kSession, 3).status == LeaveOutcome::Status::NotAParticipant);

  assert(table.register_participant(kSession, a).status == RegisterOutcome::Status::AlreadyRegistered);
}

void test_unknown_session() {
  SessionTable table;
  const SessionId other{9, 9};
  assert(table.relay(other, 1, Offer{}).status == RelayOutcome::Status::UnknownSession);
  assert(table.report_established(other, 1).status == EstablishedOutcome::Status::UnknownSession);
  assert(table.unregister(other, 1).status == LeaveOutcome::Status::UnknownSession);
  assert(!table.teardown(other).removed);
}

void test_pending_buffer() {
  SessionTableOptions options;
  options.max_pending_messages = 2;
  SessionTable table(options);
  auto a = make_fake(1);
  auto b = make_fake(2);

  table.register_participant(kSession, a);
  assert(table.relay(kSession, 1, Offer{{1}}).status == RelayOutcome::Status::Buffered);
  assert(table.relay(kSession, 1, Candidate{{2}}).status == RelayOutcome::Status::Buffered);
  assert(table.relay(kSession, 1, Candidate{{3}}).status == RelayOutcome::Status::BufferFull);

  auto rb = table.register_participant(kSession, b);
  assert(rb.status == RegisterOutcome::Status::Paired);
  assert(rb.flushed.size() == 2);
  assert(std::holds_alternative<Offer>(rb.flushed[0]));
  assert(std::get<Candidate>(rb.flushed[1]).payload == Bytes{2});

  // Abandoning a waiting session reports the buffered messages it drops.
  const SessionId second{0, 2};
  table.register_participant(second, make_fake(5));
  table.relay(second, 5, Offer{{1}});
  auto left = table.unregister(second, 5);
  assert(left.status == LeaveOutcome::Status::Removed);
  assert(left.dropped_messages == 1);
}

void test_relay_during_pairing_handoff() {
  SessionTableOptions options;
  options.max_pending_messages = 1;
  SessionTable table(options);
  auto a = make_fake(1);
  auto b = make_fake(2);

  table.register_participant(kSession, a);
  assert(table.relay(kSession, 1, Candidate{{1}}).status == RelayOutcome::Status::Buffered);
  const auto rb = table.register_participant(kSession, b);
  assert(rb.flushed.size() == 1);

  // Until the newcomer has been handed its backlog, relays to it queue up,
  // regardless of the pre-pairing bound.
  assert(table.relay(kSession, 1, Candidate{{2}}).status == RelayOutcome::Status::Buffered);
  assert(table.relay(kSession, 1, Candidate{{3}}).status == RelayOutcome::Status::Buffered);
  // The newcomer's own messages go straight through.
  assert(table.relay(kSession, 2, Answer{{4}}).status == RelayOutcome::Status::Forward);

  // A stale generation neither drains the queue nor ends the hand-off.
  assert(table.finish_pairing(kSession, rb.generation + 1000).empty());
  const auto late = table.finish_pairing(kSession, rb.generation);
  assert(late.size() == 2);
  assert(std::get<Candidate>(late[0]).payload == Bytes{2});
  assert(std::get<Candidate>(late[1]).payload == Bytes{3});

  assert(table.relay(kSession, 1, Candidate{{5}}).status == RelayOutcome::Status::Buffered);
  assert(table.finish_pairing(kSession, rb.generation).size() == 1);
  assert(table.finish_pairing(kSession, rb.generation).empty());

  const auto fwd = table.relay(kSession, 1, Candidate{{6}});
  assert(fwd.status == RelayOutcome::Status::Forward);
  assert(fwd.counterpart.lock() == b);
}

void test_established_requires_counterpart() {
  SessionTable table;
  auto a = make_fake(1);
  table.register_participant(kSession, a);
  assert(table.report_established(kSession, 1).status == EstablishedOutcome::Status::NoCounterpart);
  assert(table.phase(kSession) == SessionPhase::Waiting);
}

void test_abandon_paired() {
  SessionTable table;
  auto a = make_fake(1);
  auto b = make_fake(2);
  table.register_participant(kSession, a);
  table.register_participant(kSession, b);
  auto out = table.unregister(kSession, 2);
  assert(out.status == LeaveOutcome::Status::Abandoned);
  assert(out.counterpart.lock() == a);
  assert(table.phase(kSession) == SessionPhase::Empty);
}

void test_id_reuse() {
  SessionTable table;
  auto a = make_fake(1);
  auto b = make_fake(2);
  const auto first = table.register_participant(kSession, a);
  table.register_participant(kSession, b);
  table.report_established(kSession, 1);
  table.report_established(kSession, 2);

  // Still closing: the id is not free yet.
  assert(table.register_participant(kSession, make_fake(3)).status == RegisterOutcome::Status::SessionFull);

  table.unregister(kSession, 1);
  table.unregister(kSession, 2);

  auto again = table.register_participant(kSession, make_fake(4));
  assert(again.status == RegisterOutcome::Status::Waiting);
  assert(again.generation != first.generation);

  // A stale teardown for the old incarnation leaves the new one alone.
  assert(!table.teardown(kSession, first.generation).removed);
  assert(table.phase(kSession) == SessionPhase::Waiting);
  auto torn = table.teardown(kSession, again.generation);
  assert(torn.removed);
  assert(torn.phase == SessionPhase::Waiting);
  assert(torn.remaining.size() == 1);
}

void test_teardown_skips_closed_side() {
  SessionTable table;
  auto a = make_fake(1);
  auto b = make_fake(2);
  table.register_participant(kSession, a);
  table.register_participant(kSession, b);
  table.report_established(kSession, 2);
  table.report_established(kSession, 1);
  table.unregister(kSession, 1);

  auto out = table.teardown(kSession);
  assert(out.removed);
  assert(out.phase == SessionPhase::Closing);
  assert(out.remaining.size() == 1);
  assert(out.remaining[0].lock() == b);
}

void test_sweep() {
  SessionTableOptions options;
  options.waiting_timeout = std::chrono::seconds(10);
  options.idle_timeout = std::chrono::seconds(20);
  options.closing_grace = std::chrono::seconds(5);
  SessionTable table(options);

  const SessionId waiting{1, 0};
  const SessionId paired{2, 0};
  const SessionId closing{3, 0};
  auto w = make_fake(1);
  auto p1 = make_fake(2);
  auto p2 = make_fake(3);
  auto c1 = make_fake(4);
  auto c2 = make_fake(5);
  table.register_participant(waiting, w);
  table.register_participant(paired, p1);
  table.register_participant(paired, p2);
  table.register_participant(closing, c1);
  table.register_participant(closing, c2);
  table.report_established(closing, 4);
  table.report_established(closing, 5);

  const auto now = Clock::now();
  assert(table.sweep(now).empty());
  assert(table.size() == 3);

  auto closing_only = table.sweep(now + std::chrono::seconds(6));
  assert(closing_only.size() == 1);
  assert(closing_only[0].session_id == closing);
  assert(closing_only[0].reason == SweepAction::Reason::ClosingExpired);
  assert(closing_only[0].participants.size() == 2);

  auto waiting_only = table.sweep(now + std::chrono::seconds(11));
  assert(waiting_only.size() == 1);
  assert(waiting_only[0].reason == SweepAction::Reason::WaitingExpired);

  auto idle = table.sweep(now + std::chrono::seconds(21));
  assert(idle.size() == 1);
  assert(idle[0].reason == SweepAction::Reason::IdleExpired);
  assert(idle[0].participants.size() == 2);
  assert(table.size() == 0);
}

void test_concurrent_pairing() {
  SessionTableOptions options;
  options.stripes = 4;
  SessionTable table(options);
  constexpr int kSessions = 200;

  std::vector<std::shared_ptr<testing::FakeParticipant>> keep;
  for (int i = 0; i < kSessions * 2; ++i) keep.push_back(make_fake(static_cast<uint64_t>(i + 1)));

  auto worker = [&](int side) {
    for (int i = 0; i < kSessions; ++i) {
      const SessionId id{static_cast<uint64_t>(i), 42};
      const auto out = table.register_participant(id, keep[static_cast<std::size_t>(i * 2 + side)]);
      assert(out.status == RegisterOutcome::Status::Waiting || out.status == RegisterOutcome::Status::Paired);
    }
  };
  std::thread t1(worker, 0);
  std::thread t2(worker, 1);
  t1.join();
  t2.join();

  assert(table.size() == kSessions);
  for (int i = 0; i < kSessions; ++i) {
    const SessionId id{static_cast<uint64_t>(i), 42};
    assert(table.phase(id) == SessionPhase::Paired);
    assert(table.participant_count(id) == 2);
  }
}

void test_crowded_session_id() {
  SessionTableOptions options;
  options.stripes = 2;
  SessionTable table(options);
  constexpr int kThreads = 6;
  constexpr int kSessions = 100;

  std::vector<std::shared_ptr<testing::FakeParticipant>> keep;
  for (int i = 0; i < kThreads * kSessions; ++i) keep.push_back(make_fake(static_cast<uint64_t>(i + 1)));

  std::atomic<int> admitted{0};
  std::atomic<int> rejected{0};
  auto worker = [&](int t) {
    for (int i = 0; i < kSessions; ++i) {
      const SessionId id{static_cast<uint64_t>(i), 7};
      const auto out = table.register_participant(id, keep[static_cast<std::size_t>(i * kThreads + t)]);
      if (out.status == RegisterOutcome::Status::SessionFull) {
        ++rejected;
      } else {
        assert(out.status == RegisterOutcome::Status::Waiting || out.status == RegisterOutcome::Status::Paired);
        ++admitted;
      }
      assert(table.participant_count(id) <= 2);
    }
  };
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) threads.emplace_back(worker, t);
  for (auto& t : threads) t.join();

  assert(admitted.load() == 2 * kSessions);
  assert(rejected.load() == (kThreads - 2) * kSessions);
  for (int i = 0; i < kSessions; ++i) {
    const SessionId id{static_cast<uint64_t>(i), 7};
    assert(table.participant_count(id) == 2);
    assert(table.phase(id) == SessionPhase::Paired);
  }
}

} // namespace

int main() {
  test_pairing_scenario();
  test_third_participant_rejected();
  test_unknown_session();
  test_pending_buffer();
  test_relay_during_pairing_handoff();
  test_established_requires_counterpart();
  test_abandon_paired();
  test_id_reuse();
  test_teardown_skips_closed_side();
  test_sweep();
  test_concurrent_pairing();
  test_crowded_session_id();
  return 0;
}
