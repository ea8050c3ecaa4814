#include "lifecycle/lifecycle.hpp"
#include "lifecycle/session_registry.hpp"
#include "lifecycle/session_supervisor.hpp"
#include "test_support.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace std::chrono_literals;
using lifecycle::Lifecycle;
using lifecycle::Phase;
using lifecycle::SessionRegistry;
using lifecycle::SessionSupervisor;
using testing_support::CaptureLogger;
using testing_support::FakePeerConnection;
using testing_support::TempDir;

TEST(SessionRegistry, LeaseRegistersForItsScope) {
  SessionRegistry registry;
  {
    SessionRegistry::Lease a(registry, "a");
    SessionRegistry::Lease b(registry, "b");
    EXPECT_EQ(registry.Active(), 2u);
    EXPECT_NE(a.GetId(), b.GetId());
  }
  EXPECT_EQ(registry.Active(), 0u);
  EXPECT_TRUE(registry.AwaitEmptyFor(0ms));
}

TEST(SessionRegistry, AwaitEmptyBlocksUntilLastSessionEnds) {
  SessionRegistry registry;
  auto id = registry.Register("slow");
  EXPECT_FALSE(registry.AwaitEmptyFor(10ms));

  std::jthread finisher([&] {
    std::this_thread::sleep_for(20ms);
    registry.Unregister(id);
  });
  const auto start = std::chrono::steady_clock::now();
  registry.AwaitEmpty();
  EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
  EXPECT_EQ(registry.Active(), 0u);
}

TEST(SessionRegistry, UnknownIdIsIgnored) {
  SessionRegistry registry;
  registry.Register("x");
  registry.Unregister(999);
  EXPECT_EQ(registry.Active(), 1u);
  EXPECT_EQ(registry.Names(), (std::vector<std::string>{"x"}));
}

TEST(Lifecycle, FollowsThePhaseOrder) {
  CaptureLogger log;
  Lifecycle lc(log);
  EXPECT_TRUE(lc.Advance(Phase::signaling_up));
  EXPECT_TRUE(lc.Advance(Phase::streaming));
  EXPECT_TRUE(lc.Advance(Phase::draining));
  EXPECT_TRUE(lc.Advance(Phase::closed));
  EXPECT_EQ(lc.Current(), Phase::closed);
  EXPECT_EQ(lc.ExitCode(), 0);
}

TEST(Lifecycle, DrainsWithoutEverStreaming) {
  CaptureLogger log;
  Lifecycle lc(log);
  ASSERT_TRUE(lc.Advance(Phase::signaling_up));
  EXPECT_TRUE(lc.Advance(Phase::draining));
}

TEST(Lifecycle, RejectsSkippingPhases) {
  CaptureLogger log;
  Lifecycle lc(log);
  EXPECT_FALSE(lc.Advance(Phase::streaming));
  ASSERT_TRUE(lc.Advance(Phase::signaling_up));
  EXPECT_FALSE(lc.Advance(Phase::closed));
  EXPECT_FALSE(lc.Advance(Phase::idle));
  EXPECT_EQ(lc.Current(), Phase::signaling_up);
}

TEST(Lifecycle, FatalErrorSetsExitCode) {
  CaptureLogger log;
  Lifecycle lc(log);
  lc.ReportFatal(core::Error{core::ErrorKind::transport, "accept failed"});
  lc.ReportFatal(core::Error{core::ErrorKind::io, "second"});
  EXPECT_EQ(lc.ExitCode(), 1);
  ASSERT_TRUE(lc.Fatal());
  EXPECT_EQ(lc.Fatal()->message, "accept failed");
}

namespace {

struct Negotiated {
  std::shared_ptr<FakePeerConnection> pc;
  std::shared_ptr<testing_support::FakeDataChannel> channel;
};

Negotiated MakeSession() {
  Negotiated n;
  n.pc = std::make_shared<FakePeerConnection>();
  EXPECT_TRUE(n.pc->CreateDataChannel("fileStream"));
  n.channel = n.pc->Channel();
  return n;
}

} // namespace

TEST(SessionSupervisor, StreamsOnceChannelOpens) {
  TempDir dir;
  auto path = dir.Write("sample.txt", "a\nb\n");
  CaptureLogger log;
  SessionRegistry registry;
  int streaming_calls = 0;
  SessionSupervisor supervisor({path, 0ms, 5s}, registry, log,
                               [&] { ++streaming_calls; });

  auto s = MakeSession();
  supervisor.Adopt(s.pc, s.channel);
  s.channel->Open();

  for (int i = 0; i < 200 && !s.pc->WasClosed(); ++i) {
    std::this_thread::sleep_for(5ms);
  }
  supervisor.Drain();
  EXPECT_EQ(s.channel->Sent(), (std::vector<std::string>{"a", "b"}));
  EXPECT_TRUE(s.pc->WasClosed());
  EXPECT_EQ(registry.Active(), 0u);
  EXPECT_EQ(streaming_calls, 1);
  EXPECT_EQ(supervisor.Adopted(), 1u);
}

TEST(SessionSupervisor, DrainCancelsSessionsThatNeverOpened) {
  TempDir dir;
  auto path = dir.Write("sample.txt", "a\n");
  CaptureLogger log;
  SessionRegistry registry;
  SessionSupervisor supervisor({path, 0ms, 30s}, registry, log);

  auto s = MakeSession();
  supervisor.Adopt(s.pc, s.channel);
  const auto start = std::chrono::steady_clock::now();
  supervisor.Drain();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_TRUE(s.pc->WasClosed());
  EXPECT_TRUE(s.channel->Sent().empty());
}

TEST(SessionSupervisor, OpenTimeoutClosesConnection) {
  TempDir dir;
  auto path = dir.Write("sample.txt", "a\n");
  CaptureLogger log;
  SessionRegistry registry;
  SessionSupervisor supervisor({path, 0ms, 20ms}, registry, log);

  auto s = MakeSession();
  supervisor.Adopt(s.pc, s.channel);
  for (int i = 0; i < 200 && !s.pc->WasClosed(); ++i) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_TRUE(s.pc->WasClosed());
  EXPECT_TRUE(log.Contains("did not open within"));
}

TEST(SessionSupervisor, AdoptAfterDrainClosesImmediately) {
  CaptureLogger log;
  SessionRegistry registry;
  SessionSupervisor supervisor({"unused", 0ms, 1s}, registry, log);
  supervisor.Drain();

  auto s = MakeSession();
  supervisor.Adopt(s.pc, s.channel);
  EXPECT_TRUE(s.pc->WasClosed());
}

TEST(SessionSupervisor, DrainWaitsForInFlightStream) {
  TempDir dir;
  auto path = dir.Write("sample.txt", "1\n2\n3\n4\n5\n");
  CaptureLogger log;
  SessionRegistry registry;
  SessionSupervisor supervisor({path, 20ms, 5s}, registry, log);

  auto s = MakeSession();
  supervisor.Adopt(s.pc, s.channel);
  s.channel->Open();
  for (int i = 0; i < 200 && registry.Active() == 0; ++i) {
    std::this_thread::sleep_for(1ms);
  }
  supervisor.Drain();
  // Shutdown does not preempt a running stream.
  EXPECT_EQ(s.channel->Sent().size(), 5u);
  EXPECT_EQ(registry.Active(), 0u);
}

TEST(SessionSupervisor, HoldsLeaseUntilChannelReportsClosed) {
  TempDir dir;
  auto path = dir.Write("sample.txt", "a\n");
  CaptureLogger log;
  SessionRegistry registry;
  SessionSupervisor supervisor({path, 0ms, 5s, 5s}, registry, log);

  auto s = MakeSession();
  s.channel->DeferCloseEvent();
  supervisor.Adopt(s.pc, s.channel);
  s.channel->Open();
  for (int i = 0; i < 200 && !s.channel->WasClosed(); ++i) {
    std::this_thread::sleep_for(5ms);
  }
  ASSERT_TRUE(s.channel->WasClosed());
  std::this_thread::sleep_for(20ms);
  // Close requested but not yet confirmed by the transport.
  EXPECT_EQ(registry.Active(), 1u);
  EXPECT_FALSE(s.pc->WasClosed());

  s.channel->FinishClose();
  supervisor.Drain();
  EXPECT_EQ(registry.Active(), 0u);
  EXPECT_TRUE(s.pc->WasClosed());
  EXPECT_FALSE(log.Contains("did not close within"));
}

TEST(SessionSupervisor, StopsWaitingForCloseAfterTimeout) {
  TempDir dir;
  auto path = dir.Write("sample.txt", "a\n");
  CaptureLogger log;
  SessionRegistry registry;
  SessionSupervisor supervisor({path, 0ms, 5s, 30ms}, registry, log);

  auto s = MakeSession();
  s.channel->DeferCloseEvent();
  supervisor.Adopt(s.pc, s.channel);
  s.channel->Open();
  for (int i = 0; i < 200 && registry.Active() == 0 && !s.pc->WasClosed();
       ++i) {
    std::this_thread::sleep_for(1ms);
  }
  supervisor.Drain();
  EXPECT_EQ(registry.Active(), 0u);
  EXPECT_TRUE(s.pc->WasClosed());
  EXPECT_TRUE(log.Contains("did not close within"));
}
