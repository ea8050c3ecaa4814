#include "signaling/signaling_exchange.hpp"
#include "test_support.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;
using signaling::SignalingExchange;
using signaling::SignalingState;
using testing_support::CaptureLogger;
using testing_support::FakeBehaviour;
using testing_support::FakePeerConnection;

namespace {

core::SessionDescription Offer() {
  return {core::SdpType::offer, "v=0 remote-offer"};
}
core::SessionDescription Answer() {
  return {core::SdpType::answer, "v=0 remote-answer"};
}

} // namespace

TEST(SignalingExchange, OffererFlowReachesStable) {
  CaptureLogger log;
  FakePeerConnection pc;
  SignalingExchange ex(pc, log, 1s);

  auto offer = ex.CreateLocalDescription(core::SdpType::offer);
  ASSERT_TRUE(offer) << offer.error().message;
  EXPECT_EQ(offer->type, core::SdpType::offer);
  // Only the post-gathering description is handed out.
  EXPECT_NE(offer->sdp.find("end-of-candidates"), std::string::npos);
  EXPECT_EQ(ex.State(), SignalingState::have_local_offer);

  ASSERT_TRUE(ex.ApplyRemoteDescription(Answer()));
  EXPECT_EQ(ex.State(), SignalingState::stable);
  EXPECT_EQ(pc.Remote(), Answer());
  EXPECT_TRUE(log.Contains("Creating offer took"));
}

TEST(SignalingExchange, AnswererFlowReachesStable) {
  CaptureLogger log;
  FakePeerConnection pc;
  SignalingExchange ex(pc, log, 1s);

  ASSERT_TRUE(ex.ApplyRemoteDescription(Offer()));
  EXPECT_EQ(ex.State(), SignalingState::have_remote_offer);
  auto answer = ex.CreateLocalDescription(core::SdpType::answer);
  ASSERT_TRUE(answer) << answer.error().message;
  EXPECT_EQ(answer->type, core::SdpType::answer);
  EXPECT_EQ(ex.State(), SignalingState::stable);
}

TEST(SignalingExchange, AnswerBeforeRemoteOfferIsRejected) {
  CaptureLogger log;
  FakePeerConnection pc;
  SignalingExchange ex(pc, log, 1s);

  auto answer = ex.CreateLocalDescription(core::SdpType::answer);
  ASSERT_FALSE(answer);
  EXPECT_EQ(answer.error().kind, core::ErrorKind::negotiation);
  EXPECT_EQ(ex.State(), SignalingState::idle);
}

TEST(SignalingExchange, RemoteDescriptionAppliedTwiceIsRejected) {
  CaptureLogger log;
  FakePeerConnection pc;
  SignalingExchange ex(pc, log, 1s);

  ASSERT_TRUE(ex.ApplyRemoteDescription(Offer()));
  auto again = ex.ApplyRemoteDescription(Offer());
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().kind, core::ErrorKind::negotiation);
}

TEST(SignalingExchange, AnswerWithoutLocalOfferIsRejected) {
  CaptureLogger log;
  FakePeerConnection pc;
  SignalingExchange ex(pc, log, 1s);

  auto st = ex.ApplyRemoteDescription(Answer());
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error().kind, core::ErrorKind::negotiation);
  EXPECT_FALSE(pc.Remote());
}

TEST(SignalingExchange, GatheringTimeoutIsNegotiationError) {
  CaptureLogger log;
  FakePeerConnection pc(FakeBehaviour{.stall_gathering = true});
  SignalingExchange ex(pc, log, 50ms);

  const auto start = std::chrono::steady_clock::now();
  auto offer = ex.CreateLocalDescription(core::SdpType::offer);
  ASSERT_FALSE(offer);
  EXPECT_EQ(offer.error().kind, core::ErrorKind::negotiation);
  EXPECT_EQ(offer.error().message, "candidate gathering timed out");
  EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
  EXPECT_EQ(ex.State(), SignalingState::idle);
}

TEST(SignalingExchange, GatheringIsCancelledByStopToken) {
  CaptureLogger log;
  FakePeerConnection pc(FakeBehaviour{.stall_gathering = true});
  SignalingExchange ex(pc, log, 10s);

  std::stop_source stop;
  std::jthread canceller([&stop] {
    std::this_thread::sleep_for(30ms);
    stop.request_stop();
  });
  const auto start = std::chrono::steady_clock::now();
  auto offer = ex.CreateLocalDescription(core::SdpType::offer, stop.get_token());
  ASSERT_FALSE(offer);
  EXPECT_EQ(offer.error().message, "candidate gathering cancelled");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}
