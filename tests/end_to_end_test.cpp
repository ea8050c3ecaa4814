#include "config/options.hpp"
#include "core/reactor.hpp"
#include "lifecycle/client_app.hpp"
#include "lifecycle/server_app.hpp"
#include "signaling/signaling_client.hpp"
#include "signaling/signaling_exchange.hpp"
#include "signaling/signaling_server.hpp"
#include "streaming/line_feed.hpp"
#include "streaming/line_processor.hpp"
#include "test_support.hpp"
#include "transport/session_body.hpp"
#include "transport/ws_peer_connection.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using testing_support::CaptureLogger;
using testing_support::TempDir;

namespace {

transport::WsTransportConfig LoopbackConfig() {
  transport::WsTransportConfig cfg;
  cfg.bind_address = "127.0.0.1";
  cfg.handshake_timeout = 2000ms;
  return cfg;
}

// Offer/answer between two WsPeerConnections in one process.
struct LoopbackPair {
  explicit LoopbackPair(logging::Logger &log)
      : factory(reactor.GetIoContext(), LoopbackConfig(), log) {
    reactor.Start(2);
  }
  ~LoopbackPair() {
    if (offerer) {
      offerer->Close();
    }
    if (answerer) {
      answerer->Close();
    }
    reactor.Stop();
  }

  Reactor reactor;
  transport::WsPeerConnectionFactory factory;
  std::shared_ptr<transport::PeerConnection> offerer;
  std::shared_ptr<transport::PeerConnection> answerer;
};

std::shared_ptr<transport::DataChannel>
AwaitAnnounced(transport::PeerConnection &pc) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (auto ev = pc.Events().ReceiveUntil({}, deadline)) {
    if (auto *a = std::get_if<transport::DataChannelAnnounced>(&*ev)) {
      return a->channel;
    }
  }
  return nullptr;
}

bool AwaitOpened(transport::DataChannel &channel) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (auto ev = channel.Events().ReceiveUntil({}, deadline)) {
    if (std::holds_alternative<transport::Opened>(*ev)) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST(WsTransport, DeliversMessagesInOrderAndClosesCleanly) {
  CaptureLogger log;
  LoopbackPair pair(log);
  pair.offerer = *pair.factory.Create();
  pair.answerer = *pair.factory.Create();

  signaling::SignalingExchange offer_side(*pair.offerer, log, 5s);
  signaling::SignalingExchange answer_side(*pair.answerer, log, 5s);

  auto offer = offer_side.CreateLocalDescription(core::SdpType::offer);
  ASSERT_TRUE(offer) << offer.error().message;
  ASSERT_TRUE(answer_side.ApplyRemoteDescription(*offer));
  auto sender = pair.answerer->CreateDataChannel("fileStream");
  ASSERT_TRUE(sender);
  auto answer = answer_side.CreateLocalDescription(core::SdpType::answer);
  ASSERT_TRUE(answer) << answer.error().message;

  auto body = transport::DecodeBody(answer->sdp);
  ASSERT_TRUE(body);
  EXPECT_TRUE(body->end_of_candidates);
  ASSERT_FALSE(body->candidates.empty());
  EXPECT_EQ(body->candidates.front().address, "127.0.0.1");
  EXPECT_EQ(body->label, "fileStream");

  ASSERT_TRUE(offer_side.ApplyRemoteDescription(*answer));
  auto receiver = AwaitAnnounced(*pair.offerer);
  ASSERT_TRUE(receiver);
  EXPECT_EQ(receiver->Label(), "fileStream");
  ASSERT_TRUE(AwaitOpened(**sender));

  for (int i = 1; i <= 50; ++i) {
    ASSERT_TRUE((*sender)->SendText("line " + std::to_string(i)));
  }
  (*sender)->Close();

  streaming::ChannelLineSource source(*receiver);
  testing_support::MemorySink sink;
  auto result = streaming::LineProcessor(log).Process(source, sink);
  EXPECT_TRUE(result.Ok()) << result.error->message;
  EXPECT_EQ(result.stats.lines, 50u);
  EXPECT_EQ(sink.content.substr(0, 14), "line 1\nline 2\n");

  auto after = (*sender)->SendText("too late");
  ASSERT_FALSE(after);
  EXPECT_EQ(after.error().kind, core::ErrorKind::transport);
}

TEST(WsTransport, RejectsUpgradeWithoutSessionUfrags) {
  CaptureLogger log;
  LoopbackPair pair(log);
  pair.answerer = *pair.factory.Create();
  auto offerer = *pair.factory.Create();
  pair.offerer = offerer;

  signaling::SignalingExchange offer_side(*offerer, log, 5s);
  signaling::SignalingExchange answer_side(*pair.answerer, log, 5s);
  auto offer = offer_side.CreateLocalDescription(core::SdpType::offer);
  ASSERT_TRUE(offer);
  ASSERT_TRUE(answer_side.ApplyRemoteDescription(*offer));
  ASSERT_TRUE(pair.answerer->CreateDataChannel("fileStream"));
  auto answer = answer_side.CreateLocalDescription(core::SdpType::answer);
  ASSERT_TRUE(answer);
  auto body = transport::DecodeBody(answer->sdp);
  ASSERT_TRUE(body && !body->candidates.empty());

  namespace beast = boost::beast;
  net::io_context ioc;
  beast::websocket::stream<beast::tcp_stream> ws(ioc);
  const auto &c = body->candidates.front();
  beast::get_lowest_layer(ws).connect(
      net::ip::tcp::endpoint(net::ip::make_address(c.address), c.port));
  beast::error_code ec;
  ws.handshake(c.address, "/not/this-session", ec);
  EXPECT_TRUE(ec);
  EXPECT_TRUE(log.Contains("Rejected connection"));
}

TEST(WsTransport, ClosingDuringDialLeavesNoChannelOpen) {
  CaptureLogger log;
  LoopbackPair pair(log);
  pair.offerer = *pair.factory.Create();
  pair.answerer = *pair.factory.Create();

  signaling::SignalingExchange offer_side(*pair.offerer, log, 5s);
  signaling::SignalingExchange answer_side(*pair.answerer, log, 5s);
  auto offer = offer_side.CreateLocalDescription(core::SdpType::offer);
  ASSERT_TRUE(offer);
  ASSERT_TRUE(answer_side.ApplyRemoteDescription(*offer));
  auto sender = pair.answerer->CreateDataChannel("fileStream");
  ASSERT_TRUE(sender);
  auto answer = answer_side.CreateLocalDescription(core::SdpType::answer);
  ASSERT_TRUE(answer);

  ASSERT_TRUE(offer_side.ApplyRemoteDescription(*answer));
  pair.offerer->Close();
  EXPECT_EQ(AwaitAnnounced(*pair.offerer), nullptr);

  // The answering side either never opens or sees the socket go away.
  bool closed = false;
  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (auto ev = (*sender)->Events().ReceiveUntil({}, deadline)) {
    if (std::holds_alternative<transport::Closed>(*ev)) {
      closed = true;
      break;
    }
  }
  if (!closed) {
    EXPECT_FALSE((*sender)->IsOpen());
  }
}

TEST(SignalingServer, RefusesKeepAliveRequestAfterStop) {
  namespace beast = boost::beast;
  namespace http = beast::http;
  CaptureLogger log;
  Reactor reactor;
  reactor.Start(1);
  testing_support::FakeFactory factory;
  signaling::OfferHandler handler(
      factory,
      [](std::shared_ptr<transport::PeerConnection>,
         std::shared_ptr<transport::DataChannel>) {},
      {}, log);
  signaling::SignalingServer server(reactor.GetIoContext(), handler, log);
  ASSERT_TRUE(server.Listen(
      net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)));

  net::io_context ioc;
  beast::tcp_stream stream(ioc);
  stream.connect(server.LocalEndpoint());
  http::request<http::string_body> req{http::verb::get, "/offer", 11};
  req.set(http::field::host, "127.0.0.1");
  req.keep_alive(true);
  beast::flat_buffer buffer;

  http::write(stream, req);
  http::response<http::string_body> first;
  http::read(stream, buffer, first);
  EXPECT_EQ(first.result(), http::status::method_not_allowed);
  EXPECT_TRUE(first.keep_alive());

  server.Stop();
  http::write(stream, req);
  http::response<http::string_body> second;
  http::read(stream, buffer, second);
  EXPECT_EQ(second.result(), http::status::service_unavailable);
  EXPECT_FALSE(second.keep_alive());

  reactor.Stop();
}

class EndToEndTest : public ::testing::Test {
protected:
  config::ServerOptions ServerOpts(const std::string &file,
                                   std::chrono::milliseconds delay) {
    config::ServerOptions opt;
    opt.addr = "127.0.0.1:0";
    opt.file = file;
    opt.delay = delay;
    opt.gather_timeout = 5s;
    opt.open_timeout = 5s;
    opt.bind_address = "127.0.0.1";
    return opt;
  }

  config::ClientOptions ClientOpts(const lifecycle::ServerApp &server,
                                   const std::string &output) {
    config::ClientOptions opt;
    opt.server = "http://127.0.0.1:" +
                 std::to_string(server.LocalEndpoint().port()) + "/offer";
    opt.output = output;
    opt.gather_timeout = 5s;
    opt.open_timeout = 5s;
    opt.bind_address = "127.0.0.1";
    return opt;
  }

  TempDir dir_;
  CaptureLogger server_log_;
  CaptureLogger client_log_;
  std::ostringstream announcements_;
};

TEST_F(EndToEndTest, TransfersFileThroughSignalingServer) {
  std::string content;
  for (int i = 1; i <= 20; ++i) {
    content += "Line " + std::to_string(i) + "\n";
  }
  auto input = dir_.Write("sample.txt", content);
  auto output = dir_.File("received.txt");

  lifecycle::ServerApp server(ServerOpts(input, 5ms), server_log_,
                              announcements_);
  ASSERT_TRUE(server.Start());
  EXPECT_NE(server.LocalEndpoint().port(), 0);

  const auto start = std::chrono::steady_clock::now();
  lifecycle::ClientApp client(ClientOpts(server, output), client_log_,
                              announcements_);
  EXPECT_EQ(client.Run(), 0);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 19 * 5ms);

  EXPECT_EQ(testing_support::ReadFile(output), content);
  EXPECT_EQ(client.Stats().lines, 20u);
  EXPECT_TRUE(client_log_.Contains("Received 20 lines in"));

  server.RequestShutdown();
  EXPECT_EQ(server.Shutdown(), 0);
  EXPECT_EQ(server.GetRegistry().Active(), 0u);
  EXPECT_EQ(server.GetLifecycle().Current(), lifecycle::Phase::closed);
  EXPECT_TRUE(server_log_.Contains("Finished streaming file, sent 20 lines"));

  const std::string printed = announcements_.str();
  EXPECT_NE(printed.find("SERVER_PID="), std::string::npos);
  EXPECT_NE(printed.find("CLIENT_PID="), std::string::npos);
}

TEST_F(EndToEndTest, ServerShutdownLetsInFlightStreamFinish) {
  std::string content;
  for (int i = 1; i <= 30; ++i) {
    content += "Line " + std::to_string(i) + "\n";
  }
  auto input = dir_.Write("sample.txt", content);
  auto output = dir_.File("received.txt");

  lifecycle::ServerApp server(ServerOpts(input, 20ms), server_log_,
                              announcements_);
  ASSERT_TRUE(server.Start());
  lifecycle::ClientApp client(ClientOpts(server, output), client_log_,
                              announcements_);
  int rc = -1;
  std::jthread receiver([&] { rc = client.Run(); });

  for (int i = 0; i < 1000 &&
                  server.GetLifecycle().Current() != lifecycle::Phase::streaming;
       ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(server.GetLifecycle().Current(), lifecycle::Phase::streaming);

  const auto asked = std::chrono::steady_clock::now();
  server.RequestShutdown();
  EXPECT_EQ(server.Shutdown(), 0);
  receiver.join();
  EXPECT_LT(std::chrono::steady_clock::now() - asked, 10s);

  EXPECT_EQ(rc, 0);
  EXPECT_EQ(client.Stats().lines, 30u);
  EXPECT_EQ(testing_support::ReadFile(output), content);
  EXPECT_TRUE(server_log_.Contains("Finished streaming file, sent 30 lines"));
  EXPECT_FALSE(server_log_.Contains("did not close within"));
  EXPECT_FALSE(client_log_.Contains("Transfer failed"));
}

TEST_F(EndToEndTest, ClientShutdownEndsTransferEarly) {
  std::string content;
  for (int i = 1; i <= 40; ++i) {
    content += "Line " + std::to_string(i) + "\n";
  }
  auto input = dir_.Write("sample.txt", content);
  auto output = dir_.File("received.txt");

  lifecycle::ServerApp server(ServerOpts(input, 25ms), server_log_,
                              announcements_);
  ASSERT_TRUE(server.Start());
  lifecycle::ClientApp client(ClientOpts(server, output), client_log_,
                              announcements_);
  int rc = -1;
  std::jthread receiver([&] { rc = client.Run(); });

  for (int i = 0; i < 1000 && !client_log_.Contains("Received line 5:"); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  const auto asked = std::chrono::steady_clock::now();
  client.RequestShutdown();
  receiver.join();
  EXPECT_LT(std::chrono::steady_clock::now() - asked, 3s);

  // Closing the connection ends the line stream like a normal close.
  EXPECT_EQ(rc, 0);
  EXPECT_GE(client.Stats().lines, 5u);
  EXPECT_LT(client.Stats().lines, 40u);
  const std::string received = testing_support::ReadFile(output);
  ASSERT_LE(received.size(), content.size());
  EXPECT_EQ(content.compare(0, received.size(), received), 0);

  EXPECT_EQ(server.Shutdown(), 0);
}

TEST_F(EndToEndTest, MissingFileFailsStartup) {
  lifecycle::ServerApp server(ServerOpts(dir_.File("absent.txt"), 0ms),
                              server_log_, announcements_);
  auto st = server.Start();
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error().kind, core::ErrorKind::io);
  EXPECT_EQ(server.Shutdown(), 1);
  EXPECT_EQ(announcements_.str().find("SERVER_PID="), std::string::npos);
}

TEST_F(EndToEndTest, SignalingErrorsReachTheClient) {
  auto input = dir_.Write("sample.txt", "x\n");
  lifecycle::ServerApp server(ServerOpts(input, 0ms), server_log_,
                              announcements_);
  ASSERT_TRUE(server.Start());
  const std::string url = "http://127.0.0.1:" +
                          std::to_string(server.LocalEndpoint().port()) +
                          "/offer";
  signaling::SignalingClient client(client_log_);

  // Not a transport body: the answering side cannot apply it.
  auto bogus = client.Exchange(url, {core::SdpType::offer, "hello"});
  ASSERT_FALSE(bogus);
  EXPECT_EQ(bogus.error().kind, core::ErrorKind::negotiation);
  EXPECT_NE(bogus.error().message.find("500"), std::string::npos);
  EXPECT_NE(bogus.error().message.find("Failed to set remote description"),
            std::string::npos);

  auto wrong_path = client.Exchange(
      "http://127.0.0.1:" + std::to_string(server.LocalEndpoint().port()) +
          "/other",
      {core::SdpType::offer, "v=0"});
  ASSERT_FALSE(wrong_path);
  EXPECT_NE(wrong_path.error().message.find("404"), std::string::npos);

  EXPECT_EQ(server.Shutdown(), 0);
}

TEST_F(EndToEndTest, ClientFailsWhenNobodyListens) {
  config::ClientOptions opt;
  opt.server = "http://127.0.0.1:1/offer";
  opt.output = dir_.File("out.txt");
  opt.gather_timeout = 5s;
  opt.open_timeout = 1s;
  opt.bind_address = "127.0.0.1";
  lifecycle::ClientApp client(opt, client_log_, announcements_);
  EXPECT_EQ(client.Run(), 1);
  EXPECT_TRUE(client_log_.Contains("Failed to exchange descriptions"));
  EXPECT_EQ(announcements_.str().find("CLIENT_PID="), std::string::npos);
}
