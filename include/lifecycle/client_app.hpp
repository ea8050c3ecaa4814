#pragma once

#include "config/options.hpp"
#include "core/error.hpp"
#include "core/reactor.hpp"
#include "lifecycle/shutdown_signal.hpp"
#include "logging/logger.hpp"
#include "signaling/signaling_client.hpp"
#include "signaling/signaling_exchange.hpp"
#include "streaming/line_feed.hpp"
#include "streaming/line_processor.hpp"
#include "transport/ws_peer_connection.hpp"
#include "util/time.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <stop_token>
#include <unistd.h>
#include <variant>

namespace lifecycle {

// ClientApp: receiving side; owns exactly one session.
// Threading model:
// - Reactor threads run the transport (dialer, WebSocket read loop)
// - The main thread negotiates, then runs LineProcessor over the channel's
//   events until the stream ends
// - SIGINT/SIGTERM closes the peer connection, which closes the channel and
//   thereby ends the line stream
class ClientApp {
public:
  static constexpr int kReactorThreads = 2;

  ClientApp(config::ClientOptions options, logging::Logger &log,
            std::ostream &announce = std::cout)
      : options_(std::move(options)), log_(log), announce_(announce),
        shutdown_(reactor_.GetIoContext(), log_) {}

  ~ClientApp() { reactor_.Stop(); }

  ClientApp(const ClientApp &) = delete;
  ClientApp &operator=(const ClientApp &) = delete;

  // Returns the process exit code: 0 after a successful transfer.
  int Run() {
    reactor_.Start(kReactorThreads);
    auto result = RunSession();
    reactor_.Stop();
    if (!result) {
      log_.Error(kComponent, "Transfer failed: ", core::Describe(result.error()));
      return 1;
    }
    log_.Info(kComponent, "Client shutdown complete");
    return 0;
  }

  // Last transfer statistics, valid after Run().
  const streaming::TransferStats &Stats() const { return stats_; }

  void RequestShutdown() { shutdown_.Trigger(); }

private:
  static constexpr std::string_view kComponent = "client";

  core::Status RunSession() {
    transport::WsTransportConfig cfg;
    cfg.bind_address = options_.bind_address;
    transport::WsPeerConnectionFactory factory(reactor_.GetIoContext(), cfg,
                                               log_);
    auto created = factory.Create();
    if (!created) {
      return Fail("create peer connection", created.error());
    }
    std::shared_ptr<transport::PeerConnection> pc = std::move(*created);
    std::stop_callback close_on_shutdown(shutdown_.Token(), [pc] {
      pc->Close();
    });

    auto st = Negotiate(*pc);
    if (st) {
      announce_ << "CLIENT_PID=" << ::getpid() << std::endl;
      st = Receive(*pc);
    }
    pc->Close();
    return st;
  }

  core::Status Negotiate(transport::PeerConnection &pc) {
    signaling::SignalingExchange exchange(pc, log_, options_.gather_timeout);
    auto offer =
        exchange.CreateLocalDescription(core::SdpType::offer, shutdown_.Token());
    if (!offer) {
      return Fail("create offer", offer.error());
    }
    log_.Debug(kComponent, "Offer SDP: ", offer->sdp);

    signaling::SignalingClient client(log_);
    auto answer = client.Exchange(options_.server, *offer);
    if (!answer) {
      return Fail("exchange descriptions", answer.error());
    }
    log_.Debug(kComponent, "Answer SDP: ", answer->sdp);

    if (auto applied = exchange.ApplyRemoteDescription(*answer); !applied) {
      return Fail("set remote description", applied.error());
    }
    return {};
  }

  core::Status Receive(transport::PeerConnection &pc) {
    auto channel = AwaitChannel(pc);
    if (!channel) {
      return std::unexpected(channel.error());
    }
    log_.Info(kComponent, "New data channel ", (*channel)->Label());
    streaming::ChannelLineSource source(**channel);
    streaming::LineProcessor processor(log_);
    auto result = processor.Process(source, options_.output);
    stats_ = result.stats;
    if (result.error) {
      return std::unexpected(*result.error);
    }
    return {};
  }

  // Waits for the answerer's channel, bounded by open_timeout.
  core::Result<std::shared_ptr<transport::DataChannel>>
  AwaitChannel(transport::PeerConnection &pc) {
    const auto deadline =
        std::chrono::steady_clock::now() + options_.open_timeout;
    for (;;) {
      auto ev = pc.Events().ReceiveUntil(shutdown_.Token(), deadline);
      if (!ev) {
        if (shutdown_.Triggered() || pc.Events().IsClosed()) {
          return core::MakeError(core::ErrorKind::transport,
                                 "shut down before the data channel opened");
        }
        return core::MakeError(
            core::ErrorKind::transport,
            "data channel did not open within " +
                timeutil::FormatDuration(options_.open_timeout));
      }
      if (auto *announced = std::get_if<transport::DataChannelAnnounced>(&*ev)) {
        return announced->channel;
      }
      const auto &changed = std::get<transport::StateChanged>(*ev);
      if (changed.state == transport::ConnectionState::failed) {
        return core::MakeError(core::ErrorKind::transport,
                               "peer connection failed");
      }
    }
  }

  std::unexpected<core::Error> Fail(const char *step, const core::Error &e) {
    log_.Error(kComponent, "Failed to ", step, ": ", e.message);
    return std::unexpected(e);
  }

  config::ClientOptions options_;
  logging::Logger &log_;
  std::ostream &announce_;
  Reactor reactor_;
  ShutdownSignal shutdown_;
  streaming::TransferStats stats_;
};

} // namespace lifecycle
