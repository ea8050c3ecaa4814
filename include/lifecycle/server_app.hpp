#pragma once

#include "config/options.hpp"
#include "core/error.hpp"
#include "core/reactor.hpp"
#include "lifecycle/lifecycle.hpp"
#include "lifecycle/session_registry.hpp"
#include "lifecycle/session_supervisor.hpp"
#include "lifecycle/shutdown_signal.hpp"
#include "logging/logger.hpp"
#include "net/url.hpp"
#include "signaling/offer_handler.hpp"
#include "signaling/signaling_server.hpp"
#include "transport/ws_peer_connection.hpp"
#include <boost/asio.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace lifecycle {

// ServerApp composition/threading overview:
// - Reactor: io_context on kReactorThreads jthreads; hosts the signaling
//   listener, transport acceptors/dialers and data channel read loops
// - SignalingServer: HTTP listener; OfferHandler runs on its worker pool
// - SessionSupervisor: one jthread per negotiated channel, streaming the
//   file once the channel opens
// - Main thread: Start(), then blocks in ShutdownSignal::Wait(), then
//   Shutdown(): close listener -> drain sessions -> stop reactor
class ServerApp {
public:
  using tcp = net::ip::tcp;

  static constexpr int kReactorThreads = 2;
  static constexpr std::chrono::seconds kCloseTimeout{5};

  ServerApp(config::ServerOptions options, logging::Logger &log,
            std::ostream &announce = std::cout)
      : options_(std::move(options)), log_(log), announce_(announce),
        shutdown_(reactor_.GetIoContext(), log_), lifecycle_(log_),
        factory_(reactor_.GetIoContext(), TransportConfig(options_), log_),
        supervisor_(
            lifecycle::SessionSupervisor::Settings{options_.file,
                                                   options_.delay,
                                                   options_.open_timeout,
                                                   kCloseTimeout},
            registry_, log_,
            [this] {
              if (lifecycle_.Current() == Phase::signaling_up) {
                (void)lifecycle_.Advance(Phase::streaming);
              }
            }),
        handler_(
            factory_,
            [this](std::shared_ptr<transport::PeerConnection> pc,
                   std::shared_ptr<transport::DataChannel> channel) {
              supervisor_.Adopt(std::move(pc), std::move(channel));
            },
            signaling::OfferHandler::Settings{"fileStream",
                                              options_.gather_timeout},
            log_),
        server_(reactor_.GetIoContext(), handler_, log_,
                [this](const core::Error &e) {
                  lifecycle_.ReportFatal(e);
                  shutdown_.Trigger();
                }) {}

  ~ServerApp() { Shutdown(); }

  ServerApp(const ServerApp &) = delete;
  ServerApp &operator=(const ServerApp &) = delete;

  // Startup failures (missing file, bad or busy listen address) are fatal.
  core::Status Start() {
    std::error_code fs_ec;
    if (!std::filesystem::is_regular_file(options_.file, fs_ec)) {
      return Abort(core::Error{core::ErrorKind::io,
                               "file to stream not found: " + options_.file});
    }
    auto listen = URL::ParseListenAddress(options_.addr);
    if (!listen) {
      return Abort(core::Error{core::ErrorKind::config,
                               "invalid listen address: " + options_.addr});
    }
    boost::system::error_code ec;
    auto address = net::ip::make_address(listen->host, ec);
    if (ec) {
      return Abort(core::FromErrorCode(core::ErrorKind::config,
                                       "listen address " + listen->host, ec));
    }
    std::uint16_t port = 0;
    auto [ptr, perr] = std::from_chars(
        listen->port.data(), listen->port.data() + listen->port.size(), port);
    if (perr != std::errc() || ptr != listen->port.data() + listen->port.size()) {
      return Abort(core::Error{core::ErrorKind::config,
                               "invalid listen port: " + listen->port});
    }

    reactor_.Start(kReactorThreads);
    if (auto st = server_.Listen(tcp::endpoint(address, port)); !st) {
      return Abort(st.error());
    }
    (void)lifecycle_.Advance(Phase::signaling_up);
    log_.Info(kComponent, "Streaming ", options_.file, " with ",
              options_.delay.count(), "ms delay");
    announce_ << "SERVER_PID=" << ::getpid() << std::endl;
    return {};
  }

  // Start, wait for SIGINT/SIGTERM, drain. Returns the process exit code.
  int Run() {
    if (auto st = Start(); !st) {
      log_.Error(kComponent, "Startup failed: ", core::Describe(st.error()));
      return Shutdown();
    }
    shutdown_.Wait();
    return Shutdown();
  }

  int Shutdown() {
    if (shut_down_) {
      return lifecycle_.ExitCode();
    }
    shut_down_ = true;
    const bool started = lifecycle_.Current() != Phase::idle;
    if (started) {
      (void)lifecycle_.Advance(Phase::draining);
      log_.Info(kComponent, "Shutting down: closing signaling listener");
    }
    server_.Stop();
    supervisor_.Drain();
    reactor_.Stop();
    (void)lifecycle_.Advance(Phase::closed);
    if (started) {
      log_.Info(kComponent, "Server shutdown complete");
    }
    return lifecycle_.ExitCode();
  }

  void RequestShutdown() { shutdown_.Trigger(); }

  tcp::endpoint LocalEndpoint() const { return server_.LocalEndpoint(); }
  net::io_context &GetIoContext() { return reactor_.GetIoContext(); }
  const Lifecycle &GetLifecycle() const { return lifecycle_; }
  const SessionRegistry &GetRegistry() const { return registry_; }

private:
  static constexpr std::string_view kComponent = "server";

  static transport::WsTransportConfig
  TransportConfig(const config::ServerOptions &opt) {
    transport::WsTransportConfig cfg;
    cfg.bind_address = opt.bind_address;
    return cfg;
  }

  std::unexpected<core::Error> Abort(core::Error error) {
    lifecycle_.ReportFatal(error);
    return std::unexpected(std::move(error));
  }

  config::ServerOptions options_;
  logging::Logger &log_;
  std::ostream &announce_;
  Reactor reactor_;
  ShutdownSignal shutdown_;
  Lifecycle lifecycle_;
  SessionRegistry registry_;
  transport::WsPeerConnectionFactory factory_;
  SessionSupervisor supervisor_;
  signaling::OfferHandler handler_;
  signaling::SignalingServer server_;
  bool shut_down_ = false;
};

} // namespace lifecycle
