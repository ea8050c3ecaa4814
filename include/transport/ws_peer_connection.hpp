#pragma once

#include "core/error.hpp"
#include "core/session_description.hpp"
#include "logging/logger.hpp"
#include "net/http_ops.hpp"
#include "transport/peer_connection.hpp"
#include "transport/session_body.hpp"
#include "transport/ws_data_channel.hpp"
#include <algorithm>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace transport {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

struct WsTransportConfig {
  // Interface the answering side listens on; 0.0.0.0 gathers every local
  // IPv4 address plus loopback.
  std::string bind_address = "0.0.0.0";
  // When set, these addresses are advertised instead of gathered ones.
  std::vector<std::string> advertised_addresses;
  std::chrono::milliseconds handshake_timeout{10000};
  std::string user_agent = "linecast/0.1";
};

namespace detail {

inline std::string RandomToken(std::size_t len) {
  static constexpr char kAlphabet[] =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
  std::string out(len, '\0');
  for (auto &ch : out) {
    ch = kAlphabet[pick(gen)];
  }
  return out;
}

inline std::uint64_t RandomSessionId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  // Keep it within the signed range like browser-generated o= lines.
  return gen() >> 1;
}

inline constexpr std::uint32_t kHostPriority = 2130706431u;
inline constexpr std::uint16_t kActivePort = 9;

} // namespace detail

// WsPeerConnection: TCP/WebSocket realisation of the transport capability.
// Threading model:
// - Public methods are called from handler/session threads and only touch
//   state under mu_; network work is spawned as coroutines on strand_
// - Gathering: the answering side (setup:passive) binds an ephemeral
//   listener; both sides enumerate host addresses. Completion is signalled
//   through gather_cv_
// - Connectivity: the offering side (setup:active) dials the answer's
//   passive candidates in priority order and upgrades to WebSocket on
//   /<answer-ufrag>/<offer-ufrag>; the answering side accepts exactly one
//   upgrade carrying both ufrags
// - The resulting WsDataChannel shares strand_
class WsPeerConnection : public PeerConnection,
                         public std::enable_shared_from_this<WsPeerConnection> {
public:
  using Strand = net::strand<net::io_context::executor_type>;

  WsPeerConnection(net::io_context &ioc, WsTransportConfig config,
                   logging::Logger &log)
      : strand_(net::make_strand(ioc)), config_(std::move(config)), log_(log),
        ufrag_(detail::RandomToken(8)),
        session_id_(detail::RandomSessionId()) {}

  core::Result<core::SessionDescription> CreateOffer() override {
    std::lock_guard lock(mu_);
    if (closed_) {
      return ClosedError();
    }
    SessionBody body;
    body.session_id = session_id_;
    body.ufrag = ufrag_;
    body.setup = TcpType::active;
    return core::SessionDescription{core::SdpType::offer, EncodeBody(body)};
  }

  core::Result<core::SessionDescription> CreateAnswer() override {
    std::lock_guard lock(mu_);
    if (closed_) {
      return ClosedError();
    }
    if (!remote_body_ || remote_type_ != core::SdpType::offer) {
      return core::MakeError(core::ErrorKind::negotiation,
                             "no remote offer to answer");
    }
    SessionBody body;
    body.session_id = session_id_;
    body.ufrag = ufrag_;
    body.setup = TcpType::passive;
    body.label = channel_ ? channel_->Label() : std::string();
    return core::SessionDescription{core::SdpType::answer, EncodeBody(body)};
  }

  core::Status
  SetLocalDescription(const core::SessionDescription &desc) override {
    auto body = DecodeBody(desc.sdp);
    if (!body) {
      return std::unexpected(body.error());
    }
    TcpType setup = body->setup;
    {
      std::lock_guard lock(mu_);
      if (closed_) {
        return ClosedError();
      }
      if (local_body_) {
        return core::MakeError(core::ErrorKind::negotiation,
                               "local description already set");
      }
      if (body->ufrag != ufrag_) {
        return core::MakeError(core::ErrorKind::negotiation,
                               "local description was not created here");
      }
      local_type_ = desc.type;
      local_body_ = std::move(*body);
      gathering_ = Gathering::in_progress;
    }
    log_.Info(kComponent, "Gathering candidates (setup:", ToString(setup),
              ")");
    net::spawn(strand_, [self = shared_from_this(),
                         setup](net::yield_context yield) {
      self->Gather(yield, setup);
    });
    return {};
  }

  core::Status
  SetRemoteDescription(const core::SessionDescription &desc) override {
    auto body = DecodeBody(desc.sdp);
    if (!body) {
      return std::unexpected(body.error());
    }
    {
      std::lock_guard lock(mu_);
      if (closed_) {
        return ClosedError();
      }
      if (remote_body_) {
        return core::MakeError(core::ErrorKind::negotiation,
                               "remote description already set");
      }
      const TcpType expected = desc.type == core::SdpType::offer
                                   ? TcpType::active
                                   : TcpType::passive;
      if (body->setup != expected) {
        return core::MakeError(core::ErrorKind::negotiation,
                               std::string("remote ") +
                                   core::ToString(desc.type) +
                                   " has setup:" + ToString(body->setup));
      }
      remote_type_ = desc.type;
      remote_body_ = std::move(*body);
    }
    SetState(ConnectionState::connecting);
    if (desc.type == core::SdpType::answer) {
      net::spawn(strand_, [self = shared_from_this()](
                              net::yield_context yield) { self->Dial(yield); });
    }
    return {};
  }

  core::Status AwaitGathering(std::stop_token st,
                              Clock::time_point deadline) override {
    std::unique_lock lock(mu_);
    const bool settled = gather_cv_.wait_until(lock, st, deadline, [this] {
      return gathering_ != Gathering::in_progress || closed_;
    });
    if (!settled) {
      if (st.stop_requested()) {
        return core::MakeError(core::ErrorKind::negotiation,
                               "candidate gathering cancelled");
      }
      return core::MakeError(core::ErrorKind::negotiation,
                             "candidate gathering timed out");
    }
    if (closed_) {
      return ClosedError();
    }
    switch (gathering_) {
    case Gathering::complete:
      return {};
    case Gathering::failed:
      return core::MakeError(core::ErrorKind::negotiation, gather_error_);
    default:
      return core::MakeError(core::ErrorKind::negotiation,
                             "candidate gathering not started");
    }
  }

  std::optional<core::SessionDescription> LocalDescription() const override {
    std::lock_guard lock(mu_);
    if (!local_body_ || gathering_ != Gathering::complete) {
      return std::nullopt;
    }
    return core::SessionDescription{local_type_, EncodeBody(*local_body_)};
  }

  core::Result<std::shared_ptr<DataChannel>>
  CreateDataChannel(const std::string &label) override {
    std::lock_guard lock(mu_);
    if (closed_) {
      return ClosedError();
    }
    if (channel_) {
      return core::MakeError(core::ErrorKind::negotiation,
                             "data channel " + channel_->Label() +
                                 " already exists");
    }
    channel_ = std::make_shared<WsDataChannel>(strand_, label, log_);
    return std::static_pointer_cast<DataChannel>(channel_);
  }

  ConnectionState State() const override {
    std::lock_guard lock(mu_);
    return state_;
  }

  void Close() override {
    std::shared_ptr<WsDataChannel> channel;
    {
      std::lock_guard lock(mu_);
      if (closed_) {
        return;
      }
      closed_ = true;
      channel = channel_;
    }
    gather_cv_.notify_all();
    net::post(strand_, [self = shared_from_this()] {
      if (self->acceptor_ && self->acceptor_->is_open()) {
        beast::error_code ec;
        self->acceptor_->close(ec);
      }
    });
    if (channel) {
      channel->Close();
    }
    SetState(ConnectionState::closed);
    events_.Close();
  }

  const std::string &Ufrag() const { return ufrag_; }

private:
  static constexpr std::string_view kComponent = "transport";

  enum class Gathering { new_, in_progress, complete, failed };

  static std::unexpected<core::Error> ClosedError() {
    return core::MakeError(core::ErrorKind::negotiation,
                           "peer connection is closed");
  }

  void SetState(ConnectionState next) {
    {
      std::lock_guard lock(mu_);
      if (state_ == next || state_ == ConnectionState::closed) {
        return;
      }
      state_ = next;
    }
    if (next == ConnectionState::failed) {
      log_.Error(kComponent, "Connection state changed: ", ToString(next));
    } else {
      log_.Info(kComponent, "Connection state changed: ", ToString(next));
    }
    events_.Push(StateChanged{next});
  }

  void FailGathering(const std::string &why) {
    {
      std::lock_guard lock(mu_);
      gathering_ = Gathering::failed;
      gather_error_ = why;
    }
    gather_cv_.notify_all();
    log_.Error(kComponent, "Candidate gathering failed: ", why);
    SetState(ConnectionState::failed);
  }

  // Runs on strand_.
  void Gather(net::yield_context yield, TcpType setup) {
    std::uint16_t port = detail::kActivePort;
    if (setup == TcpType::passive) {
      beast::error_code ec;
      auto address = net::ip::make_address(config_.bind_address, ec);
      if (ec) {
        FailGathering("bind address " + config_.bind_address + ": " +
                      ec.message());
        return;
      }
      tcp::endpoint endpoint(address, 0);
      acceptor_.emplace(strand_);
      acceptor_->open(endpoint.protocol(), ec);
      if (!ec) {
        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
      }
      if (!ec) {
        acceptor_->bind(endpoint, ec);
      }
      if (!ec) {
        acceptor_->listen(net::socket_base::max_listen_connections, ec);
      }
      if (ec) {
        FailGathering("listen: " + ec.message());
        return;
      }
      port = acceptor_->local_endpoint(ec).port();
    }

    std::vector<std::string> addresses = config_.advertised_addresses;
    if (addresses.empty()) {
      addresses = EnumerateAddresses(yield);
    }

    std::vector<Candidate> candidates;
    candidates.reserve(addresses.size());
    for (std::size_t i = 0; i < addresses.size(); ++i) {
      Candidate c;
      c.foundation = std::to_string(i + 1);
      c.priority = detail::kHostPriority - static_cast<std::uint32_t>(i);
      c.address = addresses[i];
      c.port = port;
      c.tcptype = setup;
      candidates.push_back(std::move(c));
    }

    {
      std::lock_guard lock(mu_);
      if (closed_) {
        if (acceptor_) {
          beast::error_code ignored;
          acceptor_->close(ignored);
        }
        return;
      }
      local_body_->candidates = std::move(candidates);
      local_body_->end_of_candidates = true;
      gathering_ = Gathering::complete;
    }
    gather_cv_.notify_all();
    log_.Info(kComponent, "Candidate gathering complete: ", addresses.size(),
              " host candidate(s)");

    if (setup == TcpType::passive) {
      AcceptLoop(yield);
    }
  }

  std::vector<std::string> EnumerateAddresses(net::yield_context yield) {
    std::vector<std::string> out;
    beast::error_code ec;
    auto bind = net::ip::make_address(config_.bind_address, ec);
    if (!ec && !bind.is_unspecified()) {
      out.push_back(bind.to_string());
      return out;
    }
    const std::string host = net::ip::host_name(ec);
    if (!ec) {
      tcp::resolver resolver(strand_);
      auto results = resolver.async_resolve(tcp::v4(), host, "0", yield[ec]);
      if (!ec) {
        for (const auto &entry : results) {
          auto address = entry.endpoint().address();
          if (address.is_loopback()) {
            continue;
          }
          std::string s = address.to_string();
          if (std::find(out.begin(), out.end(), s) == out.end()) {
            out.push_back(std::move(s));
          }
        }
      }
    }
    if (ec) {
      log_.Debug(kComponent, "host address lookup: ", ec.message());
    }
    out.emplace_back("127.0.0.1");
    return out;
  }

  // Null once Close() has run; Close() only sees channels created before it.
  std::shared_ptr<WsDataChannel> EnsureChannel(const std::string &label) {
    std::lock_guard lock(mu_);
    if (closed_) {
      return nullptr;
    }
    if (!channel_) {
      channel_ = std::make_shared<WsDataChannel>(strand_, label, log_);
    }
    return channel_;
  }

  bool IsClosed() const {
    std::lock_guard lock(mu_);
    return closed_;
  }

  // Answering side; runs on strand_ after gathering.
  void AcceptLoop(net::yield_context yield) {
    std::string expected_target;
    {
      std::lock_guard lock(mu_);
      expected_target = "/" + ufrag_ + "/" + remote_body_->ufrag;
    }
    for (;;) {
      beast::error_code ec;
      tcp::socket socket(acceptor_->get_executor());
      acceptor_->async_accept(socket, yield[ec]);
      if (ec) {
        if (ec != net::error::operation_aborted) {
          log_.Error(kComponent, "accept: ", ec.message());
          SetState(ConnectionState::failed);
        }
        return;
      }
      beast::tcp_stream stream(std::move(socket));
      stream.expires_after(config_.handshake_timeout);
      beast::flat_buffer buffer;
      auto req = httpops::AsyncReadRequest(stream, buffer, yield);
      if (!req) {
        log_.Debug(kComponent, "upgrade request: ", req.error().message());
        continue;
      }
      const std::string target(req->target().data(), req->target().size());
      if (!websocket::is_upgrade(*req) || target != expected_target) {
        log_.Info(kComponent, "Rejected connection for target ", target);
        http::response<http::string_body> res{http::status::forbidden,
                                               req->version()};
        res.set(http::field::content_type, "text/plain");
        res.body() = "unknown session\n";
        res.prepare_payload();
        if (auto st = httpops::AsyncWrite(stream, res, yield); !st) {
          log_.Debug(kComponent, "reject: ", st.error().message());
        }
        continue;
      }
      stream.expires_never();
      websocket::stream<beast::tcp_stream> ws(std::move(stream));
      httpops::ConfigureWebSocket(ws, config_.user_agent,
                                  beast::role_type::server);
      if (auto st = httpops::AsyncWsAccept(ws, *req, yield); !st) {
        log_.Error(kComponent, "websocket accept: ", st.error().message());
        continue;
      }
      acceptor_->close(ec);
      auto channel = EnsureChannel("data");
      if (!channel) {
        beast::get_lowest_layer(ws).close();
        return;
      }
      channel->Attach(std::move(ws));
      SetState(ConnectionState::connected);
      return;
    }
  }

  // Offering side; runs on strand_ once the answer is installed.
  void Dial(net::yield_context yield) {
    SessionBody remote;
    {
      std::lock_guard lock(mu_);
      remote = *remote_body_;
    }
    std::vector<Candidate> passive;
    for (const auto &c : remote.candidates) {
      if (c.tcptype == TcpType::passive) {
        passive.push_back(c);
      }
    }
    std::stable_sort(passive.begin(), passive.end(),
                     [](const Candidate &a, const Candidate &b) {
                       return a.priority > b.priority;
                     });
    if (passive.empty()) {
      log_.Error(kComponent, "Remote answer carries no passive candidates");
      SetState(ConnectionState::failed);
      return;
    }

    const std::string target = "/" + remote.ufrag + "/" + ufrag_;
    for (const auto &c : passive) {
      beast::error_code ec;
      auto address = net::ip::make_address(c.address, ec);
      if (ec) {
        log_.Debug(kComponent, "skipping candidate ", c.address, ": ",
                   ec.message());
        continue;
      }
      beast::tcp_stream stream(strand_);
      stream.expires_after(config_.handshake_timeout);
      if (auto st = httpops::AsyncConnect(stream, tcp::endpoint(address, c.port),
                                          yield);
          !st) {
        log_.Debug(kComponent, "connect ", c.address, ":", c.port, ": ",
                   st.error().message());
        continue;
      }
      if (IsClosed()) {
        return;
      }
      httpops::SetTcpNoDelay(stream);
      stream.expires_never();
      websocket::stream<beast::tcp_stream> ws(std::move(stream));
      httpops::ConfigureWebSocket(ws, config_.user_agent,
                                  beast::role_type::client);
      const std::string host = c.address + ":" + std::to_string(c.port);
      if (auto st = httpops::AsyncWsHandshake(ws, host, target, yield); !st) {
        log_.Debug(kComponent, "handshake ", host, ": ",
                   st.error().message());
        continue;
      }
      auto channel = EnsureChannel(remote.label.empty() ? "data" : remote.label);
      if (!channel) {
        beast::get_lowest_layer(ws).close();
        return;
      }
      channel->Attach(std::move(ws));
      events_.Push(DataChannelAnnounced{channel});
      SetState(ConnectionState::connected);
      return;
    }
    log_.Error(kComponent, "No remote candidate was reachable");
    SetState(ConnectionState::failed);
  }

  Strand strand_;
  WsTransportConfig config_;
  logging::Logger &log_;
  const std::string ufrag_;
  const std::uint64_t session_id_;

  mutable std::mutex mu_;
  std::condition_variable_any gather_cv_;
  bool closed_ = false;
  ConnectionState state_ = ConnectionState::new_;
  Gathering gathering_ = Gathering::new_;
  std::string gather_error_;
  core::SdpType local_type_ = core::SdpType::offer;
  std::optional<SessionBody> local_body_;
  core::SdpType remote_type_ = core::SdpType::offer;
  std::optional<SessionBody> remote_body_;
  std::shared_ptr<WsDataChannel> channel_;

  // strand_ only
  std::optional<tcp::acceptor> acceptor_;
};

class WsPeerConnectionFactory : public PeerConnectionFactory {
public:
  WsPeerConnectionFactory(net::io_context &ioc, WsTransportConfig config,
                          logging::Logger &log)
      : ioc_(ioc), config_(std::move(config)), log_(log) {}

  core::Result<std::shared_ptr<PeerConnection>> Create() override {
    return std::static_pointer_cast<PeerConnection>(
        std::make_shared<WsPeerConnection>(ioc_, config_, log_));
  }

private:
  net::io_context &ioc_;
  WsTransportConfig config_;
  logging::Logger &log_;
};

} // namespace transport
