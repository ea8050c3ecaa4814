#pragma once

#include "core/error.hpp"
#include "logging/logger.hpp"
#include "signaling/offer_handler.hpp"
#include "signaling/wire.hpp"
#include "util/branch.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace signaling {

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace detail {

// HttpSession: one signaling connection.
// Reads a request (body capped at kMaxDescriptionBytes) on the reactor,
// hands it to the worker pool because OfferHandler blocks during gathering,
// and posts the response back to the connection's strand for writing.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  static constexpr std::chrono::seconds kReadTimeout{30};

  HttpSession(tcp::socket socket, OfferHandler &handler,
              net::thread_pool &pool, std::stop_token st, logging::Logger &log)
      : stream_(std::move(socket)), handler_(handler), pool_(pool),
        stop_(std::move(st)), log_(log) {}

  void Start() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::DoRead,
                                            shared_from_this()));
  }

private:
  static constexpr std::string_view kComponent = "signaling";

  void DoRead() {
    parser_.emplace();
    parser_->body_limit(wire::kMaxDescriptionBytes);
    stream_.expires_after(kReadTimeout);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::OnRead,
                                               shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      Shutdown();
      return;
    }
    if (ec == http::error::body_limit) {
      log_.Error(kComponent, "Failed to read offer: ", ec.message());
      Request head = parser_->release();
      auto res = OfferHandler::Text(head, http::status::bad_request,
                                    "Failed to read offer: " + ec.message());
      res.keep_alive(false);
      Write(std::move(res));
      return;
    }
    if (ec) {
      log_.Debug(kComponent, "read: ", ec.message());
      return;
    }
    if (stop_.stop_requested()) {
      // The pool is being joined; nothing would pick the request up.
      auto res = OfferHandler::Text(parser_->get(),
                                    http::status::service_unavailable,
                                    "Server is shutting down");
      res.keep_alive(false);
      Write(std::move(res));
      return;
    }
    stream_.expires_never();
    net::post(pool_, [self = shared_from_this(), req = parser_->release()] {
      Response res = self->handler_.Handle(req, self->stop_);
      net::post(self->stream_.get_executor(),
                [self, res = std::move(res)]() mutable {
                  self->Write(std::move(res));
                });
    });
  }

  void Write(Response res) {
    res_ = std::make_shared<Response>(std::move(res));
    stream_.expires_after(kReadTimeout);
    http::async_write(stream_, *res_,
                      beast::bind_front_handler(&HttpSession::OnWrite,
                                                shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      log_.Debug(kComponent, "write: ", ec.message());
      return;
    }
    const bool keep_alive = res_->keep_alive();
    res_.reset();
    if (!keep_alive) {
      Shutdown();
      return;
    }
    DoRead();
  }

  void Shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<Response> res_;
  OfferHandler &handler_;
  net::thread_pool &pool_;
  std::stop_token stop_;
  logging::Logger &log_;
};

} // namespace detail

// SignalingServer
// Threading model:
// - Accept loop is a coroutine (spawn) on the reactor, serialised on its own
//   strand; each accepted connection becomes a detail::HttpSession
// - OfferHandler::Handle runs on pool_ (kWorkers threads)
// - Stop(): closes the listener (no new requests) and requests stop on the
//   token handed to in-flight handlers, then joins the pool
class SignalingServer {
public:
  using FatalFn = std::function<void(const core::Error &)>;

  static constexpr int kWorkers = 4;
  static constexpr std::chrono::seconds kCloseWait{2};

  SignalingServer(net::io_context &ioc, OfferHandler &handler,
                  logging::Logger &log, FatalFn on_fatal = {})
      : ioc_(ioc), acceptor_(net::make_strand(ioc)), handler_(handler),
        log_(log),
        on_fatal_(std::move(on_fatal)) {}

  ~SignalingServer() { Stop(); }

  SignalingServer(const SignalingServer &) = delete;
  SignalingServer &operator=(const SignalingServer &) = delete;

  core::Status Listen(const tcp::endpoint &endpoint) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      return std::unexpected(
          core::FromErrorCode(core::ErrorKind::config, "open", ec));
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      return std::unexpected(
          core::FromErrorCode(core::ErrorKind::config, "set_option", ec));
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
      return std::unexpected(
          core::FromErrorCode(core::ErrorKind::config, "bind", ec));
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      return std::unexpected(
          core::FromErrorCode(core::ErrorKind::config, "listen", ec));
    }
    local_ = acceptor_.local_endpoint(ec);
    listening_.store(true);
    log_.Info(kComponent, "Signaling server listening on ", local_);
    net::spawn(acceptor_.get_executor(),
               [this](net::yield_context yield) { this->AcceptLoop(yield); });
    return {};
  }

  tcp::endpoint LocalEndpoint() const { return local_; }

  void Stop() {
    if (stopped_.exchange(true)) {
      return;
    }
    if (!listening_.load()) {
      return;
    }
    auto closed = std::make_shared<std::promise<void>>();
    auto done = closed->get_future();
    net::post(acceptor_.get_executor(), [this, closed] {
      beast::error_code ec;
      acceptor_.close(ec);
      closed->set_value();
    });
    // The reactor may already be stopped; then nothing is accepting anyway.
    if (done.wait_for(kCloseWait) != std::future_status::ready) {
      log_.Debug(kComponent, "listener close was not acknowledged");
    }
    stop_.request_stop();
    pool_.join();
    log_.Info(kComponent, "Signaling server stopped");
  }

private:
  static constexpr std::string_view kComponent = "signaling";

  void AcceptLoop(net::yield_context yield) {
    for (;;) {
      beast::error_code ec;
      tcp::socket socket(net::make_strand(ioc_));
      acceptor_.async_accept(socket, yield[ec]);
      if (LINECAST_UNLIKELY(ec)) {
        if (ec == net::error::operation_aborted || stopped_.load()) {
          return;
        }
        auto err = core::FromErrorCode(core::ErrorKind::transport, "accept", ec);
        log_.Error(kComponent, core::Describe(err));
        if (on_fatal_) {
          on_fatal_(err);
        }
        return;
      }
      if (stopped_.load()) {
        return;
      }
      std::make_shared<detail::HttpSession>(std::move(socket), handler_, pool_,
                                            stop_.get_token(), log_)
          ->Start();
    }
  }

  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  OfferHandler &handler_;
  logging::Logger &log_;
  FatalFn on_fatal_;
  net::thread_pool pool_{kWorkers};
  std::stop_source stop_;
  std::atomic<bool> stopped_{false};
  std::atomic<bool> listening_{false};
  tcp::endpoint local_;
};

} // namespace signaling
