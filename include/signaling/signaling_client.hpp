#pragma once

#include "core/error.hpp"
#include "core/session_description.hpp"
#include "logging/logger.hpp"
#include "net/http_ops.hpp"
#include "net/url.hpp"
#include "signaling/wire.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace signaling {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

// SignalingClient
// Offering side of the HTTP exchange: POSTs the final offer and returns the
// decoded answer. Each call runs its own short-lived io_context on the
// calling thread; the whole request is bounded by request_timeout.
class SignalingClient {
public:
  static constexpr std::chrono::seconds kRequestTimeout{30};

  explicit SignalingClient(logging::Logger &log,
                           std::chrono::milliseconds request_timeout =
                               kRequestTimeout)
      : log_(log), timeout_(request_timeout) {}

  core::Result<core::SessionDescription>
  Exchange(const std::string &url, const core::SessionDescription &offer) {
    auto parts = URL::ParseHttpUrl(url);
    if (!parts) {
      return core::MakeError(core::ErrorKind::config,
                             "invalid signaling URL (expected "
                             "http://host[:port]/path): " +
                                 url);
    }
    log_.Info(kComponent, "Posting offer to ", url);

    net::io_context ioc;
    std::optional<core::Result<core::SessionDescription>> result;
    net::spawn(ioc, [&](net::yield_context yield) {
      result = Post(ioc, *parts, wire::EncodeDescription(offer), yield);
    });
    ioc.run();
    if (!result) {
      return core::MakeError(core::ErrorKind::negotiation,
                             "signaling request did not complete");
    }
    return std::move(*result);
  }

private:
  static constexpr std::string_view kComponent = "signaling";

  core::Result<core::SessionDescription> Post(net::io_context &ioc,
                                              const URL::UrlParts &url,
                                              std::string body,
                                              net::yield_context yield) {
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto results = httpops::AsyncResolve(resolver, url.host, url.port, yield);
    if (!results) {
      return Failed("resolve", results.error());
    }
    stream.expires_after(timeout_);
    if (auto st = httpops::AsyncConnect(stream, *results, yield); !st) {
      return Failed("connect", st.error());
    }
    httpops::SetTcpNoDelay(stream);

    http::request<http::string_body> req{http::verb::post, url.target, 11};
    req.set(http::field::host, url.host + ":" + url.port);
    req.set(http::field::user_agent, "linecast/0.1");
    req.set(http::field::content_type, "application/json");
    req.body() = std::move(body);
    req.prepare_payload();
    if (auto st = httpops::AsyncWrite(stream, req, yield); !st) {
      return Failed("write", st.error());
    }

    beast::flat_buffer buffer;
    auto res = httpops::AsyncReadResponse(stream, buffer, yield);
    if (!res) {
      return Failed("read", res.error());
    }
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    if (res->result() != http::status::ok) {
      std::string text = res->body();
      while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
      }
      return core::MakeError(core::ErrorKind::negotiation,
                             "signaling server returned " +
                                 std::to_string(res->result_int()) + ": " +
                                 text);
    }
    auto answer = wire::DecodeDescription(res->body());
    if (!answer) {
      return std::unexpected(answer.error());
    }
    if (answer->type != core::SdpType::answer) {
      return core::MakeError(core::ErrorKind::negotiation,
                             std::string("expected an answer, got ") +
                                 core::ToString(answer->type));
    }
    return answer;
  }

  std::unexpected<core::Error> Failed(const char *stage,
                                      const beast::error_code &ec) {
    auto err = core::FromErrorCode(core::ErrorKind::negotiation, stage, ec);
    log_.Error(kComponent, "Signaling ", err.message);
    return std::unexpected(std::move(err));
  }

  logging::Logger &log_;
  std::chrono::milliseconds timeout_;
};

} // namespace signaling
