#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <expected>
#include <string>

// namespace httpops: thin std::expected wrappers around the Asio/Beast calls
// used by the signaling client/server and the WebSocket transport, so each
// call site is a single `if (!st) { OnError(stage, st.error()); }`.
namespace httpops {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using Status = std::expected<void, beast::error_code>;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline std::expected<tcp::resolver::results_type, beast::error_code>
AsyncResolve(tcp::resolver &resolver, const std::string &host,
             const std::string &port, net::yield_context yield) {
  beast::error_code ec;
  auto r = resolver.async_resolve(host, port, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return r;
}

inline Status AsyncConnect(beast::tcp_stream &stream,
                           const tcp::resolver::results_type &endpoints,
                           net::yield_context yield) {
  beast::error_code ec;
  stream.async_connect(endpoints, yield[ec]);
  return MakeStatus(ec);
}

inline Status AsyncConnect(beast::tcp_stream &stream,
                           const tcp::endpoint &endpoint,
                           net::yield_context yield) {
  beast::error_code ec;
  stream.async_connect(endpoint, yield[ec]);
  return MakeStatus(ec);
}

template <bool isRequest, typename Body>
inline Status AsyncWrite(beast::tcp_stream &stream,
                         http::message<isRequest, Body> &msg,
                         net::yield_context yield) {
  beast::error_code ec;
  http::async_write(stream, msg, yield[ec]);
  return MakeStatus(ec);
}

inline std::expected<http::response<http::string_body>, beast::error_code>
AsyncReadResponse(beast::tcp_stream &stream, beast::flat_buffer &buffer,
                  net::yield_context yield) {
  beast::error_code ec;
  http::response<http::string_body> res;
  http::async_read(stream, buffer, res, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return res;
}

inline std::expected<http::request<http::string_body>, beast::error_code>
AsyncReadRequest(beast::tcp_stream &stream, beast::flat_buffer &buffer,
                 net::yield_context yield) {
  beast::error_code ec;
  http::request<http::string_body> req;
  http::async_read(stream, buffer, req, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return req;
}

inline Status
AsyncWsHandshake(websocket::stream<beast::tcp_stream> &ws,
                 const std::string &host, const std::string &target,
                 net::yield_context yield) {
  beast::error_code ec;
  ws.async_handshake(host, target, yield[ec]);
  return MakeStatus(ec);
}

inline Status AsyncWsAccept(websocket::stream<beast::tcp_stream> &ws,
                            const http::request<http::string_body> &req,
                            net::yield_context yield) {
  beast::error_code ec;
  ws.async_accept(req, yield[ec]);
  return MakeStatus(ec);
}

inline void SetTcpNoDelay(beast::tcp_stream &stream) {
  beast::error_code ec;
  stream.socket().set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

template <typename WS>
inline void ConfigureWebSocket(WS &ws, const std::string &userAgent,
                               beast::role_type role) {
  websocket::permessage_deflate pmd;
  pmd.client_enable = false;
  pmd.server_enable = false;
  ws.set_option(pmd);
  ws.set_option(websocket::stream_base::timeout::suggested(role));
  if (role == beast::role_type::client) {
    ws.set_option(websocket::stream_base::decorator(
        [userAgent](websocket::request_type &req) {
          req.set(beast::http::field::user_agent, userAgent);
        }));
  } else {
    ws.set_option(websocket::stream_base::decorator(
        [userAgent](websocket::response_type &res) {
          res.set(beast::http::field::server, userAgent);
        }));
  }
}

} // namespace httpops
