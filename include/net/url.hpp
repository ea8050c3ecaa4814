#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>

namespace URL {

struct UrlParts {
  std::string scheme;
  std::string host;
  std::string port;
  std::string target;
};

// http://host[:port][/path]: signaling endpoint of the answering side.
inline std::optional<UrlParts> ParseHttpUrl(const std::string &url) {
  if (!boost::algorithm::istarts_with(url, "http://")) {
    return std::nullopt;
  }
  std::string rest = url.substr(7);
  auto slash = rest.find('/');
  std::string hostport =
      slash == std::string::npos ? rest : rest.substr(0, slash);
  std::string target = slash == std::string::npos ? "/" : rest.substr(slash);
  std::string host = hostport;
  std::string port = "80";
  auto colon = hostport.rfind(':');
  if (colon != std::string::npos) {
    host = hostport.substr(0, colon);
    port = hostport.substr(colon + 1);
  }
  if (host.empty() || port.empty()) {
    return std::nullopt;
  }
  return UrlParts{
      .scheme = "http", .host = host, .port = port, .target = target};
}

struct ListenAddress {
  std::string host;
  std::string port;
};

// [host]:port: an empty host listens on every interface.
inline std::optional<ListenAddress> ParseListenAddress(const std::string &addr) {
  auto colon = addr.rfind(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  std::string host = addr.substr(0, colon);
  std::string port = addr.substr(colon + 1);
  if (port.empty() ||
      port.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  if (host.empty()) {
    host = "0.0.0.0";
  }
  return ListenAddress{.host = host, .port = port};
}

} // namespace URL
