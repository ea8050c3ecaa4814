#pragma once

#include "core/error.hpp"
#include <charconv>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// namespace transport: SDP-style body produced by the WebSocket transport.
//
//   v=0
//   o=- <session-id> 2 IN IP4 127.0.0.1
//   s=-
//   t=0 0
//   m=application 9 TCP/WS webrtc-datachannel
//   c=IN IP4 0.0.0.0
//   a=ice-ufrag:<ufrag>
//   a=setup:active|passive
//   a=label:<data channel label>            (answer only)
//   a=candidate:<foundation> 1 tcp <prio> <ip> <port> typ host tcptype <t>
//   a=end-of-candidates
//
// Lines are CRLF terminated. Unknown attributes are ignored on decode.
namespace transport {

enum class TcpType { active, passive };

inline const char *ToString(TcpType t) {
  return t == TcpType::active ? "active" : "passive";
}

struct Candidate {
  std::string foundation;
  std::uint32_t priority = 0;
  std::string address;
  std::uint16_t port = 0;
  TcpType tcptype = TcpType::passive;

  bool operator==(const Candidate &) const = default;
};

struct SessionBody {
  std::uint64_t session_id = 0;
  std::string ufrag;
  TcpType setup = TcpType::active;
  std::string label;
  std::vector<Candidate> candidates;
  bool end_of_candidates = false;

  bool operator==(const SessionBody &) const = default;
};

inline std::string EncodeCandidate(const Candidate &c) {
  std::ostringstream oss;
  oss << "candidate:" << c.foundation << " 1 tcp " << c.priority << ' '
      << c.address << ' ' << c.port << " typ host tcptype "
      << ToString(c.tcptype);
  return oss.str();
}

namespace detail {

template <typename T> inline bool ParseNumber(std::string_view s, T &out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

inline std::vector<std::string_view> SplitFields(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t pos = 0;
  while (pos < s.size()) {
    std::size_t next = s.find(' ', pos);
    if (next == std::string_view::npos) {
      next = s.size();
    }
    if (next > pos) {
      out.push_back(s.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return out;
}

inline core::Result<TcpType> ParseTcpType(std::string_view s) {
  if (s == "active") {
    return TcpType::active;
  }
  if (s == "passive") {
    return TcpType::passive;
  }
  return core::MakeError(core::ErrorKind::negotiation,
                         "unknown tcptype \"" + std::string(s) + "\"");
}

} // namespace detail

// Accepts the attribute value with or without the leading "candidate:".
inline core::Result<Candidate> DecodeCandidate(std::string_view line) {
  constexpr std::string_view kPrefix = "candidate:";
  if (line.substr(0, kPrefix.size()) == kPrefix) {
    line.remove_prefix(kPrefix.size());
  }
  auto fields = detail::SplitFields(line);
  // foundation component transport priority address port typ host tcptype X
  if (fields.size() != 10 || fields[2] != "tcp" || fields[6] != "typ" ||
      fields[8] != "tcptype") {
    return core::MakeError(core::ErrorKind::negotiation,
                           "malformed candidate \"" + std::string(line) +
                               "\"");
  }
  Candidate c;
  c.foundation = std::string(fields[0]);
  c.address = std::string(fields[4]);
  if (!detail::ParseNumber(fields[3], c.priority) ||
      !detail::ParseNumber(fields[5], c.port)) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "malformed candidate \"" + std::string(line) +
                               "\"");
  }
  auto tcptype = detail::ParseTcpType(fields[9]);
  if (!tcptype) {
    return std::unexpected(tcptype.error());
  }
  c.tcptype = *tcptype;
  return c;
}

inline std::string EncodeBody(const SessionBody &body) {
  std::string out;
  auto line = [&out](std::string_view s) {
    out += s;
    out += "\r\n";
  };
  line("v=0");
  line("o=- " + std::to_string(body.session_id) + " 2 IN IP4 127.0.0.1");
  line("s=-");
  line("t=0 0");
  line("m=application 9 TCP/WS webrtc-datachannel");
  line("c=IN IP4 0.0.0.0");
  line("a=ice-ufrag:" + body.ufrag);
  line(std::string("a=setup:") + ToString(body.setup));
  if (!body.label.empty()) {
    line("a=label:" + body.label);
  }
  for (const auto &c : body.candidates) {
    line("a=" + EncodeCandidate(c));
  }
  if (body.end_of_candidates) {
    line("a=end-of-candidates");
  }
  return out;
}

inline core::Result<SessionBody> DecodeBody(std::string_view sdp) {
  SessionBody body;
  bool saw_version = false;
  bool saw_setup = false;
  std::size_t pos = 0;
  while (pos < sdp.size()) {
    std::size_t eol = sdp.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = sdp.size();
    }
    std::string_view line = sdp.substr(pos, eol - pos);
    pos = eol + 1;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }
    if (!saw_version) {
      if (line != "v=0") {
        return core::MakeError(core::ErrorKind::negotiation,
                               "description does not start with v=0");
      }
      saw_version = true;
      continue;
    }
    if (line.starts_with("o=")) {
      auto fields = detail::SplitFields(line.substr(2));
      if (fields.size() < 2 ||
          !detail::ParseNumber(fields[1], body.session_id)) {
        return core::MakeError(core::ErrorKind::negotiation,
                               "malformed origin line");
      }
    } else if (line.starts_with("a=ice-ufrag:")) {
      body.ufrag = std::string(line.substr(12));
    } else if (line.starts_with("a=setup:")) {
      auto setup = detail::ParseTcpType(line.substr(8));
      if (!setup) {
        return std::unexpected(setup.error());
      }
      body.setup = *setup;
      saw_setup = true;
    } else if (line.starts_with("a=label:")) {
      body.label = std::string(line.substr(8));
    } else if (line.starts_with("a=candidate:")) {
      auto c = DecodeCandidate(line.substr(2));
      if (!c) {
        return std::unexpected(c.error());
      }
      body.candidates.push_back(std::move(*c));
    } else if (line == "a=end-of-candidates") {
      body.end_of_candidates = true;
    }
  }
  if (!saw_version) {
    return core::MakeError(core::ErrorKind::negotiation, "empty description");
  }
  if (body.ufrag.empty()) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "description has no ice-ufrag");
  }
  if (!saw_setup) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "description has no setup attribute");
  }
  return body;
}

} // namespace transport
