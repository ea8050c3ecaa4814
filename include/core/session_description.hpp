#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace core {

enum class SdpType { offer, answer };

inline const char *ToString(SdpType type) {
  return type == SdpType::offer ? "offer" : "answer";
}

inline std::optional<SdpType> ParseSdpType(std::string_view s) {
  if (s == "offer") {
    return SdpType::offer;
  }
  if (s == "answer") {
    return SdpType::answer;
  }
  return std::nullopt;
}

// SessionDescription: negotiation payload exchanged over signaling.
// `sdp` is opaque to everything except the transport that produced it.
struct SessionDescription {
  SdpType type = SdpType::offer;
  std::string sdp;

  bool operator==(const SessionDescription &) const = default;
};

} // namespace core
