#pragma once

#include "core/error.hpp"
#include "core/session_description.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>

// namespace signaling::wire: JSON codec for SessionDescription.
// Wire shape: {"type":"offer"|"answer","sdp":"<transport body>"}
namespace signaling::wire {

namespace pt = boost::property_tree;

inline constexpr std::size_t kMaxDescriptionBytes = 64 * 1024;

inline std::string EncodeDescription(const core::SessionDescription &desc) {
  pt::ptree tree;
  tree.put("type", core::ToString(desc.type));
  tree.put("sdp", desc.sdp);
  std::ostringstream oss;
  pt::write_json(oss, tree, /*pretty=*/false);
  std::string out = oss.str();
  // write_json terminates the document with a newline
  if (!out.empty() && out.back() == '\n') {
    out.pop_back();
  }
  return out;
}

inline core::Result<core::SessionDescription>
DecodeDescription(std::string_view body) {
  if (body.size() > kMaxDescriptionBytes) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "description exceeds " +
                               std::to_string(kMaxDescriptionBytes) + " bytes");
  }
  pt::ptree tree;
  std::istringstream iss{std::string(body)};
  try {
    pt::read_json(iss, tree);
  } catch (const pt::json_parser_error &e) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "invalid JSON: " + e.message() + " at line " +
                               std::to_string(e.line()));
  }

  auto type_field = tree.get_optional<std::string>("type");
  if (!type_field) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "missing field \"type\"");
  }
  auto type = core::ParseSdpType(*type_field);
  if (!type) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "unknown description type \"" + *type_field + "\"");
  }
  auto sdp = tree.get_optional<std::string>("sdp");
  if (!sdp || sdp->empty()) {
    return core::MakeError(core::ErrorKind::negotiation,
                           "missing field \"sdp\"");
  }
  return core::SessionDescription{*type, std::move(*sdp)};
}

} // namespace signaling::wire
