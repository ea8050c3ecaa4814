#pragma once

#include "core/error.hpp"
#include "core/session_description.hpp"
#include "logging/logger.hpp"
#include "transport/peer_connection.hpp"
#include <chrono>
#include <stop_token>
#include <string>

namespace signaling {

enum class SignalingState {
  idle,
  have_local_offer,
  have_remote_offer,
  stable,
};

inline const char *ToString(SignalingState state) {
  switch (state) {
  case SignalingState::idle:
    return "idle";
  case SignalingState::have_local_offer:
    return "have-local-offer";
  case SignalingState::have_remote_offer:
    return "have-remote-offer";
  case SignalingState::stable:
    return "stable";
  }
  return "unknown";
}

// SignalingExchange
// Drives the offer/answer protocol for one PeerConnection:
//   offerer:  CreateLocalDescription(offer)  -> ApplyRemoteDescription(answer)
//   answerer: ApplyRemoteDescription(offer)  -> CreateLocalDescription(answer)
// CreateLocalDescription returns only once candidate gathering is complete,
// bounded by gather_timeout and by the caller's stop token. Not thread-safe;
// one exchange is driven by one thread.
class SignalingExchange {
public:
  SignalingExchange(transport::PeerConnection &pc, logging::Logger &log,
                    std::chrono::milliseconds gather_timeout)
      : pc_(pc), log_(log), gather_timeout_(gather_timeout) {}

  core::Result<core::SessionDescription>
  CreateLocalDescription(core::SdpType type, std::stop_token st = {}) {
    if (type == core::SdpType::offer && state_ != SignalingState::idle) {
      return Reject("create an offer");
    }
    if (type == core::SdpType::answer &&
        state_ != SignalingState::have_remote_offer) {
      return Reject("create an answer");
    }

    logging::ScopedTimer timer(log_, kComponent,
                               std::string("Creating ") +
                                   core::ToString(type));
    auto desc = type == core::SdpType::offer ? pc_.CreateOffer()
                                             : pc_.CreateAnswer();
    if (!desc) {
      return std::unexpected(desc.error());
    }
    if (auto st_local = pc_.SetLocalDescription(*desc); !st_local) {
      return std::unexpected(st_local.error());
    }
    const auto deadline =
        transport::PeerConnection::Clock::now() + gather_timeout_;
    if (auto st_gather = pc_.AwaitGathering(st, deadline); !st_gather) {
      return std::unexpected(st_gather.error());
    }
    auto final_desc = pc_.LocalDescription();
    if (!final_desc) {
      return core::MakeError(core::ErrorKind::negotiation,
                             "local description unavailable after gathering");
    }
    state_ = type == core::SdpType::offer ? SignalingState::have_local_offer
                                          : SignalingState::stable;
    log_.Debug(kComponent, "Signaling state: ", ToString(state_));
    return *final_desc;
  }

  core::Status ApplyRemoteDescription(const core::SessionDescription &desc) {
    if (desc.type == core::SdpType::offer && state_ != SignalingState::idle) {
      return Reject("apply a remote offer");
    }
    if (desc.type == core::SdpType::answer &&
        state_ != SignalingState::have_local_offer) {
      return Reject("apply a remote answer");
    }
    if (auto st = pc_.SetRemoteDescription(desc); !st) {
      return st;
    }
    state_ = desc.type == core::SdpType::offer
                 ? SignalingState::have_remote_offer
                 : SignalingState::stable;
    log_.Debug(kComponent, "Signaling state: ", ToString(state_));
    return {};
  }

  SignalingState State() const { return state_; }

private:
  static constexpr std::string_view kComponent = "signaling";

  std::unexpected<core::Error> Reject(const std::string &what) const {
    return core::MakeError(core::ErrorKind::negotiation,
                           "cannot " + what + " in state " +
                               ToString(state_));
  }

  transport::PeerConnection &pc_;
  logging::Logger &log_;
  std::chrono::milliseconds gather_timeout_;
  SignalingState state_ = SignalingState::idle;
};

} // namespace signaling
