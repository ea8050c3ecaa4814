#pragma once

#include "core/error.hpp"
#include "core/mailbox.hpp"
#include "core/session_description.hpp"
#include "transport/data_channel.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>

namespace transport {

enum class ConnectionState {
  new_,
  connecting,
  connected,
  disconnected,
  failed,
  closed,
};

inline const char *ToString(ConnectionState state) {
  switch (state) {
  case ConnectionState::new_:
    return "new";
  case ConnectionState::connecting:
    return "connecting";
  case ConnectionState::connected:
    return "connected";
  case ConnectionState::disconnected:
    return "disconnected";
  case ConnectionState::failed:
    return "failed";
  case ConnectionState::closed:
    return "closed";
  }
  return "unknown";
}

// The offering side does not create its channel; it learns about the one the
// answerer created once the connection is up.
struct DataChannelAnnounced {
  std::shared_ptr<DataChannel> channel;
};

struct StateChanged {
  ConnectionState state;
};

using PeerEvent = std::variant<DataChannelAnnounced, StateChanged>;

// PeerConnection: the external transport capability.
// Produces local descriptions, gathers candidates asynchronously, accepts the
// remote description and eventually yields an open DataChannel. Ordering of
// the offer/answer steps is enforced by signaling::SignalingExchange, not
// here. Owners must call Close() on every path; background tasks keep the
// object alive until then.
class PeerConnection {
public:
  using Clock = std::chrono::steady_clock;

  virtual ~PeerConnection() = default;

  virtual core::Result<core::SessionDescription> CreateOffer() = 0;
  virtual core::Result<core::SessionDescription> CreateAnswer() = 0;

  // Installs the local description and starts candidate gathering.
  virtual core::Status
  SetLocalDescription(const core::SessionDescription &desc) = 0;
  virtual core::Status
  SetRemoteDescription(const core::SessionDescription &desc) = 0;

  // Blocks until gathering completes, `deadline` passes or `st` is stopped.
  // Timeout and cancellation are negotiation errors.
  virtual core::Status AwaitGathering(std::stop_token st,
                                      Clock::time_point deadline) = 0;

  // Final local description (candidates included) once gathering completed.
  virtual std::optional<core::SessionDescription> LocalDescription() const = 0;

  virtual core::Result<std::shared_ptr<DataChannel>>
  CreateDataChannel(const std::string &label) = 0;

  virtual ConnectionState State() const = 0;

  virtual void Close() = 0;

  core::Mailbox<PeerEvent> &Events() { return events_; }

protected:
  core::Mailbox<PeerEvent> events_;
};

class PeerConnectionFactory {
public:
  virtual ~PeerConnectionFactory() = default;
  virtual core::Result<std::shared_ptr<PeerConnection>> Create() = 0;
};

} // namespace transport
