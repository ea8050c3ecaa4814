#pragma once

#include "core/error.hpp"
#include "core/mailbox.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace transport {

// Lifecycle events of one data channel, consumed by an explicit event loop
// (the sender's session watcher or the receiver's line source) instead of
// callbacks fired from transport threads.
struct Opened {};

struct MessageReceived {
  std::string payload;
};

// `reason` is empty for an orderly close, holds end_of_stream when the peer
// went away without a close handshake, and a transport error otherwise.
struct Closed {
  std::optional<core::Error> reason;
};

using ChannelEvent = std::variant<Opened, MessageReceived, Closed>;

// Minimal send capability; FileStreamer only needs this much.
class TextSender {
public:
  virtual ~TextSender() = default;
  virtual core::Status SendText(std::string_view text) = 0;
};

// DataChannel: ordered, reliable duplex message channel.
// Every event is pushed into Events(); Closed is always the last event and
// the mailbox is closed right after it.
class DataChannel : public TextSender {
public:
  virtual const std::string &Label() const = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  core::Mailbox<ChannelEvent> &Events() { return events_; }

protected:
  core::Mailbox<ChannelEvent> events_;
};

} // namespace transport
