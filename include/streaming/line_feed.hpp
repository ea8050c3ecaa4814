#pragma once

#include "core/error.hpp"
#include "core/mailbox.hpp"
#include "transport/data_channel.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <variant>

namespace streaming {

// Events seen by LineProcessor. A source has two logical streams: lines
// (terminated by LinesClosed) and at most one error (terminated by
// ErrorsClosed). Both are merged into one ordered sequence so the consumer
// waits on whichever produces next.
struct Line {
  std::string text;
};
struct LinesClosed {};
struct Failure {
  core::Error error;
};
struct ErrorsClosed {};

using FeedEvent = std::variant<Line, LinesClosed, Failure, ErrorsClosed>;

class LineSource {
public:
  virtual ~LineSource() = default;
  // Blocks for the next event; nullopt once nothing more can arrive.
  virtual std::optional<FeedEvent> Next() = 0;
};

// LineFeed
// Producer-side handle for a LineSource; any thread may push.
class LineFeed : public LineSource {
public:
  void PushLine(std::string text) { mailbox_.Push(Line{std::move(text)}); }

  void CloseLines() { mailbox_.Push(LinesClosed{}); }

  // Only the first error is delivered.
  void PushError(core::Error error) {
    if (!error_sent_.exchange(true)) {
      mailbox_.Push(Failure{std::move(error)});
    }
  }

  void CloseErrors() { mailbox_.Push(ErrorsClosed{}); }

  std::optional<FeedEvent> Next() override { return mailbox_.Receive(); }

private:
  core::Mailbox<FeedEvent> mailbox_;
  std::atomic<bool> error_sent_{false};
};

// ChannelLineSource
// Adapts a DataChannel's event mailbox:
//   MessageReceived -> Line
//   Closed{}        -> LinesClosed
//   Closed{error}   -> Failure (end_of_stream included)
class ChannelLineSource : public LineSource {
public:
  explicit ChannelLineSource(transport::DataChannel &channel)
      : channel_(channel) {}

  std::optional<FeedEvent> Next() override {
    for (;;) {
      auto ev = channel_.Events().Receive();
      if (!ev) {
        return std::nullopt;
      }
      if (auto *msg = std::get_if<transport::MessageReceived>(&*ev)) {
        return Line{std::move(msg->payload)};
      }
      if (auto *closed = std::get_if<transport::Closed>(&*ev)) {
        if (closed->reason) {
          return Failure{std::move(*closed->reason)};
        }
        return LinesClosed{};
      }
      // Opened carries nothing for the consumer.
    }
  }

private:
  transport::DataChannel &channel_;
};

} // namespace streaming
