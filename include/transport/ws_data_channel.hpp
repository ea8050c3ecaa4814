#pragma once

#include "core/error.hpp"
#include "logging/logger.hpp"
#include "transport/data_channel.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace transport {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

// WsDataChannel
// Threading model:
// - All stream operations run on the owning peer connection's strand; the
//   read loop is a coroutine spawned there once Attach() hands over an
//   upgraded WebSocket
// - SendText may be called from any non-reactor thread: it posts the frame
//   to the strand and blocks on a future until the write completes, so a
//   sender observes failures line by line
// - Writes are queued; Close() waits for queued writes before sending the
//   close frame
class WsDataChannel : public DataChannel,
                      public std::enable_shared_from_this<WsDataChannel> {
public:
  using Strand = net::strand<net::io_context::executor_type>;
  using Stream = websocket::stream<beast::tcp_stream>;

  static constexpr std::chrono::seconds kSendTimeout{30};

  WsDataChannel(Strand strand, std::string label, logging::Logger &log)
      : strand_(std::move(strand)), label_(std::move(label)), log_(log) {}

  const std::string &Label() const override { return label_; }

  bool IsOpen() const override { return state_.load() == State::open; }

  // Must run on the strand. Takes over an upgraded stream and starts reading.
  void Attach(Stream ws) {
    if (state_.load() != State::pending) {
      beast::error_code ec;
      beast::get_lowest_layer(ws).socket().close(ec);
      return;
    }
    ws_.emplace(std::move(ws));
    ws_->text(true);
    state_.store(State::open);
    log_.Info(kComponent, "Data channel opened: ", label_);
    events_.Push(Opened{});
    net::spawn(strand_, [self = shared_from_this()](net::yield_context yield) {
      self->ReadLoop(yield);
    });
  }

  core::Status SendText(std::string_view text) override {
    if (state_.load() != State::open) {
      return core::MakeError(core::ErrorKind::transport,
                             "data channel is not open");
    }
    auto done = std::make_shared<std::promise<core::Status>>();
    auto result = done->get_future();
    net::post(strand_, [self = shared_from_this(), text = std::string(text),
                        done]() mutable {
      if (self->state_.load() != State::open) {
        done->set_value(core::MakeError(core::ErrorKind::transport,
                                        "data channel closed"));
        return;
      }
      self->writes_.push_back(PendingWrite{std::move(text), std::move(done)});
      if (self->writes_.size() == 1) {
        self->DoWrite();
      }
    });
    if (result.wait_for(kSendTimeout) != std::future_status::ready) {
      return core::MakeError(core::ErrorKind::transport,
                             "send timed out after " +
                                 std::to_string(kSendTimeout.count()) + "s");
    }
    return result.get();
  }

  void Close() override {
    net::post(strand_, [self = shared_from_this()] { self->DoClose(); });
  }

private:
  static constexpr std::string_view kComponent = "transport";

  enum class State { pending, open, closing, closed };

  struct PendingWrite {
    std::string text;
    std::shared_ptr<std::promise<core::Status>> done;
  };

  void ReadLoop(net::yield_context yield) {
    for (;;) {
      beast::error_code ec;
      buffer_.clear();
      ws_->async_read(buffer_, yield[ec]);
      if (ec) {
        Finish(ClassifyReadError(ec));
        return;
      }
      events_.Push(MessageReceived{beast::buffers_to_string(buffer_.data())});
    }
  }

  std::optional<core::Error> ClassifyReadError(const beast::error_code &ec) {
    if (ec == websocket::error::closed) {
      return std::nullopt;
    }
    if (ec == net::error::operation_aborted &&
        state_.load() == State::closing) {
      return std::nullopt;
    }
    if (ec == net::error::eof) {
      return core::EndOfStream();
    }
    return core::FromErrorCode(core::ErrorKind::transport, "read", ec);
  }

  void DoWrite() {
    ws_->async_write(
        net::buffer(writes_.front().text),
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
          self->OnWrite(ec);
        });
  }

  void OnWrite(const beast::error_code &ec) {
    PendingWrite w = std::move(writes_.front());
    writes_.pop_front();
    if (ec) {
      w.done->set_value(std::unexpected(
          core::FromErrorCode(core::ErrorKind::transport, "send", ec)));
      FailPending("data channel write failed");
      return;
    }
    w.done->set_value({});
    if (!writes_.empty()) {
      DoWrite();
    } else if (state_.load() == State::closing) {
      StartClose();
    }
  }

  void DoClose() {
    switch (state_.load()) {
    case State::pending:
      Finish(std::nullopt);
      break;
    case State::open:
      state_.store(State::closing);
      if (writes_.empty()) {
        StartClose();
      }
      break;
    case State::closing:
    case State::closed:
      break;
    }
  }

  void StartClose() {
    ws_->async_close(websocket::close_code::normal,
                     [self = shared_from_this()](beast::error_code ec) {
                       if (ec) {
                         self->log_.Debug(kComponent, "close handshake on ",
                                          self->label_, ": ", ec.message());
                         beast::get_lowest_layer(*self->ws_).close();
                       }
                     });
  }

  void FailPending(const std::string &why) {
    while (!writes_.empty()) {
      writes_.front().done->set_value(
          core::MakeError(core::ErrorKind::transport, why));
      writes_.pop_front();
    }
  }

  void Finish(std::optional<core::Error> reason) {
    if (state_.exchange(State::closed) == State::closed) {
      return;
    }
    FailPending("data channel closed");
    if (reason && !core::IsEndOfStream(*reason)) {
      log_.Error(kComponent, "Data channel ", label_,
                 " failed: ", reason->message);
    } else {
      log_.Info(kComponent, "Data channel closed: ", label_);
    }
    events_.Push(Closed{std::move(reason)});
    events_.Close();
  }

  Strand strand_;
  std::string label_;
  logging::Logger &log_;
  std::atomic<State> state_{State::pending};
  std::optional<Stream> ws_;
  beast::flat_buffer buffer_;
  std::deque<PendingWrite> writes_;
};

} // namespace transport
