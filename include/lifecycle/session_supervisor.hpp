#pragma once

#include "lifecycle/session_registry.hpp"
#include "logging/logger.hpp"
#include "streaming/stream_session.hpp"
#include "transport/data_channel.hpp"
#include "transport/peer_connection.hpp"
#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <variant>

namespace lifecycle {

// SessionSupervisor
// Threading model:
// - Adopt() is called from signaling worker threads; it starts one watcher
//   std::jthread per negotiated channel
// - A watcher waits (bounded by open_timeout, cancelled by Drain) for the
//   channel's Opened event, then runs a StreamSession under a registry
//   lease. Once streaming it no longer observes the stop token
// - The lease is held until the channel reports Closed, so an empty registry
//   means every close handshake has run on the reactor
// - Drain(): stop pending watchers, wait for the registry to empty, join
class SessionSupervisor {
public:
  struct Settings {
    std::string path;
    std::chrono::milliseconds delay{1000};
    std::chrono::milliseconds open_timeout{30000};
    // How long a finished session waits for its channel's close handshake.
    std::chrono::milliseconds close_timeout{5000};
  };

  using StreamingFn = std::function<void()>;

  SessionSupervisor(Settings settings, SessionRegistry &registry,
                    logging::Logger &log, StreamingFn on_streaming = {})
      : settings_(std::move(settings)), registry_(registry), log_(log),
        on_streaming_(std::move(on_streaming)) {}

  ~SessionSupervisor() { Drain(); }

  SessionSupervisor(const SessionSupervisor &) = delete;
  SessionSupervisor &operator=(const SessionSupervisor &) = delete;

  // Takes ownership of a negotiated connection. After Drain() the connection
  // is closed immediately.
  void Adopt(std::shared_ptr<transport::PeerConnection> pc,
             std::shared_ptr<transport::DataChannel> channel) {
    std::lock_guard lock(mu_);
    Reap();
    if (draining_) {
      log_.Info(kComponent, "Shutting down, dropping new session ",
                channel->Label());
      pc->Close();
      return;
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    const std::size_t number = ++adopted_;
    workers_.push_back(Worker{
        std::jthread([this, pc = std::move(pc), channel = std::move(channel),
                      done, number](std::stop_token st) {
          Watch(st, pc, channel, number);
          done->store(true);
        }),
        done});
  }

  void Drain() {
    std::list<Worker> workers;
    {
      std::lock_guard lock(mu_);
      if (draining_) {
        return;
      }
      draining_ = true;
      for (auto &w : workers_) {
        w.thread.request_stop();
      }
      workers.swap(workers_);
    }
    if (registry_.Active() > 0) {
      log_.Info(kComponent, "Waiting for ", registry_.Active(),
                " active session(s) to finish");
    }
    registry_.AwaitEmpty();
    workers.clear();
  }

  std::size_t Adopted() const {
    std::lock_guard lock(mu_);
    return adopted_;
  }

private:
  static constexpr std::string_view kComponent = "server";

  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // Joins finished watchers; mu_ held.
  void Reap() {
    workers_.remove_if([](const Worker &w) { return w.done->load(); });
  }

  bool WaitOpened(std::stop_token st, transport::DataChannel &channel) {
    const auto deadline =
        std::chrono::steady_clock::now() + settings_.open_timeout;
    for (;;) {
      auto ev = channel.Events().ReceiveUntil(st, deadline);
      if (!ev) {
        if (st.stop_requested()) {
          log_.Info(kComponent, "Shutdown before data channel ",
                    channel.Label(), " opened");
        } else if (channel.Events().IsClosed()) {
          log_.Error(kComponent, "Data channel ", channel.Label(),
                     " closed before opening");
        } else {
          log_.Error(kComponent, "Data channel ", channel.Label(),
                     " did not open within ",
                     timeutil::FormatDuration(settings_.open_timeout));
        }
        return false;
      }
      if (std::holds_alternative<transport::Opened>(*ev)) {
        return true;
      }
      if (auto *closed = std::get_if<transport::Closed>(&*ev)) {
        log_.Error(kComponent, "Data channel ", channel.Label(),
                   " closed before opening",
                   closed->reason ? ": " + closed->reason->message
                                  : std::string());
        return false;
      }
    }
  }

  void Watch(std::stop_token st,
             const std::shared_ptr<transport::PeerConnection> &pc,
             const std::shared_ptr<transport::DataChannel> &channel,
             std::size_t number) {
    if (!WaitOpened(st, *channel)) {
      pc->Close();
      return;
    }
    const std::string name =
        channel->Label() + "#" + std::to_string(number);
    std::optional<SessionRegistry::Lease> lease;
    {
      std::lock_guard lock(mu_);
      if (draining_) {
        log_.Info(kComponent, "Shutting down, not starting session ", name);
        pc->Close();
        return;
      }
      lease.emplace(registry_, name);
    }
    if (on_streaming_) {
      on_streaming_();
    }
    log_.Info(kComponent, "Starting stream session ", name, " for ",
              settings_.path);
    streaming::StreamSession session(channel, settings_.path, settings_.delay,
                                     log_);
    auto st_run = session.Run();
    if (st_run) {
      log_.Info(kComponent, "Stream session ", name, " completed");
    }
    AwaitClosed(*channel, name);
    pc->Close();
  }

  // Close() only queues the handshake on the reactor; wait for its outcome.
  void AwaitClosed(transport::DataChannel &channel, const std::string &name) {
    const auto deadline =
        std::chrono::steady_clock::now() + settings_.close_timeout;
    for (;;) {
      auto ev = channel.Events().ReceiveUntil({}, deadline);
      if (!ev) {
        if (!channel.Events().IsClosed()) {
          log_.Error(kComponent, "Data channel of ", name,
                     " did not close within ",
                     timeutil::FormatDuration(settings_.close_timeout));
        }
        return;
      }
      if (std::holds_alternative<transport::Closed>(*ev)) {
        log_.Debug(kComponent, "Data channel of ", name, " closed");
        return;
      }
    }
  }

  Settings settings_;
  SessionRegistry &registry_;
  logging::Logger &log_;
  StreamingFn on_streaming_;

  mutable std::mutex mu_;
  bool draining_ = false;
  std::size_t adopted_ = 0;
  std::list<Worker> workers_;
};

} // namespace lifecycle
