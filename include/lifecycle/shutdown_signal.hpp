#pragma once

#include "logging/logger.hpp"
#include <boost/asio.hpp>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <stop_token>

namespace lifecycle {

namespace net = boost::asio;

// ShutdownSignal
// Turns SIGINT/SIGTERM (delivered through the reactor's signal_set) into a
// std::stop_token. Trigger() does the same programmatically.
class ShutdownSignal {
public:
  ShutdownSignal(net::io_context &ioc, logging::Logger &log)
      : signals_(ioc, SIGINT, SIGTERM), log_(log) {
    signals_.async_wait([this](const boost::system::error_code &ec, int sig) {
      if (ec) {
        return;
      }
      log_.Info(kComponent, "Received signal ", sig, ", shutting down");
      Trigger();
    });
  }

  ~ShutdownSignal() {
    boost::system::error_code ec;
    signals_.cancel(ec);
  }

  ShutdownSignal(const ShutdownSignal &) = delete;
  ShutdownSignal &operator=(const ShutdownSignal &) = delete;

  std::stop_token Token() const { return source_.get_token(); }

  void Trigger() {
    {
      std::lock_guard lock(mu_);
      source_.request_stop();
    }
    cv_.notify_all();
  }

  bool Triggered() const { return source_.stop_requested(); }

  // Blocks until the signal fires or Trigger() is called.
  void Wait() {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return source_.stop_requested(); });
  }

private:
  static constexpr std::string_view kComponent = "lifecycle";

  net::signal_set signals_;
  logging::Logger &log_;
  std::stop_source source_;
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace lifecycle
