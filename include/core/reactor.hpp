#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns the io_context shared by the signaling listener, the transport's
//   acceptors/dialers and every data channel read loop
// - Runs io_context::run() on N std::jthread workers; per-connection state is
//   serialised on strands, so N > 1 is safe
// - Blocking work (offer handling, file streaming) never runs here; it lives
//   on the handler pool and on session threads
class Reactor {
public:
  Reactor() = default;

  net::io_context &GetIoContext() { return ioc_; }

  void Start(int numThreads = 2) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
    threads_.clear();
  }

  ~Reactor() { Stop(); }

private:
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
