#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace core {

// Mailbox: unbounded MPSC message queue with close semantics.
// Threading model:
// - Any thread may Push/Close; one consumer thread blocks in Receive
// - Receive honours a std::stop_token so shutdown can interrupt a wait
// - After Close, queued items are still delivered; Receive then returns
//   nullopt
template <typename T> class Mailbox {
public:
  using Clock = std::chrono::steady_clock;

  Mailbox() = default;
  Mailbox(const Mailbox &) = delete;
  Mailbox &operator=(const Mailbox &) = delete;

  // Returns false if the mailbox is already closed (item dropped).
  bool Push(T item) {
    {
      std::lock_guard lock(mu_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  void Close() {
    {
      std::lock_guard lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Blocks until an item is available, the mailbox is closed and drained, or
  // a stop is requested.
  std::optional<T> Receive(std::stop_token st = {}) {
    std::unique_lock lock(mu_);
    cv_.wait(lock, st, [this] { return !items_.empty() || closed_; });
    return PopLocked();
  }

  // Same as Receive but also gives up at `deadline`.
  std::optional<T> ReceiveUntil(std::stop_token st, Clock::time_point deadline) {
    std::unique_lock lock(mu_);
    cv_.wait_until(lock, st, deadline,
                   [this] { return !items_.empty() || closed_; });
    return PopLocked();
  }

  bool IsClosed() const {
    std::lock_guard lock(mu_);
    return closed_;
  }

private:
  std::optional<T> PopLocked() {
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

} // namespace core
