#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <map>
#include <string>
#include <vector>

namespace lifecycle {

// SessionRegistry
// The set of in-flight sender sessions. Register/Unregister may be called
// from any session thread; shutdown blocks in AwaitEmpty until every
// session has finished.
class SessionRegistry {
public:
  using Id = std::size_t;

  // RAII registration; unregisters on destruction.
  class Lease {
  public:
    Lease(SessionRegistry &registry, const std::string &name)
        : registry_(&registry), id_(registry.Register(name)) {}
    ~Lease() {
      if (registry_) {
        registry_->Unregister(id_);
      }
    }
    Lease(Lease &&other) noexcept
        : registry_(other.registry_), id_(other.id_) {
      other.registry_ = nullptr;
    }
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    Lease &operator=(Lease &&) = delete;

    Id GetId() const { return id_; }

  private:
    SessionRegistry *registry_;
    Id id_;
  };

  Id Register(const std::string &name) {
    std::lock_guard lock(mu_);
    const Id id = next_id_++;
    active_.emplace(id, name);
    return id;
  }

  // Unknown ids are ignored.
  void Unregister(Id id) {
    bool empty = false;
    {
      std::lock_guard lock(mu_);
      active_.erase(id);
      empty = active_.empty();
    }
    if (empty) {
      cv_.notify_all();
    }
  }

  void AwaitEmpty() {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return active_.empty(); });
  }

  // Returns false if sessions were still running when `timeout` elapsed.
  template <typename Rep, typename Period>
  bool AwaitEmptyFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mu_);
    return cv_.wait_for(lock, timeout, [this] { return active_.empty(); });
  }

  std::size_t Active() const {
    std::lock_guard lock(mu_);
    return active_.size();
  }

  std::vector<std::string> Names() const {
    std::lock_guard lock(mu_);
    std::vector<std::string> out;
    out.reserve(active_.size());
    for (const auto &[id, name] : active_) {
      out.push_back(name);
    }
    return out;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<Id, std::string> active_;
  Id next_id_ = 1;
};

} // namespace lifecycle
