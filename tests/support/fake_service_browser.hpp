#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/discovery/service_browser.hpp"

namespace threadnet::testing {

/*
  Scripted ServiceBrowser. Browse callbacks are driven by the test and
  resolves stay pending until the test completes them, in any order.
*/
class FakeServiceBrowser final : public discovery::ServiceBrowser {
 public:
  struct PendingResolve {
    std::string                type;
    std::string                name;
    std::chrono::milliseconds  timeout;
    discovery::ResolveCallback callback;
  };

  bool fail_add_listener = false;

  void AddServiceListener(const std::string& type, std::shared_ptr<discovery::ServiceListener> listener) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_add_listener) {
      throw std::runtime_error("mdns daemon unavailable");
    }
    listeners_.emplace_back(type, std::move(listener));
    ++add_calls_;
  }

  void RemoveServiceListener(const std::shared_ptr<discovery::ServiceListener>& listener) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(listeners_, [&](const auto& entry) { return entry.second == listener; });
    ++remove_calls_;
  }

  void ResolveService(const std::string& type, const std::string& name, std::chrono::milliseconds timeout,
                      discovery::ResolveCallback callback) override {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(PendingResolve{type, name, timeout, std::move(callback)});
  }

  void Add(const std::string& name) {
    for (const auto& [type, listener] : Listeners()) listener->AddService(type, name);
  }
  void Update(const std::string& name) {
    for (const auto& [type, listener] : Listeners()) listener->UpdateService(type, name);
  }
  void Remove(const std::string& name) {
    for (const auto& [type, listener] : Listeners()) listener->RemoveService(type, name);
  }

  // Completes the index-th pending resolve (in issue order).
  void Complete(std::size_t index, std::optional<discovery::ServiceInfo> info) {
    PendingResolve pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (index >= pending_.size()) {
        throw std::out_of_range("no such pending resolve");
      }
      pending = std::move(pending_[index]);
      pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(index));
    }
    pending.callback(std::move(info));
  }

  // Completes the oldest pending resolve for name.
  void CompleteFor(const std::string& name, std::optional<discovery::ServiceInfo> info) {
    std::size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = std::find_if(pending_.begin(), pending_.end(), [&](const PendingResolve& p) { return p.name == name; });
      if (it == pending_.end()) {
        throw std::out_of_range("no pending resolve for " + name);
      }
      index = static_cast<std::size_t>(it - pending_.begin());
    }
    Complete(index, std::move(info));
  }

  std::size_t PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
  }
  std::vector<std::string> PendingNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& p : pending_) names.push_back(p.name);
    return names;
  }
  std::size_t ListenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
  }
  int AddCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_calls_;
  }
  int RemoveCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_calls_;
  }

 private:
  using Entry = std::pair<std::string, std::shared_ptr<discovery::ServiceListener>>;

  std::vector<Entry> Listeners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_;
  }

  mutable std::mutex          mutex_;
  std::vector<Entry>          listeners_;
  std::vector<PendingResolve> pending_;
  int                         add_calls_    = 0;
  int                         remove_calls_ = 0;
};

} // namespace threadnet::testing
