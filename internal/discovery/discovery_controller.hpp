#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/discovery/router_registry.hpp"
#include "internal/discovery/service_browser.hpp"

namespace threadnet::discovery {

struct DiscoveryOptions {
  std::string               service_type    = "_meshcop._udp.local.";
  std::chrono::milliseconds resolve_timeout = std::chrono::milliseconds(3000);
  RouterKeySource           key_source      = RouterKeySource::kExtendedPanId;
};

/*
  DiscoveryController

  Bridges a ServiceBrowser to the RouterRegistry. States: idle and
  subscribed.

  Each add/update triggers an asynchronous resolve. For a given service name
  only the most recently issued resolve may apply; completions that arrive
  after a newer resolve, a remove or Stop() are dropped. Resolves for
  different names apply in completion order.

  Registry mutation and event delivery happen under one lock, so the sink
  sees events in mutation order. The sink must not call back into the
  controller.
*/
class DiscoveryController : public std::enable_shared_from_this<DiscoveryController> {
 public:
  using EventSink = std::function<void(const RouterEvent&)>;

  static std::shared_ptr<DiscoveryController> Create(std::shared_ptr<ServiceBrowser> browser, DiscoveryOptions options, EventSink sink);

  ~DiscoveryController();

  DiscoveryController(const DiscoveryController&)            = delete;
  DiscoveryController& operator=(const DiscoveryController&) = delete;

  // Throws util::InvalidState when already subscribed.
  void Start();
  // No-op when idle.
  void Stop();

  bool                      IsSubscribed() const;
  std::vector<RouterRecord> Routers() const;

  const DiscoveryOptions& options() const {
    return options_;
  }

 private:
  class Listener;

  DiscoveryController(std::shared_ptr<ServiceBrowser> browser, DiscoveryOptions options, EventSink sink);

  void OnServiceChanged(uint64_t session, const std::string& type, const std::string& name);
  void OnServiceRemoved(uint64_t session, const std::string& name);
  void OnResolved(uint64_t session, const std::string& name, uint64_t generation, std::optional<ServiceInfo> info);

  void EmitLocked(const RouterEvent& event);

  std::shared_ptr<ServiceBrowser> browser_;
  DiscoveryOptions                options_;
  EventSink                       sink_;

  mutable std::mutex        mutex_;
  bool                      subscribed_ = false;
  uint64_t                  session_    = 0;
  uint64_t                  next_generation_ = 0;
  std::shared_ptr<Listener> listener_;
  RouterRegistry            registry_;
  // service name -> generation of its latest issued resolve
  std::unordered_map<std::string, uint64_t> pending_;
};

} // namespace threadnet::discovery
