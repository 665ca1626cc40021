#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace threadnet::discovery {

/*
  A resolved DNS-SD service instance.

  TXT properties keep their raw bytes; a key present without "=" maps to
  nullopt.
*/
struct ServiceInfo {
  std::string type;    // "_meshcop._udp.local."
  std::string name;    // full instance name, including the type
  std::string server;  // target host, "host.local."
  uint16_t    port = 0;

  std::vector<std::string> addresses;

  std::map<std::string, std::optional<std::string>> properties;
};

/*
  Raw browse callbacks. Invoked on the browser's thread.
*/
class ServiceListener {
 public:
  virtual ~ServiceListener() = default;

  virtual void AddService(const std::string& type, const std::string& name)    = 0;
  virtual void UpdateService(const std::string& type, const std::string& name) = 0;
  virtual void RemoveService(const std::string& type, const std::string& name) = 0;
};

// nullopt on failure or timeout
using ResolveCallback = std::function<void(std::optional<ServiceInfo>)>;

/*
  ServiceBrowser

  Transport-level DNS-SD browser/resolver. Implementations deliver
  callbacks on their own thread and never from inside the call that
  registered them.
*/
class ServiceBrowser {
 public:
  virtual ~ServiceBrowser() = default;

  virtual void AddServiceListener(const std::string& type, std::shared_ptr<ServiceListener> listener) = 0;

  // Unknown listeners are ignored.
  virtual void RemoveServiceListener(const std::shared_ptr<ServiceListener>& listener) = 0;

  // callback is invoked exactly once.
  virtual void ResolveService(const std::string& type, const std::string& name, std::chrono::milliseconds timeout,
                              ResolveCallback callback) = 0;
};

} // namespace threadnet::discovery
