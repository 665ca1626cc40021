#pragma once

#include <dns_sd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/discovery/service_browser.hpp"

namespace threadnet::discovery::dnssd {

/*
  DnssdBrowser

  ServiceBrowser over the DNS-SD client library (mDNSResponder or the
  avahi compat layer). A single loop thread owns every DNSServiceRef and
  multiplexes their sockets with select(). Public calls post work to the
  loop through a self-pipe; listener and resolve callbacks always run on
  the loop thread after the library callback has returned.
*/
class DnssdBrowser final : public ServiceBrowser {
 public:
  DnssdBrowser();
  // Every resolve still pending, or posted but not yet started, completes
  // with nullopt before this returns.
  ~DnssdBrowser() override;

  DnssdBrowser(const DnssdBrowser&)            = delete;
  DnssdBrowser& operator=(const DnssdBrowser&) = delete;

  // Blocks until the browse is registered. Throws std::runtime_error when
  // the daemon rejects it.
  void AddServiceListener(const std::string& type, std::shared_ptr<ServiceListener> listener) override;
  void RemoveServiceListener(const std::shared_ptr<ServiceListener>& listener) override;
  void ResolveService(const std::string& type, const std::string& name, std::chrono::milliseconds timeout,
                      ResolveCallback callback) override;

 private:
  struct Instance {
    std::string instance;
    std::string regtype;
    std::string domain;
    uint32_t    interface_index = kDNSServiceInterfaceIndexAny;
  };

  struct Browse {
    DnssdBrowser*                    owner = nullptr;
    std::string                      type;
    std::shared_ptr<ServiceListener> listener;
    DNSServiceRef                    ref = nullptr;
    // full instance name -> instance
    std::map<std::string, Instance> instances;
  };

  struct Resolution {
    DnssdBrowser*                         owner = nullptr;
    std::string                           type;
    std::string                           name;
    Instance                              instance;
    std::chrono::steady_clock::time_point deadline;
    ResolveCallback                       callback;
    DNSServiceRef                         ref       = nullptr;
    bool                                  resolved  = false;
    bool                                  done      = false;
    bool                                  succeeded = false;
    ServiceInfo                           info;
  };

  using Command = std::function<void()>;

  static void DNSSD_API HandleBrowseResult(DNSServiceRef ref, DNSServiceFlags flags, uint32_t interface_index,
                                           DNSServiceErrorType error, const char* instance_name, const char* regtype,
                                           const char* domain, void* context);
  static void DNSSD_API HandleResolveResult(DNSServiceRef ref, DNSServiceFlags flags, uint32_t interface_index,
                                            DNSServiceErrorType error, const char* full_name, const char* host_target,
                                            uint16_t port, uint16_t txt_len, const unsigned char* txt_record, void* context);
  static void DNSSD_API HandleAddrInfoResult(DNSServiceRef ref, DNSServiceFlags flags, uint32_t interface_index,
                                             DNSServiceErrorType error, const char* host_name, const struct sockaddr* address,
                                             uint32_t ttl, void* context);

  void Post(Command command);
  bool OnLoopThread() const;
  void Run();
  void RunCommands(std::vector<Command>& commands);

  void StartBrowse(std::unique_ptr<Browse> browse);
  void StopBrowse(const std::shared_ptr<ServiceListener>& listener);
  void StartResolve(std::unique_ptr<Resolution> resolution);
  void Finish(Resolution* resolution, bool success);
  void ExpireResolutions(std::chrono::steady_clock::time_point now);
  void Reap();
  void RunDeferred();
  bool IsLive(DNSServiceRef ref) const;

  std::thread       thread_;
  std::thread::id   thread_id_;
  int               wake_pipe_[2] = {-1, -1};
  std::atomic<bool> stopping_{false};

  std::mutex           mutex_;
  std::vector<Command> commands_;

  // Loop thread only.
  std::vector<std::unique_ptr<Browse>>   browses_;
  std::list<std::unique_ptr<Resolution>> resolutions_;
  std::vector<Command>                   deferred_;
};

} // namespace threadnet::discovery::dnssd
