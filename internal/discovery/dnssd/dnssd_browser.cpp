#include "dnssd_browser.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <future>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace threadnet::discovery::dnssd {

namespace {

constexpr auto kMaxPollInterval = std::chrono::milliseconds(1000);

// "_meshcop._udp.local." -> {"_meshcop._udp", "local."}
std::pair<std::string, std::string> SplitServiceType(const std::string& type) {
  for (const char* proto : {"._udp", "._tcp"}) {
    auto pos = type.find(proto);
    if (pos == std::string::npos) continue;

    std::string regtype = type.substr(0, pos + 5);
    std::string domain  = type.substr(pos + 5);
    if (!domain.empty() && domain.front() == '.') domain.erase(0, 1);
    if (domain.empty()) domain = "local.";
    return {regtype, domain};
  }
  return {type, "local."};
}

std::string FullName(const std::string& instance, const std::string& regtype, const std::string& domain) {
  char buffer[kDNSServiceMaxDomainName];
  if (DNSServiceConstructFullName(buffer, instance.c_str(), regtype.c_str(), domain.c_str()) == 0) {
    return buffer;
  }
  std::string name = instance + "." + regtype;
  if (name.back() != '.') name += ".";
  return name + domain;
}

std::optional<std::string> FormatAddress(const struct sockaddr* address) {
  char buffer[INET6_ADDRSTRLEN];
  if (address->sa_family == AF_INET) {
    auto* in = reinterpret_cast<const struct sockaddr_in*>(address);
    if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer))) return std::string(buffer);
  } else if (address->sa_family == AF_INET6) {
    auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(address);
    if (inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer))) return std::string(buffer);
  }
  return std::nullopt;
}

void ParseTxtRecord(uint16_t txt_len, const unsigned char* txt_record, ServiceInfo* info) {
  uint16_t count = TXTRecordGetCount(txt_len, txt_record);
  for (uint16_t i = 0; i < count; ++i) {
    char        key[256];
    uint8_t     value_len = 0;
    const void* value     = nullptr;
    if (TXTRecordGetItemAtIndex(txt_len, txt_record, i, sizeof(key), key, &value_len, &value) != kDNSServiceErr_NoError) {
      continue;
    }
    if (value) {
      info->properties[key] = std::string(static_cast<const char*>(value), value_len);
    } else {
      info->properties[key] = std::nullopt;
    }
  }
}

} // namespace

DnssdBrowser::DnssdBrowser() {
  if (pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
    throw std::runtime_error(std::string("dnssd browser: pipe failed: ") + std::strerror(errno));
  }
  thread_    = std::thread([this] { Run(); });
  thread_id_ = thread_.get_id();
}

DnssdBrowser::~DnssdBrowser() {
  stopping_ = true;
  Post([] {});
  if (thread_.joinable()) thread_.join();

  for (auto& browse : browses_) {
    if (browse->ref) {
      DNSServiceRefDeallocate(browse->ref);
      browse->ref = nullptr;
    }
  }
  browses_.clear();

  for (auto& resolution : resolutions_) {
    if (resolution->ref) {
      DNSServiceRefDeallocate(resolution->ref);
      resolution->ref = nullptr;
    }
    Finish(resolution.get(), false);
  }

  // Commands posted after the loop's last pass still run: starts fail and
  // resolves complete empty while stopping_ is set.
  for (;;) {
    Reap();
    RunDeferred();

    std::vector<Command> commands;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      commands.swap(commands_);
    }
    if (commands.empty()) break;
    RunCommands(commands);
  }

  close(wake_pipe_[0]);
  close(wake_pipe_[1]);
}

void DnssdBrowser::AddServiceListener(const std::string& type, std::shared_ptr<ServiceListener> listener) {
  auto browse      = std::make_unique<Browse>();
  browse->owner    = this;
  browse->type     = type;
  browse->listener = std::move(listener);

  if (OnLoopThread()) {
    StartBrowse(std::move(browse));
    return;
  }
  if (stopping_) {
    throw std::runtime_error("dnssd browser is shutting down");
  }

  auto  started = std::make_shared<std::promise<void>>();
  auto  result  = started->get_future();
  auto* raw     = browse.release();
  Post([this, raw, started] {
    try {
      StartBrowse(std::unique_ptr<Browse>(raw));
      started->set_value();
    } catch (const std::exception&) {
      started->set_exception(std::current_exception());
    }
  });
  result.get();
}

void DnssdBrowser::RemoveServiceListener(const std::shared_ptr<ServiceListener>& listener) {
  Post([this, listener] { StopBrowse(listener); });
}

void DnssdBrowser::ResolveService(const std::string& type, const std::string& name, std::chrono::milliseconds timeout,
                                  ResolveCallback callback) {
  auto resolution      = std::make_shared<Resolution>();
  resolution->owner    = this;
  resolution->type     = type;
  resolution->name     = name;
  resolution->deadline = std::chrono::steady_clock::now() + timeout;
  resolution->callback = std::move(callback);

  Post([this, resolution] { StartResolve(std::make_unique<Resolution>(std::move(*resolution))); });
}

void DnssdBrowser::Post(Command command) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    commands_.push_back(std::move(command));
  }
  const char byte = 1;
  if (write(wake_pipe_[1], &byte, 1) < 0 && errno != EAGAIN) {
    THREADNET_LOG_WARN("dnssd browser: wake write failed", {observability::StringField("error", std::strerror(errno))});
  }
}

bool DnssdBrowser::OnLoopThread() const {
  return std::this_thread::get_id() == thread_id_;
}

void DnssdBrowser::Run() {
  while (!stopping_) {
    fd_set read_set;
    FD_ZERO(&read_set);
    FD_SET(wake_pipe_[0], &read_set);
    int max_fd = wake_pipe_[0];

    std::vector<std::pair<DNSServiceRef, int>> polled;
    auto watch = [&](DNSServiceRef ref) {
      int fd = DNSServiceRefSockFD(ref);
      if (fd < 0) return;
      FD_SET(fd, &read_set);
      max_fd = std::max(max_fd, fd);
      polled.emplace_back(ref, fd);
    };
    for (const auto& browse : browses_) {
      if (browse->ref) watch(browse->ref);
    }

    auto now  = std::chrono::steady_clock::now();
    auto wait = std::chrono::duration_cast<std::chrono::microseconds>(kMaxPollInterval);
    for (const auto& resolution : resolutions_) {
      if (resolution->done) continue;
      if (resolution->ref) watch(resolution->ref);
      auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(resolution->deadline - now);
      wait           = std::max(std::chrono::microseconds(0), std::min(wait, remaining));
    }

    struct timeval timeout;
    timeout.tv_sec  = static_cast<time_t>(wait.count() / 1000000);
    timeout.tv_usec = static_cast<suseconds_t>(wait.count() % 1000000);

    int ready = select(max_fd + 1, &read_set, nullptr, nullptr, &timeout);
    if (ready < 0) {
      if (errno == EINTR) continue;
      THREADNET_LOG_ERROR("dnssd browser: select failed", {observability::StringField("error", std::strerror(errno))});
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }

    if (ready > 0 && FD_ISSET(wake_pipe_[0], &read_set)) {
      char drain[64];
      while (read(wake_pipe_[0], drain, sizeof(drain)) > 0) {
      }
    }

    std::vector<Command> commands;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      commands.swap(commands_);
    }
    RunCommands(commands);
    if (stopping_) break;

    // Commands may have released refs whose fds were polled. Readiness is
    // level-triggered, so anything skipped here is reported again.
    if (ready > 0 && commands.empty()) {
      for (const auto& [ref, fd] : polled) {
        if (!FD_ISSET(fd, &read_set) || !IsLive(ref)) continue;
        DNSServiceErrorType error = DNSServiceProcessResult(ref);
        if (error != kDNSServiceErr_NoError) {
          THREADNET_LOG_WARN("dnssd browser: process result failed", {observability::IntField("error", error)});
        }
      }
    }

    ExpireResolutions(std::chrono::steady_clock::now());
    Reap();
    RunDeferred();
  }
}

void DnssdBrowser::RunCommands(std::vector<Command>& commands) {
  for (auto& command : commands) {
    try {
      command();
    } catch (const std::exception& e) {
      THREADNET_LOG_ERROR("dnssd browser: command failed", {observability::StringField("error", e.what())});
    }
  }
}

bool DnssdBrowser::IsLive(DNSServiceRef ref) const {
  for (const auto& browse : browses_) {
    if (browse->ref == ref) return true;
  }
  for (const auto& resolution : resolutions_) {
    if (!resolution->done && resolution->ref == ref) return true;
  }
  return false;
}

void DnssdBrowser::StartBrowse(std::unique_ptr<Browse> browse) {
  if (stopping_) {
    throw std::runtime_error("dnssd browser is shutting down");
  }

  auto [regtype, domain] = SplitServiceType(browse->type);

  DNSServiceErrorType error = DNSServiceBrowse(&browse->ref, 0, kDNSServiceInterfaceIndexAny, regtype.c_str(), domain.c_str(),
                                               HandleBrowseResult, browse.get());
  if (error != kDNSServiceErr_NoError) {
    throw std::runtime_error("DNSServiceBrowse failed for " + browse->type + ": error " + std::to_string(error));
  }

  THREADNET_LOG_INFO("dnssd browse started", {observability::StringField("type", browse->type)});
  browses_.push_back(std::move(browse));
}

void DnssdBrowser::StopBrowse(const std::shared_ptr<ServiceListener>& listener) {
  auto it = std::find_if(browses_.begin(), browses_.end(), [&](const auto& browse) { return browse->listener == listener; });
  if (it == browses_.end()) return;

  if ((*it)->ref) DNSServiceRefDeallocate((*it)->ref);
  THREADNET_LOG_INFO("dnssd browse stopped", {observability::StringField("type", (*it)->type)});
  browses_.erase(it);
}

void DnssdBrowser::StartResolve(std::unique_ptr<Resolution> resolution) {
  Resolution* raw = resolution.get();
  resolutions_.push_back(std::move(resolution));

  if (stopping_) {
    Finish(raw, false);
    return;
  }

  bool known = false;
  for (const auto& browse : browses_) {
    if (browse->type != raw->type) continue;
    auto it = browse->instances.find(raw->name);
    if (it != browse->instances.end()) {
      raw->instance = it->second;
      known         = true;
      break;
    }
  }
  if (!known) {
    auto [regtype, domain] = SplitServiceType(raw->type);
    std::string suffix     = "." + raw->type;
    if (raw->name.size() <= suffix.size() || raw->name.compare(raw->name.size() - suffix.size(), suffix.size(), suffix) != 0) {
      THREADNET_LOG_DEBUG("dnssd resolve: name does not match type", {observability::StringField("name", raw->name)});
      Finish(raw, false);
      return;
    }
    raw->instance.instance = raw->name.substr(0, raw->name.size() - suffix.size());
    raw->instance.regtype  = regtype;
    raw->instance.domain   = domain;
  }

  DNSServiceErrorType error =
      DNSServiceResolve(&raw->ref, kDNSServiceFlagsTimeout, raw->instance.interface_index, raw->instance.instance.c_str(),
                        raw->instance.regtype.c_str(), raw->instance.domain.c_str(), HandleResolveResult, raw);
  if (error != kDNSServiceErr_NoError) {
    raw->ref = nullptr;
    THREADNET_LOG_WARN("DNSServiceResolve failed", {observability::StringField("name", raw->name), observability::IntField("error", error)});
    Finish(raw, false);
  }
}

void DnssdBrowser::Finish(Resolution* resolution, bool success) {
  if (resolution->done) return;
  resolution->done      = true;
  resolution->succeeded = success;
}

void DnssdBrowser::ExpireResolutions(std::chrono::steady_clock::time_point now) {
  for (auto& resolution : resolutions_) {
    if (resolution->done || now < resolution->deadline) continue;
    THREADNET_LOG_DEBUG("dnssd resolve timed out",
                        {observability::StringField("name", resolution->name), observability::BoolField("resolved", resolution->resolved)});
    // A resolved SRV/TXT without addresses is still usable.
    Finish(resolution.get(), resolution->resolved);
  }
}

void DnssdBrowser::Reap() {
  for (auto it = resolutions_.begin(); it != resolutions_.end();) {
    auto& resolution = *it;
    if (!resolution->done) {
      ++it;
      continue;
    }
    if (resolution->ref) {
      DNSServiceRefDeallocate(resolution->ref);
      resolution->ref = nullptr;
    }

    std::optional<ServiceInfo> result;
    if (resolution->succeeded) result = std::move(resolution->info);
    deferred_.push_back([callback = std::move(resolution->callback), result = std::move(result)]() mutable {
      if (callback) callback(std::move(result));
    });
    it = resolutions_.erase(it);
  }
}

void DnssdBrowser::RunDeferred() {
  std::vector<Command> deferred;
  deferred.swap(deferred_);
  for (auto& command : deferred) {
    try {
      command();
    } catch (const std::exception& e) {
      THREADNET_LOG_ERROR("dnssd browser: callback failed", {observability::StringField("error", e.what())});
    }
  }
}

void DNSSD_API DnssdBrowser::HandleBrowseResult(DNSServiceRef, DNSServiceFlags flags, uint32_t interface_index, DNSServiceErrorType error,
                                                const char* instance_name, const char* regtype, const char* domain, void* context) {
  auto* browse = static_cast<Browse*>(context);

  if (error != kDNSServiceErr_NoError) {
    THREADNET_LOG_WARN("DNSServiceBrowse reply error", {observability::StringField("type", browse->type), observability::IntField("error", error)});
    return;
  }

  std::string name     = FullName(instance_name, regtype, domain);
  auto        listener = browse->listener;
  auto        type     = browse->type;

  if (flags & kDNSServiceFlagsAdd) {
    bool known = browse->instances.count(name) > 0;
    browse->instances[name] = Instance{instance_name, regtype, domain, interface_index};
    browse->owner->deferred_.push_back([listener, type, name, known] {
      if (known) {
        listener->UpdateService(type, name);
      } else {
        listener->AddService(type, name);
      }
    });
  } else {
    if (browse->instances.erase(name) == 0) return;
    browse->owner->deferred_.push_back([listener, type, name] { listener->RemoveService(type, name); });
  }
}

void DNSSD_API DnssdBrowser::HandleResolveResult(DNSServiceRef, DNSServiceFlags, uint32_t interface_index, DNSServiceErrorType error,
                                                 const char*, const char* host_target, uint16_t port, uint16_t txt_len,
                                                 const unsigned char* txt_record, void* context) {
  auto* resolution = static_cast<Resolution*>(context);
  if (resolution->done) return;

  if (error != kDNSServiceErr_NoError) {
    THREADNET_LOG_DEBUG("DNSServiceResolve reply error", {observability::StringField("name", resolution->name), observability::IntField("error", error)});
    resolution->owner->Finish(resolution, false);
    return;
  }

  ServiceInfo& info = resolution->info;
  info.type         = resolution->type;
  info.name         = resolution->name;
  info.server       = host_target ? host_target : "";
  info.port         = ntohs(port);
  ParseTxtRecord(txt_len, txt_record, &info);
  resolution->resolved = true;

  DNSServiceRefDeallocate(resolution->ref);
  resolution->ref = nullptr;

  if (info.server.empty()) {
    resolution->owner->Finish(resolution, true);
    return;
  }

  DNSServiceErrorType addr_error = DNSServiceGetAddrInfo(&resolution->ref, 0, interface_index,
                                                         kDNSServiceProtocol_IPv4 | kDNSServiceProtocol_IPv6, info.server.c_str(),
                                                         HandleAddrInfoResult, resolution);
  if (addr_error != kDNSServiceErr_NoError) {
    resolution->ref = nullptr;
    THREADNET_LOG_WARN("DNSServiceGetAddrInfo failed", {observability::StringField("host", info.server), observability::IntField("error", addr_error)});
    resolution->owner->Finish(resolution, true);
  }
}

void DNSSD_API DnssdBrowser::HandleAddrInfoResult(DNSServiceRef, DNSServiceFlags flags, uint32_t, DNSServiceErrorType error,
                                                  const char*, const struct sockaddr* address, uint32_t, void* context) {
  auto* resolution = static_cast<Resolution*>(context);
  if (resolution->done) return;

  if (error != kDNSServiceErr_NoError) {
    resolution->owner->Finish(resolution, true);
    return;
  }

  if ((flags & kDNSServiceFlagsAdd) && address) {
    if (auto formatted = FormatAddress(address)) {
      auto& addresses = resolution->info.addresses;
      if (std::find(addresses.begin(), addresses.end(), *formatted) == addresses.end()) {
        addresses.push_back(*formatted);
      }
    }
  }

  if (!(flags & kDNSServiceFlagsMoreComing) && !resolution->info.addresses.empty()) {
    resolution->owner->Finish(resolution, true);
  }
}

} // namespace threadnet::discovery::dnssd
