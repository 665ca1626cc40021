#include "discovery_controller.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace threadnet::discovery {

/*
  Browser-facing listener. Holds the controller weakly and tags every
  callback with the session it was registered for.
*/
class DiscoveryController::Listener final : public ServiceListener {
 public:
  Listener(std::weak_ptr<DiscoveryController> controller, uint64_t session) : controller_(std::move(controller)), session_(session) {
  }

  void AddService(const std::string& type, const std::string& name) override {
    if (auto controller = controller_.lock()) controller->OnServiceChanged(session_, type, name);
  }

  void UpdateService(const std::string& type, const std::string& name) override {
    if (auto controller = controller_.lock()) controller->OnServiceChanged(session_, type, name);
  }

  void RemoveService(const std::string&, const std::string& name) override {
    if (auto controller = controller_.lock()) controller->OnServiceRemoved(session_, name);
  }

 private:
  std::weak_ptr<DiscoveryController> controller_;
  uint64_t                           session_;
};

std::shared_ptr<DiscoveryController> DiscoveryController::Create(std::shared_ptr<ServiceBrowser> browser, DiscoveryOptions options,
                                                                 EventSink sink) {
  return std::shared_ptr<DiscoveryController>(new DiscoveryController(std::move(browser), std::move(options), std::move(sink)));
}

DiscoveryController::DiscoveryController(std::shared_ptr<ServiceBrowser> browser, DiscoveryOptions options, EventSink sink)
    : browser_(std::move(browser)), options_(std::move(options)), sink_(std::move(sink)) {
  if (!browser_) {
    throw std::invalid_argument("discovery controller requires a service browser");
  }
}

DiscoveryController::~DiscoveryController() {
  std::shared_ptr<Listener> listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = std::move(listener_);
  }
  if (listener) {
    browser_->RemoveServiceListener(listener);
  }
}

void DiscoveryController::Start() {
  std::shared_ptr<Listener> listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscribed_) {
      throw util::InvalidState("router discovery already started");
    }
    subscribed_ = true;
    ++session_;
    listener_ = std::make_shared<Listener>(weak_from_this(), session_);
    listener  = listener_;
  }

  try {
    browser_->AddServiceListener(options_.service_type, listener);
  } catch (const std::exception& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribed_ = false;
    listener_.reset();
    THREADNET_LOG_ERROR("router discovery failed to start", {observability::StringField("error", e.what())});
    throw;
  }

  THREADNET_LOG_INFO("router discovery started", {observability::StringField("service_type", options_.service_type)});
}

void DiscoveryController::Stop() {
  std::shared_ptr<Listener> listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!subscribed_) {
      return;
    }
    subscribed_ = false;
    ++session_;
    listener = std::move(listener_);
    registry_.Clear();
    pending_.clear();
  }

  browser_->RemoveServiceListener(listener);
  THREADNET_LOG_INFO("router discovery stopped");
}

bool DiscoveryController::IsSubscribed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribed_;
}

std::vector<RouterRecord> DiscoveryController::Routers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.Routers();
}

void DiscoveryController::OnServiceChanged(uint64_t session, const std::string& type, const std::string& name) {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!subscribed_ || session != session_) {
      return;
    }
    generation     = ++next_generation_;
    pending_[name] = generation;
  }

  THREADNET_LOG_DEBUG("resolving service", {observability::StringField("name", name), observability::IntField("generation", static_cast<int64_t>(generation))});

  std::weak_ptr<DiscoveryController> weak = weak_from_this();
  browser_->ResolveService(type, name, options_.resolve_timeout, [weak, session, name, generation](std::optional<ServiceInfo> info) {
    if (auto controller = weak.lock()) {
      controller->OnResolved(session, name, generation, std::move(info));
    }
  });
}

void DiscoveryController::OnServiceRemoved(uint64_t session, const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!subscribed_ || session != session_) {
    return;
  }

  pending_.erase(name);
  if (auto event = registry_.RemoveService(name)) {
    EmitLocked(*event);
  }
}

void DiscoveryController::OnResolved(uint64_t session, const std::string& name, uint64_t generation, std::optional<ServiceInfo> info) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!subscribed_ || session != session_) {
    return;
  }

  auto latest = pending_.find(name);
  if (latest == pending_.end() || latest->second != generation) {
    THREADNET_LOG_DEBUG("dropping stale resolution", {observability::StringField("name", name)});
    return;
  }

  if (!info) {
    THREADNET_LOG_DEBUG("service resolution failed", {observability::StringField("name", name)});
    return;
  }

  auto record = BuildRouterRecord(*info, options_.key_source);
  if (!record) {
    THREADNET_LOG_DEBUG("ignoring service without router key", {observability::StringField("name", name)});
    return;
  }

  for (const auto& event : registry_.Upsert(name, *record)) {
    EmitLocked(event);
  }
}

void DiscoveryController::EmitLocked(const RouterEvent& event) {
  observability::Metrics::Instance().RecordRouterEvent(RouterEventKindName(event.kind));
  THREADNET_LOG_DEBUG("router event", {observability::StringField("kind", RouterEventKindName(event.kind)), observability::StringField("key", event.key)});

  if (!sink_) {
    return;
  }
  try {
    sink_(event);
  } catch (const std::exception& e) {
    THREADNET_LOG_ERROR("router event sink failed", {observability::StringField("key", event.key), observability::StringField("error", e.what())});
  }
}

} // namespace threadnet::discovery
