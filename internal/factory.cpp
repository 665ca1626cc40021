#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/dataset_server.hpp"
#include "internal/grpc/discovery_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/dataset_service.hpp"
#include "internal/service/discovery_service.hpp"
#include "internal/service/service_context.hpp"
#if THREADNET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if THREADNET_MDNS_DNSSD
#include "internal/discovery/dnssd/dnssd_browser.hpp"
#endif

namespace threadnet::factory {

std::shared_ptr<db::Repository> BuildRepository(const threadnet::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if THREADNET_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::ApplyMigrations(*sqlite_db);
    THREADNET_LOG_INFO("using sqlite dataset repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  THREADNET_LOG_INFO("using in-memory dataset repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

discovery::DiscoveryOptions BuildDiscoveryOptions(const threadnet::runtime::config::RuntimeConfig& config) {
  const auto& discovery = config.discovery();

  discovery::DiscoveryOptions options;
  options.service_type    = discovery.service_type();
  options.resolve_timeout = std::chrono::milliseconds(discovery.resolve_timeout_ms());
  options.key_source      = discovery.router_key() == threadnet::runtime::config::ROUTER_KEY_SOURCE_EXTENDED_ADDRESS
                                ? discovery::RouterKeySource::kExtendedAddress
                                : discovery::RouterKeySource::kExtendedPanId;
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const threadnet::runtime::config::RuntimeConfig& config, std::shared_ptr<discovery::ServiceBrowser> browser) {
  Application app;

  // ------------------------------------------------------------------
  // Dataset store
  // ------------------------------------------------------------------
  app.datasets = std::make_shared<core::DatasetStore>(BuildRepository(config));
  app.datasets->Load();

  // ------------------------------------------------------------------
  // Router discovery
  // ------------------------------------------------------------------
#if THREADNET_MDNS_DNSSD
  if (!browser) {
    browser = std::make_shared<discovery::dnssd::DnssdBrowser>();
  }
#endif
  if (browser) {
    app.routers = subscription::RouterEventHub::Create(std::move(browser), BuildDiscoveryOptions(config),
                                                       config.discovery().subscriber_queue_depth());
  } else {
    THREADNET_LOG_WARN("no mdns backend available; router discovery disabled");
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.datasets = app.datasets;
  ctx.routers  = app.routers;

  auto dataset_service   = std::make_shared<service::DatasetService>(ctx);
  auto discovery_service = std::make_shared<service::DiscoveryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DatasetServer>(dataset_service));
  app.grpc_services.push_back(std::make_unique<grpc::DiscoveryServer>(
      discovery_service, std::chrono::milliseconds(config.discovery().stream_poll_interval_ms())));

  return app;
}

} // namespace threadnet::factory
