#pragma once

#include <memory>

namespace threadnet::core { class DatasetStore; }
namespace threadnet::subscription { class RouterEventHub; }

namespace threadnet::service {

/*
  Dependency container shared by all services.

  routers is null when the binary was built without an mDNS backend.
*/
struct ServiceContext {
  std::shared_ptr<threadnet::core::DatasetStore> datasets;
  std::shared_ptr<threadnet::subscription::RouterEventHub> routers;
};

}
