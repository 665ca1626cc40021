#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "threadnet_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "C:\\thread\\\"quoted\"\\db.sqlite"
    wal_mode: true
discovery:
  service_type: "_meshcop._udp.local."
  resolve_timeout_ms: 1500
  router_key: ROUTER_KEY_SOURCE_EXTENDED_ADDRESS
  subscriber_queue_depth: 16
  stream_poll_interval_ms: 50
logging:
  level: debug
)");

  auto config = threadnet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "C:\\thread\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
  assert(config.discovery().resolve_timeout_ms() == 1500);
  assert(config.discovery().router_key() == threadnet::runtime::config::ROUTER_KEY_SOURCE_EXTENDED_ADDRESS);
  assert(config.discovery().subscriber_queue_depth() == 16);
  assert(config.discovery().stream_poll_interval_ms() == 50);
  assert(config.logging().level() == "debug");
}

void TestDefaultsAreApplied() {
  auto config = threadnet::config::ConfigLoader::LoadFromYamlString("logging:\n  level: info\n");
  assert(config.server().bind_address() == threadnet::config::kDefaultBindAddress);
  assert(config.database().has_memory());
  assert(config.discovery().service_type() == "_meshcop._udp.local.");
  assert(config.discovery().resolve_timeout_ms() == 3000);
  assert(config.discovery().router_key() == threadnet::runtime::config::ROUTER_KEY_SOURCE_EXTENDED_PAN_ID);
  assert(config.discovery().subscriber_queue_depth() == threadnet::config::kDefaultSubscriberQueue);
}

void TestEmptyDocumentIsAllDefaults() {
  auto config = threadnet::config::ConfigLoader::LoadFromYamlString("");
  assert(config.database().has_memory());
  assert(config.discovery().resolve_timeout_ms() == 3000);
}

void TestQuotedNumbersStayStrings() {
  auto config = threadnet::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "50061"
)");
  assert(config.server().bind_address() == "50061");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = threadnet::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)threadnet::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestObservabilityDefaultsAndSampleRatio() {
  auto defaults = threadnet::config::ConfigLoader::LoadFromYamlString("");
  assert(defaults.observability().service_name() == "threadnet-manager");
  assert(defaults.observability().trace_sample_ratio() == 1.0);

  auto tuned = threadnet::config::ConfigLoader::LoadFromYamlString(R"(observability:
  tracing_enabled: true
  service_name: "threadnet-kitchen"
  trace_sample_ratio: 0
)");
  assert(tuned.observability().service_name() == "threadnet-kitchen");
  assert(tuned.observability().has_trace_sample_ratio());
  assert(tuned.observability().trace_sample_ratio() == 0.0);

  bool threw = false;
  try {
    (void)threadnet::config::ConfigLoader::LoadFromYamlString("observability:\n  trace_sample_ratio: 1.5\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("trace_sample_ratio") != std::string::npos;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)threadnet::config::ConfigLoader::LoadFromYaml("/nonexistent/threadnet.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsAreApplied();
  TestEmptyDocumentIsAllDefaults();
  TestQuotedNumbersStayStrings();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestObservabilityDefaultsAndSampleRatio();
  TestMissingFileIsReported();

  std::cout << "threadnet_manager_unit_config_loader: pass\n";
  return 0;
}
