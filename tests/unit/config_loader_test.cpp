#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using timekeeper::config::ConfigLoader;
using timekeeper::runtime::config::StoreConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "timekeeper_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullFileIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
store:
  sqlite:
    path: "/var/lib/timekeeper/matches.db"
    wal_mode: true
logging:
  level: debug
  pattern: "%v"
timer:
  update_interval_ms: 500
  accuracy_threshold_seconds: 3
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.store().backend_case() == StoreConfig::kSqlite);
  assert(config.store().sqlite().path() == "/var/lib/timekeeper/matches.db");
  assert(config.store().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.timer().update_interval_ms() == 500);
  assert(config.timer().accuracy_threshold_seconds() == 3);
}

void TestDefaultsFillMissingSections() {
  auto config = ConfigLoader::LoadFromYamlString("logging:\n  level: info\n");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.store().backend_case() == StoreConfig::kFile);
  assert(config.store().file().path() == "data/storage.json");
  assert(config.timer().update_interval_ms() == 1000);
  assert(config.timer().accuracy_threshold_seconds() == 2);

  auto empty = ConfigLoader::LoadFromYamlString("");
  assert(empty.store().file().path() == "data/storage.json");
}

void TestMemoryBackend() {
  auto config = ConfigLoader::LoadFromYamlString("store:\n  memory: {}\n");
  assert(config.store().backend_case() == StoreConfig::kMemory);
}

void TestStorePathOverride() {
  setenv("TIMEKEEPER_STORE_PATH", "/tmp/override.json", 1);
  auto file = ConfigLoader::LoadFromYamlString("store:\n  file:\n    path: data/other.json\n");
  assert(file.store().file().path() == "/tmp/override.json");

  auto sqlite = ConfigLoader::LoadFromYamlString("store:\n  sqlite:\n    path: data/x.db\n");
  assert(sqlite.store().sqlite().path() == "/tmp/override.json");
  unsetenv("TIMEKEEPER_STORE_PATH");

  auto restored = ConfigLoader::LoadFromYamlString("store:\n  file:\n    path: data/other.json\n");
  assert(restored.store().file().path() == "data/other.json");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("unknown_field: 123\n"));
  assert(Rejects("server:\n  bind_address: nowhere\n"));
  assert(Rejects("logging:\n  level: chatty\n"));
  assert(Rejects("- just\n- a list\n"));
  assert(Rejects("server: [unterminated\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/timekeeper.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  unsetenv("TIMEKEEPER_STORE_PATH");

  TestFullFileIsParsed();
  TestDefaultsFillMissingSections();
  TestMemoryBackend();
  TestStorePathOverride();
  TestInvalidConfigsAreRejected();

  std::cout << "timekeeper_unit_config_loader: pass\n";
  return 0;
}
