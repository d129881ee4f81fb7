#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using apphost::config::ConfigLoader;
using apphost::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "apphost_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigurationLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(global:
  configuration_status: "8.1.3"
  use_ssl: true
  system_path: "/system"
logging:
  level: "debug"
database:
  sqlite:
    path: "/var/lib/apphost/apphost.db"
    wal_mode: true
    busy_timeout_ms: 2500
cache:
  disabled: false
web_routing:
  app_url: "https://www.example.com"
scheduled_tasks:
  base_url: "www.example.com:8080"
boot:
  ready_timeout_ms: 1000
  replace_context: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.global().configuration_status() == "8.1.3");
  assert(config.global().use_ssl());
  assert(config.logging().level() == "debug");
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "/var/lib/apphost/apphost.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(!config.cache().disabled());
  assert(config.web_routing().app_url() == "https://www.example.com");
  assert(config.scheduled_tasks().base_url() == "www.example.com:8080");
  assert(config.boot().ready_timeout_ms() == 1000);
  assert(config.boot().replace_context());
}

void TestQuotedVersionStaysString() {
  auto config = ConfigLoader::LoadFromYamlString(R"(global:
  configuration_status: "8.1"
)");
  assert(config.global().configuration_status() == "8.1");
}

void TestUnquotedThreeFieldVersionIsString() {
  auto config = ConfigLoader::LoadFromYamlString("global:\n  configuration_status: 8.1.3\n");
  assert(config.global().configuration_status() == "8.1.3");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\apphost\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\apphost\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(web_routing:
  app_url: "line1\nline2☃"
)");
  assert(config.web_routing().app_url() == std::string("line1\nline2☃"));
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.global().configuration_status().empty());
  assert(config.database().backend_case() == DatabaseConfig::BACKEND_NOT_SET);
  assert(!config.boot().replace_context());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(global:
  configuration_status: "8.1.3"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingTopLevelIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("- a\n- b\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("top level must be a mapping") != std::string::npos;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/apphost/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("Failed to load YAML config", 0) == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigurationLoads();
  TestQuotedVersionStaysString();
  TestUnquotedThreeFieldVersionIsString();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestNonMappingTopLevelIsRejected();
  TestMissingFileIsReported();

  std::cout << "apphost_unit_config_loader: pass\n";
  return 0;
}
