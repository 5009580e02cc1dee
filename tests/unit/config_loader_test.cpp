#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using engram::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "engram_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(objects:
  disk:
    root_path: "/tmp/engram-objects"
    fsync: false
database:
  sqlite:
    path: "/tmp/engram.db"
logging:
  level: "debug"
branches:
  default_branch: "trunk"
  default_agent: "planner"
sync:
  default_strategy: "latest_wins"
  max_stale_retries: 5
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.objects().has_disk());
  assert(config.objects().disk().root_path() == "/tmp/engram-objects");
  assert(!config.objects().disk().fsync());
  assert(config.database().sqlite().path() == "/tmp/engram.db");
  assert(config.logging().level() == "debug");
  assert(config.branches().default_branch() == "trunk");
  assert(config.branches().default_agent() == "planner");
  assert(config.sync().default_strategy() == "latest_wins");
  assert(config.sync().max_stale_retries() == 5);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "C:\\engram\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\engram\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumericStaysString() {
  auto config = ConfigLoader::LoadFromString(R"(branches:
  default_branch: "2024"
)");
  assert(config.branches().default_branch() == "2024");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(config.objects().has_ram());
  assert(config.database().has_memory());
  assert(config.branches().default_branch() == "main");
  assert(config.branches().default_agent() == "engram");
  assert(config.sync().default_strategy() == "intelligent_merge");
  assert(config.sync().max_stale_retries() == 3);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(objects:
  ram: {}
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

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/engram/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumericStaysString();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "engram_unit_config_loader: pass\n";
  return 0;
}
