#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "voicecode_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = voicecode::config::ConfigLoader::LoadFromYamlString("");

  assert(config.database().has_memory());
  assert(voicecode::util::FromProto(config.uploads().timeout()).count() == 30000);
  assert(voicecode::util::FromProto(config.uploads().connection_test_timeout()).count() == 5000);
  assert(config.uploads().max_payload_bytes() == 100ull * 1024ull * 1024ull);
  assert(config.uploads().storage_location() == "~/Downloads");
  assert(config.queue().origin() == 1.0);
  assert(config.queue().unit_step() == 1.0);
  assert(config.queue().min_gap() == 1e-9);
  assert(config.queue().renormalize_step() == 1.0);
}

void TestFullDocumentIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "%v"
database:
  sqlite:
    path: "/tmp/voicecode/queue.db"
    wal_mode: true
uploads:
  timeout: "12.5s"
  connection_test_timeout: "2s"
  max_payload_bytes: 1024
  storage_location: "/srv/uploads"
queue:
  origin: 100
  unit_step: 10
  min_gap: 0.000001
  renormalize_step: 5
)");

  auto config = voicecode::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.database().sqlite().path() == "/tmp/voicecode/queue.db");
  assert(config.database().sqlite().wal_mode());
  assert(voicecode::util::FromProto(config.uploads().timeout()).count() == 12500);
  assert(voicecode::util::FromProto(config.uploads().connection_test_timeout()).count() == 2000);
  assert(config.uploads().max_payload_bytes() == 1024);
  assert(config.uploads().storage_location() == "/srv/uploads");
  assert(config.queue().origin() == 100.0);
  assert(config.queue().unit_step() == 10.0);
  assert(config.queue().min_gap() == 0.000001);
  assert(config.queue().renormalize_step() == 5.0);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\voicecode\\\"quoted\"\\db.sqlite"
    wal_mode: false
uploads:
  storage_location: "12345"
)");

  auto config = voicecode::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\voicecode\\\"quoted\"\\db.sqlite");
  assert(!config.database().sqlite().wal_mode());
  assert(config.uploads().storage_location() == "12345");
}

void TestPartialSectionsKeepOtherDefaults() {
  auto config = voicecode::config::ConfigLoader::LoadFromYamlString(R"(uploads:
  timeout: "45s"
)");

  assert(voicecode::util::FromProto(config.uploads().timeout()).count() == 45000);
  assert(voicecode::util::FromProto(config.uploads().connection_test_timeout()).count() == 5000);
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(uploads:
  timeout: "30s"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)voicecode::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)voicecode::config::ConfigLoader::LoadFromYaml("/nonexistent/voicecode/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentYieldsDefaults();
  TestFullDocumentIsParsed();
  TestQuotedScalarsStayStrings();
  TestPartialSectionsKeepOtherDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "voicecode_unit_config_loader: pass\n";
  return 0;
}
