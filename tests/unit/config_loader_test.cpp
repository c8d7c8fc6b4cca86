#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using glucolumin::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "glucolumin_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool RejectsWith(const std::string& yaml, const std::string& fragment) {
  try {
    ConfigLoader::ParseYaml(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(fragment) != std::string::npos;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\glucolumin\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\glucolumin\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::ParseYaml(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedNumberStaysString() {
  auto config = ConfigLoader::ParseYaml(R"(model:
  artifact_path: "42"
)");
  assert(config.model().artifact_path() == "42");
}

void TestUnknownFieldsAreRejected() {
  assert(RejectsWith(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)",
                     "Invalid configuration"));

  assert(RejectsWith(R"(pipeline:
  workers: 2
  gpu: true
)",
                     "Invalid configuration"));
}

void TestDefaultsApplied() {
  auto config = ConfigLoader::ParseYaml("logging:\n  level: debug\n");

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_memory());
  assert(config.logging().level() == "debug");

  const auto& pipeline = config.pipeline();
  assert(pipeline.workers() == 2);
  assert(pipeline.min_samples() == 16);
  assert(pipeline.max_samples_per_visit() == 65536);
  assert(pipeline.collection_window_ms() == 30000);
  assert(pipeline.max_processing_ms() == 60000);
  assert(pipeline.sweep_interval_ms() == 500);
  assert(pipeline.savgol().window_length() == 11);
  assert(pipeline.savgol().poly_order() == 3);
  assert(pipeline.wavelet_levels() == 2);
  assert(pipeline.low_magnitude_threshold() == 10.0);
  assert(pipeline.low_magnitude_gain() == 660.0);
  assert(!pipeline.signal_quality().enabled());
  assert(pipeline.signal_quality().min_mean() == 5.0);
  assert(pipeline.signal_quality().max_mean() == 500.0);
  assert(pipeline.signal_quality().min_std() == 0.01);
}

void TestShippedConfigLoads() {
  auto config = ConfigLoader::LoadFromYaml("config/glucolumin.yaml");
  assert(config.database().has_sqlite());
  assert(config.model().artifact_path() == "config/model.yaml");
  assert(config.pipeline().savgol().window_length() == 11);
}

void TestSemanticValidation() {
  assert(RejectsWith("pipeline:\n  savgol:\n    window_length: 10\n", "must be odd"));
  assert(RejectsWith("pipeline:\n  savgol:\n    window_length: 5\n    poly_order: 4\n", "poly_order + 2"));
  assert(RejectsWith("pipeline:\n  min_samples: 8\n", "min_samples"));
  assert(RejectsWith("pipeline:\n  min_samples: 32\n  max_samples_per_visit: 20\n", "max_samples_per_visit"));
  assert(RejectsWith("pipeline:\n  signal_quality:\n    min_mean: 600\n", "min_mean"));
  assert(RejectsWith("database:\n  sqlite:\n    wal_mode: true\n", "database.sqlite.path"));
}

void TestMissingFile() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "glucolumin_no_such_config.yaml").string());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumberStaysString();
  TestUnknownFieldsAreRejected();
  TestDefaultsApplied();
  TestShippedConfigLoads();
  TestSemanticValidation();
  TestMissingFile();

  std::cout << "glucolumin_unit_config_loader: pass\n";
  return 0;
}
