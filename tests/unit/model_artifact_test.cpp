#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/calibration/model_artifact.hpp"
#include "internal/calibration/model_registry.hpp"
#include "internal/signal/feature_extractor.hpp"
#include "internal/util/errors.hpp"

namespace {

using glucolumin::calibration::ModelRegistry;
using glucolumin::calibration::ParseModelArtifact;
using glucolumin::util::ModelUnavailableError;

constexpr const char* kMinimalArtifact = R"(
version: test-1
intercept: 1.5
features:
  - {name: a, coefficient: 2.0, clip_min: 0, clip_max: 10}
  - {name: b, coefficient: -1.0}
covariates:
  bmi: 0.3
skin_tones:
  Medium: {factor: 3, offset: 1.25}
)";

bool RejectsArtifact(const std::string& text) {
  try {
    ParseModelArtifact(text);
  } catch (const ModelUnavailableError&) {
    return true;
  }
  return false;
}

std::filesystem::path WriteArtifact(const std::string& name, const std::string& text) {
  const auto dir = std::filesystem::temp_directory_path() / "glucolumin_model_artifact_tests";
  std::filesystem::create_directories(dir);
  const auto    path = dir / (name + ".yaml");
  std::ofstream out(path);
  out << text;
  return path;
}

void TestParsesMinimalArtifact() {
  const auto artifact = ParseModelArtifact(kMinimalArtifact);
  assert(artifact.version == "test-1");
  assert(artifact.intercept == 1.5);
  assert(artifact.features.size() == 2);
  assert(artifact.features[0].name == "a");
  assert(artifact.features[0].clip_min.value() == 0.0);
  assert(artifact.features[0].clip_max.value() == 10.0);
  assert(!artifact.features[1].clip_min.has_value());
  assert(artifact.covariates.at("bmi") == 0.3);
  assert(artifact.skin_tones.at("Medium").factor == 3.0);
  assert(artifact.skin_tones.at("Medium").offset == 1.25);
  // Fasting defaults.
  assert(artifact.fed_hours == 2.0);
  assert(artifact.fasting_hours == 10.0);
}

void TestRejectsMalformedArtifacts() {
  assert(RejectsArtifact("intercept: 1\nfeatures: [{name: a, coefficient: 1}]\nskin_tones: {Fair: {factor: 2}}\n"));
  assert(RejectsArtifact("version: x\nfeatures: [{name: a, coefficient: 1}]\nskin_tones: {Fair: {factor: 2}}\n"));
  assert(RejectsArtifact("version: x\nintercept: 1\nfeatures: []\nskin_tones: {Fair: {factor: 2}}\n"));
  assert(RejectsArtifact("version: x\nintercept: 1\nfeatures: [{name: a, coefficient: 1}, {name: a, coefficient: 2}]\n"
                         "skin_tones: {Fair: {factor: 2}}\n"));
  assert(RejectsArtifact("version: x\nintercept: 1\nfeatures: [{name: a, coefficient: 1, clip_min: 5, clip_max: 1}]\n"
                         "skin_tones: {Fair: {factor: 2}}\n"));
  assert(RejectsArtifact("version: x\nintercept: 1\nfeatures: [{name: a, coefficient: nope}]\nskin_tones: {Fair: {factor: 2}}\n"));
  assert(RejectsArtifact("version: x\nintercept: 1\nfeatures: [{name: a, coefficient: 1}]\ncovariates: {shoe_size: 1}\n"
                         "skin_tones: {Fair: {factor: 2}}\n"));
  assert(RejectsArtifact("version: x\nintercept: 1\nfeatures: [{name: a, coefficient: 1}]\n"));
  assert(RejectsArtifact("version: [unterminated\n"));
}

void TestShippedArtifactMatchesExtractor() {
  glucolumin::signal::FeatureExtractor extractor(glucolumin::signal::SignalConditioningOptions{});

  ModelRegistry registry;
  registry.ExpectFeatures(extractor.FeatureNames());
  const auto artifact = registry.Load("config/model.yaml");

  assert(artifact->FeatureNames() == extractor.FeatureNames());
  assert(artifact->intercept == -6.6);
  assert(artifact->covariates.at("bmi") == 0.3);
  assert(artifact->covariates.at("fasting_hours") == -0.5);
  assert(artifact->skin_tones.size() == 5);
  assert(artifact->skin_tones.at("Very Fair").factor == 1.0);
  assert(artifact->skin_tones.at("Black").factor == 4.0);
}

void TestRegistryKeepsPreviousArtifactOnFailure() {
  ModelRegistry registry;
  registry.ExpectFeatures({"a", "b"});

  bool threw = false;
  try {
    registry.Require();
  } catch (const ModelUnavailableError&) {
    threw = true;
  }
  assert(threw);

  const auto good = WriteArtifact("good", kMinimalArtifact);
  registry.Load(good.string());
  assert(registry.Current()->version == "test-1");

  const auto mismatched = WriteArtifact("mismatched", R"(
version: test-2
intercept: 0
features:
  - {name: b, coefficient: 1}
  - {name: a, coefficient: 1}
skin_tones:
  Fair: {factor: 2}
)");
  threw = false;
  try {
    registry.Load(mismatched.string());
  } catch (const ModelUnavailableError&) {
    threw = true;
  }
  assert(threw);
  assert(registry.Current()->version == "test-1");

  threw = false;
  try {
    registry.Load((std::filesystem::temp_directory_path() / "glucolumin_missing_model.yaml").string());
  } catch (const ModelUnavailableError&) {
    threw = true;
  }
  assert(threw);
  assert(registry.Current()->version == "test-1");
}

void TestReloadUsesLastPath() {
  ModelRegistry registry;

  bool threw = false;
  try {
    registry.Reload();
  } catch (const ModelUnavailableError&) {
    threw = true;
  }
  assert(threw);

  const auto path = WriteArtifact("reload", kMinimalArtifact);
  registry.Load(path.string());

  {
    std::ofstream out(path);
    out << std::string(kMinimalArtifact).replace(std::string(kMinimalArtifact).find("test-1"), 6, "test-9");
  }
  const auto reloaded = registry.Reload();
  assert(reloaded->version == "test-9");
  assert(registry.ArtifactPath().value() == path.string());
}

} // namespace

int main() {
  TestParsesMinimalArtifact();
  TestRejectsMalformedArtifacts();
  TestShippedArtifactMatchesExtractor();
  TestRegistryKeepsPreviousArtifactOnFailure();
  TestReloadUsesLastPath();

  std::cout << "glucolumin_unit_model_artifact: pass\n";
  return 0;
}
