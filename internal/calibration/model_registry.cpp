#include "model_registry.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace glucolumin::calibration {

std::shared_ptr<const ModelArtifact> ModelRegistry::Load(const std::string& path) {
  {
    std::unique_lock lock(mutex_);
    path_ = path;
  }

  auto artifact = std::make_shared<const ModelArtifact>(LoadModelArtifact(path));
  CheckContract(*artifact);

  std::unique_lock lock(mutex_);
  current_ = artifact;
  GLUCOLUMIN_LOG_INFO("model artifact loaded", {observability::StringField("path", path), observability::StringField("version", artifact->version),
                                                observability::IntField("features", static_cast<int64_t>(artifact->features.size()))});
  return current_;
}

std::shared_ptr<const ModelArtifact> ModelRegistry::Reload() {
  const auto path = ArtifactPath();
  if (!path) {
    throw util::ModelUnavailableError("no model artifact path configured");
  }
  return Load(*path);
}

void ModelRegistry::ExpectFeatures(std::vector<std::string> names) {
  std::unique_lock lock(mutex_);
  expected_features_ = std::move(names);
}

void ModelRegistry::CheckContract(const ModelArtifact& artifact) const {
  std::vector<std::string> expected;
  {
    std::shared_lock lock(mutex_);
    expected = expected_features_;
  }
  if (expected.empty()) {
    return;
  }

  const auto declared = artifact.FeatureNames();
  if (declared != expected) {
    std::string want;
    for (const auto& name : expected) {
      want += (want.empty() ? "" : ",") + name;
    }
    throw util::ModelUnavailableError("model " + artifact.version + " feature list does not match extractor output [" + want + "]");
  }
}

void ModelRegistry::Install(ModelArtifact artifact) {
  CheckContract(artifact);
  auto installed = std::make_shared<const ModelArtifact>(std::move(artifact));

  std::unique_lock lock(mutex_);
  current_ = std::move(installed);
}

std::shared_ptr<const ModelArtifact> ModelRegistry::Current() const {
  std::shared_lock lock(mutex_);
  return current_;
}

std::shared_ptr<const ModelArtifact> ModelRegistry::Require() const {
  auto artifact = Current();
  if (!artifact) {
    throw util::ModelUnavailableError("no model artifact loaded");
  }
  return artifact;
}

std::optional<std::string> ModelRegistry::ArtifactPath() const {
  std::shared_lock lock(mutex_);
  return path_;
}

} // namespace glucolumin::calibration
