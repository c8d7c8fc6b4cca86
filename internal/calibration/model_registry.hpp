#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/calibration/model_artifact.hpp"

namespace glucolumin::calibration {

/*
  Holds the active model artifact.

  Readers take a shared_ptr snapshot; a reload swaps the pointer, so a
  pipeline run keeps the artifact it started with.
*/
class ModelRegistry {
 public:
  ModelRegistry() = default;

  // When set, Load and Install reject an artifact whose feature list differs.
  void ExpectFeatures(std::vector<std::string> names);

  // Loads and installs; on failure the previous artifact stays active.
  std::shared_ptr<const ModelArtifact> Load(const std::string& path);

  // Reloads from the last path given to Load.
  std::shared_ptr<const ModelArtifact> Reload();

  void Install(ModelArtifact artifact);

  // nullptr when no model is loaded.
  std::shared_ptr<const ModelArtifact> Current() const;

  // Throws ModelUnavailableError when no model is loaded.
  std::shared_ptr<const ModelArtifact> Require() const;

  void CheckContract(const ModelArtifact& artifact) const;

  std::optional<std::string> ArtifactPath() const;

 private:
  mutable std::shared_mutex            mutex_;
  std::shared_ptr<const ModelArtifact> current_;
  std::optional<std::string>           path_;
  std::vector<std::string>             expected_features_;
};

} // namespace glucolumin::calibration
