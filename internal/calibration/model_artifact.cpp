#include "model_artifact.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <set>

#include "internal/util/errors.hpp"

namespace glucolumin::calibration {

namespace {

[[noreturn]] void Invalid(const std::string& what) {
  throw util::ModelUnavailableError("invalid model artifact: " + what);
}

double RequireNumber(const YAML::Node& node, const std::string& field) {
  if (!node || !node.IsScalar()) {
    Invalid("missing numeric field '" + field + "'");
  }
  double value = 0.0;
  try {
    value = node.as<double>();
  } catch (const YAML::Exception&) {
    Invalid("field '" + field + "' is not a number");
  }
  if (!std::isfinite(value)) {
    Invalid("field '" + field + "' is not finite");
  }
  return value;
}

std::optional<double> OptionalNumber(const YAML::Node& node, const std::string& field) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  return RequireNumber(node, field);
}

ModelArtifact FromYaml(const YAML::Node& root) {
  if (!root.IsMap()) {
    Invalid("top level must be a mapping");
  }

  ModelArtifact artifact;

  const auto version = root["version"];
  if (!version || !version.IsScalar() || version.Scalar().empty()) {
    Invalid("missing 'version'");
  }
  artifact.version   = version.Scalar();
  artifact.intercept = RequireNumber(root["intercept"], "intercept");

  const auto features = root["features"];
  if (!features || !features.IsSequence() || features.size() == 0) {
    Invalid("'features' must be a non-empty list");
  }
  std::set<std::string> seen;
  for (const auto& entry : features) {
    FeatureWeight weight;
    if (!entry["name"] || !entry["name"].IsScalar()) {
      Invalid("feature entry without 'name'");
    }
    weight.name = entry["name"].Scalar();
    if (!seen.insert(weight.name).second) {
      Invalid("duplicate feature '" + weight.name + "'");
    }
    weight.coefficient = RequireNumber(entry["coefficient"], weight.name + ".coefficient");
    weight.clip_min    = OptionalNumber(entry["clip_min"], weight.name + ".clip_min");
    weight.clip_max    = OptionalNumber(entry["clip_max"], weight.name + ".clip_max");
    if (weight.clip_min && weight.clip_max && *weight.clip_min > *weight.clip_max) {
      Invalid("feature '" + weight.name + "' has clip_min > clip_max");
    }
    artifact.features.push_back(std::move(weight));
  }

  if (const auto covariates = root["covariates"]) {
    if (!covariates.IsMap()) {
      Invalid("'covariates' must be a mapping");
    }
    const auto& known = KnownCovariates();
    for (const auto& it : covariates) {
      const auto name = it.first.Scalar();
      if (std::find(known.begin(), known.end(), name) == known.end()) {
        Invalid("unknown covariate '" + name + "'");
      }
      artifact.covariates[name] = RequireNumber(it.second, "covariates." + name);
    }
  }

  const auto tones = root["skin_tones"];
  if (!tones || !tones.IsMap() || tones.size() == 0) {
    Invalid("'skin_tones' must be a non-empty mapping");
  }
  for (const auto& it : tones) {
    const auto          tone = it.first.Scalar();
    SkinToneCalibration calibration;
    calibration.factor         = RequireNumber(it.second["factor"], "skin_tones." + tone + ".factor");
    calibration.offset         = OptionalNumber(it.second["offset"], "skin_tones." + tone + ".offset").value_or(0.0);
    artifact.skin_tones[tone] = calibration;
  }

  if (const auto fasting = root["fasting"]) {
    artifact.fed_hours     = OptionalNumber(fasting["fed_hours"], "fasting.fed_hours").value_or(artifact.fed_hours);
    artifact.fasting_hours = OptionalNumber(fasting["fasting_hours"], "fasting.fasting_hours").value_or(artifact.fasting_hours);
  }

  return artifact;
}

} // namespace

std::vector<std::string> ModelArtifact::FeatureNames() const {
  std::vector<std::string> names;
  names.reserve(features.size());
  for (const auto& f : features) {
    names.push_back(f.name);
  }
  return names;
}

const std::vector<std::string>& KnownCovariates() {
  static const std::vector<std::string> kNames = {"age",          "sex_male",         "bmi",           "bp_systolic",
                                                  "bp_diastolic", "skin_tone_factor", "fasting_hours", "family_history"};
  return kNames;
}

ModelArtifact LoadModelArtifact(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ModelUnavailableError("failed to load model artifact '" + path + "': " + e.what());
  }
  return FromYaml(root);
}

ModelArtifact ParseModelArtifact(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw util::ModelUnavailableError(std::string("failed to parse model artifact: ") + e.what());
  }
  return FromYaml(root);
}

} // namespace glucolumin::calibration
