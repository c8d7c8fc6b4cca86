#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace glucolumin::calibration {

struct FeatureWeight {
  std::string           name;
  double                coefficient = 0.0;
  std::optional<double> clip_min;
  std::optional<double> clip_max;
};

struct SkinToneCalibration {
  double factor = 1.0;
  double offset = 0.0;
};

/*
  Regression model artifact.

  glucose = intercept
          + sum(feature coefficient * clip(feature))
          + sum(covariate coefficient * covariate)
          + skin_tones[tone].offset

  Features are listed in the exact order the extractor must produce them.
*/
struct ModelArtifact {
  std::string version;
  double      intercept = 0.0;

  std::vector<FeatureWeight>                 features;
  std::map<std::string, double>              covariates;
  std::map<std::string, SkinToneCalibration> skin_tones;

  double fed_hours     = 2.0;
  double fasting_hours = 10.0;

  std::vector<std::string> FeatureNames() const;
};

// Covariate names an artifact may carry a coefficient for.
const std::vector<std::string>& KnownCovariates();

// Both throw ModelUnavailableError on any missing, malformed or unknown entry.
ModelArtifact LoadModelArtifact(const std::string& path);
ModelArtifact ParseModelArtifact(const std::string& yaml_text);

} // namespace glucolumin::calibration
