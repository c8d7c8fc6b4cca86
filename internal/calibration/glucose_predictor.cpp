#include "glucose_predictor.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace glucolumin::calibration {

void GlucosePredictor::CheckFeatureContract(const ModelArtifact& artifact, const model::FeatureVector& features) {
  if (artifact.features.size() != features.size()) {
    throw util::ModelUnavailableError("model " + artifact.version + " expects " + std::to_string(artifact.features.size()) +
                                      " features, extractor produced " + std::to_string(features.size()));
  }
  for (std::size_t i = 0; i < features.size(); ++i) {
    if (artifact.features[i].name != features[i].name) {
      throw util::ModelUnavailableError("model " + artifact.version + " expects feature '" + artifact.features[i].name +
                                        "' at position " + std::to_string(i) + ", got '" + features[i].name + "'");
    }
  }
}

double GlucosePredictor::Predict(const ModelArtifact& artifact, const model::FeatureVector& features, const Covariates& covariates) {
  CheckFeatureContract(artifact, features);

  double glucose = artifact.intercept;

  for (std::size_t i = 0; i < features.size(); ++i) {
    const auto& weight = artifact.features[i];
    double      value  = features[i].value;
    if (weight.clip_min) value = std::max(value, *weight.clip_min);
    if (weight.clip_max) value = std::min(value, *weight.clip_max);
    glucose += weight.coefficient * value;
  }

  for (const auto& [name, coefficient] : artifact.covariates) {
    const auto it = covariates.values.find(name);
    if (it == covariates.values.end()) {
      throw util::ModelUnavailableError("model " + artifact.version + " references covariate '" + name + "' with no value");
    }
    glucose += coefficient * it->second;
  }

  glucose += covariates.skin_offset;

  if (!std::isfinite(glucose)) {
    throw util::SignalProcessingError("prediction is not finite");
  }
  return glucose;
}

} // namespace glucolumin::calibration
