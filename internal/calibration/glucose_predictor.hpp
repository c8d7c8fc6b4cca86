#pragma once

#include "internal/calibration/covariates.hpp"
#include "internal/calibration/model_artifact.hpp"
#include "internal/model/features.hpp"

namespace glucolumin::calibration {

/*
  Applies a model artifact to one visit.

  The feature vector must match the artifact's feature list name for name
  and in order; anything else is ModelUnavailableError. The returned value
  is unrounded.
*/
class GlucosePredictor {
 public:
  static void CheckFeatureContract(const ModelArtifact& artifact, const model::FeatureVector& features);

  static double Predict(const ModelArtifact& artifact, const model::FeatureVector& features, const Covariates& covariates);
};

} // namespace glucolumin::calibration
