#pragma once

#include <map>
#include <string>

#include "internal/calibration/model_artifact.hpp"
#include "internal/model/patient.hpp"

namespace glucolumin::calibration {

/*
  Patient-derived regressors, keyed by the names in KnownCovariates().
*/
struct Covariates {
  std::map<std::string, double> values;
  std::string                   skin_tone;
  double                        skin_offset = 0.0;
};

// ValidationError for a malformed blood pressure, an unknown skin tone, or
// a non-positive height or weight.
Covariates DeriveCovariates(const model::PatientProfile& profile, const ModelArtifact& artifact);

} // namespace glucolumin::calibration
