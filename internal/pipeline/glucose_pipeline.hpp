#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/calibration/model_registry.hpp"
#include "internal/classification/advisory.hpp"
#include "internal/model/features.hpp"
#include "internal/model/patient.hpp"
#include "internal/signal/feature_extractor.hpp"

namespace glucolumin::pipeline {

struct PipelineOutput {
  model::FeatureVector features;

  // Rounded to 2 decimals; the classification is taken from the rounded value.
  double                   glucose_mg_dl = 0.0;
  classification::Advisory advisory;
  std::string              model_version;
};

/*
  signal conditioning -> calibration & prediction -> classification

  Stateless apart from the model snapshot taken at the start of Run, so
  concurrent runs for different visits are safe.
*/
class GlucosePipeline {
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  GlucosePipeline(signal::SignalConditioningOptions options, std::shared_ptr<calibration::ModelRegistry> models);

  // Throws the pipeline error taxonomy; ProcessingTimeoutError when the
  // deadline passes between stages.
  PipelineOutput Run(const std::vector<double>& samples, const model::PatientProfile& patient,
                     std::optional<Deadline> deadline = std::nullopt) const;

  const signal::FeatureExtractor& Extractor() const {
    return extractor_;
  }

 private:
  signal::FeatureExtractor                   extractor_;
  std::shared_ptr<calibration::ModelRegistry> models_;
};

double RoundToHundredths(double value);

} // namespace glucolumin::pipeline
