#include "glucose_pipeline.hpp"

#include <cmath>

#include "internal/calibration/covariates.hpp"
#include "internal/calibration/glucose_predictor.hpp"
#include "internal/util/errors.hpp"

namespace glucolumin::pipeline {

namespace {

void CheckDeadline(const std::optional<GlucosePipeline::Deadline>& deadline, const char* stage) {
  if (deadline && std::chrono::steady_clock::now() > *deadline) {
    throw util::ProcessingTimeoutError(std::string("processing deadline exceeded before ") + stage);
  }
}

} // namespace

double RoundToHundredths(double value) {
  return std::round(value * 100.0) / 100.0;
}

GlucosePipeline::GlucosePipeline(signal::SignalConditioningOptions options, std::shared_ptr<calibration::ModelRegistry> models)
    : extractor_(options), models_(std::move(models)) {
}

PipelineOutput GlucosePipeline::Run(const std::vector<double>& samples, const model::PatientProfile& patient,
                                    std::optional<Deadline> deadline) const {
  const auto artifact = models_->Require();

  PipelineOutput out;
  out.model_version = artifact->version;

  CheckDeadline(deadline, "signal conditioning");
  out.features = extractor_.Extract(samples);

  CheckDeadline(deadline, "prediction");
  const auto covariates = calibration::DeriveCovariates(patient, *artifact);
  out.glucose_mg_dl     = RoundToHundredths(calibration::GlucosePredictor::Predict(*artifact, out.features, covariates));

  CheckDeadline(deadline, "classification");
  out.advisory = classification::Classify(out.glucose_mg_dl);

  return out;
}

} // namespace glucolumin::pipeline
