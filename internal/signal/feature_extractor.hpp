#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/features.hpp"
#include "internal/signal/savitzky_golay.hpp"

namespace glucolumin::signal {

struct SignalConditioningOptions {
  std::size_t          min_samples = 16;
  SavitzkyGolayOptions savgol;
  std::size_t          wavelet_levels = 2;

  // Sensor readings in the low-voltage range are rescaled into the glucose range.
  double low_magnitude_threshold = 10.0;
  double low_magnitude_gain      = 660.0;
};

/*
  Signal conditioning stage.

  raw samples -> low-magnitude rescale -> Savitzky-Golay -> FFT, db4
  wavelet and time-domain statistics -> fixed-order FeatureVector.

  Deterministic; no side effects.
*/
class FeatureExtractor {
 public:
  explicit FeatureExtractor(SignalConditioningOptions options);

  const SignalConditioningOptions& Options() const {
    return options_;
  }

  // Feature order produced by Extract; stable for the lifetime of the extractor.
  const std::vector<std::string>& FeatureNames() const {
    return names_;
  }

  // InsufficientSamplesError below min_samples, SignalProcessingError on any
  // non-finite intermediate value.
  model::FeatureVector Extract(const std::vector<double>& samples) const;

  std::vector<double> Condition(const std::vector<double>& samples) const;

 private:
  SignalConditioningOptions options_;
  SavitzkyGolayFilter       filter_;
  std::vector<std::string>  names_;
};

} // namespace glucolumin::signal
