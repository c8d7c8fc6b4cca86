#include "signal_quality.hpp"

#include <cmath>
#include <numeric>

namespace glucolumin::core {

std::optional<SignalQualityIssue> EvaluateSignalQuality(const std::vector<double>& values, const SignalQualityOptions& options) {
  if (!options.enabled || values.empty()) {
    return std::nullopt;
  }

  const double n    = static_cast<double>(values.size());
  const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
  double       var  = 0.0;
  for (double v : values) {
    var += (v - mean) * (v - mean);
  }
  const double stddev = std::sqrt(var / n);

  if (mean > options.max_mean || stddev < options.min_std) {
    return SignalQualityIssue{kNoFingerDetected, mean};
  }
  if (mean < options.min_mean) {
    return SignalQualityIssue{kSensorError, mean};
  }
  return std::nullopt;
}

} // namespace glucolumin::core
