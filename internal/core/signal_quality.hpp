#pragma once

#include <optional>
#include <string>
#include <vector>

namespace glucolumin::core {

struct SignalQualityOptions {
  bool   enabled  = false;
  double min_mean = 5.0;
  double max_mean = 500.0;
  double min_std  = 0.01;
};

struct SignalQualityIssue {
  std::string reason;  // NO_FINGER_DETECTED | SENSOR_ERROR
  double      value = 0.0;
};

inline constexpr const char* kNoFingerDetected = "NO_FINGER_DETECTED";
inline constexpr const char* kSensorError      = "SENSOR_ERROR";

/*
  Upload-time check of one sample batch.

  A saturated (mean above max_mean) or flat (std below min_std) batch means
  nothing is covering the sensor; a mean below min_mean means the sensor is
  not reading. The reported value is the batch mean.
*/
std::optional<SignalQualityIssue> EvaluateSignalQuality(const std::vector<double>& values, const SignalQualityOptions& options);

} // namespace glucolumin::core
