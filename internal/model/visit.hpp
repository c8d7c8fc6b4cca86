#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "internal/model/patient.hpp"
#include "internal/model/visit_state.hpp"
#include "internal/util/time.hpp"

namespace glucolumin::model {

// Indices are persisted as signed 64-bit values.
constexpr uint64_t kMaxSampleIndex = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

struct RawSample {
  uint64_t sample_index = 0;
  double   value        = 0.0;
};

struct PredictionResult {
  double                          glucose_mg_dl  = 0.0;
  glucolumin::v1::Classification  classification = glucolumin::v1::CLASSIFICATION_UNSPECIFIED;
  std::string                     label;
  std::string                     advice;
  util::TimePoint                 computed_at{};
  std::string                     model_version;
};

/*
  Session view of one visit, as served to pollers.
*/
struct Visit {
  std::string visit_id;
  std::string patient_id;

  PatientProfile patient;
  double         bmi = 0.0;

  VisitStatus       status  = glucolumin::v1::VISIT_STATUS_UNSPECIFIED;
  ProcessingTrigger trigger = glucolumin::v1::PROCESSING_TRIGGER_UNSPECIFIED;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> last_sample_at;
  std::optional<util::TimePoint> processing_started_at;

  uint64_t                sample_count = 0;
  std::optional<uint64_t> last_sample_index;

  std::string                     failure_reason;
  std::optional<PredictionResult> result;
};

} // namespace glucolumin::model
