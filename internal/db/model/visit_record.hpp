#pragma once

#include <cstdint>
#include <string>

#include "glucolumin/v1/types.pb.h"

namespace glucolumin::db::model {

/*
  Persistent visit row: patient snapshot plus session state.

  Timestamps are unix milliseconds; 0 means unset.
  Version increments on every update.
*/

struct VisitRecord {
  std::string visit_id;
  std::string patient_id;

  std::string patient_name;
  int32_t     age = 0;
  std::string sex;
  double      height_cm = 0.0;
  double      weight_kg = 0.0;
  double      bmi       = 0.0;
  std::string skin_tone;
  std::string blood_pressure;
  bool        had_food       = false;
  bool        family_history = false;

  glucolumin::v1::VisitStatus status = glucolumin::v1::VISIT_STATUS_UNSPECIFIED;

  glucolumin::v1::ProcessingTrigger trigger = glucolumin::v1::PROCESSING_TRIGGER_UNSPECIFIED;

  uint64_t created_at_ms            = 0;
  uint64_t updated_at_ms            = 0;
  uint64_t last_sample_at_ms        = 0;
  uint64_t processing_started_at_ms = 0;

  uint64_t sample_count = 0;

  // -1 until the first sample arrives
  int64_t last_sample_index = -1;

  std::string failure_reason;

  uint64_t version = 0;
};

}
