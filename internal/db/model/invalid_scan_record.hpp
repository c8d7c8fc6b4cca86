#pragma once

#include <cstdint>
#include <string>

namespace glucolumin::db::model {

struct InvalidScanRecord {
  // Assigned by the repository on insert.
  uint64_t id = 0;

  std::string visit_id;
  std::string reason;  // NO_FINGER_DETECTED | SENSOR_ERROR
  double      value = 0.0;

  uint64_t recorded_at_ms = 0;
};

}
