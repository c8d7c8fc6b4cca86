#pragma once

#include <cstdint>

namespace glucolumin::db::model {

struct RawSampleRecord {
  uint64_t sample_index = 0;
  double   value        = 0.0;
};

}
