#pragma once

#include <cstdint>
#include <string>

namespace glucolumin::db::model {

// One extracted feature, kept for audit. Position preserves extractor order.
struct FeatureRecord {
  uint32_t    position = 0;
  std::string name;
  double      value = 0.0;
};

}
