#pragma once

#include <cstdint>
#include <string>

#include "glucolumin/v1/types.pb.h"

namespace glucolumin::db::model {

/*
  Clinical result. Written once per visit, never updated.
*/
struct ResultRecord {
  std::string visit_id;

  double glucose_mg_dl = 0.0;

  glucolumin::v1::Classification classification = glucolumin::v1::CLASSIFICATION_UNSPECIFIED;

  std::string label;
  std::string advice;
  std::string model_version;

  uint64_t computed_at_ms = 0;
};

}
