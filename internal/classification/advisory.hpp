#pragma once

#include <string>

#include "glucolumin/v1/types.pb.h"

namespace glucolumin::classification {

struct Advisory {
  glucolumin::v1::Classification classification = glucolumin::v1::CLASSIFICATION_UNSPECIFIED;
  std::string                    label;
  std::string                    advice;
};

/*
  Glucose bucket and dietary advice, mg/dL:

    < 70          Hypoglycemia
    [70, 100]     Normal
    (100, 125]    Pre-Diabetic
    (125, 200]    High
    > 200         Critical

  Throws SignalProcessingError for a non-finite value.
*/
Advisory Classify(double glucose_mg_dl);

std::string ClassificationLabel(glucolumin::v1::Classification classification);

} // namespace glucolumin::classification
