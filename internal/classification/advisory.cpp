#include "advisory.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace glucolumin::classification {

Advisory Classify(double glucose_mg_dl) {
  using namespace glucolumin::v1;

  if (!std::isfinite(glucose_mg_dl)) {
    throw util::SignalProcessingError("cannot classify non-finite glucose value");
  }

  if (glucose_mg_dl < 70.0) {
    return {CLASSIFICATION_HYPOGLYCEMIA, ClassificationLabel(CLASSIFICATION_HYPOGLYCEMIA), "Eat fast-acting carbs immediately"};
  }
  if (glucose_mg_dl <= 100.0) {
    return {CLASSIFICATION_NORMAL, ClassificationLabel(CLASSIFICATION_NORMAL), "Maintain balanced diet"};
  }
  if (glucose_mg_dl <= 125.0) {
    return {CLASSIFICATION_PRE_DIABETIC, ClassificationLabel(CLASSIFICATION_PRE_DIABETIC), "Reduce sugar intake"};
  }
  if (glucose_mg_dl <= 200.0) {
    return {CLASSIFICATION_HIGH, ClassificationLabel(CLASSIFICATION_HIGH), "Avoid white carbs/sugar"};
  }
  return {CLASSIFICATION_CRITICAL, ClassificationLabel(CLASSIFICATION_CRITICAL), "Consult doctor immediately"};
}

std::string ClassificationLabel(glucolumin::v1::Classification classification) {
  switch (classification) {
    case glucolumin::v1::CLASSIFICATION_HYPOGLYCEMIA:
      return "Hypoglycemia";
    case glucolumin::v1::CLASSIFICATION_NORMAL:
      return "Normal";
    case glucolumin::v1::CLASSIFICATION_PRE_DIABETIC:
      return "Pre-Diabetic";
    case glucolumin::v1::CLASSIFICATION_HIGH:
      return "High";
    case glucolumin::v1::CLASSIFICATION_CRITICAL:
      return "Critical";
    default:
      return "Unspecified";
  }
}

} // namespace glucolumin::classification
