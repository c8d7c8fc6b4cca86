#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace glucolumin::util {

/*
  Visit identifiers.

  Format: V<YYYYMMDD>_<6 uppercase hex>, e.g. V20261019_3FA9C1.
  The patient id shares the random suffix: P-3FA9C1.
*/

struct VisitId {
  std::string visit_id;
  std::string patient_id;
};

VisitId GenerateVisitId(TimePoint at);

bool IsValidVisitId(const std::string& visit_id);

// Suffix of a well-formed visit id, nullopt otherwise.
std::optional<std::string> VisitSuffix(const std::string& visit_id);

} // namespace glucolumin::util
