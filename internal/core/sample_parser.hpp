#pragma once

#include <string>
#include <vector>

#include "internal/model/visit.hpp"

namespace glucolumin::core {

/*
  Parses raw upload lines of the form "<visit_id>,<sample_index>,<value>".

  Blank lines are skipped. Any malformed line, or one naming a different
  visit, fails the whole batch with ValidationError.
*/
std::vector<model::RawSample> ParseSampleLines(const std::string& visit_id, const std::vector<std::string>& lines);

} // namespace glucolumin::core
