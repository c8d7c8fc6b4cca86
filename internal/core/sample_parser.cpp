#include "sample_parser.hpp"

#include <charconv>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace glucolumin::core {

namespace {

std::string_view Trim(std::string_view value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

[[noreturn]] void Malformed(std::size_t line_no, const std::string& why) {
  throw util::ValidationError("line " + std::to_string(line_no) + ": " + why);
}

} // namespace

std::vector<model::RawSample> ParseSampleLines(const std::string& visit_id, const std::vector<std::string>& lines) {
  std::vector<model::RawSample> out;
  out.reserve(lines.size());

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto line_no = i + 1;
    const auto line    = Trim(lines[i]);
    if (line.empty()) {
      continue;
    }

    const auto first  = line.find(',');
    const auto second = first == std::string_view::npos ? first : line.find(',', first + 1);
    if (second == std::string_view::npos || line.find(',', second + 1) != std::string_view::npos) {
      Malformed(line_no, "expected \"visit_id,sample_index,value\"");
    }

    const auto id = Trim(line.substr(0, first));
    if (id != visit_id) {
      Malformed(line_no, "visit id \"" + std::string(id) + "\" does not match " + visit_id);
    }

    const auto index_token = Trim(line.substr(first + 1, second - first - 1));
    uint64_t   index       = 0;
    const auto [ptr, ec]   = std::from_chars(index_token.data(), index_token.data() + index_token.size(), index);
    if (index_token.empty() || ec != std::errc() || ptr != index_token.data() + index_token.size()) {
      Malformed(line_no, "sample index \"" + std::string(index_token) + "\" is not a non-negative integer");
    }
    if (index > model::kMaxSampleIndex) {
      Malformed(line_no, "sample index " + std::string(index_token) + " is out of range");
    }

    const std::string value_token(Trim(line.substr(second + 1)));
    char*             end   = nullptr;
    const double      value = std::strtod(value_token.c_str(), &end);
    if (value_token.empty() || end != value_token.c_str() + value_token.size()) {
      Malformed(line_no, "value \"" + value_token + "\" is not a number");
    }

    out.push_back({index, value});
  }

  return out;
}

} // namespace glucolumin::core
