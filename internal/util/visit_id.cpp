#include "visit_id.hpp"

#include <cctype>
#include <random>

namespace glucolumin::util {

namespace {

constexpr std::size_t kDateLength   = 8;
constexpr std::size_t kSuffixLength = 6;
constexpr std::size_t kIdLength     = 1 + kDateLength + 1 + kSuffixLength;

} // namespace

VisitId GenerateVisitId(TimePoint at) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char               kHex[] = "0123456789ABCDEF";

  std::string suffix;
  suffix.reserve(kSuffixLength);
  auto bits = rng();
  for (std::size_t i = 0; i < kSuffixLength; ++i) {
    suffix.push_back(kHex[bits & 0x0F]);
    bits >>= 4;
  }

  VisitId id;
  id.visit_id   = "V" + ToDateStamp(at) + "_" + suffix;
  id.patient_id = "P-" + suffix;
  return id;
}

bool IsValidVisitId(const std::string& visit_id) {
  if (visit_id.size() != kIdLength || visit_id[0] != 'V' || visit_id[1 + kDateLength] != '_') {
    return false;
  }
  for (std::size_t i = 1; i <= kDateLength; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(visit_id[i]))) return false;
  }
  for (std::size_t i = 2 + kDateLength; i < kIdLength; ++i) {
    const char c = visit_id[i];
    if (!std::isdigit(static_cast<unsigned char>(c)) && !(c >= 'A' && c <= 'F')) return false;
  }
  return true;
}

std::optional<std::string> VisitSuffix(const std::string& visit_id) {
  if (!IsValidVisitId(visit_id)) {
    return std::nullopt;
  }
  return visit_id.substr(2 + kDateLength);
}

} // namespace glucolumin::util
