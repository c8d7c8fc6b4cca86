#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/time.hpp"
#include "internal/util/visit_id.hpp"

namespace {

using namespace glucolumin::util;

void TestFormat() {
  const auto at = FromUnixMillis(1792368000000ULL);  // 2026-10-19T00:00:00Z
  const auto id = GenerateVisitId(at);

  assert(id.visit_id.size() == 16);
  assert(id.visit_id.rfind("V20261019_", 0) == 0);
  assert(IsValidVisitId(id.visit_id));
  assert(id.patient_id == "P-" + VisitSuffix(id.visit_id).value());
}

void TestIdsAreUnique() {
  std::set<std::string> seen;
  const auto            now = Now();
  for (int i = 0; i < 200; ++i) {
    seen.insert(GenerateVisitId(now).visit_id);
  }
  // 24 random bits; a collision among 200 draws is vanishingly unlikely.
  assert(seen.size() >= 199);
}

void TestRejectsMalformedIds() {
  assert(!IsValidVisitId(""));
  assert(!IsValidVisitId("V20261019-3FA9C1"));
  assert(!IsValidVisitId("V20261019_3fa9c1"));
  assert(!IsValidVisitId("X20261019_3FA9C1"));
  assert(!IsValidVisitId("V2026101_3FA9C1"));
  assert(!IsValidVisitId("V20261019_3FA9C1Z"));
  assert(IsValidVisitId("V20261019_3FA9C1"));
  assert(!VisitSuffix("bogus").has_value());
  assert(VisitSuffix("V20261019_3FA9C1").value() == "3FA9C1");
}

void TestIsoTimestamp() {
  const auto at = FromUnixMillis(1792368000123ULL);
  assert(ToIso8601(at) == "2026-10-19T00:00:00.123Z");
  assert(ToDateStamp(at) == "20261019");
  assert(ToUnixMillis(at) == 1792368000123ULL);
}

} // namespace

int main() {
  TestFormat();
  TestIdsAreUnique();
  TestRejectsMalformedIds();
  TestIsoTimestamp();

  std::cout << "glucolumin_unit_visit_id: pass\n";
  return 0;
}
