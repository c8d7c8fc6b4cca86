#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/patient.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace glucolumin::model;
using glucolumin::util::ValidationError;

PatientProfile Valid() {
  PatientProfile p;
  p.name           = "Ada";
  p.age            = 35;
  p.sex            = "Female";
  p.height_cm      = 175.0;
  p.weight_kg      = 70.0;
  p.skin_tone      = "Medium";
  p.blood_pressure = "120/80";
  return p;
}

template <typename Fn>
bool RejectsWithValidation(Fn&& fn) {
  try {
    fn();
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

void TestBodyMassIndex() {
  assert(BodyMassIndex(175.0, 70.0) == 22.86);
  assert(BodyMassIndex(160.0, 50.0) == 19.53);
  assert(RejectsWithValidation([] { BodyMassIndex(0.0, 70.0); }));
}

void TestBloodPressure() {
  const auto bp = ParseBloodPressure("120/80");
  assert(bp.systolic == 120);
  assert(bp.diastolic == 80);
  assert(ParseBloodPressure(" 135 / 85 ").diastolic == 85);

  assert(RejectsWithValidation([] { ParseBloodPressure("120"); }));
  assert(RejectsWithValidation([] { ParseBloodPressure("120/80/60"); }));
  assert(RejectsWithValidation([] { ParseBloodPressure("abc/80"); }));
  assert(RejectsWithValidation([] { ParseBloodPressure("80/120"); }));
  assert(RejectsWithValidation([] { ParseBloodPressure("400/80"); }));
}

void TestYesNo() {
  assert(ParseYesNo("had_food", "Yes"));
  assert(ParseYesNo("had_food", " y "));
  assert(ParseYesNo("had_food", "TRUE"));
  assert(!ParseYesNo("had_food", "No"));
  assert(!ParseYesNo("had_food", "0"));
  assert(RejectsWithValidation([] { ParseYesNo("had_food", "maybe"); }));
}

void TestCanonicalSpellings() {
  assert(CanonicalSkinTone("very fair") == "Very Fair");
  assert(CanonicalSkinTone("BLACK") == "Black");
  assert(RejectsWithValidation([] { CanonicalSkinTone("Olive"); }));

  assert(CanonicalSex("m") == "Male");
  assert(CanonicalSex("FEMALE") == "Female");
  assert(CanonicalSex("other") == "Other");
  assert(RejectsWithValidation([] { CanonicalSex("unknown"); }));
}

void TestValidateProfile() {
  ValidateProfile(Valid());

  assert(RejectsWithValidation([] {
    auto p = Valid();
    p.name = "  ";
    ValidateProfile(p);
  }));
  assert(RejectsWithValidation([] {
    auto p = Valid();
    p.age  = 0;
    ValidateProfile(p);
  }));
  assert(RejectsWithValidation([] {
    auto p      = Valid();
    p.height_cm = 10.0;
    ValidateProfile(p);
  }));
  assert(RejectsWithValidation([] {
    auto p      = Valid();
    p.weight_kg = 900.0;
    ValidateProfile(p);
  }));
  assert(RejectsWithValidation([] {
    auto p      = Valid();
    p.skin_tone = "Teal";
    ValidateProfile(p);
  }));
  assert(RejectsWithValidation([] {
    auto p           = Valid();
    p.blood_pressure = "high";
    ValidateProfile(p);
  }));
}

} // namespace

int main() {
  TestBodyMassIndex();
  TestBloodPressure();
  TestYesNo();
  TestCanonicalSpellings();
  TestValidateProfile();

  std::cout << "glucolumin_unit_patient: pass\n";
  return 0;
}
