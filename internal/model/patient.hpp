#pragma once

#include <array>
#include <string>
#include <string_view>

namespace glucolumin::model {

/*
  Immutable patient snapshot taken at registration.
*/
struct PatientProfile {
  std::string name;
  int         age = 0;
  std::string sex;

  double height_cm = 0.0;
  double weight_kg = 0.0;

  std::string skin_tone;
  std::string blood_pressure;  // "systolic/diastolic"

  bool had_food                = false;
  bool family_diabetic_history = false;
};

struct BloodPressure {
  int systolic  = 0;
  int diastolic = 0;
};

inline constexpr std::array<std::string_view, 5> kSkinTones = {"Very Fair", "Fair", "Medium", "Dark", "Black"};

// Rejects every malformed field with ValidationError.
void ValidateProfile(const PatientProfile& profile);

// weight / height^2, rounded to 2 decimals.
double BodyMassIndex(double height_cm, double weight_kg);

BloodPressure ParseBloodPressure(const std::string& value);

// yes/no, true/false, y/n, 1/0; case-insensitive.
bool ParseYesNo(std::string_view field, const std::string& value);

// Canonical spelling of a skin tone from kSkinTones, matched case-insensitively.
std::string CanonicalSkinTone(const std::string& value);

// "Male", "Female" or "Other".
std::string CanonicalSex(const std::string& value);

} // namespace glucolumin::model
