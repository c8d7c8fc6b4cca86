#include "patient.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

#include "internal/util/errors.hpp"

namespace glucolumin::model {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Trim(std::string_view value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(begin, end - begin + 1));
}

int ParseBoundedInt(std::string_view token, std::string_view what) {
  const auto trimmed = Trim(token);
  int        value   = 0;
  const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
  if (trimmed.empty() || ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
    throw util::ValidationError("blood_pressure: " + std::string(what) + " is not an integer");
  }
  return value;
}

} // namespace

double BodyMassIndex(double height_cm, double weight_kg) {
  if (!(height_cm > 0.0) || !(weight_kg > 0.0)) {
    throw util::ValidationError("bmi: height_cm and weight_kg must be positive");
  }
  const double height_m = height_cm / 100.0;
  return std::round(weight_kg / (height_m * height_m) * 100.0) / 100.0;
}

BloodPressure ParseBloodPressure(const std::string& value) {
  const auto slash = value.find('/');
  if (slash == std::string::npos || value.find('/', slash + 1) != std::string::npos) {
    throw util::ValidationError("blood_pressure: expected \"systolic/diastolic\", got \"" + value + "\"");
  }

  BloodPressure bp;
  bp.systolic  = ParseBoundedInt(std::string_view(value).substr(0, slash), "systolic");
  bp.diastolic = ParseBoundedInt(std::string_view(value).substr(slash + 1), "diastolic");

  if (bp.systolic < 40 || bp.systolic > 300 || bp.diastolic < 20 || bp.diastolic > 200) {
    throw util::ValidationError("blood_pressure: value out of physiological range: " + value);
  }
  if (bp.diastolic >= bp.systolic) {
    throw util::ValidationError("blood_pressure: diastolic must be below systolic: " + value);
  }
  return bp;
}

bool ParseYesNo(std::string_view field, const std::string& value) {
  const auto normalized = Lower(Trim(value));
  if (normalized == "yes" || normalized == "y" || normalized == "true" || normalized == "1") {
    return true;
  }
  if (normalized == "no" || normalized == "n" || normalized == "false" || normalized == "0") {
    return false;
  }
  throw util::ValidationError(std::string(field) + ": expected yes/no, got \"" + value + "\"");
}

std::string CanonicalSkinTone(const std::string& value) {
  const auto normalized = Lower(Trim(value));
  for (const auto tone : kSkinTones) {
    if (Lower(tone) == normalized) {
      return std::string(tone);
    }
  }
  throw util::ValidationError("skin_tone: unknown value \"" + value + "\"");
}

std::string CanonicalSex(const std::string& value) {
  const auto normalized = Lower(Trim(value));
  if (normalized == "male" || normalized == "m") return "Male";
  if (normalized == "female" || normalized == "f") return "Female";
  if (normalized == "other") return "Other";
  throw util::ValidationError("sex: expected Male, Female or Other, got \"" + value + "\"");
}

void ValidateProfile(const PatientProfile& profile) {
  if (Trim(profile.name).empty()) {
    throw util::ValidationError("patient_name: must not be empty");
  }
  if (profile.age <= 0 || profile.age > 130) {
    throw util::ValidationError("age: must be in (0, 130], got " + std::to_string(profile.age));
  }
  if (!std::isfinite(profile.height_cm) || profile.height_cm < 30.0 || profile.height_cm > 272.0) {
    throw util::ValidationError("height_cm: must be in [30, 272]");
  }
  if (!std::isfinite(profile.weight_kg) || profile.weight_kg < 1.0 || profile.weight_kg > 500.0) {
    throw util::ValidationError("weight_kg: must be in [1, 500]");
  }

  (void)CanonicalSex(profile.sex);
  (void)CanonicalSkinTone(profile.skin_tone);
  (void)ParseBloodPressure(profile.blood_pressure);
}

} // namespace glucolumin::model
