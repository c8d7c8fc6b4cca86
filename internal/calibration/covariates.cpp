#include "covariates.hpp"

#include "internal/util/errors.hpp"

namespace glucolumin::calibration {

Covariates DeriveCovariates(const model::PatientProfile& profile, const ModelArtifact& artifact) {
  const auto bp   = model::ParseBloodPressure(profile.blood_pressure);
  const auto tone = model::CanonicalSkinTone(profile.skin_tone);

  const auto calibration = artifact.skin_tones.find(tone);
  if (calibration == artifact.skin_tones.end()) {
    throw util::ValidationError("skin tone '" + tone + "' has no calibration in model " + artifact.version);
  }

  Covariates out;
  out.skin_tone   = tone;
  out.skin_offset = calibration->second.offset;

  out.values["age"]              = static_cast<double>(profile.age);
  out.values["sex_male"]         = model::CanonicalSex(profile.sex) == "Male" ? 1.0 : 0.0;
  out.values["bmi"]              = model::BodyMassIndex(profile.height_cm, profile.weight_kg);
  out.values["bp_systolic"]      = static_cast<double>(bp.systolic);
  out.values["bp_diastolic"]     = static_cast<double>(bp.diastolic);
  out.values["skin_tone_factor"] = calibration->second.factor;
  out.values["fasting_hours"]    = profile.had_food ? artifact.fed_hours : artifact.fasting_hours;
  out.values["family_history"]   = profile.family_diabetic_history ? 1.0 : 0.0;
  return out;
}

} // namespace glucolumin::calibration
