// ==============================
// Datei: lib/profile_ctrl/profile_ctrl.cpp
// ==============================

#include "profile_ctrl.h"
#include "../../include/verdant_config.h" // Standardprofile
#include <cmath>
#include <cstring>
#include <string>

using namespace profile_ctrl;
using verdant::ConfigError;
using verdant::ConfigErrorCode;

namespace {

// Leeres Profil für ungültige Konfigurationen (validate() schlägt vorher an)
const ThresholdProfile kEmptyProfile{};

bool bandValid(const Band& b) {
  if (!b.defined) return true;
  if (!std::isfinite(b.idealMin) || !std::isfinite(b.idealMax) || !std::isfinite(b.tolerance)) return false;
  if (b.idealMin > b.idealMax) return false;
  return b.tolerance > 0.0f;
}

bool profileValid(const ThresholdProfile& p, std::string& which) {
  for (int i = 0; i < kVariableCount; ++i) {
    if (!bandValid(p.bands[i])) {
      which = variableName(static_cast<Variable>(i));
      return false;
    }
  }
  return true;
}

} // namespace

const char* profile_ctrl::variableName(Variable v) {
  switch (v) {
    case Variable::Temperature: return "temperature";
    case Variable::Humidity:    return "humidity";
    case Variable::Vpd:         return "vpd";
    case Variable::Co2:         return "co2";
    case Variable::Fan:         return "fan_state";
  }
  return "unknown";
}

bool profile_ctrl::parseVariable(const char* name, Variable& out) {
  if (!name) return false;
  for (int i = 0; i < kVariableCount; ++i) {
    Variable v = static_cast<Variable>(i);
    if (std::strcmp(name, variableName(v)) == 0) { out = v; return true; }
  }
  if (std::strcmp(name, "fan") == 0) { out = Variable::Fan; return true; }
  return false;
}

const char* profile_ctrl::phaseName(DayPhase p) {
  return p == DayPhase::Night ? "night" : "day";
}

// --- Band ---

double Band::distanceAbove(double v) const {
  if (!defined || v <= idealMax) return 0.0;
  return (v - idealMax) / tolerance;
}

double Band::distanceBelow(double v) const {
  if (!defined || v >= idealMin) return 0.0;
  return (idealMin - v) / tolerance;
}

double Band::normalizedDistance(double v) const {
  double above = distanceAbove(v);
  return above > 0.0 ? above : distanceBelow(v);
}

bool ThresholdProfile::any() const {
  for (const auto& b : bands) if (b.defined) return true;
  return false;
}

// --- ProfileResolver ---

ProfileResolver::ProfileResolver() : lateFlowerDays_(verdant::profiles::LATE_FLOWER_DAYS) {
  for (int si = 0; si < kStageCount; ++si) {
    profiles_[si][0] = verdant::profiles::DAY[si];
    present_[si][0]  = true;
    profiles_[si][1] = verdant::profiles::NIGHT[si];
    present_[si][1]  = verdant::profiles::HAS_NIGHT[si];
  }
  late_[0] = verdant::profiles::LATE_FLOWER_DAY;
  late_[1] = verdant::profiles::LATE_FLOWER_NIGHT;
  latePresent_[0] = latePresent_[1] = true;
}

void ProfileResolver::setProfile(GrowthStage st, DayPhase ph, const ThresholdProfile& p) {
  profiles_[vpd_calc::stageIndex(st)][idxPhase(ph)] = p;
  present_[vpd_calc::stageIndex(st)][idxPhase(ph)]  = true;
}

void ProfileResolver::clearProfile(GrowthStage st, DayPhase ph) {
  profiles_[vpd_calc::stageIndex(st)][idxPhase(ph)] = kEmptyProfile;
  present_[vpd_calc::stageIndex(st)][idxPhase(ph)]  = false;
}

bool ProfileResolver::hasExplicit(GrowthStage st, DayPhase ph) const {
  return present_[vpd_calc::stageIndex(st)][idxPhase(ph)];
}

void ProfileResolver::setLateFlowerProfile(DayPhase ph, const ThresholdProfile& p) {
  late_[idxPhase(ph)] = p;
  latePresent_[idxPhase(ph)] = true;
}

void ProfileResolver::clearLateFlowerProfile(DayPhase ph) {
  late_[idxPhase(ph)] = kEmptyProfile;
  latePresent_[idxPhase(ph)] = false;
}

const ThresholdProfile& ProfileResolver::resolve(GrowthStage st, DayPhase ph) const {
  const int si = vpd_calc::stageIndex(st);
  const int pi = idxPhase(ph);
  if (present_[si][pi]) return profiles_[si][pi];
  if (present_[si][0]) return profiles_[si][0];   // Nacht -> Tag
  return kEmptyProfile;
}

const ThresholdProfile& ProfileResolver::resolve(GrowthStage st, DayPhase ph, int daysInStage) const {
  if (st == GrowthStage::Flowering && lateFlowerDays_ > 0 && daysInStage >= lateFlowerDays_) {
    const int pi = idxPhase(ph);
    if (latePresent_[pi]) return late_[pi];
    if (latePresent_[0]) return late_[0];
    // keine Spätblüte hinterlegt: normales Blüteprofil
  }
  return resolve(st, ph);
}

bool ProfileResolver::validate(ConfigError& err) const {
  std::string which;
  for (int si = 0; si < kStageCount; ++si) {
    const char* stage = vpd_calc::stageName(static_cast<GrowthStage>(si));
    if (!present_[si][0] || !profiles_[si][0].any()) {
      return err.fail(ConfigErrorCode::MissingProfile,
                      std::string("no day profile for stage '") + stage + "'");
    }
    for (int pi = 0; pi < kPhaseCount; ++pi) {
      if (!present_[si][pi]) continue;
      if (!profileValid(profiles_[si][pi], which)) {
        return err.fail(ConfigErrorCode::InvalidProfileBand,
                        std::string("invalid ") + which + " band in " + stage + "/" +
                        phaseName(static_cast<DayPhase>(pi)) + " profile");
      }
    }
  }
  for (int pi = 0; pi < kPhaseCount; ++pi) {
    if (latePresent_[pi] && !profileValid(late_[pi], which)) {
      return err.fail(ConfigErrorCode::InvalidProfileBand,
                      std::string("invalid ") + which + " band in late flower/" +
                      phaseName(static_cast<DayPhase>(pi)) + " profile");
    }
  }
  if (lateFlowerDays_ < 0) {
    return err.fail(ConfigErrorCode::InvalidTolerance, "late_flower_days must not be negative");
  }
  return true;
}
