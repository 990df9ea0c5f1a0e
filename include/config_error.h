// Konfigurationsfehler – werden beim Start eines Growspace gemeldet, nie still korrigiert.
#pragma once

#include <cstdint>
#include <string>

namespace verdant {

enum class ConfigErrorCode : uint8_t {
  None = 0,
  PriorOutOfRange,     // Prior nicht in (0,1)
  ThresholdOrder,      // turn_on <= turn_off
  ThresholdRange,      // Schwelle nicht in [0,1]
  MissingProfile,      // Stadium ohne Tagesprofil
  InvalidProfileBand,  // ideal_min > ideal_max, Toleranz <= 0, ...
  InvalidSchedule,     // Lichtstunden außerhalb 0..24
  InvalidTolerance,    // Toleranz/Fenster unplausibel
  DuplicateGrowspace,
  ParseError,          // JSON nicht lesbar
  MissingField,        // Pflichtfeld fehlt (z. B. "id")
};

inline const char* configErrorName(ConfigErrorCode c) {
  switch (c) {
    case ConfigErrorCode::None:               return "none";
    case ConfigErrorCode::PriorOutOfRange:    return "prior_out_of_range";
    case ConfigErrorCode::ThresholdOrder:     return "threshold_order";
    case ConfigErrorCode::ThresholdRange:     return "threshold_range";
    case ConfigErrorCode::MissingProfile:     return "missing_profile";
    case ConfigErrorCode::InvalidProfileBand: return "invalid_profile_band";
    case ConfigErrorCode::InvalidSchedule:    return "invalid_schedule";
    case ConfigErrorCode::InvalidTolerance:   return "invalid_tolerance";
    case ConfigErrorCode::DuplicateGrowspace: return "duplicate_growspace";
    case ConfigErrorCode::ParseError:         return "parse_error";
    case ConfigErrorCode::MissingField:       return "missing_field";
  }
  return "unknown";
}

struct ConfigError {
  ConfigErrorCode code = ConfigErrorCode::None;
  std::string message;

  bool ok() const { return code == ConfigErrorCode::None; }

  // Gibt immer false zurück, damit "return err.fail(...)" in bool-Funktionen passt
  bool fail(ConfigErrorCode c, const std::string& msg) {
    code = c;
    message = msg;
    return false;
  }
};

} // namespace verdant
