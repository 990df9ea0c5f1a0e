// Sehr leichte Health-Status-Verwaltung je Growspace
#pragma once

#include <string>
#include "profile_ctrl.h"

namespace health {

struct GrowspaceHealth {
  bool config_ok = false;
  bool sensor_ok[profile_ctrl::kVariableCount] = {};  // letzter Messwert verfügbar
  bool light_ok = false;                               // Lichtzustand bekannt
  // Kurzer Sammeltext für schnelle Anzeige
  std::string message;
};

// Für Stress/Schimmel braucht es mindestens Temperatur oder Feuchte
inline bool critical_ok(const GrowspaceHealth& h) {
  return h.config_ok &&
         (h.sensor_ok[profile_ctrl::varIndex(profile_ctrl::Variable::Temperature)] ||
          h.sensor_ok[profile_ctrl::varIndex(profile_ctrl::Variable::Humidity)]);
}

inline void set_config(GrowspaceHealth& h, bool ok, const std::string& msg = "") {
  h.config_ok = ok; if (!ok && msg.length()) h.message = msg;
}
inline void set_sensor(GrowspaceHealth& h, profile_ctrl::Variable v, bool ok, const std::string& msg = "") {
  h.sensor_ok[profile_ctrl::varIndex(v)] = ok; if (!ok && msg.length()) h.message = msg;
}
inline void set_light(GrowspaceHealth& h, bool ok, const std::string& msg = "") {
  h.light_ok = ok; if (!ok && msg.length()) h.message = msg;
}

} // namespace health
