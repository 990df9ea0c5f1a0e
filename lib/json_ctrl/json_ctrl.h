/*
 * json_ctrl.h | JSON-Anbindung (ArduinoJson 7)
 *
 * - Growspace-Konfiguration laden (ein Objekt, Array oder {"growspaces":[...]})
 * - Ereignisse aus JSON-Zeilen lesen (Replay / externe Einspeisung)
 * - Urteile, Lichtplan und Status als JSON für die Veröffentlichung
 *
 * Fehlende Schlüssel behalten die Defaults aus verdant_config.h.
 * Die inhaltliche Prüfung (Priors, Schwellen, Profile) macht
 * growspace_ctrl::validateConfig beim Start.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "growspace_ctrl.h"
#include "engine_ctrl.h"
#include "../../include/config_error.h"

namespace json_ctrl {

// "YYYY-MM-DD" -> Epoch-ms (UTC Mitternacht)
bool parseDate(const char* s, uint64_t& outMs);

bool loadGrowspaceConfig(const std::string& json, growspace_ctrl::GrowspaceConfig& out,
                         verdant::ConfigError& err);
bool loadGrowspaceConfigs(const std::string& json, std::vector<growspace_ctrl::GrowspaceConfig>& out,
                          verdant::ConfigError& err);

bool parseEvent(const std::string& line, engine_ctrl::Event& out, verdant::ConfigError& err);

std::string makeVerdictJson(const growspace_ctrl::VerdictUpdate& u);
std::string makeScheduleJson(const growspace_ctrl::LightScheduleUpdate& u);
std::string makeGrowspaceStatusJson(const growspace_ctrl::GrowspaceCtrl& gs, uint64_t nowMs);

} // namespace json_ctrl
