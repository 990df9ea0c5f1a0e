// ==============================
// Datei: lib/json_ctrl/json_ctrl.cpp
// ==============================

#include "json_ctrl.h"
#include "log_ctrl.h"

#include <ArduinoJson.h>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>
#include <set>

using namespace json_ctrl;
using growspace_ctrl::Condition;
using growspace_ctrl::GrowspaceConfig;
using profile_ctrl::Band;
using profile_ctrl::DayPhase;
using profile_ctrl::ThresholdProfile;
using profile_ctrl::Variable;
using verdant::ConfigError;
using verdant::ConfigErrorCode;
using vpd_calc::GrowthStage;

namespace {

constexpr uint64_t kMinuteMs = 60ull * 1000ull;
constexpr double kMaxDurationMs = 9.0e18;   // unter 2^63

double round3(double v) { return std::round(v * 1000.0) / 1000.0; }

bool readBool(JsonVariantConst v, bool& out, const char* key, ConfigError& err) {
  if (v.isNull()) return true;
  if (!v.is<bool>()) return err.fail(ConfigErrorCode::ParseError, std::string("'") + key + "' must be true/false");
  out = v.as<bool>();
  return true;
}

template <typename T>
bool readNumber(JsonVariantConst v, T& out, const char* key, ConfigError& err) {
  if (v.isNull()) return true;
  if (!v.is<double>()) return err.fail(ConfigErrorCode::ParseError, std::string("'") + key + "' must be a number");
  const double d = v.as<double>();
  if (!std::isfinite(d) || d < static_cast<double>(std::numeric_limits<T>::lowest()) ||
      d > static_cast<double>(std::numeric_limits<T>::max())) {
    return err.fail(ConfigErrorCode::ParseError, std::string("'") + key + "' out of range");
  }
  out = static_cast<T>(d);
  return true;
}

// Dauer in Einheiten (s, min) -> ms; negativ oder jenseits uint64 ist ein Fehler
bool durationMs(double value, double unitMs, uint64_t& out, const std::string& key, ConfigError& err) {
  if (value < 0.0) return err.fail(ConfigErrorCode::InvalidTolerance, key + " must not be negative");
  const double ms = value * unitMs;
  if (!(ms < kMaxDurationMs)) return err.fail(ConfigErrorCode::ParseError, key + " out of range");
  out = static_cast<uint64_t>(ms);
  return true;
}

bool readString(JsonVariantConst v, std::string& out, const char* key, ConfigError& err) {
  if (v.isNull()) return true;
  if (!v.is<const char*>()) return err.fail(ConfigErrorCode::ParseError, std::string("'") + key + "' must be a string");
  out = v.as<const char*>();
  return true;
}

// Epoch-ms als Zahl oder "YYYY-MM-DD"
bool readTime(JsonVariantConst v, uint64_t& out, const char* key, ConfigError& err) {
  if (v.is<const char*>()) {
    if (parseDate(v.as<const char*>(), out)) return true;
    return err.fail(ConfigErrorCode::ParseError, std::string("'") + key + "' must be YYYY-MM-DD");
  }
  if (v.is<uint64_t>()) { out = v.as<uint64_t>(); return true; }
  return err.fail(ConfigErrorCode::ParseError, std::string("'") + key + "' must be epoch ms or YYYY-MM-DD");
}

// --- Profile ---

bool readBand(JsonVariantConst v, Band& b, const std::string& where, ConfigError& err) {
  if (v.isNull()) { b = Band{false, 0.0f, 0.0f, 0.0f}; return true; }  // explizit null = kein Band
  if (!v.is<JsonObjectConst>()) return err.fail(ConfigErrorCode::ParseError, where + " must be an object");
  JsonObjectConst o = v.as<JsonObjectConst>();
  Band n = b.defined ? b : Band{true, 0.0f, 0.0f, 0.0f};
  n.defined = true;
  if (!o["ideal"].isNull()) {
    float ideal = 0.0f;
    if (!readNumber(o["ideal"], ideal, "ideal", err)) return false;
    n.idealMin = n.idealMax = ideal;
  }
  if (!readNumber(o["min"], n.idealMin, "min", err)) return false;
  if (!readNumber(o["max"], n.idealMax, "max", err)) return false;
  if (!readNumber(o["tolerance"], n.tolerance, "tolerance", err)) return false;
  b = n;
  return true;
}

bool readProfile(JsonVariantConst v, ThresholdProfile& p, const std::string& where, ConfigError& err) {
  if (!v.is<JsonObjectConst>()) return err.fail(ConfigErrorCode::ParseError, where + " must be an object");
  for (JsonPairConst kv : v.as<JsonObjectConst>()) {
    Variable var;
    if (!profile_ctrl::parseVariable(kv.key().c_str(), var)) {
      return err.fail(ConfigErrorCode::ParseError, where + ": unknown variable '" + kv.key().c_str() + "'");
    }
    if (!readBand(kv.value(), p.band(var), where + "." + kv.key().c_str(), err)) return false;
  }
  return true;
}

bool parsePhaseKey(const char* key, DayPhase& out) {
  if (std::strcmp(key, "day") == 0) { out = DayPhase::Day; return true; }
  if (std::strcmp(key, "night") == 0) { out = DayPhase::Night; return true; }
  return false;
}

bool applyProfiles(JsonObjectConst o, profile_ctrl::ProfileResolver& res, ConfigError& err) {
  for (JsonPairConst st : o) {
    GrowthStage stage;
    if (!vpd_calc::parseStage(st.key().c_str(), stage)) {
      return err.fail(ConfigErrorCode::ParseError, std::string("profiles: unknown stage '") + st.key().c_str() + "'");
    }
    if (!st.value().is<JsonObjectConst>()) {
      return err.fail(ConfigErrorCode::ParseError, std::string("profiles.") + st.key().c_str() + " must be an object");
    }
    for (JsonPairConst ph : st.value().as<JsonObjectConst>()) {
      DayPhase phase;
      if (!parsePhaseKey(ph.key().c_str(), phase)) {
        return err.fail(ConfigErrorCode::ParseError, std::string("profiles: unknown phase '") + ph.key().c_str() + "'");
      }
      if (ph.value().isNull()) { res.clearProfile(stage, phase); continue; }
      // Basis: bisheriges Profil (Nacht ohne eigenes Profil: Tagesprofil)
      ThresholdProfile p = res.resolve(stage, phase);
      const std::string where = std::string("profiles.") + st.key().c_str() + "." + ph.key().c_str();
      if (!readProfile(ph.value(), p, where, err)) return false;
      res.setProfile(stage, phase, p);
    }
  }
  return true;
}

bool applyLateFlowerProfiles(JsonObjectConst o, profile_ctrl::ProfileResolver& res, ConfigError& err) {
  for (JsonPairConst ph : o) {
    DayPhase phase;
    if (!parsePhaseKey(ph.key().c_str(), phase)) {
      return err.fail(ConfigErrorCode::ParseError, std::string("late_flower_profiles: unknown phase '") + ph.key().c_str() + "'");
    }
    if (ph.value().isNull()) { res.clearLateFlowerProfile(phase); continue; }
    ThresholdProfile p = res.resolve(GrowthStage::Flowering, phase, INT_MAX);
    if (!readProfile(ph.value(), p, std::string("late_flower_profiles.") + ph.key().c_str(), err)) return false;
    res.setLateFlowerProfile(phase, p);
  }
  return true;
}

// --- Growspace-Objekt ---

bool applyCondition(JsonVariantConst v, growspace_ctrl::ConditionConfig& cc, const char* name, ConfigError& err) {
  if (!v.is<JsonObjectConst>()) return err.fail(ConfigErrorCode::ParseError, std::string("conditions.") + name + " must be an object");
  JsonObjectConst o = v.as<JsonObjectConst>();
  if (!readBool(o["enabled"], cc.enabled, "enabled", err)) return false;
  if (!readNumber(o["prior"], cc.prior, "prior", err)) return false;
  if (!readNumber(o["turn_on"], cc.gate.turnOn, "turn_on", err)) return false;
  if (!readNumber(o["turn_off"], cc.gate.turnOff, "turn_off", err)) return false;
  double dwellS = cc.gate.minDwellMs / 1000.0;
  if (!readNumber(o["min_dwell_s"], dwellS, "min_dwell_s", err)) return false;
  return durationMs(dwellS, 1000.0, cc.gate.minDwellMs, std::string(name) + ": min_dwell_s", err);
}

bool applyGrowspace(JsonObjectConst o, GrowspaceConfig& c, ConfigError& err) {
  if (!o["id"].is<const char*>() || !std::strlen(o["id"].as<const char*>())) {
    return err.fail(ConfigErrorCode::MissingField, "growspace 'id' missing");
  }
  c.id = o["id"].as<const char*>();
  c.name = c.id;
  if (!readString(o["name"], c.name, "name", err)) return false;

  if (!o["sensors"].isNull()) {
    JsonObjectConst s = o["sensors"].as<JsonObjectConst>();
    if (s.isNull()) return err.fail(ConfigErrorCode::ParseError, "'sensors' must be an object");
    if (!readBool(s["temperature"], c.sensors.temperature, "sensors.temperature", err)) return false;
    if (!readBool(s["humidity"], c.sensors.humidity, "sensors.humidity", err)) return false;
    if (!readBool(s["vpd"], c.sensors.vpd, "sensors.vpd", err)) return false;
    if (!readBool(s["co2"], c.sensors.co2, "sensors.co2", err)) return false;
    if (!readBool(s["light"], c.sensors.light, "sensors.light", err)) return false;
    if (!readBool(s["fan"], c.sensors.fan, "sensors.fan", err)) return false;
  }
  if (!readBool(o["derive_vpd"], c.deriveVpd, "derive_vpd", err)) return false;

  int lateDays = c.profiles.lateFlowerDays();
  if (!readNumber(o["late_flower_days"], lateDays, "late_flower_days", err)) return false;
  c.profiles.setLateFlowerDays(lateDays);

  if (!o["stage"].isNull()) {
    const char* st = o["stage"].as<const char*>();
    if (!vpd_calc::parseStage(st, c.stage)) {
      return err.fail(ConfigErrorCode::ParseError, std::string("unknown stage '") + (st ? st : "?") + "'");
    }
  }
  if (!o["stage_start"].isNull()) {
    if (!readTime(o["stage_start"], c.stageStartMs, "stage_start", err)) return false;
    c.hasStageStart = true;
  }

  if (!o["conditions"].isNull()) {
    JsonObjectConst conds = o["conditions"].as<JsonObjectConst>();
    if (conds.isNull()) return err.fail(ConfigErrorCode::ParseError, "'conditions' must be an object");
    for (JsonPairConst kv : conds) {
      Condition cond;
      if (!growspace_ctrl::parseCondition(kv.key().c_str(), cond)) {
        return err.fail(ConfigErrorCode::ParseError, std::string("unknown condition '") + kv.key().c_str() + "'");
      }
      if (!applyCondition(kv.value(), c.condition(cond), growspace_ctrl::conditionName(cond), err)) return false;
    }
  }

  if (!o["light"].isNull()) {
    JsonObjectConst l = o["light"].as<JsonObjectConst>();
    if (l.isNull()) return err.fail(ConfigErrorCode::ParseError, "'light' must be an object");
    double tolMin = c.light.toleranceMs / static_cast<double>(kMinuteMs);
    if (!readNumber(l["tolerance_min"], tolMin, "light.tolerance_min", err)) return false;
    if (!durationMs(tolMin, static_cast<double>(kMinuteMs), c.light.toleranceMs, "light.tolerance_min", err)) return false;
    if (!readNumber(l["rollover_minute"], c.light.rolloverMinute, "light.rollover_minute", err)) return false;
    if (!readNumber(l["tz_offset_min"], c.light.tzOffsetMin, "light.tz_offset_min", err)) return false;
    if (!l["hours"].isNull()) {
      JsonObjectConst h = l["hours"].as<JsonObjectConst>();
      if (h.isNull()) return err.fail(ConfigErrorCode::ParseError, "'light.hours' must be an object");
      // "flower" gilt auch für alle Blüte-Unterphasen ohne eigenen Wert
      bool phaseSet[light_cycle::kFlowerPhaseCount] = {false, false, false};
      for (JsonPairConst kv : h) {
        light_cycle::FlowerPhase fp;
        if (light_cycle::parseFlowerPhase(kv.key().c_str(), fp)) {
          const int i = static_cast<int>(fp);
          if (!readNumber(kv.value(), c.light.flowerOnHours[i], "light.hours", err)) return false;
          phaseSet[i] = true;
          continue;
        }
        GrowthStage st;
        if (!vpd_calc::parseStage(kv.key().c_str(), st)) {
          return err.fail(ConfigErrorCode::ParseError, std::string("light.hours: unknown stage '") + kv.key().c_str() + "'");
        }
        if (!readNumber(kv.value(), c.light.onHours[vpd_calc::stageIndex(st)], "light.hours", err)) return false;
      }
      const float flower = c.light.onHours[vpd_calc::stageIndex(GrowthStage::Flowering)];
      if (!h["flower"].isNull() || !h["flowering"].isNull()) {
        for (int i = 0; i < light_cycle::kFlowerPhaseCount; ++i) {
          if (!phaseSet[i]) c.light.flowerOnHours[i] = flower;
        }
      }
    }
    if (!readNumber(l["flower_mid_days"], c.light.flowerMidDays, "light.flower_mid_days", err)) return false;
    if (!readNumber(l["flower_late_days"], c.light.flowerLateDays, "light.flower_late_days", err)) return false;
  }

  if (!o["trend"].isNull()) {
    JsonObjectConst t = o["trend"].as<JsonObjectConst>();
    if (t.isNull()) return err.fail(ConfigErrorCode::ParseError, "'trend' must be an object");
    if (!readBool(t["enabled"], c.trendEnabled, "trend.enabled", err)) return false;
    double winMin = c.trendWindowMs / static_cast<double>(kMinuteMs);
    if (!readNumber(t["window_min"], winMin, "trend.window_min", err)) return false;
    if (!durationMs(winMin, static_cast<double>(kMinuteMs), c.trendWindowMs, "trend.window_min", err)) return false;
  }

  if (!o["profiles"].isNull()) {
    JsonObjectConst p = o["profiles"].as<JsonObjectConst>();
    if (p.isNull()) return err.fail(ConfigErrorCode::ParseError, "'profiles' must be an object");
    if (!applyProfiles(p, c.profiles, err)) return false;
  }
  if (!o["late_flower_profiles"].isNull()) {
    JsonObjectConst p = o["late_flower_profiles"].as<JsonObjectConst>();
    if (p.isNull()) return err.fail(ConfigErrorCode::ParseError, "'late_flower_profiles' must be an object");
    if (!applyLateFlowerProfiles(p, c.profiles, err)) return false;
  }
  return true;
}

bool withId(bool ok, const GrowspaceConfig& c, ConfigError& err) {
  if (!ok && !c.id.empty()) err.message = c.id + ": " + err.message;
  return ok;
}

} // namespace

// --- Datum ---

bool json_ctrl::parseDate(const char* s, uint64_t& outMs) {
  if (!s) return false;
  int y = 0, m = 0, d = 0;
  char tail = 0;
  if (std::sscanf(s, "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) return false;
  if (y < 1970 || m < 1 || m > 12 || d < 1 || d > 31) return false;
  // Tage seit 1970-01-01 (proleptischer Gregorianischer Kalender)
  const int yy = y - (m <= 2 ? 1 : 0);
  const int era = yy / 400;
  const int yoe = yy - era * 400;
  const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  const long long days = static_cast<long long>(era) * 146097 + doe - 719468;
  outMs = static_cast<uint64_t>(days) * 24ull * 60ull * kMinuteMs;
  return true;
}

// --- Konfiguration ---

bool json_ctrl::loadGrowspaceConfig(const std::string& json, GrowspaceConfig& out, ConfigError& err) {
  JsonDocument doc;
  DeserializationError de = deserializeJson(doc, json);
  if (de) return err.fail(ConfigErrorCode::ParseError, std::string("bad json: ") + de.c_str());
  if (!doc.is<JsonObjectConst>()) return err.fail(ConfigErrorCode::ParseError, "growspace config must be an object");
  GrowspaceConfig c;
  if (!withId(applyGrowspace(doc.as<JsonObjectConst>(), c, err), c, err)) return false;
  out = c;
  return true;
}

bool json_ctrl::loadGrowspaceConfigs(const std::string& json, std::vector<GrowspaceConfig>& out,
                                     ConfigError& err) {
  JsonDocument doc;
  DeserializationError de = deserializeJson(doc, json);
  if (de) return err.fail(ConfigErrorCode::ParseError, std::string("bad json: ") + de.c_str());

  JsonArrayConst list;
  if (doc.is<JsonArrayConst>()) {
    list = doc.as<JsonArrayConst>();
  } else if (doc["growspaces"].is<JsonArrayConst>()) {
    list = doc["growspaces"].as<JsonArrayConst>();
  } else if (doc.is<JsonObjectConst>()) {
    GrowspaceConfig c;
    if (!withId(applyGrowspace(doc.as<JsonObjectConst>(), c, err), c, err)) return false;
    out.push_back(c);
    return true;
  } else {
    return err.fail(ConfigErrorCode::ParseError, "expected growspace object or array");
  }

  std::vector<GrowspaceConfig> parsed;
  std::set<std::string> ids;
  for (JsonVariantConst v : list) {
    if (!v.is<JsonObjectConst>()) return err.fail(ConfigErrorCode::ParseError, "growspace entry must be an object");
    GrowspaceConfig c;
    if (!withId(applyGrowspace(v.as<JsonObjectConst>(), c, err), c, err)) return false;
    if (!ids.insert(c.id).second) {
      return err.fail(ConfigErrorCode::DuplicateGrowspace, "duplicate growspace id '" + c.id + "'");
    }
    parsed.push_back(c);
  }
  if (parsed.empty()) return err.fail(ConfigErrorCode::MissingField, "no growspaces configured");
  out.insert(out.end(), parsed.begin(), parsed.end());
  return true;
}

// --- Ereignisse ---

bool json_ctrl::parseEvent(const std::string& line, engine_ctrl::Event& out, ConfigError& err) {
  JsonDocument doc;
  DeserializationError de = deserializeJson(doc, line);
  if (de) return err.fail(ConfigErrorCode::ParseError, std::string("bad json: ") + de.c_str());
  if (!doc.is<JsonObjectConst>()) return err.fail(ConfigErrorCode::ParseError, "event must be an object");

  const char* type = doc["type"].as<const char*>();
  if (!type) return err.fail(ConfigErrorCode::MissingField, "event 'type' missing");

  std::string id;
  if (!readString(doc["growspace"], id, "growspace", err)) return false;
  if (id.empty() && !readString(doc["growspace_id"], id, "growspace_id", err)) return false;
  if (id.empty()) return err.fail(ConfigErrorCode::MissingField, "event 'growspace' missing");

  if (!doc["ts"].is<uint64_t>()) return err.fail(ConfigErrorCode::MissingField, "event 'ts' (epoch ms) missing");
  const uint64_t ts = doc["ts"].as<uint64_t>();

  if (std::strcmp(type, "sensor") == 0) {
    Variable var;
    if (!profile_ctrl::parseVariable(doc["variable"].as<const char*>(), var)) {
      return err.fail(ConfigErrorCode::ParseError, "sensor event: unknown 'variable'");
    }
    JsonVariantConst v = doc["value"];
    if (v.isNull()) {
      out = engine_ctrl::Event::sensorUnavailable(id, var, ts);
    } else if (v.is<bool>()) {
      out = engine_ctrl::Event::sensor(id, var, v.as<bool>() ? 1.0 : 0.0, ts);
    } else if (v.is<double>()) {
      out = engine_ctrl::Event::sensor(id, var, v.as<double>(), ts);
    } else if (v.is<const char*>() && (std::strcmp(v.as<const char*>(), "on") == 0 ||
                                       std::strcmp(v.as<const char*>(), "off") == 0)) {
      out = engine_ctrl::Event::sensor(id, var, std::strcmp(v.as<const char*>(), "on") == 0 ? 1.0 : 0.0, ts);
    } else {
      out = engine_ctrl::Event::sensorUnavailable(id, var, ts);   // "unavailable", "unknown", ...
    }
    return true;
  }

  if (std::strcmp(type, "stage") == 0) {
    GrowthStage st;
    if (!vpd_calc::parseStage(doc["stage"].as<const char*>(), st)) {
      return err.fail(ConfigErrorCode::ParseError, "stage event: unknown 'stage'");
    }
    uint64_t start = ts;
    if (!doc["stage_start"].isNull() && !readTime(doc["stage_start"], start, "stage_start", err)) return false;
    out = engine_ctrl::Event::stageChange(id, st, start, ts);
    return true;
  }

  if (std::strcmp(type, "light") == 0) {
    JsonVariantConst s = doc["state"];
    if (s.is<bool>()) {
      out = engine_ctrl::Event::light(id, s.as<bool>(), ts);
    } else if (s.is<const char*>() && std::strcmp(s.as<const char*>(), "on") == 0) {
      out = engine_ctrl::Event::light(id, true, ts);
    } else if (s.is<const char*>() && std::strcmp(s.as<const char*>(), "off") == 0) {
      out = engine_ctrl::Event::light(id, false, ts);
    } else {
      out = engine_ctrl::Event::lightUnavailable(id, ts);
    }
    return true;
  }

  if (std::strcmp(type, "tick") == 0) {
    out = engine_ctrl::Event::tick(id, ts);
    return true;
  }

  return err.fail(ConfigErrorCode::ParseError, std::string("unknown event type '") + type + "'");
}

// --- Ausgabe ---

std::string json_ctrl::makeVerdictJson(const growspace_ctrl::VerdictUpdate& u) {
  JsonDocument doc;
  doc["growspace_id"] = u.growspaceId;
  doc["condition"] = growspace_ctrl::conditionName(u.condition);
  doc["state"] = growspace_ctrl::tristateName(u.value);
  doc["stale"] = u.stale;
  if (u.hasProbability) doc["probability"] = round3(u.probability);
  else doc["probability"] = nullptr;
  doc["prior"] = round3(u.prior);
  doc["low_confidence"] = u.hasProbability && u.observed.size() == 1;

  JsonArray contrib = doc["contributing"].to<JsonArray>();
  for (Variable v : u.contributing) contrib.add(profile_ctrl::variableName(v));
  JsonArray obs = doc["observed"].to<JsonArray>();
  for (Variable v : u.observed) obs.add(profile_ctrl::variableName(v));
  JsonArray reasons = doc["reasons"].to<JsonArray>();
  for (const auto& c : u.contributions) {
    JsonObject r = reasons.add<JsonObject>();
    r["variable"] = profile_ctrl::variableName(c.variable);
    r["source"] = c.source;
    r["ratio"] = round3(c.ratio);
    if (c.derived) r["derived"] = true;
  }

  doc["changed_at"] = u.changedAtMs;
  doc["evaluated_at"] = u.evaluatedAtMs;
  doc["stage"] = vpd_calc::stageName(u.stage);
  doc["phase"] = profile_ctrl::phaseName(u.phase);
  if (u.lateFlower) doc["late_flower"] = true;
  std::string out;
  serializeJson(doc, out);
  return out;
}

std::string json_ctrl::makeScheduleJson(const growspace_ctrl::LightScheduleUpdate& u) {
  JsonDocument doc;
  doc["growspace_id"] = u.growspaceId;
  doc["state"] = light_cycle::verdictName(u.verdict);
  doc["observed_on_min"] = round3(u.observedOnMs / 60000.0);
  doc["expected_on_min"] = round3(u.expectedOnMs / 60000.0);
  doc["observed_on_ms"] = u.observedOnMs;
  doc["expected_on_ms"] = u.expectedOnMs;
  if (u.windowStartMs || u.windowEndMs) {
    JsonObject w = doc["window"].to<JsonObject>();
    w["start"] = u.windowStartMs;
    w["end"] = u.windowEndMs;
    w["closed"] = u.windowValid;
    w["evaluated"] = u.windowEvaluated;
  }
  doc["stage"] = vpd_calc::stageName(u.stage);
  doc["at"] = u.atMs;
  std::string out;
  serializeJson(doc, out);
  return out;
}

std::string json_ctrl::makeGrowspaceStatusJson(const growspace_ctrl::GrowspaceCtrl& gs, uint64_t nowMs) {
  JsonDocument doc;
  doc["growspace_id"] = gs.id();
  doc["name"] = gs.config().name;
  doc["stage"] = vpd_calc::stageName(gs.stage());
  doc["days_in_stage"] = gs.daysInStage(nowMs);
  doc["late_flower"] = gs.isLateFlower(nowMs);
  doc["phase"] = profile_ctrl::phaseName(gs.phase());
  doc["light"] = light_cycle::lightStateName(gs.lightState());

  const bayes_calc::SensorSnapshot& snap = gs.snapshot();
  JsonObject sensors = doc["sensors"].to<JsonObject>();
  for (int i = 0; i < profile_ctrl::kVariableCount; ++i) {
    const Variable v = static_cast<Variable>(i);
    const bayes_calc::Reading& r = snap.get(v);
    if (r.available) sensors[profile_ctrl::variableName(v)] = round3(r.value);
    else sensors[profile_ctrl::variableName(v)] = nullptr;
  }
  doc["vpd_derived"] = snap.get(Variable::Vpd).derived;
  const bayes_calc::Reading& t = snap.get(Variable::Temperature);
  const bayes_calc::Reading& h = snap.get(Variable::Humidity);
  if (t.available && h.available) {
    const double dp = vpd_calc::computeDewPoint(t.value, h.value);
    if (std::isfinite(dp)) doc["dew_point"] = round3(dp);
  }

  JsonObject verdicts = doc["verdicts"].to<JsonObject>();
  for (int i = 0; i < growspace_ctrl::kConditionCount; ++i) {
    const Condition c = static_cast<Condition>(i);
    const growspace_ctrl::VerdictUpdate& u = gs.latest(c);
    JsonObject o = verdicts[growspace_ctrl::conditionName(c)].to<JsonObject>();
    o["enabled"] = gs.config().condition(c).enabled;
    o["state"] = growspace_ctrl::tristateName(u.value);
    o["stale"] = u.stale;
    if (u.hasProbability) o["probability"] = round3(u.probability);
    else o["probability"] = nullptr;
  }

  const growspace_ctrl::LightScheduleUpdate sch = gs.schedule(nowMs);
  JsonObject s = doc["light_schedule"].to<JsonObject>();
  s["state"] = light_cycle::verdictName(sch.verdict);
  s["observed_on_min"] = round3(sch.observedOnMs / 60000.0);
  s["expected_on_min"] = round3(sch.expectedOnMs / 60000.0);

  const ThresholdProfile& p = gs.activeProfile(nowMs);
  JsonObject prof = doc["profile"].to<JsonObject>();
  for (int i = 0; i < profile_ctrl::kVariableCount; ++i) {
    const Band& b = p.bands[i];
    if (!b.defined) continue;
    JsonObject bo = prof[profile_ctrl::variableName(static_cast<Variable>(i))].to<JsonObject>();
    bo["min"] = b.idealMin;
    bo["max"] = b.idealMax;
    bo["tolerance"] = b.tolerance;
  }

  const health::GrowspaceHealth& hs = gs.healthState();
  JsonObject ho = doc["health"].to<JsonObject>();
  ho["config_ok"] = hs.config_ok;
  ho["critical_ok"] = health::critical_ok(hs);
  ho["light_ok"] = hs.light_ok;
  if (hs.message.length()) ho["message"] = hs.message;

  std::string out;
  serializeJson(doc, out);
  return out;
}
