#include <gtest/gtest.h>

#include <ArduinoJson.h>
#include <string>
#include <vector>

#include "json_ctrl.h"
#include "log_ctrl.h"

using namespace json_ctrl;
using engine_ctrl::Event;
using engine_ctrl::EventType;
using growspace_ctrl::Condition;
using growspace_ctrl::GrowspaceConfig;
using growspace_ctrl::GrowspaceCtrl;
using profile_ctrl::DayPhase;
using profile_ctrl::Variable;
using verdant::ConfigError;
using verdant::ConfigErrorCode;
using vpd_calc::GrowthStage;

namespace {

const char* kTent = R"({
  "id": "tent1",
  "name": "Blütezelt",
  "sensors": {"temperature": true, "humidity": true, "co2": true, "light": true, "fan": true},
  "derive_vpd": false,
  "late_flower_days": 49,
  "stage": "flowering",
  "stage_start": "2024-01-01",
  "conditions": {
    "stress": {"prior": 0.2, "turn_on": 0.8, "turn_off": 0.6, "min_dwell_s": 120},
    "mold": {"enabled": false}
  },
  "light": {"tolerance_min": 20, "rollover_minute": 360, "tz_offset_min": 60, "hours": {"flower": 11.5}},
  "trend": {"enabled": true, "window_min": 15},
  "profiles": {
    "veg": {
      "day": {"temperature": {"min": 22, "max": 26, "tolerance": 1.5}, "co2": null, "humidity": {"ideal": 55}},
      "night": null
    }
  },
  "late_flower_profiles": {"night": {"humidity": {"max": 45}}}
})";

JsonDocument parse(const std::string& s) {
  JsonDocument doc;
  EXPECT_FALSE(deserializeJson(doc, s)) << s;
  return doc;
}

class JsonCtrlTest : public ::testing::Test {
protected:
  void SetUp() override { log_ctrl::setSink([](const char*) {}); }
  void TearDown() override { log_ctrl::setSink(nullptr); }
};

} // namespace

TEST(JsonDate, ParsesIsoDay) {
  uint64_t ms = 0;
  ASSERT_TRUE(parseDate("2024-01-01", ms));
  EXPECT_EQ(ms, 1704067200000ull);
  ASSERT_TRUE(parseDate("1970-01-01", ms));
  EXPECT_EQ(ms, 0u);
  ASSERT_TRUE(parseDate("2024-03-01", ms));
  EXPECT_EQ(ms, 1709251200000ull);
  EXPECT_FALSE(parseDate("2024-13-01", ms));
  EXPECT_FALSE(parseDate("yesterday", ms));
  EXPECT_FALSE(parseDate("2024-01-01T10:00", ms));
  EXPECT_FALSE(parseDate(nullptr, ms));
}

TEST(JsonConfig, FullGrowspace) {
  GrowspaceConfig c;
  ConfigError err;
  ASSERT_TRUE(loadGrowspaceConfig(kTent, c, err)) << err.message;

  EXPECT_EQ(c.id, "tent1");
  EXPECT_EQ(c.name, "Blütezelt");
  EXPECT_TRUE(c.sensors.co2);
  EXPECT_TRUE(c.sensors.fan);
  EXPECT_FALSE(c.sensors.vpd);
  EXPECT_FALSE(c.deriveVpd);
  EXPECT_EQ(c.profiles.lateFlowerDays(), 49);
  EXPECT_EQ(c.stage, GrowthStage::Flowering);
  EXPECT_TRUE(c.hasStageStart);
  EXPECT_EQ(c.stageStartMs, 1704067200000ull);

  const auto& stress = c.condition(Condition::Stress);
  EXPECT_DOUBLE_EQ(stress.prior, 0.2);
  EXPECT_FLOAT_EQ(stress.gate.turnOn, 0.8f);
  EXPECT_FLOAT_EQ(stress.gate.turnOff, 0.6f);
  EXPECT_EQ(stress.gate.minDwellMs, 120000u);
  EXPECT_FALSE(c.condition(Condition::MoldRisk).enabled);
  EXPECT_TRUE(c.condition(Condition::Optimal).enabled);

  EXPECT_EQ(c.light.toleranceMs, 20u * 60000u);
  EXPECT_EQ(c.light.rolloverMinute, 360);
  EXPECT_EQ(c.light.tzOffsetMin, 60);
  EXPECT_EQ(c.light.expectedOnMs(GrowthStage::Flowering), 690u * 60000u);
  EXPECT_EQ(c.light.expectedOnMs(GrowthStage::Vegetative), 18u * 3600000u);

  EXPECT_TRUE(c.trendEnabled);
  EXPECT_EQ(c.trendWindowMs, 15u * 60000u);

  ConfigError verr;
  EXPECT_TRUE(growspace_ctrl::validateConfig(c, verr)) << verr.message;
}

TEST(JsonConfig, ProfileOverridesMergeOntoDefaults) {
  GrowspaceConfig c;
  ConfigError err;
  ASSERT_TRUE(loadGrowspaceConfig(kTent, c, err)) << err.message;

  const auto& day = c.profiles.resolve(GrowthStage::Vegetative, DayPhase::Day);
  EXPECT_FLOAT_EQ(day.band(Variable::Temperature).idealMin, 22.0f);
  EXPECT_FLOAT_EQ(day.band(Variable::Temperature).idealMax, 26.0f);
  EXPECT_FLOAT_EQ(day.band(Variable::Temperature).tolerance, 1.5f);
  EXPECT_FALSE(day.band(Variable::Co2).defined);
  // Sollpunkt übernimmt die bisherige Toleranz
  EXPECT_FLOAT_EQ(day.band(Variable::Humidity).idealMin, 55.0f);
  EXPECT_FLOAT_EQ(day.band(Variable::Humidity).idealMax, 55.0f);
  EXPECT_FLOAT_EQ(day.band(Variable::Humidity).tolerance, 10.0f);
  // unverändert aus den Defaults
  EXPECT_TRUE(day.band(Variable::Vpd).defined);

  EXPECT_FALSE(c.profiles.hasExplicit(GrowthStage::Vegetative, DayPhase::Night));
  EXPECT_EQ(&c.profiles.resolve(GrowthStage::Vegetative, DayPhase::Night), &day);

  const auto& lateNight = c.profiles.resolve(GrowthStage::Flowering, DayPhase::Night, 60);
  EXPECT_FLOAT_EQ(lateNight.band(Variable::Humidity).idealMax, 45.0f);
  EXPECT_FLOAT_EQ(lateNight.band(Variable::Humidity).idealMin, 40.0f);
}

TEST(JsonConfig, MissingIdIsMissingField) {
  GrowspaceConfig c;
  ConfigError err;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"name": "no id"})", c, err));
  EXPECT_EQ(err.code, ConfigErrorCode::MissingField);
}

TEST(JsonConfig, BrokenJsonIsParseError) {
  GrowspaceConfig c;
  ConfigError err;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"id": "x",)", c, err));
  EXPECT_EQ(err.code, ConfigErrorCode::ParseError);
}

TEST(JsonConfig, WrongTypesAreParseErrors) {
  GrowspaceConfig c;
  ConfigError e1;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"id": "x", "derive_vpd": "yes"})", c, e1));
  EXPECT_EQ(e1.code, ConfigErrorCode::ParseError);
  EXPECT_EQ(e1.message.rfind("x: ", 0), 0u);

  ConfigError e2;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"id": "x", "conditions": {"stress": {"prior": "high"}}})", c, e2));
  EXPECT_EQ(e2.code, ConfigErrorCode::ParseError);

  ConfigError e3;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"id": "x", "stage": "harvest"})", c, e3));
  EXPECT_EQ(e3.code, ConfigErrorCode::ParseError);

  ConfigError e4;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"id": "x", "profiles": {"veg": {"day": {"pressure": {"min": 1}}}}})", c, e4));
  EXPECT_EQ(e4.code, ConfigErrorCode::ParseError);

  ConfigError e5;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"id": "x", "conditions": {"drought": {}}})", c, e5));
  EXPECT_EQ(e5.code, ConfigErrorCode::ParseError);
}

TEST(JsonConfig, SemanticErrorsSurfaceOnValidation) {
  GrowspaceConfig c;
  ConfigError err;
  ASSERT_TRUE(loadGrowspaceConfig(
      R"({"id": "x", "conditions": {"optimal": {"turn_on": 0.5, "turn_off": 0.7}}})", c, err));
  ConfigError verr;
  EXPECT_FALSE(growspace_ctrl::validateConfig(c, verr));
  EXPECT_EQ(verr.code, ConfigErrorCode::ThresholdOrder);
}

TEST(JsonConfig, ListForms) {
  std::vector<GrowspaceConfig> a;
  ConfigError e1;
  ASSERT_TRUE(loadGrowspaceConfigs(R"([{"id": "a"}, {"id": "b"}])", a, e1)) << e1.message;
  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a[1].id, "b");

  std::vector<GrowspaceConfig> b;
  ConfigError e2;
  ASSERT_TRUE(loadGrowspaceConfigs(R"({"growspaces": [{"id": "a", "stage": "veg"}]})", b, e2));
  ASSERT_EQ(b.size(), 1u);
  EXPECT_EQ(b[0].stage, GrowthStage::Vegetative);

  std::vector<GrowspaceConfig> c;
  ConfigError e3;
  ASSERT_TRUE(loadGrowspaceConfigs(R"({"id": "solo"})", c, e3));
  ASSERT_EQ(c.size(), 1u);
  EXPECT_EQ(c[0].name, "solo");
}

TEST(JsonConfig, ListErrors) {
  std::vector<GrowspaceConfig> out;
  ConfigError e1;
  EXPECT_FALSE(loadGrowspaceConfigs(R"([{"id": "a"}, {"id": "a"}])", out, e1));
  EXPECT_EQ(e1.code, ConfigErrorCode::DuplicateGrowspace);
  EXPECT_TRUE(out.empty());

  ConfigError e2;
  EXPECT_FALSE(loadGrowspaceConfigs("[]", out, e2));
  EXPECT_EQ(e2.code, ConfigErrorCode::MissingField);

  ConfigError e3;
  EXPECT_FALSE(loadGrowspaceConfigs("42", out, e3));
  EXPECT_EQ(e3.code, ConfigErrorCode::ParseError);
}

TEST(JsonConfig, FlowerSubStageHours) {
  GrowspaceConfig c;
  ConfigError err;
  ASSERT_TRUE(loadGrowspaceConfig(
      R"({"id": "x", "light": {"hours": {"flower_late": 10, "flower": 11}, "flower_mid_days": 20}})", c, err))
      << err.message;
  constexpr uint64_t kH = 3600000ull;
  EXPECT_EQ(c.light.flowerMidDays, 20);
  EXPECT_EQ(c.light.flowerLateDays, 42);
  EXPECT_EQ(c.light.expectedOnMs(GrowthStage::Flowering), 11 * kH);
  EXPECT_EQ(c.light.expectedOnMs(GrowthStage::Flowering, 5), 11 * kH);
  EXPECT_EQ(c.light.expectedOnMs(GrowthStage::Flowering, 20), 11 * kH);
  EXPECT_EQ(c.light.expectedOnMs(GrowthStage::Flowering, 42), 10 * kH);

  ConfigError verr;
  EXPECT_TRUE(growspace_ctrl::validateConfig(c, verr)) << verr.message;

  GrowspaceConfig bad;
  ConfigError e2;
  ASSERT_TRUE(loadGrowspaceConfig(R"({"id": "x", "light": {"flower_mid_days": 50}})", bad, e2));
  ConfigError verr2;
  EXPECT_FALSE(growspace_ctrl::validateConfig(bad, verr2));
  EXPECT_EQ(verr2.code, ConfigErrorCode::InvalidSchedule);
}

TEST(JsonConfig, OutOfRangeNumbersAreRejected) {
  const char* cases[] = {
      R"({"id": "x", "late_flower_days": 1e300})",
      R"({"id": "x", "light": {"rollover_minute": 1e12}})",
      R"({"id": "x", "light": {"tz_offset_min": -1e12}})",
      R"({"id": "x", "light": {"tolerance_min": 1e17}})",
      R"({"id": "x", "conditions": {"stress": {"min_dwell_s": 1e20}}})",
      R"({"id": "x", "conditions": {"stress": {"turn_on": 1e300}}})",
      R"({"id": "x", "trend": {"window_min": 1e300}})",
  };
  for (const char* json : cases) {
    GrowspaceConfig c;
    ConfigError err;
    EXPECT_FALSE(loadGrowspaceConfig(json, c, err)) << json;
    EXPECT_EQ(err.code, ConfigErrorCode::ParseError) << json;
  }

  GrowspaceConfig c;
  ConfigError err;
  EXPECT_FALSE(loadGrowspaceConfig(R"({"id": "x", "trend": {"window_min": -5}})", c, err));
  EXPECT_EQ(err.code, ConfigErrorCode::InvalidTolerance);
}

TEST(JsonEvent, Sensor) {
  Event ev;
  ConfigError err;
  ASSERT_TRUE(parseEvent(R"({"type":"sensor","growspace":"t","ts":1000,"variable":"temperature","value":24.5})", ev, err));
  EXPECT_EQ(ev.type, EventType::Sensor);
  EXPECT_EQ(ev.growspaceId, "t");
  EXPECT_EQ(ev.ts, 1000u);
  EXPECT_EQ(ev.variable, Variable::Temperature);
  EXPECT_TRUE(ev.available);
  EXPECT_DOUBLE_EQ(ev.value, 24.5);

  ASSERT_TRUE(parseEvent(R"({"type":"sensor","growspace_id":"t","ts":1,"variable":"fan_state","value":"off"})", ev, err));
  EXPECT_EQ(ev.variable, Variable::Fan);
  EXPECT_TRUE(ev.available);
  EXPECT_DOUBLE_EQ(ev.value, 0.0);

  ASSERT_TRUE(parseEvent(R"({"type":"sensor","growspace":"t","ts":1,"variable":"fan","value":true})", ev, err));
  EXPECT_DOUBLE_EQ(ev.value, 1.0);

  ASSERT_TRUE(parseEvent(R"({"type":"sensor","growspace":"t","ts":1,"variable":"humidity","value":null})", ev, err));
  EXPECT_FALSE(ev.available);
  ASSERT_TRUE(parseEvent(R"({"type":"sensor","growspace":"t","ts":1,"variable":"humidity","value":"unavailable"})", ev, err));
  EXPECT_FALSE(ev.available);
}

TEST(JsonEvent, StageLightTick) {
  Event ev;
  ConfigError err;
  ASSERT_TRUE(parseEvent(R"({"type":"stage","growspace":"t","ts":5000,"stage":"flower","stage_start":"2024-01-01"})", ev, err));
  EXPECT_EQ(ev.type, EventType::Stage);
  EXPECT_EQ(ev.stage, GrowthStage::Flowering);
  EXPECT_EQ(ev.stageStartMs, 1704067200000ull);

  ASSERT_TRUE(parseEvent(R"({"type":"stage","growspace":"t","ts":5000,"stage":"dry"})", ev, err));
  EXPECT_EQ(ev.stageStartMs, 5000u);

  ASSERT_TRUE(parseEvent(R"({"type":"light","growspace":"t","ts":1,"state":"on"})", ev, err));
  EXPECT_EQ(ev.type, EventType::Light);
  EXPECT_TRUE(ev.available);
  EXPECT_TRUE(ev.lightOn);
  ASSERT_TRUE(parseEvent(R"({"type":"light","growspace":"t","ts":1,"state":false})", ev, err));
  EXPECT_FALSE(ev.lightOn);
  ASSERT_TRUE(parseEvent(R"({"type":"light","growspace":"t","ts":1,"state":"unknown"})", ev, err));
  EXPECT_FALSE(ev.available);

  ASSERT_TRUE(parseEvent(R"({"type":"tick","growspace":"t","ts":99})", ev, err));
  EXPECT_EQ(ev.type, EventType::Tick);
  EXPECT_EQ(ev.ts, 99u);
}

TEST(JsonEvent, Errors) {
  Event ev;
  ConfigError e1;
  EXPECT_FALSE(parseEvent(R"({"growspace":"t","ts":1})", ev, e1));
  EXPECT_EQ(e1.code, ConfigErrorCode::MissingField);

  ConfigError e2;
  EXPECT_FALSE(parseEvent(R"({"type":"tick","ts":1})", ev, e2));
  EXPECT_EQ(e2.code, ConfigErrorCode::MissingField);

  ConfigError e3;
  EXPECT_FALSE(parseEvent(R"({"type":"tick","growspace":"t"})", ev, e3));
  EXPECT_EQ(e3.code, ConfigErrorCode::MissingField);

  ConfigError e4;
  EXPECT_FALSE(parseEvent(R"({"type":"harvest","growspace":"t","ts":1})", ev, e4));
  EXPECT_EQ(e4.code, ConfigErrorCode::ParseError);

  ConfigError e5;
  EXPECT_FALSE(parseEvent(R"({"type":"sensor","growspace":"t","ts":1,"variable":"pressure","value":1})", ev, e5));
  EXPECT_EQ(e5.code, ConfigErrorCode::ParseError);

  ConfigError e6;
  EXPECT_FALSE(parseEvent("not json", ev, e6));
  EXPECT_EQ(e6.code, ConfigErrorCode::ParseError);
}

TEST(JsonOutput, VerdictWithProbability) {
  growspace_ctrl::VerdictUpdate u;
  u.growspaceId = "tent1";
  u.condition = Condition::MoldRisk;
  u.value = growspace_ctrl::Tristate::True;
  u.stale = false;
  u.hasProbability = true;
  u.probability = 0.81234;
  u.prior = 0.1;
  u.contributing = {Variable::Humidity};
  u.observed = {Variable::Humidity, Variable::Vpd};
  u.contributions = {{Variable::Humidity, "humidity_high", 6.5, false},
                     {Variable::Vpd, "vpd_low", 1.0, true}};
  u.changedAtMs = 1000;
  u.evaluatedAtMs = 2000;
  u.stage = GrowthStage::Flowering;
  u.phase = DayPhase::Night;
  u.lateFlower = true;

  JsonDocument doc = parse(makeVerdictJson(u));
  EXPECT_STREQ(doc["growspace_id"].as<const char*>(), "tent1");
  EXPECT_STREQ(doc["condition"].as<const char*>(), "mold_risk");
  EXPECT_STREQ(doc["state"].as<const char*>(), "on");
  EXPECT_FALSE(doc["stale"].as<bool>());
  EXPECT_NEAR(doc["probability"].as<double>(), 0.812, 1e-9);
  EXPECT_FALSE(doc["low_confidence"].as<bool>());
  EXPECT_EQ(doc["contributing"].size(), 1u);
  EXPECT_STREQ(doc["contributing"][0].as<const char*>(), "humidity");
  EXPECT_EQ(doc["observed"].size(), 2u);
  EXPECT_STREQ(doc["reasons"][0]["source"].as<const char*>(), "humidity_high");
  EXPECT_DOUBLE_EQ(doc["reasons"][0]["ratio"].as<double>(), 6.5);
  EXPECT_TRUE(doc["reasons"][0]["derived"].isNull());
  EXPECT_TRUE(doc["reasons"][1]["derived"].as<bool>());
  EXPECT_EQ(doc["changed_at"].as<uint64_t>(), 1000u);
  EXPECT_STREQ(doc["stage"].as<const char*>(), "flower");
  EXPECT_STREQ(doc["phase"].as<const char*>(), "night");
  EXPECT_TRUE(doc["late_flower"].as<bool>());
}

TEST(JsonOutput, UnknownVerdictHasNullProbability) {
  growspace_ctrl::VerdictUpdate u;
  u.growspaceId = "tent1";
  JsonDocument doc = parse(makeVerdictJson(u));
  EXPECT_STREQ(doc["state"].as<const char*>(), "unknown");
  EXPECT_TRUE(doc["stale"].as<bool>());
  EXPECT_TRUE(doc["probability"].isNull());
  EXPECT_FALSE(doc["probability"].isUnbound());
  EXPECT_EQ(doc["contributing"].size(), 0u);
  EXPECT_TRUE(doc["late_flower"].isUnbound());
}

TEST(JsonOutput, SingleVariableIsLowConfidence) {
  growspace_ctrl::VerdictUpdate u;
  u.hasProbability = true;
  u.probability = 0.5;
  u.observed = {Variable::Temperature};
  JsonDocument doc = parse(makeVerdictJson(u));
  EXPECT_TRUE(doc["low_confidence"].as<bool>());
}

TEST(JsonOutput, Schedule) {
  growspace_ctrl::LightScheduleUpdate u;
  u.growspaceId = "tent1";
  u.verdict = light_cycle::ScheduleVerdict::Incorrect;
  u.observedOnMs = 700ull * 60000ull;
  u.expectedOnMs = 720ull * 60000ull;
  u.windowValid = true;
  u.windowEvaluated = true;
  u.windowStartMs = 10;
  u.windowEndMs = 20;
  u.stage = GrowthStage::Flowering;
  u.atMs = 20;

  JsonDocument doc = parse(makeScheduleJson(u));
  EXPECT_STREQ(doc["state"].as<const char*>(), "incorrect");
  EXPECT_DOUBLE_EQ(doc["observed_on_min"].as<double>(), 700.0);
  EXPECT_DOUBLE_EQ(doc["expected_on_min"].as<double>(), 720.0);
  EXPECT_EQ(doc["window"]["end"].as<uint64_t>(), 20u);
  EXPECT_TRUE(doc["window"]["closed"].as<bool>());
  EXPECT_STREQ(doc["stage"].as<const char*>(), "flower");

  growspace_ctrl::LightScheduleUpdate empty;
  JsonDocument d2 = parse(makeScheduleJson(empty));
  EXPECT_STREQ(d2["state"].as<const char*>(), "unknown");
  EXPECT_TRUE(d2["window"].isUnbound());
}

TEST_F(JsonCtrlTest, GrowspaceStatus) {
  GrowspaceConfig c;
  ConfigError err;
  ASSERT_TRUE(loadGrowspaceConfig(R"({"id": "tent1", "name": "Zelt", "stage": "veg",
                                      "stage_start": 1700000000000})", c, err)) << err.message;
  GrowspaceCtrl gs;
  ASSERT_TRUE(gs.begin(c, err)) << err.message;
  const uint64_t now = 1700000000000ull + 3ull * 86400000ull;
  gs.onSensor(Variable::Temperature, true, 25.0, now);
  gs.onSensor(Variable::Humidity, true, 50.0, now);

  JsonDocument doc = parse(makeGrowspaceStatusJson(gs, now));
  EXPECT_STREQ(doc["growspace_id"].as<const char*>(), "tent1");
  EXPECT_STREQ(doc["name"].as<const char*>(), "Zelt");
  EXPECT_STREQ(doc["stage"].as<const char*>(), "veg");
  EXPECT_EQ(doc["days_in_stage"].as<int>(), 3);
  EXPECT_FALSE(doc["late_flower"].as<bool>());
  EXPECT_STREQ(doc["phase"].as<const char*>(), "day");
  EXPECT_STREQ(doc["light"].as<const char*>(), "unknown");

  EXPECT_DOUBLE_EQ(doc["sensors"]["temperature"].as<double>(), 25.0);
  EXPECT_TRUE(doc["sensors"]["co2"].isNull());
  EXPECT_NEAR(doc["sensors"]["vpd"].as<double>(), 1.58, 0.01);
  EXPECT_TRUE(doc["vpd_derived"].as<bool>());
  EXPECT_NEAR(doc["dew_point"].as<double>(), 13.9, 0.1);

  EXPECT_TRUE(doc["verdicts"]["stress"]["enabled"].as<bool>());
  EXPECT_FALSE(doc["verdicts"]["stress"]["probability"].isNull());
  EXPECT_STREQ(doc["light_schedule"]["state"].as<const char*>(), "unknown");
  EXPECT_DOUBLE_EQ(doc["light_schedule"]["expected_on_min"].as<double>(), 1080.0);
  EXPECT_DOUBLE_EQ(doc["profile"]["temperature"]["min"].as<double>(), 24.0);
  EXPECT_TRUE(doc["profile"]["fan_state"].isUnbound());

  EXPECT_TRUE(doc["health"]["config_ok"].as<bool>());
  EXPECT_TRUE(doc["health"]["critical_ok"].as<bool>());
  EXPECT_FALSE(doc["health"]["light_ok"].as<bool>());
}
