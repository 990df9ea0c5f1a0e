// ==============================
// Datei: lib/growspace_ctrl/growspace_ctrl.cpp
// ==============================

#include "growspace_ctrl.h"
#include "log_ctrl.h"
#include "../../include/verdant_config.h" // zentrale Defaults
#include <cmath>
#include <cstring>

using namespace growspace_ctrl;
using verdant::ConfigError;
using verdant::ConfigErrorCode;
using vpd_calc::computeVpd;

namespace {

constexpr uint64_t kDayMs = 24ull * 60ull * 60ull * 1000ull;

gate_ctrl::GateConfig gateFrom(const verdant::gate::Thresholds& t) {
  return gate_ctrl::GateConfig{t.turnOn, t.turnOff, static_cast<uint64_t>(t.minDwellS) * 1000ull};
}

const char* boolWord(bool b) { return b ? "ON" : "OFF"; }

} // namespace

const char* growspace_ctrl::conditionName(Condition c) {
  switch (c) {
    case Condition::Stress:   return "stress";
    case Condition::MoldRisk: return "mold_risk";
    case Condition::Optimal:  return "optimal";
  }
  return "unknown";
}

bool growspace_ctrl::parseCondition(const char* name, Condition& out) {
  if (!name) return false;
  for (int i = 0; i < kConditionCount; ++i) {
    Condition c = static_cast<Condition>(i);
    if (std::strcmp(name, conditionName(c)) == 0) { out = c; return true; }
  }
  if (std::strcmp(name, "mold") == 0) { out = Condition::MoldRisk; return true; }
  return false;
}

const char* growspace_ctrl::tristateName(Tristate t) {
  switch (t) {
    case Tristate::True:  return "on";
    case Tristate::False: return "off";
    case Tristate::Unknown: break;
  }
  return "unknown";
}

bool SensorBindings::bound(Variable v) const {
  switch (v) {
    case Variable::Temperature: return temperature;
    case Variable::Humidity:    return humidity;
    case Variable::Vpd:         return vpd;
    case Variable::Co2:         return co2;
    case Variable::Fan:         return fan;
  }
  return false;
}

// --- Konfiguration ---

GrowspaceConfig::GrowspaceConfig()
  : deriveVpd(true),
    conditions{{true, verdant::priors::STRESS, gateFrom(verdant::gate::STRESS)},
               {true, verdant::priors::MOLD_RISK, gateFrom(verdant::gate::MOLD_RISK)},
               {true, verdant::priors::OPTIMAL, gateFrom(verdant::gate::OPTIMAL)}},
    light(light_cycle::defaultLightCycleConfig()),
    trendEnabled(verdant::trend::ENABLED),
    trendWindowMs(static_cast<uint64_t>(verdant::trend::WINDOW_MIN) * 60ull * 1000ull),
    stage(GrowthStage::Seedling),
    stageStartMs(0),
    hasStageStart(false) {}

bool growspace_ctrl::validateConfig(const GrowspaceConfig& cfg, ConfigError& err) {
  if (cfg.id.empty()) return err.fail(ConfigErrorCode::MissingField, "growspace id missing");

  for (int i = 0; i < kConditionCount; ++i) {
    const ConditionConfig& cc = cfg.conditions[i];
    if (!cc.enabled) continue;
    const char* name = conditionName(static_cast<Condition>(i));
    if (!(cc.prior > 0.0 && cc.prior < 1.0)) {
      return err.fail(ConfigErrorCode::PriorOutOfRange,
                      std::string(name) + ": prior " + std::to_string(cc.prior) + " outside (0,1)");
    }
    if (!cc.gate.validate(err)) {
      err.message = std::string(name) + ": " + err.message;
      return false;
    }
  }
  if (!cfg.profiles.validate(err)) return false;
  if (!cfg.light.validate(err)) return false;
  if (cfg.trendEnabled && cfg.trendWindowMs == 0) {
    return err.fail(ConfigErrorCode::InvalidTolerance, "trend window must be > 0");
  }
  return true;
}

// --- GrowspaceCtrl ---

GrowspaceCtrl::GrowspaceCtrl()
  : started_(false), stage_(GrowthStage::Seedling), stageStartMs_(0),
    phase_(DayPhase::Day), measuredVpd_(false) {}

bool GrowspaceCtrl::begin(const GrowspaceConfig& cfg, ConfigError& err) {
  started_ = false;
  if (!validateConfig(cfg, err)) {
    log_ctrl::printf("CFG", "growspace '%s' rejected: %s (%s)", cfg.id.c_str(),
                     err.message.c_str(), verdant::configErrorName(err.code));
    health::set_config(health_, false, err.message);
    return false;
  }
  cfg_ = cfg;

  estimators_[0] = bayes_calc::makeStressEstimator(cfg_.condition(Condition::Stress).prior, cfg_.trendEnabled);
  estimators_[1] = bayes_calc::makeMoldEstimator(cfg_.condition(Condition::MoldRisk).prior, cfg_.trendEnabled);
  estimators_[2] = bayes_calc::makeOptimalEstimator(cfg_.condition(Condition::Optimal).prior);
  for (int i = 0; i < kConditionCount; ++i) {
    if (cfg_.conditions[i].enabled && !estimators_[i].validate(err)) {
      log_ctrl::printf("CFG", "growspace '%s' rejected: %s", cfg.id.c_str(), err.message.c_str());
      health::set_config(health_, false, err.message);
      return false;
    }
    gates_[i].configure(cfg_.conditions[i].gate);
    gates_[i].reset();

    VerdictUpdate& u = latest_[i];
    u = VerdictUpdate{};
    u.growspaceId = cfg_.id;
    u.condition = static_cast<Condition>(i);
    u.prior = cfg_.conditions[i].prior;
  }

  for (int v = 0; v < kVariableCount; ++v) {
    trends_[v].configure(cfg_.trendWindowMs, verdant::trend::EPS[v]);
  }

  stage_ = cfg_.stage;
  stageStartMs_ = cfg_.hasStageStart ? cfg_.stageStartMs : 0;
  phase_ = DayPhase::Day;
  measuredVpd_ = false;
  snap_ = bayes_calc::SensorSnapshot{};
  verifier_.begin(cfg_.light, stage_, cfg_.sensors.light);
  verifier_.setStageStart(stageStartMs_);

  health_ = health::GrowspaceHealth{};
  health::set_config(health_, true);
  started_ = true;

  log_ctrl::printf("CFG", "growspace '%s' ready: stage=%s light=%s vpd=%s", cfg_.id.c_str(),
                   vpd_calc::stageName(stage_), cfg_.sensors.light ? "bound" : "none",
                   cfg_.sensors.vpd ? "sensor" : (cfg_.deriveVpd ? "derived" : "off"));
  return true;
}

int GrowspaceCtrl::daysInStage(uint64_t nowMs) const {
  if (stageStartMs_ == 0 || nowMs <= stageStartMs_) return 0;
  return static_cast<int>((nowMs - stageStartMs_) / kDayMs);
}

bool GrowspaceCtrl::isLateFlower(uint64_t nowMs) const {
  const int late = cfg_.profiles.lateFlowerDays();
  return stage_ == GrowthStage::Flowering && late > 0 && daysInStage(nowMs) >= late;
}

const profile_ctrl::ThresholdProfile& GrowspaceCtrl::activeProfile(uint64_t nowMs) const {
  return cfg_.profiles.resolve(stage_, phase_, daysInStage(nowMs));
}

void GrowspaceCtrl::onSensor(Variable var, bool available, double value, uint64_t nowMs) {
  if (!started_) return;
  if (!cfg_.sensors.bound(var)) {
    log_ctrl::debugf("EVAL", "%s: %s not bound, ignored", cfg_.id.c_str(), profile_ctrl::variableName(var));
    return;
  }
  if (available && !std::isfinite(value)) available = false;

  const int vi = profile_ctrl::varIndex(var);
  if (available) {
    snap_.set(var, value, nowMs);
    trends_[vi].addSample(value, nowMs);
    health::set_sensor(health_, var, true);
  } else {
    snap_.clear(var);
    trends_[vi].clear();
    health::set_sensor(health_, var, false, std::string(profile_ctrl::variableName(var)) + " unavailable");
  }
  if (var == Variable::Vpd) measuredVpd_ = available;

  if (var == Variable::Temperature || var == Variable::Humidity || var == Variable::Vpd) {
    refreshDerivedVpd(nowMs);
  }
  evaluate(nowMs);
}

void GrowspaceCtrl::refreshDerivedVpd(uint64_t nowMs) {
  if (measuredVpd_ || !cfg_.deriveVpd) return;
  const bayes_calc::Reading& t = snap_.get(Variable::Temperature);
  const bayes_calc::Reading& h = snap_.get(Variable::Humidity);
  const int vi = profile_ctrl::varIndex(Variable::Vpd);
  if (t.available && h.available) {
    const double vpd = computeVpd(t.value, h.value);
    snap_.set(Variable::Vpd, vpd, nowMs, true);
    trends_[vi].addSample(vpd, nowMs);
  } else if (snap_.get(Variable::Vpd).available) {
    snap_.clear(Variable::Vpd);
    trends_[vi].clear();
  }
}

void GrowspaceCtrl::refreshTrends(uint64_t nowMs) {
  for (int v = 0; v < kVariableCount; ++v) {
    snap_.trends[v] = (cfg_.trendEnabled && snap_.readings[v].available)
                          ? trends_[v].trend(nowMs)
                          : trend_calc::Trend::Unknown;
  }
}

void GrowspaceCtrl::onStage(GrowthStage stage, uint64_t stageStartMs, uint64_t nowMs) {
  if (!started_) return;
  const bool changed = stage != stage_;
  stage_ = stage;
  stageStartMs_ = stageStartMs;
  verifier_.setStageStart(stageStartMs_);
  if (changed) {
    log_ctrl::printf("STAGE", "%s: stage -> %s (day %d)", cfg_.id.c_str(),
                     vpd_calc::stageName(stage_), daysInStage(nowMs));
    verifier_.onStageChange(stage_, nowMs);
    publishSchedule(nowMs);
  }
  // neues Profil gilt ab sofort
  evaluate(nowMs);
}

void GrowspaceCtrl::updatePhase(uint64_t) {
  if (!cfg_.sensors.light) { phase_ = DayPhase::Day; return; }
  switch (verifier_.state()) {
    case light_cycle::LightState::On:  phase_ = DayPhase::Day; break;
    case light_cycle::LightState::Off: phase_ = DayPhase::Night; break;
    default: break;  // unbekannt: letzte Phase halten
  }
}

void GrowspaceCtrl::onLight(bool available, bool on, uint64_t nowMs) {
  if (!started_) return;
  if (!cfg_.sensors.light) {
    log_ctrl::debugf("LIGHT", "%s: no light sensor bound, ignored", cfg_.id.c_str());
    return;
  }
  const light_cycle::LightState before = verifier_.state();
  const bool closed = available ? verifier_.onLight(on, nowMs) : verifier_.onUnavailable(nowMs);
  health::set_light(health_, available, "light state unavailable");
  if (verifier_.state() != before) {
    log_ctrl::printf("LIGHT", "%s: light %s", cfg_.id.c_str(),
                     light_cycle::lightStateName(verifier_.state()));
  }
  if (closed) publishSchedule(nowMs);

  const DayPhase old = phase_;
  updatePhase(nowMs);
  if (phase_ != old) evaluate(nowMs);
}

void GrowspaceCtrl::tick(uint64_t nowMs) {
  if (!started_) return;
  if (verifier_.tick(nowMs)) publishSchedule(nowMs);
  evaluate(nowMs);
}

void GrowspaceCtrl::evaluate(uint64_t nowMs) {
  refreshTrends(nowMs);
  const profile_ctrl::ThresholdProfile& profile = activeProfile(nowMs);
  for (int i = 0; i < kConditionCount; ++i) {
    if (!cfg_.conditions[i].enabled) continue;
    evaluateCondition(static_cast<Condition>(i), profile, nowMs);
  }
}

void GrowspaceCtrl::evaluateCondition(Condition c, const profile_ctrl::ThresholdProfile& profile,
                                      uint64_t nowMs) {
  const int i = static_cast<int>(c);
  const bayes_calc::Estimate e = estimators_[i].estimate(snap_, profile, phase_);
  gate_ctrl::HysteresisGate& g = gates_[i];
  const bool changed = g.update(e.sufficient, e.posterior, nowMs);

  VerdictUpdate& u = latest_[i];
  u.value = !g.known() ? Tristate::Unknown : (g.verdict() ? Tristate::True : Tristate::False);
  u.stale = g.stale();
  u.hasProbability = e.sufficient;
  u.probability = e.sufficient ? e.posterior : 0.0;
  u.prior = e.prior;
  u.contributing = e.contributing;
  u.observed = e.observed;
  u.contributions = e.contributions;
  u.changedAtMs = g.changedAtMs();
  u.evaluatedAtMs = nowMs;
  u.changed = changed;
  u.stage = stage_;
  u.phase = phase_;
  u.lateFlower = isLateFlower(nowMs);

  if (changed) {
    if (e.sufficient) {
      log_ctrl::printf("GATE", "%s/%s -> %s (p=%.3f, %u vars)", cfg_.id.c_str(), conditionName(c),
                       boolWord(g.verdict()), e.posterior, static_cast<unsigned>(e.observed.size()));
    } else {
      log_ctrl::printf("GATE", "%s/%s holds %s (stale, insufficient data)", cfg_.id.c_str(),
                       conditionName(c), g.known() ? boolWord(g.verdict()) : "unknown");
    }
  } else if (e.sufficient) {
    log_ctrl::debugf("EVAL", "%s/%s p=%.3f %s/%s", cfg_.id.c_str(), conditionName(c), e.posterior,
                     vpd_calc::stageName(stage_), profile_ctrl::phaseName(phase_));
  }

  if (verdictCb_) verdictCb_(u);
}

LightScheduleUpdate GrowspaceCtrl::schedule(uint64_t nowMs) const {
  LightScheduleUpdate u;
  const light_cycle::WindowResult& w = verifier_.lastWindow();
  u.growspaceId = cfg_.id;
  u.verdict = verifier_.verdict();
  u.windowValid = w.valid;
  u.windowEvaluated = w.evaluated;
  if (w.valid) {
    u.observedOnMs = w.onMs;
    u.windowStartMs = w.startMs;
    u.windowEndMs = w.endMs;
  } else {
    u.observedOnMs = verifier_.observedOnMs(nowMs);
    u.windowStartMs = verifier_.windowOpen() ? verifier_.windowStartMs() : 0;
    u.windowEndMs = verifier_.windowOpen() ? verifier_.windowEndMs() : 0;
  }
  u.expectedOnMs = w.valid ? w.expectedMs : verifier_.expectedOnMs(nowMs);
  u.stage = stage_;
  u.atMs = nowMs;
  return u;
}

void GrowspaceCtrl::publishSchedule(uint64_t nowMs) {
  const LightScheduleUpdate u = schedule(nowMs);
  if (u.windowValid) {
    log_ctrl::printf("SCHED", "%s: window closed, on=%.1f min expected=%.1f min%s -> %s",
                     cfg_.id.c_str(), u.observedOnMs / 60000.0, u.expectedOnMs / 60000.0,
                     u.windowEvaluated ? "" : " (incomplete)", light_cycle::verdictName(u.verdict));
  } else {
    log_ctrl::printf("SCHED", "%s: schedule reset, expected=%.1f min -> %s", cfg_.id.c_str(),
                     u.expectedOnMs / 60000.0, light_cycle::verdictName(u.verdict));
  }
  if (scheduleCb_) scheduleCb_(u);
}
