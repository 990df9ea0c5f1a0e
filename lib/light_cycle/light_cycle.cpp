// ==============================
// Datei: lib/light_cycle/light_cycle.cpp
// ==============================

#include "light_cycle.h"
#include "../../include/verdant_config.h"

#include <cmath>
#include <cstring>
#include <string>

using namespace light_cycle;
using verdant::ConfigError;
using verdant::ConfigErrorCode;

namespace {
constexpr uint64_t kMinuteMs = 60ull * 1000ull;
constexpr uint64_t kDayMs = 24ull * 60ull * kMinuteMs;
} // namespace

const char* light_cycle::verdictName(ScheduleVerdict v) {
  switch (v) {
    case ScheduleVerdict::Correct:   return "correct";
    case ScheduleVerdict::Incorrect: return "incorrect";
    case ScheduleVerdict::Unknown:   break;
  }
  return "unknown";
}

const char* light_cycle::lightStateName(LightState s) {
  switch (s) {
    case LightState::On:  return "on";
    case LightState::Off: return "off";
    case LightState::Unknown: break;
  }
  return "unknown";
}

const char* light_cycle::flowerPhaseName(FlowerPhase p) {
  switch (p) {
    case FlowerPhase::Early: return "flower_early";
    case FlowerPhase::Mid:   return "flower_mid";
    case FlowerPhase::Late:  return "flower_late";
  }
  return "flower_early";
}

bool light_cycle::parseFlowerPhase(const char* name, FlowerPhase& out) {
  if (!name) return false;
  for (int i = 0; i < kFlowerPhaseCount; ++i) {
    const FlowerPhase p = static_cast<FlowerPhase>(i);
    if (std::strcmp(name, flowerPhaseName(p)) == 0) {
      out = p;
      return true;
    }
  }
  return false;
}

// --- Konfiguration ---

LightCycleConfig light_cycle::defaultLightCycleConfig() {
  LightCycleConfig c{};
  c.toleranceMs = verdant::light::TOLERANCE_MIN * kMinuteMs;
  c.rolloverMinute = verdant::light::ROLLOVER_MINUTE;
  c.tzOffsetMin = verdant::light::TZ_OFFSET_MIN;
  for (int i = 0; i < vpd_calc::kStageCount; ++i) c.onHours[i] = verdant::light::ON_HOURS[i];
  for (int i = 0; i < kFlowerPhaseCount; ++i) c.flowerOnHours[i] = verdant::light::FLOWER_ON_HOURS[i];
  c.flowerMidDays = verdant::light::FLOWER_MID_DAYS;
  c.flowerLateDays = verdant::light::FLOWER_LATE_DAYS;
  return c;
}

bool LightCycleConfig::validate(ConfigError& err) const {
  for (int i = 0; i < vpd_calc::kStageCount; ++i) {
    if (!std::isfinite(onHours[i]) || onHours[i] < 0.0f || onHours[i] > 24.0f) {
      return err.fail(ConfigErrorCode::InvalidSchedule,
                      std::string("light hours for stage '") +
                      vpd_calc::stageName(static_cast<GrowthStage>(i)) + "' outside 0..24");
    }
  }
  for (int i = 0; i < kFlowerPhaseCount; ++i) {
    if (!std::isfinite(flowerOnHours[i]) || flowerOnHours[i] < 0.0f || flowerOnHours[i] > 24.0f) {
      return err.fail(ConfigErrorCode::InvalidSchedule,
                      std::string("light hours for '") +
                      flowerPhaseName(static_cast<FlowerPhase>(i)) + "' outside 0..24");
    }
  }
  if (flowerMidDays <= 0 || flowerLateDays <= flowerMidDays) {
    return err.fail(ConfigErrorCode::InvalidSchedule, "flower sub-stage days must satisfy 0 < mid < late");
  }
  if (toleranceMs >= kDayMs / 2) {
    return err.fail(ConfigErrorCode::InvalidTolerance, "light tolerance must be below 12 h");
  }
  if (rolloverMinute < -1 || rolloverMinute >= 24 * 60) {
    return err.fail(ConfigErrorCode::InvalidSchedule, "rollover_minute must be -1 or 0..1439");
  }
  if (tzOffsetMin < -24 * 60 || tzOffsetMin > 24 * 60) {
    return err.fail(ConfigErrorCode::InvalidSchedule, "tz_offset_min outside +-1440");
  }
  return true;
}

FlowerPhase LightCycleConfig::flowerPhase(int daysInStage) const {
  if (daysInStage >= flowerLateDays) return FlowerPhase::Late;
  if (daysInStage >= flowerMidDays) return FlowerPhase::Mid;
  return FlowerPhase::Early;
}

uint64_t LightCycleConfig::expectedOnMs(GrowthStage st, int daysInStage) const {
  double h = onHours[vpd_calc::stageIndex(st)];
  if (st == GrowthStage::Flowering && daysInStage >= 0) {
    h = flowerOnHours[static_cast<int>(flowerPhase(daysInStage))];
  }
  return static_cast<uint64_t>(std::llround(h * 60.0)) * kMinuteMs;
}

// --- Verifier ---

LightCycleVerifier::LightCycleVerifier()
  : cfg_(defaultLightCycleConfig()), stage_(GrowthStage::Seedling), stageStart_(0), bound_(false),
    state_(LightState::Unknown), stateSince_(0),
    windowOpen_(false), windowStart_(0), windowEnd_(0), accountedTo_(0), onMs_(0), gap_(false),
    verdict_(ScheduleVerdict::Unknown) {}

void LightCycleVerifier::begin(const LightCycleConfig& cfg, GrowthStage stage, bool sensorBound) {
  cfg_ = cfg;
  stage_ = stage;
  bound_ = sensorBound;
  state_ = LightState::Unknown;
  stateSince_ = 0;
  windowOpen_ = false;
  onMs_ = 0;
  gap_ = false;
  verdict_ = ScheduleVerdict::Unknown;
  last_ = WindowResult{};
  log_.clear();
}

uint64_t LightCycleVerifier::windowEndFor(uint64_t startMs) const {
  if (cfg_.rolloverMinute < 0) return startMs + kDayMs;
  // nächste Tagesgrenze (Ortszeit) strikt nach startMs
  const int64_t tz = static_cast<int64_t>(cfg_.tzOffsetMin) * static_cast<int64_t>(kMinuteMs);
  const int64_t day = static_cast<int64_t>(kDayMs);
  const int64_t local = static_cast<int64_t>(startMs) + tz;
  int64_t midnight = local - (((local % day) + day) % day);
  int64_t boundary = midnight + static_cast<int64_t>(cfg_.rolloverMinute) * static_cast<int64_t>(kMinuteMs);
  while (boundary <= local) boundary += day;
  return static_cast<uint64_t>(boundary - tz);
}

void LightCycleVerifier::openWindow(uint64_t startMs) {
  windowOpen_ = true;
  windowStart_ = startMs;
  windowEnd_ = windowEndFor(startMs);
  accountedTo_ = startMs;
  onMs_ = 0;
  gap_ = false;
}

void LightCycleVerifier::accumulate(uint64_t untilMs) {
  if (!windowOpen_) return;
  if (untilMs > windowEnd_) untilMs = windowEnd_;
  if (untilMs <= accountedTo_) return;
  if (state_ == LightState::On) onMs_ += untilMs - accountedTo_;
  accountedTo_ = untilMs;
}

void LightCycleVerifier::closeWindow() {
  WindowResult r;
  r.valid = true;
  r.startMs = windowStart_;
  r.endMs = windowEnd_;
  r.onMs = onMs_;
  r.expectedMs = cfg_.expectedOnMs(stage_, daysInStageAt(windowStart_));
  r.stage = stage_;
  // angebrochenes Fenster (Rollover) oder Lücke: keine Bewertung
  r.evaluated = !gap_ && (windowEnd_ - windowStart_) >= kDayMs;
  if (r.evaluated) {
    const uint64_t diff = r.onMs > r.expectedMs ? r.onMs - r.expectedMs : r.expectedMs - r.onMs;
    verdict_ = diff <= cfg_.toleranceMs ? ScheduleVerdict::Correct : ScheduleVerdict::Incorrect;
  }
  r.verdict = verdict_;
  last_ = r;
  windowOpen_ = false;
}

bool LightCycleVerifier::advance(uint64_t nowMs) {
  bool closed = false;
  while (windowOpen_ && nowMs >= windowEnd_) {
    const uint64_t end = windowEnd_;
    accumulate(end);
    closeWindow();
    closed = true;
    if (state_ != LightState::Unknown) openWindow(end);
  }
  return closed;
}

void LightCycleVerifier::recordPhase(bool on, uint64_t startMs, uint64_t endMs) {
  log_.push_back(Phase{on, startMs, endMs});
  while (!log_.empty() && log_.front().endMs + kDayMs <= endMs) log_.pop_front();
}

bool LightCycleVerifier::onLight(bool on, uint64_t nowMs) {
  if (!bound_) return false;
  const bool closed = advance(nowMs);
  const LightState next = on ? LightState::On : LightState::Off;
  if (state_ == next) return closed;   // doppelte Meldung

  accumulate(nowMs);
  if (state_ != LightState::Unknown) recordPhase(state_ == LightState::On, stateSince_, nowMs);
  state_ = next;
  stateSince_ = nowMs;
  if (!windowOpen_) openWindow(nowMs);
  return closed;
}

bool LightCycleVerifier::onUnavailable(uint64_t nowMs) {
  if (!bound_) return false;
  const bool closed = advance(nowMs);
  if (state_ == LightState::Unknown) return closed;

  accumulate(nowMs);
  recordPhase(state_ == LightState::On, stateSince_, nowMs);
  state_ = LightState::Unknown;
  stateSince_ = nowMs;
  if (windowOpen_) gap_ = true;
  return closed;
}

bool LightCycleVerifier::tick(uint64_t nowMs) {
  if (!bound_) return false;
  return advance(nowMs);
}

void LightCycleVerifier::onStageChange(GrowthStage stage, uint64_t nowMs) {
  stage_ = stage;
  log_.clear();
  verdict_ = ScheduleVerdict::Unknown;
  last_ = WindowResult{};
  windowOpen_ = false;
  onMs_ = 0;
  gap_ = false;
  if (!bound_ || state_ == LightState::Unknown) return;
  // laufende Phase zählt ab Stadienwechsel
  stateSince_ = nowMs;
  openWindow(nowMs);
}

int LightCycleVerifier::daysInStageAt(uint64_t ms) const {
  if (stageStart_ == 0) return -1;
  if (ms <= stageStart_) return 0;
  return static_cast<int>((ms - stageStart_) / kDayMs);
}

uint64_t LightCycleVerifier::expectedOnMs(uint64_t nowMs) const {
  return cfg_.expectedOnMs(stage_, daysInStageAt(windowOpen_ ? windowStart_ : nowMs));
}

uint64_t LightCycleVerifier::observedOnMs(uint64_t nowMs) const {
  if (!windowOpen_) return 0;
  uint64_t v = onMs_;
  const uint64_t until = nowMs < windowEnd_ ? nowMs : windowEnd_;
  if (state_ == LightState::On && until > accountedTo_) v += until - accountedTo_;
  return v;
}
