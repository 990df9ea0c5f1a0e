#include "gate_ctrl.h"
#include "../../include/verdant_config.h"

#include <cmath>
#include <string>

using namespace gate_ctrl;
using verdant::ConfigError;
using verdant::ConfigErrorCode;

bool GateConfig::validate(ConfigError& err) const {
  if (!std::isfinite(turnOn) || !std::isfinite(turnOff) ||
      turnOn < 0.0f || turnOn > 1.0f || turnOff < 0.0f || turnOff > 1.0f) {
    return err.fail(ConfigErrorCode::ThresholdRange, "gate thresholds must lie in [0,1]");
  }
  if (turnOn <= turnOff) {
    return err.fail(ConfigErrorCode::ThresholdOrder,
                    "turn_on " + std::to_string(turnOn) + " must be above turn_off " +
                    std::to_string(turnOff));
  }
  return true;
}

GateStep gate_ctrl::step(const GateConfig& cfg, const GateState& st, bool sufficient,
                         double posterior, uint64_t nowMs) {
  GateStep out{st, false};
  GateState& n = out.state;

  if (!sufficient) {
    // Urteil halten, Rohverfolgung neu beginnen
    n.hasRaw = false;
    if (!n.stale) { n.stale = true; out.changed = true; }
    return out;
  }

  bool raw = n.verdict;
  if (posterior >= cfg.turnOn) raw = true;
  else if (posterior <= cfg.turnOff) raw = false;

  if (!n.hasRaw || n.raw != raw) {
    n.hasRaw = true;
    n.raw = raw;
    n.rawSinceMs = nowMs;
  }

  if (n.stale) { n.stale = false; out.changed = true; }
  if (!n.everFresh) { n.everFresh = true; n.changedAtMs = nowMs; out.changed = true; }

  if (raw != n.verdict && nowMs >= n.rawSinceMs && nowMs - n.rawSinceMs >= cfg.minDwellMs) {
    n.verdict = raw;
    n.changedAtMs = nowMs;
    out.changed = true;
  }
  return out;
}

HysteresisGate::HysteresisGate()
  : cfg_{verdant::gate::STRESS.turnOn, verdant::gate::STRESS.turnOff,
         verdant::gate::STRESS.minDwellS * 1000ull} {}

bool HysteresisGate::update(bool sufficient, double posterior, uint64_t nowMs) {
  GateStep s = step(cfg_, st_, sufficient, posterior, nowMs);
  st_ = s.state;
  return s.changed;
}

uint64_t HysteresisGate::rawDurationMs(uint64_t nowMs) const {
  if (!st_.hasRaw || nowMs < st_.rawSinceMs) return 0;
  return nowMs - st_.rawSinceMs;
}
