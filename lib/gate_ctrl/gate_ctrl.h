/*
 * gate_ctrl.h | Hysterese-Gatter: Posterior -> stabiles Ja/Nein
 *
 * Zwei Schwellen (turnOn > turnOff) bilden ein Totband. Rohklassifikation:
 *   p >= turnOn  -> wahr
 *   p <= turnOff -> falsch
 *   dazwischen   -> bisheriges Urteil
 * Ein Wechsel wird erst übernommen, wenn die neue Rohklassifikation
 * mindestens minDwellMs ununterbrochen anliegt.
 *
 * "Insufficient" ändert nie das Urteil, es wird nur als stale markiert.
 * Startzustand: falsch/stale, nach außen "unbekannt" bis zur ersten Evidenz.
 *
 * step() ist eine reine Funktion (Zustand rein, neuer Zustand raus);
 * HysteresisGate hält den Zustand nur bequem fest.
 */

#pragma once

#include <cstdint>
#include "../../include/config_error.h"

namespace gate_ctrl {

struct GateConfig {
  float turnOn;
  float turnOff;
  uint64_t minDwellMs;

  bool validate(verdant::ConfigError& err) const;
};

struct GateState {
  bool verdict = false;
  bool stale = true;
  bool everFresh = false;      // mind. einmal mit ausreichender Evidenz
  uint64_t changedAtMs = 0;    // letzter Wechsel von verdict
  bool hasRaw = false;
  bool raw = false;            // aktuelle Rohklassifikation
  uint64_t rawSinceMs = 0;     // seit wann raw ununterbrochen anliegt
};

struct GateStep {
  GateState state;
  bool changed;   // verdict, stale oder everFresh hat sich geändert
};

GateStep step(const GateConfig& cfg, const GateState& st, bool sufficient,
              double posterior, uint64_t nowMs);

class HysteresisGate {
public:
  HysteresisGate();
  explicit HysteresisGate(const GateConfig& cfg) : cfg_(cfg) {}

  void configure(const GateConfig& cfg) { cfg_ = cfg; }
  const GateConfig& config() const { return cfg_; }

  // true, wenn sich das veröffentlichte Urteil (inkl. stale) geändert hat
  bool update(bool sufficient, double posterior, uint64_t nowMs);
  void reset() { st_ = GateState{}; }

  bool verdict() const { return st_.verdict; }
  bool stale() const { return st_.stale; }
  bool known() const { return st_.everFresh; }
  uint64_t changedAtMs() const { return st_.changedAtMs; }
  uint64_t rawDurationMs(uint64_t nowMs) const;
  const GateState& state() const { return st_; }

private:
  GateConfig cfg_;
  GateState st_;
};

} // namespace gate_ctrl
