// ==============================
// File: lib/growspace_ctrl/growspace_ctrl.h
// ==============================
/*
 * growspace_ctrl.h | Auswertung je Growspace
 *
 * Besitzt je Growspace genau ein Profil-Set, drei Schätzer mit je einem
 * Hysterese-Gatter (Stress, Schimmelrisiko, Optimal) und einen
 * Lichtplan-Prüfer. Bekommt Messwerte, Stadien- und Lichtwechsel
 * gemeldet (push) und veröffentlicht Urteile über Callbacks.
 *
 * Ablauf je Messwert:
 *   Messwert -> Profil (Stadium, Tag/Nacht) -> Schätzer -> Gatter -> Callback
 * Der Lichtplan läuft unabhängig davon nur über Lichtwechsel.
 *
 * Nicht thread-sicher; Serialisierung übernimmt engine_ctrl.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "vpd_calc.h"
#include "profile_ctrl.h"
#include "bayes_calc.h"
#include "gate_ctrl.h"
#include "light_cycle.h"
#include "trend_calc.h"
#include "../../include/config_error.h"
#include "../../include/health.h"

namespace growspace_ctrl {

using vpd_calc::GrowthStage;
using profile_ctrl::DayPhase;
using profile_ctrl::Variable;
using profile_ctrl::kVariableCount;

enum class Condition : uint8_t { Stress = 0, MoldRisk = 1, Optimal = 2 };
constexpr int kConditionCount = 3;

const char* conditionName(Condition c);   // "stress", "mold_risk", "optimal"
bool parseCondition(const char* name, Condition& out);

// Veröffentlichtes Urteil: unbekannt solange nie ausreichend Evidenz vorlag
enum class Tristate : uint8_t { Unknown = 0, False, True };
const char* tristateName(Tristate t);

// Welche Sensoren sind dem Growspace zugeordnet
struct SensorBindings {
  bool temperature = true;
  bool humidity = true;
  bool vpd = false;
  bool co2 = false;
  bool light = false;
  bool fan = false;

  bool bound(Variable v) const;
  bool any() const { return temperature || humidity || vpd || co2 || fan; }
};

struct ConditionConfig {
  bool enabled;
  double prior;
  gate_ctrl::GateConfig gate;
};

struct GrowspaceConfig {
  std::string id;
  std::string name;
  SensorBindings sensors;
  bool deriveVpd;
  ConditionConfig conditions[kConditionCount];
  light_cycle::LightCycleConfig light;
  bool trendEnabled;
  uint64_t trendWindowMs;
  profile_ctrl::ProfileResolver profiles;   // inkl. Spätblüte-Tage

  // Startstadium (bis das erste Stadien-Event kommt)
  GrowthStage stage;
  uint64_t stageStartMs;
  bool hasStageStart;

  GrowspaceConfig();
  ConditionConfig& condition(Condition c) { return conditions[static_cast<int>(c)]; }
  const ConditionConfig& condition(Condition c) const { return conditions[static_cast<int>(c)]; }
};

// Prüft alles einmalig beim Start; false + err beim ersten Fehler
bool validateConfig(const GrowspaceConfig& cfg, verdant::ConfigError& err);

struct VerdictUpdate {
  std::string growspaceId;
  Condition condition = Condition::Stress;
  Tristate value = Tristate::Unknown;
  bool stale = true;
  bool hasProbability = false;
  double probability = 0.0;
  double prior = 0.0;
  std::vector<Variable> contributing;
  std::vector<Variable> observed;
  std::vector<bayes_calc::Contribution> contributions;
  uint64_t changedAtMs = 0;
  uint64_t evaluatedAtMs = 0;
  bool changed = false;        // Urteil oder stale geändert
  GrowthStage stage = GrowthStage::Seedling;
  DayPhase phase = DayPhase::Day;
  bool lateFlower = false;
};

struct LightScheduleUpdate {
  std::string growspaceId;
  light_cycle::ScheduleVerdict verdict = light_cycle::ScheduleVerdict::Unknown;
  uint64_t observedOnMs = 0;   // letztes geschlossenes Fenster
  uint64_t expectedOnMs = 0;
  bool windowValid = false;
  bool windowEvaluated = false;
  uint64_t windowStartMs = 0;
  uint64_t windowEndMs = 0;
  GrowthStage stage = GrowthStage::Seedling;
  uint64_t atMs = 0;
};

typedef std::function<void(const VerdictUpdate&)> VerdictCallback;
typedef std::function<void(const LightScheduleUpdate&)> ScheduleCallback;

class GrowspaceCtrl {
public:
  GrowspaceCtrl();

  // Konfiguration prüfen und übernehmen; bei Fehler bleibt der Growspace inaktiv
  bool begin(const GrowspaceConfig& cfg, verdant::ConfigError& err);
  bool started() const { return started_; }

  void onVerdict(VerdictCallback cb) { verdictCb_ = std::move(cb); }
  void onSchedule(ScheduleCallback cb) { scheduleCb_ = std::move(cb); }

  // Messwert; available=false oder NaN = nicht verfügbar
  void onSensor(Variable var, bool available, double value, uint64_t nowMs);
  void onStage(GrowthStage stage, uint64_t stageStartMs, uint64_t nowMs);
  void onLight(bool available, bool on, uint64_t nowMs);
  // Zeitfortschritt ohne Messwert (Lichtfenster, Dwell)
  void tick(uint64_t nowMs);

  // Zustand
  const std::string& id() const { return cfg_.id; }
  const GrowspaceConfig& config() const { return cfg_; }
  GrowthStage stage() const { return stage_; }
  uint64_t stageStartMs() const { return stageStartMs_; }
  int daysInStage(uint64_t nowMs) const;
  bool isLateFlower(uint64_t nowMs) const;
  DayPhase phase() const { return phase_; }
  light_cycle::LightState lightState() const { return verifier_.state(); }
  const profile_ctrl::ThresholdProfile& activeProfile(uint64_t nowMs) const;

  const VerdictUpdate& latest(Condition c) const { return latest_[static_cast<int>(c)]; }
  LightScheduleUpdate schedule(uint64_t nowMs) const;
  const light_cycle::LightCycleVerifier& verifier() const { return verifier_; }
  const bayes_calc::SensorSnapshot& snapshot() const { return snap_; }
  const health::GrowspaceHealth& healthState() const { return health_; }

private:
  void evaluate(uint64_t nowMs);
  void evaluateCondition(Condition c, const profile_ctrl::ThresholdProfile& profile,
                         uint64_t nowMs);
  void refreshDerivedVpd(uint64_t nowMs);
  void refreshTrends(uint64_t nowMs);
  void publishSchedule(uint64_t nowMs);
  void updatePhase(uint64_t nowMs);

  GrowspaceConfig cfg_;
  bool started_;

  GrowthStage stage_;
  uint64_t stageStartMs_;
  DayPhase phase_;
  bool measuredVpd_;           // VPD-Sensor hat einen aktuellen Wert

  bayes_calc::BayesEstimator estimators_[kConditionCount];
  gate_ctrl::HysteresisGate gates_[kConditionCount];
  light_cycle::LightCycleVerifier verifier_;
  trend_calc::TrendWindow trends_[kVariableCount];

  bayes_calc::SensorSnapshot snap_;
  VerdictUpdate latest_[kConditionCount];
  health::GrowspaceHealth health_;

  VerdictCallback verdictCb_;
  ScheduleCallback scheduleCb_;
};

} // namespace growspace_ctrl
