/*
 * light_cycle.h | Prüfung des Lichtplans (Licht-an-Dauer je 24 h)
 *
 * Zustandsautomat AN/AUS, getrieben von Lichtwechseln. Ein Fenster beginnt
 * mit dem ersten bekannten Lichtzustand (bzw. beim Stadienwechsel) und
 * schließt nach 24 h oder an einer festen Tageszeit (rolloverMinute).
 * Beim Schließen wird die AN-Dauer im Fenster mit dem Sollwert des
 * Stadiums verglichen:
 *   |ist - soll| <= Toleranz -> Correct, sonst Incorrect.
 * Das Urteil bleibt bis zum nächsten abgeschlossenen Fenster bestehen.
 * Angebrochene Fenster oder Fenster mit Sensorlücken ändern es nicht.
 *
 * Stadienwechsel verwirft Fenster und Phasenlog (neuer Sollwert),
 * Urteil -> Unknown. Ohne Lichtsensor ist das Urteil immer Unknown.
 *
 * In der Blüte hängt der Sollwert von den Tagen im Stadium ab
 * (flower_early / flower_mid / flower_late), maßgeblich ist der
 * Fensterbeginn. Ohne bekannten Stadienbeginn gilt onHours[Flowering].
 *
 * Schnelles Flackern wird nicht gefiltert: jeder Wechsel ist eine Phase.
 */

#pragma once

#include <cstdint>
#include <deque>

#include "vpd_calc.h"
#include "../../include/config_error.h"

namespace light_cycle {

using vpd_calc::GrowthStage;

enum class ScheduleVerdict : uint8_t { Unknown = 0, Correct, Incorrect };
enum class LightState : uint8_t { Unknown = 0, On, Off };
enum class FlowerPhase : uint8_t { Early = 0, Mid, Late };
constexpr int kFlowerPhaseCount = 3;

const char* verdictName(ScheduleVerdict v);   // "unknown" / "correct" / "incorrect"
const char* lightStateName(LightState s);
const char* flowerPhaseName(FlowerPhase p);    // "flower_early" / "flower_mid" / "flower_late"
bool parseFlowerPhase(const char* name, FlowerPhase& out);

struct LightCycleConfig {
  uint64_t toleranceMs;
  int rolloverMinute;                        // -1 = rollierend ab Fensterbeginn
  int tzOffsetMin;                           // Ortszeit = UTC + Offset
  float onHours[vpd_calc::kStageCount];
  float flowerOnHours[kFlowerPhaseCount];
  int flowerMidDays;                         // ab diesem Tag flower_mid
  int flowerLateDays;                        // ab diesem Tag flower_late

  bool validate(verdant::ConfigError& err) const;
  FlowerPhase flowerPhase(int daysInStage) const;
  // daysInStage < 0: Stadienbeginn unbekannt
  uint64_t expectedOnMs(GrowthStage st, int daysInStage = -1) const;
};

LightCycleConfig defaultLightCycleConfig();

// Abgeschlossene Phase (für das rollierende 24-h-Log)
struct Phase {
  bool on;
  uint64_t startMs;
  uint64_t endMs;
};

struct WindowResult {
  bool valid = false;          // es wurde mind. ein Fenster geschlossen
  bool evaluated = false;      // vollständig beobachtet und bewertet
  uint64_t startMs = 0;
  uint64_t endMs = 0;
  uint64_t onMs = 0;
  uint64_t expectedMs = 0;
  GrowthStage stage = GrowthStage::Seedling;
  ScheduleVerdict verdict = ScheduleVerdict::Unknown;
};

class LightCycleVerifier {
public:
  LightCycleVerifier();

  void begin(const LightCycleConfig& cfg, GrowthStage stage, bool sensorBound);
  // 0 = unbekannt; ändert kein laufendes Fenster
  void setStageStart(uint64_t stageStartMs) { stageStart_ = stageStartMs; }

  // Rückgabe: true, wenn ein Fenster geschlossen wurde
  bool onLight(bool on, uint64_t nowMs);
  bool onUnavailable(uint64_t nowMs);
  bool tick(uint64_t nowMs);
  void onStageChange(GrowthStage stage, uint64_t nowMs);

  ScheduleVerdict verdict() const { return verdict_; }
  const WindowResult& lastWindow() const { return last_; }
  const std::deque<Phase>& phaseLog() const { return log_; }

  LightState state() const { return state_; }
  uint64_t stateSinceMs() const { return stateSince_; }
  GrowthStage stage() const { return stage_; }
  bool sensorBound() const { return bound_; }
  bool windowOpen() const { return windowOpen_; }
  uint64_t windowStartMs() const { return windowStart_; }
  uint64_t windowEndMs() const { return windowEnd_; }
  // Sollwert des offenen Fensters, sonst ab nowMs
  uint64_t expectedOnMs(uint64_t nowMs) const;
  int daysInStageAt(uint64_t ms) const;     // -1 ohne Stadienbeginn
  // AN-Dauer im offenen Fenster bis nowMs
  uint64_t observedOnMs(uint64_t nowMs) const;

private:
  bool advance(uint64_t nowMs);
  void accumulate(uint64_t untilMs);
  void openWindow(uint64_t startMs);
  void closeWindow();
  void recordPhase(bool on, uint64_t startMs, uint64_t endMs);
  uint64_t windowEndFor(uint64_t startMs) const;

  LightCycleConfig cfg_;
  GrowthStage stage_;
  uint64_t stageStart_;
  bool bound_;

  LightState state_;
  uint64_t stateSince_;

  bool windowOpen_;
  uint64_t windowStart_;
  uint64_t windowEnd_;
  uint64_t accountedTo_;
  uint64_t onMs_;
  bool gap_;                   // Sensor zeitweise unbekannt

  ScheduleVerdict verdict_;
  WindowResult last_;
  std::deque<Phase> log_;
};

} // namespace light_cycle
