/*
 * profile_ctrl.h | Schwellenprofile je Stadium & Tag/Nacht
 *
 * Liefert für (GrowthStage, DayPhase) die Idealbereiche und Toleranzen aller
 * überwachten Größen. Reine Tabellen-Abfrage; einzige Logik ist der
 * Rückfall Nacht -> Tag für Stadien ohne eigenes Nachtprofil sowie die
 * Spätblüte-Variante ab einer konfigurierbaren Anzahl Blütetage.
 *
 * Vollständigkeit wird einmalig beim Start geprüft (validate), nicht bei
 * jeder Abfrage.
 */

#pragma once

#include <cstdint>
#include "vpd_calc.h"
#include "../../include/config_error.h"

namespace profile_ctrl {

using vpd_calc::GrowthStage;
using vpd_calc::kStageCount;

// Tag/Nacht – abgeleitet aus dem Lichtzustand
enum class DayPhase : uint8_t { Day = 0, Night = 1 };
constexpr int kPhaseCount = 2;

// Überwachte Größen; Reihenfolge = Index in ThresholdProfile::bands
enum class Variable : uint8_t { Temperature = 0, Humidity = 1, Vpd = 2, Co2 = 3, Fan = 4 };
constexpr int kVariableCount = 5;

inline int varIndex(Variable v) { return static_cast<int>(v); }

const char* variableName(Variable v);           // "temperature", "humidity", "vpd", "co2", "fan_state"
bool parseVariable(const char* name, Variable& out);
const char* phaseName(DayPhase p);              // "day" / "night"

// Idealbereich einer Größe. idealMin == idealMax beschreibt einen Idealpunkt.
struct Band {
  bool  defined;
  float idealMin;
  float idealMax;
  float tolerance;   // Abstand (Einheit der Größe), der d = 1.0 entspricht

  // Abstand zum Idealbereich in Toleranz-Einheiten; 0 innerhalb des Bereichs
  double normalizedDistance(double v) const;
  // Nur Überschreitung (oberhalb idealMax) bzw. Unterschreitung (unterhalb idealMin)
  double distanceAbove(double v) const;
  double distanceBelow(double v) const;
};

struct ThresholdProfile {
  Band bands[kVariableCount];

  const Band& band(Variable v) const { return bands[varIndex(v)]; }
  Band& band(Variable v) { return bands[varIndex(v)]; }
  bool any() const;
};

class ProfileResolver {
public:
  ProfileResolver();   // Standardtabellen aus verdant_config.h

  void setProfile(GrowthStage st, DayPhase ph, const ThresholdProfile& p);
  void clearProfile(GrowthStage st, DayPhase ph);
  bool hasExplicit(GrowthStage st, DayPhase ph) const;

  // Spätblüte (Flowering ab lateFlowerDays Tagen)
  void setLateFlowerProfile(DayPhase ph, const ThresholdProfile& p);
  void clearLateFlowerProfile(DayPhase ph);
  void setLateFlowerDays(int days) { lateFlowerDays_ = days; }
  int  lateFlowerDays() const { return lateFlowerDays_; }

  // Total: liefert immer ein Profil (Nacht fällt auf Tag zurück)
  const ThresholdProfile& resolve(GrowthStage st, DayPhase ph) const;
  const ThresholdProfile& resolve(GrowthStage st, DayPhase ph, int daysInStage) const;

  // Prüft alle Stadien; false + err bei fehlendem Tagesprofil oder ungültigem Band
  bool validate(verdant::ConfigError& err) const;

private:
  static int idxPhase(DayPhase p) { return p == DayPhase::Night ? 1 : 0; }

  ThresholdProfile profiles_[kStageCount][kPhaseCount];
  bool present_[kStageCount][kPhaseCount];

  ThresholdProfile late_[kPhaseCount];
  bool latePresent_[kPhaseCount];
  int  lateFlowerDays_;
};

} // namespace profile_ctrl
