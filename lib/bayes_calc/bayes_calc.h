/*
 * bayes_calc.h | Naiver Bayes-Schätzer für Growspace-Zustände
 *
 * Jede Evidenzquelle liefert für ihre Messgröße ein Likelihood-Verhältnis
 *   L = P(Messwert | Zustand wahr) / P(Messwert | Zustand falsch).
 * Der Schätzer multipliziert die Verhältnisse aller Quellen mit Messwert
 * auf die Prior-Odds (im Log-Raum):
 *   posterior_odds = prior_odds * Π L
 * Fehlende Messwerte sind keine Evidenz (nicht neutral 0.5, nicht 0).
 * Ohne Evidenz einer Klimagröße (Temperatur, Feuchte, VPD) ist das
 * Ergebnis "insufficient" statt einer Zahl. CO2, Lüfter und Trends
 * verschieben nur einen Posterior, der schon aus Klimadaten entsteht.
 *
 * Neue Messgrößen brauchen nur eine neue EvidenceSource, die
 * Kombinationslogik (combine) bleibt unverändert.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "profile_ctrl.h"
#include "trend_calc.h"
#include "../../include/config_error.h"

namespace bayes_calc {

using profile_ctrl::Band;
using profile_ctrl::DayPhase;
using profile_ctrl::ThresholdProfile;
using profile_ctrl::Variable;
using profile_ctrl::kVariableCount;

inline bool isClimateVariable(Variable v) {
  return v == Variable::Temperature || v == Variable::Humidity || v == Variable::Vpd;
}

// --- Messwerte ---

struct Reading {
  bool     available = false;
  double   value = 0.0;
  uint64_t ts = 0;
  bool     derived = false;   // z. B. VPD aus Temperatur/Feuchte berechnet
};

struct SensorSnapshot {
  Reading readings[kVariableCount];
  trend_calc::Trend trends[kVariableCount] = {};

  const Reading& get(Variable v) const { return readings[profile_ctrl::varIndex(v)]; }
  trend_calc::Trend trend(Variable v) const { return trends[profile_ctrl::varIndex(v)]; }

  void set(Variable v, double value, uint64_t ts, bool derived = false);
  void clear(Variable v);
};

// --- Abstand -> Likelihood-Verhältnis ---

enum class CurveShape : uint8_t { Linear = 0, Gaussian = 1 };

/**
 * Monotone, begrenzte Abbildung des normierten Abstands d >= 0 auf ein
 * Likelihood-Verhältnis. f(d) wächst von 0 (ideal) auf 1 (weit weg):
 *   Linear:   f = min(d / span, 1)
 *   Gaussian: f = 1 - exp(-0.5 * (d / span)^2)
 * L = idealRatio^(1-f) * farRatio^f, begrenzt auf [minRatio, maxRatio].
 * Für ungünstige Zustände ist idealRatio = 1 (ideal = keine Evidenz) und
 * farRatio > 1, für den Optimal-Zustand umgekehrt.
 */
struct LikelihoodCurve {
  CurveShape shape;
  float idealRatio;
  float farRatio;
  float span;
  float minRatio;
  float maxRatio;

  double ratioAt(double d) const;
  double clamp(double ratio) const;
  bool valid() const;
};

// --- Evidenzquellen ---

class EvidenceSource {
public:
  virtual ~EvidenceSource() = default;

  virtual const char* name() const = 0;
  virtual Variable variable() const = 0;

  // false = keine Evidenz (Messwert fehlt, kein Band im Profil, Trend unbekannt)
  virtual bool evaluate(const SensorSnapshot& snap, const ThresholdProfile& profile,
                        DayPhase phase, double& ratio) const = 0;

  virtual bool valid() const { return true; }

  // true = Evidenz dieser Quelle reicht allein für ein Ergebnis
  virtual bool anchors() const { return false; }
};

enum class Side : uint8_t { Both = 0, High, Low };

// Abstand zum Idealbereich des aktuellen Profils
class RangeEvidence : public EvidenceSource {
public:
  RangeEvidence(const char* name, Variable var, Side side, const LikelihoodCurve& curve,
                float nightWeight = 1.0f);

  const char* name() const override { return name_; }
  Variable variable() const override { return var_; }
  bool evaluate(const SensorSnapshot& snap, const ThresholdProfile& profile,
                DayPhase phase, double& ratio) const override;
  bool valid() const override;
  bool anchors() const override { return isClimateVariable(var_); }

private:
  const char* name_;
  Variable var_;
  Side side_;
  LikelihoodCurve curve_;
  float nightWeight_;   // Exponent auf L in der Nachtphase
};

// Boolescher Messwert (z. B. Lüfter an/aus): fester Faktor je Zustand
class SwitchEvidence : public EvidenceSource {
public:
  SwitchEvidence(const char* name, Variable var, float onRatio, float offRatio,
                 float nightWeight = 1.0f);

  const char* name() const override { return name_; }
  Variable variable() const override { return var_; }
  bool evaluate(const SensorSnapshot& snap, const ThresholdProfile& profile,
                DayPhase phase, double& ratio) const override;
  bool valid() const override;

private:
  const char* name_;
  Variable var_;
  float onRatio_;
  float offRatio_;
  float nightWeight_;
};

// Trend im gleitenden Fenster; nur solange die Größe einen aktuellen Messwert hat
class TrendEvidence : public EvidenceSource {
public:
  TrendEvidence(const char* name, Variable var, trend_calc::Trend adverse, float ratio);

  const char* name() const override { return name_; }
  Variable variable() const override { return var_; }
  bool evaluate(const SensorSnapshot& snap, const ThresholdProfile& profile,
                DayPhase phase, double& ratio) const override;
  bool valid() const override { return ratio_ > 0.0f; }

private:
  const char* name_;
  Variable var_;
  trend_calc::Trend adverse_;
  float ratio_;
};

// --- Ergebnis ---

struct Contribution {
  Variable    variable;
  const char* source;
  double      ratio;
  bool        derived;
};

struct Estimate {
  bool   sufficient = false;
  double prior = 0.0;
  double posterior = 0.0;                  // nur gültig wenn sufficient
  std::vector<Contribution> contributions; // je Quelle mit Evidenz
  std::vector<Variable> contributing;      // Größen mit L != 1
  std::vector<Variable> observed;          // Größen mit Evidenz

  bool lowConfidence() const { return sufficient && observed.size() == 1; }
};

// posterior aus prior und Likelihood-Verhältnissen (Produkt der Odds)
double combine(double prior, const std::vector<double>& ratios);

class BayesEstimator {
public:
  BayesEstimator() : prior_(0.5) {}
  explicit BayesEstimator(double prior) : prior_(prior) {}

  BayesEstimator(BayesEstimator&&) = default;
  BayesEstimator& operator=(BayesEstimator&&) = default;

  void setPrior(double p) { prior_ = p; }
  double prior() const { return prior_; }

  void addSource(std::unique_ptr<EvidenceSource> src);
  size_t sourceCount() const { return sources_.size(); }
  bool usesVariable(Variable v) const;

  // Prior in (0,1) und alle Quellen gültig
  bool validate(verdant::ConfigError& err) const;

  Estimate estimate(const SensorSnapshot& snap, const ThresholdProfile& profile,
                    DayPhase phase) const;

private:
  double prior_;
  std::vector<std::unique_ptr<EvidenceSource>> sources_;
};

// --- Vorkonfigurierte Schätzer (Kurven aus verdant_config.h) ---

BayesEstimator makeStressEstimator(double prior, bool withTrends);
BayesEstimator makeMoldEstimator(double prior, bool withTrends);
BayesEstimator makeOptimalEstimator(double prior);

} // namespace bayes_calc
