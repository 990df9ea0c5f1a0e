// ==============================
// Datei: lib/bayes_calc/bayes_calc.cpp
// ==============================

#include "bayes_calc.h"

#include <algorithm>
#include <cmath>
#include <string>

using namespace bayes_calc;
using verdant::ConfigError;
using verdant::ConfigErrorCode;

namespace {

// Exponent auf das Verhältnis (Nachtgewichtung); 1.0 = unverändert
inline double weighted(double ratio, float weight) {
  if (weight == 1.0f || ratio <= 0.0) return ratio;
  return std::pow(ratio, static_cast<double>(weight));
}

inline bool contains(const std::vector<Variable>& list, Variable v) {
  return std::find(list.begin(), list.end(), v) != list.end();
}

} // namespace

// --- SensorSnapshot ---

void SensorSnapshot::set(Variable v, double value, uint64_t ts, bool derived) {
  Reading& r = readings[profile_ctrl::varIndex(v)];
  if (!std::isfinite(value)) { // NaN/Inf = nicht verfügbar
    r = Reading{};
    r.ts = ts;
    return;
  }
  r.available = true;
  r.value = value;
  r.ts = ts;
  r.derived = derived;
}

void SensorSnapshot::clear(Variable v) {
  readings[profile_ctrl::varIndex(v)] = Reading{};
  trends[profile_ctrl::varIndex(v)] = trend_calc::Trend::Unknown;
}

// --- LikelihoodCurve ---

double LikelihoodCurve::clamp(double ratio) const {
  if (ratio < minRatio) return minRatio;
  if (ratio > maxRatio) return maxRatio;
  return ratio;
}

double LikelihoodCurve::ratioAt(double d) const {
  if (!(d > 0.0)) d = 0.0;
  double f;
  if (shape == CurveShape::Gaussian) {
    const double x = d / span;
    f = 1.0 - std::exp(-0.5 * x * x);
  } else {
    f = std::min(d / span, 1.0);
  }
  const double logL = std::log(static_cast<double>(idealRatio)) * (1.0 - f) +
                      std::log(static_cast<double>(farRatio)) * f;
  return clamp(std::exp(logL));
}

bool LikelihoodCurve::valid() const {
  return idealRatio > 0.0f && farRatio > 0.0f && span > 0.0f &&
         minRatio > 0.0f && minRatio <= maxRatio;
}

// --- RangeEvidence ---

RangeEvidence::RangeEvidence(const char* name, Variable var, Side side,
                             const LikelihoodCurve& curve, float nightWeight)
  : name_(name), var_(var), side_(side), curve_(curve), nightWeight_(nightWeight) {}

bool RangeEvidence::evaluate(const SensorSnapshot& snap, const ThresholdProfile& profile,
                             DayPhase phase, double& ratio) const {
  const Reading& r = snap.get(var_);
  if (!r.available) return false;
  const Band& b = profile.band(var_);
  if (!b.defined) return false;

  double d;
  switch (side_) {
    case Side::High: d = b.distanceAbove(r.value); break;
    case Side::Low:  d = b.distanceBelow(r.value); break;
    default:         d = b.normalizedDistance(r.value); break;
  }
  ratio = curve_.ratioAt(d);
  if (phase == DayPhase::Night) ratio = curve_.clamp(weighted(ratio, nightWeight_));
  return true;
}

bool RangeEvidence::valid() const {
  return curve_.valid() && nightWeight_ > 0.0f;
}

// --- SwitchEvidence ---

SwitchEvidence::SwitchEvidence(const char* name, Variable var, float onRatio, float offRatio,
                               float nightWeight)
  : name_(name), var_(var), onRatio_(onRatio), offRatio_(offRatio), nightWeight_(nightWeight) {}

bool SwitchEvidence::evaluate(const SensorSnapshot& snap, const ThresholdProfile&,
                              DayPhase phase, double& ratio) const {
  const Reading& r = snap.get(var_);
  if (!r.available) return false;
  ratio = r.value >= 0.5 ? onRatio_ : offRatio_;
  if (phase == DayPhase::Night) ratio = weighted(ratio, nightWeight_);
  return true;
}

bool SwitchEvidence::valid() const {
  return onRatio_ > 0.0f && offRatio_ > 0.0f && nightWeight_ > 0.0f;
}

// --- TrendEvidence ---

TrendEvidence::TrendEvidence(const char* name, Variable var, trend_calc::Trend adverse, float ratio)
  : name_(name), var_(var), adverse_(adverse), ratio_(ratio) {}

bool TrendEvidence::evaluate(const SensorSnapshot& snap, const ThresholdProfile&,
                             DayPhase, double& ratio) const {
  if (!snap.get(var_).available) return false;
  const trend_calc::Trend t = snap.trend(var_);
  if (t == trend_calc::Trend::Unknown) return false;
  ratio = (t == adverse_) ? ratio_ : 1.0;
  return true;
}

// --- Kombination ---

double bayes_calc::combine(double prior, const std::vector<double>& ratios) {
  double logOdds = std::log(prior / (1.0 - prior));
  for (double r : ratios) logOdds += std::log(r);
  return 1.0 / (1.0 + std::exp(-logOdds));
}

void BayesEstimator::addSource(std::unique_ptr<EvidenceSource> src) {
  if (src) sources_.push_back(std::move(src));
}

bool BayesEstimator::usesVariable(Variable v) const {
  for (const auto& s : sources_) if (s->variable() == v) return true;
  return false;
}

bool BayesEstimator::validate(ConfigError& err) const {
  if (!(prior_ > 0.0 && prior_ < 1.0)) {
    return err.fail(ConfigErrorCode::PriorOutOfRange,
                    "prior " + std::to_string(prior_) + " outside (0,1)");
  }
  for (const auto& s : sources_) {
    if (!s->valid()) {
      return err.fail(ConfigErrorCode::InvalidTolerance,
                      std::string("invalid likelihood parameters for source '") + s->name() + "'");
    }
  }
  return true;
}

Estimate BayesEstimator::estimate(const SensorSnapshot& snap, const ThresholdProfile& profile,
                                  DayPhase phase) const {
  Estimate e;
  e.prior = prior_;
  std::vector<double> ratios;
  ratios.reserve(sources_.size());
  bool anchored = false;

  for (const auto& s : sources_) {
    double ratio = 1.0;
    if (!s->evaluate(snap, profile, phase, ratio)) continue;
    const Variable v = s->variable();
    ratios.push_back(ratio);
    if (s->anchors()) anchored = true;
    e.contributions.push_back(Contribution{v, s->name(), ratio, snap.get(v).derived});
    if (!contains(e.observed, v)) e.observed.push_back(v);
    if (ratio != 1.0 && !contains(e.contributing, v)) e.contributing.push_back(v);
  }

  if (!anchored) return e;   // insufficient, auch wenn CO2/Lüfter etwas liefern
  e.sufficient = true;
  e.posterior = combine(prior_, ratios);
  return e;
}
