// Vorkonfigurierte Schätzer für Stress, Schimmelrisiko und Optimalzustand

#include "bayes_calc.h"
#include "../../include/verdant_config.h"

using namespace bayes_calc;
using trend_calc::Trend;
namespace curves = verdant::curves;

// Stress: symmetrische Abweichung von Temperatur/Feuchte/VPD/CO2
BayesEstimator bayes_calc::makeStressEstimator(double prior, bool withTrends) {
  BayesEstimator est(prior);
  est.addSource(std::make_unique<RangeEvidence>(
      "temperature_range", Variable::Temperature, Side::Both, curves::STRESS_TEMP));
  est.addSource(std::make_unique<RangeEvidence>(
      "humidity_range", Variable::Humidity, Side::Both, curves::STRESS_HUMIDITY));
  est.addSource(std::make_unique<RangeEvidence>(
      "vpd_range", Variable::Vpd, Side::Both, curves::STRESS_VPD));
  est.addSource(std::make_unique<RangeEvidence>(
      "co2_range", Variable::Co2, Side::Both, curves::STRESS_CO2));
  if (withTrends) {
    est.addSource(std::make_unique<TrendEvidence>(
        "temperature_trend", Variable::Temperature, Trend::Rising, curves::TREND_RATIO));
    est.addSource(std::make_unique<TrendEvidence>(
        "humidity_trend", Variable::Humidity, Trend::Rising, curves::TREND_RATIO));
    est.addSource(std::make_unique<TrendEvidence>(
        "vpd_trend", Variable::Vpd, Trend::Rising, curves::TREND_RATIO));
  }
  return est;
}

// Schimmel: hohe Feuchte, niedriges VPD, stehende Luft – nachts stärker
BayesEstimator bayes_calc::makeMoldEstimator(double prior, bool withTrends) {
  BayesEstimator est(prior);
  est.addSource(std::make_unique<RangeEvidence>(
      "humidity_high", Variable::Humidity, Side::High, curves::MOLD_HUMIDITY,
                        curves::MOLD_NIGHT_WEIGHT));
  est.addSource(std::make_unique<RangeEvidence>(
      "vpd_low", Variable::Vpd, Side::Low, curves::MOLD_VPD,
                        curves::MOLD_NIGHT_WEIGHT));
  est.addSource(std::make_unique<SwitchEvidence>(
      "fan_off", Variable::Fan, curves::FAN_ON_RATIO, curves::FAN_OFF_RATIO,
                         curves::MOLD_NIGHT_WEIGHT));
  if (withTrends) {
    est.addSource(std::make_unique<TrendEvidence>(
        "humidity_trend", Variable::Humidity, Trend::Rising, curves::TREND_RATIO));
    est.addSource(std::make_unique<TrendEvidence>(
        "vpd_trend", Variable::Vpd, Trend::Falling, curves::TREND_RATIO));
  }
  return est;
}

BayesEstimator bayes_calc::makeOptimalEstimator(double prior) {
  BayesEstimator est(prior);
  est.addSource(std::make_unique<RangeEvidence>(
      "temperature_ideal", Variable::Temperature, Side::Both, curves::OPTIMAL_TEMP));
  est.addSource(std::make_unique<RangeEvidence>(
      "humidity_ideal", Variable::Humidity, Side::Both, curves::OPTIMAL_HUMIDITY));
  est.addSource(std::make_unique<RangeEvidence>(
      "vpd_ideal", Variable::Vpd, Side::Both, curves::OPTIMAL_VPD));
  est.addSource(std::make_unique<RangeEvidence>(
      "co2_ideal", Variable::Co2, Side::Both, curves::OPTIMAL_CO2));
  return est;
}
