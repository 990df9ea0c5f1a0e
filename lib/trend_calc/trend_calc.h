/*
 * trend_calc.h | Trend einer Messgröße über ein gleitendes Zeitfenster
 *
 * Vergleicht ältesten und neuesten Messwert im Fenster (Standard 30 min).
 * Weniger als zwei Werte im Fenster -> Trend::Unknown.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace trend_calc {

enum class Trend : uint8_t { Unknown = 0, Stable, Rising, Falling };

const char* trendName(Trend t);

class TrendWindow {
public:
  TrendWindow();
  TrendWindow(uint64_t windowMs, double epsilon);

  void configure(uint64_t windowMs, double epsilon);

  // Zeitstempel müssen monoton steigen; ältere Werte werden verworfen
  void addSample(double value, uint64_t nowMs);
  void clear() { samples_.clear(); }

  Trend trend(uint64_t nowMs) const;
  // Änderung neuester - ältester Wert im Fenster; false bei < 2 Werten
  bool change(uint64_t nowMs, double& out) const;

  size_t size() const { return samples_.size(); }
  uint64_t windowMs() const { return windowMs_; }

private:
  struct Sample { uint64_t ts; double value; };

  void prune(uint64_t nowMs);

  std::deque<Sample> samples_;
  uint64_t windowMs_;
  double eps_;
};

} // namespace trend_calc
