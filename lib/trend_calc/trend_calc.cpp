#include "trend_calc.h"

using namespace trend_calc;

const char* trend_calc::trendName(Trend t) {
  switch (t) {
    case Trend::Stable:  return "stable";
    case Trend::Rising:  return "rising";
    case Trend::Falling: return "falling";
    case Trend::Unknown: break;
  }
  return "unknown";
}

TrendWindow::TrendWindow() : windowMs_(30ull * 60ull * 1000ull), eps_(0.01) {}

TrendWindow::TrendWindow(uint64_t windowMs, double epsilon) : windowMs_(windowMs), eps_(epsilon) {}

void TrendWindow::configure(uint64_t windowMs, double epsilon) {
  windowMs_ = windowMs;
  eps_ = epsilon;
  samples_.clear();
}

void TrendWindow::prune(uint64_t nowMs) {
  if (nowMs < windowMs_) return;
  const uint64_t cutoff = nowMs - windowMs_;
  while (!samples_.empty() && samples_.front().ts < cutoff) samples_.pop_front();
}

void TrendWindow::addSample(double value, uint64_t nowMs) {
  if (!samples_.empty() && nowMs < samples_.back().ts) return; // out of order
  samples_.push_back(Sample{nowMs, value});
  prune(nowMs);
}

bool TrendWindow::change(uint64_t nowMs, double& out) const {
  const uint64_t cutoff = nowMs >= windowMs_ ? nowMs - windowMs_ : 0;
  const Sample* first = nullptr;
  const Sample* last = nullptr;
  size_t n = 0;
  for (const auto& s : samples_) {
    if (s.ts < cutoff || s.ts > nowMs) continue;
    if (!first) first = &s;
    last = &s;
    ++n;
  }
  if (n < 2) return false;
  out = last->value - first->value;
  return true;
}

Trend TrendWindow::trend(uint64_t nowMs) const {
  double d = 0.0;
  if (!change(nowMs, d)) return Trend::Unknown;
  if (d > eps_) return Trend::Rising;
  if (d < -eps_) return Trend::Falling;
  return Trend::Stable;
}
