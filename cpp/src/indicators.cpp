#include "qbook/indicators.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace qbook {

std::vector<double> compute_atr(const std::vector<double>& highs,
                                const std::vector<double>& lows,
                                const std::vector<double>& closes,
                                std::size_t period) {
  const std::size_t n = closes.size();
  if (period == 0 || highs.size() != n || lows.size() != n || n < period + 1) return {};

  // tr[i-1] is the true range of bar i (bar 0 has no previous close)
  std::vector<double> tr;
  tr.reserve(n - 1);
  for (std::size_t i = 1; i < n; ++i) {
    const double pc = closes[i - 1];
    tr.push_back(std::max({highs[i] - lows[i], std::fabs(highs[i] - pc), std::fabs(lows[i] - pc)}));
  }

  std::vector<double> atr;
  atr.reserve(n - period);
  double sum = 0.0;
  for (std::size_t i = 0; i < period; ++i) sum += tr[i];
  double cur = sum / static_cast<double>(period);
  atr.push_back(cur);

  const double p = static_cast<double>(period);
  for (std::size_t i = period; i < tr.size(); ++i) {
    cur = (cur * (p - 1.0) + tr[i]) / p;   // Wilder smoothing
    atr.push_back(cur);
  }
  return atr;
}

SupertrendSeries compute_supertrend(const std::vector<double>& highs,
                                    const std::vector<double>& lows,
                                    const std::vector<double>& closes,
                                    std::size_t period, double multiplier) {
  SupertrendSeries out;
  const std::vector<double> atr = compute_atr(highs, lows, closes, period);
  if (atr.empty()) return out;

  const std::size_t offset = period;
  out.line.reserve(atr.size());
  out.direction.reserve(atr.size());

  // first usable bar
  {
    const std::size_t i = offset;
    const double hl2   = (highs[i] + lows[i]) / 2.0;
    const double upper = hl2 + multiplier * atr[0];
    const double lower = hl2 - multiplier * atr[0];
    TrendDirection d;
    if (closes[i] > upper)      d = TrendDirection::Up;
    else if (closes[i] < lower) d = TrendDirection::Down;
    else                        d = closes[i] >= hl2 ? TrendDirection::Up : TrendDirection::Down;
    out.direction.push_back(d);
    out.line.push_back(d == TrendDirection::Up ? lower : upper);
  }

  for (std::size_t k = 1; k < atr.size(); ++k) {
    const std::size_t i = offset + k;
    const double hl2         = (highs[i] + lows[i]) / 2.0;
    const double basic_upper = hl2 + multiplier * atr[k];
    const double basic_lower = hl2 - multiplier * atr[k];

    const TrendDirection prev_dir  = out.direction.back();
    const double         prev_line = out.line.back();

    const double final_upper = prev_dir == TrendDirection::Up
                                 ? std::min(basic_upper, prev_line) : basic_upper;
    const double final_lower = prev_dir == TrendDirection::Down
                                 ? std::max(basic_lower, prev_line) : basic_lower;

    // only a break of the band opposing the current trend flips it
    TrendDirection d = prev_dir;
    if (prev_dir == TrendDirection::Up) {
      if (closes[i] < final_lower) d = TrendDirection::Down;
    } else {
      if (closes[i] > final_upper) d = TrendDirection::Up;
    }

    out.direction.push_back(d);
    out.line.push_back(d == TrendDirection::Up ? final_lower : final_upper);
  }
  return out;
}

// -------- IndicatorEngine --------
IndicatorEngine::IndicatorEngine(std::size_t atr_period, double multiplier)
  : period_(atr_period), mult_(multiplier) {
  if (period_ == 0) throw std::invalid_argument("IndicatorEngine: atr_period must be > 0");
  if (!(mult_ > 0.0) || !std::isfinite(mult_)) {
    throw std::invalid_argument("IndicatorEngine: multiplier must be positive");
  }
}

std::optional<IndicatorState> IndicatorEngine::update(const CandleRing& ring) {
  if (ring.size() < min_bars()) {
    last_.reset();
    return std::nullopt;
  }
  const auto highs  = ring.highs();
  const auto lows   = ring.lows();
  const auto closes = ring.closes();

  const auto atr = compute_atr(highs, lows, closes, period_);
  const auto st  = compute_supertrend(highs, lows, closes, period_, mult_);
  if (atr.empty() || st.line.empty()) {
    last_.reset();
    return std::nullopt;
  }

  IndicatorState s;
  s.atr             = atr.back();
  s.supertrend_line = st.line.back();
  s.direction       = st.direction.back();
  last_ = s;
  return last_;
}

} // namespace qbook
