#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "candles.hpp"

namespace qbook {

enum class TrendDirection : uint8_t { Up=0, Down=1 };

inline const char* to_string(TrendDirection d) { return d == TrendDirection::Up ? "up" : "down"; }

struct SupertrendSeries {
  std::vector<double>         line;
  std::vector<TrendDirection> direction;
};

struct IndicatorState {
  double         atr{0.0};
  double         supertrend_line{0.0};
  TrendDirection direction{TrendDirection::Up};
};

// Wilder ATR. Needs at least period+1 bars (and equal-length inputs), else empty.
// Output has n - period values; value k belongs to bar k + period.
std::vector<double> compute_atr(const std::vector<double>& highs,
                                const std::vector<double>& lows,
                                const std::vector<double>& closes,
                                std::size_t period);

// Supertrend over the same window. Empty when ATR is empty.
// Output is aligned like compute_atr: index k belongs to bar k + period.
SupertrendSeries compute_supertrend(const std::vector<double>& highs,
                                    const std::vector<double>& lows,
                                    const std::vector<double>& closes,
                                    std::size_t period, double multiplier);

// Recomputes ATR + Supertrend from the full window on every update and keeps
// only the newest scalar state.
class IndicatorEngine {
public:
  IndicatorEngine(std::size_t atr_period, double multiplier);

  std::optional<IndicatorState> update(const CandleRing& ring);
  const std::optional<IndicatorState>& last() const { return last_; }

  std::size_t atr_period() const { return period_; }
  double      multiplier() const { return mult_; }
  // Bars needed before update() yields a state.
  std::size_t min_bars() const { return period_ + 1; }

private:
  std::size_t period_;
  double      mult_;
  std::optional<IndicatorState> last_;
};

} // namespace qbook
