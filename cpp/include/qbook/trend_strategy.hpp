#pragma once
#include <optional>
#include "strategy.hpp"

namespace qbook {

// -------- Supertrend trend follower --------
// Holds the last acted signal across cycles. A flip cancels every entry order,
// flattens an opposite position with a reduce-only market order and posts a new
// limit entry at the touch; otherwise it keeps one entry order near the touch,
// repricing at most one order per cycle.
class TrendFollowingStrategy final : public StrategyBase {
public:
  TrendFollowingStrategy(StrategyParams params, PriceScale scale);

  const char* name() const override { return "supertrend"; }

  void initialize() override;
  void on_candle_update(const CandleRing& ring) override;
  std::vector<OrderIntent> decide(const AccountState& acct) override;

  // Bypasses the candle window; used by on_candle_update and tests.
  void on_indicator(const std::optional<IndicatorState>& s) { state_ = s; }

  TradingSignal last_signal() const { return last_signal_; }
  void set_last_signal(TradingSignal s) { last_signal_ = s; }
  const std::optional<IndicatorState>& indicator() const { return state_; }

private:
  void on_flip(TradingSignal signal, const AccountState& acct, std::vector<OrderIntent>& out);
  void maintain_entry(TradingSignal signal, const AccountState& acct, std::vector<OrderIntent>& out);

  IndicatorEngine               engine_;
  std::optional<IndicatorState> state_;
  TradingSignal                 last_signal_{TradingSignal::None};
};

} // namespace qbook
