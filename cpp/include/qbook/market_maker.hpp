#pragma once
#include <optional>
#include <utility>
#include "strategy.hpp"

namespace qbook {

struct QuoteTargets {
  double bid{0.0};
  double ask{0.0};
  double spread_used{0.0};
  bool   nudged{false};   // ask forced to bid + one tick
};

// -------- Symmetric quoting around the touch --------
// Keeps at most the configured resting quantity per side, each quote
// `spread` away from the best price. No state besides the order set.
class MarketMakingStrategy final : public StrategyBase {
public:
  MarketMakingStrategy(StrategyParams params, PriceScale scale);

  const char* name() const override { return "market_maker"; }

  void on_candle_update(const CandleRing&) override {}
  std::vector<OrderIntent> decide(const AccountState& acct) override;

  // Quote prices for a given touch; nullopt if either side is missing.
  std::optional<QuoteTargets> targets(const TopOfBook& tob) const;

private:
  void quote_side(Side side, double target, bool allowed, const AccountState& acct,
                  std::vector<OrderIntent>& out);
};

} // namespace qbook
