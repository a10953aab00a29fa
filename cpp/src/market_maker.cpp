#include "qbook/market_maker.hpp"
#include <cmath>

namespace qbook {

// Halvings tried before falling back to bid + one tick.
static constexpr int kMaxSpreadHalvings = 8;

MarketMakingStrategy::MarketMakingStrategy(StrategyParams params, PriceScale scale)
  : StrategyBase(std::move(params), scale, "mm") {}

std::optional<QuoteTargets> MarketMakingStrategy::targets(const TopOfBook& tob) const {
  if (!tob.bid || !tob.ask) return std::nullopt;

  QuoteTargets t;
  double spread = params_.spread;
  t.bid = *tob.bid * (1.0 - spread);
  t.ask = *tob.ask * (1.0 + spread);
  for (int i = 0; i < kMaxSpreadHalvings && t.bid >= t.ask; ++i) {
    spread /= 2.0;
    t.bid = *tob.bid * (1.0 - spread);
    t.ask = *tob.ask * (1.0 + spread);
  }
  t.spread_used = spread;

  // snap outward to the tick grid: bids down, asks up
  const double tick = scale_.tick_size;
  t.bid = scale_.to_price(static_cast<Tick>(std::floor(t.bid / tick + 1e-9)));
  t.ask = scale_.to_price(static_cast<Tick>(std::ceil(t.ask / tick - 1e-9)));

  if (t.bid >= t.ask) {
    t.ask = t.bid + tick;
    t.nudged = true;
  }
  return t;
}

void MarketMakingStrategy::quote_side(Side side, double target, bool allowed,
                                      const AccountState& acct, std::vector<OrderIntent>& out) {
  const auto orders = entry_orders(acct, side);
  Quantity outstanding = outstanding_qty(orders);

  for (const auto* o : orders) {
    if (!deviates(o->price, target)) continue;
    out.push_back(OrderIntent::cancel(o->order_id));
    outstanding -= o->qty;
    if (allowed && under_order_cap(outstanding)) {
      out.push_back(OrderIntent::limit(side, params_.order_size, target, next_client_id()));
    }
    return;   // one reprice per side per cycle
  }

  if (orders.empty() && allowed && under_order_cap(outstanding)) {
    out.push_back(OrderIntent::limit(side, params_.order_size, target, next_client_id()));
  }
}

std::vector<OrderIntent> MarketMakingStrategy::decide(const AccountState& acct) {
  begin_cycle();
  std::vector<OrderIntent> out;
  const auto t = targets(tob_);
  if (!t) return out;

  const bool can_buy  = acct.position_size < params_.max_position_size;
  const bool can_sell = acct.position_size > -params_.max_position_size;
  quote_side(Side::Bid, t->bid, can_buy, acct, out);
  quote_side(Side::Ask, t->ask, can_sell, acct, out);

  position_safety_valve(acct, out);
  return out;
}

} // namespace qbook
