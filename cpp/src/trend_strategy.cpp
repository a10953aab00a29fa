#include "qbook/trend_strategy.hpp"
#include <utility>

namespace qbook {

TrendFollowingStrategy::TrendFollowingStrategy(StrategyParams params, PriceScale scale)
  : StrategyBase(std::move(params), scale, "st"),
    engine_(params_.atr_period, params_.supertrend_multiplier) {}

void TrendFollowingStrategy::initialize() {
  state_.reset();
  last_signal_ = TradingSignal::None;
}

void TrendFollowingStrategy::on_candle_update(const CandleRing& ring) {
  on_indicator(engine_.update(ring));
}

void TrendFollowingStrategy::on_flip(TradingSignal signal, const AccountState& acct,
                                     std::vector<OrderIntent>& out) {
  out.push_back(OrderIntent::cancel_all());

  Quantity pos = acct.position_size;
  const bool long_signal = signal == TradingSignal::Long;
  if ((long_signal && pos < 0) || (!long_signal && pos > 0)) {
    const Side flatten = long_signal ? Side::Bid : Side::Ask;
    out.push_back(OrderIntent::market(flatten, acct.abs_position(), /*reduce_only=*/true,
                                      next_client_id()));
    pos = 0.0;
  }

  // every entry order was just cancelled
  const Quantity outstanding = 0.0;
  const Quantity abs_pos = pos < 0 ? -pos : pos;
  if (abs_pos < params_.max_position_size && under_order_cap(outstanding)) {
    const Side side = long_signal ? Side::Bid : Side::Ask;
    const double px = long_signal ? *tob_.bid : *tob_.ask;
    out.push_back(OrderIntent::limit(side, params_.order_size, px, next_client_id()));
  }
}

void TrendFollowingStrategy::maintain_entry(TradingSignal signal, const AccountState& acct,
                                            std::vector<OrderIntent>& out) {
  const bool long_signal = signal == TradingSignal::Long;
  const Side side = long_signal ? Side::Bid : Side::Ask;
  const double target = long_signal ? *tob_.bid : *tob_.ask;
  const bool room = acct.abs_position() < params_.max_position_size;

  const auto orders = entry_orders(acct, side);
  Quantity outstanding = outstanding_qty(orders);

  for (const auto* o : orders) {
    if (!deviates(o->price, target)) continue;
    out.push_back(OrderIntent::cancel(o->order_id));
    outstanding -= o->qty;
    if (room && under_order_cap(outstanding)) {
      out.push_back(OrderIntent::limit(side, params_.order_size, target, next_client_id()));
    }
    return;   // one reprice per cycle
  }

  if (orders.empty() && room && under_order_cap(outstanding)) {
    out.push_back(OrderIntent::limit(side, params_.order_size, target, next_client_id()));
  }
}

std::vector<OrderIntent> TrendFollowingStrategy::decide(const AccountState& acct) {
  begin_cycle();
  std::vector<OrderIntent> out;
  if (!state_ || !tob_.bid || !tob_.ask) return out;   // not enough data yet

  const TradingSignal signal =
      state_->direction == TrendDirection::Up ? TradingSignal::Long : TradingSignal::Short;

  bool flattened = false;
  if (signal != last_signal_) {
    on_flip(signal, acct, out);
    // the flatten already covers any excess
    flattened = (signal == TradingSignal::Long && acct.position_size < 0) ||
                (signal == TradingSignal::Short && acct.position_size > 0);
    last_signal_ = signal;
  } else {
    maintain_entry(signal, acct, out);
  }

  if (!flattened) position_safety_valve(acct, out);
  return out;
}

} // namespace qbook
