#include "qbook/strategy.hpp"
#include "qbook/market_maker.hpp"
#include "qbook/trend_strategy.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace qbook {

// Quantities are decimal lot sizes; compare with a small tolerance.
static constexpr double kQtyEps = 1e-12;

const char* to_string(TradingSignal s) {
  switch (s) {
    case TradingSignal::None:  return "none";
    case TradingSignal::Long:  return "long";
    case TradingSignal::Short: return "short";
  }
  return "?";
}

// ---- StrategyBase ----
StrategyBase::StrategyBase(StrategyParams params, PriceScale scale, std::string id_prefix)
  : params_(std::move(params)), scale_(scale), id_prefix_(std::move(id_prefix)) {}

void StrategyBase::begin_cycle() {
  ++cycle_;
  seq_in_cycle_ = 0;
}

std::string StrategyBase::next_client_id() {
  return id_prefix_ + "-" + std::to_string(cycle_) + "-" + std::to_string(++seq_in_cycle_);
}

std::vector<const OrderRecord*> StrategyBase::entry_orders(const AccountState& acct, Side side) {
  std::vector<const OrderRecord*> out;
  for (const auto& kv : acct.active_orders) {
    const OrderRecord& o = kv.second;
    if (o.side == side && o.type == OrderType::Limit && is_open_status(o.status)) out.push_back(&o);
  }
  std::sort(out.begin(), out.end(),
            [](const OrderRecord* a, const OrderRecord* b) { return a->order_id < b->order_id; });
  return out;
}

Quantity StrategyBase::outstanding_qty(const std::vector<const OrderRecord*>& orders) {
  Quantity q = 0.0;
  for (const auto* o : orders) q += o->qty;
  return q;
}

bool StrategyBase::deviates(double px, double target) const {
  if (target <= 0.0) return false;
  return std::fabs(px - target) / target > params_.reprice_threshold_pct;
}

bool StrategyBase::under_order_cap(Quantity outstanding) const {
  const Quantity cap = params_.order_size * params_.max_open_entry_orders_per_side;
  return outstanding < cap - kQtyEps;
}

bool StrategyBase::position_safety_valve(const AccountState& acct, std::vector<OrderIntent>& out) {
  const Quantity limit = params_.max_position_size + params_.position_buffer;
  const Quantity excess = acct.abs_position() - params_.max_position_size;
  if (acct.abs_position() <= limit + kQtyEps || excess <= kQtyEps) return false;
  const Side de_risk = acct.position_size > 0 ? Side::Ask : Side::Bid;
  out.push_back(OrderIntent::market(de_risk, excess, /*reduce_only=*/true, next_client_id()));
  return true;
}

std::vector<OrderIntent> StrategyBase::shutdown(const AccountState& acct) {
  std::vector<OrderIntent> out;
  for (Side s : {Side::Bid, Side::Ask}) {
    for (const auto* o : entry_orders(acct, s)) out.push_back(OrderIntent::cancel(o->order_id));
  }
  return out;
}

// ---- StrategyRegistry ----
StrategyRegistry StrategyRegistry::with_builtins() {
  StrategyRegistry r;
  r.add("supertrend", [](const StrategyParams& p, const PriceScale& s) -> std::unique_ptr<IStrategy> {
    return std::make_unique<TrendFollowingStrategy>(p, s);
  });
  r.add("market_maker", [](const StrategyParams& p, const PriceScale& s) -> std::unique_ptr<IStrategy> {
    return std::make_unique<MarketMakingStrategy>(p, s);
  });
  return r;
}

bool StrategyRegistry::add(const std::string& name, StrategyFactory factory) {
  if (!factory) return false;
  return factories_.emplace(name, std::move(factory)).second;
}

std::unique_ptr<IStrategy> StrategyRegistry::create(const std::string& name,
                                                    const StrategyParams& params,
                                                    const PriceScale& scale,
                                                    IEventLogger* logger) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) {
    const std::string msg = "unknown strategy '" + name + "'";
    if (logger) logger->log_message(LogLevel::Error, msg);
    else        std::fprintf(stderr, "[qbook] %s\n", msg.c_str());
    return nullptr;
  }
  return it->second(params, scale);
}

std::vector<std::string> StrategyRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& kv : factories_) out.push_back(kv.first);
  return out;
}

} // namespace qbook
