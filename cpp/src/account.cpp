#include "qbook/account.hpp"

namespace qbook {

void AccountTracker::on_position(const PositionEvent& e) {
  if (!accepts(e.symbol)) return;
  const Quantity sz = e.size < 0 ? -e.size : e.size;
  if (sz == 0.0 || e.side == PositionSide::Flat) {
    state_.position_size = 0.0;
    state_.position_side = PositionSide::Flat;
    return;
  }
  state_.position_side = e.side;
  state_.position_size = e.side == PositionSide::Long ? sz : -sz;
}

void AccountTracker::on_order(const OrderEvent& e) {
  if (!accepts(e.symbol) || e.order_id.empty()) return;
  if (!is_open_status(e.status)) {
    state_.active_orders.erase(e.order_id);
    return;
  }
  OrderRecord& r = state_.active_orders[e.order_id];
  r.order_id = e.order_id;
  r.side     = e.side;
  r.price    = e.price;
  r.qty      = e.qty;
  r.type     = e.type;
  r.status   = e.status;
}

void AccountTracker::on_wallet(const WalletEvent& e) {
  state_.wallet_balance = e.total_equity;
}

} // namespace qbook
