#pragma once
#include <string>
#include "orders.hpp"

namespace qbook {

struct PositionEvent {
  std::string  symbol;
  Quantity     size{0.0};        // unsigned size as reported by the venue
  double       avg_price{0.0};
  PositionSide side{PositionSide::Flat};
};

struct OrderEvent {
  std::string symbol;
  std::string order_id;
  Side        side{Side::Bid};
  Quantity    qty{0.0};
  double      price{0.0};
  OrderType   type{OrderType::Limit};
  OrderStatus status{OrderStatus::New};
};

struct WalletEvent {
  std::string account_type;
  double      total_equity{0.0};
};

// Single writer of AccountState. Fed by the execution feed (or the paper
// executor); the trading loop copies a snapshot() once per cycle.
class AccountTracker {
public:
  AccountTracker() = default;
  // Empty filter accepts every symbol.
  explicit AccountTracker(std::string symbol) : symbol_(std::move(symbol)) {}

  void on_position(const PositionEvent& e);
  void on_order(const OrderEvent& e);
  void on_wallet(const WalletEvent& e);

  // Replace the whole state, e.g. from a bootstrap fetch.
  void reset(const AccountState& s) { state_ = s; }

  AccountState snapshot() const { return state_; }
  const AccountState& state() const { return state_; }
  const std::string& symbol() const { return symbol_; }

private:
  bool accepts(const std::string& sym) const { return symbol_.empty() || sym.empty() || sym == symbol_; }

  std::string  symbol_;
  AccountState state_;
};

} // namespace qbook
