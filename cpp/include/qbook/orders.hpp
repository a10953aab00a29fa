#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "types.hpp"

namespace qbook {

enum class OrderType   : uint8_t { Limit=0, Market=1 };
enum class OrderStatus : uint8_t { New=0, PartiallyFilled, Untriggered, Created, Filled, Cancelled, Rejected };
enum class PositionSide: uint8_t { Flat=0, Long=1, Short=2 };
enum class IntentKind  : uint8_t { Place=0, Cancel=1, CancelAll=2 };

const char* to_string(OrderType t);
const char* to_string(OrderStatus s);
const char* to_string(PositionSide s);
const char* to_string(IntentKind k);

// Exchange spellings: "New", "PartiallyFilled", "Cancelled"/"Canceled", ...
bool parse_order_status(const std::string& s, OrderStatus& out);

// Statuses that keep an order resting on the book.
inline bool is_open_status(OrderStatus s) {
  return s == OrderStatus::New || s == OrderStatus::PartiallyFilled ||
         s == OrderStatus::Untriggered || s == OrderStatus::Created;
}

struct OrderRecord {
  std::string order_id;
  Side        side{Side::Bid};
  double      price{0.0};
  Quantity    qty{0.0};
  OrderType   type{OrderType::Limit};
  OrderStatus status{OrderStatus::New};
};

// Read-only view handed to the strategy once per cycle.
struct AccountState {
  double       wallet_balance{0.0};
  Quantity     position_size{0.0};   // signed: > 0 long, < 0 short
  PositionSide position_side{PositionSide::Flat};
  std::unordered_map<std::string, OrderRecord> active_orders;

  Quantity abs_position() const { return position_size < 0 ? -position_size : position_size; }
};

// One order-management command produced by a strategy.
struct OrderIntent {
  IntentKind            kind{IntentKind::Place};
  Side                  side{Side::Bid};
  OrderType             order_type{OrderType::Limit};
  Quantity              qty{0.0};
  std::optional<double> price;            // Limit only
  std::string           order_id;         // Cancel only
  std::string           client_order_id;  // Place only
  bool                  reduce_only{false};

  static OrderIntent limit(Side s, Quantity q, double px, std::string client_id) {
    OrderIntent i;
    i.kind = IntentKind::Place; i.side = s; i.order_type = OrderType::Limit;
    i.qty = q; i.price = px; i.client_order_id = std::move(client_id);
    return i;
  }
  static OrderIntent market(Side s, Quantity q, bool reduce_only, std::string client_id) {
    OrderIntent i;
    i.kind = IntentKind::Place; i.side = s; i.order_type = OrderType::Market;
    i.qty = q; i.reduce_only = reduce_only; i.client_order_id = std::move(client_id);
    return i;
  }
  static OrderIntent cancel(std::string id) {
    OrderIntent i;
    i.kind = IntentKind::Cancel; i.order_id = std::move(id);
    return i;
  }
  static OrderIntent cancel_all() {
    OrderIntent i;
    i.kind = IntentKind::CancelAll;
    return i;
  }
};

} // namespace qbook
