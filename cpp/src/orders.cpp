#include "qbook/orders.hpp"
#include <cctype>

namespace qbook {

const char* to_string(OrderType t) {
  return t == OrderType::Limit ? "Limit" : "Market";
}

const char* to_string(OrderStatus s) {
  switch (s) {
    case OrderStatus::New:             return "New";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Untriggered:     return "Untriggered";
    case OrderStatus::Created:         return "Created";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Cancelled:       return "Cancelled";
    case OrderStatus::Rejected:        return "Rejected";
  }
  return "?";
}

const char* to_string(PositionSide s) {
  switch (s) {
    case PositionSide::Flat:  return "Flat";
    case PositionSide::Long:  return "Long";
    case PositionSide::Short: return "Short";
  }
  return "?";
}

const char* to_string(IntentKind k) {
  switch (k) {
    case IntentKind::Place:     return "place";
    case IntentKind::Cancel:    return "cancel";
    case IntentKind::CancelAll: return "cancel_all";
  }
  return "?";
}

bool parse_order_status(const std::string& s, OrderStatus& out) {
  std::string x;
  x.reserve(s.size());
  for (char c : s) {
    if (c == '_' || c == ' ') continue;
    x.push_back((char)std::tolower((unsigned char)c));
  }
  if (x == "new")                                 { out = OrderStatus::New;             return true; }
  if (x == "partiallyfilled")                     { out = OrderStatus::PartiallyFilled; return true; }
  if (x == "untriggered")                         { out = OrderStatus::Untriggered;     return true; }
  if (x == "created")                             { out = OrderStatus::Created;         return true; }
  if (x == "filled")                              { out = OrderStatus::Filled;          return true; }
  if (x == "cancelled" || x == "canceled")        { out = OrderStatus::Cancelled;       return true; }
  if (x == "rejected")                            { out = OrderStatus::Rejected;        return true; }
  return false;
}

} // namespace qbook
