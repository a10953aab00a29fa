#include "qbook/execution.hpp"
#include <cmath>
#include <cstdio>
#include <exception>
#include <thread>

namespace qbook {

Sleeper default_sleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

// ---- RetryingExecutionClient ----
RetryingExecutionClient::RetryingExecutionClient(IExecutionClient& inner, RetryPolicy policy,
                                                 IEventLogger* logger, Sleeper sleeper)
  : inner_(inner), policy_(policy), logger_(logger),
    sleep_(sleeper ? std::move(sleeper) : default_sleeper()) {
  if (policy_.max_attempts < 1) policy_.max_attempts = 1;
}

bool RetryingExecutionClient::run(const std::string& what, const std::function<bool()>& attempt) {
  for (int k = 1; k <= policy_.max_attempts; ++k) {
    ++attempts_;
    bool ok = false;
    try {
      ok = attempt();
    } catch (const std::exception& e) {
      // a throwing adapter counts as a failed attempt
      if (logger_) logger_->log_message(LogLevel::Warn, what + ": " + e.what());
    }
    if (ok) return true;
    if (k < policy_.max_attempts) sleep_(policy_.base_delay * k);
  }
  ++failures_;
  if (logger_) logger_->log_command_failure(what, policy_.max_attempts);
  return false;
}

std::optional<std::string> RetryingExecutionClient::place_order(Side side, Quantity qty,
                                                                std::optional<double> price,
                                                                OrderType type,
                                                                const std::optional<std::string>& client_order_id,
                                                                bool reduce_only) {
  std::optional<std::string> id;
  std::string what = std::string("place ") + to_string(side) + " " + to_string(type);
  if (client_order_id) what += " " + *client_order_id;
  run(what, [&] {
    id = inner_.place_order(side, qty, price, type, client_order_id, reduce_only);
    return id.has_value();
  });
  return id;
}

bool RetryingExecutionClient::cancel_order(const std::string& order_id) {
  return run("cancel " + order_id, [&] { return inner_.cancel_order(order_id); });
}

int RetryingExecutionClient::cancel_all_orders() {
  int n = -1;
  run("cancel_all", [&] {
    n = inner_.cancel_all_orders();
    return n >= 0;
  });
  return n;
}

// ---- PaperExecutionClient ----
PaperExecutionClient::PaperExecutionClient(AccountTracker* tracker, std::string symbol)
  : tracker_(tracker), symbol_(std::move(symbol)) {}

bool PaperExecutionClient::consume_failure() {
  if (fail_next_ <= 0) return false;
  --fail_next_;
  return true;
}

void PaperExecutionClient::report_order(const OrderRecord& o) {
  if (!tracker_) return;
  OrderEvent e;
  e.symbol   = symbol_;
  e.order_id = o.order_id;
  e.side     = o.side;
  e.qty      = o.qty;
  e.price    = o.price;
  e.type     = o.type;
  e.status   = o.status;
  tracker_->on_order(e);
}

void PaperExecutionClient::fill(const OrderRecord& o, double px) {
  position_ += o.side == Side::Bid ? o.qty : -o.qty;
  if (std::fabs(position_) < 1e-12) position_ = 0.0;
  mark_px_ = px;

  OrderRecord done = o;
  done.status = OrderStatus::Filled;
  report_order(done);

  if (tracker_) {
    PositionEvent p;
    p.symbol    = symbol_;
    p.size      = std::fabs(position_);
    p.avg_price = px;
    p.side      = position_ > 0 ? PositionSide::Long
                : position_ < 0 ? PositionSide::Short : PositionSide::Flat;
    tracker_->on_position(p);
  }
}

std::optional<std::string> PaperExecutionClient::place_order(Side side, Quantity qty,
                                                             std::optional<double> price,
                                                             OrderType type,
                                                             const std::optional<std::string>& client_order_id,
                                                             bool reduce_only) {
  Call c;
  c.kind = CallKind::Place;
  c.side = side;
  c.type = type;
  c.qty  = qty;
  c.price = price;
  c.client_order_id = client_order_id.value_or("");
  c.reduce_only = reduce_only;

  if (consume_failure()) { calls_.push_back(c); return std::nullopt; }
  if (!(qty > 0.0) || (type == OrderType::Limit && !price)) { calls_.push_back(c); return std::nullopt; }

  if (client_order_id) {
    auto it = by_client_.find(*client_order_id);
    if (it != by_client_.end()) {
      // retried command: same order, nothing new happens
      c.order_id = it->second;
      calls_.push_back(c);
      return it->second;
    }
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "paper-%06llu", static_cast<unsigned long long>(next_id_++));
  const std::string id(buf);
  c.order_id = id;
  calls_.push_back(c);
  if (client_order_id) by_client_[*client_order_id] = id;

  OrderRecord o;
  o.order_id = id;
  o.side     = side;
  o.price    = price.value_or(mark_px_);
  o.qty      = qty;
  o.type     = type;
  o.status   = OrderStatus::New;

  if (type == OrderType::Market) {
    if (reduce_only) {
      // never flip the position through zero
      const Quantity open = side == Side::Bid ? -position_ : position_;
      if (open <= 0.0) return id;
      if (o.qty > open) o.qty = open;
    }
    fill(o, o.price);
    return id;
  }

  open_[id] = o;
  report_order(o);
  return id;
}

bool PaperExecutionClient::cancel_order(const std::string& order_id) {
  Call c;
  c.kind = CallKind::Cancel;
  c.order_id = order_id;
  calls_.push_back(c);
  if (consume_failure()) return false;

  auto it = open_.find(order_id);
  if (it == open_.end()) return false;
  OrderRecord o = it->second;
  open_.erase(it);
  o.status = OrderStatus::Cancelled;
  report_order(o);
  return true;
}

int PaperExecutionClient::cancel_all_orders() {
  Call c;
  c.kind = CallKind::CancelAll;
  calls_.push_back(c);
  if (consume_failure()) return -1;

  const int n = static_cast<int>(open_.size());
  for (auto& kv : open_) {
    OrderRecord o = kv.second;
    o.status = OrderStatus::Cancelled;
    report_order(o);
  }
  open_.clear();
  return n;
}

} // namespace qbook
