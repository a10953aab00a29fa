#include "qbook/book_engine.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace qbook {

const char* to_string(ApplyResult r) {
  switch (r) {
    case ApplyResult::Applied:  return "applied";
    case ApplyResult::Stale:    return "stale";
    case ApplyResult::Rejected: return "rejected";
    case ApplyResult::Gap:      return "gap";
  }
  return "?";
}

Timestamp now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

OrderBookEngine::OrderBookEngine(IPriceLevels& bids, IPriceLevels& asks,
                                 BookOptions opt, IEventLogger* logger)
  : bids_(bids), asks_(asks), opt_(opt), logger_(logger) {
  if (bids_.side() != Side::Bid || asks_.side() != Side::Ask) {
    throw std::invalid_argument("OrderBookEngine: stores passed for the wrong sides");
  }
  if (!(opt_.scale.tick_size > 0.0) || !std::isfinite(opt_.scale.tick_size)) {
    throw std::invalid_argument("OrderBookEngine: tick_size must be positive");
  }
}

// Full consumption of the string is required: "12abc" is not a number.
static bool parse_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  const char* b = s.c_str();
  char* end = nullptr;
  out = std::strtod(b, &end);
  return end != b && *end == '\0';
}

const char* OrderBookEngine::parse_entry(const RawEntry& e, double& px, Quantity& qty) const {
  if (e.size() < 2)                 return "missing price or quantity";
  if (!parse_double(e[0], px))      return "price is not a number";
  if (!parse_double(e[1], qty))     return "quantity is not a number";
  if (!std::isfinite(px) || !std::isfinite(qty)) return "non-finite value";
  if (px <= 0.0)                    return "non-positive price";
  if (qty < 0.0)                    return "negative quantity";
  if (px / opt_.scale.tick_size >= static_cast<double>(std::numeric_limits<Tick>::max())) {
    return "price out of tick range";
  }
  if (opt_.scale.to_tick(px) <= 0)  return "price below one tick";
  return nullptr;
}

std::pair<std::size_t, std::size_t>
OrderBookEngine::apply_side(IPriceLevels& store, const std::vector<RawEntry>& entries,
                            bool snapshot, Timestamp ts) {
  std::size_t applied = 0, skipped = 0;
  for (const auto& e : entries) {
    double px = 0.0;
    Quantity qty = 0.0;
    const char* why = parse_entry(e, px, qty);
    if (!why && snapshot && qty == 0.0) why = "zero quantity in snapshot";
    if (why) {
      ++skipped;
      if (logger_) logger_->log_entry_skipped(store.side(), e, why);
      continue;
    }

    const Tick t = opt_.scale.to_tick(px);
    if (qty == 0.0) {
      // deleting an absent price is fine
      store.erase(t);
    } else {
      PriceLevel lvl;
      lvl.tick  = t;
      lvl.price = px;
      lvl.qty   = qty;
      lvl.ts    = ts;
      store.upsert(lvl);
    }
    ++applied;
  }
  stats_.entries_skipped += skipped;
  return {applied, skipped};
}

void OrderBookEngine::log_result(BookEvent kind, SeqNo seq, ApplyResult r,
                                 std::size_t applied, std::size_t skipped) {
  if (logger_) logger_->log_book(kind, seq, r, applied, skipped);
}

ApplyResult OrderBookEngine::apply_snapshot(const BookMessage& msg) {
  std::lock_guard<std::mutex> lk(mu_);

  if (!msg.bids || !msg.asks || !msg.seq) {
    ++stats_.rejected;
    log_result(BookEvent::Snapshot, msg.seq.value_or(0), ApplyResult::Rejected, 0, 0);
    if (logger_) logger_->log_message(LogLevel::Error, "snapshot missing bids, asks or sequence id");
    return ApplyResult::Rejected;
  }

  bids_.clear();
  asks_.clear();
  const Timestamp ts = now_ms();
  auto b = apply_side(bids_, *msg.bids, /*snapshot=*/true, ts);
  auto a = apply_side(asks_, *msg.asks, /*snapshot=*/true, ts);

  last_seq_ = *msg.seq;
  awaiting_snapshot_ = false;
  ++stats_.snapshots;
  log_result(BookEvent::Snapshot, *msg.seq, ApplyResult::Applied,
             b.first + a.first, b.second + a.second);
  return ApplyResult::Applied;
}

ApplyResult OrderBookEngine::apply_delta(const BookMessage& msg) {
  std::lock_guard<std::mutex> lk(mu_);

  if (!msg.seq || (!msg.bids && !msg.asks)) {
    ++stats_.rejected;
    log_result(BookEvent::Delta, msg.seq.value_or(0), ApplyResult::Rejected, 0, 0);
    if (logger_) logger_->log_message(LogLevel::Error, "delta missing sequence id or both sides");
    return ApplyResult::Rejected;
  }
  const SeqNo seq = *msg.seq;

  if (last_seq_ && seq <= *last_seq_) {
    ++stats_.stale;
    log_result(BookEvent::Delta, seq, ApplyResult::Stale, 0, 0);
    return ApplyResult::Stale;
  }

  if (awaiting_snapshot_) {
    ++stats_.rejected;
    log_result(BookEvent::Delta, seq, ApplyResult::Rejected, 0, 0);
    return ApplyResult::Rejected;
  }

  if (last_seq_ && seq > *last_seq_ + 1) {
    ++stats_.gaps;
    if (logger_) {
      logger_->log_message(LogLevel::Warn,
                           "sequence gap: last=" + std::to_string(*last_seq_) +
                           " got=" + std::to_string(seq));
    }
    if (opt_.resync_on_gap) {
      awaiting_snapshot_ = true;
      log_result(BookEvent::Delta, seq, ApplyResult::Gap, 0, 0);
      return ApplyResult::Gap;
    }
  }

  const Timestamp ts = now_ms();
  std::size_t applied = 0, skipped = 0;
  if (msg.bids) {
    auto r = apply_side(bids_, *msg.bids, /*snapshot=*/false, ts);
    applied += r.first; skipped += r.second;
  }
  if (msg.asks) {
    auto r = apply_side(asks_, *msg.asks, /*snapshot=*/false, ts);
    applied += r.first; skipped += r.second;
  }

  last_seq_ = seq;
  ++stats_.deltas_applied;
  log_result(BookEvent::Delta, seq, ApplyResult::Applied, applied, skipped);
  return ApplyResult::Applied;
}

TopOfBook OrderBookEngine::best_bid_ask() const {
  std::lock_guard<std::mutex> lk(mu_);
  TopOfBook out;
  if (auto b = bids_.best()) { out.bid = b->price; out.bid_qty = b->qty; }
  if (auto a = asks_.best()) { out.ask = a->price; out.ask_qty = a->qty; }
  return out;
}

DepthView OrderBookEngine::depth(std::size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  DepthView out;
  out.bids = bids_.top_n(n);
  out.asks = asks_.top_n(n);
  return out;
}

std::optional<SeqNo> OrderBookEngine::last_sequence() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_seq_;
}

bool OrderBookEngine::awaiting_snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return awaiting_snapshot_;
}

BookStats OrderBookEngine::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

// -------- analytics --------
double OrderBookEngine::imbalance(std::size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  double bid_notional = 0.0, ask_notional = 0.0;
  for (const auto& l : bids_.top_n(n)) bid_notional += l.price * l.qty;
  for (const auto& l : asks_.top_n(n)) ask_notional += l.price * l.qty;
  const double total = bid_notional + ask_notional;
  if (total == 0.0) return 0.0;
  return (bid_notional - ask_notional) / total;
}

std::optional<double> OrderBookEngine::microprice(std::size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto b = bids_.top_n(n);
  const auto a = asks_.top_n(n);
  if (b.empty() || a.empty()) return std::nullopt;

  Quantity bid_qty = 0.0, ask_qty = 0.0;
  for (const auto& l : b) bid_qty += l.qty;
  for (const auto& l : a) ask_qty += l.qty;
  if (bid_qty + ask_qty == 0.0) return std::nullopt;
  return (b.front().price * ask_qty + a.front().price * bid_qty) / (bid_qty + ask_qty);
}

std::optional<MarketImpact> OrderBookEngine::estimate_market_impact(Side taker, Quantity qty) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!(qty > 0.0)) return std::nullopt;
  const auto levels = (taker == Side::Bid ? asks_ : bids_).top_n(kImpactLevels);
  if (levels.empty()) return std::nullopt;

  MarketImpact out;
  out.best_price  = levels.front().price;
  out.worst_price = out.best_price;
  Quantity remaining = qty;
  for (const auto& l : levels) {
    if (remaining <= 0.0) break;
    const Quantity fill = std::min(remaining, l.qty);
    out.total_cost   += fill * l.price;
    out.executed_qty += fill;
    remaining        -= fill;
    out.worst_price   = l.price;
  }
  if (out.executed_qty <= 0.0) return std::nullopt;
  out.avg_price    = out.total_cost / out.executed_qty;
  out.slippage_pct = std::fabs(out.avg_price - out.best_price) / out.best_price * 100.0;
  return out;
}

bool OrderBookEngine::side_is_ordered(IPriceLevels& store) {
  const auto all = store.top_n(store.size());
  if (all.size() != store.size()) return false;
  for (std::size_t i = 1; i < all.size(); ++i) {
    const bool better_first = store.side() == Side::Bid ? all[i - 1].tick > all[i].tick
                                                        : all[i - 1].tick < all[i].tick;
    if (!better_first) return false;
  }
  return true;
}

bool OrderBookEngine::validate() {
  std::lock_guard<std::mutex> lk(mu_);
  if (bids_.empty() && asks_.empty()) return true;

  bool ok = true;
  auto report = [this](const std::string& what) {
    if (logger_) logger_->log_message(LogLevel::Error, "book invalid: " + what);
  };

  const auto b = bids_.best();
  const auto a = asks_.best();
  if (b && a && b->tick >= a->tick) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "crossed spread bid=%.8g ask=%.8g", b->price, a->price);
    report(buf);
    ok = false;
  }
  if (!side_is_ordered(bids_)) { report("bid levels out of order or repeated"); ok = false; }
  if (!side_is_ordered(asks_)) { report("ask levels out of order or repeated"); ok = false; }
  return ok;
}

} // namespace qbook
