#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
#include "types.hpp"
#include "price_levels.hpp"
#include "logging.hpp"

namespace qbook {

// Outcome of one snapshot/delta message.
enum class ApplyResult : uint8_t {
  Applied  = 0,
  Stale    = 1,   // seq <= last applied; nothing changed
  Rejected = 2,   // structurally malformed (or awaiting a snapshot); nothing changed
  Gap      = 3    // seq skipped ahead and resync_on_gap is set; nothing changed
};

const char* to_string(ApplyResult r);

struct BookOptions {
  PriceScale scale{};
  // When set, a delta with seq > last+1 is refused and every delta is refused
  // until the next snapshot.
  bool resync_on_gap{false};
};

struct BookStats {
  uint64_t snapshots{0};
  uint64_t deltas_applied{0};
  uint64_t stale{0};
  uint64_t rejected{0};
  uint64_t entries_skipped{0};
  uint64_t gaps{0};
};

// Cost of sweeping one side of the book with a market order.
struct MarketImpact {
  double   avg_price{0.0};
  double   best_price{0.0};
  double   worst_price{0.0};   // last level touched
  double   slippage_pct{0.0};  // |avg - best| / best * 100
  Quantity executed_qty{0.0};  // < requested when the side runs out
  double   total_cost{0.0};
};

// Wall clock in ms, used to stamp levels.
Timestamp now_ms();

// -------- Two-sided book fed by snapshots and incremental deltas --------
// Every public method takes the same mutex; readers never observe a side
// mid-reset or a delta half applied.
class OrderBookEngine {
public:
  OrderBookEngine(IPriceLevels& bids, IPriceLevels& asks,
                  BookOptions opt = {}, IEventLogger* logger = nullptr);

  ApplyResult apply_snapshot(const BookMessage& msg);
  ApplyResult apply_delta(const BookMessage& msg);

  TopOfBook best_bid_ask() const;
  DepthView depth(std::size_t n);

  // -------- analytics over the top n levels --------
  // Notional (price * qty) imbalance in [-1, 1]; 0 when both sides are empty.
  double imbalance(std::size_t n = 5);
  // Best prices weighted by the opposite side's depth; empty unless both sides have levels.
  std::optional<double> microprice(std::size_t n = 5);
  // Walks up to kImpactLevels of the side a taker hits. Side::Bid buys (walks asks).
  std::optional<MarketImpact> estimate_market_impact(Side taker, Quantity qty);

  // Integrity check: crossed spread, out-of-order or repeated levels.
  // Logs what it finds and returns false; never repairs the book.
  bool validate();

  std::optional<SeqNo> last_sequence() const;
  bool awaiting_snapshot() const;
  BookStats stats() const;
  const PriceScale& scale() const { return opt_.scale; }

  static constexpr std::size_t kImpactLevels = 100;

private:
  // Parses and validates one [price, qty, ...] entry.
  // Returns nullptr on success, otherwise a short reason.
  const char* parse_entry(const RawEntry& e, double& px, Quantity& qty) const;

  // Applies one side of a message; returns {applied, skipped}.
  std::pair<std::size_t, std::size_t> apply_side(IPriceLevels& side_store,
                                                 const std::vector<RawEntry>& entries,
                                                 bool snapshot, Timestamp ts);

  void log_result(BookEvent kind, SeqNo seq, ApplyResult r,
                  std::size_t applied, std::size_t skipped);

  // true when the full ladder is strictly ordered best -> worse with no repeated tick
  bool side_is_ordered(IPriceLevels& store);

  IPriceLevels&  bids_;
  IPriceLevels&  asks_;
  BookOptions    opt_;
  IEventLogger*  logger_;

  mutable std::mutex    mu_;
  std::optional<SeqNo>  last_seq_;
  bool                  awaiting_snapshot_{false};
  BookStats             stats_{};
};

} // namespace qbook
