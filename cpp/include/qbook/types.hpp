#pragma once
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace qbook {

// Price keys are integer ticks; the decimal price is kept alongside for output.
using Tick      = int64_t;   // price in ticks
using Quantity  = double;    // base-asset size (fractional contracts allowed)
using Timestamp = int64_t;   // milliseconds since epoch
using SeqNo     = uint64_t;  // exchange update id

enum class Side : uint8_t { Bid=0, Ask=1 };

inline Side opposite(Side s) { return s == Side::Bid ? Side::Ask : Side::Bid; }
inline const char* to_string(Side s) { return s == Side::Bid ? "Buy" : "Sell"; }

// Decimal price <-> tick conversion for one instrument.
struct PriceScale {
  double tick_size{0.01};

  Tick   to_tick(double px) const { return static_cast<Tick>(std::llround(px / tick_size)); }
  double to_price(Tick t)   const { return static_cast<double>(t) * tick_size; }
};

// Aggregated resting quantity at one price.
// qty == 0 is a deletion signal and never stored.
struct PriceLevel {
  Tick      tick{0};
  double    price{0.0};
  Quantity  qty{0.0};
  Timestamp ts{0};          // last update (local clock)
  uint32_t  order_count{1};
};

// One [price, qty, ...] entry exactly as delivered by the feed.
using RawEntry = std::vector<std::string>;

// Snapshot or delta. A side left unset is "absent" (allowed for deltas only).
struct BookMessage {
  std::optional<std::vector<RawEntry>> bids;
  std::optional<std::vector<RawEntry>> asks;
  std::optional<SeqNo>                 seq;
};

struct TopOfBook {
  std::optional<double> bid;
  std::optional<double> ask;
  Quantity bid_qty{0.0};
  Quantity ask_qty{0.0};
};

struct DepthView {
  std::vector<PriceLevel> bids;  // best -> worse
  std::vector<PriceLevel> asks;  // best -> worse
};

// compile-time sanity checks
static_assert(std::is_signed_v<Tick>);
static_assert(std::is_floating_point_v<Quantity>);
static_assert(sizeof(Side) == 1);

} // namespace qbook
