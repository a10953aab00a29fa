#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

namespace qbook {

enum class StoreKind : uint8_t { Skip=0, Heap=1 };

// Abstract interface for "a side's price ladder" (bids OR asks).
// Implementations order by tick key; "best" is the max key for bids, min for asks.
class IPriceLevels {
public:
  virtual ~IPriceLevels() = default;

  virtual Side side() const = 0;

  // Insert or overwrite the level at lvl.tick. Callers never pass qty == 0.
  virtual void upsert(const PriceLevel& lvl) = 0;

  // Remove the level at px; false if it was not present.
  virtual bool erase(Tick px) = 0;

  // Top-of-book level, empty optional if the side is empty.
  virtual std::optional<PriceLevel> best() const = 0;

  // Up to n levels ordered best -> worse.
  // Non-const: the heap variant pops and reinserts to produce it.
  virtual std::vector<PriceLevel> top_n(std::size_t n) = 0;

  virtual std::size_t size() const = 0;
  virtual void        clear() = 0;

  bool empty() const { return size() == 0; }
};

// Build a ladder of the requested kind. seed only affects the skip variant.
std::unique_ptr<IPriceLevels> make_price_levels(StoreKind kind, Side side,
                                                uint64_t seed = 0x5eedULL);

// "skip" | "heap" (case-insensitive)
bool parse_store_kind(const std::string& s, StoreKind& out);
const char* to_string(StoreKind k);

} // namespace qbook
