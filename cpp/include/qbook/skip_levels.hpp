#pragma once
#include <array>
#include <optional>
#include <random>
#include <vector>
#include "node_arena.hpp"
#include "price_levels.hpp"

namespace qbook {

struct SkipOptions {
  int      max_level = 16;   // highest level index a node may reach (<= kLevelCap-1)
  double   p         = 0.5;  // promotion probability per coin flip
  uint64_t seed      = 0x5eedULL;
};

// -------- Probabilistic skip list keyed by tick (ascending storage) --------
// Nodes live in a NodeArena; node 0 is the header. Links are arena indices with
// kNullNode as terminator, so no node owns another.
class PriceLevelsSkip final : public IPriceLevels {
public:
  static constexpr int kLevelCap = 32;

  explicit PriceLevelsSkip(Side side, SkipOptions opt = {});

  // Ordered-map primitives
  void insert(Tick key, const PriceLevel& value);
  bool remove(Tick key);
  const PriceLevel* find(Tick key) const;

  // Level-0 traversal; reverse=true yields descending keys.
  std::vector<PriceLevel>   sorted_items(bool reverse) const;
  std::optional<PriceLevel> peek_top(bool reverse) const;

  int top_level() const { return level_; }

  // IPriceLevels
  Side side() const override { return side_; }
  void upsert(const PriceLevel& lvl) override { insert(lvl.tick, lvl); }
  bool erase(Tick px) override { return remove(px); }
  std::optional<PriceLevel> best() const override { return peek_top(side_ == Side::Bid); }
  std::vector<PriceLevel>   top_n(std::size_t n) override;
  std::size_t size() const override { return size_; }
  void        clear() override;

private:
  struct Node {
    Tick       key{0};
    PriceLevel value{};
    int        height{0};
    std::array<NodeIndex, kLevelCap> forward{};
  };

  static constexpr NodeIndex kHeader = 0;

  int  random_level();
  void reset_header();
  // Fills update[0..level_] with the last node whose key < key on each level.
  void find_predecessors(Tick key, std::array<NodeIndex, kLevelCap>& update) const;

  Side                 side_;
  SkipOptions          opt_;
  std::mt19937_64      rng_;
  std::uniform_real_distribution<double> coin_{0.0, 1.0};
  NodeArena<Node>      arena_;
  int                  level_{0};
  std::size_t          size_{0};
  NodeIndex            tail_{kNullNode};  // largest key, for O(1) reverse peek
};

} // namespace qbook
