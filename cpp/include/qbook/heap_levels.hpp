#pragma once
#include <cstddef>
#include <unordered_map>
#include <vector>
#include "price_levels.hpp"

namespace qbook {

// -------- Binary heap with tick -> slot index (bids: max-heap, asks: min-heap) --------
// The position map allows O(log n) update/removal of an arbitrary price.
// There is no sorted view: top_n() pops and reinserts, so it must run inside the
// owner's exclusive region.
class PriceLevelsHeap final : public IPriceLevels {
public:
  explicit PriceLevelsHeap(Side side) : side_(side), is_max_(side == Side::Bid) {}

  void insert(const PriceLevel& lvl);
  bool remove(Tick px);
  const PriceLevel* peek_top() const { return heap_.empty() ? nullptr : &heap_.front(); }

  // IPriceLevels
  Side side() const override { return side_; }
  void upsert(const PriceLevel& lvl) override { insert(lvl); }
  bool erase(Tick px) override { return remove(px); }
  std::optional<PriceLevel> best() const override;
  std::vector<PriceLevel>   top_n(std::size_t n) override;
  std::size_t size() const override { return heap_.size(); }
  void        clear() override { heap_.clear(); pos_.clear(); }

  // Test hook: true if every parent outranks its children and the index is exact.
  bool check_invariants() const;

private:
  static std::size_t parent(std::size_t i) { return (i - 1) / 2; }
  static std::size_t left  (std::size_t i) { return 2 * i + 1; }
  static std::size_t right (std::size_t i) { return 2 * i + 2; }

  bool outranks(const PriceLevel& a, const PriceLevel& b) const {
    return is_max_ ? a.tick > b.tick : a.tick < b.tick;
  }
  void swap_slots(std::size_t i, std::size_t j);
  void sift_up(std::size_t i);
  void sift_down(std::size_t i);

  Side                                 side_;
  bool                                 is_max_;
  std::vector<PriceLevel>              heap_;
  std::unordered_map<Tick, std::size_t> pos_;
};

} // namespace qbook
