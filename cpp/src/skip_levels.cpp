#include "qbook/skip_levels.hpp"
#include <algorithm>
#include <stdexcept>

namespace qbook {

PriceLevelsSkip::PriceLevelsSkip(Side side, SkipOptions opt)
  : side_(side), opt_(opt), rng_(opt.seed) {
  if (opt_.max_level < 0 || opt_.max_level >= kLevelCap) {
    throw std::invalid_argument("skip list max_level must be in [0, 31]");
  }
  if (!(opt_.p > 0.0 && opt_.p < 1.0)) {
    throw std::invalid_argument("skip list promotion probability must be in (0, 1)");
  }
  reset_header();
}

void PriceLevelsSkip::reset_header() {
  arena_.reset();
  const NodeIndex h = arena_.alloc();   // always index 0
  arena_[h].height = kLevelCap - 1;
  arena_[h].forward.fill(kNullNode);
  level_ = 0;
  size_  = 0;
  tail_  = kNullNode;
}

// Coin flips until failure, capped at max_level.
int PriceLevelsSkip::random_level() {
  int lvl = 0;
  while (lvl < opt_.max_level && coin_(rng_) < opt_.p) ++lvl;
  return lvl;
}

void PriceLevelsSkip::find_predecessors(Tick key,
                                        std::array<NodeIndex, kLevelCap>& update) const {
  NodeIndex cur = kHeader;
  for (int i = level_; i >= 0; --i) {
    NodeIndex nxt = arena_[cur].forward[i];
    while (nxt != kNullNode && arena_[nxt].key < key) {
      cur = nxt;
      nxt = arena_[cur].forward[i];
    }
    update[i] = cur;
  }
}

void PriceLevelsSkip::insert(Tick key, const PriceLevel& value) {
  std::array<NodeIndex, kLevelCap> update;
  update.fill(kHeader);
  find_predecessors(key, update);

  const NodeIndex cand = arena_[update[0]].forward[0];
  if (cand != kNullNode && arena_[cand].key == key) {
    arena_[cand].value = value;   // replace in place
    return;
  }

  const int new_level = random_level();
  if (new_level > level_) {
    for (int i = level_ + 1; i <= new_level; ++i) update[i] = kHeader;
    level_ = new_level;
  }

  // take the reference only after alloc(): the arena vector may have grown
  const NodeIndex n = arena_.alloc();
  Node& node = arena_[n];
  node.key    = key;
  node.value  = value;
  node.height = new_level;
  node.forward.fill(kNullNode);
  for (int i = 0; i <= new_level; ++i) {
    node.forward[i]              = arena_[update[i]].forward[i];
    arena_[update[i]].forward[i] = n;
  }
  if (node.forward[0] == kNullNode) tail_ = n;
  ++size_;
}

bool PriceLevelsSkip::remove(Tick key) {
  std::array<NodeIndex, kLevelCap> update;
  update.fill(kHeader);
  find_predecessors(key, update);

  const NodeIndex target = arena_[update[0]].forward[0];
  if (target == kNullNode || arena_[target].key != key) return false;

  for (int i = 0; i <= level_; ++i) {
    if (arena_[update[i]].forward[i] != target) break;
    arena_[update[i]].forward[i] = arena_[target].forward[i];
  }
  if (tail_ == target) tail_ = (update[0] == kHeader) ? kNullNode : update[0];

  arena_.free(target);
  while (level_ > 0 && arena_[kHeader].forward[level_] == kNullNode) --level_;
  --size_;
  return true;
}

const PriceLevel* PriceLevelsSkip::find(Tick key) const {
  std::array<NodeIndex, kLevelCap> update;
  update.fill(kHeader);
  find_predecessors(key, update);
  const NodeIndex cand = arena_[update[0]].forward[0];
  if (cand != kNullNode && arena_[cand].key == key) return &arena_[cand].value;
  return nullptr;
}

std::vector<PriceLevel> PriceLevelsSkip::sorted_items(bool reverse) const {
  std::vector<PriceLevel> out;
  out.reserve(size_);
  for (NodeIndex n = arena_[kHeader].forward[0]; n != kNullNode; n = arena_[n].forward[0]) {
    out.push_back(arena_[n].value);
  }
  if (reverse) std::reverse(out.begin(), out.end());
  return out;
}

std::optional<PriceLevel> PriceLevelsSkip::peek_top(bool reverse) const {
  if (size_ == 0) return std::nullopt;
  if (reverse) return arena_[tail_].value;
  return arena_[arena_[kHeader].forward[0]].value;
}

std::vector<PriceLevel> PriceLevelsSkip::top_n(std::size_t n) {
  if (n == 0 || size_ == 0) return {};
  if (side_ == Side::Bid) {
    // descending order needs the whole chain reversed
    std::vector<PriceLevel> all = sorted_items(/*reverse=*/true);
    if (all.size() > n) all.resize(n);
    return all;
  }
  std::vector<PriceLevel> out;
  out.reserve(std::min(n, size_));
  for (NodeIndex i = arena_[kHeader].forward[0]; i != kNullNode && out.size() < n;
       i = arena_[i].forward[0]) {
    out.push_back(arena_[i].value);
  }
  return out;
}

void PriceLevelsSkip::clear() {
  reset_header();
}

} // namespace qbook
