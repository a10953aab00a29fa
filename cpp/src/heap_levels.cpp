#include "qbook/heap_levels.hpp"
#include <algorithm>
#include <utility>

namespace qbook {

void PriceLevelsHeap::swap_slots(std::size_t i, std::size_t j) {
  pos_[heap_[i].tick] = j;
  pos_[heap_[j].tick] = i;
  std::swap(heap_[i], heap_[j]);
}

void PriceLevelsHeap::sift_up(std::size_t i) {
  while (i > 0) {
    const std::size_t p = parent(i);
    if (!outranks(heap_[i], heap_[p])) break;
    swap_slots(i, p);
    i = p;
  }
}

void PriceLevelsHeap::sift_down(std::size_t i) {
  const std::size_t n = heap_.size();
  while (true) {
    std::size_t top = i;
    const std::size_t l = left(i), r = right(i);
    if (l < n && outranks(heap_[l], heap_[top])) top = l;
    if (r < n && outranks(heap_[r], heap_[top])) top = r;
    if (top == i) break;
    swap_slots(i, top);
    i = top;
  }
}

void PriceLevelsHeap::insert(const PriceLevel& lvl) {
  auto it = pos_.find(lvl.tick);
  if (it != pos_.end()) {
    // same key: ordering cannot change, but re-heapify both ways anyway
    const std::size_t i = it->second;
    heap_[i] = lvl;
    sift_up(i);
    sift_down(pos_[lvl.tick]);
    return;
  }
  heap_.push_back(lvl);
  const std::size_t i = heap_.size() - 1;
  pos_[lvl.tick] = i;
  sift_up(i);
}

bool PriceLevelsHeap::remove(Tick px) {
  auto it = pos_.find(px);
  if (it == pos_.end()) return false;
  const std::size_t i = it->second;
  pos_.erase(it);

  const std::size_t last = heap_.size() - 1;
  if (i == last) {
    heap_.pop_back();
    return true;
  }
  const Tick moved = heap_[last].tick;
  heap_[i] = heap_[last];
  heap_.pop_back();
  pos_[moved] = i;
  sift_up(i);
  sift_down(pos_[moved]);
  return true;
}

std::optional<PriceLevel> PriceLevelsHeap::best() const {
  if (heap_.empty()) return std::nullopt;
  return heap_.front();
}

std::vector<PriceLevel> PriceLevelsHeap::top_n(std::size_t n) {
  std::vector<PriceLevel> out;
  const std::size_t k = std::min(n, heap_.size());
  out.reserve(k);
  for (std::size_t i = 0; i < k; ++i) {
    out.push_back(heap_.front());
    remove(heap_.front().tick);
  }
  // restore: the heap holds exactly what it held before the call
  for (const auto& lvl : out) insert(lvl);
  return out;
}

bool PriceLevelsHeap::check_invariants() const {
  if (pos_.size() != heap_.size()) return false;
  for (std::size_t i = 0; i < heap_.size(); ++i) {
    auto it = pos_.find(heap_[i].tick);
    if (it == pos_.end() || it->second != i) return false;
    if (i > 0 && outranks(heap_[i], heap_[parent(i)])) return false;
  }
  return true;
}

} // namespace qbook
