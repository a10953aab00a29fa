#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace qbook {

using NodeIndex = uint32_t;
inline constexpr NodeIndex kNullNode = std::numeric_limits<NodeIndex>::max();

// Index-addressed node pool; O(1) alloc/free after warmup.
// Freed slots are chained through a free list and reused before the vector grows.
// Indices stay valid across growth (unlike pointers into the vector).
template<class T>
class NodeArena {
  std::vector<T>         nodes_;
  std::vector<NodeIndex> free_;

public:
  explicit NodeArena(std::size_t reserve = 0) { nodes_.reserve(reserve); }

  NodeIndex alloc() {
    if (!free_.empty()) {
      NodeIndex i = free_.back(); free_.pop_back();
      nodes_[i] = T{};
      return i;
    }
    nodes_.emplace_back();
    return static_cast<NodeIndex>(nodes_.size() - 1);
  }

  void free(NodeIndex i) {
    free_.push_back(i);
  }

  // Drops every node; indices handed out before are invalid afterwards.
  void reset() {
    nodes_.clear();
    free_.clear();
  }

  T&       operator[](NodeIndex i)       { return nodes_[i]; }
  const T& operator[](NodeIndex i) const { return nodes_[i]; }
};

} // namespace qbook
