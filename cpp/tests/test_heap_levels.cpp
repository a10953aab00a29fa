#include <catch2/catch.hpp>
#include "qbook/heap_levels.hpp"

#include <random>

using namespace qbook;

static PriceLevel lvl(Tick t, Quantity q = 1.0) {
  PriceLevel l;
  l.tick = t;
  l.price = t * 0.01;
  l.qty = q;
  return l;
}

TEST_CASE("Bid heap is a max-heap, ask heap a min-heap") {
  PriceLevelsHeap bids{Side::Bid}, asks{Side::Ask};
  for (Tick t : {100, 104, 97, 102}) { bids.insert(lvl(t)); asks.insert(lvl(t)); }
  REQUIRE(bids.peek_top()->tick == 104);
  REQUIRE(asks.peek_top()->tick == 97);
  REQUIRE(bids.check_invariants());
  REQUIRE(asks.check_invariants());
}

TEST_CASE("Heap insert on an indexed price overwrites the value") {
  PriceLevelsHeap bids{Side::Bid};
  bids.insert(lvl(100, 1.0));
  bids.insert(lvl(101, 2.0));
  bids.insert(lvl(100, 9.0));
  REQUIRE(bids.size() == 2);
  auto top = bids.top_n(2);
  REQUIRE(top[1].tick == 100);
  REQUIRE(top[1].qty == 9.0);
  REQUIRE(bids.check_invariants());
}

TEST_CASE("Heap remove of an arbitrary price keeps the heap valid") {
  PriceLevelsHeap asks{Side::Ask};
  for (Tick t = 1; t <= 50; ++t) asks.insert(lvl(t * 3 % 101));
  REQUIRE(asks.remove(3));
  REQUIRE_FALSE(asks.remove(3));
  REQUIRE(asks.check_invariants());
  while (!asks.empty()) {
    const Tick top = asks.peek_top()->tick;
    REQUIRE(asks.remove(top));
    REQUIRE(asks.check_invariants());
    if (!asks.empty()) REQUIRE(asks.peek_top()->tick > top);
  }
}

TEST_CASE("Heap top_n leaves the heap exactly as it was") {
  PriceLevelsHeap bids{Side::Bid};
  std::mt19937_64 rng(5);
  for (int i = 0; i < 200; ++i) bids.insert(lvl(static_cast<Tick>(rng() % 1000 + 1), 1.0 + i));
  const std::size_t before = bids.size();
  const auto all_before = bids.top_n(before);

  auto top5 = bids.top_n(5);
  REQUIRE(top5.size() == 5);
  for (std::size_t i = 1; i < top5.size(); ++i) REQUIRE(top5[i - 1].tick > top5[i].tick);

  REQUIRE(bids.size() == before);
  REQUIRE(bids.check_invariants());
  const auto all_after = bids.top_n(before);
  REQUIRE(all_after.size() == all_before.size());
  for (std::size_t i = 0; i < all_after.size(); ++i) {
    REQUIRE(all_after[i].tick == all_before[i].tick);
    REQUIRE(all_after[i].qty == all_before[i].qty);
  }
}

TEST_CASE("Heap clear empties both the array and the index") {
  PriceLevelsHeap asks{Side::Ask};
  asks.insert(lvl(5));
  asks.clear();
  REQUIRE(asks.empty());
  REQUIRE_FALSE(asks.best().has_value());
  REQUIRE_FALSE(asks.remove(5));
  asks.insert(lvl(5));
  REQUIRE(asks.check_invariants());
}
