#include <catch2/catch.hpp>
#include "qbook/skip_levels.hpp"

#include <random>
#include <stdexcept>

using namespace qbook;

static PriceLevel lvl(Tick t, Quantity q = 1.0) {
  PriceLevel l;
  l.tick = t;
  l.price = t * 0.01;
  l.qty = q;
  return l;
}

TEST_CASE("Skip list keeps level-0 chain sorted") {
  PriceLevelsSkip s{Side::Ask};
  for (Tick t : {105, 101, 110, 103, 102, 108}) s.insert(t, lvl(t));
  REQUIRE(s.size() == 6);

  auto asc = s.sorted_items(/*reverse=*/false);
  REQUIRE(asc.size() == 6);
  for (std::size_t i = 1; i < asc.size(); ++i) REQUIRE(asc[i - 1].tick < asc[i].tick);

  auto desc = s.sorted_items(/*reverse=*/true);
  REQUIRE(desc.front().tick == 110);
  REQUIRE(desc.back().tick == 101);
}

TEST_CASE("Skip list insert on an existing key replaces in place") {
  PriceLevelsSkip s{Side::Bid};
  s.insert(100, lvl(100, 1.0));
  s.insert(100, lvl(100, 7.5));
  REQUIRE(s.size() == 1);
  REQUIRE(s.find(100) != nullptr);
  REQUIRE(s.find(100)->qty == 7.5);
}

TEST_CASE("Skip list erase unlinks and shrinks") {
  PriceLevelsSkip s{Side::Bid};
  for (Tick t = 1; t <= 200; ++t) s.insert(t, lvl(t));
  REQUIRE(s.remove(50));
  REQUIRE_FALSE(s.remove(50));
  REQUIRE_FALSE(s.remove(999));
  REQUIRE(s.find(50) == nullptr);
  REQUIRE(s.size() == 199);

  for (Tick t = 1; t <= 200; ++t) s.remove(t);
  REQUIRE(s.empty());
  REQUIRE(s.top_level() == 0);
  REQUIRE_FALSE(s.peek_top(true).has_value());
  REQUIRE_FALSE(s.peek_top(false).has_value());
}

TEST_CASE("Skip list best follows the side") {
  PriceLevelsSkip bids{Side::Bid}, asks{Side::Ask};
  for (Tick t : {100, 98, 99}) { bids.upsert(lvl(t)); asks.upsert(lvl(t + 5)); }
  REQUIRE(bids.best()->tick == 100);
  REQUIRE(asks.best()->tick == 103);

  // removing the tail (largest key) moves the reverse peek
  bids.erase(100);
  REQUIRE(bids.best()->tick == 99);
  asks.erase(103);
  REQUIRE(asks.best()->tick == 104);
}

TEST_CASE("Skip list top_n is best first and bounded") {
  PriceLevelsSkip bids{Side::Bid};
  for (Tick t = 90; t <= 100; ++t) bids.upsert(lvl(t));
  auto top = bids.top_n(3);
  REQUIRE(top.size() == 3);
  REQUIRE(top[0].tick == 100);
  REQUIRE(top[1].tick == 99);
  REQUIRE(top[2].tick == 98);
  REQUIRE(bids.top_n(0).empty());
  REQUIRE(bids.top_n(100).size() == 11);
}

TEST_CASE("Skip list survives random churn against a reference") {
  PriceLevelsSkip s{Side::Ask, SkipOptions{8, 0.5, 7}};
  std::mt19937_64 rng(123);
  std::uniform_int_distribution<Tick> key(1, 300);
  std::vector<bool> present(301, false);
  std::size_t n = 0;
  for (int i = 0; i < 5000; ++i) {
    const Tick k = key(rng);
    if (rng() % 3 == 0) {
      const bool removed = s.remove(k);
      REQUIRE(removed == present[k]);
      if (removed) { present[k] = false; --n; }
    } else {
      if (!present[k]) { present[k] = true; ++n; }
      s.insert(k, lvl(k));
    }
    REQUIRE(s.size() == n);
  }
  Tick prev = 0;
  for (const auto& l : s.sorted_items(false)) {
    REQUIRE(present[l.tick]);
    REQUIRE(l.tick > prev);
    prev = l.tick;
  }
}

TEST_CASE("Skip list rejects invalid options") {
  REQUIRE_THROWS_AS(PriceLevelsSkip(Side::Bid, SkipOptions{40, 0.5, 1}), std::invalid_argument);
  REQUIRE_THROWS_AS(PriceLevelsSkip(Side::Bid, SkipOptions{16, 1.0, 1}), std::invalid_argument);
  REQUIRE_THROWS_AS(PriceLevelsSkip(Side::Bid, SkipOptions{16, 0.0, 1}), std::invalid_argument);
}
