#include <catch2/catch.hpp>
#include "qbook/price_levels.hpp"

#include <random>

using namespace qbook;

// Same operation stream into both implementations; they must agree at every step.
TEST_CASE("Skip and heap stores agree on best and depth") {
  for (Side side : {Side::Bid, Side::Ask}) {
    auto skip = make_price_levels(StoreKind::Skip, side, 99);
    auto heap = make_price_levels(StoreKind::Heap, side);

    std::mt19937_64 rng(2024);
    std::uniform_int_distribution<Tick> key(9900, 10100);
    std::uniform_int_distribution<int>  op(0, 9);
    for (int i = 0; i < 4000; ++i) {
      const Tick t = key(rng);
      if (op(rng) < 3) {
        REQUIRE(skip->erase(t) == heap->erase(t));
      } else {
        PriceLevel l;
        l.tick = t;
        l.price = t * 0.01;
        l.qty = 1.0 + (i % 7);
        skip->upsert(l);
        heap->upsert(l);
      }
      REQUIRE(skip->size() == heap->size());
      const auto a = skip->best();
      const auto b = heap->best();
      REQUIRE(a.has_value() == b.has_value());
      if (a) {
        REQUIRE(a->tick == b->tick);
        REQUIRE(a->qty == b->qty);
      }
      if (i % 97 == 0) {
        const auto da = skip->top_n(10);
        const auto db = heap->top_n(10);
        REQUIRE(da.size() == db.size());
        for (std::size_t k = 0; k < da.size(); ++k) REQUIRE(da[k].tick == db[k].tick);
      }
    }
  }
}

TEST_CASE("Store kind parsing") {
  StoreKind k = StoreKind::Heap;
  REQUIRE(parse_store_kind("Skip", k));
  REQUIRE(k == StoreKind::Skip);
  REQUIRE(parse_store_kind("heap", k));
  REQUIRE(k == StoreKind::Heap);
  REQUIRE_FALSE(parse_store_kind("btree", k));
  REQUIRE(std::string(to_string(StoreKind::Skip)) == "skip");
}
