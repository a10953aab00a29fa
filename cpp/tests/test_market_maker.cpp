#include <catch2/catch.hpp>
#include "qbook/market_maker.hpp"

#include <string>

using namespace qbook;
using Catch::Matchers::WithinAbs;

static TopOfBook touch(double bid, double ask) {
  TopOfBook t;
  t.bid = bid;
  t.ask = ask;
  return t;
}

static void add_order(AccountState& acct, const std::string& id, Side side, double px) {
  OrderRecord o;
  o.order_id = id;
  o.side = side;
  o.price = px;
  o.qty = 0.001;
  acct.active_orders[id] = o;
}

TEST_CASE("Quotes sit one spread outside the touch on the tick grid", "[mm]") {
  MarketMakingStrategy mm(StrategyParams{}, PriceScale{0.01});
  const auto t = mm.targets(touch(100.0, 100.5));
  REQUIRE(t.has_value());
  REQUIRE_THAT(t->bid, WithinAbs(99.95, 1e-9));    // 99.95 exactly
  REQUIRE_THAT(t->ask, WithinAbs(100.56, 1e-9));   // 100.55025 rounded up
  REQUIRE(t->spread_used == 0.0005);
  REQUIRE_FALSE(t->nudged);
}

TEST_CASE("Crossed touch falls back to bid plus one tick", "[mm]") {
  MarketMakingStrategy mm(StrategyParams{}, PriceScale{0.01});
  const auto t = mm.targets(touch(101.0, 100.0));
  REQUIRE(t.has_value());
  REQUIRE(t->nudged);
  REQUIRE(t->spread_used < 0.0005);
  REQUIRE_THAT(t->ask - t->bid, WithinAbs(0.01, 1e-9));
}

TEST_CASE("One-sided book gives no quotes", "[mm]") {
  MarketMakingStrategy mm(StrategyParams{}, PriceScale{0.01});
  TopOfBook t;
  t.bid = 100.0;
  REQUIRE_FALSE(mm.targets(t).has_value());
  mm.on_book_update(t);
  REQUIRE(mm.decide(AccountState{}).empty());
}

TEST_CASE("Flat account quotes both sides", "[mm]") {
  MarketMakingStrategy mm(StrategyParams{}, PriceScale{0.01});
  mm.on_book_update(touch(100.0, 100.5));
  const auto out = mm.decide(AccountState{});
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].side == Side::Bid);
  REQUIRE(out[0].client_order_id == "mm-1-1");
  REQUIRE(out[1].side == Side::Ask);
  REQUIRE(out[1].client_order_id == "mm-1-2");
  REQUIRE(out[0].order_type == OrderType::Limit);
  REQUIRE(out[0].qty == 0.001);
}

TEST_CASE("Position at the limit blocks the side that would grow it", "[mm]") {
  MarketMakingStrategy mm(StrategyParams{}, PriceScale{0.01});
  mm.on_book_update(touch(100.0, 100.5));

  AccountState longs;
  longs.position_size = 0.01;
  auto out = mm.decide(longs);
  REQUIRE(out.size() == 1);
  REQUIRE(out[0].side == Side::Ask);

  AccountState shorts;
  shorts.position_size = -0.01;
  out = mm.decide(shorts);
  REQUIRE(out.size() == 1);
  REQUIRE(out[0].side == Side::Bid);
}

TEST_CASE("Stale quotes are repriced once per side", "[mm]") {
  StrategyParams p;
  p.max_open_entry_orders_per_side = 2;
  MarketMakingStrategy mm(p, PriceScale{0.01});
  mm.on_book_update(touch(100.0, 100.5));

  AccountState acct;
  add_order(acct, "b1", Side::Bid, 90.0);
  add_order(acct, "b2", Side::Bid, 91.0);
  add_order(acct, "a1", Side::Ask, 120.0);

  const auto out = mm.decide(acct);
  REQUIRE(out.size() == 4);
  REQUIRE(out[0].kind == IntentKind::Cancel);
  REQUIRE(out[0].order_id == "b1");
  REQUIRE(out[1].kind == IntentKind::Place);
  REQUIRE(out[1].side == Side::Bid);
  REQUIRE_THAT(*out[1].price, WithinAbs(99.95, 1e-9));
  REQUIRE(out[2].kind == IntentKind::Cancel);
  REQUIRE(out[2].order_id == "a1");
  REQUIRE(out[3].side == Side::Ask);
}

TEST_CASE("Quotes near target are kept", "[mm]") {
  MarketMakingStrategy mm(StrategyParams{}, PriceScale{0.01});
  mm.on_book_update(touch(100.0, 100.5));

  AccountState acct;
  add_order(acct, "b1", Side::Bid, 99.95);
  add_order(acct, "a1", Side::Ask, 100.56);
  REQUIRE(mm.decide(acct).empty());
}
