#include <catch2/catch.hpp>
#include "qbook/book_engine.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace qbook;
using Catch::Matchers::WithinAbs;

namespace {

// Records every callback so tests can check what was logged.
struct RecordingLogger : IEventLogger {
  std::vector<ApplyResult> results;
  std::vector<std::string> skip_reasons;
  std::vector<std::string> messages;

  void log_book(BookEvent, SeqNo, ApplyResult r, std::size_t, std::size_t) override {
    results.push_back(r);
  }
  void log_entry_skipped(Side, const RawEntry&, const char* reason) override {
    skip_reasons.emplace_back(reason);
  }
  void log_message(LogLevel, const std::string& text) override { messages.push_back(text); }
};

struct Fixture {
  std::unique_ptr<IPriceLevels> bids;
  std::unique_ptr<IPriceLevels> asks;
  RecordingLogger               log;
  std::unique_ptr<OrderBookEngine> book;

  explicit Fixture(StoreKind kind, bool resync = false) {
    bids = make_price_levels(kind, Side::Bid);
    asks = make_price_levels(kind, Side::Ask);
    BookOptions opt;
    opt.resync_on_gap = resync;
    book = std::make_unique<OrderBookEngine>(*bids, *asks, opt, &log);
  }
};

using Entries = std::vector<RawEntry>;

BookMessage msg(std::optional<std::vector<RawEntry>> b,
                std::optional<std::vector<RawEntry>> a,
                std::optional<SeqNo> seq) {
  BookMessage m;
  m.bids = std::move(b);
  m.asks = std::move(a);
  m.seq = seq;
  return m;
}

} // namespace

TEST_CASE("Snapshot, delete delta, then replayed old id changes nothing") {
  for (StoreKind kind : {StoreKind::Skip, StoreKind::Heap}) {
    Fixture f(kind);
    auto& book = *f.book;

    REQUIRE(book.apply_snapshot(msg(Entries{{"100", "1"}}, Entries{{"101", "1"}}, 1)) == ApplyResult::Applied);
    auto tob = book.best_bid_ask();
    REQUIRE(tob.bid == 100.0);
    REQUIRE(tob.ask == 101.0);

    REQUIRE(book.apply_delta(msg(Entries{{"100", "0"}}, std::nullopt, 2)) == ApplyResult::Applied);
    tob = book.best_bid_ask();
    REQUIRE_FALSE(tob.bid.has_value());
    REQUIRE(tob.ask == 101.0);

    // seq 1 again: discarded as stale
    REQUIRE(book.apply_delta(msg(Entries{{"100", "5"}}, std::nullopt, 1)) == ApplyResult::Stale);
    REQUIRE_FALSE(book.best_bid_ask().bid.has_value());
    REQUIRE(book.last_sequence() == SeqNo{2});
  }
}

TEST_CASE("Applying the same delta twice changes state once") {
  Fixture f(StoreKind::Skip);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"100", "1"}}, Entries{{"105", "1"}}, 10));

  const auto d = msg(Entries{{"101", "2"}}, Entries{{"104", "3"}}, 11);
  REQUIRE(book.apply_delta(d) == ApplyResult::Applied);
  const auto once = book.depth(10);
  REQUIRE(book.apply_delta(d) == ApplyResult::Stale);
  const auto twice = book.depth(10);

  REQUIRE(once.bids.size() == twice.bids.size());
  REQUIRE(once.asks.size() == twice.asks.size());
  REQUIRE(twice.bids.front().price == 101.0);
  REQUIRE(twice.asks.front().price == 104.0);
  REQUIRE(book.stats().stale == 1);
}

TEST_CASE("Snapshot discards every previous level") {
  for (StoreKind kind : {StoreKind::Skip, StoreKind::Heap}) {
    Fixture f(kind);
    auto& book = *f.book;
    book.apply_snapshot(msg(Entries{{"100", "1"}, {"99", "2"}, {"98", "3"}},
                            Entries{{"101", "1"}, {"102", "1"}}, 1));
    book.apply_delta(msg(Entries{{"97", "1"}}, Entries{{"103", "1"}}, 2));

    REQUIRE(book.apply_snapshot(msg(Entries{{"50", "1"}}, Entries{}, 3)) == ApplyResult::Applied);
    const auto d = book.depth(100);
    REQUIRE(d.bids.size() == 1);
    REQUIRE(d.bids[0].price == 50.0);
    REQUIRE(d.asks.empty());
    REQUIRE(book.last_sequence() == SeqNo{3});
  }
}

TEST_CASE("Snapshot may move the sequence backwards") {
  Fixture f(StoreKind::Heap);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"100", "1"}}, Entries{{"101", "1"}}, 50));
  REQUIRE(book.apply_snapshot(msg(Entries{{"90", "1"}}, Entries{{"91", "1"}}, 5)) == ApplyResult::Applied);
  REQUIRE(book.last_sequence() == SeqNo{5});
  REQUIRE(book.apply_delta(msg(Entries{{"89", "1"}}, std::nullopt, 6)) == ApplyResult::Applied);
}

TEST_CASE("Malformed messages are rejected and leave the book intact") {
  Fixture f(StoreKind::Skip);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"100", "1"}}, Entries{{"101", "1"}}, 1));

  REQUIRE(book.apply_snapshot(msg(Entries{{"1", "1"}}, std::nullopt, 2)) == ApplyResult::Rejected);
  REQUIRE(book.apply_snapshot(msg(std::nullopt, Entries{{"1", "1"}}, 2)) == ApplyResult::Rejected);
  REQUIRE(book.apply_snapshot(msg(Entries{}, Entries{}, std::nullopt)) == ApplyResult::Rejected);
  REQUIRE(book.apply_delta(msg(Entries{{"100", "0"}}, std::nullopt, std::nullopt)) == ApplyResult::Rejected);
  REQUIRE(book.apply_delta(msg(std::nullopt, std::nullopt, 2)) == ApplyResult::Rejected);

  const auto tob = book.best_bid_ask();
  REQUIRE(tob.bid == 100.0);
  REQUIRE(tob.ask == 101.0);
  REQUIRE(book.last_sequence() == SeqNo{1});
  REQUIRE(book.stats().rejected == 5);
}

TEST_CASE("Bad entries are skipped, the rest of the message applies") {
  Fixture f(StoreKind::Heap);
  auto& book = *f.book;
  const std::vector<RawEntry> bids = {
    {"100", "1"},
    {"abc", "1"},      // not a number
    {"99", "-2"},      // negative quantity
    {"-5", "1"},       // negative price
    {"98"},            // missing quantity
    {"97", "nan"},     // non-finite
    {"96", "0"},       // zero quantity in a snapshot
    {"95", "1.5", "extra"},
  };
  REQUIRE(book.apply_snapshot(msg(bids, Entries{{"101", "2"}}, 7)) == ApplyResult::Applied);

  const auto d = book.depth(10);
  REQUIRE(d.bids.size() == 2);
  REQUIRE(d.bids[0].price == 100.0);
  REQUIRE(d.bids[1].price == 95.0);
  REQUIRE(d.bids[1].qty == 1.5);
  REQUIRE(f.log.skip_reasons.size() == 6);
  REQUIRE(book.stats().entries_skipped == 6);

  // a delta with only bad entries still advances the sequence
  REQUIRE(book.apply_delta(msg(Entries{{"x", "1"}}, std::nullopt, 8)) == ApplyResult::Applied);
  REQUIRE(book.last_sequence() == SeqNo{8});
  REQUIRE(book.depth(10).bids.size() == 2);
}

TEST_CASE("Delta upserts overwrite and deletes of absent prices are harmless") {
  Fixture f(StoreKind::Skip);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"100", "1"}}, Entries{{"101", "1"}}, 1));
  book.apply_delta(msg(Entries{{"100", "4"}, {"42", "0"}}, Entries{{"101", "0"}, {"102", "2"}}, 2));

  const auto tob = book.best_bid_ask();
  REQUIRE(tob.bid == 100.0);
  REQUIRE(tob.bid_qty == 4.0);
  REQUIRE(tob.ask == 102.0);
  REQUIRE(tob.ask_qty == 2.0);
}

TEST_CASE("Depth is best first on both sides") {
  Fixture f(StoreKind::Heap);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"99", "1"}, {"100", "1"}, {"98", "1"}},
                          Entries{{"103", "1"}, {"101", "1"}, {"102", "1"}}, 1));
  const auto d = book.depth(2);
  REQUIRE(d.bids.size() == 2);
  REQUIRE(d.bids[0].price == 100.0);
  REQUIRE(d.bids[1].price == 99.0);
  REQUIRE(d.asks[0].price == 101.0);
  REQUIRE(d.asks[1].price == 102.0);
  // depth on the heap must not lose levels
  REQUIRE(book.depth(10).bids.size() == 3);
}

TEST_CASE("Sequence gaps are applied by default and counted") {
  Fixture f(StoreKind::Skip, /*resync=*/false);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"100", "1"}}, Entries{{"101", "1"}}, 1));
  REQUIRE(book.apply_delta(msg(Entries{{"99", "1"}}, std::nullopt, 5)) == ApplyResult::Applied);
  REQUIRE(book.stats().gaps == 1);
  REQUIRE_FALSE(book.awaiting_snapshot());
}

TEST_CASE("Resync on gap rejects deltas until the next snapshot") {
  Fixture f(StoreKind::Heap, /*resync=*/true);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"100", "1"}}, Entries{{"101", "1"}}, 1));
  REQUIRE(book.apply_delta(msg(Entries{{"99", "1"}}, std::nullopt, 2)) == ApplyResult::Applied);

  REQUIRE(book.apply_delta(msg(Entries{{"98", "1"}}, std::nullopt, 4)) == ApplyResult::Gap);
  REQUIRE(book.awaiting_snapshot());
  REQUIRE(book.apply_delta(msg(Entries{{"97", "1"}}, std::nullopt, 5)) == ApplyResult::Rejected);
  REQUIRE(book.depth(10).bids.size() == 2);
  REQUIRE(book.last_sequence() == SeqNo{2});

  REQUIRE(book.apply_snapshot(msg(Entries{{"90", "1"}}, Entries{{"91", "1"}}, 10)) == ApplyResult::Applied);
  REQUIRE_FALSE(book.awaiting_snapshot());
  REQUIRE(book.apply_delta(msg(Entries{{"89", "1"}}, std::nullopt, 11)) == ApplyResult::Applied);
}

TEST_CASE("Prices are keyed by tick, not by raw double") {
  Fixture f(StoreKind::Heap);
  auto& book = *f.book;
  book.apply_snapshot(msg(Entries{{"100.10", "1"}}, Entries{{"100.30", "1"}}, 1));
  // same tick written differently: overwrite, not a second level
  book.apply_delta(msg(Entries{{"100.1000000001", "3"}}, std::nullopt, 2));
  const auto d = book.depth(10);
  REQUIRE(d.bids.size() == 1);
  REQUIRE(d.bids[0].qty == 3.0);
}

TEST_CASE("Engine rejects stores passed for the wrong sides") {
  auto a = make_price_levels(StoreKind::Skip, Side::Ask);
  auto b = make_price_levels(StoreKind::Skip, Side::Bid);
  REQUIRE_THROWS_AS(OrderBookEngine(*a, *b), std::invalid_argument);
  BookOptions bad;
  bad.scale.tick_size = 0.0;
  REQUIRE_THROWS_AS(OrderBookEngine(*b, *a, bad), std::invalid_argument);
}

TEST_CASE("Prices too large for a tick key are skipped with their own reason") {
  Fixture f(StoreKind::Skip);
  auto& book = *f.book;
  REQUIRE(book.apply_snapshot(msg(Entries{{"1e300", "1"}, {"100", "1"}},
                                  Entries{{"101", "1"}, {"1e17", "1"}}, 1)) == ApplyResult::Applied);
  REQUIRE(f.log.skip_reasons == std::vector<std::string>{"price out of tick range",
                                                         "price out of tick range"});
  const auto d = book.depth(10);
  REQUIRE(d.bids.size() == 1);
  REQUIRE(d.asks.size() == 1);
  REQUIRE(d.asks[0].price == 101.0);
}

TEST_CASE("Imbalance and microprice over the top levels") {
  for (StoreKind kind : {StoreKind::Skip, StoreKind::Heap}) {
    Fixture f(kind);
    auto& book = *f.book;
    REQUIRE(book.imbalance() == 0.0);
    REQUIRE_FALSE(book.microprice().has_value());

    book.apply_snapshot(msg(Entries{{"100", "2"}, {"99", "1"}},
                            Entries{{"101", "1"}, {"102", "3"}}, 1));
    // notional 200 vs 101, then 299 vs 407
    REQUIRE_THAT(book.imbalance(1), WithinAbs(99.0 / 301.0, 1e-12));
    REQUIRE_THAT(book.imbalance(2), WithinAbs(-108.0 / 706.0, 1e-12));
    REQUIRE_THAT(*book.microprice(1), WithinAbs(302.0 / 3.0, 1e-9));
    REQUIRE_THAT(*book.microprice(2), WithinAbs(703.0 / 7.0, 1e-9));

    // one empty side: no microprice, imbalance saturates
    book.apply_delta(msg(std::nullopt, Entries{{"101", "0"}, {"102", "0"}}, 2));
    REQUIRE_FALSE(book.microprice().has_value());
    REQUIRE(book.imbalance() == 1.0);

    // heap depth queries must leave every level in place
    REQUIRE(book.depth(10).bids.size() == 2);
  }
}

TEST_CASE("Market impact walks the opposite side") {
  Fixture f(StoreKind::Heap);
  auto& book = *f.book;
  REQUIRE_FALSE(book.estimate_market_impact(Side::Bid, 1.0).has_value());

  book.apply_snapshot(msg(Entries{{"100", "2"}, {"99", "1"}},
                          Entries{{"101", "1"}, {"102", "3"}}, 1));

  auto buy = book.estimate_market_impact(Side::Bid, 2.0);
  REQUIRE(buy.has_value());
  REQUIRE(buy->executed_qty == 2.0);
  REQUIRE(buy->best_price == 101.0);
  REQUIRE(buy->worst_price == 102.0);
  REQUIRE_THAT(buy->total_cost, WithinAbs(203.0, 1e-9));
  REQUIRE_THAT(buy->avg_price, WithinAbs(101.5, 1e-9));
  REQUIRE_THAT(buy->slippage_pct, WithinAbs(0.5 / 101.0 * 100.0, 1e-9));

  // more than the side holds: partial execution
  buy = book.estimate_market_impact(Side::Bid, 10.0);
  REQUIRE(buy->executed_qty == 4.0);
  REQUIRE_THAT(buy->total_cost, WithinAbs(407.0, 1e-9));

  const auto sell = book.estimate_market_impact(Side::Ask, 0.5);
  REQUIRE(sell->best_price == 100.0);
  REQUIRE(sell->worst_price == 100.0);
  REQUIRE(sell->slippage_pct == 0.0);

  REQUIRE_FALSE(book.estimate_market_impact(Side::Ask, 0.0).has_value());
  REQUIRE(book.depth(10).asks.size() == 2);
}

TEST_CASE("Validate flags a crossed book without touching it") {
  for (StoreKind kind : {StoreKind::Skip, StoreKind::Heap}) {
    Fixture f(kind);
    auto& book = *f.book;
    REQUIRE(book.validate());

    book.apply_snapshot(msg(Entries{{"100", "1"}, {"99", "1"}, {"98", "1"}},
                            Entries{{"101", "1"}, {"102", "1"}}, 1));
    REQUIRE(book.validate());
    REQUIRE(f.log.messages.empty());

    book.apply_delta(msg(Entries{{"101.5", "1"}}, std::nullopt, 2));
    REQUIRE_FALSE(book.validate());
    REQUIRE(f.log.messages.size() == 1);
    REQUIRE(f.log.messages[0].find("crossed spread") != std::string::npos);

    // a locked book counts as crossed too
    book.apply_delta(msg(Entries{{"101.5", "0"}, {"101", "2"}}, std::nullopt, 3));
    REQUIRE_FALSE(book.validate());

    const auto d = book.depth(10);
    REQUIRE(d.bids.size() == 4);
    REQUIRE(d.asks.size() == 2);
    REQUIRE(book.best_bid_ask().bid == 101.0);
  }
}

TEST_CASE("Readers on another thread never see a side emptied by a writer") {
  for (StoreKind kind : {StoreKind::Heap, StoreKind::Skip}) {
    Fixture f(kind);
    auto& book = *f.book;

    // ten resting levels per side that the writer only resizes, never removes
    Entries bids, asks;
    for (int i = 0; i < 10; ++i) {
      bids.push_back({std::to_string(100 - i), "1"});
      asks.push_back({std::to_string(101 + i), "1"});
    }
    REQUIRE(book.apply_snapshot(msg(bids, asks, 1)) == ApplyResult::Applied);

    constexpr SeqNo kDeltas = 20000;
    std::atomic<bool> done{false};
    std::atomic<int>  short_depth{0};
    std::atomic<int>  missing_top{0};
    std::atomic<long> reads{0};

    std::thread reader([&] {
      while (!done.load() || reads.load() == 0) {
        const DepthView d = book.depth(5);
        if (d.bids.size() != 5 || d.asks.size() != 5) ++short_depth;
        const TopOfBook t = book.best_bid_ask();
        if (!t.bid || !t.ask || *t.bid != 100.0 || *t.ask != 101.0) ++missing_top;
        ++reads;
      }
    });

    std::thread writer([&] {
      for (SeqNo seq = 2; seq < 2 + kDeltas; ++seq) {
        const std::string far_bid = std::to_string(80 + seq % 7);
        const std::string far_ask = std::to_string(120 + seq % 7);
        const std::string qty     = std::to_string(1 + seq % 3);
        // churn far from the top: add, remove, and resize a resting level
        book.apply_delta(msg(Entries{{far_bid, seq % 2 ? "0" : "1"}, {"100", qty}},
                             Entries{{far_ask, seq % 2 ? "1" : "0"}, {"101", qty}}, seq));
      }
      done.store(true);
    });

    writer.join();
    reader.join();

    REQUIRE(reads.load() > 0);
    REQUIRE(short_depth.load() == 0);
    REQUIRE(missing_top.load() == 0);
    REQUIRE(book.last_sequence() == SeqNo{1 + kDeltas});
    REQUIRE(book.stats().deltas_applied == kDeltas);
  }
}
