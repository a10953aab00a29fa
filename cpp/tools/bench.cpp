// cpp/tools/bench.cpp
// Throughput/latency of OrderBookEngine::apply_delta for both level stores.
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#if defined(__linux__)
  #include <pthread.h>
  #include <sched.h>
#endif

#include "qbook/book_engine.hpp"
#include "qbook/price_levels.hpp"
#include "qbook/types.hpp"

using namespace qbook;
using steady = std::chrono::steady_clock;

struct BenchOptions {
  uint64_t    msgs           = 500'000;
  uint64_t    warmup         = 20'000;
  std::string store          = "both";   // skip | heap | both
  uint64_t    levels         = 200;      // distinct price ticks per side
  uint64_t    depth_every    = 0;        // depth(25) every K msgs, 0 = never
  uint64_t    latency_sample = 1;        // time every K-th msg, 0 = off
  uint64_t    seed           = 42;
  std::string out_csv;
  std::optional<int> pin_core;
};

static void usage(const char* prog) {
  std::fprintf(stderr,
    "Usage: %s [--msgs N] [--warmup N] [--store skip|heap|both] [--levels N]\n"
    "          [--depth-every K] [--latency-sample K] [--seed N]\n"
    "          [--out-csv PATH] [--pin-core N]\n", prog);
}

static bool parse_count(const char* s, uint64_t& out) {
  char* end = nullptr;
  out = std::strtoull(s, &end, 10);
  return end != s && *end == '\0';
}

static bool parse_options(int argc, char** argv, BenchOptions& o) {
  for (int i = 1; i < argc; ++i) {
    const char* flag = argv[i];
    if (i + 1 >= argc) {
      std::fprintf(stderr, "missing value after %s\n", flag);
      return false;
    }
    const char* val = argv[++i];
    bool ok = true;
    if      (!std::strcmp(flag, "--msgs"))           ok = parse_count(val, o.msgs);
    else if (!std::strcmp(flag, "--warmup"))         ok = parse_count(val, o.warmup);
    else if (!std::strcmp(flag, "--levels"))         ok = parse_count(val, o.levels);
    else if (!std::strcmp(flag, "--depth-every"))    ok = parse_count(val, o.depth_every);
    else if (!std::strcmp(flag, "--latency-sample")) ok = parse_count(val, o.latency_sample);
    else if (!std::strcmp(flag, "--seed"))           ok = parse_count(val, o.seed);
    else if (!std::strcmp(flag, "--store"))          o.store = val;
    else if (!std::strcmp(flag, "--out-csv"))        o.out_csv = val;
    else if (!std::strcmp(flag, "--pin-core"))       o.pin_core = std::atoi(val);
    else {
      std::fprintf(stderr, "unknown option: %s\n", flag);
      return false;
    }
    if (!ok) {
      std::fprintf(stderr, "bad count for %s: %s\n", flag, val);
      return false;
    }
  }
  if (o.levels == 0) {
    std::fprintf(stderr, "--levels must be > 0\n");
    return false;
  }
  if (o.store != "skip" && o.store != "heap" && o.store != "both") {
    std::fprintf(stderr, "--store must be skip, heap or both\n");
    return false;
  }
  return true;
}

static void pin_to_core(const std::optional<int>& core) {
  if (!core) return;
#if defined(__linux__)
  cpu_set_t mask;
  CPU_ZERO(&mask);
  CPU_SET(*core, &mask);
  if (pthread_setaffinity_np(pthread_self(), sizeof(mask), &mask) != 0) {
    std::fprintf(stderr, "warning: could not pin to core %d\n", *core);
  }
#else
  std::fprintf(stderr, "warning: --pin-core is only supported on Linux\n");
#endif
}

// Sorted latency samples with linear-interpolated percentiles.
class Percentiles {
public:
  explicit Percentiles(std::vector<double> samples) : v_(std::move(samples)) {
    std::sort(v_.begin(), v_.end());
  }
  bool empty() const { return v_.empty(); }
  double at(double q) const {
    if (v_.empty()) return 0.0;
    const double pos  = q * static_cast<double>(v_.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(pos);
    const std::size_t hi = std::min(lo + 1, v_.size() - 1);
    const double w = pos - static_cast<double>(lo);
    return v_[lo] + (v_[hi] - v_[lo]) * w;
  }
private:
  std::vector<double> v_;
};

// Pre-rendered one-entry deltas so string formatting stays out of the timed loop.
// Bids live below 10000.00, asks above; ~20% of entries delete a level.
static std::vector<BookMessage> make_stream(const BenchOptions& o, uint64_t n, uint64_t first_seq,
                                            std::mt19937_64& rng) {
  std::uniform_int_distribution<uint64_t> lvl(1, o.levels);
  std::bernoulli_distribution is_bid(0.5);
  std::uniform_int_distribution<int> qty(0, 9);

  std::vector<BookMessage> out;
  out.reserve(n);
  char px[32], q[16];
  for (uint64_t i = 0; i < n; ++i) {
    const bool bid = is_bid(rng);
    const double off = 0.01 * static_cast<double>(lvl(rng));
    std::snprintf(px, sizeof(px), "%.2f", bid ? 10000.0 - off : 10000.0 + off);
    const int qv = qty(rng);
    std::snprintf(q, sizeof(q), "%d", qv < 2 ? 0 : qv);

    BookMessage m;
    m.seq = first_seq + i;
    (bid ? m.bids : m.asks) = std::vector<RawEntry>{RawEntry{px, q}};
    out.push_back(std::move(m));
  }
  return out;
}

static void run_store(StoreKind kind, const BenchOptions& o, std::FILE* csv) {
  auto bids = make_price_levels(kind, Side::Bid, o.seed);
  auto asks = make_price_levels(kind, Side::Ask, o.seed + 1);
  OrderBookEngine book(*bids, *asks);

  BookMessage empty_snap;
  empty_snap.seq = 1;
  empty_snap.bids.emplace();
  empty_snap.asks.emplace();
  if (book.apply_snapshot(empty_snap) != ApplyResult::Applied) {
    std::fprintf(stderr, "[%s] initial snapshot refused\n", to_string(kind));
    return;
  }

  std::mt19937_64 rng(o.seed);
  const auto warm = make_stream(o, o.warmup, 2, rng);
  const auto timed = make_stream(o, o.msgs, 2 + o.warmup, rng);
  for (const auto& m : warm) book.apply_delta(m);

  std::vector<double> lat_us;
  if (o.latency_sample) lat_us.reserve(o.msgs / o.latency_sample + 1);
  std::size_t depth_levels = 0;

  const auto start = steady::now();
  for (uint64_t i = 0; i < timed.size(); ++i) {
    const bool sample = o.latency_sample && i % o.latency_sample == 0;
    const auto before = sample ? steady::now() : steady::time_point{};
    book.apply_delta(timed[i]);
    if (sample) {
      lat_us.push_back(std::chrono::duration<double, std::micro>(steady::now() - before).count());
    }
    if (o.depth_every && i % o.depth_every == 0) {
      const DepthView d = book.depth(25);
      depth_levels += d.bids.size() + d.asks.size();
    }
  }
  const double secs = std::chrono::duration<double>(steady::now() - start).count();
  const double rate = secs > 0 ? static_cast<double>(o.msgs) / secs : 0.0;

  const Percentiles pct(std::move(lat_us));
  const BookStats st = book.stats();
  std::printf("[%s] msgs=%llu time=%.3fs rate=%.1f msgs/s levels=%zu/%zu skipped=%llu\n",
              to_string(kind), (unsigned long long)o.msgs, secs, rate,
              bids->size(), asks->size(), (unsigned long long)st.entries_skipped);
  if (!pct.empty()) {
    std::printf("[%s] latency_us p50=%.3f p99=%.3f p99.9=%.3f (every %llu)\n",
                to_string(kind), pct.at(0.50), pct.at(0.99), pct.at(0.999),
                (unsigned long long)o.latency_sample);
  }
  if (o.depth_every) {
    std::printf("[%s] depth queries returned %zu levels\n", to_string(kind), depth_levels);
  }
  if (csv) {
    std::fprintf(csv, "%s,%llu,%.6f,%.1f,%.6f,%.6f,%.6f,%llu,%llu,%llu\n",
                 to_string(kind), (unsigned long long)o.msgs, secs, rate,
                 pct.at(0.50), pct.at(0.99), pct.at(0.999),
                 (unsigned long long)o.levels, (unsigned long long)o.depth_every,
                 (unsigned long long)o.seed);
  }
}

int main(int argc, char** argv) {
  BenchOptions o;
  if (!parse_options(argc, argv, o)) {
    usage(argv[0]);
    return 2;
  }
  pin_to_core(o.pin_core);

  std::FILE* csv = nullptr;
  if (!o.out_csv.empty()) {
    csv = std::fopen(o.out_csv.c_str(), "w");
    if (!csv) {
      std::perror(o.out_csv.c_str());
      return 1;
    }
    std::fprintf(csv, "store,msgs,wall_s,rate_msgs_s,p50_us,p99_us,p99_9_us,levels,depth_every,seed\n");
  }

  if (o.store != "heap") run_store(StoreKind::Skip, o, csv);
  if (o.store != "skip") run_store(StoreKind::Heap, o, csv);
  if (csv) std::fclose(csv);
  return 0;
}
