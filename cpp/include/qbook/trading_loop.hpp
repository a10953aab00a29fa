#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "account.hpp"
#include "book_engine.hpp"
#include "candles.hpp"
#include "execution.hpp"
#include "logging.hpp"
#include "strategy.hpp"

namespace qbook {

// Thrown when the initial account fetch never succeeds; trading must not start.
class BootstrapError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct LoopOptions {
  std::chrono::milliseconds interval{5000};
  // Wait between a cancel-all and the next placement. A heuristic: the venue
  // does not acknowledge the cancel before we place again.
  std::chrono::milliseconds settle_delay{500};
  int                       bootstrap_attempts{3};
  std::chrono::milliseconds bootstrap_delay{3000};   // attempt k waits k * delay
};

using AccountFetch = std::function<std::optional<AccountState>()>;
using CandleFetch  = std::function<std::vector<Candle>(const std::string& interval, std::size_t limit)>;

struct CycleReport {
  std::size_t intents{0};
  std::size_t dispatched{0};
  std::size_t failed{0};
};

// -------- One decision cycle per tick --------
// Wires book, candle window, account snapshot and strategy to the execution
// client. Dispatch failures are counted and logged; the loop keeps going.
class TradingLoop {
public:
  TradingLoop(OrderBookEngine& book, CandleRing& candles, AccountTracker& account,
              IStrategy& strategy, IExecutionClient& exec,
              LoopOptions opt = {}, IEventLogger* logger = nullptr, Sleeper sleeper = {});

  // Seeds the account state; throws BootstrapError once attempts are exhausted.
  void bootstrap(const AccountFetch& fetch);

  // Optional per-cycle candle poll (interval/limit come from the strategy).
  void set_candle_source(CandleFetch fetch) { candle_fetch_ = std::move(fetch); }

  CycleReport run_cycle();

  // Cycles every opt.interval until stop is set; checked between cycles and
  // while waiting.
  void run(const std::atomic<bool>& stop);

  // Dispatches the strategy's shutdown intents.
  CycleReport shutdown();

  uint64_t cycles() const { return cycles_; }
  uint64_t failed_commands() const { return failed_; }

private:
  CycleReport dispatch(const std::vector<OrderIntent>& intents);
  bool dispatch_one(const OrderIntent& in, bool& settle_pending);
  void poll_candles();

  OrderBookEngine&  book_;
  CandleRing&       candles_;
  AccountTracker&   account_;
  IStrategy&        strategy_;
  IExecutionClient& exec_;
  LoopOptions       opt_;
  IEventLogger*     logger_;
  Sleeper           sleep_;
  CandleFetch       candle_fetch_;

  uint64_t cycles_{0};
  uint64_t failed_{0};
};

} // namespace qbook
