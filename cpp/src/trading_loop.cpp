#include "qbook/trading_loop.hpp"
#include <algorithm>
#include <exception>
#include <utility>

namespace qbook {

// Granularity of the wait between cycles, so a stop request is seen quickly.
static constexpr std::chrono::milliseconds kStopPollStep{100};

TradingLoop::TradingLoop(OrderBookEngine& book, CandleRing& candles, AccountTracker& account,
                         IStrategy& strategy, IExecutionClient& exec,
                         LoopOptions opt, IEventLogger* logger, Sleeper sleeper)
  : book_(book), candles_(candles), account_(account), strategy_(strategy), exec_(exec),
    opt_(opt), logger_(logger), sleep_(sleeper ? std::move(sleeper) : default_sleeper()) {}

void TradingLoop::bootstrap(const AccountFetch& fetch) {
  const int attempts = std::max(1, opt_.bootstrap_attempts);
  for (int k = 1; k <= attempts; ++k) {
    std::optional<AccountState> st;
    try {
      st = fetch();
    } catch (const std::exception& e) {
      if (logger_) logger_->log_message(LogLevel::Warn, std::string("bootstrap fetch: ") + e.what());
    }
    if (st) {
      account_.reset(*st);
      strategy_.initialize();
      if (logger_) logger_->log_message(LogLevel::Info, std::string("bootstrap ok, strategy ") + strategy_.name());
      return;
    }
    if (k < attempts) sleep_(opt_.bootstrap_delay * k);
  }
  if (logger_) {
    logger_->log_command_failure("bootstrap", attempts);
    logger_->flush();
  }
  throw BootstrapError("account bootstrap failed after " + std::to_string(attempts) + " attempt(s)");
}

void TradingLoop::poll_candles() {
  if (!candle_fetch_) return;
  std::vector<Candle> bars;
  try {
    bars = candle_fetch_(strategy_.kline_interval(), strategy_.kline_limit());
  } catch (const std::exception& e) {
    // keep the previous window; the strategy sees stale bars this cycle
    if (logger_) logger_->log_message(LogLevel::Warn, std::string("candle fetch: ") + e.what());
    return;
  }
  for (const auto& c : bars) candles_.upsert(c);
}

bool TradingLoop::dispatch_one(const OrderIntent& in, bool& settle_pending) {
  if (logger_) logger_->log_intent(in);
  switch (in.kind) {
    case IntentKind::CancelAll:
      settle_pending = true;
      return exec_.cancel_all_orders() >= 0;
    case IntentKind::Cancel:
      return exec_.cancel_order(in.order_id);
    case IntentKind::Place: {
      if (settle_pending) {
        sleep_(opt_.settle_delay);
        settle_pending = false;
      }
      std::optional<std::string> cid;
      if (!in.client_order_id.empty()) cid = in.client_order_id;
      return exec_.place_order(in.side, in.qty, in.price, in.order_type, cid, in.reduce_only).has_value();
    }
  }
  return false;
}

CycleReport TradingLoop::dispatch(const std::vector<OrderIntent>& intents) {
  CycleReport rep;
  rep.intents = intents.size();
  bool settle_pending = false;
  for (const auto& in : intents) {
    if (dispatch_one(in, settle_pending)) {
      ++rep.dispatched;
    } else {
      ++rep.failed;
      ++failed_;
      if (logger_) {
        logger_->log_message(LogLevel::Warn, std::string("intent failed: ") + to_string(in.kind) +
                             (in.order_id.empty() ? "" : " " + in.order_id) +
                             (in.client_order_id.empty() ? "" : " " + in.client_order_id));
      }
    }
  }
  return rep;
}

CycleReport TradingLoop::run_cycle() {
  ++cycles_;
  poll_candles();
  strategy_.on_candle_update(candles_);
  strategy_.on_book_update(book_.best_bid_ask());
  const AccountState acct = account_.snapshot();
  const CycleReport rep = dispatch(strategy_.decide(acct));
  if (logger_) logger_->flush();
  return rep;
}

void TradingLoop::run(const std::atomic<bool>& stop) {
  while (!stop.load()) {
    run_cycle();
    for (std::chrono::milliseconds waited{0}; waited < opt_.interval && !stop.load();
         waited += kStopPollStep) {
      sleep_(std::min(kStopPollStep, opt_.interval - waited));
    }
  }
}

CycleReport TradingLoop::shutdown() {
  const CycleReport rep = dispatch(strategy_.shutdown(account_.snapshot()));
  if (logger_) {
    logger_->log_message(LogLevel::Info, "shutdown: " + std::to_string(rep.dispatched) + " of " +
                         std::to_string(rep.intents) + " intents dispatched");
    logger_->flush();
  }
  return rep;
}

} // namespace qbook
