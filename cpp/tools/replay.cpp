// cpp/tools/replay.cpp
#include "qbook/account.hpp"
#include "qbook/book_engine.hpp"
#include "qbook/candles.hpp"
#include "qbook/config.hpp"
#include "qbook/execution.hpp"
#include "qbook/feed.hpp"
#include "qbook/logging.hpp"
#include "qbook/price_levels.hpp"
#include "qbook/quote_writer.hpp"
#include "qbook/strategy.hpp"
#include "qbook/trading_loop.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace qbook;

struct Args {
  std::string book_file;       // seq,kind,side,price,qty
  std::string candles_file;    // open_time,open,high,low,close,volume,turnover
  std::string config_file;
  std::string quotes_out;      // top of book per applied message
  std::string intents_out;     // every dispatched intent
  int         cycle_every = 1; // decision cycle every N book messages
  double      balance = 10000.0;
  bool        verbose = false;
  std::vector<std::pair<std::string, std::string>> overrides;   // --set key=value and shortcuts
};

static std::optional<Args> parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string k = argv[i];
    auto need = [&](const char* opt) -> std::string {
      if (i + 1 >= argc) { std::cerr << "Missing value after " << opt << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (k == "--book") a.book_file = need("--book");
    else if (k == "--candles") a.candles_file = need("--candles");
    else if (k == "--config") a.config_file = need("--config");
    else if (k == "--quotes-out") a.quotes_out = need("--quotes-out");
    else if (k == "--intents-out") a.intents_out = need("--intents-out");
    else if (k == "--cycle-every") a.cycle_every = std::atoi(need("--cycle-every").c_str());
    else if (k == "--balance") a.balance = std::atof(need("--balance").c_str());
    else if (k == "--strategy") a.overrides.emplace_back("strategy", need("--strategy"));
    else if (k == "--store") a.overrides.emplace_back("store", need("--store"));
    else if (k == "--tick-size") a.overrides.emplace_back("tick_size", need("--tick-size"));
    else if (k == "--log") a.overrides.emplace_back("log_path", need("--log"));
    else if (k == "--resync-on-gap") a.overrides.emplace_back("resync_on_gap", "true");
    else if (k == "--verbose" || k == "-v") a.verbose = true;
    else if (k == "--set") {
      const std::string kv = need("--set");
      const auto eq = kv.find('=');
      if (eq == std::string::npos) { std::cerr << "--set expects key=value\n"; std::exit(2); }
      a.overrides.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
    } else if (k == "--help" || k == "-h") {
      std::cout <<
R"(Usage: qbook_replay --book BOOK.csv
                    [--candles CANDLES.csv]
                    [--config ENGINE.conf] [--set key=value ...]
                    [--strategy supertrend|market_maker] [--store skip|heap]
                    [--tick-size X] [--resync-on-gap] [--log BASE]
                    [--quotes-out QUOTES.csv] [--intents-out INTENTS.csv]
                    [--cycle-every N] [--balance X] [--verbose]
)";
      std::exit(0);
    } else {
      std::cerr << "Unknown option: " << k << "\n"; std::exit(2);
    }
  }
  if (a.book_file.empty()) { std::cerr << "Required: --book <book.csv>\n"; return std::nullopt; }
  if (a.cycle_every < 1) { std::cerr << "--cycle-every must be >= 1\n"; return std::nullopt; }
  return a;
}

static void ensure_parent(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
}

// Forwards everything to the journal (if any) and dispatched intents to the CSV.
class ReplayLogger final : public IEventLogger {
public:
  ReplayLogger(IEventLogger& diag, IEventLogger* journal, QuoteWriter& out)
    : diag_(diag), journal_(journal), out_(out) {}

  void set_cycle(uint64_t c) { cycle_ = c; }

  void log_book(BookEvent kind, SeqNo seq, ApplyResult result,
                std::size_t applied, std::size_t skipped) override {
    diag_.log_book(kind, seq, result, applied, skipped);
    if (journal_) journal_->log_book(kind, seq, result, applied, skipped);
  }
  void log_entry_skipped(Side side, const RawEntry& entry, const char* reason) override {
    diag_.log_entry_skipped(side, entry, reason);
    if (journal_) journal_->log_entry_skipped(side, entry, reason);
  }
  void log_intent(const OrderIntent& in) override {
    out_.write_intent_row(cycle_, in);
    if (journal_) journal_->log_intent(in);
  }
  void log_command_failure(const std::string& what, int attempts) override {
    diag_.log_command_failure(what, attempts);
    if (journal_) journal_->log_command_failure(what, attempts);
  }
  void log_message(LogLevel lvl, const std::string& text) override {
    diag_.log_message(lvl, text);
    if (journal_) journal_->log_message(lvl, text);
  }
  void flush() override {
    if (journal_) journal_->flush();
  }

private:
  IEventLogger& diag_;
  IEventLogger* journal_;
  QuoteWriter&  out_;
  uint64_t      cycle_{0};
};

int main(int argc, char** argv) {
  auto maybe = parse_args(argc, argv);
  if (!maybe) return 2;
  const Args a = *maybe;

  // ---- config: defaults <- file <- command line ----
  EngineConfig cfg;
  if (!a.config_file.empty() && !load_config_file(a.config_file, cfg)) return 2;
  for (const auto& kv : a.overrides) {
    std::string err;
    if (!apply_config_value(cfg, kv.first, kv.second, &err)) {
      std::cerr << "[replay] " << err << "\n";
      return 2;
    }
  }
  {
    std::string err;
    if (!validate_config(cfg, &err)) { std::cerr << "[replay] " << err << "\n"; return 2; }
  }

  // ---- inputs ----
  std::vector<FeedMessage> feed;
  if (!load_book_csv(a.book_file, feed)) return 1;
  std::vector<Candle> bars;
  if (!a.candles_file.empty() && !load_candles_csv(a.candles_file, bars)) return 1;

  // ---- outputs ----
  QuoteWriter out;
  if (!a.quotes_out.empty()) {
    ensure_parent(a.quotes_out);
    if (!a.intents_out.empty()) ensure_parent(a.intents_out);
    if (!out.open(a.quotes_out, a.intents_out)) return 1;
  } else if (!a.intents_out.empty()) {
    std::cerr << "[replay] --intents-out needs --quotes-out\n";
    return 2;
  }

  StderrEventLogger diag(a.verbose ? LogLevel::Debug : LogLevel::Warn);
  std::unique_ptr<JsonlEventLogger> journal;
  if (!cfg.log_path.empty()) journal = std::make_unique<JsonlEventLogger>(cfg.log_path);
  ReplayLogger logger(diag, journal.get(), out);

  // ---- engine ----
  BookOptions bopt;
  bopt.scale.tick_size = cfg.tick_size;
  bopt.resync_on_gap   = cfg.resync_on_gap;
  auto bids = make_price_levels(cfg.store, Side::Bid);
  auto asks = make_price_levels(cfg.store, Side::Ask);
  OrderBookEngine book(*bids, *asks, bopt, &logger);

  CandleRing candles(cfg.candle_capacity);
  for (const auto& c : bars) candles.upsert(c);

  auto strategy = StrategyRegistry::with_builtins().create(cfg.strategy, cfg.params, bopt.scale, &logger);
  if (!strategy) return 2;

  AccountTracker account(cfg.symbol);
  PaperExecutionClient paper(&account, cfg.symbol);
  auto no_wait = [](std::chrono::milliseconds) {};
  RetryingExecutionClient exec(paper, retry_policy(cfg), &logger, no_wait);

  LoopOptions lopt = loop_options(cfg);
  lopt.settle_delay = std::chrono::milliseconds(0);
  TradingLoop loop(book, candles, account, *strategy, exec, lopt, &logger, no_wait);

  try {
    loop.bootstrap([&]() -> std::optional<AccountState> {
      AccountState s;
      s.wallet_balance = a.balance;
      return s;
    });
  } catch (const BootstrapError& e) {
    std::cerr << "[replay] " << e.what() << "\n";
    return 1;
  }

  // ---- replay ----
  std::size_t n_msgs = 0;
  for (const auto& fm : feed) {
    const ApplyResult r = fm.kind == BookEvent::Snapshot ? book.apply_snapshot(fm.msg)
                                                         : book.apply_delta(fm.msg);
    ++n_msgs;
    if (r != ApplyResult::Applied) continue;

    const TopOfBook tob = book.best_bid_ask();
    out.write_quote_row(*fm.msg.seq, tob);

    if (n_msgs % static_cast<std::size_t>(a.cycle_every) == 0) {
      logger.set_cycle(loop.cycles() + 1);
      loop.run_cycle();
    }
  }

  logger.set_cycle(loop.cycles() + 1);
  loop.shutdown();
  logger.flush();
  out.close();

  const BookStats st = book.stats();
  const AccountState acct = account.snapshot();
  std::cerr << "[replay] done. msgs=" << n_msgs
            << " snapshots=" << st.snapshots << " deltas=" << st.deltas_applied
            << " stale=" << st.stale << " rejected=" << st.rejected
            << " gaps=" << st.gaps << " skipped_entries=" << st.entries_skipped << "\n";
  std::cerr << "[replay] strategy=" << strategy->name() << " cycles=" << loop.cycles()
            << " failed_commands=" << loop.failed_commands()
            << " position=" << acct.position_size
            << " open_orders=" << acct.active_orders.size() << "\n";
  if (const auto seq = book.last_sequence()) {
    std::cerr << "[replay] last_seq=" << *seq << "\n";
  }
  const auto micro = book.microprice();
  std::cerr << "[replay] imbalance(5)=" << book.imbalance()
            << " microprice(5)=" << (micro ? std::to_string(*micro) : std::string("n/a"))
            << " valid=" << (book.validate() ? "yes" : "no") << "\n";
  return 0;
}
