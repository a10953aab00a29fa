#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "candles.hpp"
#include "indicators.hpp"
#include "logging.hpp"
#include "orders.hpp"
#include "types.hpp"

namespace qbook {

enum class TradingSignal : uint8_t { None=0, Long=1, Short=2 };

const char* to_string(TradingSignal s);

struct StrategyParams {
  Quantity    order_size{0.001};
  Quantity    max_position_size{0.01};
  Quantity    position_buffer{0.0};           // tolerated excess before the safety valve fires
  int         max_open_entry_orders_per_side{1};
  double      reprice_threshold_pct{0.0002};  // relative deviation, 0.0002 = 2 bps
  std::size_t atr_period{10};
  double      supertrend_multiplier{3.0};
  double      spread{0.0005};                 // market maker, fraction of price
  std::string kline_interval{"15"};
  std::size_t kline_limit{500};
};

// -------- Strategy interface --------
// One instance per active configuration. The trading loop feeds it the candle
// window and top of book, then asks for intents once per cycle.
class IStrategy {
public:
  virtual ~IStrategy() = default;

  virtual const char* name() const = 0;
  virtual std::string kline_interval() const = 0;
  virtual std::size_t kline_limit() const = 0;

  virtual void initialize() {}
  virtual void on_candle_update(const CandleRing& ring) = 0;
  virtual void on_book_update(const TopOfBook& tob) = 0;

  virtual std::vector<OrderIntent> decide(const AccountState& acct) = 0;

  // Intents to run once before the process exits.
  virtual std::vector<OrderIntent> shutdown(const AccountState& acct) = 0;
};

// Shared plumbing for the built-in strategies: cycle-scoped client ids,
// entry-order bookkeeping and the position safety valve.
class StrategyBase : public IStrategy {
public:
  StrategyBase(StrategyParams params, PriceScale scale, std::string id_prefix);

  std::string kline_interval() const override { return params_.kline_interval; }
  std::size_t kline_limit() const override { return params_.kline_limit; }

  void on_book_update(const TopOfBook& tob) override { tob_ = tob; }

  // Cancels every outstanding entry order, in order id order.
  std::vector<OrderIntent> shutdown(const AccountState& acct) override;

  const StrategyParams& params() const { return params_; }
  uint64_t cycle() const { return cycle_; }

protected:
  // Advances the cycle counter; client ids restart at 1.
  void begin_cycle();
  // "<prefix>-<cycle>-<n>"
  std::string next_client_id();

  // Resting limit orders on one side, sorted by order id.
  static std::vector<const OrderRecord*> entry_orders(const AccountState& acct, Side side);
  static Quantity outstanding_qty(const std::vector<const OrderRecord*>& orders);

  bool deviates(double px, double target) const;
  bool under_order_cap(Quantity outstanding) const;

  // Places one reduce-only market order for |position| beyond max + buffer.
  // Returns true if it emitted something.
  bool position_safety_valve(const AccountState& acct, std::vector<OrderIntent>& out);

  StrategyParams params_;
  PriceScale     scale_;
  TopOfBook      tob_{};

private:
  std::string id_prefix_;
  uint64_t    cycle_{0};
  uint32_t    seq_in_cycle_{0};
};

// -------- Name -> constructor registry --------
using StrategyFactory =
    std::function<std::unique_ptr<IStrategy>(const StrategyParams&, const PriceScale&)>;

class StrategyRegistry {
public:
  // Registry preloaded with "supertrend" and "market_maker".
  static StrategyRegistry with_builtins();

  // False if the name is already taken.
  bool add(const std::string& name, StrategyFactory factory);

  // nullptr (and an error record) for unknown names.
  std::unique_ptr<IStrategy> create(const std::string& name, const StrategyParams& params,
                                    const PriceScale& scale,
                                    IEventLogger* logger = nullptr) const;

  bool contains(const std::string& name) const { return factories_.count(name) != 0; }
  std::vector<std::string> names() const;

private:
  std::map<std::string, StrategyFactory> factories_;
};

} // namespace qbook
