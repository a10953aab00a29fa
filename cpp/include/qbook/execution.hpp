#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "account.hpp"
#include "logging.hpp"
#include "orders.hpp"

namespace qbook {

// Outbound command surface. The venue adapter behind it owns transport,
// authentication and timeouts; implementations must tolerate a repeated
// client_order_id (deduplicate).
class IExecutionClient {
public:
  virtual ~IExecutionClient() = default;

  // Returns the venue order id, or nullopt on failure.
  virtual std::optional<std::string> place_order(Side side, Quantity qty,
                                                 std::optional<double> price,
                                                 OrderType type,
                                                 const std::optional<std::string>& client_order_id,
                                                 bool reduce_only) = 0;
  virtual bool cancel_order(const std::string& order_id) = 0;
  // Number of orders cancelled, negative on failure.
  virtual int  cancel_all_orders() = 0;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Blocking std::this_thread::sleep_for.
Sleeper default_sleeper();

struct RetryPolicy {
  int                       max_attempts{3};
  std::chrono::milliseconds base_delay{3000};   // attempt k waits k * base_delay
};

// -------- Bounded retry decorator --------
// Exhaustion is logged and reported as a failed command; it never throws.
class RetryingExecutionClient final : public IExecutionClient {
public:
  RetryingExecutionClient(IExecutionClient& inner, RetryPolicy policy,
                          IEventLogger* logger = nullptr, Sleeper sleeper = {});

  std::optional<std::string> place_order(Side side, Quantity qty,
                                         std::optional<double> price,
                                         OrderType type,
                                         const std::optional<std::string>& client_order_id,
                                         bool reduce_only) override;
  bool cancel_order(const std::string& order_id) override;
  int  cancel_all_orders() override;

  uint64_t attempts() const { return attempts_; }
  uint64_t failures() const { return failures_; }   // commands that exhausted retries

private:
  // Runs `attempt` until it reports success or the policy is exhausted.
  bool run(const std::string& what, const std::function<bool()>& attempt);

  IExecutionClient& inner_;
  RetryPolicy       policy_;
  IEventLogger*     logger_;
  Sleeper           sleep_;
  uint64_t          attempts_{0};
  uint64_t          failures_{0};
};

// -------- In-memory venue --------
// Accepts every command, assigns ids, reports order/position events to an
// AccountTracker. Market orders fill in full at the mark price; limit orders
// rest until cancelled. Nothing is ever matched against a book.
class PaperExecutionClient final : public IExecutionClient {
public:
  enum class CallKind : uint8_t { Place=0, Cancel=1, CancelAll=2 };

  struct Call {
    CallKind              kind{CallKind::Place};
    Side                  side{Side::Bid};
    OrderType             type{OrderType::Limit};
    Quantity              qty{0.0};
    std::optional<double> price;
    std::string           client_order_id;
    std::string           order_id;   // assigned id (Place) or target id (Cancel)
    bool                  reduce_only{false};
  };

  explicit PaperExecutionClient(AccountTracker* tracker = nullptr, std::string symbol = {});

  std::optional<std::string> place_order(Side side, Quantity qty,
                                         std::optional<double> price,
                                         OrderType type,
                                         const std::optional<std::string>& client_order_id,
                                         bool reduce_only) override;
  bool cancel_order(const std::string& order_id) override;
  int  cancel_all_orders() override;

  // Price used for market fills that carry no price.
  void set_mark_price(double px) { mark_px_ = px; }

  // Test hook: the next n commands fail.
  void fail_next(int n) { fail_next_ = n; }

  const std::vector<Call>& calls() const { return calls_; }
  Quantity position() const { return position_; }
  std::size_t open_orders() const { return open_.size(); }

private:
  bool consume_failure();
  void fill(const OrderRecord& o, double px);
  void report_order(const OrderRecord& o);

  AccountTracker* tracker_;
  std::string     symbol_;
  uint64_t        next_id_{1};
  int             fail_next_{0};
  Quantity        position_{0.0};
  double          mark_px_{0.0};

  std::vector<Call>                            calls_;
  std::map<std::string, OrderRecord>           open_;        // ordered for deterministic cancel-all
  std::unordered_map<std::string, std::string> by_client_;   // client id -> order id
};

} // namespace qbook
