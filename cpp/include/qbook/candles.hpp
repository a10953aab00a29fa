#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "types.hpp"

namespace qbook {

struct Candle {
  Timestamp open_time{0};
  double    open{0.0};
  double    high{0.0};
  double    low{0.0};
  double    close{0.0};
  double    volume{0.0};
  double    turnover{0.0};
};

enum class UpsertResult : uint8_t { Replaced=0, Appended=1, Rejected=2 };

// -------- Bounded, time-ordered candle window --------
// Fixed-capacity ring: the newest bar may be rewritten while it is still forming,
// a strictly newer bar is appended (evicting the oldest when full), older bars are refused.
class CandleRing {
public:
  explicit CandleRing(std::size_t capacity);

  UpsertResult upsert(const Candle& c);

  std::size_t size() const { return count_; }
  std::size_t capacity() const { return buf_.size(); }
  bool        empty() const { return count_ == 0; }
  void        clear() { head_ = 0; count_ = 0; }

  // i = 0 is the oldest held bar.
  const Candle& at(std::size_t i) const { return buf_[(head_ + i) % buf_.size()]; }
  std::optional<Candle> newest() const;

  // Column views in time order.
  std::vector<double> highs() const;
  std::vector<double> lows() const;
  std::vector<double> closes() const;

private:
  std::vector<Candle> buf_;
  std::size_t head_{0};   // slot of the oldest bar
  std::size_t count_{0};
};

} // namespace qbook
