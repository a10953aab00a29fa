#include "qbook/candles.hpp"
#include <stdexcept>

namespace qbook {

CandleRing::CandleRing(std::size_t capacity) {
  if (capacity == 0) throw std::invalid_argument("CandleRing: capacity must be > 0");
  buf_.resize(capacity);
}

UpsertResult CandleRing::upsert(const Candle& c) {
  if (count_ > 0) {
    const std::size_t last = (head_ + count_ - 1) % buf_.size();
    if (c.open_time == buf_[last].open_time) {
      buf_[last] = c;   // still forming
      return UpsertResult::Replaced;
    }
    if (c.open_time < buf_[last].open_time) return UpsertResult::Rejected;
  }

  if (count_ < buf_.size()) {
    buf_[(head_ + count_) % buf_.size()] = c;
    ++count_;
  } else {
    buf_[head_] = c;    // overwrite the oldest
    head_ = (head_ + 1) % buf_.size();
  }
  return UpsertResult::Appended;
}

std::optional<Candle> CandleRing::newest() const {
  if (count_ == 0) return std::nullopt;
  return at(count_ - 1);
}

std::vector<double> CandleRing::highs() const {
  std::vector<double> out;
  out.reserve(count_);
  for (std::size_t i = 0; i < count_; ++i) out.push_back(at(i).high);
  return out;
}

std::vector<double> CandleRing::lows() const {
  std::vector<double> out;
  out.reserve(count_);
  for (std::size_t i = 0; i < count_; ++i) out.push_back(at(i).low);
  return out;
}

std::vector<double> CandleRing::closes() const {
  std::vector<double> out;
  out.reserve(count_);
  for (std::size_t i = 0; i < count_; ++i) out.push_back(at(i).close);
  return out;
}

} // namespace qbook
