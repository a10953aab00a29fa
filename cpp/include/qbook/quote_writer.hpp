#pragma once
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

#include "qbook/orders.hpp"
#include "qbook/types.hpp"

namespace qbook {

// Dependency-free CSV writer for replay output.
// Quotes are sampled once per applied message; intents are written as dispatched.
class QuoteWriter {
public:
  QuoteWriter() = default;
  ~QuoteWriter() { close(); }
  QuoteWriter(const QuoteWriter&) = delete;
  QuoteWriter& operator=(const QuoteWriter&) = delete;

  // Open CSVs; writes headers. An empty intents path skips that file.
  // quotes columns:  seq,bid,ask,bid_sz,ask_sz,mid,spread,microprice
  // intents columns: cycle,kind,side,type,qty,price,order_id,client_id,reduce_only
  bool open(const std::string& quotes_csv, const std::string& intents_csv = {});

  // Close files if open (flushes).
  void close();

  bool is_open() const { return qf_ != nullptr; }

  void write_quote_row(SeqNo seq, const TopOfBook& tob);
  void write_intent_row(uint64_t cycle, const OrderIntent& in);

private:
  std::FILE* qf_ = nullptr;
  std::FILE* if_ = nullptr;

  // Monotonicity best-effort warning (we don't throw).
  std::optional<SeqNo> last_seq_;

  static void fprint_double(std::FILE* f, double v);
};

} // namespace qbook
