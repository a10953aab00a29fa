#include "qbook/quote_writer.hpp"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <limits>

namespace qbook {

bool QuoteWriter::open(const std::string& quotes_csv, const std::string& intents_csv) {
  close();
  qf_ = std::fopen(quotes_csv.c_str(), "wb");
  if (!qf_) {
    std::fprintf(stderr, "QuoteWriter: failed to open quotes CSV '%s': %s\n",
                 quotes_csv.c_str(), std::strerror(errno));
    return false;
  }
  if (!intents_csv.empty()) {
    if_ = std::fopen(intents_csv.c_str(), "wb");
    if (!if_) {
      std::fprintf(stderr, "QuoteWriter: failed to open intents CSV '%s': %s\n",
                   intents_csv.c_str(), std::strerror(errno));
      std::fclose(qf_); qf_ = nullptr;
      return false;
    }
    std::fprintf(if_, "cycle,kind,side,type,qty,price,order_id,client_id,reduce_only\n");
  }
  std::fprintf(qf_, "seq,bid,ask,bid_sz,ask_sz,mid,spread,microprice\n");
  return true;
}

void QuoteWriter::close() {
  if (qf_) {
    std::fflush(qf_);
    std::fclose(qf_);
    qf_ = nullptr;
  }
  if (if_) {
    std::fflush(if_);
    std::fclose(if_);
    if_ = nullptr;
  }
  last_seq_.reset();
}

void QuoteWriter::fprint_double(std::FILE* f, double v) {
  if (std::isnan(v)) return;   // empty cell
  std::fprintf(f, "%.12g", v);
}

void QuoteWriter::write_quote_row(SeqNo seq, const TopOfBook& tob) {
  if (!qf_) return;

  if (last_seq_ && seq < *last_seq_) {
    std::fprintf(stderr, "WARN: Non-monotonic quote seq: %llu < %llu\n",
                 (unsigned long long)seq, (unsigned long long)*last_seq_);
  }
  last_seq_ = seq;

  const bool have_bid = tob.bid.has_value();
  const bool have_ask = tob.ask.has_value();

  double mid    = std::numeric_limits<double>::quiet_NaN();
  double spread = std::numeric_limits<double>::quiet_NaN();
  double micro  = std::numeric_limits<double>::quiet_NaN();

  if (have_bid && have_ask) {
    mid = 0.5 * (*tob.bid + *tob.ask);
    spread = *tob.ask - *tob.bid;
    const double denom = tob.bid_qty + tob.ask_qty;
    micro = (denom > 0.0) ? ((*tob.ask * tob.bid_qty + *tob.bid * tob.ask_qty) / denom) : mid;
  } else if (have_bid) {
    mid = *tob.bid;
  } else if (have_ask) {
    mid = *tob.ask;
  }

  std::fprintf(qf_, "%llu,", (unsigned long long)seq);

  if (have_bid) fprint_double(qf_, *tob.bid);
  std::fputc(',', qf_);
  if (have_ask) fprint_double(qf_, *tob.ask);
  std::fputc(',', qf_);
  if (have_bid) fprint_double(qf_, tob.bid_qty);
  std::fputc(',', qf_);
  if (have_ask) fprint_double(qf_, tob.ask_qty);
  std::fputc(',', qf_);

  fprint_double(qf_, mid);
  std::fputc(',', qf_);
  fprint_double(qf_, spread);
  std::fputc(',', qf_);
  fprint_double(qf_, micro);
  std::fputc('\n', qf_);
}

void QuoteWriter::write_intent_row(uint64_t cycle, const OrderIntent& in) {
  if (!if_) return;
  std::fprintf(if_, "%llu,%s,", (unsigned long long)cycle, to_string(in.kind));
  if (in.kind == IntentKind::Place) {
    std::fprintf(if_, "%s,%s,", to_string(in.side), to_string(in.order_type));
    fprint_double(if_, in.qty);
    std::fputc(',', if_);
    if (in.price) fprint_double(if_, *in.price);
  } else {
    std::fputs(",,,", if_);
  }
  std::fprintf(if_, ",%s,%s,%d\n", in.order_id.c_str(), in.client_order_id.c_str(),
               in.reduce_only ? 1 : 0);
}

} // namespace qbook
