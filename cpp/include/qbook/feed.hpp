#pragma once

#include <string>
#include <vector>

#include "qbook/candles.hpp"
#include "qbook/logging.hpp"
#include "qbook/types.hpp"

namespace qbook {

// One recorded market-data message.
struct FeedMessage {
  BookEvent   kind{BookEvent::Delta};
  BookMessage msg;
};

// Recorded book feed. Expected header and columns (in this order):
// seq,kind,side,price,qty
// - seq:   uint64, rows sharing (seq, kind) with the previous row form one message
// - kind:  "snapshot" | "delta" (case-insensitive)
// - side:  "b"/"bid"/"buy" | "a"/"ask"/"sell"; empty = message without entries
// - price, qty: kept verbatim, the engine validates them
// A snapshot always carries both sides (possibly empty); a delta only the sides
// that appear in its rows.
bool load_book_csv(const std::string& path, std::vector<FeedMessage>& out);

// Candle history, time ascending:
// open_time,open,high,low,close,volume,turnover
bool load_candles_csv(const std::string& path, std::vector<Candle>& out);

} // namespace qbook
