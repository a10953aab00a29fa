#include "qbook/price_levels.hpp"
#include "qbook/heap_levels.hpp"
#include "qbook/skip_levels.hpp"
#include <cctype>
#include <stdexcept>

namespace qbook {

std::unique_ptr<IPriceLevels> make_price_levels(StoreKind kind, Side side, uint64_t seed) {
  switch (kind) {
    case StoreKind::Skip: {
      SkipOptions opt;
      opt.seed = seed;
      return std::make_unique<PriceLevelsSkip>(side, opt);
    }
    case StoreKind::Heap:
      return std::make_unique<PriceLevelsHeap>(side);
  }
  throw std::invalid_argument("unknown price level store kind");
}

bool parse_store_kind(const std::string& s, StoreKind& out) {
  std::string x;
  x.reserve(s.size());
  for (char c : s) x.push_back((char)std::tolower((unsigned char)c));
  if (x == "skip" || x == "skiplist" || x == "skip_list") { out = StoreKind::Skip; return true; }
  if (x == "heap")                                        { out = StoreKind::Heap; return true; }
  return false;
}

const char* to_string(StoreKind k) {
  return k == StoreKind::Skip ? "skip" : "heap";
}

} // namespace qbook
