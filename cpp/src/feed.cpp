#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "qbook/feed.hpp"

namespace qbook {

// -----------------------------
// CSV helpers (tiny & strict)
// -----------------------------
static inline std::string trim(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace((unsigned char)s[i])) ++i;
  while (j > i && std::isspace((unsigned char)s[j-1])) --j;
  return s.substr(i, j - i);
}

static std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    const size_t comma = line.find(',', start);
    if (comma == std::string::npos) { out.push_back(trim(line.substr(start))); break; }
    out.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  return out;
}

static std::string lower(const std::string& s) {
  std::string x; x.reserve(s.size());
  for (char c : s) x.push_back((char)std::tolower((unsigned char)c));
  return x;
}

static bool parse_kind(const std::string& k, BookEvent& out) {
  const std::string x = lower(k);
  if (x == "snapshot" || x == "snap") { out = BookEvent::Snapshot; return true; }
  if (x == "delta"    || x == "update") { out = BookEvent::Delta;  return true; }
  return false;
}

static bool parse_side(const std::string& s, Side& out) {
  const std::string x = lower(s);
  if (x == "b" || x == "bid" || x == "buy")  { out = Side::Bid; return true; }
  if (x == "a" || x == "ask" || x == "sell" || x == "s") { out = Side::Ask; return true; }
  return false;
}

static bool parse_u64(const std::string& s, uint64_t& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  out = std::strtoull(s.c_str(), &end, 10);
  return errno == 0 && *end == '\0';
}

static bool parse_num(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return *end == '\0';
}

bool load_book_csv(const std::string& path, std::vector<FeedMessage>& out) {
  out.clear();
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "Failed to open book CSV '%s': %s\n", path.c_str(), std::strerror(errno));
    return false;
  }

  std::string line;
  if (!std::getline(in, line)) {
    std::fprintf(stderr, "Empty CSV: %s\n", path.c_str());
    return false;
  }
  const auto header = split_fields(lower(line));
  if (header.size() < 5 || header[0] != "seq" || header[1] != "kind" ||
      header[2] != "side" || header[3] != "price" || header[4] != "qty") {
    std::fprintf(stderr, "Unexpected CSV header for '%s'. Expected: seq,kind,side,price,qty\n",
                 path.c_str());
    return false;
  }

  int lineno = 1;
  while (std::getline(in, line)) {
    ++lineno;
    if (trim(line).empty()) continue;
    const auto f = split_fields(line);
    if (f.size() < 2) {
      std::fprintf(stderr, "%s:%d: expected seq,kind,side,price,qty\n", path.c_str(), lineno);
      return false;
    }

    uint64_t seq = 0;
    BookEvent kind = BookEvent::Delta;
    if (!parse_u64(f[0], seq)) {
      std::fprintf(stderr, "%s:%d: bad seq '%s'\n", path.c_str(), lineno, f[0].c_str());
      return false;
    }
    if (!parse_kind(f[1], kind)) {
      std::fprintf(stderr, "%s:%d: bad kind '%s'\n", path.c_str(), lineno, f[1].c_str());
      return false;
    }

    const bool same = !out.empty() && out.back().kind == kind &&
                      out.back().msg.seq && *out.back().msg.seq == seq;
    if (!same) {
      FeedMessage m;
      m.kind = kind;
      m.msg.seq = seq;
      if (kind == BookEvent::Snapshot) {
        m.msg.bids.emplace();
        m.msg.asks.emplace();
      }
      out.push_back(std::move(m));
    }

    const std::string side_s = f.size() > 2 ? f[2] : std::string();
    if (side_s.empty()) continue;
    Side side = Side::Bid;
    if (!parse_side(side_s, side)) {
      std::fprintf(stderr, "%s:%d: bad side '%s'\n", path.c_str(), lineno, side_s.c_str());
      return false;
    }
    RawEntry e;
    e.push_back(f.size() > 3 ? f[3] : std::string());
    e.push_back(f.size() > 4 ? f[4] : std::string());

    auto& slot = side == Side::Bid ? out.back().msg.bids : out.back().msg.asks;
    if (!slot) slot.emplace();
    slot->push_back(std::move(e));
  }
  return true;
}

bool load_candles_csv(const std::string& path, std::vector<Candle>& out) {
  out.clear();
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "Failed to open candle CSV '%s': %s\n", path.c_str(), std::strerror(errno));
    return false;
  }

  std::string line;
  if (!std::getline(in, line)) {
    std::fprintf(stderr, "Empty CSV: %s\n", path.c_str());
    return false;
  }
  if (lower(line).find("open_time") == std::string::npos) {
    std::fprintf(stderr, "Unexpected CSV header for '%s'. Expected: "
                 "open_time,open,high,low,close,volume,turnover\n", path.c_str());
    return false;
  }

  int lineno = 1;
  while (std::getline(in, line)) {
    ++lineno;
    if (trim(line).empty()) continue;
    const auto f = split_fields(line);
    Candle c;
    uint64_t t = 0;
    bool ok = f.size() >= 5 && parse_u64(f[0], t) &&
              parse_num(f[1], c.open) && parse_num(f[2], c.high) &&
              parse_num(f[3], c.low)  && parse_num(f[4], c.close);
    if (ok && f.size() > 5) ok = parse_num(f[5], c.volume);
    if (ok && f.size() > 6) ok = parse_num(f[6], c.turnover);
    if (!ok) {
      std::fprintf(stderr, "%s:%d: bad candle row\n", path.c_str(), lineno);
      return false;
    }
    c.open_time = static_cast<Timestamp>(t);
    out.push_back(c);
  }
  return true;
}

} // namespace qbook
