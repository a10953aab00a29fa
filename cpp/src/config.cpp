#include "qbook/config.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace qbook {

static std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

static bool to_double(const std::string& v, double& out) {
  if (v.empty()) return false;
  char* end = nullptr;
  errno = 0;
  out = std::strtod(v.c_str(), &end);
  return errno == 0 && *end == '\0' && std::isfinite(out);
}

static bool to_long(const std::string& v, long& out) {
  if (v.empty()) return false;
  char* end = nullptr;
  errno = 0;
  out = std::strtol(v.c_str(), &end, 10);
  return errno == 0 && *end == '\0';
}

static bool to_size(const std::string& v, std::size_t& out) {
  long x = 0;
  if (!to_long(v, x) || x < 0) return false;
  out = static_cast<std::size_t>(x);
  return true;
}

static bool to_int(const std::string& v, int& out) {
  long x = 0;
  if (!to_long(v, x) || x > INT_MAX || x < INT_MIN) return false;
  out = static_cast<int>(x);
  return true;
}

static bool to_bool(const std::string& v, bool& out) {
  if (v == "1" || v == "true"  || v == "yes" || v == "on")  { out = true;  return true; }
  if (v == "0" || v == "false" || v == "no"  || v == "off") { out = false; return true; }
  return false;
}

bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value,
                        std::string* error) {
  auto fail = [&](const char* what) {
    if (error) *error = std::string(what) + " for '" + key + "': '" + value + "'";
    return false;
  };
  StrategyParams& p = cfg.params;

  if (key == "symbol")          { if (value.empty()) return fail("empty value"); cfg.symbol = value; return true; }
  if (key == "store")           return parse_store_kind(value, cfg.store) ? true : fail("unknown store kind");
  if (key == "tick_size")       return to_double(value, cfg.tick_size) ? true : fail("bad number");
  if (key == "candle_capacity") return to_size(value, cfg.candle_capacity) ? true : fail("bad count");
  if (key == "resync_on_gap")   return to_bool(value, cfg.resync_on_gap) ? true : fail("bad boolean");
  if (key == "strategy")        { if (value.empty()) return fail("empty value"); cfg.strategy = value; return true; }
  if (key == "log_path")        { cfg.log_path = value; return true; }

  if (key == "loop_interval_ms")    return to_long(value, cfg.loop_interval_ms) ? true : fail("bad integer");
  if (key == "settle_delay_ms")     return to_long(value, cfg.settle_delay_ms) ? true : fail("bad integer");
  if (key == "retry_attempts")      return to_int(value, cfg.retry_attempts) ? true : fail("bad integer");
  if (key == "retry_base_delay_ms") return to_long(value, cfg.retry_base_delay_ms) ? true : fail("bad integer");

  if (key == "order_size")            return to_double(value, p.order_size) ? true : fail("bad number");
  if (key == "max_position_size")     return to_double(value, p.max_position_size) ? true : fail("bad number");
  if (key == "position_buffer")       return to_double(value, p.position_buffer) ? true : fail("bad number");
  if (key == "max_open_entry_orders_per_side")
    return to_int(value, p.max_open_entry_orders_per_side) ? true : fail("bad integer");
  if (key == "reprice_threshold_pct") return to_double(value, p.reprice_threshold_pct) ? true : fail("bad number");
  if (key == "atr_period")            return to_size(value, p.atr_period) ? true : fail("bad count");
  if (key == "supertrend_multiplier") return to_double(value, p.supertrend_multiplier) ? true : fail("bad number");
  if (key == "spread")                return to_double(value, p.spread) ? true : fail("bad number");
  if (key == "kline_interval")        { if (value.empty()) return fail("empty value"); p.kline_interval = value; return true; }
  if (key == "kline_limit")           return to_size(value, p.kline_limit) ? true : fail("bad count");

  if (error) *error = "unknown key '" + key + "'";
  return false;
}

bool validate_config(const EngineConfig& cfg, std::string* error) {
  auto fail = [&](const char* what) {
    if (error) *error = what;
    return false;
  };
  const StrategyParams& p = cfg.params;
  if (!(cfg.tick_size > 0.0))                  return fail("tick_size must be > 0");
  if (cfg.candle_capacity == 0)                return fail("candle_capacity must be > 0");
  if (!(p.order_size > 0.0))                   return fail("order_size must be > 0");
  if (!(p.max_position_size > 0.0))            return fail("max_position_size must be > 0");
  if (p.position_buffer < 0.0)                 return fail("position_buffer must be >= 0");
  if (p.max_open_entry_orders_per_side < 1)    return fail("max_open_entry_orders_per_side must be >= 1");
  if (p.reprice_threshold_pct < 0.0)           return fail("reprice_threshold_pct must be >= 0");
  if (p.atr_period == 0)                       return fail("atr_period must be > 0");
  if (!(p.supertrend_multiplier > 0.0))        return fail("supertrend_multiplier must be > 0");
  if (!(p.spread > 0.0 && p.spread < 1.0))     return fail("spread must be in (0, 1)");
  if (cfg.candle_capacity < p.atr_period + 1)  return fail("candle_capacity must exceed atr_period");
  if (cfg.loop_interval_ms <= 0)               return fail("loop_interval_ms must be > 0");
  if (cfg.settle_delay_ms < 0)                 return fail("settle_delay_ms must be >= 0");
  if (cfg.retry_attempts < 1)                  return fail("retry_attempts must be >= 1");
  if (cfg.retry_base_delay_ms < 0)             return fail("retry_base_delay_ms must be >= 0");
  return true;
}

bool load_config_file(const std::string& path, EngineConfig& cfg) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "[qbook] cannot open config %s\n", path.c_str());
    return false;
  }
  bool ok = true;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      std::fprintf(stderr, "[qbook] %s:%d: expected key = value\n", path.c_str(), lineno);
      ok = false;
      continue;
    }
    const std::string key = trim(line.substr(0, eq));
    const std::string val = trim(line.substr(eq + 1));
    std::string err;
    if (!apply_config_value(cfg, key, val, &err)) {
      std::fprintf(stderr, "[qbook] %s:%d: %s\n", path.c_str(), lineno, err.c_str());
      ok = false;
    }
  }
  if (ok) {
    std::string err;
    if (!validate_config(cfg, &err)) {
      std::fprintf(stderr, "[qbook] %s: %s\n", path.c_str(), err.c_str());
      ok = false;
    }
  }
  return ok;
}

LoopOptions loop_options(const EngineConfig& cfg) {
  LoopOptions o;
  o.interval           = std::chrono::milliseconds(cfg.loop_interval_ms);
  o.settle_delay       = std::chrono::milliseconds(cfg.settle_delay_ms);
  o.bootstrap_attempts = cfg.retry_attempts;
  o.bootstrap_delay    = std::chrono::milliseconds(cfg.retry_base_delay_ms);
  return o;
}

RetryPolicy retry_policy(const EngineConfig& cfg) {
  RetryPolicy r;
  r.max_attempts = cfg.retry_attempts;
  r.base_delay   = std::chrono::milliseconds(cfg.retry_base_delay_ms);
  return r;
}

} // namespace qbook
