#pragma once
#include <cstddef>
#include <string>
#include "price_levels.hpp"
#include "strategy.hpp"
#include "trading_loop.hpp"

namespace qbook {

// Everything one instrument's engine needs. Defaults match a 15m BTCUSDT setup.
struct EngineConfig {
  std::string    symbol{"BTCUSDT"};
  StoreKind      store{StoreKind::Skip};
  double         tick_size{0.01};
  std::size_t    candle_capacity{500};
  bool           resync_on_gap{false};
  std::string    strategy{"supertrend"};
  StrategyParams params{};

  long loop_interval_ms{5000};
  long settle_delay_ms{500};
  int  retry_attempts{3};
  long retry_base_delay_ms{3000};
  std::string log_path;      // base path for the JSONL journal, empty = off
};

// key = value per line, '#' starts a comment. Keys are the field names above
// (strategy parameters without a prefix, e.g. "order_size").
// Unknown keys and unparsable values are reported on stderr and fail the load;
// cfg may then be partially updated.
bool load_config_file(const std::string& path, EngineConfig& cfg);

// Applies a single key/value pair; same keys as the file format.
bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value,
                        std::string* error = nullptr);

// Range checks that the parser cannot express (e.g. tick_size > 0).
bool validate_config(const EngineConfig& cfg, std::string* error = nullptr);

LoopOptions loop_options(const EngineConfig& cfg);
RetryPolicy retry_policy(const EngineConfig& cfg);

} // namespace qbook
