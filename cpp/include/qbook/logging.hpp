#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include "types.hpp"

namespace qbook {

// Forward declarations to avoid header cycles
struct OrderIntent;
enum class ApplyResult : uint8_t;

enum class BookEvent : uint8_t { Snapshot=0, Delta=1 };
enum class LogLevel  : uint8_t { Debug=0, Info=1, Warn=2, Error=3 };

const char* to_string(BookEvent e);
const char* to_string(LogLevel l);

// ---------- Event logging interface ----------
// Every component takes an optional IEventLogger*; nullptr means "don't log".
class IEventLogger {
public:
  virtual ~IEventLogger() = default;

  // One record per snapshot/delta message, after the book finished mutating.
  virtual void log_book(BookEvent kind, SeqNo seq, ApplyResult result,
                        std::size_t applied, std::size_t skipped) = 0;

  // A single [price, qty] entry that failed parsing or validation.
  virtual void log_entry_skipped(Side side, const RawEntry& entry, const char* reason) = 0;

  virtual void log_intent(const OrderIntent& /*intent*/) {}

  // A command that still failed after the last retry.
  virtual void log_command_failure(const std::string& /*what*/, int /*attempts*/) {}

  virtual void log_message(LogLevel /*lvl*/, const std::string& /*text*/) {}

  virtual void flush() {}
};

// ---------- Concrete logger (one JSON object per line) ----------
class JsonlEventLogger final : public IEventLogger {
public:
  // base_path without extension, e.g. "logs/btcusdt" -> logs/btcusdt.jsonl
  explicit JsonlEventLogger(const std::string& base_path, LogLevel min_level = LogLevel::Info);

  const std::string& path() const { return jsonl_path_; }
  bool is_open() const { return jsonl_.is_open(); }
  uint64_t records() const { return records_; }

  void log_book(BookEvent kind, SeqNo seq, ApplyResult result,
                std::size_t applied, std::size_t skipped) override;
  void log_entry_skipped(Side side, const RawEntry& entry, const char* reason) override;
  void log_intent(const OrderIntent& intent) override;
  void log_command_failure(const std::string& what, int attempts) override;
  void log_message(LogLevel lvl, const std::string& text) override;
  void flush() override;

private:
  std::string   jsonl_path_;
  std::ofstream jsonl_;
  LogLevel      min_level_;
  uint64_t      records_{0};
};

// ---------- Diagnostics to stderr (used by the tools) ----------
class StderrEventLogger final : public IEventLogger {
public:
  explicit StderrEventLogger(LogLevel min_level = LogLevel::Warn) : min_level_(min_level) {}

  void log_book(BookEvent kind, SeqNo seq, ApplyResult result,
                std::size_t applied, std::size_t skipped) override;
  void log_entry_skipped(Side side, const RawEntry& entry, const char* reason) override;
  void log_command_failure(const std::string& what, int attempts) override;
  void log_message(LogLevel lvl, const std::string& text) override;

private:
  LogLevel min_level_;
};

// Minimal JSON string escaping for the journal.
std::string json_escape(const std::string& s);

} // namespace qbook
