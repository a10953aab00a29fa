#include "qbook/logging.hpp"
#include "qbook/book_engine.hpp" // for ApplyResult definition
#include "qbook/orders.hpp"      // for OrderIntent definition
#include <cstdio>
#include <filesystem>

namespace qbook {

const char* to_string(BookEvent e) {
  return e == BookEvent::Snapshot ? "snapshot" : "delta";
}

const char* to_string(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

static std::string entry_to_json(const RawEntry& entry) {
  std::string out = "[";
  for (std::size_t i = 0; i < entry.size(); ++i) {
    if (i) out += ',';
    out += '"';
    out += json_escape(entry[i]);
    out += '"';
  }
  out += ']';
  return out;
}

// ---- JsonlEventLogger ----
JsonlEventLogger::JsonlEventLogger(const std::string& base_path, LogLevel min_level)
  : jsonl_path_(base_path + ".jsonl"), min_level_(min_level) {
  const std::filesystem::path parent = std::filesystem::path(jsonl_path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  jsonl_.open(jsonl_path_, std::ios::out | std::ios::trunc);
  if (!jsonl_) {
    std::fprintf(stderr, "[qbook] cannot open event log %s\n", jsonl_path_.c_str());
  }
}

void JsonlEventLogger::log_book(BookEvent kind, SeqNo seq, ApplyResult result,
                                std::size_t applied, std::size_t skipped) {
  if (!jsonl_) return;
  // stale deltas are routine; keep them out of an info-level journal
  if (result == ApplyResult::Stale && min_level_ > LogLevel::Debug) return;
  jsonl_ << "{\"type\":\"book\",\"event\":\"" << to_string(kind) << "\""
         << ",\"seq\":" << seq
         << ",\"result\":\"" << to_string(result) << "\""
         << ",\"applied\":" << applied
         << ",\"skipped\":" << skipped << "}\n";
  ++records_;
}

void JsonlEventLogger::log_entry_skipped(Side side, const RawEntry& entry, const char* reason) {
  if (!jsonl_ || min_level_ > LogLevel::Warn) return;
  jsonl_ << "{\"type\":\"skip\",\"side\":\"" << to_string(side) << "\""
         << ",\"entry\":" << entry_to_json(entry)
         << ",\"reason\":\"" << json_escape(reason ? reason : "") << "\"}\n";
  ++records_;
}

void JsonlEventLogger::log_intent(const OrderIntent& in) {
  if (!jsonl_ || min_level_ > LogLevel::Info) return;
  jsonl_ << "{\"type\":\"intent\",\"kind\":\"" << to_string(in.kind) << "\"";
  if (in.kind == IntentKind::Place) {
    jsonl_ << ",\"side\":\"" << to_string(in.side) << "\""
           << ",\"order_type\":\"" << to_string(in.order_type) << "\""
           << ",\"qty\":" << in.qty;
    if (in.price) jsonl_ << ",\"px\":" << *in.price;
    jsonl_ << ",\"reduce_only\":" << (in.reduce_only ? "true" : "false")
           << ",\"client_id\":\"" << json_escape(in.client_order_id) << "\"";
  } else if (in.kind == IntentKind::Cancel) {
    jsonl_ << ",\"id\":\"" << json_escape(in.order_id) << "\"";
  }
  jsonl_ << "}\n";
  ++records_;
}

void JsonlEventLogger::log_command_failure(const std::string& what, int attempts) {
  if (!jsonl_) return;
  jsonl_ << "{\"type\":\"command_failure\",\"what\":\"" << json_escape(what) << "\""
         << ",\"attempts\":" << attempts << "}\n";
  ++records_;
}

void JsonlEventLogger::log_message(LogLevel lvl, const std::string& text) {
  if (!jsonl_ || lvl < min_level_) return;
  jsonl_ << "{\"type\":\"msg\",\"level\":\"" << to_string(lvl) << "\""
         << ",\"text\":\"" << json_escape(text) << "\"}\n";
  ++records_;
}

void JsonlEventLogger::flush() {
  if (jsonl_) jsonl_.flush();
}

// ---- StderrEventLogger ----
void StderrEventLogger::log_book(BookEvent kind, SeqNo seq, ApplyResult result,
                                 std::size_t applied, std::size_t skipped) {
  const bool bad = result == ApplyResult::Rejected || result == ApplyResult::Gap;
  if (!bad && min_level_ > LogLevel::Debug) return;
  std::fprintf(stderr, "[qbook] %s seq=%llu %s (applied=%zu skipped=%zu)\n",
               to_string(kind), static_cast<unsigned long long>(seq), to_string(result),
               applied, skipped);
}

void StderrEventLogger::log_entry_skipped(Side side, const RawEntry& entry, const char* reason) {
  if (min_level_ > LogLevel::Warn) return;
  std::fprintf(stderr, "[qbook] skipped %s entry %s: %s\n",
               to_string(side), entry_to_json(entry).c_str(), reason ? reason : "");
}

void StderrEventLogger::log_command_failure(const std::string& what, int attempts) {
  std::fprintf(stderr, "[qbook] %s failed after %d attempt(s)\n", what.c_str(), attempts);
}

void StderrEventLogger::log_message(LogLevel lvl, const std::string& text) {
  if (lvl < min_level_) return;
  std::fprintf(stderr, "[qbook] %s: %s\n", to_string(lvl), text.c_str());
}

} // namespace qbook
