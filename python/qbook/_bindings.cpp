// python/qbook/_bindings.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "qbook/book_engine.hpp"
#include "qbook/candles.hpp"
#include "qbook/indicators.hpp"
#include "qbook/price_levels.hpp"

namespace py = pybind11;
using namespace qbook;

// Owns both ladders so Python only sees one object.
struct PyBook {
  std::unique_ptr<IPriceLevels> bids;
  std::unique_ptr<IPriceLevels> asks;
  OrderBookEngine               core;

  PyBook(const std::string& store, double tick_size, bool resync_on_gap)
    : bids(make_price_levels(kind_of(store), Side::Bid)),
      asks(make_price_levels(kind_of(store), Side::Ask)),
      core(*bids, *asks, BookOptions{PriceScale{tick_size}, resync_on_gap}, /*logger*/ nullptr) {}

  static StoreKind kind_of(const std::string& s) {
    StoreKind k;
    if (!parse_store_kind(s, k)) throw py::value_error("store must be 'skip' or 'heap'");
    return k;
  }

  // Entries are [price, qty] pairs of strings or numbers.
  static std::optional<std::vector<RawEntry>> entries(const py::object& o) {
    if (o.is_none()) return std::nullopt;
    std::vector<RawEntry> out;
    for (const auto& row : o) {
      RawEntry e;
      for (const auto& f : row) e.push_back(py::str(f));
      out.push_back(std::move(e));
    }
    return out;
  }

  static BookMessage message(const py::object& b, const py::object& a, std::optional<SeqNo> seq) {
    BookMessage m;
    m.bids = entries(b);
    m.asks = entries(a);
    m.seq  = seq;
    return m;
  }

  ApplyResult snapshot(const py::object& b, const py::object& a, std::optional<SeqNo> seq) {
    return core.apply_snapshot(message(b, a, seq));
  }
  ApplyResult delta(const py::object& b, const py::object& a, std::optional<SeqNo> seq) {
    return core.apply_delta(message(b, a, seq));
  }

  // L1 snapshot as dict
  py::dict l1() const {
    const TopOfBook t = core.best_bid_ask();
    py::dict d;
    d["best_bid_px"]  = t.bid ? py::cast(*t.bid) : py::none();
    d["best_bid_qty"] = t.bid_qty;
    d["best_ask_px"]  = t.ask ? py::cast(*t.ask) : py::none();
    d["best_ask_qty"] = t.ask_qty;
    return d;
  }

  // L2 snapshot (top N levels per side), each as list of (px, qty) best first
  py::dict l2(int depth = 5) {
    const DepthView v = core.depth(depth > 0 ? static_cast<std::size_t>(depth) : 0);
    std::vector<std::pair<double, Quantity>> b, a;
    for (const auto& l : v.bids) b.emplace_back(l.price, l.qty);
    for (const auto& l : v.asks) a.emplace_back(l.price, l.qty);
    py::dict d;
    d["bids"] = b;
    d["asks"] = a;
    return d;
  }

  py::object last_seq() const {
    const auto s = core.last_sequence();
    return s ? py::cast(*s) : py::none();
  }
};

static std::vector<Candle> to_candles(const std::vector<double>& highs,
                                      const std::vector<double>& lows,
                                      const std::vector<double>& closes) {
  if (highs.size() != lows.size() || highs.size() != closes.size()) {
    throw py::value_error("highs, lows and closes must have the same length");
  }
  std::vector<Candle> out(closes.size());
  for (std::size_t i = 0; i < closes.size(); ++i) {
    out[i].open_time = static_cast<Timestamp>(i);
    out[i].high  = highs[i];
    out[i].low   = lows[i];
    out[i].close = closes[i];
    out[i].open  = closes[i];
  }
  return out;
}

PYBIND11_MODULE(_qbook, m) {
  // --- enums ---
  py::enum_<Side>(m, "Side")
      .value("Bid", Side::Bid)
      .value("Ask", Side::Ask);

  py::enum_<ApplyResult>(m, "ApplyResult")
      .value("Applied", ApplyResult::Applied)
      .value("Stale", ApplyResult::Stale)
      .value("Rejected", ApplyResult::Rejected)
      .value("Gap", ApplyResult::Gap);

  py::enum_<TrendDirection>(m, "TrendDirection")
      .value("Up", TrendDirection::Up)
      .value("Down", TrendDirection::Down);

  // --- data classes ---
  py::class_<BookStats>(m, "BookStats")
      .def_readonly("snapshots", &BookStats::snapshots)
      .def_readonly("deltas_applied", &BookStats::deltas_applied)
      .def_readonly("stale", &BookStats::stale)
      .def_readonly("rejected", &BookStats::rejected)
      .def_readonly("entries_skipped", &BookStats::entries_skipped)
      .def_readonly("gaps", &BookStats::gaps);

  py::class_<IndicatorState>(m, "IndicatorState")
      .def_readonly("atr", &IndicatorState::atr)
      .def_readonly("supertrend_line", &IndicatorState::supertrend_line)
      .def_readonly("direction", &IndicatorState::direction);

  // --- Book wrapper ---
  py::class_<PyBook>(m, "Book")
      .def(py::init<const std::string&, double, bool>(),
           py::arg("store") = "skip", py::arg("tick_size") = 0.01,
           py::arg("resync_on_gap") = false)
      .def("apply_snapshot", &PyBook::snapshot,
           py::arg("bids"), py::arg("asks"), py::arg("seq"))
      .def("apply_delta", &PyBook::delta,
           py::arg("bids") = py::none(), py::arg("asks") = py::none(), py::arg("seq") = py::none())
      .def("l1", &PyBook::l1)
      .def("l2", &PyBook::l2, py::arg("depth") = 5)
      .def("last_seq", &PyBook::last_seq)
      .def("imbalance", [](PyBook& b, std::size_t depth) { return b.core.imbalance(depth); },
           py::arg("depth") = 5)
      .def("microprice", [](PyBook& b, std::size_t depth) { return b.core.microprice(depth); },
           py::arg("depth") = 5)
      .def("validate", [](PyBook& b) { return b.core.validate(); })
      .def("awaiting_snapshot", [](const PyBook& b) { return b.core.awaiting_snapshot(); })
      .def("stats", [](const PyBook& b) { return b.core.stats(); });

  // --- indicators ---
  m.def("compute_atr", &compute_atr,
        py::arg("highs"), py::arg("lows"), py::arg("closes"), py::arg("period"));
  m.def("compute_supertrend",
        [](const std::vector<double>& h, const std::vector<double>& l,
           const std::vector<double>& c, std::size_t period, double mult) {
          const SupertrendSeries s = compute_supertrend(h, l, c, period, mult);
          return py::make_tuple(s.line, s.direction);
        },
        py::arg("highs"), py::arg("lows"), py::arg("closes"),
        py::arg("period"), py::arg("multiplier"),
        "Return (line, direction), aligned to bar index + period");
  m.def("indicator_state",
        [](const std::vector<double>& h, const std::vector<double>& l,
           const std::vector<double>& c, std::size_t period, double mult) {
          const auto bars = to_candles(h, l, c);
          CandleRing ring(bars.empty() ? 1 : bars.size());
          for (const auto& b : bars) ring.upsert(b);
          IndicatorEngine eng(period, mult);
          return eng.update(ring);
        },
        py::arg("highs"), py::arg("lows"), py::arg("closes"),
        py::arg("period") = 10, py::arg("multiplier") = 3.0,
        "Latest IndicatorState or None when the window is too short");
}
