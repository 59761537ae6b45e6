#include "vs/screener/screener.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <exception>
#include <future>
#include <unordered_set>

namespace {

using vs::screener::Reason;
using vs::screener::ScreenerRow;
using vs::screener::TickerOutcome;

struct Slot {
  TickerOutcome outcome;
  ScreenerRow   row;
};

// Évalue tickers[begin, end) dans slots[begin, end).
void run_range(const std::vector<std::string>& tickers,
               std::size_t begin, std::size_t end,
               const vs::io::TickerSeriesSource& source,
               const vs::config::ScreenerConfig& cfg,
               const std::atomic<bool>* abort,
               std::vector<Slot>& slots)
{
  for (std::size_t i = begin; i < end; ++i) {
    if (abort && abort->load(std::memory_order_relaxed)) {
      slots[i].outcome = TickerOutcome{tickers[i], Reason::Aborted, "arrêt demandé"};
      continue;
    }
    slots[i].outcome = vs::screener::evaluate_ticker(tickers[i], source, cfg, &slots[i].row);
  }
}

} // namespace

namespace vs::screener {

std::size_t ScreenerReport::count(Reason r) const noexcept {
  return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                  [r](const TickerOutcome& o){ return o.reason == r; }));
}

TickerOutcome evaluate_ticker(const std::string& ticker,
                              const vs::io::TickerSeriesSource& source,
                              const vs::config::ScreenerConfig& cfg,
                              ScreenerRow* row)
{
  TickerOutcome out;
  out.ticker = ticker;
  try {
    auto fr = source.fetch(ticker);
    if (fr.status == vs::io::FetchStatus::NotFound) {
      out.reason = Reason::NotFound; out.message = fr.message; return out;
    }
    if (fr.status != vs::io::FetchStatus::Ok) {
      out.reason = Reason::LoadFailed; out.message = fr.message; return out;
    }

    const auto mr = compute_metrics(fr.series, cfg);
    if (!mr.eligible()) {
      out.reason = mr.reason; return out;
    }
    if (row) {
      row->ticker      = ticker;
      row->current_iv  = mr.metrics->current_iv;
      row->iv_rank     = mr.metrics->iv_rank;
      row->iv_hv_ratio = mr.metrics->iv_hv_ratio;
    }
    out.reason = Reason::None;
  } catch (const std::exception& e) {
    out.reason  = Reason::LoadFailed;
    out.message = e.what();
  } catch (...) {
    // exception hors std::exception (source tierce) : même traitement
    out.reason  = Reason::LoadFailed;
    out.message = "exception inconnue";
  }
  return out;
}

ScreenerReport build_screener(const std::vector<std::string>& requested,
                              const vs::io::TickerSeriesSource& source,
                              const vs::config::ScreenerConfig& cfg,
                              const std::atomic<bool>* abort)
{
  // doublons : première occurrence seulement
  std::vector<std::string> tickers;
  tickers.reserve(requested.size());
  std::unordered_set<std::string> seen;
  for (const auto& t : requested) {
    if (seen.insert(t).second) tickers.push_back(t);
  }

  const std::size_t n = tickers.size();
  std::vector<Slot> slots(n);

  const std::size_t nThreads = std::max<std::size_t>(1, std::min(cfg.n_threads, n));
  if (nThreads <= 1) {
    run_range(tickers, 0, n, source, cfg, abort, slots);
  } else {
    // lots contigus ; chaque tâche écrit dans sa propre plage de slots
    const std::size_t perThread = n / nThreads;
    std::vector<std::future<void>> futures;
    futures.reserve(nThreads);
    for (std::size_t k = 0; k < nThreads; ++k) {
      const std::size_t begin = k * perThread;
      const std::size_t end   = (k == nThreads - 1) ? n : (k + 1) * perThread;
      futures.emplace_back(std::async(std::launch::async, [&, begin, end]() {
        run_range(tickers, begin, end, source, cfg, abort, slots);
      }));
    }
    for (auto& f : futures) f.get();
  }

  ScreenerReport rep;
  rep.outcomes.reserve(n);
  for (auto& s : slots) {
    if (s.outcome.reason == Reason::None) rep.rows.push_back(s.row);
    rep.outcomes.push_back(std::move(s.outcome));
  }

  // les lignes à rang indéfini ont déjà été écartées par compute_metrics
  assert(std::all_of(rep.rows.begin(), rep.rows.end(),
                     [](const ScreenerRow& r){ return std::isfinite(r.iv_rank); }));

  std::stable_sort(rep.rows.begin(), rep.rows.end(),
                   [](const ScreenerRow& a, const ScreenerRow& b){ return a.iv_rank > b.iv_rank; });
  return rep;
}

ScreenerReport build_screener(const vs::io::TickerSeriesSource& source,
                              const vs::config::ScreenerConfig& cfg,
                              const std::atomic<bool>* abort)
{
  std::vector<std::string> tickers;
  try {
    tickers = source.list_tickers();
  } catch (const std::exception& e) {
    // source illisible : rapport vide ("pas de données"), pas d'erreur
    ScreenerReport rep;
    rep.source_error = e.what();
    return rep;
  } catch (...) {
    ScreenerReport rep;
    rep.source_error = "exception inconnue";
    return rep;
  }
  return build_screener(tickers, source, cfg, abort);
}

} // namespace vs::screener
