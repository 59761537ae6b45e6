#include "vs/screener/metrics.hpp"
#include "vs/window/window.hpp"
#include "vs/core/stats.hpp"
#include <cmath>

namespace {
inline bool fin(double x){ return std::isfinite(x); }
}

namespace vs::screener {

const char* to_string(Reason r) noexcept {
  switch (r) {
    case Reason::None:                return "ok";
    case Reason::NotFound:            return "not_found";
    case Reason::LoadFailed:          return "load_failed";
    case Reason::NoData:              return "no_data";
    case Reason::MissingColumns:      return "missing_columns";
    case Reason::InsufficientHistory: return "insufficient_history";
    case Reason::DegenerateMetric:    return "degenerate_metric";
    case Reason::Aborted:             return "aborted";
  }
  return "unknown";
}

MetricsResult compute_metrics(const vs::market::TickerSeries& series,
                              const vs::config::ScreenerConfig& cfg)
{
  MetricsResult res;

  // 1) fenêtre glissante de rang
  const auto win = vs::window::resolve(series, cfg.rank_window, cfg.window);

  // 2) éligibilité
  if (win.empty()) { res.reason = Reason::NoData; return res; }
  if (!series.has_hv_column() || !series.has_iv_column()) {
    res.reason = Reason::MissingColumns; return res;
  }
  if (win.size() < cfg.min_observations) {
    res.reason = Reason::InsufficientHistory; return res;
  }

  Metrics m;
  m.n_obs     = win.size();
  m.last_date = win.rows.back().date;

  // 3) IV courante, 6) HV courante : dernière observation de la fenêtre
  m.current_iv = win.rows.back().iv_30d;
  m.current_hv = win.rows.back().hv_30d;

  // 4) extrema d'IV (NaN exclus)
  vs::core::ColumnStats iv;
  for (const auto& o : win.rows) iv.add(o.iv_30d);
  m.iv_low  = iv.min();
  m.iv_high = iv.max();

  // 5) rang : indéfini si historique plat ou IV courante absente
  if (fin(m.current_iv) && iv.any() && m.iv_high > m.iv_low) {
    m.iv_rank = (m.current_iv - m.iv_low) / (m.iv_high - m.iv_low);
  }

  // 7) ratio : indéfini si HV absente ou nulle
  if (fin(m.current_iv) && fin(m.current_hv) && m.current_hv != 0.0) {
    m.iv_hv_ratio = m.current_iv / m.current_hv;
  }

  // 8) pas de ligne partielle
  if (!fin(m.iv_rank) || !fin(m.iv_hv_ratio)) {
    res.reason = Reason::DegenerateMetric; return res;
  }

  res.metrics = m;
  return res;
}

} // namespace vs::screener
