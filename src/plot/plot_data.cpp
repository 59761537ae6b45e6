#include "vs/plot/plot_data.hpp"
#include "vs/window/window.hpp"
#include "vs/core/stats.hpp"
#include <cmath>
#include <exception>

namespace {

vs::plot::NamedWindow empty_panel(const vs::plot::PanelDef& def) {
  vs::plot::NamedWindow w;
  w.label = def.label;
  w.spec  = def.spec;
  w.state = vs::plot::PanelState::NoData;
  return w;
}

} // namespace

namespace vs::plot {

NamedWindow build_panel(const vs::market::TickerSeries& series,
                        const PanelDef& def,
                        const vs::config::WindowOptions& opts)
{
  NamedWindow w = empty_panel(def);
  try {
    auto sub = vs::window::resolve(series, std::string(def.spec), opts);
    if (sub.empty()) return w;

    vs::core::ColumnStats hv, iv;
    for (const auto& o : sub.rows) {
      hv.add(o.hv_30d);
      iv.add(o.iv_30d);
    }
    w.plot_hv = series.has_hv_column() && hv.any();
    w.plot_iv = series.has_iv_column() && iv.any();

    // bornes de l'axe Y sur les courbes effectivement tracées
    vs::core::ColumnStats y;
    if (w.plot_hv) { y.add(hv.min()); y.add(hv.max()); }
    if (w.plot_iv) { y.add(iv.min()); y.add(iv.max()); }
    w.y_min = y.min();
    w.y_max = y.max();

    w.rows  = std::move(sub.rows);
    w.state = PanelState::Ok;
  } catch (const std::exception&) {
    // un panneau en échec n'affecte pas les autres
    return empty_panel(def);
  } catch (...) {
    return empty_panel(def);
  }
  return w;
}

PlotData build_plot_data(const vs::market::TickerSeries& series,
                         const vs::config::WindowOptions& opts)
{
  PlotData pd;
  pd.ticker = series.ticker();
  pd.available = true;
  pd.panels.reserve(kNumPanels);
  for (const auto& def : kStandardPanels) {
    pd.panels.push_back(build_panel(series, def, opts));
  }
  return pd;
}

PlotData build_plot_data(const vs::io::TickerSeriesSource& source,
                         const std::string& ticker,
                         const vs::config::WindowOptions& opts)
{
  PlotData pd;
  vs::io::FetchResult fr;
  try {
    fr = source.fetch(ticker);
  } catch (const std::exception& e) {
    fr.status  = vs::io::FetchStatus::Failed;
    fr.message = e.what();
  } catch (...) {
    fr.status  = vs::io::FetchStatus::Failed;
    fr.message = "exception inconnue";
  }

  if (!fr.ok()) {
    pd.ticker    = ticker;
    pd.available = false;
    pd.message   = fr.message.empty() ? ("Données indisponibles pour " + ticker) : fr.message;
    pd.panels.reserve(kNumPanels);
    for (const auto& def : kStandardPanels) pd.panels.push_back(empty_panel(def));
    return pd;
  }

  pd = build_plot_data(fr.series, opts);
  if (pd.ticker.empty()) pd.ticker = ticker;
  return pd;
}

} // namespace vs::plot
