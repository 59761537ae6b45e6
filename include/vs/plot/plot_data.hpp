#pragma once
#include <array>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include <vs/config/screener_config.hpp>
#include <vs/io/series_source.hpp>
#include <vs/market/series.hpp>

namespace vs::plot {

enum class PanelState { Ok, NoData };

// Un panneau de graphique : libellé + sous-série résolue.
struct NamedWindow {
  std::string label;  // "5 Years", "1 Year", "6 Months", "YTD", "1 Month"
  std::string spec;   // "5Y", "1Y", "6M", "YTD", "1M"
  PanelState  state{PanelState::NoData};
  std::vector<vs::market::Observation> rows;

  bool plot_hv{false}; // au moins une HV définie
  bool plot_iv{false}; // colonne IV présente et au moins une IV définie

  // Étendue des valeurs définies (HV et IV tracées), NaN si aucune.
  double y_min = std::numeric_limits<double>::quiet_NaN();
  double y_max = std::numeric_limits<double>::quiet_NaN();

  bool has_data() const noexcept { return state == PanelState::Ok; }
};

inline constexpr std::size_t kNumPanels = 5;

struct PanelDef { const char* label; const char* spec; };

// Ordre d'affichage fixe.
inline constexpr std::array<PanelDef, kNumPanels> kStandardPanels{{
  {"5 Years",  "5Y"},
  {"1 Year",   "1Y"},
  {"6 Months", "6M"},
  {"YTD",      "YTD"},
  {"1 Month",  "1M"},
}};

struct PlotData {
  std::string ticker;
  bool available{false};   // false : série introuvable / illisible
  std::string message;     // diagnostic si !available
  std::vector<NamedWindow> panels; // toujours kNumPanels entrées
};

// Un panneau, résolu indépendamment. Ne lève jamais : échec -> NoData.
NamedWindow build_panel(const vs::market::TickerSeries& series,
                        const PanelDef& def,
                        const vs::config::WindowOptions& opts = {});

// Les cinq panneaux standard pour une série.
PlotData build_plot_data(const vs::market::TickerSeries& series,
                         const vs::config::WindowOptions& opts = {});

// Lecture via la source puis construction ; absence -> available=false
// et cinq panneaux NoData.
PlotData build_plot_data(const vs::io::TickerSeriesSource& source,
                         const std::string& ticker,
                         const vs::config::WindowOptions& opts = {});

} // namespace vs::plot
