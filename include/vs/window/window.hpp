#pragma once
#include <optional>
#include <string>
#include <vector>

#include <vs/core/date.hpp>
#include <vs/market/series.hpp>
#include <vs/config/screener_config.hpp>

namespace vs::window {

/**
 * Spécificateur de période :
 *  - glissant "<n><unité>" avec n >= 1 et unité Y | M | W | D ;
 *  - calendaire "YTD".
 *
 * Durées (jours) : Y -> floor(n * 365.25), M -> 30 n, W -> 7 n, D -> n.
 * Ex : 5Y = 1826, 1Y = 365, 6M = 180, 1M = 30.
 */
struct WindowSpec {
  enum class Kind { Rolling, YearToDate };
  enum class Unit { Year, Month, Week, Day };

  Kind kind{Kind::Rolling};
  int  amount{1};
  Unit unit{Unit::Year};

  // Durée en jours (0 pour YTD).
  long duration_days() const noexcept;
  std::string to_string() const;
};

// "5Y", "6m", "YTD"... std::nullopt si la syntaxe est invalide.
std::optional<WindowSpec> parse_window_spec(const std::string& text);

// Sous-série contiguë résolue. Vide si aucune donnée (jamais une erreur).
struct SubSeries {
  std::vector<vs::market::Observation> rows;
  std::optional<vs::core::Date> start; // borne basse (incluse) si définie
  std::optional<vs::core::Date> end;   // borne haute (incluse) si définie

  bool empty() const noexcept { return rows.empty(); }
  std::size_t size() const noexcept { return rows.size(); }
};

// Glissant : [max_date - durée, max_date], bornes incluses.
// YTD : year(date) == année de référence (selon opts.ytd_policy).
// Série vide -> résultat vide. Ne lève jamais.
SubSeries resolve(const vs::market::TickerSeries& series,
                  const WindowSpec& spec,
                  const vs::config::WindowOptions& opts = {});

// Variante texte : un spécificateur illisible donne un résultat vide.
SubSeries resolve(const vs::market::TickerSeries& series,
                  const std::string& spec,
                  const vs::config::WindowOptions& opts = {});

} // namespace vs::window
