#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

#include <vs/core/date.hpp>
#include <vs/market/series.hpp>
#include <vs/config/screener_config.hpp>

namespace vs::screener {

// Raison d'exclusion d'un ticker du screener.
enum class Reason {
  None,                // éligible
  NotFound,            // ticker absent de la source
  LoadFailed,          // lecture impossible / exception pendant le calcul
  NoData,              // fenêtre de rang vide
  MissingColumns,      // colonne HV ou IV absente de la source
  InsufficientHistory, // moins de min_observations dans la fenêtre
  DegenerateMetric,    // rang ou ratio indéfini (IV plate, HV nulle/absente...)
  Aborted              // arrêt demandé avant traitement
};

const char* to_string(Reason r) noexcept;

struct Metrics {
  double current_iv  = std::numeric_limits<double>::quiet_NaN();
  double current_hv  = std::numeric_limits<double>::quiet_NaN();
  double iv_low      = std::numeric_limits<double>::quiet_NaN();
  double iv_high     = std::numeric_limits<double>::quiet_NaN();
  double iv_rank     = std::numeric_limits<double>::quiet_NaN(); // [0,1]
  double iv_hv_ratio = std::numeric_limits<double>::quiet_NaN();
  std::size_t n_obs{0};       // taille de la fenêtre de rang
  vs::core::Date last_date;   // date de la dernière observation
};

// Soit des métriques, soit une raison d'inéligibilité.
struct MetricsResult {
  std::optional<Metrics> metrics;
  Reason reason{Reason::None};

  bool eligible() const noexcept { return metrics.has_value(); }
};

// Calcule IV courante, rang d'IV sur la fenêtre cfg.rank_window et ratio IV/HV.
// Ne lève pas : toute donnée manquante/dégénérée donne une raison d'exclusion.
MetricsResult compute_metrics(const vs::market::TickerSeries& series,
                              const vs::config::ScreenerConfig& cfg = {});

} // namespace vs::screener
