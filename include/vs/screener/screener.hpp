#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include <vs/config/screener_config.hpp>
#include <vs/io/series_source.hpp>
#include <vs/screener/metrics.hpp>

namespace vs::screener {

// Une ligne du tableau de sortie (unités : fractions, ratio sans dimension).
struct ScreenerRow {
  std::string ticker;
  double current_iv{0.0};
  double iv_rank{0.0};
  double iv_hv_ratio{0.0};
};

// Résultat explicite par ticker demandé (éligible ou raison d'exclusion).
struct TickerOutcome {
  std::string ticker;
  Reason reason{Reason::None};
  std::string message;
};

struct ScreenerReport {
  std::vector<ScreenerRow>   rows;     // triées par iv_rank décroissant (tri stable)
  std::vector<TickerOutcome> outcomes; // même ordre que la requête (doublons retirés)
  std::string source_error;            // listing de la source impossible (rapport vide)

  std::size_t count(Reason r) const noexcept;
  bool empty() const noexcept { return rows.empty(); }
};

// Évalue un ticker : lecture + métriques. Ne lève jamais.
TickerOutcome evaluate_ticker(const std::string& ticker,
                              const vs::io::TickerSeriesSource& source,
                              const vs::config::ScreenerConfig& cfg,
                              ScreenerRow* row);

// Parcourt les tickers, écarte les inéligibles, trie par iv_rank décroissant
// (égalités : ordre d'entrée). Un ticker en erreur n'interrompt pas le lot.
// abort (optionnel) : si positionné, les tickers restants sont marqués Aborted.
ScreenerReport build_screener(const std::vector<std::string>& tickers,
                              const vs::io::TickerSeriesSource& source,
                              const vs::config::ScreenerConfig& cfg = {},
                              const std::atomic<bool>* abort = nullptr);

// Tous les tickers listés par la source.
ScreenerReport build_screener(const vs::io::TickerSeriesSource& source,
                              const vs::config::ScreenerConfig& cfg = {},
                              const std::atomic<bool>* abort = nullptr);

} // namespace vs::screener
