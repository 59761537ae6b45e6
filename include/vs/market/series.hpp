#pragma once
/**
 * @file series.hpp
 * @brief Série quotidienne de volatilités (HV 30j, IV 30j) pour un ticker.
 *
 * # Contenu
 * - Observation : une date + hv_30d + iv_30d.
 * - TickerSeries : observations triées par date strictement croissante.
 *
 * # Unités
 * - Volatilités annualisées en décimal (0.23 = 23 %).
 * - Valeur absente = NaN (quiet_NaN), jamais 0.
 *
 * # Invariants
 * - Dates uniques, strictement croissantes (vérifié à la construction).
 * - La série peut être vide.
 * - Immuable après construction.
 */

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <vs/core/date.hpp>

namespace vs {
namespace market {

/// @brief Une observation quotidienne. Champs absents = NaN.
struct Observation {
  vs::core::Date date;
  double hv_30d = std::numeric_limits<double>::quiet_NaN();
  double iv_30d = std::numeric_limits<double>::quiet_NaN();
};

class TickerSeries {
public:
  TickerSeries() = default;

  /// @param ticker        symbole (ex : "AAPL")
  /// @param obs           observations, dates strictement croissantes
  /// @param has_hv_column la source porte une colonne HV
  /// @param has_iv_column la source porte une colonne IV
  /// @throws std::invalid_argument si les dates ne sont pas strictement croissantes.
  TickerSeries(std::string ticker,
               std::vector<Observation> obs,
               bool has_hv_column = true,
               bool has_iv_column = true);

  /// @brief Trie par date et supprime les doublons (la dernière occurrence gagne).
  /// @param num_dropped (optionnel) nombre de lignes écartées comme doublons.
  static TickerSeries from_unsorted(std::string ticker,
                                    std::vector<Observation> obs,
                                    bool has_hv_column = true,
                                    bool has_iv_column = true,
                                    std::size_t* num_dropped = nullptr);

  const std::string& ticker() const noexcept { return ticker_; }
  const std::vector<Observation>& observations() const noexcept { return obs_; }

  std::size_t size() const noexcept { return obs_.size(); }
  bool empty() const noexcept { return obs_.empty(); }

  const Observation& front() const { return obs_.front(); }
  const Observation& back() const { return obs_.back(); }

  /// @return Dernière date de la série, std::nullopt si vide.
  std::optional<vs::core::Date> max_date() const;

  bool has_hv_column() const noexcept { return has_hv_; }
  bool has_iv_column() const noexcept { return has_iv_; }

private:
  std::string ticker_;
  std::vector<Observation> obs_;
  bool has_hv_{true};
  bool has_iv_{true};
};

} // namespace market
} // namespace vs
