#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateur en streaming sur une colonne de volatilités.
 *
 * - Les NaN (valeurs absentes) sont ignorés : ils ne comptent pas dans count().
 * - Moyenne incrémentale (une passe).
 * - min / max : extrema des valeurs définies.
 * - n == 0 : mean(), min(), max() renvoient NaN.
 */

#include <cstddef> // std::size_t

namespace vs {
namespace core {

struct ColumnStats {
public:
  /// @brief Initialise les accumulateurs (n=0).
  ColumnStats() noexcept;

  /// @brief Ajoute un échantillon ; NaN est ignoré.
  void add(double x) noexcept;

  /// @return Nombre de valeurs définies vues.
  std::size_t count() const noexcept;

  /// @return true si au moins une valeur définie a été vue.
  bool any() const noexcept { return n_ > 0; }

  double mean() const noexcept;
  double min() const noexcept;
  double max() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double min_{0.0};
  double max_{0.0};
};

} // namespace core
} // namespace vs
