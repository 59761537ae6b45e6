#pragma once
/**
 * @file date.hpp
 * @brief Date calendaire (grégorien proleptique) stockée en jours depuis 1970-01-01.
 *
 * - Arithmétique exacte en jours (pas de fuseau horaire une fois la date lue).
 * - Lecture ISO "YYYY-MM-DD" (une partie horaire éventuelle est ignorée).
 * - today() : date UTC de l'horloge murale.
 */

#include <optional>
#include <string>

namespace vs {
namespace core {

class Date {
public:
  /// @brief 1970-01-01.
  constexpr Date() noexcept = default;

  /// @throws std::invalid_argument si (y,m,d) n'est pas une date valide.
  static Date from_ymd(int y, int m, int d);

  /// @brief "2024-06-21", "2024-06-21T10:30:00" ou "2024-06-21 10:30:00".
  /// @return std::nullopt si la chaîne n'est pas une date valide.
  static std::optional<Date> parse_iso(const std::string& s);

  /// @brief Date UTC courante.
  static Date today();

  long days_since_epoch() const noexcept { return days_; }

  int year() const noexcept;
  int month() const noexcept;   ///< 1..12
  int day() const noexcept;     ///< 1..31

  /// @brief Format ISO "YYYY-MM-DD".
  std::string to_string() const;

  friend constexpr Date operator+(Date a, long n) noexcept { return Date(a.days_ + n); }
  friend constexpr Date operator-(Date a, long n) noexcept { return Date(a.days_ - n); }
  friend constexpr long operator-(Date a, Date b) noexcept { return a.days_ - b.days_; }

  friend constexpr bool operator==(Date a, Date b) noexcept { return a.days_ == b.days_; }
  friend constexpr bool operator!=(Date a, Date b) noexcept { return a.days_ != b.days_; }
  friend constexpr bool operator< (Date a, Date b) noexcept { return a.days_ <  b.days_; }
  friend constexpr bool operator<=(Date a, Date b) noexcept { return a.days_ <= b.days_; }
  friend constexpr bool operator> (Date a, Date b) noexcept { return a.days_ >  b.days_; }
  friend constexpr bool operator>=(Date a, Date b) noexcept { return a.days_ >= b.days_; }

private:
  constexpr explicit Date(long days) noexcept : days_(days) {}
  long days_{0};
};

/// @brief true si l'année est bissextile (grégorien).
bool is_leap_year(int y) noexcept;

/// @brief Nombre de jours du mois m (1..12) de l'année y.
int days_in_month(int y, int m) noexcept;

} // namespace core
} // namespace vs
