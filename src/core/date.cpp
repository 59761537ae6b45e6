#include <vs/core/date.hpp>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace {

// Conversions jours <-> (y,m,d) : algorithmes "civil" de H. Hinnant
// (ère de 400 ans, année commençant au 1er mars).
long days_from_civil(long y, unsigned m, unsigned d) noexcept {
  y -= (m <= 2) ? 1 : 0;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long>(doe) - 719468;
}

struct Ymd { long y; unsigned m; unsigned d; };

Ymd civil_from_days(long z) noexcept {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long y = static_cast<long>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return { y + (m <= 2 ? 1 : 0), m, d };
}

// lit exactement n chiffres à partir de pos
bool read_digits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}

} // namespace

namespace vs {
namespace core {

bool is_leap_year(int y) noexcept {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int days_in_month(int y, int m) noexcept {
  static constexpr int DIM[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m < 1 || m > 12) return 0;
  return (m == 2 && is_leap_year(y)) ? 29 : DIM[m - 1];
}

Date Date::from_ymd(int y, int m, int d) {
  if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
    throw std::invalid_argument("Date: invalid calendar date");
  }
  return Date(days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d)));
}

std::optional<Date> Date::parse_iso(const std::string& s) {
  // YYYY-MM-DD, éventuellement suivi de 'T' ou ' ' + heure (ignorée)
  int y = 0, m = 0, d = 0;
  if (!read_digits(s, 0, 4, y) || s.size() < 10 || s[4] != '-' ||
      !read_digits(s, 5, 2, m) || s[7] != '-' || !read_digits(s, 8, 2, d)) {
    return std::nullopt;
  }
  if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') return std::nullopt;
  if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) return std::nullopt;
  return Date(days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d)));
}

Date Date::today() {
  using namespace std::chrono;
  const auto secs = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  // division entière vers -inf
  long days = static_cast<long>(secs / 86400);
  if (secs % 86400 < 0) --days;
  return Date(days);
}

int Date::year() const noexcept { return static_cast<int>(civil_from_days(days_).y); }
int Date::month() const noexcept { return static_cast<int>(civil_from_days(days_).m); }
int Date::day() const noexcept { return static_cast<int>(civil_from_days(days_).d); }

std::string Date::to_string() const {
  const Ymd c = civil_from_days(days_);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04ld-%02u-%02u", c.y, c.m, c.d);
  return std::string(buf);
}

} // namespace core
} // namespace vs
