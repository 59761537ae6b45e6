#include "vs/window/window.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>

namespace {

using vs::market::Observation;

inline bool date_less(const Observation& o, const vs::core::Date& d) { return o.date < d; }
inline bool date_greater(const vs::core::Date& d, const Observation& o) { return d < o.date; }

} // namespace

namespace vs::window {

long WindowSpec::duration_days() const noexcept {
  if (kind == Kind::YearToDate) return 0;
  switch (unit) {
    case Unit::Year:  return static_cast<long>(std::floor(amount * 365.25));
    case Unit::Month: return 30L * amount;
    case Unit::Week:  return 7L * amount;
    case Unit::Day:   return amount;
  }
  return 0;
}

std::string WindowSpec::to_string() const {
  if (kind == Kind::YearToDate) return "YTD";
  char u = 'Y';
  switch (unit) {
    case Unit::Year:  u = 'Y'; break;
    case Unit::Month: u = 'M'; break;
    case Unit::Week:  u = 'W'; break;
    case Unit::Day:   u = 'D'; break;
  }
  return std::to_string(amount) + u;
}

std::optional<WindowSpec> parse_window_spec(const std::string& text) {
  std::string s;
  for (unsigned char c : text) {
    if (!std::isspace(c)) s.push_back(static_cast<char>(std::toupper(c)));
  }
  if (s.empty()) return std::nullopt;

  WindowSpec spec;
  if (s == "YTD") {
    spec.kind = WindowSpec::Kind::YearToDate;
    spec.amount = 0;
    return spec;
  }

  // <n><unité>, n >= 1, au plus 4 chiffres
  std::size_t i = 0;
  long n = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) && i < 4) {
    n = n * 10 + (s[i] - '0');
    ++i;
  }
  if (i == 0 || n < 1 || i + 1 != s.size()) return std::nullopt;

  switch (s[i]) {
    case 'Y': spec.unit = WindowSpec::Unit::Year;  break;
    case 'M': spec.unit = WindowSpec::Unit::Month; break;
    case 'W': spec.unit = WindowSpec::Unit::Week;  break;
    case 'D': spec.unit = WindowSpec::Unit::Day;   break;
    default:  return std::nullopt;
  }
  spec.kind = WindowSpec::Kind::Rolling;
  spec.amount = static_cast<int>(n);
  return spec;
}

SubSeries resolve(const vs::market::TickerSeries& series,
                  const WindowSpec& spec,
                  const vs::config::WindowOptions& opts)
{
  SubSeries out;
  const auto max_date = series.max_date();
  if (!max_date) return out;

  const auto& obs = series.observations();

  if (spec.kind == WindowSpec::Kind::YearToDate) {
    const int year = (opts.ytd_policy == vs::config::YtdPolicy::WallClockYear)
                       ? opts.effective_today().year()
                       : max_date->year();
    const auto jan1  = vs::core::Date::from_ymd(year, 1, 1);
    const auto dec31 = vs::core::Date::from_ymd(year, 12, 31);
    out.start = jan1;
    out.end   = dec31;
    auto lo = std::lower_bound(obs.begin(), obs.end(), jan1, date_less);
    auto hi = std::upper_bound(obs.begin(), obs.end(), dec31, date_greater);
    if (lo < hi) out.rows.assign(lo, hi);
    return out;
  }

  const long days = spec.duration_days();
  if (days <= 0) return out;

  const auto start = *max_date - days;
  out.start = start;
  out.end   = *max_date;
  // série triée : [start, max_date] est un suffixe contigu
  auto lo = std::lower_bound(obs.begin(), obs.end(), start, date_less);
  out.rows.assign(lo, obs.end());
  return out;
}

SubSeries resolve(const vs::market::TickerSeries& series,
                  const std::string& spec,
                  const vs::config::WindowOptions& opts)
{
  const auto parsed = parse_window_spec(spec);
  if (!parsed) return {};
  return resolve(series, *parsed, opts);
}

} // namespace vs::window
