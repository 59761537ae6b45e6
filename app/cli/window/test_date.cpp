#include "vs/core/date.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using vs::core::Date;

int main() {
  // 1) epoch et valeurs connues
  assert(Date::from_ymd(1970, 1, 1).days_since_epoch() == 0);
  assert(Date::from_ymd(2000, 3, 1).days_since_epoch() == 11017);
  assert(Date::from_ymd(1969, 12, 31).days_since_epoch() == -1);

  // 2) aller-retour y/m/d, années bissextiles
  const Date feb29 = Date::from_ymd(2024, 2, 29);
  assert(feb29.year() == 2024 && feb29.month() == 2 && feb29.day() == 29);
  assert((feb29 + 1).to_string() == "2024-03-01");
  assert((Date::from_ymd(2024, 3, 15) - 365).to_string() == "2023-03-16");
  assert(Date::from_ymd(2024, 12, 31) - Date::from_ymd(2024, 1, 1) == 365);
  assert(Date::from_ymd(2023, 12, 31) - Date::from_ymd(2023, 1, 1) == 364);

  bool threw = false;
  try { (void)Date::from_ymd(2023, 2, 29); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 3) lecture ISO
  auto d = Date::parse_iso("2024-06-21");
  assert(d && d->to_string() == "2024-06-21");
  auto dt = Date::parse_iso("2024-06-21T10:30:00");
  assert(dt && *dt == *d);
  auto ds = Date::parse_iso("2024-06-21 00:00:00");
  assert(ds && *ds == *d);
  assert(!Date::parse_iso(""));
  assert(!Date::parse_iso("2024/06/21"));
  assert(!Date::parse_iso("2024-13-01"));
  assert(!Date::parse_iso("2023-02-29"));
  assert(!Date::parse_iso("2024-06-2"));
  assert(!Date::parse_iso("2024-06-21X"));

  // 4) comparaisons
  assert(Date::from_ymd(2020, 1, 1) < Date::from_ymd(2020, 1, 2));
  assert(Date::today().year() >= 2024);

  std::cout << "Date OK.\n";
  return 0;
}
