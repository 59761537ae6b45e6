#include "vs/window/window.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using vs::core::Date;
using vs::market::Observation;
using vs::market::TickerSeries;
namespace win = vs::window;

// série quotidienne [first, last], HV/IV arbitraires
static TickerSeries daily(const std::string& ticker, Date first, Date last) {
  std::vector<Observation> obs;
  for (Date d = first; d <= last; d = d + 1) {
    Observation o;
    o.date = d;
    o.hv_30d = 0.20;
    o.iv_30d = 0.25;
    obs.push_back(o);
  }
  return TickerSeries(ticker, std::move(obs));
}

int main() {
  const Date last = Date::from_ymd(2024, 3, 15);
  const auto s = daily("AAA", Date::from_ymd(2019, 1, 1), last);
  assert(s.size() == 1901);

  // 1) parsing des spécificateurs
  assert(win::parse_window_spec("5Y")->duration_days() == 1826);
  assert(win::parse_window_spec("1Y")->duration_days() == 365);
  assert(win::parse_window_spec("6M")->duration_days() == 180);
  assert(win::parse_window_spec("1m")->duration_days() == 30);
  assert(win::parse_window_spec("2W")->duration_days() == 14);
  assert(win::parse_window_spec("10D")->duration_days() == 10);
  assert(win::parse_window_spec("ytd")->kind == win::WindowSpec::Kind::YearToDate);
  assert(win::parse_window_spec(" 6M ")->to_string() == "6M");
  assert(!win::parse_window_spec(""));
  assert(!win::parse_window_spec("0Y"));
  assert(!win::parse_window_spec("Y"));
  assert(!win::parse_window_spec("6X"));
  assert(!win::parse_window_spec("1Y2"));
  assert(!win::parse_window_spec("-1Y"));

  // 2) fenêtres glissantes : bornes incluses des deux côtés
  struct Case { const char* spec; const char* first; std::size_t n; };
  const Case cases[] = {
    {"5Y", "2019-03-16", 1827},
    {"1Y", "2023-03-16", 366},
    {"6M", "2023-09-17", 181},
    {"1M", "2024-02-14", 31},
  };
  for (const auto& c : cases) {
    const auto w = win::resolve(s, std::string(c.spec));
    assert(w.size() == c.n);
    assert(w.rows.front().date.to_string() == c.first);
    assert(w.rows.back().date == last);
    assert(w.start && w.start->to_string() == c.first);
    assert(w.end && *w.end == last);
    for (const auto& o : w.rows) assert(o.date >= *w.start && o.date <= *w.end);
  }

  // 3) borne basse exacte : start-1 exclu, start inclus
  {
    const Date start = last - 30;
    std::vector<Observation> obs(3);
    obs[0].date = start - 1;
    obs[1].date = start;
    obs[2].date = last;
    TickerSeries sparse("SPR", obs);
    const auto w = win::resolve(sparse, std::string("1M"));
    assert(w.size() == 2);
    assert(w.rows.front().date == start);
  }

  // 4) YTD : année de la dernière observation (défaut)
  {
    const auto w = win::resolve(s, std::string("YTD"));
    assert(w.size() == 75);
    assert(w.rows.front().date.to_string() == "2024-01-01");
    assert(w.rows.back().date == last);
  }

  // 5) YTD : horloge murale, cache ancien -> vide ; même année -> identique
  {
    vs::config::WindowOptions wall;
    wall.ytd_policy = vs::config::YtdPolicy::WallClockYear;
    wall.today = Date::from_ymd(2025, 2, 1);
    assert(win::resolve(s, std::string("YTD"), wall).empty());

    wall.today = Date::from_ymd(2024, 11, 30);
    assert(win::resolve(s, std::string("YTD"), wall).size() == 75);

    wall.today = Date::from_ymd(2020, 6, 1);
    assert(win::resolve(s, std::string("YTD"), wall).size() == 366); // 2020 bissextile
  }

  // 6) série vide / spécificateur invalide : résultat vide, pas d'exception
  {
    TickerSeries empty("EMPTY", {});
    for (const char* sp : {"5Y", "1Y", "6M", "YTD", "1M"}) {
      assert(win::resolve(empty, std::string(sp)).empty());
    }
    assert(win::resolve(s, std::string("bogus")).empty());
    assert(win::resolve(s, std::string("")).empty());
  }

  // 7) la série source n'est pas modifiée
  assert(s.size() == 1901 && s.back().date == last);

  std::cout << "WindowResolver OK.\n";
  return 0;
}
