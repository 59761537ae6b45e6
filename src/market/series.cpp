#include <vs/market/series.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vs {
namespace market {

TickerSeries::TickerSeries(std::string ticker,
                           std::vector<Observation> obs,
                           bool has_hv_column,
                           bool has_iv_column)
  : ticker_(std::move(ticker)),
    obs_(std::move(obs)),
    has_hv_(has_hv_column),
    has_iv_(has_iv_column)
{
  for (std::size_t i = 1; i < obs_.size(); ++i) {
    if (!(obs_[i-1].date < obs_[i].date)) {
      throw std::invalid_argument("TickerSeries: dates must be strictly increasing (" +
                                  ticker_ + " at " + obs_[i].date.to_string() + ")");
    }
  }
}

TickerSeries TickerSeries::from_unsorted(std::string ticker,
                                         std::vector<Observation> obs,
                                         bool has_hv_column,
                                         bool has_iv_column,
                                         std::size_t* num_dropped)
{
  // tri stable : à date égale, l'ordre d'arrivée est conservé
  std::stable_sort(obs.begin(), obs.end(),
                   [](const Observation& a, const Observation& b){ return a.date < b.date; });

  std::vector<Observation> uniq;
  uniq.reserve(obs.size());
  std::size_t dropped = 0;
  for (auto& o : obs) {
    if (!uniq.empty() && uniq.back().date == o.date) {
      uniq.back() = o; // la dernière occurrence gagne
      ++dropped;
    } else {
      uniq.push_back(o);
    }
  }
  if (num_dropped) *num_dropped = dropped;
  return TickerSeries(std::move(ticker), std::move(uniq), has_hv_column, has_iv_column);
}

std::optional<vs::core::Date> TickerSeries::max_date() const {
  if (obs_.empty()) return std::nullopt;
  return obs_.back().date;
}

} // namespace market
} // namespace vs
