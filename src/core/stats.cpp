#include <vs/core/stats.hpp>

#include <cmath>    // std::isnan
#include <limits>   // std::numeric_limits

namespace vs {
namespace core {

ColumnStats::ColumnStats() noexcept = default;

void ColumnStats::add(double x) noexcept {
  if (std::isnan(x)) return; // valeur absente
  if (n_ == 0) {
    min_ = x;
    max_ = x;
  } else {
    if (x < min_) min_ = x;
    if (x > max_) max_ = x;
  }
  // moyenne incrémentale
  n_ += 1;
  mean_ += (x - mean_) / static_cast<double>(n_);
}

std::size_t ColumnStats::count() const noexcept {
  return n_;
}

double ColumnStats::mean() const noexcept {
  return n_ == 0 ? std::numeric_limits<double>::quiet_NaN() : mean_;
}

double ColumnStats::min() const noexcept {
  return n_ == 0 ? std::numeric_limits<double>::quiet_NaN() : min_;
}

double ColumnStats::max() const noexcept {
  return n_ == 0 ? std::numeric_limits<double>::quiet_NaN() : max_;
}

} // namespace core
} // namespace vs
