#pragma once
#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <vs/screener/screener.hpp>

namespace vs::screener {

// Mémoïsation du screener, détenue par l'appelant (CLI, GUI).
// Clé = snapshot_id() de la source + liste de tickers + empreinte de config.
// Un seul rapport est conservé. Une passe interrompue (abort) n'est pas mémorisée.
// Non thread-safe.
class ScreenerCache {
public:
  // tickers vide => tous les tickers listés par la source.
  const ScreenerReport& get_or_build(const std::vector<std::string>& tickers,
                                     const vs::io::TickerSeriesSource& source,
                                     const vs::config::ScreenerConfig& cfg = {},
                                     const std::atomic<bool>* abort = nullptr);

  void invalidate() noexcept { key_.reset(); }
  bool has_value() const noexcept { return key_.has_value(); }

  std::size_t hits() const noexcept { return hits_; }
  std::size_t misses() const noexcept { return misses_; }

private:
  static std::string make_key(const std::vector<std::string>& tickers,
                              const vs::io::TickerSeriesSource& source,
                              const vs::config::ScreenerConfig& cfg);

  std::optional<std::string> key_;
  ScreenerReport report_;
  std::size_t hits_{0};
  std::size_t misses_{0};
};

} // namespace vs::screener
