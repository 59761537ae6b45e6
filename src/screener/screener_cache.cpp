#include "vs/screener/screener_cache.hpp"

namespace vs::screener {

std::string ScreenerCache::make_key(const std::vector<std::string>& tickers,
                                    const vs::io::TickerSeriesSource& source,
                                    const vs::config::ScreenerConfig& cfg)
{
  std::string key = source.snapshot_id();
  key += '#';
  key += cfg.fingerprint();
  key += '#';
  if (tickers.empty()) {
    key += '*';
  } else {
    for (const auto& t : tickers) { key += t; key += ','; }
  }
  return key;
}

const ScreenerReport& ScreenerCache::get_or_build(const std::vector<std::string>& tickers,
                                                  const vs::io::TickerSeriesSource& source,
                                                  const vs::config::ScreenerConfig& cfg,
                                                  const std::atomic<bool>* abort)
{
  const std::string key = make_key(tickers, source, cfg);
  if (key_ && *key_ == key) {
    ++hits_;
    return report_;
  }
  ++misses_;
  report_ = tickers.empty() ? build_screener(source, cfg, abort)
                            : build_screener(tickers, source, cfg, abort);
  if (report_.count(Reason::Aborted) > 0) key_.reset();
  else key_ = key;
  return report_;
}

} // namespace vs::screener
