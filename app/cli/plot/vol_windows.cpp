// app/cli/plot/vol_windows.cpp
#include "vs/io/series_source.hpp"
#include "vs/io/series_csv.hpp"
#include "vs/plot/plot_data.hpp"
#include "vs/core/stats.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <string>
#include <filesystem>
#include <cmath>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " -d data_dir -s TICKER [--ytd last|wall] [-o out_dir]\n"
    "  Affiche les 5 panneaux (5 Years, 1 Year, 6 Months, YTD, 1 Month).\n"
    "  -o / --out   exporte chaque panneau en CSV (<out_dir>/<TICKER>_<spec>.csv)\n";
}

static std::string pct(double x){
  if (!std::isfinite(x)) return "   n/a";
  std::ostringstream os;
  os << std::fixed << std::setprecision(1) << std::setw(5) << 100.0*x << "%";
  return os.str();
}

int main(int argc, char** argv){
  std::string dir, ticker, out_dir;
  vs::config::WindowOptions opts;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if ((a=="-d"||a=="--dir") && i+1<argc) dir = argv[++i];
    else if ((a=="-s"||a=="--symbol") && i+1<argc) ticker = argv[++i];
    else if ((a=="-o"||a=="--out") && i+1<argc) out_dir = argv[++i];
    else if (a=="--ytd" && i+1<argc) {
      auto p = vs::config::parse_ytd_policy(argv[++i]);
      if (!p) { std::cerr << "error: --ytd attend last|wall\n"; return 1; }
      opts.ytd_policy = *p;
    }
    else if (a=="-h"||a=="--help"){ usage(argv[0]); return 0; }
  }
  if (dir.empty() || ticker.empty()) { usage(argv[0]); return 1; }

  vs::io::CsvDirectorySource src(dir);
  const auto pd = vs::plot::build_plot_data(src, ticker, opts);
  if (!pd.available) {
    std::cerr << "error: " << pd.message << "\n";
    return 2;
  }

  std::cout << "Historical vs. Implied Volatility for " << pd.ticker << "\n";
  for (const auto& p : pd.panels) {
    std::cout << std::left << std::setw(9) << p.label << std::right;
    if (!p.has_data()) {
      std::cout << "  No Data Available for this Timeframe\n";
      continue;
    }
    vs::core::ColumnStats hv, iv;
    for (const auto& o : p.rows) { hv.add(o.hv_30d); iv.add(o.iv_30d); }
    std::cout << "  rows=" << std::setw(5) << p.rows.size()
              << "  " << p.rows.front().date.to_string()
              << " .. " << p.rows.back().date.to_string()
              << "  HV avg=" << pct(hv.mean())
              << "  IV avg=" << (p.plot_iv ? pct(iv.mean()) : std::string("   n/a"))
              << (p.plot_iv ? "" : "  (HV only)") << "\n";

    if (!out_dir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(out_dir, ec);
      if (ec) {
        std::cerr << "error: " << out_dir << ": " << ec.message() << "\n";
        return 2;
      }
      const auto path = (std::filesystem::path(out_dir) / (pd.ticker + "_" + p.spec + ".csv")).string();
      if (!vs::io::write_series_csv(path, p.rows)) {
        std::cerr << "error: impossible d'ecrire " << path << "\n";
        return 2;
      }
    }
  }
  return 0;
}
