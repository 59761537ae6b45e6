#include "vs/io/series_csv.hpp"
#include "vs/core/stats.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::string path;
  bool show_warnings = false;
  bool require_iv    = false;

  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if ((a=="-f" || a=="--file") && i+1<argc) { path = argv[++i]; }
    else if (a=="-w" || a=="--show-warnings") { show_warnings = true; }
    else if (a=="--require-iv") { require_iv = true; }
    else if (a=="-h" || a=="--help") {
      std::cout << "Usage: series_csv_info -f <TICKER.csv> [-w] [--require-iv]\n";
      return 0;
    } else if (path.empty()) { path = a; }
  }
  if (path.empty()) {
    std::cerr << "Please provide a CSV path (-f <file.csv>).\n";
    return 1;
  }

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  auto s = vs::io::read_series_csv(path, &ignored, &warnings);

  if (show_warnings) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }
  if (!s) {
    std::cerr << "error: unreadable series file " << path << "\n";
    return 2;
  }

  vs::core::ColumnStats hv, iv;
  for (const auto& o : s->observations()) { hv.add(o.hv_30d); iv.add(o.iv_30d); }

  std::cout << "File: " << path << "\n";
  std::cout << "Ticker: " << s->ticker() << "\n";
  std::cout << "Valid rows: " << s->size() << "\n";
  std::cout << "Ignored rows: " << ignored << "\n";
  if (!s->empty()) {
    std::cout << "Span: " << s->front().date.to_string() << " .. " << s->back().date.to_string() << "\n";
  }
  std::cout << "HV column: " << (s->has_hv_column() ? "yes" : "no")
            << " (defined=" << hv.count() << ")\n";
  std::cout << "IV column: " << (s->has_iv_column() ? "yes" : "no")
            << " (defined=" << iv.count() << ")\n";

  if (require_iv && (!s->has_iv_column() || !iv.any())) {
    std::cerr << "Missing implied volatility data.\n";
    return 3;
  }
  return 0;
}
