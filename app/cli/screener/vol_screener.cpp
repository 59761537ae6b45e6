// app/cli/screener/vol_screener.cpp
#include "vs/io/series_source.hpp"
#include "vs/screener/screener.hpp"
#include "vs/config/screener_config.hpp"
#include "vs/window/window.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " -d data_dir [-t AAPL,MSFT] [--min-obs 20] [--ytd last|wall]\n"
    "                  [--threads N] [-o out.csv] [-w]\n"
    "Options:\n"
    "  -d / --dir       repertoire du cache (un <TICKER>.csv par ticker)\n"
    "  -t / --tickers   liste de tickers (def: tous les fichiers du repertoire)\n"
    "  --min-obs        nb minimal d'observations sur 1 an (def: 20)\n"
    "  --window         fenetre du rang d'IV (def: 1Y)\n"
    "  --ytd            politique YTD: last (def) | wall\n"
    "  --threads        nb de threads pour la boucle par ticker (def: 1)\n"
    "  -o / --out       export CSV du tableau classe\n"
    "  -w / --show-warnings  affiche les tickers exclus et la raison\n";
}

static std::vector<std::string> parse_list(const std::string& s){
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    if (!tok.empty()) out.push_back(tok);
  }
  return out;
}

static bool parse_size(const std::string& s, std::size_t& out){
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || v < 0) return false;
  out = static_cast<std::size_t>(v);
  return true;
}

int main(int argc, char** argv){
  std::string dir, out_path, tick_list;
  bool show_warnings = false;
  vs::config::ScreenerConfig cfg;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if ((a=="-d"||a=="--dir") && i+1<argc) dir = argv[++i];
    else if ((a=="-t"||a=="--tickers") && i+1<argc) tick_list = argv[++i];
    else if ((a=="-o"||a=="--out") && i+1<argc) out_path = argv[++i];
    else if (a=="--min-obs" && i+1<argc) {
      if (!parse_size(argv[++i], cfg.min_observations)) { usage(argv[0]); return 1; }
    }
    else if (a=="--threads" && i+1<argc) {
      if (!parse_size(argv[++i], cfg.n_threads)) { usage(argv[0]); return 1; }
    }
    else if (a=="--window" && i+1<argc) {
      cfg.rank_window = argv[++i];
      if (!vs::window::parse_window_spec(cfg.rank_window)) {
        std::cerr << "error: fenetre invalide '" << cfg.rank_window << "' (ex: 1Y, 6M, YTD)\n";
        return 1;
      }
    }
    else if (a=="--ytd" && i+1<argc) {
      auto p = vs::config::parse_ytd_policy(argv[++i]);
      if (!p) { std::cerr << "error: --ytd attend last|wall\n"; return 1; }
      cfg.window.ytd_policy = *p;
    }
    else if (a=="-w"||a=="--show-warnings") show_warnings = true;
    else if (a=="-h"||a=="--help"){ usage(argv[0]); return 0; }
    else if (dir.empty()) dir = a;
  }
  if (dir.empty()) { usage(argv[0]); return 1; }

  vs::io::CsvDirectorySource src(dir);
  const auto tickers = tick_list.empty() ? src.list_tickers() : parse_list(tick_list);
  if (tickers.empty()) {
    std::cerr << "error: aucun fichier de serie dans " << dir << "\n";
    return 2;
  }

  const auto rep = vs::screener::build_screener(tickers, src, cfg);

  if (show_warnings) {
    for (const auto& o : rep.outcomes) {
      if (o.reason == vs::screener::Reason::None) continue;
      std::cerr << "[skip] " << o.ticker << ": " << vs::screener::to_string(o.reason);
      if (!o.message.empty()) std::cerr << " (" << o.message << ")";
      std::cerr << "\n";
    }
  }

  std::cout << "Tickers: " << rep.outcomes.size()
            << "  eligible: " << rep.rows.size() << "\n";
  if (rep.empty()) {
    std::cout << "No data: aucun ticker eligible.\n";
    return 3;
  }

  // presentation : pourcentages arrondis (le moteur renvoie des fractions)
  std::cout << std::left << std::setw(10) << "Ticker"
            << std::right << std::setw(12) << "Current IV"
            << std::setw(12) << "IV Rank"
            << std::setw(10) << "IV/HV" << "\n";
  std::cout << std::fixed;
  for (const auto& r : rep.rows) {
    std::cout << std::left << std::setw(10) << r.ticker << std::right
              << std::setw(11) << std::setprecision(2) << 100.0*r.current_iv << "%"
              << std::setw(11) << std::setprecision(2) << 100.0*r.iv_rank << "%"
              << std::setw(10) << std::setprecision(2) << r.iv_hv_ratio << "\n";
  }

  if (!out_path.empty()) {
    std::ofstream f(out_path);
    if (!f) { std::cerr << "error: impossible d'ecrire " << out_path << "\n"; return 2; }
    f.precision(10);
    f << "ticker,current_iv,iv_rank,iv_hv_ratio\n";
    for (const auto& r : rep.rows) {
      f << r.ticker << "," << r.current_iv << "," << r.iv_rank << "," << r.iv_hv_ratio << "\n";
    }
    std::cout << "Exported: " << out_path << "\n";
  }
  return 0;
}
