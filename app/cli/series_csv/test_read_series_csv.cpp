#include "vs/io/series_csv.hpp"
#include "vs/io/series_source.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void write_file(const fs::path& p, const std::string& content) {
  std::ofstream f(p);
  f << content;
}

int main() {
  const fs::path dir = fs::temp_directory_path() / "volscreen_test_read_series_csv";
  fs::remove_all(dir);
  fs::create_directories(dir);

  // 1) index sans nom, désordre, doublon, ligne invalide, NaN, négatif, commentaire, CRLF
  write_file(dir / "abc.csv",
    ",HV_30D,IV_30D\r\n"
    "# cache du 2024-03-15\r\n"
    "2024-03-14,0.21,0.30\r\n"
    "2024-03-12 00:00:00,0.20,\r\n"
    "not-a-date,0.5,0.5\r\n"
    "2024-03-13,-0.1,0.28\r\n"
    "\r\n"
    "2024-03-14,0.22,0.31\r\n"
    "\"2024-03-15\",\"0.23\",nan\r\n");

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  auto s = vs::io::read_series_csv((dir / "abc.csv").string(), &ignored, &warnings);
  assert(s.has_value());
  assert(s->ticker() == "ABC");
  assert(s->has_hv_column() && s->has_iv_column());
  assert(s->size() == 4);
  assert(ignored == 2); // date invalide + doublon
  assert(s->front().date.to_string() == "2024-03-12");
  assert(std::isnan(s->front().iv_30d));
  assert(std::isnan(s->observations()[1].hv_30d));      // négatif -> NaN
  assert(std::abs(s->observations()[2].hv_30d - 0.22) < 1e-12); // dernière occurrence
  assert(std::abs(s->back().hv_30d - 0.23) < 1e-12);
  assert(std::isnan(s->back().iv_30d));

  auto has_warn = [&](const std::string& needle){
    return std::any_of(warnings.begin(), warnings.end(),
                       [&](const std::string& w){ return w.find(needle) != std::string::npos; });
  };
  assert(has_warn("date invalide"));
  assert(has_warn("double"));
  assert(has_warn("NaN"));

  // 2) colonne IV absente : HV seule
  write_file(dir / "HVONLY.csv", "Date,hv\n2024-01-02,0.2\n2024-01-03,0.21\n");
  auto hv = vs::io::read_series_csv((dir / "HVONLY.csv").string());
  assert(hv && hv->has_hv_column() && !hv->has_iv_column() && hv->size() == 2);

  // 3) sans colonne date / fichier absent / fichier vide
  write_file(dir / "NODATE.csv", "hv_30d,iv_30d\n0.2,0.3\n");
  assert(!vs::io::read_series_csv((dir / "NODATE.csv").string()));
  assert(!vs::io::read_series_csv((dir / "does_not_exist.csv").string()));
  write_file(dir / "EMPTYFILE.csv", "");
  assert(!vs::io::read_series_csv((dir / "EMPTYFILE.csv").string()));

  // 4) écriture puis relecture d'une fenêtre
  {
    const auto out = (dir / "copy.csv").string();
    assert(vs::io::write_series_csv(out, s->observations()));
    auto back = vs::io::read_series_csv(out);
    assert(back && back->size() == s->size());
    assert(std::isnan(back->front().iv_30d));
  }

  // 5) source répertoire
  {
    vs::io::CsvDirectorySource src(dir.string());
    auto tickers = src.list_tickers();
    assert(std::find(tickers.begin(), tickers.end(), "ABC") != tickers.end());
    assert(std::is_sorted(tickers.begin(), tickers.end()));

    auto ok = src.fetch("abc");
    assert(ok.status == vs::io::FetchStatus::Ok && ok.series.size() == 4);
    assert(src.fetch("ZZZ").status == vs::io::FetchStatus::NotFound);
    assert(src.fetch("NODATE").status == vs::io::FetchStatus::Failed);

    const std::string snap1 = src.snapshot_id();
    assert(snap1 == src.snapshot_id());
    write_file(dir / "NEW.csv", "date,hv_30d,iv_30d\n2024-01-02,0.2,0.3\n");
    assert(src.snapshot_id() != snap1); // nb de fichiers changé

    // sous-répertoire nommé *.csv et fichier non CSV : ignorés
    fs::create_directories(dir / "SUB.csv");
    write_file(dir / "notes.txt", "x\n");
    tickers = src.list_tickers();
    assert(std::find(tickers.begin(), tickers.end(), "SUB") == tickers.end());
    assert(std::find(tickers.begin(), tickers.end(), "NOTES") == tickers.end());
    assert(std::find(tickers.begin(), tickers.end(), "NEW") != tickers.end());
    assert(src.fetch("SUB").status == vs::io::FetchStatus::NotFound);

    // répertoire absent : listing vide, snapshot stable, aucune exception
    vs::io::CsvDirectorySource missing((dir / "nope").string());
    assert(missing.list_tickers().empty());
    assert(missing.snapshot_id() == (dir / "nope").string() + "|missing");
    assert(missing.fetch("ABC").status == vs::io::FetchStatus::NotFound);
  }

  fs::remove_all(dir);
  std::cout << "Series CSV OK.\n";
  return 0;
}
