#include "vs/io/series_csv.hpp"
#include <fstream>
#include <unordered_map>
#include <algorithm>
#include <filesystem>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}
static inline std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double tolérant ("" / "nan" / texte -> NaN)
static double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

// récupère index de colonne via map (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

// volatilité exploitable : finie et >= 0, sinon NaN
static double sanitize_vol(double v, bool& rejected) {
  rejected = false;
  if (std::isnan(v)) return v;
  if (!std::isfinite(v) || v < 0.0) {
    rejected = true;
    return std::numeric_limits<double>::quiet_NaN();
  }
  return v;
}

} // namespace

namespace vs::io {

std::optional<vs::market::TickerSeries>
read_series_csv(const std::string& path,
                std::size_t* num_ignored,
                std::vector<std::string>* warnings)
{
  using vs::market::Observation;
  if (num_ignored) *num_ignored = 0;

  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Impossible d'ouvrir le fichier: " + path);
    return std::nullopt;
  }

  const std::string ticker = upper(std::filesystem::path(path).stem().string());

  std::string line;
  bool header_seen = false;
  int iDate = -1, iHv = -1, iIv = -1;
  std::vector<Observation> obs;
  std::size_t lineno = 0;

  while (std::getline(f, line)) {
    ++lineno;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      std::unordered_map<std::string,int> idx;
      for (int i=0;i<(int)cells.size();++i) idx[lower(cells[i])] = i;

      iDate = col(idx, {"date","day","timestamp","datetime"});
      // export d'index sans nom : première cellule vide
      if (iDate < 0 && !cells.empty() && cells[0].empty()) iDate = 0;
      iHv = col(idx, {"hv_30d","hv30","hv","historical_vol"});
      iIv = col(idx, {"iv_30d","iv30","iv","implied_vol"});

      if (iDate < 0) {
        if (warnings) warnings->push_back("Colonne date absente: " + path);
        return std::nullopt;
      }
      if (iHv < 0 && warnings) warnings->push_back("Colonne HV absente: " + path);
      if (iIv < 0 && warnings) warnings->push_back("Colonne IV absente: " + path);
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    auto d = vs::core::Date::parse_iso(get(iDate));
    if (!d) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne " + std::to_string(lineno) +
                                        " ignorée: date invalide '" + get(iDate) + "'");
      continue;
    }

    Observation o;
    o.date = *d;
    bool bad_hv = false, bad_iv = false;
    o.hv_30d = sanitize_vol(parse_double(get(iHv)), bad_hv);
    o.iv_30d = sanitize_vol(parse_double(get(iIv)), bad_iv);
    if (warnings && (bad_hv || bad_iv)) {
      warnings->push_back("Ligne " + std::to_string(lineno) +
                          ": volatilité négative ou non finie remplacée par NaN");
    }
    obs.push_back(o);
  }

  if (!header_seen) {
    if (warnings) warnings->push_back("Fichier vide: " + path);
    return std::nullopt;
  }

  std::size_t dups = 0;
  auto series = vs::market::TickerSeries::from_unsorted(ticker, std::move(obs),
                                                        iHv >= 0, iIv >= 0, &dups);
  if (dups > 0) {
    if (num_ignored) *num_ignored += dups;
    if (warnings) warnings->push_back(std::to_string(dups) +
                                      " date(s) en double: dernière ligne conservée");
  }
  return series;
}

bool write_series_csv(const std::string& path,
                      const std::vector<vs::market::Observation>& rows)
{
  std::ofstream f(path);
  if (!f) return false;
  f.precision(10);
  f << "date,hv_30d,iv_30d\n";
  for (const auto& o : rows) {
    f << o.date.to_string() << ",";
    if (std::isfinite(o.hv_30d)) f << o.hv_30d;
    f << ",";
    if (std::isfinite(o.iv_30d)) f << o.iv_30d;
    f << "\n";
  }
  return static_cast<bool>(f);
}

} // namespace vs::io
