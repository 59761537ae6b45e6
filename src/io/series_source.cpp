#include "vs/io/series_source.hpp"
#include "vs/io/series_csv.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

inline std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
  return s;
}

inline bool is_csv(const fs::path& p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
  return ext == ".csv";
}

// Fichiers .csv du répertoire, sans exception (increment(ec) au lieu de ++).
// false si le répertoire est illisible ; une erreur en cours de parcours
// arrête le listing sur ce qui a déjà été lu.
bool csv_entries(const std::string& dir, std::vector<fs::directory_entry>& out) {
  out.clear();
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return false;
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    std::error_code ec2;
    if (it->is_regular_file(ec2) && is_csv(it->path())) out.push_back(*it);
  }
  return true;
}

} // namespace

namespace vs::io {

// ---- CsvDirectorySource ---------------------------------------------------

CsvDirectorySource::CsvDirectorySource(std::string dir) : dir_(std::move(dir)) {}

std::string CsvDirectorySource::path_for(const std::string& ticker) const {
  const std::string key = upper(ticker);
  const fs::path canonical = fs::path(dir_) / (key + ".csv");
  std::error_code ec;
  if (fs::is_regular_file(canonical, ec)) return canonical.string();

  // nom de fichier en casse libre (abc.csv, Abc.CSV...)
  std::vector<fs::directory_entry> entries;
  if (csv_entries(dir_, entries)) {
    for (const auto& e : entries) {
      if (upper(e.path().stem().string()) == key) return e.path().string();
    }
  }
  return canonical.string();
}

FetchResult CsvDirectorySource::fetch(const std::string& ticker) const {
  FetchResult res;
  const std::string path = path_for(ticker);

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    res.status  = FetchStatus::NotFound;
    res.message = "Fichier introuvable pour " + ticker + ": " + path;
    return res;
  }

  std::size_t ignored = 0;
  auto s = read_series_csv(path, &ignored, &res.warnings);
  if (!s) {
    res.status  = FetchStatus::Failed;
    res.message = res.warnings.empty() ? ("Lecture impossible: " + path) : res.warnings.back();
    return res;
  }
  res.status = FetchStatus::Ok;
  res.series = std::move(*s);
  if (ignored > 0) res.message = std::to_string(ignored) + " ligne(s) ignorée(s)";
  return res;
}

std::vector<std::string> CsvDirectorySource::list_tickers() const {
  std::vector<std::string> out;
  std::vector<fs::directory_entry> entries;
  if (!csv_entries(dir_, entries)) return out; // répertoire absent : aucun ticker
  for (const auto& e : entries) out.push_back(upper(e.path().stem().string()));
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::string CsvDirectorySource::snapshot_id() const {
  // nb de fichiers + date de modification la plus récente
  std::size_t n = 0;
  fs::file_time_type latest{};
  std::vector<fs::directory_entry> entries;
  if (!csv_entries(dir_, entries)) return dir_ + "|missing";
  for (const auto& e : entries) {
    ++n;
    std::error_code ec;
    auto t = e.last_write_time(ec);
    if (!ec && t > latest) latest = t;
  }
  return dir_ + "|" + std::to_string(n) + "|" +
         std::to_string(latest.time_since_epoch().count());
}

// ---- InMemorySource -------------------------------------------------------

void InMemorySource::put(vs::market::TickerSeries s) {
  const std::string key = upper(s.ticker());
  series_.insert_or_assign(key, std::move(s));
  ++revision_;
}

FetchResult InMemorySource::fetch(const std::string& ticker) const {
  FetchResult res;
  auto it = series_.find(upper(ticker));
  if (it == series_.end()) {
    res.status  = FetchStatus::NotFound;
    res.message = "Ticker inconnu: " + ticker;
    return res;
  }
  res.status = FetchStatus::Ok;
  res.series = it->second;
  return res;
}

std::vector<std::string> InMemorySource::list_tickers() const {
  std::vector<std::string> out;
  out.reserve(series_.size());
  for (const auto& kv : series_) out.push_back(kv.first);
  return out; // std::map : déjà trié
}

std::string InMemorySource::snapshot_id() const {
  return "mem|" + std::to_string(revision_);
}

} // namespace vs::io
