#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <vs/market/series.hpp>

namespace vs::io {

enum class FetchStatus { Ok, NotFound, Failed };

struct FetchResult {
  FetchStatus status{FetchStatus::NotFound};
  vs::market::TickerSeries series;   // valide si status == Ok
  std::string message;               // diagnostic (fichier absent, erreur de lecture...)
  std::vector<std::string> warnings; // avertissements de lecture non bloquants

  bool ok() const noexcept { return status == FetchStatus::Ok; }
};

// Fournisseur de séries par ticker (accès en lecture seule).
// fetch() ne doit pas lever pour un ticker absent : il renvoie NotFound.
class TickerSeriesSource {
public:
  virtual ~TickerSeriesSource() = default;

  virtual FetchResult fetch(const std::string& ticker) const = 0;

  // Tickers disponibles, triés.
  virtual std::vector<std::string> list_tickers() const = 0;

  // Identifiant opaque qui change quand les données changent (clé de cache).
  virtual std::string snapshot_id() const = 0;
};

// Un fichier <TICKER>.csv par ticker dans un répertoire.
class CsvDirectorySource : public TickerSeriesSource {
public:
  explicit CsvDirectorySource(std::string dir);

  FetchResult fetch(const std::string& ticker) const override;
  std::vector<std::string> list_tickers() const override;
  std::string snapshot_id() const override;

  const std::string& directory() const noexcept { return dir_; }
  // <dir>/<TICKER>.csv ; à défaut, fichier dont le nom correspond sans tenir compte de la casse.
  std::string path_for(const std::string& ticker) const;

private:
  std::string dir_;
};

// Séries déjà en mémoire (tests, appelants qui possèdent les données).
class InMemorySource : public TickerSeriesSource {
public:
  void put(vs::market::TickerSeries s);

  FetchResult fetch(const std::string& ticker) const override;
  std::vector<std::string> list_tickers() const override;
  std::string snapshot_id() const override;

private:
  std::map<std::string, vs::market::TickerSeries> series_;
  std::uint64_t revision_{0};
};

} // namespace vs::io
