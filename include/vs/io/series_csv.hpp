#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

#include <vs/market/series.hpp>

namespace vs::io {

// Lit la série quotidienne d'un ticker depuis un CSV (date, hv_30d, iv_30d).
// Colonnes reconnues (insensible à la casse, synonymes acceptés) :
//   date   : date | day | timestamp | "" (1re colonne d'index sans nom)
//   HV     : hv_30d | hv30 | hv | historical_vol
//   IV     : iv_30d | iv30 | iv | implied_vol
// Filtre/normalise : date illisible -> ligne ignorée ; cellule vide ou
// non numérique -> NaN ; valeur négative/non finie -> NaN (+ warning) ;
// date en double -> la dernière ligne gagne (+ warning). Trie par date.
// Retourne std::nullopt si le fichier est absent ou sans colonne date.
// Le ticker est le nom du fichier sans extension, en majuscules.
std::optional<vs::market::TickerSeries>
read_series_csv(const std::string& path,
                std::size_t* num_ignored = nullptr,
                std::vector<std::string>* warnings = nullptr);

// Écrit une série (ou une fenêtre) au format lu par read_series_csv.
// Retourne false si le fichier ne peut pas être ouvert.
bool write_series_csv(const std::string& path,
                      const std::vector<vs::market::Observation>& rows);

} // namespace vs::io
