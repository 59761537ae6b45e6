#pragma once
/**
 * @file screener_config.hpp
 * @brief Configuration du screener de volatilité et de la résolution des fenêtres.
 *
 * # Contenu
 * - min_observations : nombre minimal d'observations dans la fenêtre de rang
 *   (en dessous, min/max ne sont pas fiables ⇒ ticker inéligible).
 * - rank_window      : spécificateur de la fenêtre glissante du rang d'IV ("1Y").
 * - ytd_policy       : définition de "l'année en cours" pour YTD.
 * - n_threads        : 1 = séquentiel ; >1 = découpage en lots via std::async.
 * - today            : date "murale" imposée (tests) ; sinon Date::today().
 *
 * # YTD
 * - LastObservationYear (défaut) : année de la dernière date de la série.
 *   Ne renvoie jamais vide sur une série non vide.
 * - WallClockYear : année de l'horloge murale. Peut renvoyer vide si le cache
 *   est ancien (dernière date dans une année précédente).
 */

#include <cstddef>
#include <optional>
#include <string>

#include <vs/core/date.hpp>

namespace vs {
namespace config {

enum class YtdPolicy { LastObservationYear, WallClockYear };

/// @brief Options de résolution des fenêtres (partagées screener / graphiques).
struct WindowOptions {
  YtdPolicy ytd_policy = YtdPolicy::LastObservationYear;
  std::optional<vs::core::Date> today; ///< Surcharge de l'horloge (WallClockYear).

  /// @return today si fourni, sinon la date UTC courante.
  vs::core::Date effective_today() const {
    return today ? *today : vs::core::Date::today();
  }
};

/// @brief Configuration d'un passage du screener.
struct ScreenerConfig {
  std::size_t   min_observations = 20;   ///< Seuil d'historique (fenêtre de rang).
  std::string   rank_window      = "1Y"; ///< Fenêtre glissante du rang d'IV.
  WindowOptions window;                  ///< YTD / horloge.
  std::size_t   n_threads        = 1;    ///< Parallélisme de la boucle par ticker.

  /// @brief Empreinte texte des paramètres qui influencent le résultat (clé de cache).
  std::string fingerprint() const {
    std::string fp = "min=" + std::to_string(min_observations) + ";win=" + rank_window;
    fp += (window.ytd_policy == YtdPolicy::WallClockYear) ? ";ytd=wall" : ";ytd=last";
    if (window.today) fp += ";today=" + window.today->to_string();
    else if (window.ytd_policy == YtdPolicy::WallClockYear)
      fp += ";year=" + std::to_string(vs::core::Date::today().year());
    return fp;
  }
};

/// @brief "last" | "wall" (insensible à la casse). std::nullopt sinon.
std::optional<YtdPolicy> parse_ytd_policy(const std::string& s);

/// @brief Inverse de parse_ytd_policy.
const char* to_string(YtdPolicy p) noexcept;

} // namespace config
} // namespace vs
