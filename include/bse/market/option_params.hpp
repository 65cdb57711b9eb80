#pragma once
/**
 * @file option_params.hpp
 * @brief Paramètres d’une option européenne sous Black–Scholes (sans dividende).
 *
 * # Contenu
 * - S     : spot (> 0).
 * - K     : strike (> 0).
 * - r     : taux sans risque continu annualisé (décimal, peut être négatif).
 * - sigma : volatilité annualisée (> 0).
 * - T     : maturité en années fractionnelles (> 0).
 *
 * # Domaine
 * La structure n’impose rien à la construction : les formules propagent
 * NaN/Inf si le domaine est violé. `validate()` permet d’échouer tôt.
 */

#include <string>

namespace bse {
namespace market {

/// @brief Type d’option vanille (Call ou Put).
enum class OptionType {
  Call, ///< Droit d’acheter le sous-jacent au strike.
  Put   ///< Droit de vendre le sous-jacent au strike.
};

/// @brief Les cinq scalaires d’une évaluation Black–Scholes.
struct OptionParams {
  double S;     ///< Spot (> 0).
  double K;     ///< Strike (> 0).
  double r;     ///< Taux sans risque (décimal).
  double sigma; ///< Volatilité (> 0).
  double T;     ///< Maturité en années (> 0).
};

/// @brief Jeu par défaut : S=100, K=100, r=5 %, sigma=20 %, T=1 an.
constexpr OptionParams default_params() noexcept {
  return OptionParams{100.0, 100.0, 0.05, 0.20, 1.0};
}

/**
 * @brief Vérifie le domaine de définition de la formule.
 * @details Ordre de contrôle : S, K, r, sigma, T (la première violation lève).
 *   - S, K, sigma, T : finis et > 0
 *   - r : fini
 * @throws core::InvalidParameter
 */
void validate(const OptionParams& p);

/// @return "call" ou "put".
const char* to_string(OptionType type) noexcept;

/// @brief Interprète c/call/p/put (insensible à la casse, espaces ignorés).
/// @return false si le texte n’est pas reconnu (out inchangé).
bool parse_option_type(const std::string& text, OptionType* out);

} // namespace market
} // namespace bse
