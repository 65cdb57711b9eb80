#pragma once
/**
 * @file analytic_bs.hpp
 * @brief Formules fermées Black–Scholes : prix et delta d’options européennes.
 *
 * # Modèle (mesure Q, sans dividende)
 * dS_t / S_t = r dt + sigma dW_t
 *
 * # Notations
 * d1 = [ ln(S/K) + (r + 0.5*sigma^2) T ] / (sigma * sqrt(T))
 * d2 = d1 - sigma * sqrt(T)
 *
 * Prix (valeurs au temps 0) :
 *   Call = S * N(d1) - K * e^{-rT} * N(d2)
 *   Put  = K * e^{-rT} * N(-d2) - S * N(-d1)
 * Deltas :
 *   Delta_call = N(d1)        ∈ [0, 1]
 *   Delta_put  = N(d1) - 1    ∈ [-1, 0]
 *
 * # Domaine
 * - Aucune validation ici : sigma == 0 ou T == 0 donnent 0/0, S ou K <= 0
 *   donnent un log non défini ⇒ NaN/Inf propagés jusqu’au résultat.
 * - Pour échouer tôt : market::validate() avant l’appel.
 * - Chaque fonction recalcule d1/d2 (pas d’état partagé, thread-safe).
 *
 * # Unités
 * - T en années fractionnelles (ex : 0.5 = 6 mois).
 * - Taux continus annualisés en décimal.
 */

#include <bse/market/option_params.hpp>

namespace bse {
namespace pricing {

/// @brief Termes intermédiaires de la formule.
struct D1D2 {
  double d1;
  double d2;
};

/**
 * @brief Calcule d1 et d2.
 * @param S     Spot (>0)
 * @param K     Strike (>0)
 * @param r     Taux sans risque (décimal, peut être < 0)
 * @param sigma Volatilité (>0)
 * @param T     Maturité en années (>0)
 */
D1D2 compute_d1_d2(double S, double K, double r, double sigma, double T) noexcept;

/// @brief Prix Black–Scholes d’un call européen.
double call_price(double S, double K, double r, double sigma, double T) noexcept;

/// @brief Prix Black–Scholes d’un put européen.
double put_price(double S, double K, double r, double sigma, double T) noexcept;

/// @brief Delta d’un call : N(d1).
double call_delta(double S, double K, double r, double sigma, double T) noexcept;

/// @brief Delta d’un put : N(d1) - 1.
double put_delta(double S, double K, double r, double sigma, double T) noexcept;

// Variantes sur OptionParams, dispatch Call/Put
double price(market::OptionType type, const market::OptionParams& p) noexcept;
double delta(market::OptionType type, const market::OptionParams& p) noexcept;

/// @brief Les quatre sorties affichées par les front-ends.
struct BsReport {
  double call_price;
  double put_price;
  double call_delta;
  double put_delta;
};

/// @brief Évalue prix et deltas call/put pour un jeu de paramètres.
[[nodiscard]] BsReport evaluate_bs(const market::OptionParams& p) noexcept;

/**
 * @brief Écart de parité put–call.
 * @return gap = call - put - ( S - K * e^{-rT} )   (≈ 0 en BS sans frictions)
 */
double put_call_parity_gap(double call, double put,
                           double S, double K, double r, double T) noexcept;

} // namespace pricing
} // namespace bse
