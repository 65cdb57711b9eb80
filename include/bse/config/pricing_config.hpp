#pragma once
/**
 * @file pricing_config.hpp
 * @brief Configuration d’une évaluation en ligne de commande.
 *
 * # Contenu
 * - params    : S, K, r, sigma, T (défauts : 100, 100, 0.05, 0.2, 1.0).
 * - policy    : Lenient (argument illisible ⇒ valeur par défaut, silencieux)
 *               ou Strict (ParseError / InvalidParameter).
 * - precision : nombre de décimales affichées (4 par défaut).
 * - verbose   : si true, les substitutions par défaut sont signalées sur stderr.
 */

#include <bse/market/option_params.hpp>

namespace bse {
namespace config {

enum class ParsePolicy { Lenient, Strict };

/// @brief Configuration d’un run bs_price.
struct PricingConfig {
  market::OptionParams params; ///< Paramètres de l’option.
  ParsePolicy policy;          ///< Politique sur argument illisible.
  int  precision;              ///< Décimales en sortie (>= 0).
  bool verbose;                ///< Warnings sur stderr.
  bool show_help;              ///< -h / --help demandé.

  /// @brief Construit une configuration avec valeurs par défaut.
  PricingConfig(market::OptionParams params = market::default_params(),
                ParsePolicy policy = ParsePolicy::Lenient,
                int  precision = 4,
                bool verbose = false,
                bool show_help = false) noexcept
      : params(params),
        policy(policy),
        precision(precision),
        verbose(verbose),
        show_help(show_help) {}
};

} // namespace config
} // namespace bse
