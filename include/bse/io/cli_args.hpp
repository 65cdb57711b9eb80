#pragma once
/**
 * @file cli_args.hpp
 * @brief Lecture de la ligne de commande de bs_price.
 *
 * Forme : bs_price [options] [S K r sigma T]
 *
 * Options : --strict, --verbose | -v, --precision N, -h | --help
 *
 * # Politique Lenient (défaut)
 * - 0 positionnel : paramètres par défaut.
 * - >= 5 positionnels : les 5 premiers sont lus, le reste ignoré.
 * - 1 à 4 positionnels : tous les paramètres restent par défaut.
 * - Nombre illisible : la valeur par défaut de ce paramètre est conservée.
 * - Option inconnue : ignorée.
 * Chaque substitution ajoute un message dans `warnings` (si fourni).
 *
 * # Politique Strict (--strict)
 * - Tout ce qui serait un warning lève core::ParseError (index = position
 *   dans argv, 1 = premier argument).
 * - Les paramètres lus sont validés : core::InvalidParameter si hors domaine.
 */

#include <optional>
#include <string>
#include <vector>

#include <bse/config/pricing_config.hpp>

namespace bse::io {

/// @brief Parse les arguments (sans le nom du programme).
/// @throws core::ParseError, core::InvalidParameter (mode strict uniquement)
config::PricingConfig
parse_pricing_args(const std::vector<std::string>& args,
                   std::vector<std::string>* warnings = nullptr);

/// @brief Variante argc/argv (argv[0] ignoré).
config::PricingConfig
parse_pricing_args(int argc, const char* const* argv,
                   std::vector<std::string>* warnings = nullptr);

/// @brief Nombre décimal complet ("1e-2", " 0.5 ") ; nullopt si texte résiduel.
std::optional<double> parse_number(const std::string& text);

/// @brief Texte d’aide de bs_price.
std::string pricing_usage(const std::string& prog);

} // namespace bse::io
