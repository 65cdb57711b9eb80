#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include <bse/market/option_params.hpp>

namespace bse::io {

// Une ligne de chaîne d’options à évaluer.
struct OptionRow {
  std::string          id;    // optionnel ("" si absent)
  market::OptionType   type = market::OptionType::Call;
  market::OptionParams params{};
};

// Lit une chaîne d’options CSV (en-tête obligatoire, lignes "#" et vides ignorées).
// Colonnes (synonymes, casse libre) : id|symbol, type|cp|callput, s|spot|s0,
// k|strike, r|rate, sigma|vol|volatility, t|maturity|expiry.
// Type vide ⇒ call. Lignes rejetées : champ non numérique, type inconnu,
// paramètre hors domaine (market::validate).
// Retourne uniquement les lignes **valides** ; num_ignored/warnings optionnels.
std::vector<OptionRow>
read_option_csv(std::istream& in,
                std::size_t* num_ignored = nullptr,
                std::vector<std::string>* warnings = nullptr);

// Variante fichier. Fichier introuvable ⇒ vecteur vide + warning.
std::vector<OptionRow>
read_option_csv(const std::string& path,
                std::size_t* num_ignored = nullptr,
                std::vector<std::string>* warnings = nullptr);

} // namespace bse::io
