#pragma once
/**
 * @file errors.hpp
 * @brief Erreurs remontées par la validation et le parsing des entrées.
 *
 * - InvalidParameter : paramètre hors domaine (S, K, sigma, T <= 0, valeur non finie).
 * - ParseError       : argument de ligne de commande non interprétable (mode strict).
 *
 * Les formules fermées ne lèvent jamais : ces erreurs ne viennent que
 * des couches de validation (market::validate, io::parse_pricing_args).
 */

#include <cstddef>   // std::size_t
#include <stdexcept>
#include <string>

namespace bse {
namespace core {

/// @brief Paramètre de pricing hors de son domaine de définition.
class InvalidParameter : public std::invalid_argument {
public:
  /// @param name   Nom du paramètre ("S", "K", "r", "sigma", "T").
  /// @param value  Valeur rejetée.
  /// @param reason Contrainte violée (ex: "must be finite and > 0").
  InvalidParameter(std::string name, double value, std::string reason);

  const std::string& name()   const noexcept { return name_; }
  double             value()  const noexcept { return value_; }
  const std::string& reason() const noexcept { return reason_; }

private:
  std::string name_;
  double      value_;
  std::string reason_;
};

/// @brief Argument de ligne de commande invalide.
/// @details index = position dans argv (1 = premier argument utilisateur).
class ParseError : public std::runtime_error {
public:
  ParseError(std::size_t index, std::string text, std::string reason);

  std::size_t        index()  const noexcept { return index_; }
  const std::string& text()   const noexcept { return text_; }
  const std::string& reason() const noexcept { return reason_; }

private:
  std::size_t index_;
  std::string text_;
  std::string reason_;
};

} // namespace core
} // namespace bse
