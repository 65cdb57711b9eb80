#pragma once
/**
 * @file european_option.hpp
 * @brief Option européenne (call ou put) évaluée par Black–Scholes.
 *
 * Valeur immuable : paramètres + type. price()/delta() délèguent aux
 * formules fermées de analytic_bs.hpp, sans cache.
 *
 * - Constructeur : aucune validation (NaN/Inf propagés comme les formules).
 * - checked()    : valide d’abord (market::validate), lève InvalidParameter.
 */

#include <bse/market/option_params.hpp>

namespace bse {
namespace pricing {

class EuropeanOption {
public:
  EuropeanOption(market::OptionParams params, market::OptionType type) noexcept
    : params_(params), type_(type) {}

  /// @throws core::InvalidParameter si un paramètre est hors domaine.
  static EuropeanOption checked(market::OptionParams params, market::OptionType type);

  [[nodiscard]] double price() const noexcept;
  [[nodiscard]] double delta() const noexcept;

  const market::OptionParams& params() const noexcept { return params_; }
  market::OptionType          type()   const noexcept { return type_; }
  bool is_call() const noexcept { return type_ == market::OptionType::Call; }

private:
  market::OptionParams params_;
  market::OptionType   type_;
};

} // namespace pricing
} // namespace bse
