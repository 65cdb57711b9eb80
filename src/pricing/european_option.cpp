#include <bse/pricing/european_option.hpp>
#include <bse/pricing/analytic_bs.hpp>

namespace bse {
namespace pricing {

EuropeanOption EuropeanOption::checked(market::OptionParams params, market::OptionType type) {
  market::validate(params);
  return EuropeanOption(params, type);
}

double EuropeanOption::price() const noexcept {
  return pricing::price(type_, params_);
}

double EuropeanOption::delta() const noexcept {
  return pricing::delta(type_, params_);
}

} // namespace pricing
} // namespace bse
