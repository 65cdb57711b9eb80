#include <bse/pricing/analytic_bs.hpp>
#include <bse/core/normal.hpp>

#include <cmath> // log, exp, sqrt

namespace bse {
namespace pricing {

using core::normal_cdf;

D1D2 compute_d1_d2(double S, double K, double r, double sigma, double T) noexcept {
  const double sigSqrtT = sigma * std::sqrt(T);
  const double logm     = std::log(S / K);
  const double muT      = (r + 0.5 * sigma * sigma) * T;

  const double d1 = (logm + muT) / sigSqrtT;
  return D1D2{d1, d1 - sigSqrtT};
}

double call_price(double S, double K, double r, double sigma, double T) noexcept {
  const D1D2 d = compute_d1_d2(S, K, r, sigma, T);
  const double df = std::exp(-r * T);
  return S * normal_cdf(d.d1) - K * df * normal_cdf(d.d2);
}

double put_price(double S, double K, double r, double sigma, double T) noexcept {
  const D1D2 d = compute_d1_d2(S, K, r, sigma, T);
  const double df = std::exp(-r * T);
  return K * df * normal_cdf(-d.d2) - S * normal_cdf(-d.d1);
}

double call_delta(double S, double K, double r, double sigma, double T) noexcept {
  return normal_cdf(compute_d1_d2(S, K, r, sigma, T).d1);
}

double put_delta(double S, double K, double r, double sigma, double T) noexcept {
  return normal_cdf(compute_d1_d2(S, K, r, sigma, T).d1) - 1.0;
}

double price(market::OptionType type, const market::OptionParams& p) noexcept {
  return (type == market::OptionType::Call)
           ? call_price(p.S, p.K, p.r, p.sigma, p.T)
           : put_price (p.S, p.K, p.r, p.sigma, p.T);
}

double delta(market::OptionType type, const market::OptionParams& p) noexcept {
  return (type == market::OptionType::Call)
           ? call_delta(p.S, p.K, p.r, p.sigma, p.T)
           : put_delta (p.S, p.K, p.r, p.sigma, p.T);
}

BsReport evaluate_bs(const market::OptionParams& p) noexcept {
  BsReport rep;
  rep.call_price = call_price(p.S, p.K, p.r, p.sigma, p.T);
  rep.put_price  = put_price (p.S, p.K, p.r, p.sigma, p.T);
  rep.call_delta = call_delta(p.S, p.K, p.r, p.sigma, p.T);
  rep.put_delta  = put_delta (p.S, p.K, p.r, p.sigma, p.T);
  return rep;
}

double put_call_parity_gap(double call, double put,
                           double S, double K, double r, double T) noexcept {
  const double df = std::exp(-r * T);
  // gap = call - put - ( S - K e^{-rT} )
  return call - put - (S - K * df);
}

} // namespace pricing
} // namespace bse
