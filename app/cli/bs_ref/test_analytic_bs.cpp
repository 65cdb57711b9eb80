#include "bse/pricing/analytic_bs.hpp"
#include "bse/pricing/european_option.hpp"
#include "bse/core/normal.hpp"
#include "bse/core/errors.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <vector>
#include <algorithm>

using namespace bse;

static bool approx(double a, double b, double tol) { return std::abs(a - b) < tol; }

int main() {
  // 1) Cas de référence S=K=100, r=5 %, sigma=20 %, T=1
  {
    const auto rep = pricing::evaluate_bs(market::default_params());
    assert(approx(rep.call_price, 10.4506, 1e-3));
    assert(approx(rep.put_price,   5.5735, 1e-3));
    assert(approx(rep.call_delta,  0.6368, 1e-3));
    assert(approx(rep.put_delta,  -0.3632, 1e-3));

    const auto d = pricing::compute_d1_d2(100.0, 100.0, 0.05, 0.20, 1.0);
    assert(approx(d.d1, 0.35, 1e-12));
    assert(approx(d.d2, 0.15, 1e-12));
  }

  // 2) Très ITM / très OTM
  assert(pricing::call_delta(200.0, 100.0, 0.05, 0.20, 1.0) > 0.99);
  assert(pricing::call_delta( 50.0, 100.0, 0.05, 0.20, 1.0) < 0.02);

  // 3) Parité put–call + identité des deltas sur une grille
  const std::vector<double> spots {50, 80, 100, 120, 200};
  const std::vector<double> strikes {60, 100, 140};
  const std::vector<double> rates {-0.01, 0.0, 0.05};
  const std::vector<double> vols {0.05, 0.2, 0.8};
  const std::vector<double> mats {0.1, 1.0, 5.0};
  double gapmax = 0.0;
  for (double S : spots) for (double K : strikes) for (double r : rates)
  for (double sig : vols) for (double T : mats) {
    const double c = pricing::call_price(S, K, r, sig, T);
    const double p = pricing::put_price (S, K, r, sig, T);
    const double gap = pricing::put_call_parity_gap(c, p, S, K, r, T);
    gapmax = std::max(gapmax, std::abs(gap));
    assert(std::abs(c - p - (S - K * std::exp(-r * T))) < 1e-9);

    const double dc = pricing::call_delta(S, K, r, sig, T);
    const double dp = pricing::put_delta (S, K, r, sig, T);
    assert(approx(dc - dp, 1.0, 1e-12));
    assert(dc >= 0.0 && dc <= 1.0);
    assert(dp >= -1.0 && dp <= 0.0);
  }

  // 4) Delta du call croissant en S
  {
    double prev = 0.0;
    for (double S = 1.0; S <= 400.0; S += 0.5) {
      const double dc = pricing::call_delta(S, 100.0, 0.05, 0.20, 1.0);
      assert(dc >= prev);
      prev = dc;
    }
  }

  // 5) ATM, r=0, T→0+ : prix → 0
  {
    double prevC = 1e9, prevP = 1e9;
    for (double T : {1e-2, 1e-4, 1e-6, 1e-8, 1e-10}) {
      const double c = pricing::call_price(100.0, 100.0, 0.0, 0.20, T);
      const double p = pricing::put_price (100.0, 100.0, 0.0, 0.20, T);
      assert(c >= 0.0 && c < prevC);
      assert(p >= 0.0 && p < prevP);
      prevC = c; prevP = p;
    }
    assert(prevC < 1e-4);
    assert(prevP < 1e-4);
  }

  // 6) Symétrie de N et saturation
  for (double x = -10.0; x <= 10.0; x += 0.25) {
    assert(approx(core::normal_cdf(x) + core::normal_cdf(-x), 1.0, 1e-9));
  }
  assert(approx(core::normal_cdf(0.0), 0.5, 1e-15));
  assert(approx(core::normal_cdf(1.959963984540054), 0.975, 1e-9));
  assert(core::normal_cdf(-40.0) >= 0.0 && core::normal_cdf(-40.0) < 1e-300);
  assert(core::normal_cdf(40.0) == 1.0);

  // 7) Hors domaine : propagation NaN/Inf, aucune exception
  assert(!std::isfinite(pricing::compute_d1_d2(100.0, 100.0, 0.05, 0.0, 1.0).d1));
  assert(std::isnan(pricing::call_price(100.0, 100.0, 0.05, 0.20, 0.0)));
  assert(std::isnan(pricing::put_price(-1.0, 100.0, 0.05, 0.20, 1.0)));
  assert(std::isnan(pricing::call_delta(100.0, 100.0, 0.05, 0.0, 0.0)));

  // 8) EuropeanOption = formules libres
  {
    const market::OptionParams p{110.0, 100.0, 0.02, 0.30, 0.75};
    const pricing::EuropeanOption call(p, market::OptionType::Call);
    const pricing::EuropeanOption put (p, market::OptionType::Put);
    assert(call.is_call() && !put.is_call());
    assert(call.price() == pricing::call_price(p.S, p.K, p.r, p.sigma, p.T));
    assert(put.price()  == pricing::put_price (p.S, p.K, p.r, p.sigma, p.T));
    assert(call.delta() == pricing::call_delta(p.S, p.K, p.r, p.sigma, p.T));
    assert(put.delta()  == pricing::put_delta (p.S, p.K, p.r, p.sigma, p.T));

    bool thrown = false;
    try {
      (void)pricing::EuropeanOption::checked({100.0, 100.0, 0.05, -0.2, 1.0}, market::OptionType::Put);
    } catch (const core::InvalidParameter& e) {
      thrown = true;
      assert(e.name() == "sigma");
      assert(e.value() == -0.2);
    }
    assert(thrown);
    const auto ok = pricing::EuropeanOption::checked(p, market::OptionType::Put);
    assert(ok.price() == put.price());
  }

  // 9) validate : ordre S, K, r, sigma, T
  {
    auto name_of = [](const market::OptionParams& p) -> std::string {
      try { market::validate(p); } catch (const core::InvalidParameter& e) { return e.name(); }
      return "";
    };
    assert(name_of(market::default_params()).empty());
    assert(name_of({0.0, 100.0, 0.05, 0.2, 1.0}) == "S");
    assert(name_of({100.0, -1.0, 0.05, 0.2, 1.0}) == "K");
    assert(name_of({100.0, 100.0, NAN, 0.2, 1.0}) == "r");
    assert(name_of({100.0, 100.0, -0.05, 0.0, 1.0}) == "sigma");
    assert(name_of({100.0, 100.0, 0.05, 0.2, 0.0}) == "T");
    assert(name_of({-1.0, -1.0, 0.05, 0.2, 0.0}) == "S");
    assert(name_of({100.0, INFINITY, 0.05, 0.2, 1.0}) == "K");
  }

  std::cout << "Analytic BS OK. Max parity gap=" << gapmax << "\n";
  return 0;
}
