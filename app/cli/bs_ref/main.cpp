#include <bse/io/cli_args.hpp>
#include <bse/pricing/analytic_bs.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [S K r sigma T]\n"
            << "If no arguments are provided, runs the reference cases.\n";
}

int main(int argc, char** argv) {
  std::vector<bse::market::OptionParams> cases;
  if (argc == 1) {
    // cas “or” : ATM, très ITM, très OTM, taux négatif
    cases.push_back(bse::market::default_params());
    cases.push_back({200.0, 100.0, 0.05, 0.20, 1.00});
    cases.push_back({ 50.0, 100.0, 0.05, 0.20, 1.00});
    cases.push_back({ 80.0, 100.0, -0.01, 0.35, 2.00});
  } else if (argc == 6) {
    double v[5];
    for (int i = 0; i < 5; ++i) {
      const auto x = bse::io::parse_number(argv[i + 1]);
      if (!x) {
        std::cerr << "Invalid number: '" << argv[i + 1] << "'\n";
        print_usage(argv[0]);
        return 1;
      }
      v[i] = *x;
    }
    cases.push_back({v[0], v[1], v[2], v[3], v[4]});
  } else {
    print_usage(argv[0]);
    return 1;
  }

  // entrées sur 10 car. (4 décimales), sorties sur 11 car. (6 décimales)
  std::cout << std::setw(10) << "S"     << ' '
            << std::setw(10) << "K"     << ' '
            << std::setw(10) << "r"     << ' '
            << std::setw(10) << "sigma" << ' '
            << std::setw(10) << "T"     << ' '
            << std::setw(11) << "Call"      << ' '
            << std::setw(11) << "Put"       << ' '
            << std::setw(11) << "CallDelta" << ' '
            << std::setw(11) << "PutDelta"  << ' '
            << std::setw(11) << "ParityGap" << '\n';
  std::cout << std::string(5 * 11 + 5 * 12 - 1, '-') << '\n';

  std::cout.setf(std::ios::fixed);
  for (const auto& c : cases) {
    const auto rep = bse::pricing::evaluate_bs(c);
    const double gap = bse::pricing::put_call_parity_gap(rep.call_price, rep.put_price,
                                                         c.S, c.K, c.r, c.T);

    std::cout << std::setprecision(4)
              << std::setw(10) << c.S     << ' '
              << std::setw(10) << c.K     << ' '
              << std::setw(10) << c.r     << ' '
              << std::setw(10) << c.sigma << ' '
              << std::setw(10) << c.T     << ' '
              << std::setprecision(6)
              << std::setw(11) << rep.call_price << ' '
              << std::setw(11) << rep.put_price  << ' '
              << std::setw(11) << rep.call_delta << ' '
              << std::setw(11) << rep.put_delta  << ' '
              << std::setw(11) << std::scientific << std::setprecision(3) << gap
              << std::fixed << '\n';
  }
  return 0;
}
