#include <bse/config/pricing_config.hpp>
#include <bse/core/errors.hpp>
#include <bse/io/cli_args.hpp>
#include <bse/io/report.hpp>
#include <bse/pricing/analytic_bs.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::string> warnings;
  bse::config::PricingConfig cfg;
  try {
    cfg = bse::io::parse_pricing_args(argc, argv, &warnings);
  } catch (const bse::core::ParseError& e) {
    std::cerr << "Error: " << e.what() << "\n" << bse::io::pricing_usage(argv[0]);
    return 1;
  } catch (const bse::core::InvalidParameter& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  if (cfg.show_help) {
    std::cout << bse::io::pricing_usage(argv[0]);
    return 0;
  }
  if (cfg.verbose) {
    for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }

  const bse::pricing::BsReport rep = bse::pricing::evaluate_bs(cfg.params);
  bse::io::write_report(std::cout, rep, cfg.precision);
  return 0;
}
