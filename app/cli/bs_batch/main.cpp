#include <bse/io/cli_args.hpp>
#include <bse/io/option_csv.hpp>
#include <bse/pricing/european_option.hpp>

#include <cmath>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog << " chain.csv [--precision N]\n"
            << "CSV columns: id,type,S,K,r,sigma,T (header required)\n";
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(argv[0]); return 1; }

  std::string path;
  int precision = 4;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--precision" && i + 1 < argc) {
      const auto v = bse::io::parse_number(argv[++i]);
      if (!v || std::floor(*v) != *v || *v < 0.0 || *v > 17.0) { std::cerr << "Invalid --precision\n"; usage(argv[0]); return 1; }
      precision = static_cast<int>(*v);
    }
    else if (path.empty() && a.rfind("--", 0) != 0) path = a;
    else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
  }
  if (path.empty()) { usage(argv[0]); return 1; }

  std::ifstream in(path);
  if (!in) { std::cerr << "Error: cannot open " << path << "\n"; return 1; }

  try {
    std::size_t ignored = 0;
    std::vector<std::string> warnings;
    const auto rows = bse::io::read_option_csv(in, &ignored, &warnings);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(precision);
    std::cout << std::left << std::setw(12) << "id" << std::right
              << std::setw(6)  << "type"
              << std::setw(10) << "S"
              << std::setw(10) << "K"
              << std::setw(9)  << "r"
              << std::setw(9)  << "sigma"
              << std::setw(9)  << "T"
              << std::setw(12) << "price"
              << std::setw(10) << "delta" << "\n";

    for (const auto& row : rows) {
      const bse::pricing::EuropeanOption opt(row.params, row.type);
      const auto& p = opt.params();
      std::cout << std::left << std::setw(12) << (row.id.empty() ? "-" : row.id) << std::right
                << std::setw(6)  << bse::market::to_string(opt.type())
                << std::setw(10) << p.S
                << std::setw(10) << p.K
                << std::setw(9)  << p.r
                << std::setw(9)  << p.sigma
                << std::setw(9)  << p.T
                << std::setw(12) << opt.price()
                << std::setw(10) << opt.delta() << "\n";
    }

    for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
    std::cerr << "Priced rows: " << rows.size() << ", ignored rows: " << ignored << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}
