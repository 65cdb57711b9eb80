#include "bse/io/option_csv.hpp"
#include "bse/pricing/european_option.hpp"
#include <iostream>
#include <sstream>
#include <cassert>
#include <cmath>
#include <algorithm> // any_of
using namespace std;

int main(int argc, char** argv) {
  const string path = (argc>1 ? argv[1] : "data/samples/sample_chain.csv");

  size_t ignored = 0;
  vector<string> warnings;
  auto rows = bse::io::read_option_csv(path, &ignored, &warnings);

  cout << "Valid rows: " << rows.size() << "\n";
  cout << "Ignored rows: " << ignored << "\n";

  constexpr double EPS = 1e-12;
  assert(rows.size() == 5);
  assert(ignored == 4);

  const auto& r0 = rows.front();
  assert(r0.id == "ATM-C");
  assert(r0.type == bse::market::OptionType::Call);
  assert(std::abs(r0.params.S - 100.0) < EPS && std::abs(r0.params.sigma - 0.2) < EPS);
  assert(rows[1].type == bse::market::OptionType::Put);
  assert(rows[2].type == bse::market::OptionType::Call);
  assert(rows.back().id == "SHORT,P");
  assert(rows.back().type == bse::market::OptionType::Put);
  assert(std::abs(rows.back().params.T - 0.5) < EPS);

  // Prix cohérents avec le cas de référence
  const bse::pricing::EuropeanOption atm(r0.params, r0.type);
  assert(std::abs(atm.price() - 10.4506) < 1e-3);
  const bse::pricing::EuropeanOption itm(rows[2].params, rows[2].type);
  assert(itm.delta() > 0.99);

  auto has_warn = [&](const string& needle){
    return any_of(warnings.begin(), warnings.end(),
                  [&](const string& w){ return w.find(needle) != string::npos; });
  };
  assert(has_warn("S=-5"));
  assert(has_warn("sigma=0"));
  assert(has_warn("T is not a number ('abc')"));
  assert(has_warn("unknown option type 'straddle'"));
  assert(has_warn("line 8: InvalidParameter: S=-5"));

  // Flux en mémoire : synonymes de colonnes, type absent ⇒ call
  {
    istringstream in("Symbol,Spot,Strike,Rate,Vol,Maturity\n"
                     "X,100,100,0.05,0.2,1\n"
                     "Y,100,100,0.05,0.2,\n");
    size_t ign = 0;
    vector<string> w;
    auto rs = bse::io::read_option_csv(in, &ign, &w);
    assert(rs.size() == 1);
    assert(rs[0].id == "X");
    assert(rs[0].type == bse::market::OptionType::Call);
    assert(ign == 1);
    assert(w.size() == 1 && w[0].find("T is not a number") != string::npos);
  }

  // Octets non ASCII (UTF-8) dans commentaires, identifiants et espaces de bord
  {
    istringstream in("# Cha\xC3\xAEne d'\xC3\xA9" "chantillon\n"
                     "id,type,S,K,r,sigma,T\n"
                     "CAC\xC3\xA9,call,100,100,0.05,0.2,1\n"
                     "  \xC3\xA9t\xC3\xA9  ,put,100,100,0.05,0.2,1\n");
    size_t ign = 0;
    vector<string> w;
    auto rs = bse::io::read_option_csv(in, &ign, &w);
    assert(rs.size() == 2);
    assert(ign == 0 && w.empty());
    assert(rs[0].id == "CAC\xC3\xA9");
    assert(rs[1].id == "\xC3\xA9t\xC3\xA9");
    assert(rs[1].type == bse::market::OptionType::Put);
  }

  // Fichier absent
  {
    size_t ign = 42;
    vector<string> w;
    auto rs = bse::io::read_option_csv(string("does/not/exist.csv"), &ign, &w);
    assert(rs.empty() && ign == 0);
    assert(w.size() == 1 && w[0].find("cannot open") != string::npos);
  }

  for (auto& w: warnings) cerr << "[warn] " << w << "\n";
  return 0;
}
