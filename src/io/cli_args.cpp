#include <bse/io/cli_args.hpp>
#include <bse/core/errors.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace {

using Arg = std::pair<std::size_t, std::string>; // (index argv, texte)

constexpr std::size_t N_POSITIONAL = 5;
constexpr const char* NAMES[N_POSITIONAL] = {"S", "K", "r", "sigma", "T"};
constexpr int MAX_PRECISION = 17;

double& param_slot(bse::market::OptionParams& p, std::size_t j) {
  switch (j) {
    case 0:  return p.S;
    case 1:  return p.K;
    case 2:  return p.r;
    case 3:  return p.sigma;
    default: return p.T;
  }
}

bool is_option(const std::string& a) {
  return a.size() > 2 && a[0] == '-' && a[1] == '-';
}

// Strict : lève ; Lenient : note le warning et continue.
void reject(bool strict, std::vector<std::string>* warnings,
            std::size_t index, const std::string& text, const std::string& reason,
            const std::string& fallback) {
  if (strict) throw bse::core::ParseError(index, text, reason);
  if (warnings) {
    std::ostringstream os;
    os << "argument " << index << " '" << text << "': " << reason;
    if (!fallback.empty()) os << ", " << fallback;
    warnings->push_back(os.str());
  }
}

} // namespace

namespace bse::io {

std::optional<double> parse_number(const std::string& text) {
  std::size_t b = 0, e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  if (b == e) return std::nullopt;

  const std::string s = text.substr(b, e - b);
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  return v;
}

config::PricingConfig
parse_pricing_args(const std::vector<std::string>& args,
                   std::vector<std::string>* warnings)
{
  config::PricingConfig cfg;
  std::vector<Arg> positional;
  std::vector<Arg> unknown;
  std::optional<Arg> precision_arg;
  std::optional<std::size_t> precision_missing;

  // 1) Options (où qu’elles soient) puis positionnels
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    const std::size_t idx = i + 1;
    if      (a == "--strict")                cfg.policy = config::ParsePolicy::Strict;
    else if (a == "--verbose" || a == "-v")  cfg.verbose = true;
    else if (a == "--help" || a == "-h")     cfg.show_help = true;
    else if (a == "--precision") {
      if (i + 1 < args.size()) { precision_arg = Arg{idx + 1, args[i + 1]}; ++i; }
      else precision_missing = idx;
    }
    else if (is_option(a)) unknown.emplace_back(idx, a);
    else                   positional.emplace_back(idx, a);
  }
  if (cfg.show_help) return cfg;

  const bool strict = (cfg.policy == config::ParsePolicy::Strict);

  for (const auto& u : unknown) {
    reject(strict, warnings, u.first, u.second, "unknown option", "ignored");
  }
  if (precision_missing) {
    reject(strict, warnings, *precision_missing, "--precision", "missing value", "keeping 4 decimals");
  }
  if (precision_arg) {
    const auto v = parse_number(precision_arg->second);
    if (v && std::floor(*v) == *v && *v >= 0.0 && *v <= MAX_PRECISION) {
      cfg.precision = static_cast<int>(*v);
    } else {
      reject(strict, warnings, precision_arg->first, precision_arg->second,
             "precision must be an integer in [0, 17]", "keeping 4 decimals");
    }
  }

  // 2) Positionnels
  if (positional.empty()) return cfg;

  if (positional.size() < N_POSITIONAL) {
    const Arg& last = positional.back();
    std::ostringstream why;
    why << "expected 5 positional arguments <S> <K> <r> <sigma> <T>, got " << positional.size();
    reject(strict, warnings, last.first, last.second, why.str(), "using default parameters");
    return cfg;
  }
  for (std::size_t j = N_POSITIONAL; j < positional.size(); ++j) {
    reject(strict, warnings, positional[j].first, positional[j].second,
           "unexpected extra argument", "ignored");
  }

  for (std::size_t j = 0; j < N_POSITIONAL; ++j) {
    const Arg& a = positional[j];
    double& slot = param_slot(cfg.params, j);
    if (const auto v = parse_number(a.second)) {
      slot = *v;
    } else {
      std::ostringstream fb;
      fb << "using default " << NAMES[j] << "=" << slot;
      reject(strict, warnings, a.first, a.second, "not a number", fb.str());
    }
  }

  if (strict) market::validate(cfg.params);
  return cfg;
}

config::PricingConfig
parse_pricing_args(int argc, const char* const* argv,
                   std::vector<std::string>* warnings)
{
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return parse_pricing_args(args, warnings);
}

std::string pricing_usage(const std::string& prog) {
  std::ostringstream os;
  os << "Usage: " << prog << " [--strict] [--verbose] [--precision N] [S K r sigma T]\n"
     << "Without positional arguments: S=100 K=100 r=0.05 sigma=0.2 T=1.0.\n"
     << "  --strict       reject unparsable or out-of-domain inputs (exit 1 / 2)\n"
     << "  --verbose, -v  report substituted defaults on stderr\n"
     << "  --precision N  number of decimals (default 4)\n";
  return os.str();
}

} // namespace bse::io
