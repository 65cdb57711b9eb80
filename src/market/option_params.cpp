#include <bse/market/option_params.hpp>
#include <bse/core/errors.hpp>

#include <cctype>
#include <cmath>

namespace bse {
namespace market {

namespace {

constexpr const char* POSITIVE = "must be finite and > 0";

void require_positive(const char* name, double v) {
  if (!std::isfinite(v) || v <= 0.0) {
    throw core::InvalidParameter(name, v, POSITIVE);
  }
}

} // unnamed namespace

void validate(const OptionParams& p) {
  require_positive("S", p.S);
  require_positive("K", p.K);
  if (!std::isfinite(p.r)) {
    throw core::InvalidParameter("r", p.r, "must be finite");
  }
  require_positive("sigma", p.sigma);
  require_positive("T", p.T);
}

const char* to_string(OptionType type) noexcept {
  return (type == OptionType::Call) ? "call" : "put";
}

bool parse_option_type(const std::string& text, OptionType* out) {
  std::string s;
  s.reserve(text.size());
  for (unsigned char c : text) {
    if (!std::isspace(c)) s.push_back(static_cast<char>(std::tolower(c)));
  }
  if (s == "c" || s == "call") { if (out) *out = OptionType::Call; return true; }
  if (s == "p" || s == "put")  { if (out) *out = OptionType::Put;  return true; }
  return false;
}

} // namespace market
} // namespace bse
