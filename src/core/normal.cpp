#include <bse/core/normal.hpp>

#include <cmath> // erfc

namespace bse {
namespace core {

namespace {
constexpr double INV_SQRT2 = 0.70710678118654752440084436210484903928; // 1/sqrt(2)
} // unnamed namespace

double normal_cdf(double x) noexcept {
  return 0.5 * std::erfc(-x * INV_SQRT2);
}

} // namespace core
} // namespace bse
