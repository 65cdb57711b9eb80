#pragma once
/**
 * @file report.hpp
 * @brief Mise en forme console des résultats Black–Scholes.
 *
 * Quatre lignes, précision fixe :
 *   Call Price: 10.4506
 *   Put Price: 5.5735
 *   Call Delta: 0.6368
 *   Put Delta: -0.3632
 */

#include <iosfwd>
#include <string>

#include <bse/pricing/analytic_bs.hpp>

namespace bse::io {

std::string format_report(const pricing::BsReport& rep, int precision = 4);

void write_report(std::ostream& os, const pricing::BsReport& rep, int precision = 4);

} // namespace bse::io
