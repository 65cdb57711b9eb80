#pragma once
/**
 * @file normal.hpp
 * @brief Loi normale standard : fonction de répartition N(x).
 *
 * N(x) = 0.5 * (1 + erf(x / sqrt(2))) = 0.5 * erfc(-x / sqrt(2)).
 * On passe par erfc : même fonction, meilleure précision dans la queue gauche.
 *
 * - Définie pour tout x réel, sature vers 0 / 1 quand |x| grand.
 * - Symétrie : N(x) + N(-x) = 1.
 * - NaN en entrée ⇒ NaN en sortie.
 */

namespace bse {
namespace core {

/// @brief CDF de la normale standard.
double normal_cdf(double x) noexcept;

} // namespace core
} // namespace bse
