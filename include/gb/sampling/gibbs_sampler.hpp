#pragma once
/**
 * @file gibbs_sampler.hpp
 * @brief Échantillonneur de Gibbs pour la normale bivariée.
 *
 * # Chaîne
 * - État initial (x, y) = (0, 0), enregistré tel quel comme échantillon 0
 *   (pas de burn-in : les premiers points ne suivent pas encore la loi
 *   stationnaire).
 * - Pour i = 1..n-1 : x ~ N(rho * y, 1 - rho^2) avec l'ancien y, puis
 *   y ~ N(rho * x, 1 - rho^2) avec le nouvel x.
 * - Exactement n-1 transitions (2(n-1) tirages) ; n = 1 ne tire rien.
 *
 * Les échantillons successifs sont corrélés : en régime stationnaire,
 * l'autocorrélation au retard 1 de chaque marginale vaut rho^2.
 */

#include <vector>

#include <gb/core/normal_source.hpp>
#include <gb/core/sample.hpp>

namespace gb {
namespace sampling {

/// @throws gb::core::InvalidParameter si n < 1 ou |rho| >= 1 (avant tout tirage).
std::vector<core::Sample> sample_gibbs(long long n, double rho,
                                       core::NormalSource& rng);

} // namespace sampling
} // namespace gb
