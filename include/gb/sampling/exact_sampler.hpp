#pragma once
/**
 * @file exact_sampler.hpp
 * @brief Simulation directe (exacte) de n couples i.i.d.
 *
 * Pour i = 0..n-1 : x_i ~ N(0,1), y_i ~ N(rho * x_i, 1 - rho^2).
 * Consomme exactement 2n tirages de la source.
 */

#include <vector>

#include <gb/core/normal_source.hpp>
#include <gb/core/sample.hpp>

namespace gb {
namespace sampling {

/// @throws gb::core::InvalidParameter si n < 1 ou |rho| >= 1 (avant tout tirage).
std::vector<core::Sample> sample_exact(long long n, double rho,
                                       core::NormalSource& rng);

} // namespace sampling
} // namespace gb
