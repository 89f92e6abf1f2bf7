#pragma once
/**
 * @file sampler_config.hpp
 * @brief Configuration standard d'un run d'échantillonnage.
 *
 * # Contenu
 * - n      : nombre d'échantillons (>= 1 ; signé pour pouvoir rejeter n < 0
 *            avec InvalidParameter plutôt que par débordement).
 * - rho    : corrélation cible (-1 < rho < 1).
 * - seed   : graine du NormalRng.
 * - method : Exact (tirages i.i.d.) ou Gibbs (chaîne de Markov).
 *
 * Aucune validation ici : elle a lieu à l'entrée des échantillonneurs.
 */

#include <cstdint>   // std::uint64_t
#include <string>

#include <gb/core/normal_rng.hpp> // DEFAULT_SEED

namespace gb {
namespace config {

enum class Method { Exact, Gibbs };

struct SamplerConfig {
  long long     n;       ///< Nombre d'échantillons.
  double        rho;     ///< Corrélation.
  std::uint64_t seed;    ///< Graine du RNG.
  Method        method;  ///< Exact ou Gibbs.

  SamplerConfig(long long n = 1'000,
                double rho = 0.8,
                std::uint64_t seed = core::DEFAULT_SEED,
                Method method = Method::Gibbs) noexcept
      : n(n), rho(rho), seed(seed), method(method) {}
};

/// @return "exact" ou "gibbs".
const char* method_name(Method m) noexcept;

/// @brief Insensible à la casse ("exact", "gibbs").
/// @throws std::invalid_argument si le nom est inconnu.
Method parse_method(const std::string& name);

} // namespace config
} // namespace gb
