#pragma once
/**
 * @file normal_rng.hpp
 * @brief Générateur de N(0,1) encapsulant uniquement la graine côté API.
 *
 * # Reproductibilité
 * Deux instances construites avec la même graine produisent la même séquence
 * de tirages. La copie/assignation copie la graine ; l'état interne est
 * reconstruit à partir de cette graine.
 *
 * # Concurrence
 * Pas thread-safe : une instance par chaîne (et par thread).
 */

#include <cstdint>   // std::uint64_t
#include <cstddef>   // std::size_t
#include <memory>

#include <gb/core/normal_source.hpp>

namespace gb {
namespace core {

/// @brief Graine par défaut (constante "golden ratio" de Knuth).
inline constexpr std::uint64_t DEFAULT_SEED = 0x9E3779B97F4A7C15ULL;

/**
 * @brief Générateur de lois normales standard N(0,1).
 *
 * Implémentation cachée (PIMPL) afin de ne pas exposer <random> dans l'API.
 */
class NormalRng : public NormalSource {
public:
  /// @brief Construit avec DEFAULT_SEED (reproductible par défaut).
  NormalRng();

  /// @brief Construit avec une graine explicite.
  explicit NormalRng(std::uint64_t seed);

  /// @brief Un tirage N(0,1).
  double sample() override;

  /// @brief Remplit un buffer de n tirages N(0,1).
  /// @param out pointeur vers un buffer de taille >= n (non nul si n>0).
  void sample_block(double* out, std::size_t n);

  /// @brief Graine utilisée pour (re)construire l'état interne.
  std::uint64_t seed() const noexcept;

  // Copie : on copie la graine uniquement.
  NormalRng(const NormalRng&);
  NormalRng& operator=(const NormalRng&);

  NormalRng(NormalRng&&) noexcept;
  NormalRng& operator=(NormalRng&&) noexcept;

  ~NormalRng() noexcept override;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
  std::uint64_t seed_;
};

} // namespace core
} // namespace gb
