#pragma once
/**
 * @file sample.hpp
 * @brief Un tirage bivarié (x, y).
 *
 * Pas d'identité autre que la position dans la séquence produite.
 * Sert aussi d'état courant de la chaîne de Gibbs.
 */

namespace gb {
namespace core {

struct Sample {
  double x{0.0};
  double y{0.0};
};

// Égalité exacte (bit à bit sur les valeurs), utilisée pour l'état initial
// et la reproductibilité.
inline bool operator==(const Sample& a, const Sample& b) noexcept {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const Sample& a, const Sample& b) noexcept {
  return !(a == b);
}

} // namespace core
} // namespace gb
