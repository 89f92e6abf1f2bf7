#pragma once
/**
 * @file errors.hpp
 * @brief Erreur unique des échantillonneurs : paramètre invalide.
 *
 * # Cas couverts
 * - n < 1 (aucun échantillon demandé, ou n négatif) ;
 * - |rho| >= 1 (écart-type conditionnel sqrt(1 - rho^2) nul ou indéfini),
 *   NaN compris.
 *
 * Vérifié une seule fois à l'entrée, avant tout tirage.
 */

#include <stdexcept>
#include <string>

namespace gb {
namespace core {

class InvalidParameter : public std::invalid_argument {
public:
  explicit InvalidParameter(const std::string& what)
      : std::invalid_argument(what) {}
};

/// @throws InvalidParameter si |rho| >= 1 ou rho NaN.
void validate_rho(double rho);

/// @throws InvalidParameter si n < 1 ou si rho est invalide.
void validate_parameters(long long n, double rho);

} // namespace core
} // namespace gb
