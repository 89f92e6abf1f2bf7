#pragma once
/**
 * @file bivariate_normal.hpp
 * @brief Loi normale bivariée centrée réduite de corrélation rho.
 *
 * # BvnParams
 * - rho : corrélation, -1 < rho < 1.
 *
 * # Décomposition
 * La densité jointe se factorise en (marginale de X) x (conditionnelle de Y|X) :
 *    X ~ N(0, 1)
 *    Y | X = v ~ N(rho * v, 1 - rho^2)
 * et symétriquement pour X | Y. L'écart-type conditionnel vaut
 * sqrt(1 - rho^2), d'où l'exclusion de |rho| = 1.
 *
 * # Méthodes
 * - sample_exact : un tirage exact (marginale puis conditionnelle).
 * - gibbs_step_inplace : un balayage de Gibbs sur l'état courant.
 */

#include <gb/core/normal_source.hpp>
#include <gb/core/sample.hpp>

namespace gb {
namespace models {

struct BvnParams {
  double rho; ///< Corrélation (|rho| < 1).
};

class BivariateNormal {
public:
  /// @throws gb::core::InvalidParameter si |rho| >= 1.
  explicit BivariateNormal(BvnParams p);

  const BvnParams& params() const noexcept { return params_; }

  /// @return sqrt(1 - rho^2).
  double conditional_sd() const noexcept { return cond_sd_; }

  /// @brief Tire une coordonnée sachant l'autre : rho * v + sqrt(1 - rho^2) * Z.
  double draw_conditional(double v, core::NormalSource& rng) const;

  /// @brief x ~ N(0,1) puis y ~ N(rho * x, 1 - rho^2). Deux tirages.
  core::Sample sample_exact(core::NormalSource& rng) const;

  /**
   * @brief Un balayage de Gibbs, en place.
   * @param s   État courant (modifié en sortie).
   * @param rng Source N(0,1).
   *
   * x est retiré sachant l'ancien y, puis y sachant le *nouvel* x.
   */
  void gibbs_step_inplace(core::Sample& s, core::NormalSource& rng) const;

private:
  BvnParams params_;
  double cond_sd_;
};

} // namespace models
} // namespace gb
