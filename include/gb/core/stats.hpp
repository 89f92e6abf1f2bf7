#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateurs statistiques en streaming (Welford) + IC 95 %.
 *
 * - RunningStats : moyenne / variance d'échantillon (diviseur n-1) /
 *   erreur standard, en une passe.
 * - RunningCovariance : version bivariée (x, y) ; donne en plus la
 *   covariance et la corrélation de Pearson.
 * - autocorrelation : autocorrélation empirique au retard k d'une série.
 *
 * Politique aux petits n :
 *   - n == 0 : variance()=NaN, std_error()=NaN ;
 *   - n == 1 : variance()=NaN (indéfini), std_error()=NaN.
 */

#include <cstddef> // std::size_t
#include <vector>

namespace gb {
namespace core {

struct RunningStats {
public:
  RunningStats() noexcept;

  /// @brief Ajoute un échantillon.
  void add(double x) noexcept;

  std::size_t count() const noexcept;

  double mean() const noexcept;

  /// @return Variance d'échantillon (diviseur n-1), NaN si n < 2.
  [[nodiscard]] double variance() const noexcept;

  /// @return Erreur standard de la moyenne : sqrt(variance / n).
  [[nodiscard]] double std_error() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0}; // somme des carrés des écarts à la moyenne (Welford)
};

/// @brief Welford bivarié : moments d'ordre 2 d'une suite de couples (x, y).
struct RunningCovariance {
public:
  RunningCovariance() noexcept;

  void add(double x, double y) noexcept;

  std::size_t count() const noexcept;
  double mean_x() const noexcept;
  double mean_y() const noexcept;

  /// @note NaN si n < 2 (comme RunningStats).
  [[nodiscard]] double variance_x() const noexcept;
  [[nodiscard]] double variance_y() const noexcept;
  [[nodiscard]] double covariance() const noexcept;

  /// @return cov / (sd_x * sd_y) ; NaN si n < 2 ou si une variance est nulle.
  [[nodiscard]] double correlation() const noexcept;

private:
  std::size_t n_{0};
  double mean_x_{0.0};
  double mean_y_{0.0};
  double m2x_{0.0};
  double m2y_{0.0};
  double cxy_{0.0}; // somme des co-écarts
};

/// @brief Intervalle de confiance 95 % pour la moyenne (approx. normale).
struct ConfidenceInterval {
  double low;
  double high;
};

/// @brief Calcule mean ± z * std_error (z ≈ 1.9599639845).
[[nodiscard]] ConfidenceInterval confidence_interval_95(double mean,
                                                        double std_error) noexcept;

/**
 * @brief Autocorrélation empirique au retard `lag`.
 *
 *   r_k = sum_{t<n-k} (x_t - m)(x_{t+k} - m) / sum_t (x_t - m)^2
 *
 * avec m la moyenne de toute la série.
 * @return NaN si lag >= n ou si la série est constante.
 */
[[nodiscard]] double autocorrelation(const std::vector<double>& values,
                                     std::size_t lag) noexcept;

} // namespace core
} // namespace gb
