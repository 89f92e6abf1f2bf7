#include <gb/core/stats.hpp>

#include <cmath>    // std::sqrt
#include <limits>   // std::numeric_limits

namespace gb {
namespace core {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
} // namespace

// --- RunningStats -----------------------------------------------------------

RunningStats::RunningStats() noexcept = default;

void RunningStats::add(double x) noexcept {
  // Algorithme de Welford (stable numériquement, une passe)
  n_ += 1;
  const double delta  = x - mean_;
  mean_ += delta / static_cast<double>(n_);
  const double delta2 = x - mean_;
  m2_   += delta * delta2;
}

std::size_t RunningStats::count() const noexcept {
  return n_;
}

double RunningStats::mean() const noexcept {
  return mean_;
}

double RunningStats::variance() const noexcept {
  if (n_ < 2) {
    return NaN;
  }
  return m2_ / static_cast<double>(n_ - 1);
}

double RunningStats::std_error() const noexcept {
  if (n_ == 0) {
    return NaN;
  }
  return std::sqrt(variance() / static_cast<double>(n_)); // NaN si n==1
}

// --- RunningCovariance ------------------------------------------------------

RunningCovariance::RunningCovariance() noexcept = default;

void RunningCovariance::add(double x, double y) noexcept {
  n_ += 1;
  const double inv_n = 1.0 / static_cast<double>(n_);
  const double dx = x - mean_x_;
  const double dy = y - mean_y_;
  mean_x_ += dx * inv_n;
  mean_y_ += dy * inv_n;
  // co-moment : ancien écart en x * nouvel écart en y
  m2x_ += dx * (x - mean_x_);
  m2y_ += dy * (y - mean_y_);
  cxy_ += dx * (y - mean_y_);
}

std::size_t RunningCovariance::count() const noexcept { return n_; }
double RunningCovariance::mean_x() const noexcept { return mean_x_; }
double RunningCovariance::mean_y() const noexcept { return mean_y_; }

double RunningCovariance::variance_x() const noexcept {
  return n_ < 2 ? NaN : m2x_ / static_cast<double>(n_ - 1);
}

double RunningCovariance::variance_y() const noexcept {
  return n_ < 2 ? NaN : m2y_ / static_cast<double>(n_ - 1);
}

double RunningCovariance::covariance() const noexcept {
  return n_ < 2 ? NaN : cxy_ / static_cast<double>(n_ - 1);
}

double RunningCovariance::correlation() const noexcept {
  if (n_ < 2 || m2x_ <= 0.0 || m2y_ <= 0.0) {
    return NaN;
  }
  // les diviseurs (n-1) se simplifient
  return cxy_ / std::sqrt(m2x_ * m2y_);
}

// --- Confidence interval 95% ------------------------------------------------

ConfidenceInterval confidence_interval_95(double mean, double std_error) noexcept {
  static constexpr double Z95 = 1.959963984540054;
  const double half = Z95 * std_error;
  return { mean - half, mean + half };
}

// --- Autocorrélation --------------------------------------------------------

double autocorrelation(const std::vector<double>& values, std::size_t lag) noexcept {
  const std::size_t n = values.size();
  if (lag >= n) {
    return NaN;
  }
  double m = 0.0;
  for (double v : values) m += v;
  m /= static_cast<double>(n);

  double den = 0.0;
  for (double v : values) den += (v - m) * (v - m);
  if (den <= 0.0) {
    return NaN; // série constante
  }

  double num = 0.0;
  for (std::size_t t = 0; t + lag < n; ++t) {
    num += (values[t] - m) * (values[t + lag] - m);
  }
  return num / den;
}

} // namespace core
} // namespace gb
