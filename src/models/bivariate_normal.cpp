#include <gb/models/bivariate_normal.hpp>
#include <gb/core/errors.hpp>

#include <cmath>   // std::sqrt

namespace gb {
namespace models {

BivariateNormal::BivariateNormal(BvnParams p) : params_(p), cond_sd_(0.0) {
  core::validate_rho(p.rho);
  cond_sd_ = std::sqrt(1.0 - p.rho * p.rho);
}

double BivariateNormal::draw_conditional(double v, core::NormalSource& rng) const {
  const double Z = rng.sample();
  return params_.rho * v + cond_sd_ * Z;
}

core::Sample BivariateNormal::sample_exact(core::NormalSource& rng) const {
  core::Sample s;
  s.x = rng.sample();
  s.y = draw_conditional(s.x, rng);
  return s;
}

void BivariateNormal::gibbs_step_inplace(core::Sample& s, core::NormalSource& rng) const {
  s.x = draw_conditional(s.y, rng);
  s.y = draw_conditional(s.x, rng);
}

} // namespace models
} // namespace gb
