#include <gb/sampling/exact_sampler.hpp>
#include <gb/core/errors.hpp>
#include <gb/models/bivariate_normal.hpp>

#include <cstddef>

namespace gb {
namespace sampling {

std::vector<core::Sample> sample_exact(long long n, double rho,
                                       core::NormalSource& rng) {
  core::validate_parameters(n, rho);
  const models::BivariateNormal model({rho});

  std::vector<core::Sample> out;
  out.reserve(static_cast<std::size_t>(n));
  for (long long i = 0; i < n; ++i) {
    out.push_back(model.sample_exact(rng));
  }
  return out;
}

} // namespace sampling
} // namespace gb
