#include <gb/sampling/gibbs_sampler.hpp>
#include <gb/core/errors.hpp>
#include <gb/models/bivariate_normal.hpp>

#include <cstddef>

namespace gb {
namespace sampling {

std::vector<core::Sample> sample_gibbs(long long n, double rho,
                                       core::NormalSource& rng) {
  core::validate_parameters(n, rho);
  const models::BivariateNormal model({rho});

  std::vector<core::Sample> chain;
  chain.reserve(static_cast<std::size_t>(n));

  core::Sample state{0.0, 0.0};
  chain.push_back(state);
  for (long long i = 1; i < n; ++i) {
    model.gibbs_step_inplace(state, rng);
    chain.push_back(state);
  }
  return chain;
}

} // namespace sampling
} // namespace gb
