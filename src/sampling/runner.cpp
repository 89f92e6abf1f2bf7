#include <gb/sampling/runner.hpp>
#include <gb/sampling/exact_sampler.hpp>
#include <gb/sampling/gibbs_sampler.hpp>
#include <gb/core/normal_rng.hpp>

namespace gb {
namespace sampling {

std::vector<core::Sample> run_sampler(const config::SamplerConfig& cfg) {
  core::NormalRng rng(cfg.seed);
  switch (cfg.method) {
    case config::Method::Exact:
      return sample_exact(cfg.n, cfg.rho, rng);
    case config::Method::Gibbs:
      break;
  }
  return sample_gibbs(cfg.n, cfg.rho, rng);
}

} // namespace sampling
} // namespace gb
