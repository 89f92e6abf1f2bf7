#include <gb/core/normal_rng.hpp>

#include <random>   // std::mt19937_64, std::normal_distribution
#include <memory>   // std::make_unique
#include <cstddef>

namespace gb {
namespace core {

// --- PIMPL -------------------------------------------------------------------

struct NormalRng::Impl {
  std::mt19937_64 eng;
  std::normal_distribution<double> nd;

  explicit Impl(std::uint64_t seed) : eng(seed), nd(0.0, 1.0) {}
};

// --- Ctors / Dtors -----------------------------------------------------------

NormalRng::NormalRng() : NormalRng(DEFAULT_SEED) {}

NormalRng::NormalRng(std::uint64_t seed)
    : pimpl_(std::make_unique<Impl>(seed)), seed_(seed) {}

// Copie "seed-only" : on reconstruit l'état à partir de la graine.
NormalRng::NormalRng(const NormalRng& other)
    : NormalSource(other),
      pimpl_(std::make_unique<Impl>(other.seed_)),
      seed_(other.seed_) {}

NormalRng& NormalRng::operator=(const NormalRng& other) {
  if (this != &other) {
    seed_ = other.seed_;
    pimpl_ = std::make_unique<Impl>(seed_);
  }
  return *this;
}

NormalRng::NormalRng(NormalRng&& other) noexcept
    : pimpl_(std::move(other.pimpl_)), seed_(other.seed_) {}

NormalRng& NormalRng::operator=(NormalRng&& other) noexcept {
  if (this != &other) {
    pimpl_ = std::move(other.pimpl_);
    seed_  = other.seed_;
  }
  return *this;
}

NormalRng::~NormalRng() noexcept = default;

// --- API ---------------------------------------------------------------------

std::uint64_t NormalRng::seed() const noexcept {
  return seed_;
}

double NormalRng::sample() {
  return pimpl_->nd(pimpl_->eng);
}

void NormalRng::sample_block(double* out, std::size_t n) {
  // Précondition (doc) : out != nullptr si n > 0.
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = pimpl_->nd(pimpl_->eng);
  }
}

} // namespace core
} // namespace gb
