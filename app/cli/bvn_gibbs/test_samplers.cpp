#include "gb/sampling/exact_sampler.hpp"
#include "gb/sampling/gibbs_sampler.hpp"
#include "gb/sampling/runner.hpp"
#include "gb/core/normal_rng.hpp"
#include "gb/core/errors.hpp"
#include "gb/io/sample_text.hpp"
#include "gb/qc/summary.hpp"
#include <cassert>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <utility>
#include <stdexcept>
#include <string>
#include <vector>

using gb::core::Sample;
using gb::core::NormalSource;

// Source scriptée : rejoue une liste de Z et compte les tirages.
struct ScriptedNormal : NormalSource {
  std::vector<double> z;
  std::size_t next = 0;
  explicit ScriptedNormal(std::vector<double> v) : z(std::move(v)) {}
  double sample() override {
    if (next >= z.size()) throw std::runtime_error("scripted source exhausted");
    return z[next++];
  }
};

template <class F>
static bool throws_invalid(F&& f) {
  try { f(); } catch (const gb::core::InvalidParameter&) { return true; }
  return false;
}

int main() {
  constexpr double EPS = 1e-12;

  // 1) Longueurs et état initial
  for (long long n : {1LL, 2LL, 17LL, 1000LL}) {
    for (double rho : {-0.9, 0.0, 0.5, 0.98}) {
      gb::core::NormalRng rng(7);
      const auto ex = gb::sampling::sample_exact(n, rho, rng);
      assert(ex.size() == static_cast<std::size_t>(n));
      const auto ch = gb::sampling::sample_gibbs(n, rho, rng);
      assert(ch.size() == static_cast<std::size_t>(n));
      assert((ch[0] == Sample{0.0, 0.0}));
    }
  }

  // 2) n = 1 : Gibbs ne tire rien, l'exact tire exactement 2 fois
  {
    ScriptedNormal empty(std::vector<double>{});
    const auto ch = gb::sampling::sample_gibbs(1, 0.8, empty);
    assert(ch.size() == 1 && (ch[0] == Sample{0.0, 0.0}));
    assert(empty.next == 0);

    ScriptedNormal two({1.5, -0.5});
    const auto ex = gb::sampling::sample_exact(1, 0.6, two);
    assert(ex.size() == 1);
    assert(std::abs(ex[0].x - 1.5) < EPS);
    assert(std::abs(ex[0].y - (0.6 * 1.5 + 0.8 * -0.5)) < EPS);
    assert(two.next == 2);
  }

  // 3) Arithmétique d'un balayage : x sachant l'ancien y, puis y sachant le nouvel x
  {
    // rho = 0.6 => sd conditionnel = 0.8
    ScriptedNormal src({1.0, 0.5, -2.0, 0.25});
    const auto ch = gb::sampling::sample_gibbs(3, 0.6, src);
    const double x1 = 0.8 * 1.0;             // 0.8
    const double y1 = 0.6 * x1 + 0.8 * 0.5;  // 0.88
    const double x2 = 0.6 * y1 + 0.8 * -2.0;
    const double y2 = 0.6 * x2 + 0.8 * 0.25;
    assert(std::abs(ch[1].x - x1) < EPS && std::abs(ch[1].y - y1) < EPS);
    assert(std::abs(ch[2].x - x2) < EPS && std::abs(ch[2].y - y2) < EPS);
    assert(src.next == 4); // 2(n-1) tirages
  }

  // 4) Paramètres invalides : aucune sortie, aucun tirage
  for (double rho : {1.0, -1.0, 1.5, std::nan("")}) {
    ScriptedNormal src({0.1, 0.2});
    assert(throws_invalid([&]{ gb::sampling::sample_exact(10, rho, src); }));
    assert(throws_invalid([&]{ gb::sampling::sample_gibbs(10, rho, src); }));
    assert(src.next == 0);
  }
  for (long long n : {0LL, -5LL}) {
    ScriptedNormal src({0.1, 0.2});
    assert(throws_invalid([&]{ gb::sampling::sample_exact(n, 0.5, src); }));
    assert(throws_invalid([&]{ gb::sampling::sample_gibbs(n, 0.5, src); }));
    assert(src.next == 0);
  }
  // InvalidParameter reste un std::invalid_argument
  try {
    gb::core::validate_parameters(0, 0.5);
    assert(false);
  } catch (const std::invalid_argument&) {
  }

  // 5) Erreur de la source : propagée, pas masquée
  {
    ScriptedNormal short_src({0.3});
    bool thrown = false;
    try { gb::sampling::sample_gibbs(5, 0.5, short_src); }
    catch (const std::runtime_error&) { thrown = true; }
    assert(thrown);
  }

  // 6) Déterminisme : même graine => sorties texte identiques octet pour octet
  for (auto m : {gb::config::Method::Exact, gb::config::Method::Gibbs}) {
    const gb::config::SamplerConfig cfg(500, 0.7, 12345ULL, m);
    const auto a = gb::sampling::run_sampler(cfg);
    const auto b = gb::sampling::run_sampler(cfg);
    assert(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) assert(a[i] == b[i]);
    std::ostringstream sa, sb;
    gb::io::write_samples(sa, a);
    gb::io::write_samples(sb, b);
    assert(sa.str() == sb.str());
  }

  // Noms de méthode
  assert(gb::config::parse_method("GIBBS") == gb::config::Method::Gibbs);
  assert(gb::config::parse_method("exact") == gb::config::Method::Exact);
  assert(std::string(gb::config::method_name(gb::config::Method::Exact)) == "exact");
  {
    bool thrown = false;
    try { gb::config::parse_method("metropolis"); }
    catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
  }

  // 7) Propriétés statistiques, n = 100 000, rho = 0.8
  const long long N = 100'000;
  {
    gb::core::NormalRng rng(2024);
    const auto ex = gb::qc::summarize(gb::sampling::sample_exact(N, 0.8, rng));
    const auto gs = gb::qc::summarize(gb::sampling::sample_gibbs(N, 0.8, rng));
    for (const auto& s : {ex, gs}) {
      assert(std::abs(s.mean_x) < 0.05);
      assert(std::abs(s.mean_y) < 0.05);
      assert(std::abs(s.correlation - 0.8) < 0.05);
      assert(std::abs(s.var_x - 1.0) < 0.05);
      assert(std::abs(s.var_y - 1.0) < 0.05);
    }
    // lag-1 de Gibbs ≈ rho^2 = 0.64
    assert(std::abs(gs.lag1_x - 0.64) < 0.05);
  }

  // 8) Autocorrélation : Gibbs corrélé, exact non (rho = 0.98)
  double lag_gibbs = 0.0, lag_exact = 0.0;
  {
    gb::core::NormalRng rng(99);
    lag_exact = gb::qc::summarize(gb::sampling::sample_exact(N, 0.98, rng)).lag1_x;
    lag_gibbs = gb::qc::summarize(gb::sampling::sample_gibbs(N, 0.98, rng)).lag1_x;
    assert(lag_gibbs > 0.3);
    assert(std::abs(lag_exact) < 0.05);
    assert(lag_gibbs > lag_exact + 0.3);
  }

  std::cout << "Samplers OK. lag1 gibbs=" << lag_gibbs
            << " exact=" << lag_exact << "\n";
  return 0;
}
