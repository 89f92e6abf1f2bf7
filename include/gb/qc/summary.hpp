#pragma once
#include <cstddef>
#include <iosfwd>
#include <vector>

#include <gb/core/sample.hpp>

namespace gb::qc {

// Résumé de base d'une séquence (x, y) : moments d'ordre 1 et 2,
// corrélation croisée et autocorrélations au retard 1.
struct ChainSummary {
  std::size_t n{0};
  double mean_x{0.0}, mean_y{0.0};
  double var_x{0.0},  var_y{0.0};
  double correlation{0.0};
  double lag1_x{0.0}, lag1_y{0.0};
};

// Les champs indéfinis (n < 2, série constante) valent NaN.
ChainSummary summarize(const std::vector<core::Sample>& samples);

// Affichage "clé : valeur", 6 décimales.
void print_summary(std::ostream& os, const ChainSummary& s);

} // namespace gb::qc
