#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include <gb/core/sample.hpp>

namespace gb::io {

// Format d'échange "deux colonnes" : une paire par ligne, "x y",
// virgule fixe à 3 décimales, séparateur espace, fin de ligne '\n'.
//   0.000 0.000
//   -1.234 0.567
// Lève std::runtime_error si le flux passe en erreur.
void write_samples(std::ostream& os, const std::vector<core::Sample>& samples);

// Relit le même format (tout blanc accepté comme séparateur).
// Lignes vides et commentaires '#' sautés sans compter.
// Lignes mal formées (champ manquant/non numérique/en trop, non fini) :
// ignorées, comptées dans num_ignored, un message par ligne dans warnings.
// num_ignored/warnings sont optionnels.
std::vector<core::Sample>
read_samples(std::istream& is,
             std::size_t* num_ignored = nullptr,
             std::vector<std::string>* warnings = nullptr);

// Variante fichier. Lève std::runtime_error si le fichier ne s'ouvre pas.
std::vector<core::Sample>
read_samples_file(const std::string& path,
                  std::size_t* num_ignored = nullptr,
                  std::vector<std::string>* warnings = nullptr);

} // namespace gb::io
