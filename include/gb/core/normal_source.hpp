#pragma once
/**
 * @file normal_source.hpp
 * @brief Capacité minimale "produire un tirage N(0,1)".
 *
 * Les échantillonneurs ne dépendent que de cette interface : on peut leur
 * passer le générateur de production (NormalRng) ou, en test, une source
 * scriptée qui rejoue une suite de valeurs connue.
 *
 * Une erreur de la source (exception) est propagée telle quelle à l'appelant.
 */

namespace gb {
namespace core {

/// @brief Source de variables normales standard.
class NormalSource {
public:
  virtual ~NormalSource() = default;

  /// @brief Un tirage N(0,1).
  virtual double sample() = 0;
};

} // namespace core
} // namespace gb
