#pragma once
/**
 * @file runner.hpp
 * @brief Point d'entrée unique : config -> séquence d'échantillons.
 *
 * Construit un NormalRng(cfg.seed) propre au run puis délègue à
 * sample_exact ou sample_gibbs. Deux configs identiques donnent deux
 * séquences identiques.
 */

#include <vector>

#include <gb/config/sampler_config.hpp>
#include <gb/core/sample.hpp>

namespace gb {
namespace sampling {

/// @throws gb::core::InvalidParameter (cf. sample_exact / sample_gibbs).
std::vector<core::Sample> run_sampler(const config::SamplerConfig& cfg);

} // namespace sampling
} // namespace gb
