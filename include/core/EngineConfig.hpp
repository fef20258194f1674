/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENGINE_CONFIG_HPP
#define ENGINE_CONFIG_HPP

#include "simulation/SimulationTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace GlyphFlow {

// Upper bound accepted from config files (64M particles, ~2.5 GB of buffers)
constexpr size_t MAX_PARTICLE_COUNT = size_t{1} << 26;

/**
 * @brief Startup configuration for a ParticleEngine
 *
 * Defaults are usable as-is; loadEngineConfig() overlays a JSON file.
 */
struct EngineConfig {
  // simulation
  size_t particleCount{1000000};
  uint32_t seed{42};
  float textHoldDuration{2.5f};
  float convUpScale{1.0f};
  float convDnScale{1.0f};
  float pointSize{1.0f};

  // text
  std::string fontPath{"res/fonts/Arial.ttf"};
  float fontSize{200.0f};

  // threading
  bool threadingEnabled{true};
  size_t threadingThreshold{4096};
  unsigned int workerCount{0}; // 0 = hardware_concurrency - 1

  // Empty uses the built-in tension curve
  std::vector<MacroPhaseRow> macroRows;
};

/**
 * @brief Overlay a JSON config file onto `config`
 *
 * Keys are grouped under "simulation", "text", "threading" and "macroCurve".
 * Missing keys keep their current value; a key with the wrong JSON type logs
 * a warning and is skipped.
 *
 * @return false if the file cannot be read or parsed, the particle count is
 *         not in [1, MAX_PARTICLE_COUNT], or macroCurve end times are not
 *         strictly increasing. Out-of-range seed, threshold and worker count
 *         values log a warning and keep the current value.
 *         `config` is left untouched on failure.
 */
bool loadEngineConfig(const std::string &path, EngineConfig &config);

} // namespace GlyphFlow

#endif // ENGINE_CONFIG_HPP
