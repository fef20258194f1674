/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOW_PATTERN_LIBRARY_HPP
#define FLOW_PATTERN_LIBRARY_HPP

#include "simulation/SimulationTypes.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace GlyphFlow {

/**
 * @brief Named flow-field target generators
 *
 * Procedural patterns (ids 1..13) are pure functions of
 * (index, count, time) and are evaluated by the force kernel every tick.
 * Host patterns build a finite point set once with the engine RNG and write
 * it straight into the target buffer.
 *
 * "organic" exists in both forms: procedural id 1 for flow commands, and a
 * host version used to seed the initial targets and as the fallback for
 * unknown names.
 */
class FlowPatternLibrary {
public:
  static constexpr PatternId ORGANIC_ID = 1;
  static constexpr PatternId PROCEDURAL_PATTERN_COUNT = 13;

  static constexpr size_t FRACTAL_TREE_MAX_BRANCHES = 5000;
  static constexpr int FRACTAL_TREE_MAX_DEPTH = 7;

  // 0 (NO_PATTERN) when `name` is not procedural
  static PatternId proceduralId(std::string_view name);

  static std::string_view proceduralName(PatternId id);

  static bool isHostPattern(std::string_view name);

  /**
   * @brief Evaluate procedural pattern `id` for one particle
   *
   * Deterministic: identical arguments always give identical results. Ids
   * outside 1..13 return the origin.
   */
  static Vector3D evaluate(PatternId id, size_t index, size_t count, float time);

  /**
   * @brief Fill `targets` (packed xyz, `count` particles) from host pattern `name`
   *
   * Procedural names write their time-zero snapshot. Unknown names write
   * host organic and return false.
   */
  static bool buildHostPattern(std::string_view name, std::vector<float> &targets,
                               size_t count, std::mt19937 &rng);

  // Procedural names in id order (index 0 is id 1)
  static const std::vector<std::string> &proceduralNames();

  // Names only available as host patterns
  static const std::vector<std::string> &hostOnlyNames();

  // Procedural names followed by host-only names, no duplicates
  static std::vector<std::string> allPatternNames();

  // Order used by setMode(flow) when no pattern is given
  static const std::vector<std::string> &flowCycle();

private:
  static void buildOrganic(std::vector<float> &targets, size_t count, std::mt19937 &rng);
  static void buildBranchTree(std::vector<float> &targets, size_t count, std::mt19937 &rng);
  static void buildFractalTree(std::vector<float> &targets, size_t count, std::mt19937 &rng);
  static void buildKochCurve(std::vector<float> &targets, size_t count, std::mt19937 &rng);
  static void buildRandomWalk(std::vector<float> &targets, size_t count, std::mt19937 &rng);
};

} // namespace GlyphFlow

#endif // FLOW_PATTERN_LIBRARY_HPP
