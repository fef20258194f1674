/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FORMATION_ANIMATOR_HPP
#define FORMATION_ANIMATOR_HPP

#include "simulation/SimulationTypes.hpp"
#include "simulation/TextTargetSampler.hpp"
#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

namespace GlyphFlow {

// Character c reveals once the formation has run for delay + c * stagger seconds
struct FormationSchedule {
  float delay{0.0f};
  float stagger{0.0f};
};

/**
 * @brief Pre-shapes and timed reveal for text formation
 *
 * When forming starts, every character slice gets a pre-shape target (a
 * ring, a spiral, a rain column...). Each tick, characters whose reveal time
 * has passed switch their slice to the sampled text points.
 *
 * All writes go to a packed xyz target buffer and are bounded by the buffer
 * size, so slices that run past the end are cut short.
 */
class FormationAnimator {
public:
  // Jitter on repeated points when a slice outnumbers its samples
  static constexpr float OVERFLOW_JITTER = 0.03f;
  // z jitter on text points that already carry depth
  static constexpr float DEPTH_JITTER = 0.02f;

  static const FormationSchedule &schedule(FormationAnimation animation);

  static const char *name(FormationAnimation animation);

  // DirectSnap for unknown names
  static FormationAnimation fromName(std::string_view name);

  // Cycles through the animations in declaration order
  static FormationAnimation defaultForTextIndex(uint32_t textIndex);

  static bool isInstant(FormationAnimation animation) {
    return animation == FormationAnimation::DirectSnap;
  }

  /**
   * @brief Write the pre-shape of `animation` into each record's slice
   *
   * CenterBurst collapses every slice onto the origin. When no record has
   * depth, z is forced to 0 across all slices afterwards.
   */
  static void writePreShape(FormationAnimation animation,
                            const CharacterRecordList &records,
                            std::vector<float> &targets, std::mt19937 &rng);

  // Write every character's text points at once; revealed flags are untouched
  static void applyAllCharTargets(const CharacterRecordList &records,
                                  std::vector<float> &targets, std::mt19937 &rng);

  /**
   * @brief Switch one character's slice to its text points
   * @return false if the character was already revealed
   */
  static bool revealChar(CharacterRecord &record, std::vector<float> &targets,
                         std::mt19937 &rng);

  /**
   * @brief Reveal every character whose time has come
   * @param elapsed Seconds since the formation started
   * @return true once every character is revealed
   */
  static bool updateReveal(FormationAnimation animation, CharacterRecordList &records,
                           float elapsed, std::vector<float> &targets,
                           std::mt19937 &rng);

private:
  static void writeCharTargets(const CharacterRecord &record,
                               std::vector<float> &targets, std::mt19937 &rng);
};

} // namespace GlyphFlow

#endif // FORMATION_ANIMATOR_HPP
