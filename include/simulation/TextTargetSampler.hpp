/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEXT_TARGET_SAMPLER_HPP
#define TEXT_TARGET_SAMPLER_HPP

#include "simulation/GlyphRasterizer.hpp"
#include "simulation/SimulationTypes.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace GlyphFlow {

/**
 * @brief One glyph of the current text and the particle slice that draws it
 *
 * targetPositions is packed xyz. Records are rebuilt on every text command.
 */
struct CharacterRecord {
  std::string text;
  size_t startIndex{0};
  size_t count{0};
  std::vector<float> targetPositions;
  Vector3D center{};
  bool revealed{false};

  size_t pointCount() const { return targetPositions.size() / 3; }

  // True when the sampled points carry z jitter (anamorphic text)
  bool hasDepth() const {
    if (targetPositions.size() < 3) {
      return false;
    }
    return targetPositions[2] != 0.0f ||
           (targetPositions.size() > 5 && targetPositions[5] != 0.0f);
  }
};

using CharacterRecordList = std::vector<CharacterRecord>;

struct TextSamplingParams {
  float fontSize{200.0f};
  size_t maxPointsPerChar{30000};
  float targetWidth{4.0f};
  float depthSpread{0.0f};
  TextAlign align{TextAlign::Center};
};

/**
 * @brief Turns strings into particle target point sets
 *
 * Glyph masks come from an IGlyphRasterizer. Foreground pixels (alpha > 128)
 * are sampled on a square grid whose step keeps each character under its
 * point budget, then mapped into world units so the whole string spans
 * targetWidth.
 */
class TextTargetSampler {
public:
  static constexpr size_t MAX_POINTS_PER_CHAR = 30000;
  static constexpr size_t SCULPTURE_SAMPLE_BUDGET = 50000;
  static constexpr int CHAR_CANVAS_PADDING = 20;
  static constexpr int SCULPTURE_CANVAS_PADDING = 40;
  static constexpr float CANVAS_HEIGHT_FACTOR = 1.4f;
  static constexpr uint8_t ALPHA_THRESHOLD = 128;

  TextTargetSampler(IGlyphRasterizer &rasterizer, std::mt19937 &rng)
      : m_rasterizer(rasterizer), m_rng(rng) {}

  // Split UTF-8 text into code points; invalid bytes become single-byte entries
  static std::vector<std::string> splitCharacters(const std::string &text);

  /**
   * @brief Sample every character of `text` into its own record
   *
   * Records come back with startIndex/count unset; see assignSlices().
   */
  CharacterRecordList sampleCharacters(const std::string &text,
                                       const TextSamplingParams &params);

  /**
   * @brief Divide [groupStart, groupStart + groupCount) between the records
   *
   * Each record gets floor(groupCount / n) particles and the last one takes
   * the remainder.
   */
  static void assignSlices(CharacterRecordList &records, size_t groupStart,
                           size_t groupCount);

  // Translate centers and points by origin.xy
  static void applyOrigin(CharacterRecordList &records, const Vector3D &origin);

  /**
   * @brief Build one point cloud that reads as textA along -Z and textB along -Y
   *
   * Columns of textA supply (x, y); z is drawn from the nearest textB column.
   * textB columns with no textA column within five column keys are added
   * near y = 0. The result is stride-downsampled to at most maxPoints and
   * returned packed xyz.
   */
  std::vector<float> sampleSculpture(const std::string &textA,
                                     const std::string &textB, float fontSize,
                                     float targetWidth, size_t maxPoints);

private:
  float signedUnit() { return m_unit(m_rng) - 0.5f; }

  IGlyphRasterizer &m_rasterizer;
  std::mt19937 &m_rng;
  std::uniform_real_distribution<float> m_unit{0.0f, 1.0f};
};

} // namespace GlyphFlow

#endif // TEXT_TARGET_SAMPLER_HPP
