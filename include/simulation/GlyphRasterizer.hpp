/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GLYPH_RASTERIZER_HPP
#define GLYPH_RASTERIZER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace GlyphFlow {

/**
 * @brief 8-bit coverage mask, row-major, origin at the top-left
 */
struct GlyphMask {
  int width{0};
  int height{0};
  std::vector<uint8_t> alpha;

  GlyphMask() = default;
  GlyphMask(int w, int h)
      : width(w), height(h),
        alpha(static_cast<size_t>(w > 0 ? w : 0) * static_cast<size_t>(h > 0 ? h : 0), 0) {}

  uint8_t at(int x, int y) const {
    return alpha[static_cast<size_t>(y) * static_cast<size_t>(width) +
                 static_cast<size_t>(x)];
  }

  bool empty() const { return alpha.empty(); }
};

/**
 * @brief Turns text into coverage masks for target sampling
 *
 * Text is rendered bold. Implementations may cache fonts per size, so the
 * methods are non-const.
 */
class IGlyphRasterizer {
public:
  virtual ~IGlyphRasterizer() = default;

  // Horizontal advance of `text` in pixels
  virtual float measureText(const std::string &text, float fontSize) = 0;

  /**
   * @brief Render `text` onto a transparent canvas
   *
   * The pen starts at `penX` pixels from the left edge and the text is
   * centered vertically. Pixels outside the canvas are dropped.
   */
  virtual GlyphMask renderText(const std::string &text, float fontSize,
                               int canvasWidth, int canvasHeight,
                               float penX) = 0;
};

} // namespace GlyphFlow

#endif // GLYPH_RASTERIZER_HPP
