/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TTF_GLYPH_RASTERIZER_HPP
#define TTF_GLYPH_RASTERIZER_HPP

#include "simulation/GlyphRasterizer.hpp"
#include <SDL3_ttf/SDL_ttf.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace GlyphFlow {

/**
 * @brief IGlyphRasterizer backed by SDL3_ttf
 *
 * One TTF_Font per requested point size, opened lazily from the font file
 * given to init() and styled bold.
 */
class TTFGlyphRasterizer : public IGlyphRasterizer {
public:
  TTFGlyphRasterizer() = default;
  ~TTFGlyphRasterizer() override;

  TTFGlyphRasterizer(const TTFGlyphRasterizer &) = delete;
  TTFGlyphRasterizer &operator=(const TTFGlyphRasterizer &) = delete;

  /**
   * @brief Initialize SDL_ttf and verify the font file opens
   * @return false if TTF_Init fails or the font cannot be opened
   */
  bool init(const std::string &fontPath, float probeSize = 200.0f);

  void clean();

  bool isInitialized() const { return m_initialized; }

  float measureText(const std::string &text, float fontSize) override;

  GlyphMask renderText(const std::string &text, float fontSize,
                       int canvasWidth, int canvasHeight,
                       float penX) override;

private:
  std::shared_ptr<TTF_Font> getFont(float fontSize);

  std::string m_fontPath;
  std::unordered_map<int, std::shared_ptr<TTF_Font>> m_fonts;
  std::mutex m_fontsMutex;
  bool m_initialized{false};
  bool m_ownsTTF{false};
};

} // namespace GlyphFlow

#endif // TTF_GLYPH_RASTERIZER_HPP
