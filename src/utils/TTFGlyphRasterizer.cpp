/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/TTFGlyphRasterizer.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <format>

namespace GlyphFlow {

TTFGlyphRasterizer::~TTFGlyphRasterizer() { clean(); }

bool TTFGlyphRasterizer::init(const std::string &fontPath, float probeSize) {
  if (m_initialized) {
    return true;
  }

  if (TTF_WasInit() == 0) {
    if (!TTF_Init()) {
      FONT_CRITICAL(std::string("Font system initialization failed: ") + SDL_GetError());
      return false;
    }
    m_ownsTTF = true;
  }

  m_fontPath = fontPath;
  m_initialized = true;

  if (!getFont(probeSize)) {
    FONT_ERROR("Could not open font: " + fontPath);
    clean();
    return false;
  }

  FONT_INFO("Glyph rasterizer ready with font: " + fontPath);
  return true;
}

void TTFGlyphRasterizer::clean() {
  {
    std::lock_guard<std::mutex> lock(m_fontsMutex);
    // Fonts must close before TTF_Quit
    m_fonts.clear();
  }
  if (m_ownsTTF) {
    TTF_Quit();
    m_ownsTTF = false;
  }
  m_initialized = false;
}

std::shared_ptr<TTF_Font> TTFGlyphRasterizer::getFont(float fontSize) {
  if (!m_initialized) {
    return nullptr;
  }

  const int key = static_cast<int>(std::lround(fontSize * 10.0f));
  std::lock_guard<std::mutex> lock(m_fontsMutex);
  auto it = m_fonts.find(key);
  if (it != m_fonts.end()) {
    return it->second;
  }

  auto font = std::shared_ptr<TTF_Font>(TTF_OpenFont(m_fontPath.c_str(), fontSize),
                                        TTF_CloseFont);
  if (!font) {
    FONT_ERROR(std::format("Failed to open {} at size {}: {}", m_fontPath, fontSize,
                           SDL_GetError()));
    return nullptr;
  }

  TTF_SetFontStyle(font.get(), TTF_STYLE_BOLD);
  TTF_SetFontHinting(font.get(), TTF_HINTING_NORMAL);
  TTF_SetFontKerning(font.get(), true);

  m_fonts.emplace(key, font);
  return font;
}

float TTFGlyphRasterizer::measureText(const std::string &text, float fontSize) {
  auto font = getFont(fontSize);
  if (!font || text.empty()) {
    return 0.0f;
  }

  int width = 0;
  if (!TTF_GetStringSize(font.get(), text.c_str(), 0, &width, nullptr)) {
    FONT_WARN(std::format("Could not measure '{}': {}", text, SDL_GetError()));
    return 0.0f;
  }
  return static_cast<float>(width);
}

GlyphMask TTFGlyphRasterizer::renderText(const std::string &text, float fontSize,
                                         int canvasWidth, int canvasHeight,
                                         float penX) {
  GlyphMask mask(canvasWidth, canvasHeight);
  if (mask.empty() || text.empty()) {
    return mask;
  }

  auto font = getFont(fontSize);
  if (!font) {
    return mask;
  }

  const SDL_Color white = {255, 255, 255, 255};
  auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
      TTF_RenderText_Blended(font.get(), text.c_str(), 0, white), SDL_DestroySurface);
  if (!surface) {
    // Whitespace-only strings render nothing
    FONT_DEBUG(std::format("No surface for '{}': {}", text, SDL_GetError()));
    return mask;
  }

  const int originX = static_cast<int>(std::lround(penX));
  const int originY = (canvasHeight - surface->h) / 2;

  const int xBegin = std::max(0, -originX);
  const int xEnd = std::min(surface->w, canvasWidth - originX);
  const int yBegin = std::max(0, -originY);
  const int yEnd = std::min(surface->h, canvasHeight - originY);

  for (int y = yBegin; y < yEnd; ++y) {
    for (int x = xBegin; x < xEnd; ++x) {
      Uint8 r = 0, g = 0, b = 0, a = 0;
      if (SDL_ReadSurfacePixel(surface.get(), x, y, &r, &g, &b, &a)) {
        mask.alpha[static_cast<size_t>(originY + y) * static_cast<size_t>(canvasWidth) +
                   static_cast<size_t>(originX + x)] = a;
      }
    }
  }
  return mask;
}

} // namespace GlyphFlow
