/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/TextTargetSampler.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <iterator>
#include <map>

namespace GlyphFlow {

namespace {

using ColumnMap = std::map<int, std::vector<float>>;

size_t utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 1;
}

int sampleStep(int width, int height, size_t budget) {
  const double area = static_cast<double>(width) * static_cast<double>(height);
  const double raw = std::floor(std::sqrt(area / static_cast<double>(std::max<size_t>(budget, 1))));
  return std::max(1, static_cast<int>(raw));
}

// Column key of the entry in `keys` closest to `col`; keys must be sorted
const int *findNearestColumn(const std::vector<int> &keys, int col) {
  if (keys.empty()) {
    return nullptr;
  }
  auto it = std::lower_bound(keys.begin(), keys.end(), col);
  if (it == keys.end()) {
    --it;
  }
  if (it != keys.begin()) {
    auto prev = std::prev(it);
    if (std::abs(*prev - col) < std::abs(*it - col)) {
      it = prev;
    }
  }
  return &*it;
}

std::vector<int> sortedKeys(const ColumnMap &columns) {
  std::vector<int> keys;
  keys.reserve(columns.size());
  for (const auto &[key, values] : columns) {
    keys.push_back(key);
  }
  return keys;
}

} // namespace

std::vector<std::string> TextTargetSampler::splitCharacters(const std::string &text) {
  std::vector<std::string> chars;
  size_t i = 0;
  while (i < text.size()) {
    size_t len = utf8SequenceLength(static_cast<unsigned char>(text[i]));
    if (i + len > text.size()) {
      len = 1;
    }
    chars.emplace_back(text.substr(i, len));
    i += len;
  }
  return chars;
}

CharacterRecordList TextTargetSampler::sampleCharacters(const std::string &text,
                                                        const TextSamplingParams &params) {
  CharacterRecordList records;
  const auto chars = splitCharacters(text);
  if (chars.empty()) {
    return records;
  }

  std::vector<float> widths;
  widths.reserve(chars.size());
  float totalWidth = 0.0f;
  for (const auto &ch : chars) {
    const float w = m_rasterizer.measureText(ch, params.fontSize);
    widths.push_back(w);
    totalWidth += w;
  }

  const float scale = params.targetWidth / std::max(totalWidth + 40.0f, 1.0f);
  float xOffset = params.align == TextAlign::Left ? 0.0f : -totalWidth / 2.0f * scale;
  const int canvasHeight = static_cast<int>(std::ceil(params.fontSize * CANVAS_HEIGHT_FACTOR));

  records.reserve(chars.size());
  for (size_t c = 0; c < chars.size(); ++c) {
    const float cw = widths[c];
    const int canvasWidth = static_cast<int>(std::ceil(cw)) + CHAR_CANVAS_PADDING;
    const GlyphMask mask = m_rasterizer.renderText(chars[c], params.fontSize, canvasWidth,
                                                   canvasHeight, CHAR_CANVAS_PADDING / 2.0f);

    CharacterRecord record;
    record.text = chars[c];
    record.center = Vector3D(xOffset + cw * scale / 2.0f, 0.0f, 0.0f);

    if (!mask.empty()) {
      const int step = sampleStep(mask.width, mask.height, params.maxPointsPerChar);
      const float halfW = static_cast<float>(mask.width) / 2.0f;
      const float halfH = static_cast<float>(mask.height) / 2.0f;
      for (int y = 0; y < mask.height; y += step) {
        for (int x = 0; x < mask.width; x += step) {
          if (mask.at(x, y) <= ALPHA_THRESHOLD) {
            continue;
          }
          record.targetPositions.push_back(record.center.getX() +
                                           (static_cast<float>(x) - halfW) * scale);
          record.targetPositions.push_back(-(static_cast<float>(y) - halfH) * scale);
          record.targetPositions.push_back(signedUnit() * params.depthSpread);
        }
      }
    }

    TEXT_DEBUG(std::format("Sampled '{}': {} points", record.text, record.pointCount()));
    records.push_back(std::move(record));
    xOffset += cw * scale;
  }

  return records;
}

void TextTargetSampler::assignSlices(CharacterRecordList &records, size_t groupStart,
                                     size_t groupCount) {
  if (records.empty()) {
    return;
  }
  const size_t perChar = groupCount / records.size();
  for (size_t c = 0; c < records.size(); ++c) {
    records[c].startIndex = groupStart + c * perChar;
    records[c].count = c + 1 < records.size() ? perChar : groupCount - c * perChar;
    records[c].revealed = false;
  }
}

void TextTargetSampler::applyOrigin(CharacterRecordList &records, const Vector3D &origin) {
  const float offX = origin.getX();
  const float offY = origin.getY();
  for (auto &record : records) {
    record.center.setX(record.center.getX() + offX);
    record.center.setY(record.center.getY() + offY);
    for (size_t i = 0; i + 2 < record.targetPositions.size(); i += 3) {
      record.targetPositions[i] += offX;
      record.targetPositions[i + 1] += offY;
    }
  }
}

std::vector<float> TextTargetSampler::sampleSculpture(const std::string &textA,
                                                      const std::string &textB,
                                                      float fontSize, float targetWidth,
                                                      size_t maxPoints) {
  const float widthA = m_rasterizer.measureText(textA, fontSize);
  const float widthB = m_rasterizer.measureText(textB, fontSize);
  const float maxWidth = std::max(widthA, widthB);
  const int canvasWidth = static_cast<int>(std::ceil(maxWidth)) + SCULPTURE_CANVAS_PADDING;
  const int canvasHeight = static_cast<int>(std::ceil(fontSize * CANVAS_HEIGHT_FACTOR));
  const float scale = targetWidth / std::max(maxWidth + 40.0f, 1.0f);

  auto sampleColumns = [&](const std::string &text, float textWidth) {
    ColumnMap columns;
    const float penX = (static_cast<float>(canvasWidth) - textWidth) / 2.0f;
    const GlyphMask mask = m_rasterizer.renderText(text, fontSize, canvasWidth, canvasHeight, penX);
    if (mask.empty()) {
      return columns;
    }
    const int step = sampleStep(canvasWidth, canvasHeight, SCULPTURE_SAMPLE_BUDGET);
    for (int y = 0; y < mask.height; y += step) {
      for (int x = 0; x < mask.width; x += step) {
        if (mask.at(x, y) <= ALPHA_THRESHOLD) {
          continue;
        }
        const float wx = (static_cast<float>(x) - static_cast<float>(canvasWidth) / 2.0f) * scale;
        const float wy = -(static_cast<float>(y) - static_cast<float>(canvasHeight) / 2.0f) * scale;
        columns[static_cast<int>(std::lround(wx * 100.0f))].push_back(wy);
      }
    }
    return columns;
  };

  const ColumnMap columnsA = sampleColumns(textA, widthA);
  const ColumnMap columnsB = sampleColumns(textB, widthB);
  const std::vector<int> keysA = sortedKeys(columnsA);
  const std::vector<int> keysB = sortedKeys(columnsB);

  std::vector<float> points;

  // Front view columns, depth borrowed from the nearest top view column
  for (const auto &[col, ysA] : columnsA) {
    const float x = static_cast<float>(col) / 100.0f;
    const int *nearestB = findNearestColumn(keysB, col);
    const std::vector<float> *zsB = nearestB ? &columnsB.at(*nearestB) : nullptr;

    for (float y : ysA) {
      float z = 0.0f;
      if (zsB && !zsB->empty()) {
        std::uniform_int_distribution<size_t> pick(0, zsB->size() - 1);
        z = (*zsB)[pick(m_rng)];
      } else {
        z = signedUnit() * 0.1f;
      }
      points.push_back(x);
      points.push_back(y);
      points.push_back(z);
    }
  }

  // Top view columns the front view does not already cover
  for (const auto &[col, zsB] : columnsB) {
    if (columnsA.count(col) != 0) {
      continue;
    }
    const int *nearestA = findNearestColumn(keysA, col);
    if (nearestA && std::abs(*nearestA - col) < 5) {
      continue;
    }
    const float x = static_cast<float>(col) / 100.0f;
    for (float z : zsB) {
      points.push_back(x);
      points.push_back(signedUnit() * 0.15f);
      points.push_back(z);
    }
  }

  const size_t total = points.size() / 3;
  TEXT_DEBUG(std::format("Sculpture '{}|{}': {} columns A, {} columns B, {} points", textA,
                         textB, columnsA.size(), columnsB.size(), total));
  if (total <= maxPoints) {
    return points;
  }

  std::vector<float> result(maxPoints * 3);
  for (size_t i = 0; i < maxPoints; ++i) {
    const size_t src = static_cast<size_t>(
        std::floor(static_cast<double>(i) * static_cast<double>(total) /
                   static_cast<double>(maxPoints)));
    result[i * 3] = points[src * 3];
    result[i * 3 + 1] = points[src * 3 + 1];
    result[i * 3 + 2] = points[src * 3 + 2];
  }
  return result;
}

} // namespace GlyphFlow
