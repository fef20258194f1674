/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/FormationAnimator.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numbers>

namespace GlyphFlow {

namespace {

struct AnimationEntry {
  const char *name;
  FormationSchedule schedule;
};

// Declaration order of FormationAnimation
constexpr std::array<AnimationEntry, FORMATION_ANIMATION_COUNT> ANIMATIONS = {{
    {"waveReveal", {0.0f, 0.08f}},
    {"rainDrop", {0.0f, 0.0f}},
    {"spiralPerChar", {0.2f, 0.10f}},
    {"ringToChar", {0.2f, 0.08f}},
    {"typewriter", {0.0f, 0.18f}},
    {"columnDrop", {0.0f, 0.0f}},
    {"centerBurst", {0.0f, 0.0f}},
    {"directSnap", {0.0f, 0.0f}},
    {"sphereContract", {0.15f, 0.0f}},
    {"riseUp", {0.0f, 0.0f}},
    {"scatterIn", {0.0f, 0.05f}},
    {"gridDissolve", {0.2f, 0.0f}},
    {"tornado", {0.3f, 0.10f}},
    {"phyllotaxis", {0.2f, 0.0f}},
    {"shockwaveRing", {0.15f, 0.0f}},
    {"flatPlane", {0.0f, 0.06f}},
}};

constexpr float PI = std::numbers::pi_v<float>;

// Calls fn(j, idx) for each slot of the record that fits inside the buffer
template <typename Fn>
void forEachSlot(const CharacterRecord &record, size_t particleCount, Fn &&fn) {
  for (size_t j = 0; j < record.count; ++j) {
    const size_t idx = record.startIndex + j;
    if (idx >= particleCount) {
      break;
    }
    fn(j, idx);
  }
}

void writeTarget(std::vector<float> &targets, size_t idx, float x, float y, float z) {
  targets[idx * 3] = x;
  targets[idx * 3 + 1] = y;
  targets[idx * 3 + 2] = z;
}

} // namespace

const FormationSchedule &FormationAnimator::schedule(FormationAnimation animation) {
  const size_t index = static_cast<size_t>(animation);
  if (index >= ANIMATIONS.size()) {
    return ANIMATIONS[static_cast<size_t>(FormationAnimation::DirectSnap)].schedule;
  }
  return ANIMATIONS[index].schedule;
}

const char *FormationAnimator::name(FormationAnimation animation) {
  const size_t index = static_cast<size_t>(animation);
  return index < ANIMATIONS.size() ? ANIMATIONS[index].name : "unknown";
}

FormationAnimation FormationAnimator::fromName(std::string_view name) {
  for (size_t i = 0; i < ANIMATIONS.size(); ++i) {
    if (name == ANIMATIONS[i].name) {
      return static_cast<FormationAnimation>(i);
    }
  }
  FORMATION_WARN(std::format("Unknown formation animation '{}', using directSnap", name));
  return FormationAnimation::DirectSnap;
}

FormationAnimation FormationAnimator::defaultForTextIndex(uint32_t textIndex) {
  return static_cast<FormationAnimation>(textIndex % FORMATION_ANIMATION_COUNT);
}

void FormationAnimator::writePreShape(FormationAnimation animation,
                                      const CharacterRecordList &records,
                                      std::vector<float> &targets, std::mt19937 &rng) {
  std::uniform_real_distribution<float> unitDist(0.0f, 1.0f);
  auto unit = [&]() { return unitDist(rng); };
  auto rnd = [&]() { return unitDist(rng) - 0.5f; };
  const size_t particleCount = targets.size() / 3;

  for (const auto &cd : records) {
    const float cx = cd.center.getX();
    const float cy = cd.center.getY();
    const float cz = cd.center.getZ();
    const float slice = static_cast<float>(std::max<size_t>(cd.count, 1));

    switch (animation) {
    case FormationAnimation::WaveReveal:
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float localX = (static_cast<float>(j) / slice - 0.5f) * 2.5f;
        const float x = cx + localX + rnd() * 0.3f;
        const float y = cy + std::sin(localX * PI) * 0.5f + rnd() * 0.2f;
        writeTarget(targets, idx, x, y, rnd() * 0.3f);
      });
      break;
    case FormationAnimation::RainDrop:
      forEachSlot(cd, particleCount, [&](size_t, size_t idx) {
        const float x = cx + rnd() * 0.4f;
        const float y = cy + 3.0f + unit() * 3.0f;
        writeTarget(targets, idx, x, y, cz + rnd() * 0.2f);
      });
      break;
    case FormationAnimation::SpiralPerChar:
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float t = static_cast<float>(j) / slice;
        const float angle = t * PI * 10.0f;
        const float r = 1.5f * (1.0f - t);
        writeTarget(targets, idx, cx + std::cos(angle) * r, cy + std::sin(angle) * r,
                    cz + (t - 0.5f) * 0.8f);
      });
      break;
    case FormationAnimation::RingToChar:
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float angle = static_cast<float>(j) / slice * PI * 2.0f;
        const float r = 0.6f + unit() * 0.5f;
        const float x = cx + std::cos(angle) * r;
        const float y = cy + std::sin(angle) * r;
        writeTarget(targets, idx, x, y, cz + rnd() * 0.35f);
      });
      break;
    case FormationAnimation::Typewriter:
      forEachSlot(cd, particleCount, [&](size_t, size_t idx) {
        const float x = cx + rnd() * 0.15f;
        const float y = -8.0f + unit() * 0.8f;
        writeTarget(targets, idx, x, y, cz + rnd() * 0.15f);
      });
      break;
    case FormationAnimation::ColumnDrop:
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float t = static_cast<float>(j) / slice;
        const float x = cx + rnd() * 0.4f;
        writeTarget(targets, idx, x, 2.0f + t * 5.0f, cz + rnd() * 0.4f);
      });
      break;
    case FormationAnimation::CenterBurst:
      forEachSlot(cd, particleCount, [&](size_t, size_t idx) {
        const float x = rnd() * 0.05f;
        const float y = rnd() * 0.05f;
        writeTarget(targets, idx, x, y, rnd() * 0.05f);
      });
      break;
    case FormationAnimation::SphereContract:
    case FormationAnimation::ScatterIn: {
      const bool contract = animation == FormationAnimation::SphereContract;
      forEachSlot(cd, particleCount, [&](size_t, size_t idx) {
        const float theta = unit() * PI * 2.0f;
        const float phi = std::acos(2.0f * unit() - 1.0f);
        const float r = contract ? 0.6f + unit() * 0.6f : 1.0f + unit() * 2.5f;
        writeTarget(targets, idx, cx + std::sin(phi) * std::cos(theta) * r,
                    cy + std::sin(phi) * std::sin(theta) * r, cz + std::cos(phi) * r);
      });
      break;
    }
    case FormationAnimation::RiseUp:
      forEachSlot(cd, particleCount, [&](size_t, size_t idx) {
        const float x = cx + rnd() * 0.3f;
        const float y = cy - 3.0f - unit() * 2.0f;
        writeTarget(targets, idx, x, y, cz + rnd() * 0.2f);
      });
      break;
    case FormationAnimation::GridDissolve: {
      const size_t gridN = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(cd.count))));
      const float gridF = static_cast<float>(std::max<size_t>(gridN, 1));
      const float spacing = 1.2f / gridF;
      const float jit = spacing * 0.2f;
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float col = static_cast<float>(j % gridN);
        const float row = static_cast<float>(j / gridN);
        const float x = cx + (col - gridF / 2.0f) * spacing + rnd() * jit;
        const float y = cy + (row - gridF / 2.0f) * spacing + rnd() * jit;
        writeTarget(targets, idx, x, y, cz + rnd() * 0.25f);
      });
      break;
    }
    case FormationAnimation::Tornado:
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float t = static_cast<float>(j) / slice;
        const float y = t * 5.0f - 2.5f;
        const float r = 0.3f + t * 1.2f;
        const float angle = t * PI * 12.0f + rnd() * 1.5f;
        writeTarget(targets, idx, cx + std::cos(angle) * r, cy + y, cz + std::sin(angle) * r);
      });
      break;
    case FormationAnimation::Phyllotaxis: {
      const float goldenAngle = PI * (3.0f - std::sqrt(5.0f));
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float t = static_cast<float>(j) / slice;
        const float theta = static_cast<float>(j) * goldenAngle;
        const float phi = std::acos(1.0f - 2.0f * t);
        const float r = 0.8f + rnd() * 0.1f;
        writeTarget(targets, idx, cx + std::sin(phi) * std::cos(theta) * r,
                    cy + std::sin(phi) * std::sin(theta) * r, cz + std::cos(phi) * r);
      });
      break;
    }
    case FormationAnimation::ShockwaveRing:
      forEachSlot(cd, particleCount, [&](size_t j, size_t idx) {
        const float angle = static_cast<float>(j) / slice * PI * 2.0f;
        const float r = 1.5f + unit() * 0.5f;
        const float x = cx + std::cos(angle) * r;
        const float y = cy + std::sin(angle) * r;
        writeTarget(targets, idx, x, y, cz + rnd() * 0.12f);
      });
      break;
    case FormationAnimation::FlatPlane:
      forEachSlot(cd, particleCount, [&](size_t, size_t idx) {
        const float x = cx + rnd() * 3.0f;
        const float y = cy + rnd() * 2.0f;
        writeTarget(targets, idx, x, y, 0.0f);
      });
      break;
    case FormationAnimation::DirectSnap:
    case FormationAnimation::COUNT:
      break;
    }
  }

  const bool anyDepth = std::any_of(records.begin(), records.end(),
                                    [](const CharacterRecord &cd) { return cd.hasDepth(); });
  if (!anyDepth) {
    for (const auto &cd : records) {
      forEachSlot(cd, particleCount,
                  [&](size_t, size_t idx) { targets[idx * 3 + 2] = 0.0f; });
    }
  }

  FORMATION_DEBUG(std::format("Pre-shape {} over {} characters", name(animation), records.size()));
}

void FormationAnimator::writeCharTargets(const CharacterRecord &record,
                                         std::vector<float> &targets, std::mt19937 &rng) {
  const size_t pointCount = record.pointCount();
  if (pointCount == 0) {
    return;
  }
  std::uniform_real_distribution<float> unitDist(0.0f, 1.0f);
  const bool hasDepth = record.hasDepth();
  const auto &src = record.targetPositions;

  forEachSlot(record, targets.size() / 3, [&](size_t j, size_t idx) {
    const size_t s = j % pointCount;
    const float jitter = j < pointCount ? 0.0f : OVERFLOW_JITTER;
    const float x = src[s * 3] + (unitDist(rng) - 0.5f) * jitter;
    const float y = src[s * 3 + 1] + (unitDist(rng) - 0.5f) * jitter;
    const float z = src[s * 3 + 2] + (hasDepth ? (unitDist(rng) - 0.5f) * DEPTH_JITTER : 0.0f);
    writeTarget(targets, idx, x, y, z);
  });
}

void FormationAnimator::applyAllCharTargets(const CharacterRecordList &records,
                                            std::vector<float> &targets, std::mt19937 &rng) {
  for (const auto &record : records) {
    writeCharTargets(record, targets, rng);
  }
}

bool FormationAnimator::revealChar(CharacterRecord &record, std::vector<float> &targets,
                                   std::mt19937 &rng) {
  if (record.revealed) {
    return false;
  }
  record.revealed = true;
  writeCharTargets(record, targets, rng);
  return true;
}

bool FormationAnimator::updateReveal(FormationAnimation animation, CharacterRecordList &records,
                                     float elapsed, std::vector<float> &targets,
                                     std::mt19937 &rng) {
  const FormationSchedule &timing = schedule(animation);
  bool allRevealed = true;
  for (size_t c = 0; c < records.size(); ++c) {
    auto &record = records[c];
    if (record.revealed) {
      continue;
    }
    if (elapsed >= timing.delay + static_cast<float>(c) * timing.stagger) {
      revealChar(record, targets, rng);
    } else {
      allRevealed = false;
    }
  }
  return allRevealed;
}

} // namespace GlyphFlow
