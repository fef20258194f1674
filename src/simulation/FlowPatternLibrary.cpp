/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/FlowPatternLibrary.hpp"
#include "core/Logger.hpp"
#include "utils/KernelHash.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <iterator>
#include <numbers>
#include <unordered_set>

namespace GlyphFlow {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

// GLSL mod: result has the sign of y
inline float glslMod(float x, float y) { return x - y * std::floor(x / y); }

inline float mix(float a, float b, float t) { return a + (b - a) * t; }

// Deterministic per-particle random in [0,1) and [-0.5,0.5)
inline float h(float fi, int seed) {
  return KernelHash::hash2(fi, static_cast<float>(seed));
}
inline float hn(float fi, int seed) { return h(fi, seed) - 0.5f; }

Vector3D randSphere(float fi, float radius, int seedBase) {
  const float theta = h(fi, seedBase) * TWO_PI;
  const float cosP = h(fi, seedBase + 1) * 2.0f - 1.0f;
  const float sinP = std::sqrt(std::max(0.0f, 1.0f - cosP * cosP));
  const float r = std::pow(h(fi, seedBase + 2), 0.333333f) * radius;
  return Vector3D(sinP * std::cos(theta) * r, sinP * std::sin(theta) * r, cosP * r);
}

Vector3D randSphereSurface(float fi, float radius, int seedBase) {
  const float theta = h(fi, seedBase) * TWO_PI;
  const float cosP = h(fi, seedBase + 1) * 2.0f - 1.0f;
  const float sinP = std::sqrt(std::max(0.0f, 1.0f - cosP * cosP));
  return Vector3D(sinP * std::cos(theta) * radius, sinP * std::sin(theta) * radius,
                  cosP * radius);
}

// Uniform over the sphere surface by golden-angle spacing
Vector3D fibSphere(float fi, float n, float radius) {
  const float theta = (fi * 2.399963f - std::floor(fi * 2.399963f)) * TWO_PI;
  const float cosP = 1.0f - (fi / n) * 2.0f;
  const float sinP = std::sqrt(std::max(0.0f, 1.0f - cosP * cosP));
  return Vector3D(sinP * std::cos(theta) * radius, sinP * std::sin(theta) * radius,
                  cosP * radius);
}

struct Segment {
  Vector3D start;
  Vector3D end;
};

void writeTarget(std::vector<float> &targets, size_t i, float x, float y, float z) {
  targets[i * 3] = x;
  targets[i * 3 + 1] = y;
  targets[i * 3 + 2] = z;
}

} // anonymous namespace

const std::vector<std::string> &FlowPatternLibrary::proceduralNames() {
  static const std::vector<std::string> s_names = {
      "organic",     "cubeWave",   "rollingWave", "orbiting",
      "breathingSphere", "pendulumWave", "galaxySpin", "vortexDrain",
      "ripplePool",  "flowField",  "auroraCurtain", "perlinFlow3d",
      "flowingSilk"};
  return s_names;
}

const std::vector<std::string> &FlowPatternLibrary::hostOnlyNames() {
  static const std::vector<std::string> s_names = {"branchTree", "fractalTree",
                                                   "kochCurve", "randomWalk"};
  return s_names;
}

const std::vector<std::string> &FlowPatternLibrary::flowCycle() {
  static const std::vector<std::string> s_cycle = {
      "organic",  "branchTree",  "fractalTree",     "kochCurve",
      "randomWalk", "cubeWave",  "rollingWave",     "orbiting",
      "breathingSphere", "pendulumWave", "galaxySpin", "vortexDrain",
      "ripplePool", "flowField"};
  return s_cycle;
}

std::vector<std::string> FlowPatternLibrary::allPatternNames() {
  std::vector<std::string> names = proceduralNames();
  std::unordered_set<std::string> seen(names.begin(), names.end());
  for (const auto &name : hostOnlyNames()) {
    if (seen.insert(name).second) {
      names.push_back(name);
    }
  }
  return names;
}

PatternId FlowPatternLibrary::proceduralId(std::string_view name) {
  const auto &names = proceduralNames();
  auto it = std::find(names.begin(), names.end(), name);
  if (it == names.end()) {
    return NO_PATTERN;
  }
  return static_cast<PatternId>(std::distance(names.begin(), it)) + 1;
}

std::string_view FlowPatternLibrary::proceduralName(PatternId id) {
  if (id < 1 || id > PROCEDURAL_PATTERN_COUNT) {
    return {};
  }
  return proceduralNames()[static_cast<size_t>(id - 1)];
}

bool FlowPatternLibrary::isHostPattern(std::string_view name) {
  if (name == "organic") {
    return true;
  }
  const auto &names = hostOnlyNames();
  return std::find(names.begin(), names.end(), name) != names.end();
}

Vector3D FlowPatternLibrary::evaluate(PatternId id, size_t index, size_t count,
                                      float time) {
  const float fi = static_cast<float>(index);
  const float n = static_cast<float>(std::max<size_t>(count, 1));
  const float side = std::ceil(std::sqrt(n));

  switch (id) {
  case 1: // organic: random sphere volume
    return randSphere(fi, 3.5f, 1);

  case 2: { // cubeWave: ten cubes pulsing in sequence along x
    const float perCube = std::ceil(n / 10.0f);
    const float c = std::clamp(std::floor(fi / perCube), 0.0f, 9.0f);
    const float cx = c - 5.0f;
    const float t = glslMod(time - c * 0.2f, 3.0f);
    const float scale =
        std::clamp(std::min(t / 0.5f, std::min(1.0f, 1.0f - (t - 1.5f) / 0.5f)), 0.0f, 1.0f) *
        (t <= 2.0f ? 1.0f : 0.0f);
    const float s = 0.5f * scale;
    const float small = s <= 0.01f ? 1.0f : 0.0f;
    return Vector3D(cx + mix(hn(fi, 1) * s, hn(fi, 4) * 3.0f, small),
                    mix(hn(fi, 2) * s, hn(fi, 5) * 3.0f, small),
                    mix(hn(fi, 3) * s, hn(fi, 6) * 3.0f, small));
  }

  case 3: { // rollingWave
    const float x = (glslMod(fi, side) - side * 0.5f) / side * 8.0f;
    const float z = (std::floor(fi / side) - side * 0.5f) / side * 8.0f;
    const float y = std::sin(x * 1.5f - time * 2.0f) * 0.6f +
                    std::sin(z * 1.2f - time * 1.3f) * 0.3f;
    return Vector3D(x, y, z) * 0.8f;
  }

  case 4: { // orbiting: eight tilted counter-rotating rings
    const float perRing = std::ceil(n / 8.0f);
    const float r = std::clamp(std::floor(fi / perRing), 0.0f, 7.0f);
    const float j = glslMod(fi, perRing);
    const float radius = 0.5f + r * 0.3f;
    const float speed = (1.0f + r * 0.3f) * mix(1.0f, -1.0f, glslMod(r, 2.0f));
    const float tilt = r / 8.0f * (std::numbers::pi_v<float> * 0.5f);
    const float angle = j / perRing * TWO_PI + time * speed;
    const float y0 = std::sin(angle) * radius;
    return Vector3D(std::cos(angle) * radius, y0 * std::cos(tilt), y0 * std::sin(tilt));
  }

  case 5: // breathingSphere
    return fibSphere(fi, n, 1.5f + std::sin(time * 1.5f) * 0.8f);

  case 6: { // pendulumWave: 20 strings with bobs
    const float perP = std::ceil(n / 20.0f);
    const float p = std::clamp(std::floor(fi / perP), 0.0f, 19.0f);
    const float j = glslMod(fi, perP);
    const float angle = std::sin(time * (0.8f + p * 0.08f)) * 1.2f;
    const float len = 2.0f;
    const float px = (p - 10.0f) * 0.3f;
    const float bobX = px + std::sin(angle) * len;
    const float bobY = -std::cos(angle) * len;
    const float t = j / perP;
    if (t <= 0.3f) {
      const float st = t / 0.3f;
      return Vector3D(px + (bobX - px) * st + hn(fi, 1) * 0.02f,
                      1.5f + (bobY - 1.5f) * st, hn(fi, 2) * 0.02f);
    }
    const Vector3D bob = randSphereSurface(fi, 0.12f, 3);
    return Vector3D(bobX + bob.getX(), bobY + bob.getY(), bob.getZ());
  }

  case 7: { // galaxySpin: three arms
    const float arm = glslMod(fi, 3.0f);
    const float t = fi / n * 8.0f;
    const float angle = t + arm / 3.0f * TWO_PI + time * 0.15f;
    const float r = std::sqrt(t) * 0.45f;
    const float jitter = 0.06f * std::sqrt(r + 0.1f);
    return Vector3D((std::cos(angle) * r + hn(fi, 1) * jitter) * 1.6f, hn(fi, 3) * 0.1f,
                    (std::sin(angle) * r + hn(fi, 2) * jitter) * 1.6f);
  }

  case 8: { // vortexDrain
    const float t = fi / n;
    const float baseR = 0.3f + t * 2.5f;
    const float speed = 2.0f / (baseR + 0.3f);
    const float angle = t * 37.699f + time * speed;
    const float y = -t * 2.0f + 1.0f + std::sin(time * 0.5f) * 0.3f;
    return Vector3D(std::cos(angle) * baseR, y, std::sin(angle) * baseR);
  }

  case 9: { // ripplePool: three interfering sources
    const float x = (glslMod(fi, side) - side * 0.5f) / side * 6.0f;
    const float z = (std::floor(fi / side) - side * 0.5f) / side * 6.0f;
    const std::array<std::pair<float, float>, 3> sources = {{
        {std::sin(time * 0.3f) * 1.5f, std::cos(time * 0.4f) * 1.5f},
        {std::cos(time * 0.5f) * 1.5f, std::sin(time * 0.6f) * 1.5f},
        {0.0f, 0.0f},
    }};
    float y = 0.0f;
    for (const auto &[sx, sz] : sources) {
      const float d = std::sqrt((x - sx) * (x - sx) + (z - sz) * (z - sz));
      y += std::sin(d * 3.0f - time * 4.0f) * 0.2f / (d + 0.5f);
    }
    return Vector3D(x, y, z);
  }

  case 10: { // flowField: streamlines of a sine field
    const float a = fi * 0.001f + 17.0f;
    const float sx = std::sin(a) * 2.5f;
    const float sy = std::sin(a * 1.3f + 14.0f) * 2.5f;
    const float sz = std::sin(a * 1.7f + 30.0f) * 1.5f;
    const float flowT = glslMod(fi / n + time * 0.1f, 1.0f);
    return Vector3D(sx + std::sin(sy * 2.0f + time * 0.5f) * flowT * 2.0f,
                    sy + std::sin(sx * 2.0f + time * 0.3f + 1.5708f) * flowT * 1.5f,
                    sz + std::sin(time * 0.4f + sx) * flowT);
  }

  case 11: { // auroraCurtain
    const float t = fi / n;
    const float curtainX = t * 6.0f - 3.0f;
    const float waveY = std::sin(curtainX * 1.5f + time * 0.4f) * 0.3f;
    const float curtainH = h(fi, 1) * 2.5f + 0.5f;
    const float sway = std::sin(time * 0.6f + curtainX * 0.8f) * 0.3f;
    const float fold = std::sin(curtainX * 3.0f - time * 0.7f) * 0.2f;
    const float shimmer = std::sin(time * 3.0f + fi * 0.01f) * 0.03f;
    return Vector3D(curtainX * 0.5f, curtainH + waveY + shimmer,
                    fold + sway + std::sin(curtainH * 2.0f - time) * 0.1f);
  }

  case 12: { // perlinFlow3d: sphere displaced by a periodic flow
    const Vector3D b = randSphere(fi, 2.5f, 1);
    const float f = 1.5f;
    const float bx = b.getX(), by = b.getY(), bz = b.getZ();
    const Vector3D flow(std::sin(by * f + time * 0.5f) * std::cos(bz * f - time * 0.3f),
                        std::sin(bz * f + time * 0.4f) * std::cos(bx * f - time * 0.2f),
                        std::sin(bx * f + time * 0.3f) * std::cos(by * f - time * 0.4f));
    return b + flow * 0.6f;
  }

  case 13: { // flowingSilk: static drape
    const float ix = (glslMod(fi, side) / side - 0.5f) * 5.0f;
    const float iz = (std::floor(fi / side) / side - 0.5f) * 4.0f;
    const float y = std::sin(ix * 1.5f) * 0.4f + std::cos(iz * 2.0f) * 0.2f +
                    std::sin(ix * 4.0f + iz * 3.0f) * 0.1f;
    return Vector3D(ix * 0.4f, y, iz * 0.5f);
  }

  default:
    return Vector3D();
  }
}

bool FlowPatternLibrary::buildHostPattern(std::string_view name,
                                          std::vector<float> &targets,
                                          size_t count, std::mt19937 &rng) {
  if (targets.size() < count * 3) {
    FLOW_ERROR(std::format("Target buffer holds {} floats, need {}", targets.size(),
                           count * 3));
    return false;
  }

  if (name == "organic") {
    buildOrganic(targets, count, rng);
  } else if (name == "branchTree") {
    buildBranchTree(targets, count, rng);
  } else if (name == "fractalTree") {
    buildFractalTree(targets, count, rng);
  } else if (name == "kochCurve") {
    buildKochCurve(targets, count, rng);
  } else if (name == "randomWalk") {
    buildRandomWalk(targets, count, rng);
  } else if (PatternId id = proceduralId(name); id != NO_PATTERN) {
    for (size_t i = 0; i < count; ++i) {
      const Vector3D p = evaluate(id, i, count, 0.0f);
      writeTarget(targets, i, p.getX(), p.getY(), p.getZ());
    }
  } else {
    FLOW_WARN(std::format("Unknown flow pattern '{}', using organic", name));
    buildOrganic(targets, count, rng);
    return false;
  }
  return true;
}

void FlowPatternLibrary::buildOrganic(std::vector<float> &targets, size_t count,
                                      std::mt19937 &rng) {
  std::uniform_real_distribution<float> uniform(0.0f, 1.0f);
  for (size_t i = 0; i < count; ++i) {
    const float theta = uniform(rng) * TWO_PI;
    const float phi = std::acos(2.0f * uniform(rng) - 1.0f);
    const float r = std::cbrt(uniform(rng)) * 3.5f;
    writeTarget(targets, i, std::sin(phi) * std::cos(theta) * r,
                std::sin(phi) * std::sin(theta) * r, std::cos(phi) * r);
  }
}

void FlowPatternLibrary::buildBranchTree(std::vector<float> &targets, size_t count,
                                         std::mt19937 &rng) {
  constexpr float sc = 1.5f;
  std::uniform_real_distribution<float> uniform(0.0f, 1.0f);

  for (size_t i = 0; i < count; ++i) {
    const float t = static_cast<float>(i) / static_cast<float>(count);
    const int depth = static_cast<int>(std::floor(t * 6.0f));
    const unsigned int branch =
        static_cast<unsigned int>(std::floor(uniform(rng) * static_cast<float>(1u << depth)));

    float angle = 0.0f;
    float x = 0.0f;
    float y = -1.5f;
    float z = 0.0f;
    float len = 1.0f;
    for (int d = 0; d < depth; ++d) {
      const float dir = static_cast<float>((branch >> d) & 1u) * 2.0f - 1.0f;
      angle += dir * 0.4f + (uniform(rng) - 0.5f) * 0.2f;
      x += std::sin(angle) * len;
      y += len * 0.5f;
      z += std::cos(angle * 0.7f) * len * 0.3f;
      len *= 0.7f;
    }

    const float segT = t * 6.0f - static_cast<float>(depth);
    writeTarget(targets, i,
                (x + std::sin(angle) * segT * len + (uniform(rng) - 0.5f) * 0.1f) * sc,
                (y + segT * len * 0.5f) * sc,
                (z + (uniform(rng) - 0.5f) * 0.15f) * sc);
  }
}

void FlowPatternLibrary::buildFractalTree(std::vector<float> &targets, size_t count,
                                          std::mt19937 &rng) {
  std::vector<Segment> branches;
  branches.reserve(FRACTAL_TREE_MAX_BRANCHES + 1);

  // Depth-limited, three children per branch
  auto grow = [&branches](auto &self, const Vector3D &start, float angle,
                          float angleZ, float len, int depth) -> void {
    if (depth > FRACTAL_TREE_MAX_DEPTH || branches.size() > FRACTAL_TREE_MAX_BRANCHES) {
      return;
    }
    const Vector3D end = start + Vector3D(std::cos(angle) * std::cos(angleZ) * len,
                                          std::sin(angleZ) * len,
                                          std::sin(angle) * std::cos(angleZ) * len);
    branches.push_back({start, end});
    if (depth < FRACTAL_TREE_MAX_DEPTH) {
      const float nl = len * 0.67f;
      self(self, end, angle + 0.5f, angleZ + 0.3f, nl, depth + 1);
      self(self, end, angle - 0.5f, angleZ + 0.2f, nl, depth + 1);
      self(self, end, angle + 0.2f, angleZ - 0.1f, nl, depth + 1);
    }
  };
  grow(grow, Vector3D(0.0f, -2.0f, 0.0f), 0.0f, std::numbers::pi_v<float> * 0.5f,
       1.0f, 0);

  FLOW_DEBUG(std::format("fractalTree built {} branches", branches.size()));

  std::uniform_real_distribution<float> uniform(0.0f, 1.0f);
  for (size_t i = 0; i < count; ++i) {
    const Segment &b = branches[i % branches.size()];
    const Vector3D p = Vector3D::lerp(b.start, b.end, uniform(rng));
    writeTarget(targets, i, p.getX() + (uniform(rng) - 0.5f) * 0.04f,
                p.getY() + (uniform(rng) - 0.5f) * 0.04f,
                p.getZ() + (uniform(rng) - 0.5f) * 0.04f);
  }
}

void FlowPatternLibrary::buildKochCurve(std::vector<float> &targets, size_t count,
                                        std::mt19937 &rng) {
  constexpr float sc = 2.0f;
  std::vector<std::array<float, 4>> segments;

  auto koch = [&segments](auto &self, float x1, float y1, float x2, float y2,
                          int depth) -> void {
    if (depth == 0) {
      segments.push_back({x1, y1, x2, y2});
      return;
    }
    const float dx = x2 - x1;
    const float dy = y2 - y1;
    const float ax = x1 + dx / 3.0f;
    const float ay = y1 + dy / 3.0f;
    const float bx = x1 + dx * 2.0f / 3.0f;
    const float by = y1 + dy * 2.0f / 3.0f;
    const float px = (ax + bx) * 0.5f - (by - ay) * 0.866f;
    const float py = (ay + by) * 0.5f + (bx - ax) * 0.866f;
    self(self, x1, y1, ax, ay, depth - 1);
    self(self, ax, ay, px, py, depth - 1);
    self(self, px, py, bx, by, depth - 1);
    self(self, bx, by, x2, y2, depth - 1);
  };
  koch(koch, -1.0f, -0.577f, 1.0f, -0.577f, 4);
  koch(koch, 1.0f, -0.577f, 0.0f, 1.155f, 4);
  koch(koch, 0.0f, 1.155f, -1.0f, -0.577f, 4);

  std::uniform_real_distribution<float> uniform(0.0f, 1.0f);
  for (size_t i = 0; i < count; ++i) {
    const auto &seg = segments[i % segments.size()];
    const float t = uniform(rng);
    writeTarget(targets, i, (seg[0] + (seg[2] - seg[0]) * t) * sc,
                (seg[1] + (seg[3] - seg[1]) * t) * sc, (uniform(rng) - 0.5f) * 0.3f);
  }
}

void FlowPatternLibrary::buildRandomWalk(std::vector<float> &targets, size_t count,
                                         std::mt19937 &rng) {
  constexpr float sc = 0.05f;
  constexpr size_t walks = 8;
  const size_t perWalk = (count + walks - 1) / walks;
  std::uniform_real_distribution<float> step(-1.0f, 1.0f);

  for (size_t w = 0; w < walks; ++w) {
    Vector3D p;
    for (size_t i = 0; i < perWalk; ++i) {
      const size_t idx = w * perWalk + i;
      if (idx >= count) {
        break;
      }
      p += Vector3D(step(rng), step(rng), step(rng));
      writeTarget(targets, idx, p.getX() * sc, p.getY() * sc, p.getZ() * sc);
    }
  }
}

} // namespace GlyphFlow
