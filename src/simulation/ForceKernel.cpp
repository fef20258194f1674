/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/ForceKernel.hpp"
#include "simulation/FlowPatternLibrary.hpp"
#include "utils/KernelHash.hpp"
#include <algorithm>
#include <cmath>

namespace GlyphFlow {

namespace {

float smoothstep(float edge0, float edge1, float x) {
  const float t = std::clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
  return t * t * (3.0f - 2.0f * t);
}

Vector3D offsetAll(const Vector3D &v, float s) {
  return Vector3D(v.getX() + s, v.getY() + s, v.getZ() + s);
}

} // namespace

ForceKernel::ForceKernel(unsigned int noiseSeed) : m_noise(noiseSeed) {}

ForceKernel::ResolvedPattern ForceKernel::resolvePattern(const SimulationContext &ctx,
                                                         size_t index) {
  if (ctx.layerCount > 1) {
    const auto &layer = ctx.layers[index % std::min(ctx.layerCount, MAX_FLOW_LAYERS)];
    return {layer.patternId, layer.origin, layer.scale, false};
  }

  if (ctx.backgroundPatternId > NO_PATTERN) {
    const float perChar = std::max(ctx.textPerChar, 1.0f);
    const float posInChar = std::fmod(static_cast<float>(index), perChar);
    if (posInChar / perChar >= ctx.textRatio) {
      return {ctx.backgroundPatternId, ctx.flowOrigin, ctx.flowScale, true};
    }
  }

  if (index >= ctx.splitIndex && ctx.patternIdB > NO_PATTERN) {
    return {ctx.patternIdB, ctx.flowOriginB, ctx.flowScaleB, false};
  }

  return {ctx.patternId, ctx.flowOrigin, ctx.flowScale, false};
}

float ForceKernel::particleHash(size_t index) {
  return KernelHash::hash1(static_cast<float>(index) * 0.137f);
}

float ForceKernel::effectiveAttraction(float convergence, float sweepDelay, float hash) {
  return std::clamp(convergence - sweepDelay * 0.03f - hash * 0.01f, 0.0f, 1.0f);
}

Vector3D ForceKernel::respawnPosition(size_t index, float time, const Vector3D &target,
                                      float attraction) {
  const float fi = static_cast<float>(index);
  const Vector3D raw(KernelHash::hash2(fi + 500.0f, time) - 0.5f,
                     KernelHash::hash2(fi + 1500.0f, time) - 0.5f,
                     KernelHash::hash2(fi + 2500.0f, time) - 0.5f);
  const float rawLen = std::max(raw.length(), 0.001f);
  const float radius = RESPAWN_SHELL_MIN +
                       KernelHash::hash2(fi + 3500.0f, time) * (RESPAWN_SHELL_MAX - RESPAWN_SHELL_MIN);

  const Vector3D shell = target + raw / rawLen * radius;
  const Vector3D jitteredTarget = target + raw * 0.02f * std::max(1.0f - attraction, 0.05f);
  const float blend = attraction * attraction * 0.8f + attraction * 0.2f;
  return shell + (jitteredTarget - shell) * blend;
}

void ForceKernel::updateRange(ParticleBuffers &buffers, const SimulationContext &ctx,
                              size_t begin, size_t end) const {
  end = std::min(end, buffers.count());
  const float t = ctx.time;
  const float dt = ctx.deltaTime;

  // Tick-wide fields, identical for every particle
  const Vector3D vortexCenter(std::sin(t * 0.07f) * 1.2f, std::cos(t * 0.11f) * 0.8f,
                              std::sin(t * 0.09f) * 0.5f);
  const Vector3D vortexAxis =
      Vector3D(std::sin(t * 0.05f), std::cos(t * 0.03f), std::sin(t * 0.07f + 1.0f)).normalized();
  const Vector3D waveOrigin(std::sin(t * 0.13f) * 2.0f, std::cos(t * 0.09f) * 1.5f, 0.0f);
  const float camScale = ctx.isOrthographic ? 0.2f : 1.0f;
  const float flat = ctx.flattenZ;

  for (size_t i = begin; i < end; ++i) {
    const bool inGroupB = i >= ctx.splitIndex;
    const GroupUniforms &group = inGroupB ? ctx.groupB : ctx.groupA;

    // 1. Target from the resolved procedural pattern
    const ResolvedPattern pattern = resolvePattern(ctx, i);
    Vector3D target = buffers.getTarget(i);
    if (pattern.id > NO_PATTERN) {
      target = FlowPatternLibrary::evaluate(pattern.id, i, ctx.particleCount, t) * pattern.scale +
               pattern.origin;
      buffers.setTarget(i, target);
    }

    Vector3D pos = buffers.getPosition(i);
    Vector3D vel = buffers.getVelocity(i);
    buffers.life[i * 2] -= dt;

    const Vector3D dir = target - pos;
    const float hash = particleHash(i);
    const float variation = hash * 1.4f + 0.3f;

    // 2. Attraction with directional sweep
    const float attraction = effectiveAttraction(group.convergence, pos.dot(group.sweep), hash);
    const float freedom = std::max(1.0f - attraction, 0.0f);

    // 3. Multi-octave noise
    const float ns = ctx.noiseScale;
    const Vector3D n1 = m_noise.noiseVec3(offsetAll(pos * ns, t * 0.08f));
    const Vector3D n2 = m_noise.noiseVec3(offsetAll(pos * (ns * 2.3f), t * 0.14f));
    const Vector3D n3 = m_noise.noiseVec3(offsetAll(pos * (ns * 5.1f), t * 0.22f));
    vel += (n1 + n2 * 0.4f + n3 * 0.15f) * (ctx.noiseStrength * 1.5f * freedom);

    // 4. Vortex
    if (ctx.vortexStrength != 0.0f) {
      const Vector3D toV = pos - vortexCenter;
      const float vDist = std::max(toV.length(), 0.01f);
      const Vector3D vForce = (toV / vDist).cross(vortexAxis);
      const float falloff = smoothstep(0.0f, 1.5f, vDist) * smoothstep(5.0f, 2.0f, vDist);
      vel += vForce * (ctx.vortexStrength * falloff * freedom);
    }

    // 5. Wave ripple
    if (ctx.waveStrength != 0.0f) {
      const Vector3D wDir = pos - waveOrigin;
      const float wDist = std::max(wDir.length(), 0.01f);
      const float push =
          std::sin(wDist * 3.0f - ctx.wavePhase) * ctx.waveStrength / std::max(wDist, 0.5f);
      vel += wDir / wDist * push;
    }

    // 6. Direct pull, drift, spring bias and linger
    const float bgMul = pattern.background ? BACKGROUND_ATTRACTION : 1.0f;
    pos += dir * (attraction * DIRECT_PULL * bgMul);

    const float driftP = pos.getX() * 0.6f + pos.getY() * 0.4f + t * 0.2f;
    vel.setX(vel.getX() + std::sin(driftP) * 0.00004f * freedom);
    vel.setY(vel.getY() + std::sin(driftP + 1.571f) * 0.00003f * freedom -
             0.000008f * freedom);
    vel += dir * (ctx.springStrength * attraction * variation * 1.5f * bgMul);

    const float proximity = smoothstep(5.0f, 0.0f, dir.length());
    pos += dir * (ctx.springStrength * attraction * proximity * variation * 10.0f * bgMul);

    // 7. Near-target velocity suppression
    vel *= 1.0f - attraction * proximity * 0.95f;

    // 8. Camera repulsion
    const Vector3D toCam = pos - ctx.cameraPosition;
    const float camDist = std::max(toCam.length(), 0.01f);
    const float repulse = smoothstep(0.8f, 0.0f, camDist) * 0.0004f * camScale;
    vel += toCam / camDist * repulse;

    // 9. Soft boundary around the pattern origin
    const Vector3D rel = pos - pattern.origin;
    const float relDist = rel.length();
    const float over = std::max(relDist - BOUNDARY_RADIUS, 0.0f);
    if (over > 0.0f) {
      vel -= rel / std::max(relDist, 0.01f) * (over * BOUNDARY_STRENGTH);
    }

    // 10. Gravity
    vel.setY(vel.getY() - ctx.gravity);

    // 11. Velocity clamp
    const float speed = vel.length();
    if (speed > MAX_VELOCITY) {
      vel = vel / std::max(speed, 0.0001f) * MAX_VELOCITY;
    }

    // 12. Damping and integration
    vel *= ctx.damping;
    pos += vel * (dt * 60.0f);

    // 13. Flat text: soft then hard z pin
    if (flat > 0.0f) {
      vel.setZ(vel.getZ() * (1.0f - flat * 0.85f));
      pos.setZ(pos.getZ() + (target.getZ() - pos.getZ()) * flat * 0.12f);
      pos.setZ(pos.getZ() + (target.getZ() - pos.getZ()) * flat);
      vel.setZ(vel.getZ() * (1.0f - flat));
    }

    // 14. Life and respawn
    if (buffers.life[i * 2] < 0.0f) {
      pos = respawnPosition(i, t, target, attraction);
      buffers.life[i * 2] += buffers.life[i * 2 + 1];
    }

    buffers.setPosition(i, pos);
    buffers.setVelocity(i, vel);
  }
}

} // namespace GlyphFlow
