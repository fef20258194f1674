/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ForceKernelTests
#include <boost/test/unit_test.hpp>

#include "simulation/FlowPatternLibrary.hpp"
#include "simulation/ForceKernel.hpp"
#include <cmath>
#include <random>

using namespace GlyphFlow;

namespace {

constexpr size_t PARTICLES = 512;

SimulationContext makeContext() {
  SimulationContext ctx;
  ctx.time = 4.0f;
  ctx.deltaTime = 1.0f / 60.0f;
  ctx.noiseStrength = 0.002f;
  ctx.noiseScale = 0.4f;
  ctx.springStrength = 0.002f;
  ctx.damping = 0.97f;
  ctx.vortexStrength = 0.001f;
  ctx.waveStrength = 0.0005f;
  ctx.wavePhase = 1.3f;
  ctx.particleCount = PARTICLES;
  ctx.splitIndex = PARTICLES;
  ctx.groupA.convergence = 0.5f;
  ctx.patternId = FlowPatternLibrary::ORGANIC_ID;
  return ctx;
}

} // namespace

struct KernelFixture {
  KernelFixture() : rng(99), kernel(0), ctx(makeContext()) {
    buffers.allocate(PARTICLES, rng);
  }

  std::mt19937 rng;
  ForceKernel kernel;
  ParticleBuffers buffers;
  SimulationContext ctx;
};

BOOST_AUTO_TEST_SUITE(PatternResolutionTests)

BOOST_AUTO_TEST_CASE(TestGlobalPattern) {
  SimulationContext ctx = makeContext();
  ctx.flowOrigin = Vector3D(1.0f, 2.0f, 3.0f);
  ctx.flowScale = 0.5f;
  const auto resolved = ForceKernel::resolvePattern(ctx, 10);
  BOOST_CHECK_EQUAL(resolved.id, FlowPatternLibrary::ORGANIC_ID);
  BOOST_CHECK(resolved.origin == ctx.flowOrigin);
  BOOST_CHECK_EQUAL(resolved.scale, 0.5f);
  BOOST_CHECK(!resolved.background);
}

BOOST_AUTO_TEST_CASE(TestGroupBPatternAboveSplit) {
  SimulationContext ctx = makeContext();
  ctx.splitIndex = PARTICLES / 2;
  ctx.patternIdB = 7;
  ctx.flowOriginB = Vector3D(0.0f, -1.0f, 0.0f);
  BOOST_CHECK_EQUAL(ForceKernel::resolvePattern(ctx, 0).id, FlowPatternLibrary::ORGANIC_ID);
  const auto b = ForceKernel::resolvePattern(ctx, PARTICLES / 2);
  BOOST_CHECK_EQUAL(b.id, 7);
  BOOST_CHECK(b.origin == ctx.flowOriginB);
}

BOOST_AUTO_TEST_CASE(TestBackgroundShareOfCharacterSlice) {
  SimulationContext ctx = makeContext();
  ctx.backgroundPatternId = 9;
  ctx.textRatio = 0.75f;
  ctx.textPerChar = 100.0f;
  ctx.splitIndex = 0;
  ctx.patternIdB = 7;

  // First 75 of every 100 stay on text, the rest follow the background
  BOOST_CHECK(!ForceKernel::resolvePattern(ctx, 10).background);
  BOOST_CHECK_EQUAL(ForceKernel::resolvePattern(ctx, 10).id, 7);
  const auto bg = ForceKernel::resolvePattern(ctx, 180);
  BOOST_CHECK(bg.background);
  BOOST_CHECK_EQUAL(bg.id, 9);
}

BOOST_AUTO_TEST_CASE(TestMultiLayerWins) {
  SimulationContext ctx = makeContext();
  ctx.layerCount = 3;
  ctx.layers[0] = {2, Vector3D(-2.0f, 0.0f, 0.0f), 1.0f};
  ctx.layers[1] = {5, Vector3D(2.0f, 0.0f, 0.0f), 0.5f};
  ctx.layers[2] = {8, Vector3D(), 2.0f};
  ctx.backgroundPatternId = 9;
  ctx.textRatio = 0.0f;
  ctx.patternIdB = 7;
  ctx.splitIndex = 0;

  BOOST_CHECK_EQUAL(ForceKernel::resolvePattern(ctx, 0).id, 2);
  BOOST_CHECK_EQUAL(ForceKernel::resolvePattern(ctx, 4).id, 5);
  BOOST_CHECK_EQUAL(ForceKernel::resolvePattern(ctx, 5).id, 8);
  BOOST_CHECK_EQUAL(ForceKernel::resolvePattern(ctx, 4).scale, 0.5f);
  BOOST_CHECK(!ForceKernel::resolvePattern(ctx, 5).background);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AttractionTests)

BOOST_AUTO_TEST_CASE(TestAttractionClamped) {
  BOOST_CHECK_EQUAL(ForceKernel::effectiveAttraction(1.5f, 0.0f, 0.0f), 1.0f);
  BOOST_CHECK_EQUAL(ForceKernel::effectiveAttraction(0.0f, 0.0f, 0.5f), 0.0f);
  BOOST_CHECK_EQUAL(ForceKernel::effectiveAttraction(0.01f, 10.0f, 0.0f), 0.0f);
  BOOST_CHECK_CLOSE(ForceKernel::effectiveAttraction(0.5f, 1.0f, 1.0f), 0.46f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestParticleHashStable) {
  for (size_t i = 0; i < 1000; ++i) {
    const float h = ForceKernel::particleHash(i);
    BOOST_CHECK_GE(h, 0.0f);
    BOOST_CHECK_LT(h, 1.0f);
    BOOST_CHECK_EQUAL(h, ForceKernel::particleHash(i));
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RespawnTests)

BOOST_AUTO_TEST_CASE(TestRespawnOnShellWhenFree) {
  const Vector3D target(1.0f, -0.5f, 0.25f);
  for (size_t i = 0; i < 500; ++i) {
    const Vector3D p = ForceKernel::respawnPosition(i, 3.7f, target, 0.0f);
    const float dist = (p - target).length();
    BOOST_CHECK_GE(dist, ForceKernel::RESPAWN_SHELL_MIN - 1e-3f);
    BOOST_CHECK_LE(dist, ForceKernel::RESPAWN_SHELL_MAX + 1e-3f);
  }
}

BOOST_AUTO_TEST_CASE(TestRespawnNearTargetWhenConverged) {
  const Vector3D target(-2.0f, 1.0f, 0.0f);
  for (size_t i = 0; i < 500; ++i) {
    const Vector3D p = ForceKernel::respawnPosition(i, 3.7f, target, 1.0f);
    BOOST_CHECK_LE((p - target).length(), 0.01f);
  }
}

BOOST_AUTO_TEST_CASE(TestRespawnBlendMonotonic) {
  const Vector3D target;
  const float loose = (ForceKernel::respawnPosition(42, 1.0f, target, 0.0f) - target).length();
  const float half = (ForceKernel::respawnPosition(42, 1.0f, target, 0.5f) - target).length();
  const float full = (ForceKernel::respawnPosition(42, 1.0f, target, 1.0f) - target).length();
  BOOST_CHECK_GT(loose, half);
  BOOST_CHECK_GT(half, full);
  // blend(0.5) = 0.25 * 0.8 + 0.1 = 0.3
  BOOST_CHECK_CLOSE(half, loose * 0.7f, 1.0f);
}

BOOST_AUTO_TEST_CASE(TestRespawnDependsOnTime) {
  const Vector3D target;
  BOOST_CHECK(ForceKernel::respawnPosition(7, 1.0f, target, 0.0f) !=
              ForceKernel::respawnPosition(7, 2.0f, target, 0.0f));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(UpdateRangeTests)

BOOST_FIXTURE_TEST_CASE(TestSplitRangesMatchSinglePass, KernelFixture) {
  ctx.splitIndex = PARTICLES / 2;
  ctx.groupB.convergence = 0.1f;
  ctx.patternIdB = FlowPatternLibrary::proceduralId("galaxySpin");
  ParticleBuffers reference = buffers;

  kernel.updateRange(reference, ctx, 0, PARTICLES);

  // Uneven batches processed out of order
  kernel.updateRange(buffers, ctx, 300, PARTICLES);
  kernel.updateRange(buffers, ctx, 0, 37);
  kernel.updateRange(buffers, ctx, 37, 300);

  BOOST_CHECK(buffers.positions == reference.positions);
  BOOST_CHECK(buffers.velocities == reference.velocities);
  BOOST_CHECK(buffers.targets == reference.targets);
  BOOST_CHECK(buffers.life == reference.life);
}

BOOST_FIXTURE_TEST_CASE(TestRangeEndClampedToBuffer, KernelFixture) {
  ParticleBuffers reference = buffers;
  kernel.updateRange(reference, ctx, 0, PARTICLES);
  kernel.updateRange(buffers, ctx, 0, PARTICLES * 4);
  BOOST_CHECK(buffers.positions == reference.positions);
}

BOOST_FIXTURE_TEST_CASE(TestProceduralTargetWritten, KernelFixture) {
  ctx.patternId = FlowPatternLibrary::proceduralId("galaxySpin");
  ctx.flowOrigin = Vector3D(0.5f, 0.0f, 0.0f);
  ctx.flowScale = 2.0f;
  kernel.updateRange(buffers, ctx, 0, PARTICLES);

  for (size_t i = 0; i < PARTICLES; i += 31) {
    const Vector3D expected =
        FlowPatternLibrary::evaluate(ctx.patternId, i, PARTICLES, ctx.time) * 2.0f + ctx.flowOrigin;
    BOOST_CHECK_SMALL((buffers.getTarget(i) - expected).length(), 1e-5f);
  }
}

BOOST_FIXTURE_TEST_CASE(TestBufferTargetsUsedWithoutPattern, KernelFixture) {
  ctx.patternId = NO_PATTERN;
  buffers.setTarget(3, Vector3D(1.0f, 1.0f, 1.0f));
  kernel.updateRange(buffers, ctx, 0, PARTICLES);
  BOOST_CHECK(buffers.getTarget(3) == Vector3D(1.0f, 1.0f, 1.0f));
}

BOOST_FIXTURE_TEST_CASE(TestVelocityClamped, KernelFixture) {
  ctx.noiseStrength = 5.0f;
  ctx.vortexStrength = 5.0f;
  ctx.gravity = 1.0f;
  kernel.updateRange(buffers, ctx, 0, PARTICLES);
  for (size_t i = 0; i < PARTICLES; ++i) {
    BOOST_CHECK_LE(buffers.getVelocity(i).length(), ForceKernel::MAX_VELOCITY * ctx.damping + 1e-5f);
  }
}

BOOST_FIXTURE_TEST_CASE(TestFlattenPinsZ, KernelFixture) {
  ctx.patternId = NO_PATTERN;
  ctx.flattenZ = 1.0f;
  for (size_t i = 0; i < PARTICLES; ++i) {
    buffers.setTarget(i, Vector3D(0.0f, 0.0f, 0.0f));
    buffers.life[i * 2] = 100.0f;
  }
  kernel.updateRange(buffers, ctx, 0, PARTICLES);
  for (size_t i = 0; i < PARTICLES; ++i) {
    BOOST_CHECK_SMALL(buffers.getPosition(i).getZ(), 1e-5f);
    BOOST_CHECK_SMALL(buffers.getVelocity(i).getZ(), 1e-6f);
  }
}

BOOST_FIXTURE_TEST_CASE(TestExpiredParticleRespawns, KernelFixture) {
  ctx.patternId = NO_PATTERN;
  ctx.groupA.convergence = 0.0f;
  buffers.setTarget(5, Vector3D());
  buffers.setPosition(5, Vector3D(0.0f, 0.0f, 0.0f));
  buffers.life[5 * 2] = 0.001f;
  buffers.life[5 * 2 + 1] = 8.0f;

  kernel.updateRange(buffers, ctx, 0, PARTICLES);

  BOOST_CHECK_GT(buffers.life[5 * 2], 7.9f);
  const float dist = buffers.getPosition(5).length();
  BOOST_CHECK_GE(dist, ForceKernel::RESPAWN_SHELL_MIN - 1e-3f);
  BOOST_CHECK_LE(dist, ForceKernel::RESPAWN_SHELL_MAX + 1e-3f);
}

BOOST_FIXTURE_TEST_CASE(TestConvergedParticlesSettle, KernelFixture) {
  ctx.patternId = NO_PATTERN;
  ctx.groupA.convergence = 1.0f;
  ctx.noiseStrength = 0.0f;
  ctx.vortexStrength = 0.0f;
  ctx.waveStrength = 0.0f;
  ctx.springStrength = 0.005f;
  for (size_t i = 0; i < PARTICLES; ++i) {
    buffers.setTarget(i, Vector3D(0.5f, 0.5f, 0.0f));
    buffers.life[i * 2] = 1000.0f;
  }

  for (int step = 0; step < 300; ++step) {
    ctx.time += ctx.deltaTime;
    kernel.updateRange(buffers, ctx, 0, PARTICLES);
  }
  for (size_t i = 0; i < PARTICLES; i += 17) {
    BOOST_CHECK_LT((buffers.getPosition(i) - Vector3D(0.5f, 0.5f, 0.0f)).length(), 0.05f);
  }
}

BOOST_AUTO_TEST_SUITE_END()
