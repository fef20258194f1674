/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FlowPatternLibraryTests
#include <boost/test/unit_test.hpp>

#include "simulation/FlowPatternLibrary.hpp"
#include <cmath>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace GlyphFlow;

namespace {

bool allFinite(const std::vector<float> &values) {
  for (float v : values) {
    if (!std::isfinite(v)) {
      return false;
    }
  }
  return true;
}

} // namespace

BOOST_AUTO_TEST_SUITE(PatternNamingTests)

BOOST_AUTO_TEST_CASE(TestProceduralIds) {
  BOOST_CHECK_EQUAL(FlowPatternLibrary::proceduralId("organic"), FlowPatternLibrary::ORGANIC_ID);
  BOOST_CHECK_EQUAL(FlowPatternLibrary::proceduralId("galaxySpin"), 7);
  BOOST_CHECK_EQUAL(FlowPatternLibrary::proceduralId("flowingSilk"), 13);
  BOOST_CHECK_EQUAL(FlowPatternLibrary::proceduralId("fractalTree"), NO_PATTERN);
  BOOST_CHECK_EQUAL(FlowPatternLibrary::proceduralId("doesNotExist"), NO_PATTERN);

  for (PatternId id = 1; id <= FlowPatternLibrary::PROCEDURAL_PATTERN_COUNT; ++id) {
    const std::string name(FlowPatternLibrary::proceduralName(id));
    BOOST_CHECK_EQUAL(FlowPatternLibrary::proceduralId(name), id);
  }
  BOOST_CHECK(FlowPatternLibrary::proceduralName(0).empty());
  BOOST_CHECK(FlowPatternLibrary::proceduralName(14).empty());
}

BOOST_AUTO_TEST_CASE(TestHostPatterns) {
  BOOST_CHECK(FlowPatternLibrary::isHostPattern("organic"));
  BOOST_CHECK(FlowPatternLibrary::isHostPattern("branchTree"));
  BOOST_CHECK(FlowPatternLibrary::isHostPattern("kochCurve"));
  BOOST_CHECK(!FlowPatternLibrary::isHostPattern("galaxySpin"));
}

BOOST_AUTO_TEST_CASE(TestAllPatternNamesUnique) {
  const auto names = FlowPatternLibrary::allPatternNames();
  const std::set<std::string> unique(names.begin(), names.end());
  BOOST_CHECK_EQUAL(unique.size(), names.size());

  // 13 procedural + 4 host-only; organic exists in both forms
  BOOST_CHECK_EQUAL(names.size(), 17u);
  BOOST_CHECK_EQUAL(names.front(), "organic");
  BOOST_CHECK_EQUAL(names.back(), "randomWalk");
}

BOOST_AUTO_TEST_CASE(TestFlowCycleStartsOrganic) {
  const auto &cycle = FlowPatternLibrary::flowCycle();
  BOOST_REQUIRE(!cycle.empty());
  BOOST_CHECK_EQUAL(cycle.front(), "organic");
  for (const auto &name : cycle) {
    const bool known = FlowPatternLibrary::isHostPattern(name) ||
                       FlowPatternLibrary::proceduralId(name) != NO_PATTERN;
    BOOST_CHECK_MESSAGE(known, "flow cycle entry " << name << " is not a pattern");
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ProceduralPatternTests)

BOOST_AUTO_TEST_CASE(TestEvaluateIsPure) {
  const size_t count = 5000;
  for (PatternId id = 1; id <= FlowPatternLibrary::PROCEDURAL_PATTERN_COUNT; ++id) {
    for (size_t i : {size_t{0}, size_t{17}, size_t{2500}, size_t{4999}}) {
      const Vector3D first = FlowPatternLibrary::evaluate(id, i, count, 3.25f);
      // Unrelated evaluations in between must not leak state
      FlowPatternLibrary::evaluate(id, i + 1, count, 9.0f);
      FlowPatternLibrary::evaluate((id % 13) + 1, i, count, 1.0f);
      const Vector3D second = FlowPatternLibrary::evaluate(id, i, count, 3.25f);
      BOOST_CHECK_MESSAGE(first == second, "pattern " << id << " index " << i << " not pure");
      BOOST_CHECK(std::isfinite(first.getX()) && std::isfinite(first.getY()) &&
                  std::isfinite(first.getZ()));
    }
  }
}

BOOST_AUTO_TEST_CASE(TestGalaxySpinMovesWithTime) {
  const PatternId galaxy = FlowPatternLibrary::proceduralId("galaxySpin");
  const Vector3D a = FlowPatternLibrary::evaluate(galaxy, 1234, 10000, 0.0f);
  const Vector3D b = FlowPatternLibrary::evaluate(galaxy, 1234, 10000, 5.0f);
  BOOST_CHECK(a != b);
  // The disc is thin
  BOOST_CHECK_LE(std::abs(a.getY()), 0.05f);
}

BOOST_AUTO_TEST_CASE(TestOrganicStaysInBall) {
  for (size_t i = 0; i < 2000; ++i) {
    const Vector3D p = FlowPatternLibrary::evaluate(FlowPatternLibrary::ORGANIC_ID, i, 2000, 0.0f);
    BOOST_CHECK_LE(p.length(), 3.5f + 1e-4f);
  }
}

BOOST_AUTO_TEST_CASE(TestBreathingSphereRadius) {
  const PatternId id = FlowPatternLibrary::proceduralId("breathingSphere");
  // sin(0) = 0 so the radius is exactly 1.5
  for (size_t i = 0; i < 100; ++i) {
    const Vector3D p = FlowPatternLibrary::evaluate(id, i, 100, 0.0f);
    BOOST_CHECK_CLOSE(p.length(), 1.5f, 0.01f);
  }
}

BOOST_AUTO_TEST_CASE(TestUnknownIdReturnsOrigin) {
  BOOST_CHECK(FlowPatternLibrary::evaluate(NO_PATTERN, 5, 10, 1.0f) == Vector3D());
  BOOST_CHECK(FlowPatternLibrary::evaluate(99, 5, 10, 1.0f) == Vector3D());
}

BOOST_AUTO_TEST_CASE(TestZeroCountDoesNotDivideByZero) {
  for (PatternId id = 1; id <= FlowPatternLibrary::PROCEDURAL_PATTERN_COUNT; ++id) {
    const Vector3D p = FlowPatternLibrary::evaluate(id, 0, 0, 1.0f);
    BOOST_CHECK(std::isfinite(p.getX()) && std::isfinite(p.getY()) && std::isfinite(p.getZ()));
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(HostPatternTests)

BOOST_AUTO_TEST_CASE(TestEveryHostPatternFillsBuffer) {
  const size_t count = 4000;
  std::mt19937 rng(42);

  for (const auto &name : FlowPatternLibrary::allPatternNames()) {
    std::vector<float> targets(count * 3, std::nanf(""));
    BOOST_CHECK_MESSAGE(FlowPatternLibrary::buildHostPattern(name, targets, count, rng),
                        "build failed for " << name);
    BOOST_CHECK_MESSAGE(allFinite(targets), "non-finite target in " << name);
  }
}

BOOST_AUTO_TEST_CASE(TestHostPatternDeterministicForSeed) {
  const size_t count = 1000;
  std::vector<float> first(count * 3);
  std::vector<float> second(count * 3);

  std::mt19937 rngA(7);
  std::mt19937 rngB(7);
  FlowPatternLibrary::buildHostPattern("fractalTree", first, count, rngA);
  FlowPatternLibrary::buildHostPattern("fractalTree", second, count, rngB);
  BOOST_CHECK(first == second);
}

BOOST_AUTO_TEST_CASE(TestUnknownNameFallsBackToOrganic) {
  const size_t count = 500;
  std::vector<float> targets(count * 3, 100.0f);
  std::mt19937 rng(1);

  BOOST_CHECK(!FlowPatternLibrary::buildHostPattern("notAPattern", targets, count, rng));
  for (size_t i = 0; i < count; ++i) {
    const Vector3D p(targets[i * 3], targets[i * 3 + 1], targets[i * 3 + 2]);
    BOOST_CHECK_LE(p.length(), 3.5f + 1e-4f);
  }
}

BOOST_AUTO_TEST_CASE(TestShortBufferRejected) {
  std::vector<float> targets(10);
  std::mt19937 rng(1);
  BOOST_CHECK(!FlowPatternLibrary::buildHostPattern("organic", targets, 100, rng));
}

BOOST_AUTO_TEST_CASE(TestProceduralNameWritesTimeZeroSnapshot) {
  const size_t count = 300;
  std::vector<float> targets(count * 3);
  std::mt19937 rng(3);

  BOOST_CHECK(FlowPatternLibrary::buildHostPattern("rollingWave", targets, count, rng));
  const PatternId id = FlowPatternLibrary::proceduralId("rollingWave");
  for (size_t i = 0; i < count; i += 37) {
    const Vector3D expected = FlowPatternLibrary::evaluate(id, i, count, 0.0f);
    BOOST_CHECK_EQUAL(targets[i * 3], expected.getX());
    BOOST_CHECK_EQUAL(targets[i * 3 + 1], expected.getY());
    BOOST_CHECK_EQUAL(targets[i * 3 + 2], expected.getZ());
  }
}

BOOST_AUTO_TEST_SUITE_END()
