/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FormationAnimatorTests
#include <boost/test/unit_test.hpp>

#include "simulation/FormationAnimator.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace GlyphFlow;

namespace {

constexpr float SENTINEL = 999.0f;

CharacterRecord makeRecord(const std::string &text, float centerX, size_t start,
                           size_t count, float z = 0.0f) {
  CharacterRecord record;
  record.text = text;
  record.center = Vector3D(centerX, 0.0f, 0.0f);
  record.startIndex = start;
  record.count = count;
  for (int i = 0; i < 4; ++i) {
    record.targetPositions.push_back(centerX + 0.1f * static_cast<float>(i));
    record.targetPositions.push_back(0.2f * static_cast<float>(i));
    record.targetPositions.push_back(z);
  }
  return record;
}

} // namespace

struct FormationFixture {
  FormationFixture() : rng(7), targets(PARTICLES * 3, SENTINEL) {
    records.push_back(makeRecord("A", -1.0f, 0, 10));
    records.push_back(makeRecord("B", 1.0f, 10, 10));
  }

  static constexpr size_t PARTICLES = 24;

  std::mt19937 rng;
  std::vector<float> targets;
  CharacterRecordList records;
};

BOOST_AUTO_TEST_SUITE(AnimationTableTests)

BOOST_AUTO_TEST_CASE(TestNamesRoundTrip) {
  std::set<std::string> names;
  for (size_t i = 0; i < FORMATION_ANIMATION_COUNT; ++i) {
    const auto animation = static_cast<FormationAnimation>(i);
    const std::string animName = FormationAnimator::name(animation);
    names.insert(animName);
    BOOST_CHECK(FormationAnimator::fromName(animName) == animation);
  }
  BOOST_CHECK_EQUAL(names.size(), 16u);
}

BOOST_AUTO_TEST_CASE(TestUnknownNameIsDirectSnap) {
  BOOST_CHECK(FormationAnimator::fromName("noSuchAnimation") == FormationAnimation::DirectSnap);
  BOOST_CHECK(FormationAnimator::fromName("") == FormationAnimation::DirectSnap);
}

BOOST_AUTO_TEST_CASE(TestSchedules) {
  const auto &typewriter = FormationAnimator::schedule(FormationAnimation::Typewriter);
  BOOST_CHECK_CLOSE(typewriter.stagger, 0.18f, 0.001f);
  const auto &tornado = FormationAnimator::schedule(FormationAnimation::Tornado);
  BOOST_CHECK_CLOSE(tornado.delay, 0.3f, 0.001f);
  const auto &snap = FormationAnimator::schedule(FormationAnimation::DirectSnap);
  BOOST_CHECK_EQUAL(snap.delay, 0.0f);
  BOOST_CHECK_EQUAL(snap.stagger, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestOnlyDirectSnapIsInstant) {
  for (size_t i = 0; i < FORMATION_ANIMATION_COUNT; ++i) {
    const auto animation = static_cast<FormationAnimation>(i);
    BOOST_CHECK_EQUAL(FormationAnimator::isInstant(animation),
                      animation == FormationAnimation::DirectSnap);
  }
}

BOOST_AUTO_TEST_CASE(TestDefaultCyclesByTextIndex) {
  BOOST_CHECK(FormationAnimator::defaultForTextIndex(0) == FormationAnimation::WaveReveal);
  BOOST_CHECK(FormationAnimator::defaultForTextIndex(7) == FormationAnimation::DirectSnap);
  BOOST_CHECK(FormationAnimator::defaultForTextIndex(16) == FormationAnimation::WaveReveal);
  BOOST_CHECK(FormationAnimator::defaultForTextIndex(31) == FormationAnimation::FlatPlane);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PreShapeTests)

BOOST_FIXTURE_TEST_CASE(TestPreShapesStayInsideSlices, FormationFixture) {
  for (size_t i = 0; i < FORMATION_ANIMATION_COUNT; ++i) {
    const auto animation = static_cast<FormationAnimation>(i);
    std::fill(targets.begin(), targets.end(), SENTINEL);
    FormationAnimator::writePreShape(animation, records, targets, rng);

    // Particles past the last slice are never touched
    for (size_t p = 20; p < PARTICLES; ++p) {
      BOOST_CHECK_EQUAL(targets[p * 3], SENTINEL);
    }
    if (animation == FormationAnimation::DirectSnap) {
      continue;
    }
    for (size_t p = 0; p < 20; ++p) {
      BOOST_CHECK_MESSAGE(targets[p * 3] != SENTINEL,
                          FormationAnimator::name(animation) << " skipped particle " << p);
      // Flat text: pre-shapes are forced onto z = 0
      BOOST_CHECK_EQUAL(targets[p * 3 + 2], 0.0f);
    }
  }
}

BOOST_FIXTURE_TEST_CASE(TestCenterBurstCollapsesToOrigin, FormationFixture) {
  FormationAnimator::writePreShape(FormationAnimation::CenterBurst, records, targets, rng);
  for (size_t p = 0; p < 20; ++p) {
    BOOST_CHECK_LE(std::abs(targets[p * 3]), 0.025f);
    BOOST_CHECK_LE(std::abs(targets[p * 3 + 1]), 0.025f);
  }
}

BOOST_FIXTURE_TEST_CASE(TestRainDropStartsAbove, FormationFixture) {
  FormationAnimator::writePreShape(FormationAnimation::RainDrop, records, targets, rng);
  for (size_t p = 0; p < 20; ++p) {
    BOOST_CHECK_GE(targets[p * 3 + 1], 3.0f);
  }
}

BOOST_FIXTURE_TEST_CASE(TestDepthKeptForAnamorphicText, FormationFixture) {
  records[0] = makeRecord("A", -1.0f, 0, 10, 0.05f);
  FormationAnimator::writePreShape(FormationAnimation::SphereContract, records, targets, rng);

  bool anyDepth = false;
  for (size_t p = 0; p < 20; ++p) {
    anyDepth = anyDepth || targets[p * 3 + 2] != 0.0f;
  }
  BOOST_CHECK(anyDepth);
}

BOOST_FIXTURE_TEST_CASE(TestSliceClippedToBuffer, FormationFixture) {
  records.push_back(makeRecord("C", 3.0f, 20, 50));
  FormationAnimator::writePreShape(FormationAnimation::RiseUp, records, targets, rng);
  FormationAnimator::applyAllCharTargets(records, targets, rng);
  BOOST_CHECK_EQUAL(targets.size(), PARTICLES * 3);
  BOOST_CHECK_NE(targets[(PARTICLES - 1) * 3], SENTINEL);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RevealTests)

BOOST_FIXTURE_TEST_CASE(TestRevealWritesTextPoints, FormationFixture) {
  BOOST_CHECK(FormationAnimator::revealChar(records[0], targets, rng));
  BOOST_CHECK(records[0].revealed);

  // The first four slots copy the samples exactly
  for (size_t j = 0; j < 4; ++j) {
    BOOST_CHECK_EQUAL(targets[j * 3], records[0].targetPositions[j * 3]);
    BOOST_CHECK_EQUAL(targets[j * 3 + 1], records[0].targetPositions[j * 3 + 1]);
  }
  // Repeated slots wrap with small jitter
  for (size_t j = 4; j < 10; ++j) {
    const size_t s = j % 4;
    BOOST_CHECK_LE(std::abs(targets[j * 3] - records[0].targetPositions[s * 3]),
                   FormationAnimator::OVERFLOW_JITTER / 2.0f + 1e-6f);
  }
  // Other slices untouched
  BOOST_CHECK_EQUAL(targets[10 * 3], SENTINEL);
}

BOOST_FIXTURE_TEST_CASE(TestRevealIsIdempotent, FormationFixture) {
  BOOST_CHECK(FormationAnimator::revealChar(records[0], targets, rng));
  std::fill(targets.begin(), targets.end(), SENTINEL);
  BOOST_CHECK(!FormationAnimator::revealChar(records[0], targets, rng));
  BOOST_CHECK_EQUAL(targets[0], SENTINEL);
}

BOOST_FIXTURE_TEST_CASE(TestEmptyRecordRevealsWithoutWriting, FormationFixture) {
  records[1].targetPositions.clear();
  BOOST_CHECK(FormationAnimator::revealChar(records[1], targets, rng));
  BOOST_CHECK_EQUAL(targets[10 * 3], SENTINEL);
}

BOOST_FIXTURE_TEST_CASE(TestStaggeredReveal, FormationFixture) {
  // typewriter: delay 0, stagger 0.18
  const auto animation = FormationAnimation::Typewriter;

  BOOST_CHECK(!FormationAnimator::updateReveal(animation, records, 0.0f, targets, rng));
  BOOST_CHECK(records[0].revealed);
  BOOST_CHECK(!records[1].revealed);

  BOOST_CHECK(!FormationAnimator::updateReveal(animation, records, 0.17f, targets, rng));
  BOOST_CHECK(!records[1].revealed);

  BOOST_CHECK(FormationAnimator::updateReveal(animation, records, 0.18f, targets, rng));
  BOOST_CHECK(records[1].revealed);
}

BOOST_FIXTURE_TEST_CASE(TestDelayBeforeFirstReveal, FormationFixture) {
  // tornado: delay 0.3
  BOOST_CHECK(!FormationAnimator::updateReveal(FormationAnimation::Tornado, records, 0.25f,
                                               targets, rng));
  BOOST_CHECK(!records[0].revealed);
}

BOOST_FIXTURE_TEST_CASE(TestApplyAllLeavesFlags, FormationFixture) {
  FormationAnimator::applyAllCharTargets(records, targets, rng);
  BOOST_CHECK(!records[0].revealed);
  BOOST_CHECK_EQUAL(targets[10 * 3], records[1].targetPositions[0]);
}

BOOST_AUTO_TEST_SUITE_END()
