/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EngineConfigTests
#include <boost/test/unit_test.hpp>

#include "core/EngineConfig.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace GlyphFlow;

namespace {

// Writes a config file for one test and removes it afterwards
struct TempConfigFile {
  explicit TempConfigFile(const std::string &contents,
                          const std::string &name = "test_engine_config_temp.json")
      : path(name) {
    std::ofstream file(path);
    file << contents;
  }
  ~TempConfigFile() { std::remove(path.c_str()); }

  std::string path;
};

} // namespace

BOOST_AUTO_TEST_SUITE(EngineConfigDefaultsTests)

BOOST_AUTO_TEST_CASE(TestDefaults) {
  EngineConfig config;
  BOOST_CHECK_EQUAL(config.particleCount, 1000000u);
  BOOST_CHECK_CLOSE(config.textHoldDuration, 2.5f, 0.001f);
  BOOST_CHECK_CLOSE(config.convUpScale, 1.0f, 0.001f);
  BOOST_CHECK_CLOSE(config.convDnScale, 1.0f, 0.001f);
  BOOST_CHECK_CLOSE(config.pointSize, 1.0f, 0.001f);
  BOOST_CHECK_CLOSE(config.fontSize, 200.0f, 0.001f);
  BOOST_CHECK(config.threadingEnabled);
  BOOST_CHECK(config.macroRows.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EngineConfigLoadTests)

BOOST_AUTO_TEST_CASE(TestLoadOverlaysValues) {
  TempConfigFile file(R"({
      "simulation": {"particleCount": 5000, "seed": 7, "textHoldDuration": 4.0},
      "text": {"fontPath": "fonts/Test.ttf"},
      "threading": {"enabled": false, "threshold": 100, "workerCount": 2}
  })");

  EngineConfig config;
  BOOST_REQUIRE(loadEngineConfig(file.path, config));
  BOOST_CHECK_EQUAL(config.particleCount, 5000u);
  BOOST_CHECK_EQUAL(config.seed, 7u);
  BOOST_CHECK_CLOSE(config.textHoldDuration, 4.0f, 0.001f);
  BOOST_CHECK_EQUAL(config.fontPath, "fonts/Test.ttf");
  BOOST_CHECK(!config.threadingEnabled);
  BOOST_CHECK_EQUAL(config.threadingThreshold, 100u);
  BOOST_CHECK_EQUAL(config.workerCount, 2u);

  // Untouched keys keep their defaults
  BOOST_CHECK_CLOSE(config.fontSize, 200.0f, 0.001f);
  BOOST_CHECK_CLOSE(config.convUpScale, 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchKeepsDefault) {
  TempConfigFile file(R"({
      "simulation": {"textHoldDuration": "long", "pointSize": 2.0},
      "threading": {"enabled": 1}
  })");

  EngineConfig config;
  BOOST_REQUIRE(loadEngineConfig(file.path, config));
  BOOST_CHECK_CLOSE(config.textHoldDuration, 2.5f, 0.001f);
  BOOST_CHECK_CLOSE(config.pointSize, 2.0f, 0.001f);
  BOOST_CHECK(config.threadingEnabled);
}

BOOST_AUTO_TEST_CASE(TestMacroCurveRows) {
  TempConfigFile file(R"({
      "macroCurve": [
          {"end": 10, "noiseStrength": 0.001, "spring": 0.002, "damping": 0.95},
          {"end": 1e9, "noiseStrength": 0.003, "convUp": 0.02, "pointScale": 1.2}
      ]
  })");

  EngineConfig config;
  BOOST_REQUIRE(loadEngineConfig(file.path, config));
  BOOST_REQUIRE_EQUAL(config.macroRows.size(), 2u);
  BOOST_CHECK_CLOSE(config.macroRows[0].endTime, 10.0f, 0.001f);
  BOOST_CHECK_CLOSE(config.macroRows[0].params.springStrength, 0.002f, 0.001f);
  BOOST_CHECK_CLOSE(config.macroRows[0].params.damping, 0.95f, 0.001f);
  BOOST_CHECK_CLOSE(config.macroRows[1].params.convergenceUpRate, 0.02f, 0.001f);
  BOOST_CHECK_CLOSE(config.macroRows[1].params.pointScale, 1.2f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNonIncreasingMacroCurveFails) {
  TempConfigFile file(R"({
      "simulation": {"particleCount": 10},
      "macroCurve": [{"end": 10}, {"end": 10}]
  })");

  EngineConfig config;
  BOOST_CHECK(!loadEngineConfig(file.path, config));
  // Failed loads leave the config untouched
  BOOST_CHECK_EQUAL(config.particleCount, 1000000u);
  BOOST_CHECK(config.macroRows.empty());
}

BOOST_AUTO_TEST_CASE(TestNonPositiveParticleCountFails) {
  TempConfigFile file(R"({"simulation": {"particleCount": 0}})");

  EngineConfig config;
  BOOST_CHECK(!loadEngineConfig(file.path, config));
  BOOST_CHECK_EQUAL(config.particleCount, 1000000u);
}

BOOST_AUTO_TEST_CASE(TestOversizedParticleCountFails) {
  TempConfigFile file(R"({"simulation": {"particleCount": 1e30}})");

  EngineConfig config;
  BOOST_CHECK(!loadEngineConfig(file.path, config));
  BOOST_CHECK_EQUAL(config.particleCount, 1000000u);

  TempConfigFile atLimit(R"({"simulation": {"particleCount": 67108864}})",
                         "test_engine_config_limit.json");
  BOOST_CHECK(loadEngineConfig(atLimit.path, config));
  BOOST_CHECK_EQUAL(config.particleCount, MAX_PARTICLE_COUNT);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeIntegersKeepDefaults) {
  TempConfigFile file(R"({
      "simulation": {"seed": 1e12},
      "threading": {"threshold": -5, "workerCount": 1e9}
  })");

  EngineConfig config;
  BOOST_CHECK(loadEngineConfig(file.path, config));
  BOOST_CHECK_EQUAL(config.seed, 42u);
  BOOST_CHECK_EQUAL(config.threadingThreshold, 4096u);
  BOOST_CHECK_EQUAL(config.workerCount, 0u);
}

BOOST_AUTO_TEST_CASE(TestMissingOrMalformedFileFails) {
  EngineConfig config;
  BOOST_CHECK(!loadEngineConfig("does_not_exist.json", config));

  TempConfigFile file("{\"simulation\": ");
  BOOST_CHECK(!loadEngineConfig(file.path, config));

  TempConfigFile arrayRoot("[1, 2]", "test_engine_config_array.json");
  BOOST_CHECK(!loadEngineConfig(arrayRoot.path, config));
}

BOOST_AUTO_TEST_SUITE_END()
