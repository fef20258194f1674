/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/EngineConfig.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "events/SimulationEventSink.hpp"
#include "managers/ParticleEngine.hpp"
#include "utils/TTFGlyphRasterizer.hpp"
#include <chrono>
#include <cstdlib>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#ifndef GLYPHFLOW_APP_NAME
#define GLYPHFLOW_APP_NAME "GlyphFlow"
#endif

namespace {

// Headless fixed-step clock; matches the 60 Hz the physics constants assume
constexpr float FRAME_DT{1.0f / 60.0f};
constexpr float RUN_SECONDS{40.0f};
constexpr int STATS_EVERY_FRAMES{120};

struct ScriptedCue {
  float time;
  std::string label;
  std::function<void(GlyphFlow::ParticleEngine&)> action;
};

std::vector<ScriptedCue> buildDemoScript() {
  using namespace GlyphFlow;
  std::vector<ScriptedCue> script;

  script.push_back({1.0f, "flow galaxySpin", [](ParticleEngine& engine) {
    engine.setFlowTargets("galaxySpin");
  }});

  script.push_back({4.0f, "text with waveReveal", [](ParticleEngine& engine) {
    TextOptions options;
    options.animation = FormationAnimation::WaveReveal;
    options.holdDuration = 3.0f;
    engine.setText("GLYPH", options);
  }});

  // Arrives while the text holds, so it waits for the release
  script.push_back({5.0f, "deferred flow fractalTree", [](ParticleEngine& engine) {
    engine.setMode(SimulationMode::Flow, std::string("fractalTree"));
  }});

  script.push_back({12.0f, "text over a background pattern", [](ParticleEngine& engine) {
    TextOptions options;
    options.animation = FormationAnimation::DirectSnap;
    options.backgroundPattern = "auroraCurtain";
    options.textRatio = 0.5f;
    options.dissolveMode = DissolveMode::Down;
    engine.setText("FLOW", options);
  }});

  script.push_back({18.0f, "group B text", [](ParticleEngine& engine) {
    TextOptions options;
    options.particleGroup = ParticleGroup::B;
    options.origin = Vector3D(0.0f, -1.2f, 0.0f);
    engine.setText("echo", options);
  }});

  script.push_back({23.0f, "shadow sculpture", [](ParticleEngine& engine) {
    TextOptions options;
    options.holdDuration = 4.0f;
    engine.setShadowSculptureTarget("LIGHT", "SHADE", options);
  }});

  script.push_back({30.0f, "multi-layer flow", [](ParticleEngine& engine) {
    FlowLayerList layers;
    layers.push_back({"galaxySpin", Vector3D(-1.5f, 0.0f, 0.0f), 0.8f});
    layers.push_back({"breathingSphere", Vector3D(1.5f, 0.0f, 0.0f), 0.8f});
    layers.push_back({"ripplePool", Vector3D(0.0f, 1.2f, -1.0f), 0.6f});
    engine.setFlowTargetsMultiLayer(layers);
  }});

  script.push_back({36.0f, "flow cycle", [](ParticleEngine& engine) {
    engine.setMode(SimulationMode::Flow);
  }});

  return script;
}

} // namespace

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  DEMO_INFO(std::format("Initializing {}", GLYPHFLOW_APP_NAME));

  // Config first, the worker count comes from it
  GlyphFlow::EngineConfig config;
  const std::string configPath = argc > 1 ? argv[1] : "res/engine_config.json";
  if (!GlyphFlow::loadEngineConfig(configPath, config)) {
    DEMO_WARN(std::format("Failed to load {} - using defaults", configPath));
  }

  THREADSYSTEM_INFO("Initializing Thread System");
  GlyphFlow::ThreadSystem& threadSystem = GlyphFlow::ThreadSystem::Instance();
  try {
    if (!threadSystem.init(GlyphFlow::ThreadSystem::DEFAULT_QUEUE_CAPACITY,
                           config.workerCount)) {
      THREADSYSTEM_CRITICAL("Failed to initialize thread system");
      return -1;
    }
  } catch (const std::exception& e) {
    THREADSYSTEM_CRITICAL(std::format("Exception during thread system init: {}", e.what()));
    return -1;
  }

  THREADSYSTEM_INFO(std::format("Thread system initialized with {} worker threads and capacity for {} parallel tasks",
                                threadSystem.getThreadCount(), threadSystem.getQueueCapacity()));

  auto rasterizer = std::make_shared<GlyphFlow::TTFGlyphRasterizer>();
  if (!rasterizer->init(config.fontPath, config.fontSize)) {
    FONT_CRITICAL(std::format("Failed to open font: {}", config.fontPath));
    threadSystem.clean();
    return -1;
  }

  GlyphFlow::LoggingEventSink eventSink;
  GlyphFlow::ParticleEngine engine;
  if (!engine.init(config, rasterizer, &eventSink)) {
    ENGINE_CRITICAL("Failed to initialize particle engine");
    rasterizer->clean();
    threadSystem.clean();
    return -1;
  }

  DEMO_INFO(std::format("Running scripted sequence for {:.0f}s with {} particles",
                        RUN_SECONDS, config.particleCount));

  const std::vector<ScriptedCue> script = buildDemoScript();
  size_t nextCue = 0;
  float elapsed = 0.0f;
  int frame = 0;

#ifndef NDEBUG
  double totalUpdateMs = 0.0;
  double worstUpdateMs = 0.0;
#endif

  const auto runStart = std::chrono::steady_clock::now();
  while (elapsed < RUN_SECONDS) {
    while (nextCue < script.size() && script[nextCue].time <= elapsed) {
      DEMO_INFO(std::format("t={:.2f}s cue: {}", elapsed, script[nextCue].label));
      script[nextCue].action(engine);
      ++nextCue;
    }

    GlyphFlow::TickContext tick;
    tick.deltaTime = FRAME_DT;
    tick.elapsedTime = elapsed;
    tick.musicTime = elapsed;
    engine.update(tick);

    [[maybe_unused]] const GlyphFlow::EngineStats stats = engine.getStats();
#ifndef NDEBUG
    totalUpdateMs += stats.lastUpdateTimeMs;
    if (stats.lastUpdateTimeMs > worstUpdateMs) {
      worstUpdateMs = stats.lastUpdateTimeMs;
    }
#endif

    if (frame % STATS_EVERY_FRAMES == 0) {
      DEMO_INFO(std::format("t={:.2f}s A:{} {:.3f} B:{} {:.3f} split={} update={:.2f}ms ({}, {} batches)",
                            elapsed, GlyphFlow::toString(stats.phaseA), stats.convergenceA,
                            GlyphFlow::toString(stats.phaseB), stats.convergenceB,
                            stats.splitIndex, stats.lastUpdateTimeMs,
                            stats.lastUpdateThreaded ? "threaded" : "single", stats.lastBatchCount));
    }

    elapsed += FRAME_DT;
    ++frame;
  }

  [[maybe_unused]] const double wallMs = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - runStart).count();
  DEMO_INFO(std::format("Finished {} frames in {:.1f}ms", frame, wallMs));

#ifndef NDEBUG
  if (frame > 0) {
    DEMO_DEBUG(std::format("Update avg {:.2f}ms, worst {:.2f}ms",
                           totalUpdateMs / frame, worstUpdateMs));
  }
#endif

  DEMO_INFO("Shutting down...");
  engine.clean();
  rasterizer->clean();
  threadSystem.clean();
  DEMO_INFO("Shutdown complete");

  return 0;
}
