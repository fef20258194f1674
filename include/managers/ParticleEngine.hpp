/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_ENGINE_HPP
#define PARTICLE_ENGINE_HPP

/**
 * @file ParticleEngine.hpp
 * @brief Text/flow particle simulation facade
 *
 * Owns the particle buffers and drives one tick per frame:
 * - Macro tension curve eases the ambient physics parameters
 * - Phase controller advances both particle groups (formation reveals,
 *   text hold, release back to flow)
 * - Force kernel integrates every particle, split into WorkerBudget batches
 *   on the ThreadSystem when the population is large enough
 *
 * Commands (setText, setFlowTargets...) must be issued between ticks, on the
 * thread that calls update(). update() returns only after every kernel batch
 * has finished, so the buffers are complete when it returns.
 */

#include "core/EngineConfig.hpp"
#include "simulation/ForceKernel.hpp"
#include "simulation/GlyphRasterizer.hpp"
#include "simulation/MacroTensionCurve.hpp"
#include "simulation/ParticleBuffers.hpp"
#include "simulation/PhaseController.hpp"
#include "simulation/SimulationContext.hpp"
#include "simulation/SimulationTypes.hpp"
#include "simulation/TextTargetSampler.hpp"
#include "utils/Quaternion.hpp"
#include "utils/Vector3D.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace GlyphFlow {

class SimulationEventSink;

class ParticleEngine {
public:
  static constexpr float MAX_DELTA_TIME = 0.022f;
  static constexpr float ROTATION_SLERP_RATE = 0.04f;
  static constexpr float DEFAULT_TEXT_RATIO = 0.6f;
  static constexpr float DEFAULT_GROUP_B_CONVERGENCE = 0.4f;
  static constexpr float ANAMORPHIC_DEPTH_SPREAD = 0.15f;

  // Indexed by the text counter
  static constexpr std::array<std::array<float, 3>, 8> SWEEP_DIRECTIONS = {{
      {1.0f, 0.0f, 0.0f},
      {-1.0f, 0.0f, 0.0f},
      {0.0f, -1.0f, 0.0f},
      {0.0f, 1.0f, 0.0f},
      {0.7f, 0.7f, 0.0f},
      {-0.7f, -0.7f, 0.0f},
      {0.0f, 0.0f, 0.0f},
      {0.7f, -0.7f, 0.0f},
  }};

  ParticleEngine() = default;
  ~ParticleEngine();

  ParticleEngine(const ParticleEngine &) = delete;
  ParticleEngine &operator=(const ParticleEngine &) = delete;

  /**
   * @brief Allocate buffers and start in organic flow
   * @param rasterizer Glyph source for text commands; must not be null
   * @param eventSink Optional observer, must outlive the engine
   * @return false if the particle count is zero, the rasterizer is missing
   *         or the buffers cannot be allocated
   */
  bool init(const EngineConfig &config, std::shared_ptr<IGlyphRasterizer> rasterizer,
            SimulationEventSink *eventSink = nullptr);

  bool isInitialized() const { return m_initialized; }

  // Release buffers; init() may be called again afterwards
  void clean();

  /**
   * @brief Form `text` on group A, or on group B with particleGroup B
   *
   * Empty text is ignored. Group A runs the formation animation (directSnap
   * skips straight to text); group B always snaps.
   */
  void setText(const std::string &text, const TextOptions &options = TextOptions{});

  /**
   * @brief One point cloud reading textA from the front and textB from above
   *
   * Goes straight to text with no formation. Either string empty is a no-op.
   */
  void setShadowSculptureTarget(const std::string &textA, const std::string &textB,
                                const TextOptions &options = TextOptions{});

  /**
   * @brief Switch the flow target
   *
   * Merges group B back into group A, drops multi-layer and background
   * splits and replaces physics overrides with `options`. Unknown names fall
   * back to organic.
   */
  void setFlowTargets(const std::string &pattern = "organic",
                      const FlowOptions &options = FlowOptions{});

  /**
   * @brief Spread particles over up to four procedural patterns
   *
   * Particle i follows layer i % layerCount. Extra layers are ignored and
   * names without a procedural form use organic.
   */
  void setFlowTargetsMultiLayer(const FlowLayerList &layers);

  /**
   * @brief Mode switch
   *
   * Flow while group A is forming or holding text is deferred until the
   * release completes. Without a pattern, flow cycles the flow list.
   */
  void setMode(SimulationMode mode, const std::optional<std::string> &pattern = std::nullopt,
               const FlowOptions &options = FlowOptions{});

  void setFlowOrigin(const Vector3D &origin);
  void setFlowScale(float scale);
  void setPointSize(float size);

  // Move every particle onto its target and jump group A to its target convergence
  void snapToTargets();

  void update(const TickContext &tick);

  void setThreadingEnabled(bool enabled) { m_threadingEnabled = enabled; }
  bool isThreadingEnabled() const { return m_threadingEnabled; }
  void setThreadingThreshold(size_t threshold) { m_threadingThreshold = threshold; }

  EngineStats getStats() const;
  const ParticleBuffers &getBuffers() const { return m_buffers; }
  const PhaseState &getPhaseState(ParticleGroup group) const { return m_phase.getState(group); }
  const PhaseController &getPhaseController() const { return m_phase; }
  const SimulationContext &getContext() const { return m_context; }
  const MacroParams &getMacroState() const { return m_macro.getState(); }
  const Quaternion &getWorldRotation() const { return m_worldRotation; }
  const Quaternion &getTargetWorldRotation() const { return m_targetRotation; }

  // basePointSize * macro pointScale
  float getPointSize() const;

  const std::string &getCurrentText() const { return m_currentText; }
  const std::string &getCurrentFlowPattern() const { return m_currentFlowPattern; }
  uint32_t getTextIndex() const { return m_textIndex; }

  std::vector<std::string> getAllPatternNames() const;

private:
  bool checkInitialized(const char *command) const;
  void resetToSingleLayer();
  void clearBackgroundSplit();
  Vector3D sweepDirectionForText() const;
  static std::optional<PhysicsOverrides> extractOverrides(const PhysicsOverrides &physics);
  // Caller ceilings are limited to [0, 1]; unset means 1
  static float convergenceCeiling(std::optional<float> requested);

  void applyGroupBPattern(const TextOptions &options);
  void completeRelease();

  void runKernel();
  void runKernelSingleThreaded();
  void runKernelThreaded();

  EngineConfig m_config{};
  std::shared_ptr<IGlyphRasterizer> m_rasterizer;
  SimulationEventSink *m_eventSink{nullptr};

  ParticleBuffers m_buffers;
  MacroTensionCurve m_macro;
  PhaseController m_phase;
  ForceKernel m_kernel;
  std::unique_ptr<TextTargetSampler> m_sampler;
  SimulationContext m_context{};
  std::mt19937 m_rng;

  std::optional<PhysicsOverrides> m_physicsOverrides;
  std::string m_currentText;
  std::string m_currentFlowPattern{"organic"};
  uint32_t m_textIndex{0};
  size_t m_flowCycleIndex{0};
  float m_basePointSize{1.0f};

  Quaternion m_worldRotation{};
  Quaternion m_targetRotation{};

  bool m_threadingEnabled{true};
  size_t m_threadingThreshold{4096};
  std::vector<std::future<void>> m_batchFutures;
  double m_lastUpdateTimeMs{0.0};
  bool m_lastUpdateThreaded{false};
  size_t m_lastBatchCount{0};
  uint64_t m_frameCounter{0};

  bool m_initialized{false};
};

} // namespace GlyphFlow

#endif // PARTICLE_ENGINE_HPP
