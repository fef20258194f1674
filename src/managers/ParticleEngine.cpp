/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ParticleEngine.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "core/WorkerBudget.hpp"
#include "events/SimulationEventSink.hpp"
#include "simulation/FlowPatternLibrary.hpp"
#include "simulation/FormationAnimator.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <new>

namespace GlyphFlow {

ParticleEngine::~ParticleEngine() {
  if (m_initialized) {
    clean();
  }
}

bool ParticleEngine::init(const EngineConfig &config,
                          std::shared_ptr<IGlyphRasterizer> rasterizer,
                          SimulationEventSink *eventSink) {
  if (m_initialized) {
    ENGINE_WARN("ParticleEngine already initialized");
    return true;
  }

  if (config.particleCount == 0) {
    ENGINE_ERROR("Particle count must be positive");
    return false;
  }
  if (!rasterizer) {
    ENGINE_ERROR("ParticleEngine needs a glyph rasterizer");
    return false;
  }

  m_config = config;
  m_rasterizer = std::move(rasterizer);
  m_eventSink = eventSink;
  m_rng.seed(config.seed);

  try {
    m_buffers.allocate(config.particleCount, m_rng);
  } catch (const std::bad_alloc &e) {
    ENGINE_CRITICAL(std::format("Could not allocate {} particles: {}", config.particleCount,
                                e.what()));
    m_buffers.clear();
    return false;
  }

  m_macro = config.macroRows.empty() ? MacroTensionCurve()
                                     : MacroTensionCurve(config.macroRows);
  m_phase.reset(config.particleCount);
  m_phase.setEventSink(m_eventSink);
  m_phase.setHoldDuration(config.textHoldDuration);
  m_phase.setConvergenceScales(config.convUpScale, config.convDnScale);

  m_kernel = ForceKernel(config.seed);
  m_sampler = std::make_unique<TextTargetSampler>(*m_rasterizer, m_rng);

  m_context = SimulationContext{};
  m_context.particleCount = config.particleCount;
  m_context.splitIndex = config.particleCount;

  m_physicsOverrides.reset();
  m_currentText.clear();
  m_textIndex = 0;
  m_flowCycleIndex = 0;
  m_basePointSize = config.pointSize;
  m_worldRotation = Quaternion::identity();
  m_targetRotation = Quaternion::identity();
  m_threadingEnabled = config.threadingEnabled;
  m_threadingThreshold = config.threadingThreshold;
  m_frameCounter = 0;

  m_initialized = true;

  setMode(SimulationMode::Flow);

  ENGINE_INFO(std::format("ParticleEngine initialized with {} particles (seed {})",
                          config.particleCount, config.seed));
  return true;
}

void ParticleEngine::clean() {
  for (auto &future : m_batchFutures) {
    if (future.valid()) {
      future.wait();
    }
  }
  m_batchFutures.clear();
  m_sampler.reset();
  m_rasterizer.reset();
  m_buffers.clear();
  m_phase.setEventSink(nullptr);
  m_eventSink = nullptr;
  m_initialized = false;
  ENGINE_INFO("ParticleEngine cleaned up");
}

bool ParticleEngine::checkInitialized(const char *command) const {
  if (!m_initialized) {
    ENGINE_WARN(std::format("{} ignored: engine not initialized", command));
    return false;
  }
  return true;
}

void ParticleEngine::resetToSingleLayer() {
  m_context.layerCount = 1;
  m_context.flowOrigin = Vector3D();
  m_context.flowScale = 1.0f;
}

void ParticleEngine::clearBackgroundSplit() {
  m_context.backgroundPatternId = NO_PATTERN;
  m_context.textRatio = 1.0f;
  m_context.textPerChar = 1.0f;
}

Vector3D ParticleEngine::sweepDirectionForText() const {
  const auto &dir = SWEEP_DIRECTIONS[m_textIndex % SWEEP_DIRECTIONS.size()];
  return Vector3D(dir[0], dir[1], dir[2]);
}

float ParticleEngine::convergenceCeiling(std::optional<float> requested) {
  return std::clamp(requested.value_or(1.0f), 0.0f, 1.0f);
}

std::optional<PhysicsOverrides> ParticleEngine::extractOverrides(const PhysicsOverrides &physics) {
  if (!physics.any()) {
    return std::nullopt;
  }
  return physics;
}

void ParticleEngine::setText(const std::string &text, const TextOptions &options) {
  if (!checkInitialized("setText") || text.empty()) {
    return;
  }

  const size_t count = m_buffers.count();
  const bool toGroupB = options.particleGroup == ParticleGroup::B;

  // Group B: either a second text or an independent pattern under group A
  if (toGroupB) {
    m_phase.split();
    m_phase.setGroupBPatternActive(false);
  } else if (options.groupBPattern) {
    m_phase.split();
    m_phase.setGroupBPatternActive(true);
  } else if (m_phase.isGroupBPatternActive()) {
    m_phase.merge();
    m_context.patternIdB = NO_PATTERN;
  }

  const size_t split = m_phase.getSplitIndex();
  const size_t groupStart = toGroupB ? split : 0;
  const size_t groupCount = toGroupB ? count - split : split;

  m_context.patternId = NO_PATTERN;
  resetToSingleLayer();
  m_currentText = text;
  ++m_textIndex;

  // Latest text wins globally, group B included
  m_physicsOverrides = extractOverrides(options.physics);

  const FormationAnimation animation =
      options.animation.value_or(FormationAnimator::defaultForTextIndex(m_textIndex));

  const Vector3D forward(0.0f, 0.0f, 1.0f);
  const bool anamorphic = options.viewDirection.has_value() &&
                          *options.viewDirection != forward &&
                          options.viewDirection->lengthSquared() > 0.0f;

  const auto chars = TextTargetSampler::splitCharacters(text);
  const size_t charCount = chars.size();

  if (!toGroupB) {
    if (options.backgroundPattern) {
      const PatternId bgId = FlowPatternLibrary::proceduralId(*options.backgroundPattern);
      if (bgId != NO_PATTERN) {
        m_context.backgroundPatternId = bgId;
        m_context.textRatio = options.textRatio.value_or(DEFAULT_TEXT_RATIO);
        m_context.textPerChar = static_cast<float>(count / charCount);
      } else {
        TEXT_WARN("Unknown background pattern: " + *options.backgroundPattern);
        clearBackgroundSplit();
      }
    } else {
      clearBackgroundSplit();
    }
  }

  TextSamplingParams params;
  params.fontSize = m_config.fontSize;
  params.maxPointsPerChar =
      std::min(TextTargetSampler::MAX_POINTS_PER_CHAR, groupCount / charCount);
  params.targetWidth = options.targetWidth.value_or(charCount <= 3 ? 2.5f : 4.0f);
  params.depthSpread = anamorphic ? ANAMORPHIC_DEPTH_SPREAD : 0.0f;
  params.align = options.align;

  CharacterRecordList records = m_sampler->sampleCharacters(text, params);
  TextTargetSampler::assignSlices(records, groupStart, groupCount);
  TextTargetSampler::applyOrigin(records, options.origin);

  // Anamorphic text rotates the whole particle frame, not the points
  m_targetRotation = anamorphic
                         ? Quaternion::fromUnitVectors(forward, options.viewDirection->normalized())
                         : Quaternion::identity();
  m_context.flattenZ = anamorphic ? 0.0f : 1.0f;

  const Vector3D sweep = sweepDirectionForText();

  if (toGroupB) {
    PhaseState &b = m_phase.getState(ParticleGroup::B);
    b.characters = std::move(records);
    b.formationStartTime.reset();
    b.formationPending = false;
    b.animation = animation;
    b.sweepDirection = sweep;
    b.holdDurationOverride = options.holdDuration;
    b.releaseSpeed = options.releaseSpeed.value_or(1.0f);
    b.dissolveMode = options.dissolveMode;
    b.maxConvergence = convergenceCeiling(options.maxConvergence);
    b.lastTextTime.reset();
    b.targetConvergence = 1.0f;

    // Formation animations are group A only
    FormationAnimator::applyAllCharTargets(b.characters, m_buffers.targets, m_rng);
    m_phase.transition(ParticleGroup::B, Phase::Text, std::format("\"{}\"", text));
    return;
  }

  PhaseState &a = m_phase.getState(ParticleGroup::A);
  a.lastTextTime.reset();
  a.maxConvergence = convergenceCeiling(options.maxConvergence);
  a.holdDurationOverride = options.holdDuration;
  a.releaseSpeed = options.releaseSpeed.value_or(1.0f);
  a.dissolveMode = options.dissolveMode;
  a.characters = std::move(records);
  a.formationStartTime.reset();
  a.formationPending = true;
  a.animation = animation;
  a.sweepDirection = sweep;
  a.targetConvergence = 1.0f;

  if (FormationAnimator::isInstant(animation)) {
    FormationAnimator::applyAllCharTargets(a.characters, m_buffers.targets, m_rng);
    a.formationPending = false;
    m_phase.transition(ParticleGroup::A, Phase::Text, std::format("(directSnap) \"{}\"", text));
  } else {
    FormationAnimator::writePreShape(animation, a.characters, m_buffers.targets, m_rng);
    m_phase.transition(ParticleGroup::A, Phase::Forming,
                       std::format("[{}] \"{}\" {}ch", FormationAnimator::name(animation), text,
                                   charCount));
  }

  if (options.groupBPattern) {
    applyGroupBPattern(options);
  }
}

void ParticleEngine::applyGroupBPattern(const TextOptions &options) {
  const PatternId id = FlowPatternLibrary::proceduralId(*options.groupBPattern);
  if (id == NO_PATTERN) {
    FLOW_WARN("Group B pattern has no procedural form: " + *options.groupBPattern);
    return;
  }

  m_context.patternIdB = id;
  m_context.flowOriginB = options.groupBOrigin;
  m_context.flowScaleB = options.groupBScale.value_or(1.0f);

  // Group B follows the pattern for the same hold window as the text
  PhaseState &b = m_phase.getState(ParticleGroup::B);
  const float convergence =
      convergenceCeiling(options.groupBConvergence.value_or(DEFAULT_GROUP_B_CONVERGENCE));
  b.lastTextTime.reset();
  b.targetConvergence = convergence;
  b.maxConvergence = convergence;
  b.holdDurationOverride = options.holdDuration;
  b.releaseSpeed = 1.0f;
  b.characters.clear();
  b.dissolveMode = DissolveMode::None;
  m_phase.transition(ParticleGroup::B, Phase::Text,
                     std::format("animation \"{}\"", *options.groupBPattern));
}

void ParticleEngine::setShadowSculptureTarget(const std::string &textA, const std::string &textB,
                                              const TextOptions &options) {
  if (!checkInitialized("setShadowSculptureTarget") || textA.empty() || textB.empty()) {
    return;
  }

  const size_t count = m_buffers.count();
  const std::vector<float> points = m_sampler->sampleSculpture(
      textA, textB, m_config.fontSize, options.targetWidth.value_or(4.0f), count);
  const size_t pointCount = points.size() / 3;
  if (pointCount == 0) {
    TEXT_WARN(std::format("Sculpture \"{}|{}\" produced no points", textA, textB));
    return;
  }

  m_context.flattenZ = 0.0f;
  m_context.patternId = NO_PATTERN;
  resetToSingleLayer();
  m_currentText = textA + "|" + textB;
  ++m_textIndex;
  m_physicsOverrides = extractOverrides(options.physics);

  std::uniform_real_distribution<float> unit(0.0f, 1.0f);
  auto &targets = m_buffers.targets;
  for (size_t i = 0; i < count; ++i) {
    const size_t src = i % pointCount;
    const float jitter = i < pointCount ? 0.0f : FormationAnimator::OVERFLOW_JITTER;
    targets[i * 3] = points[src * 3] + (unit(m_rng) - 0.5f) * jitter;
    targets[i * 3 + 1] = points[src * 3 + 1] + (unit(m_rng) - 0.5f) * jitter;
    targets[i * 3 + 2] = points[src * 3 + 2] + (unit(m_rng) - 0.5f) * jitter;
  }

  PhaseState &a = m_phase.getState(ParticleGroup::A);
  a.lastTextTime.reset();
  a.maxConvergence = convergenceCeiling(options.maxConvergence);
  a.holdDurationOverride = options.holdDuration;
  a.releaseSpeed = options.releaseSpeed.value_or(1.0f);
  a.dissolveMode = options.dissolveMode;
  a.characters.clear();
  a.formationPending = false;
  a.formationStartTime.reset();
  a.animation = FormationAnimation::DirectSnap;
  a.sweepDirection = Vector3D();
  a.targetConvergence = 1.0f;

  m_phase.transition(ParticleGroup::A, Phase::Text,
                     std::format("(sculpture) A=\"{}\" B=\"{}\"", textA, textB));
}

void ParticleEngine::setFlowTargets(const std::string &pattern, const FlowOptions &options) {
  if (!checkInitialized("setFlowTargets")) {
    return;
  }

  m_context.flattenZ = 0.0f;
  clearBackgroundSplit();
  m_context.layerCount = 1;
  m_targetRotation = Quaternion::identity();
  m_currentFlowPattern = pattern;

  // Flow is a clean break: group B merges back into group A
  m_phase.merge();
  m_context.patternIdB = NO_PATTERN;
  m_context.flowOriginB = Vector3D();
  m_context.flowScaleB = 1.0f;

  m_physicsOverrides = extractOverrides(options.physics);

  const PatternId id = FlowPatternLibrary::proceduralId(pattern);
  if (id != NO_PATTERN) {
    m_context.patternId = id;
  } else {
    m_context.patternId = NO_PATTERN;
    if (!FlowPatternLibrary::buildHostPattern(pattern, m_buffers.targets, m_buffers.count(),
                                              m_rng)) {
      m_currentFlowPattern = "organic";
    }
  }

  if (m_eventSink) {
    m_eventSink->onPatternChange(m_currentFlowPattern, 1);
  }
}

void ParticleEngine::setFlowTargetsMultiLayer(const FlowLayerList &layers) {
  if (!checkInitialized("setFlowTargetsMultiLayer")) {
    return;
  }
  if (layers.empty()) {
    FLOW_WARN("setFlowTargetsMultiLayer called with no layers");
    return;
  }

  const size_t layerCount = std::min(layers.size(), MAX_FLOW_LAYERS);

  auto resolveId = [](const std::string &name) {
    const PatternId id = FlowPatternLibrary::proceduralId(name);
    if (id == NO_PATTERN) {
      FLOW_WARN(std::format("Layer pattern '{}' has no procedural form, using organic", name));
      return FlowPatternLibrary::ORGANIC_ID;
    }
    return id;
  };

  m_context.layerCount = layerCount;
  m_context.patternId = resolveId(layers[0].pattern);
  m_currentFlowPattern = layers[0].pattern;

  std::string joined;
  for (size_t l = 0; l < MAX_FLOW_LAYERS; ++l) {
    LayerUniforms &slot = m_context.layers[l];
    if (l < layerCount) {
      slot.patternId = resolveId(layers[l].pattern);
      slot.origin = layers[l].origin;
      slot.scale = layers[l].scale;
      joined += (l == 0 ? "" : "+") + layers[l].pattern;
    } else {
      slot = LayerUniforms{};
    }
  }

  // A single layer behaves like a plain pattern with its own origin and scale
  if (layerCount == 1) {
    m_context.flowOrigin = layers[0].origin;
    m_context.flowScale = layers[0].scale;
  }

  if (m_eventSink) {
    m_eventSink->onPatternChange(joined, layerCount);
  }
}

void ParticleEngine::setMode(SimulationMode mode, const std::optional<std::string> &pattern,
                             const FlowOptions &options) {
  if (!checkInitialized("setMode")) {
    return;
  }

  PhaseState &a = m_phase.getState(ParticleGroup::A);

  switch (mode) {
  case SimulationMode::Text:
  case SimulationMode::Forming:
    m_context.patternId = NO_PATTERN;
    resetToSingleLayer();
    a.targetConvergence = 1.0f;
    a.sweepDirection = sweepDirectionForText();
    break;

  case SimulationMode::Flow: {
    a.sweepDirection = Vector3D();
    if (m_phase.isHoldingText()) {
      // Applying now would scatter the held text
      m_phase.deferFlow(PendingFlowCommand{pattern, options});
      if (m_eventSink) {
        m_eventSink->onModeChange(mode, "deferred -> " + pattern.value_or("auto"));
      }
      break;
    }

    // A release keeps decaying to zero; completeRelease() restores the flow value
    const bool releasing = a.phase == Phase::Releasing;
    if (!releasing) {
      a.targetConvergence = PhaseController::FLOW_CONVERGENCE;
    }
    std::string name;
    if (pattern) {
      name = *pattern;
    } else {
      const auto &cycle = FlowPatternLibrary::flowCycle();
      name = cycle[m_flowCycleIndex % cycle.size()];
      ++m_flowCycleIndex;
    }
    setFlowTargets(name, options);

    // A release still in progress would otherwise replace this with organic
    if (releasing) {
      m_phase.deferFlow(PendingFlowCommand{name, options});
    }
    if (m_eventSink) {
      m_eventSink->onModeChange(mode, name);
    }
    break;
  }

  case SimulationMode::Free:
    m_context.flattenZ = 0.0f;
    a.targetConvergence = 0.0f;
    a.sweepDirection = Vector3D();
    if (m_eventSink) {
      m_eventSink->onModeChange(mode, "");
    }
    break;
  }

  if (mode != SimulationMode::Text && mode != SimulationMode::Forming) {
    m_currentText.clear();
  }
}

void ParticleEngine::setFlowOrigin(const Vector3D &origin) { m_context.flowOrigin = origin; }

void ParticleEngine::setFlowScale(float scale) { m_context.flowScale = scale; }

void ParticleEngine::setPointSize(float size) { m_basePointSize = size; }

float ParticleEngine::getPointSize() const {
  return m_basePointSize * m_macro.getState().pointScale;
}

void ParticleEngine::snapToTargets() {
  if (!checkInitialized("snapToTargets")) {
    return;
  }
  std::copy(m_buffers.targets.begin(), m_buffers.targets.end(), m_buffers.positions.begin());
  std::fill(m_buffers.velocities.begin(), m_buffers.velocities.end(), 0.0f);

  PhaseState &a = m_phase.getState(ParticleGroup::A);
  a.convergence = std::clamp(a.targetConvergence, 0.0f, a.maxConvergence);
}

std::vector<std::string> ParticleEngine::getAllPatternNames() const {
  return FlowPatternLibrary::allPatternNames();
}

void ParticleEngine::completeRelease() {
  m_physicsOverrides.reset();
  m_currentText.clear();
  clearBackgroundSplit();
  m_targetRotation = Quaternion::identity();
  resetToSingleLayer();

  std::optional<PendingFlowCommand> pending = m_phase.takePendingFlow();
  const std::string next = pending && pending->pattern ? *pending->pattern : "organic";
  setFlowTargets(next, pending ? pending->options : FlowOptions{});

  PhaseState &a = m_phase.getState(ParticleGroup::A);
  a.targetConvergence = PhaseController::FLOW_CONVERGENCE;
  a.sweepDirection = Vector3D();
}

void ParticleEngine::update(const TickContext &tick) {
  if (!m_initialized) {
    return;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    m_context.deltaTime = std::min(tick.deltaTime, MAX_DELTA_TIME);
    m_context.time = tick.elapsedTime;
    m_context.wavePhase = tick.elapsedTime * 3.0f;
    m_context.isOrthographic = tick.isOrthographic;

    m_worldRotation = m_worldRotation.slerp(m_targetRotation, ROTATION_SLERP_RATE);
    m_context.cameraPosition = m_worldRotation.isIdentity()
                                   ? tick.cameraPosition
                                   : m_worldRotation.inverse().rotate(tick.cameraPosition);

    const float authoredTime = tick.musicTime != 0.0f ? tick.musicTime : tick.elapsedTime;
    m_macro.advance(authoredTime, m_physicsOverrides ? &*m_physicsOverrides : nullptr);
    const MacroParams &macro = m_macro.getState();

    m_context.noiseStrength = macro.noiseStrength;
    m_context.noiseScale = macro.noiseScale;
    m_context.springStrength = macro.springStrength;
    m_context.damping = macro.damping;
    m_context.vortexStrength = macro.vortexStrength;
    m_context.waveStrength = macro.waveStrength;
    m_context.gravity = macro.gravity;

    // Dissolve: extra gravity and noise ramp up as the text lets go
    const PhaseState &a = m_phase.getState(ParticleGroup::A);
    if (a.phase == Phase::Releasing && a.dissolveMode == DissolveMode::Down) {
      const float progress = 0.3f + 0.7f * std::max(0.0f, 1.0f - a.convergence / 0.8f);
      m_context.gravity += 0.0018f * progress;
      m_context.noiseStrength += 0.0012f * progress;
    }

    const PhaseController::TickResult result =
        m_phase.advance(tick.elapsedTime, macro, m_buffers.targets, m_rng);
    if (result.groupAReleased) {
      completeRelease();
    }

    const PhaseState &groupA = m_phase.getState(ParticleGroup::A);
    const PhaseState &groupB = m_phase.getState(ParticleGroup::B);
    m_context.particleCount = m_buffers.count();
    m_context.splitIndex = m_phase.getSplitIndex();
    m_context.groupA = GroupUniforms{groupA.convergence, groupA.currentSweep};
    m_context.groupB = GroupUniforms{groupB.convergence, groupB.currentSweep};

    runKernel();

    auto endTime = std::chrono::high_resolution_clock::now();
    m_lastUpdateTimeMs =
        std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count() /
        1000.0;

#ifndef NDEBUG
    if (++m_frameCounter % 300 == 0) {
      if (m_lastUpdateThreaded) {
        ENGINE_DEBUG(std::format(
            "Engine Summary - Count: {}, Update: {:.2f}ms, Phase: {}/{}, Conv: {:.3f}/{:.3f} "
            "[Threaded: {} batches]",
            m_buffers.count(), m_lastUpdateTimeMs, toString(groupA.phase),
            toString(groupB.phase), groupA.convergence, groupB.convergence, m_lastBatchCount));
      } else {
        ENGINE_DEBUG(std::format(
            "Engine Summary - Count: {}, Update: {:.2f}ms, Phase: {}/{}, Conv: {:.3f}/{:.3f} "
            "[Single-threaded]",
            m_buffers.count(), m_lastUpdateTimeMs, toString(groupA.phase),
            toString(groupB.phase), groupA.convergence, groupB.convergence));
      }
    }
#endif
  } catch (const std::exception &e) {
    ENGINE_ERROR(std::format("Exception in ParticleEngine::update: {}", e.what()));
  }
}

void ParticleEngine::runKernel() {
  const size_t count = m_buffers.count();
  const bool useThreading = m_threadingEnabled && count >= m_threadingThreshold &&
                            ThreadSystem::Exists();
  if (useThreading) {
    runKernelThreaded();
  } else {
    runKernelSingleThreaded();
  }
}

void ParticleEngine::runKernelSingleThreaded() {
  m_kernel.updateRange(m_buffers, m_context, 0, m_buffers.count());
  m_lastUpdateThreaded = false;
  m_lastBatchCount = 1;
}

void ParticleEngine::runKernelThreaded() {
  const size_t count = m_buffers.count();
  auto &budgetManager = WorkerBudgetManager::Instance();
  auto &threadSystem = ThreadSystem::Instance();

  const size_t optimalWorkers = budgetManager.getOptimalWorkers(SystemType::Particle, count);
  auto [batchCount, batchSize] =
      budgetManager.getBatchStrategy(SystemType::Particle, count, optimalWorkers);

  if (batchCount <= 1 || batchSize == 0) {
    runKernelSingleThreaded();
    return;
  }

  auto batchStart = std::chrono::high_resolution_clock::now();

  m_batchFutures.clear();
  m_batchFutures.reserve(batchCount);
  for (size_t b = 0; b < batchCount; ++b) {
    const size_t startIdx = b * batchSize;
    if (startIdx >= count) {
      break;
    }
    const size_t endIdx = std::min(startIdx + batchSize, count);

    // Batches write disjoint index ranges and only read m_context
    m_batchFutures.push_back(threadSystem.enqueueTaskWithResult(
        [this, startIdx, endIdx]() -> void {
          try {
            m_kernel.updateRange(m_buffers, m_context, startIdx, endIdx);
          } catch (const std::exception &e) {
            KERNEL_ERROR(std::string("Exception in kernel batch: ") + e.what());
          }
        },
        TaskPriority::High, "Particle_Batch"));
  }

  // Write-then-dispatch barrier: the tick is complete only when every batch is
  for (auto &future : m_batchFutures) {
    future.get();
  }
  const size_t submitted = m_batchFutures.size();
  m_batchFutures.clear();

  auto batchEnd = std::chrono::high_resolution_clock::now();
  const double totalMs =
      std::chrono::duration_cast<std::chrono::microseconds>(batchEnd - batchStart).count() /
      1000.0;
  budgetManager.reportBatchCompletion(SystemType::Particle, submitted, totalMs);

  m_lastUpdateThreaded = true;
  m_lastBatchCount = submitted;
}

EngineStats ParticleEngine::getStats() const {
  EngineStats stats;
  stats.particleCount = m_buffers.count();
  stats.splitIndex = m_phase.getSplitIndex();
  stats.phaseA = m_phase.getState(ParticleGroup::A).phase;
  stats.phaseB = m_phase.getState(ParticleGroup::B).phase;
  stats.convergenceA = m_phase.getState(ParticleGroup::A).convergence;
  stats.convergenceB = m_phase.getState(ParticleGroup::B).convergence;
  stats.lastUpdateTimeMs = m_lastUpdateTimeMs;
  stats.lastUpdateThreaded = m_lastUpdateThreaded;
  stats.lastBatchCount = m_lastBatchCount;
  return stats;
}

} // namespace GlyphFlow
