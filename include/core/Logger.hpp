/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace GlyphFlow {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (file sink in release)
  ERROR_LEVEL = 1,  // Always logs (file sink in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("GlyphFlow Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define GLYPHFLOW_CRITICAL(system, msg)                                        \
  GlyphFlow::Logger::Log(GlyphFlow::LogLevel::CRITICAL, system, msg)
#define GLYPHFLOW_ERROR(system, msg)                                           \
  GlyphFlow::Logger::Log(GlyphFlow::LogLevel::ERROR_LEVEL, system, msg)
#define GLYPHFLOW_WARN(system, msg)                                            \
  GlyphFlow::Logger::Log(GlyphFlow::LogLevel::WARNING, system, msg)
#define GLYPHFLOW_INFO(system, msg)                                            \
  GlyphFlow::Logger::Log(GlyphFlow::LogLevel::INFO, system, msg)
#define GLYPHFLOW_DEBUG(system, msg)                                           \
  GlyphFlow::Logger::Log(GlyphFlow::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL/ERROR go to the log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define GLYPHFLOW_CRITICAL(system, msg)                                        \
  GlyphFlow::Logger::Log("CRITICAL", system, msg)

#define GLYPHFLOW_ERROR(system, msg)                                           \
  GlyphFlow::Logger::Log("ERROR", system, msg)

#define GLYPHFLOW_WARN(system, msg) ((void)0)  // Zero overhead
#define GLYPHFLOW_INFO(system, msg) ((void)0)  // Zero overhead
#define GLYPHFLOW_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

#define THREADSYSTEM_CRITICAL(msg) GLYPHFLOW_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) GLYPHFLOW_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) GLYPHFLOW_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) GLYPHFLOW_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) GLYPHFLOW_DEBUG("ThreadSystem", msg)

#define ENGINE_CRITICAL(msg) GLYPHFLOW_CRITICAL("ParticleEngine", msg)
#define ENGINE_ERROR(msg) GLYPHFLOW_ERROR("ParticleEngine", msg)
#define ENGINE_WARN(msg) GLYPHFLOW_WARN("ParticleEngine", msg)
#define ENGINE_INFO(msg) GLYPHFLOW_INFO("ParticleEngine", msg)
#define ENGINE_DEBUG(msg) GLYPHFLOW_DEBUG("ParticleEngine", msg)

#define PHASE_CRITICAL(msg) GLYPHFLOW_CRITICAL("PhaseController", msg)
#define PHASE_ERROR(msg) GLYPHFLOW_ERROR("PhaseController", msg)
#define PHASE_WARN(msg) GLYPHFLOW_WARN("PhaseController", msg)
#define PHASE_INFO(msg) GLYPHFLOW_INFO("PhaseController", msg)
#define PHASE_DEBUG(msg) GLYPHFLOW_DEBUG("PhaseController", msg)

#define FLOW_CRITICAL(msg) GLYPHFLOW_CRITICAL("FlowPatternLibrary", msg)
#define FLOW_ERROR(msg) GLYPHFLOW_ERROR("FlowPatternLibrary", msg)
#define FLOW_WARN(msg) GLYPHFLOW_WARN("FlowPatternLibrary", msg)
#define FLOW_INFO(msg) GLYPHFLOW_INFO("FlowPatternLibrary", msg)
#define FLOW_DEBUG(msg) GLYPHFLOW_DEBUG("FlowPatternLibrary", msg)

#define TEXT_CRITICAL(msg) GLYPHFLOW_CRITICAL("TextTargetSampler", msg)
#define TEXT_ERROR(msg) GLYPHFLOW_ERROR("TextTargetSampler", msg)
#define TEXT_WARN(msg) GLYPHFLOW_WARN("TextTargetSampler", msg)
#define TEXT_INFO(msg) GLYPHFLOW_INFO("TextTargetSampler", msg)
#define TEXT_DEBUG(msg) GLYPHFLOW_DEBUG("TextTargetSampler", msg)

#define FORMATION_CRITICAL(msg) GLYPHFLOW_CRITICAL("FormationAnimator", msg)
#define FORMATION_ERROR(msg) GLYPHFLOW_ERROR("FormationAnimator", msg)
#define FORMATION_WARN(msg) GLYPHFLOW_WARN("FormationAnimator", msg)
#define FORMATION_INFO(msg) GLYPHFLOW_INFO("FormationAnimator", msg)
#define FORMATION_DEBUG(msg) GLYPHFLOW_DEBUG("FormationAnimator", msg)

#define MACRO_CRITICAL(msg) GLYPHFLOW_CRITICAL("MacroTensionCurve", msg)
#define MACRO_ERROR(msg) GLYPHFLOW_ERROR("MacroTensionCurve", msg)
#define MACRO_WARN(msg) GLYPHFLOW_WARN("MacroTensionCurve", msg)
#define MACRO_INFO(msg) GLYPHFLOW_INFO("MacroTensionCurve", msg)
#define MACRO_DEBUG(msg) GLYPHFLOW_DEBUG("MacroTensionCurve", msg)

#define KERNEL_CRITICAL(msg) GLYPHFLOW_CRITICAL("ForceKernel", msg)
#define KERNEL_ERROR(msg) GLYPHFLOW_ERROR("ForceKernel", msg)
#define KERNEL_WARN(msg) GLYPHFLOW_WARN("ForceKernel", msg)
#define KERNEL_INFO(msg) GLYPHFLOW_INFO("ForceKernel", msg)
#define KERNEL_DEBUG(msg) GLYPHFLOW_DEBUG("ForceKernel", msg)

#define CONFIG_CRITICAL(msg) GLYPHFLOW_CRITICAL("EngineConfig", msg)
#define CONFIG_ERROR(msg) GLYPHFLOW_ERROR("EngineConfig", msg)
#define CONFIG_WARN(msg) GLYPHFLOW_WARN("EngineConfig", msg)
#define CONFIG_INFO(msg) GLYPHFLOW_INFO("EngineConfig", msg)
#define CONFIG_DEBUG(msg) GLYPHFLOW_DEBUG("EngineConfig", msg)

#define FONT_CRITICAL(msg) GLYPHFLOW_CRITICAL("FontRasterizer", msg)
#define FONT_ERROR(msg) GLYPHFLOW_ERROR("FontRasterizer", msg)
#define FONT_WARN(msg) GLYPHFLOW_WARN("FontRasterizer", msg)
#define FONT_INFO(msg) GLYPHFLOW_INFO("FontRasterizer", msg)
#define FONT_DEBUG(msg) GLYPHFLOW_DEBUG("FontRasterizer", msg)

#define DEMO_CRITICAL(msg) GLYPHFLOW_CRITICAL("GlyphFlowDemo", msg)
#define DEMO_ERROR(msg) GLYPHFLOW_ERROR("GlyphFlowDemo", msg)
#define DEMO_WARN(msg) GLYPHFLOW_WARN("GlyphFlowDemo", msg)
#define DEMO_INFO(msg) GLYPHFLOW_INFO("GlyphFlowDemo", msg)
#define DEMO_DEBUG(msg) GLYPHFLOW_DEBUG("GlyphFlowDemo", msg)

// Benchmark mode: silences all logging for clean timing runs
#define GLYPHFLOW_ENABLE_BENCHMARK_MODE()                                      \
  GlyphFlow::Logger::SetBenchmarkMode(true)
#define GLYPHFLOW_DISABLE_BENCHMARK_MODE()                                     \
  GlyphFlow::Logger::SetBenchmarkMode(false)

} // namespace GlyphFlow

#endif // LOGGER_HPP
