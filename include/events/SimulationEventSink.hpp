/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_EVENT_SINK_HPP
#define SIMULATION_EVENT_SINK_HPP

/**
 * @file SimulationEventSink.hpp
 * @brief Observer interface for engine state changes
 *
 * The engine publishes phase transitions, pattern switches and mode
 * commands here. It never depends on how they are displayed: pass a
 * LoggingEventSink for console output, a recording sink in tests, or
 * nothing at all.
 *
 * Callbacks run on the thread that issued the command or tick, never from
 * kernel worker threads.
 */

#include "simulation/SimulationTypes.hpp"
#include <cstddef>
#include <string>

namespace GlyphFlow {

class SimulationEventSink
{
public:
    virtual ~SimulationEventSink() = default;

    /**
     * @brief A group moved between flow, forming, text and releasing
     * @param detail Short human-readable context (text, hold time...)
     */
    virtual void onPhaseChange(ParticleGroup group, Phase from, Phase to,
                               const std::string& detail) = 0;

    /**
     * @brief The flow target changed
     * @param layerCount 1 for single-layer flow, up to 4 for multi-layer
     */
    virtual void onPatternChange(const std::string& pattern, size_t layerCount) = 0;

    // setMode was called; deferred flow requests report detail "deferred"
    virtual void onModeChange(SimulationMode mode, const std::string& detail) = 0;
};

/**
 * @brief Routes engine events to the logger
 */
class LoggingEventSink : public SimulationEventSink
{
public:
    void onPhaseChange(ParticleGroup group, Phase from, Phase to,
                       const std::string& detail) override;
    void onPatternChange(const std::string& pattern, size_t layerCount) override;
    void onModeChange(SimulationMode mode, const std::string& detail) override;
};

} // namespace GlyphFlow

#endif // SIMULATION_EVENT_SINK_HPP
