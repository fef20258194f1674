/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/SimulationEventSink.hpp"
#include "core/Logger.hpp"
#include <format>

namespace GlyphFlow {

void LoggingEventSink::onPhaseChange([[maybe_unused]] ParticleGroup group,
                                     [[maybe_unused]] Phase from,
                                     [[maybe_unused]] Phase to,
                                     const std::string& detail)
{
    if (detail.empty()) {
        PHASE_INFO(std::format("[{}] {} -> {}", toString(group), toString(from), toString(to)));
        return;
    }
    PHASE_INFO(std::format("[{}] {} -> {} {}", toString(group), toString(from), toString(to),
                           detail));
}

void LoggingEventSink::onPatternChange([[maybe_unused]] const std::string& pattern,
                                       size_t layerCount)
{
    if (layerCount > 1) {
        FLOW_INFO(std::format("multiLayer {}L: {}", layerCount, pattern));
    } else {
        FLOW_INFO("flow pattern " + pattern);
    }
}

void LoggingEventSink::onModeChange([[maybe_unused]] SimulationMode mode,
                                    [[maybe_unused]] const std::string& detail)
{
    ENGINE_INFO(std::format("mode {} {}", toString(mode), detail));
}

} // namespace GlyphFlow
