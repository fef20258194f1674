/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/MacroTensionCurve.hpp"
#include "core/Logger.hpp"
#include <format>

namespace GlyphFlow {

namespace {

MacroPhaseRow row(float end, float noiseStr, float noiseScl, float spring,
                  float damp, float vortex, float wave, float convUp,
                  float convDn, float pointScale) {
  MacroPhaseRow r;
  r.endTime = end;
  r.params = MacroParams{noiseStr, noiseScl, spring, damp, vortex,
                         wave,     0.0f,     convUp, convDn, pointScale};
  return r;
}

// value += (target - value) * rate, with the override taking the target
void ease(float &value, float tableValue, const std::optional<float> &override,
          float overrideRate) {
  if (override) {
    value += (*override - value) * overrideRate;
  } else {
    value += (tableValue - value) * MacroTensionCurve::DEFAULT_EASE_RATE;
  }
}

} // anonymous namespace

const std::vector<MacroPhaseRow> &MacroTensionCurve::defaultRows() {
  static const std::vector<MacroPhaseRow> s_rows = {
      //  end   noiseStr  noiseScl spring  damp   vortex   wave    convUp convDn pointScale
      row(11,  0.00008f, 0.08f, 0.015f, 0.993f, 0.0f,     0.0f,    0.10f, 0.004f, 0.6f),
      row(33,  0.00025f, 0.12f, 0.040f, 0.982f, 0.00005f, 0.0f,    0.15f, 0.006f, 1.0f),
      row(44,  0.0006f,  0.20f, 0.030f, 0.975f, 0.0004f,  0.0003f, 0.12f, 0.005f, 1.3f),
      row(66,  0.0003f,  0.14f, 0.050f, 0.980f, 0.00008f, 0.0f,    0.16f, 0.006f, 1.1f),
      row(77,  0.0008f,  0.25f, 0.025f, 0.970f, 0.0006f,  0.0005f, 0.10f, 0.005f, 1.4f),
      row(99,  0.0001f,  0.06f, 0.070f, 0.990f, 0.0f,     0.0f,    0.22f, 0.008f, 0.8f),
      row(121, 0.00015f, 0.08f, 0.065f, 0.988f, 0.00002f, 0.0f,    0.20f, 0.007f, 0.9f),
      row(999, 0.00004f, 0.04f, 0.010f, 0.995f, 0.0f,     0.0f,    0.06f, 0.003f, 0.4f),
  };
  return s_rows;
}

MacroParams MacroTensionCurve::initialState() {
  MacroParams p;
  p.noiseStrength = 0.00015f;
  p.noiseScale = 0.10f;
  p.springStrength = 0.012f;
  p.damping = 0.993f;
  p.vortexStrength = 0.0f;
  p.waveStrength = 0.0f;
  p.gravity = 0.0f;
  p.convergenceUpRate = 0.025f;
  p.convergenceDownRate = 0.004f;
  p.pointScale = 0.6f;
  return p;
}

MacroTensionCurve::MacroTensionCurve()
    : m_rows(defaultRows()), m_state(initialState()) {}

MacroTensionCurve::MacroTensionCurve(std::vector<MacroPhaseRow> rows)
    : m_rows(std::move(rows)), m_state(initialState()) {
  if (m_rows.empty()) {
    MACRO_WARN("Empty macro curve, using the built-in table");
    m_rows = defaultRows();
  }
  MACRO_DEBUG(std::format("Macro curve with {} rows, last ends at {}s",
                          m_rows.size(), m_rows.back().endTime));
}

const MacroPhaseRow &MacroTensionCurve::activeRow(float authoredTime) const {
  for (const auto &r : m_rows) {
    if (authoredTime < r.endTime) {
      return r;
    }
  }
  return m_rows.back();
}

void MacroTensionCurve::advance(float authoredTime,
                                const PhysicsOverrides *overrides) {
  static const PhysicsOverrides s_none{};
  const PhysicsOverrides &ov = overrides ? *overrides : s_none;
  const float ovRate = ov.lerpRate.value_or(DEFAULT_EASE_RATE);
  const MacroParams &target = activeRow(authoredTime).params;

  ease(m_state.noiseStrength, target.noiseStrength, ov.noiseStrength, ovRate);
  ease(m_state.noiseScale, target.noiseScale, ov.noiseScale, ovRate);
  ease(m_state.springStrength, target.springStrength, ov.spring, ovRate);
  ease(m_state.damping, target.damping, ov.damping, ovRate);
  ease(m_state.vortexStrength, target.vortexStrength, ov.vortex, ovRate);
  ease(m_state.waveStrength, target.waveStrength, ov.wave, ovRate);
  ease(m_state.gravity, target.gravity, ov.gravity, ovRate);
  ease(m_state.convergenceUpRate, target.convergenceUpRate, ov.convUp, ovRate);
  ease(m_state.convergenceDownRate, target.convergenceDownRate, ov.convDn, ovRate);
  ease(m_state.pointScale, target.pointScale, ov.pointScale, ovRate);
}

} // namespace GlyphFlow
