/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MACRO_TENSION_CURVE_HPP
#define MACRO_TENSION_CURVE_HPP

#include "simulation/SimulationTypes.hpp"
#include <vector>

namespace GlyphFlow {

/**
 * @brief Time-keyed table of ambient physics parameters
 *
 * The active row is the first whose endTime exceeds the authored time (the
 * last row once time runs past the table). Each advance() eases every scalar
 * of the current state toward that row by DEFAULT_EASE_RATE, or toward the
 * override value at the override's lerp rate when one is supplied.
 * The built-in rows keep gravity at 0, so it only moves under overrides.
 */
class MacroTensionCurve {
public:
  static constexpr float DEFAULT_EASE_RATE = 0.005f;

  // Uses the built-in silence, buildup, climax, release arc
  MacroTensionCurve();

  // `rows` must be non-empty with strictly increasing end times
  explicit MacroTensionCurve(std::vector<MacroPhaseRow> rows);

  static const std::vector<MacroPhaseRow> &defaultRows();
  static MacroParams initialState();

  const MacroPhaseRow &activeRow(float authoredTime) const;

  /**
   * @brief Ease the state one tick toward the row active at `authoredTime`
   * @param overrides Per-command overrides, or nullptr
   */
  void advance(float authoredTime, const PhysicsOverrides *overrides);

  const MacroParams &getState() const { return m_state; }
  void setState(const MacroParams &state) { m_state = state; }
  const std::vector<MacroPhaseRow> &getRows() const { return m_rows; }

private:
  std::vector<MacroPhaseRow> m_rows;
  MacroParams m_state;
};

} // namespace GlyphFlow

#endif // MACRO_TENSION_CURVE_HPP
