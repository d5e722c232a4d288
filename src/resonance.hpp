/*
seaecho - Acoustic target strength of gas bubbles and solid spheres in seawater
Copyright (C) 2023 The seaecho authors

This program is free software: you can redistribute it and/or modify it under
the terms of the GNU General Public License as published by the Free Software
Foundation, either version 3 of the License, or (at your option) any later
version.

This program is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License along with
this program. If not, see <https://www.gnu.org/licenses/>.
*/
#pragma once
#include "common.hpp"

namespace seaecho {

/**
 * Resonance of a gas bubble, Medwin and Clay (1998) Eq. 8.2.13 and
 * Eqs. 8.2.27-8.2.28.
 */
struct ResonanceInfo {
    real f_b;  // bare breathing resonance (Hz), no surface tension, adiabatic
    real f_R;  // corrected for surface tension and thermal conductivity (Hz)
    vec3 corr; // correction parameters (b, d/b, beta)
};

/**
 * The resonance and damping the corrected-resonance models actually use.
 * When the corrections come out NaN, f_res is the bare resonance and delta
 * omits the thermal term.
 */
struct EffectiveResonance {
    real f_res; // Hz
    real delta;
    real f_b;   // Hz
    bool fallback;
};

/// Bare breathing resonance (Hz), Minnaert with no surface tension
inline real BareResonance(const BubbleState &bubble)
{
    real a = bubble.d * RL(0.5);
    return RL(1.0) / (RL(2.0) * REAL_PI * a)
        * std::sqrt(RL(3.0) * bubble.gamma * bubble.water.P / bubble.water.rho);
}

/// Raises SEAECHO_WARN_KA_GT_1 if ka > 1; returns ka
real CheckKa(real f, real c, real a, ErrState *errState);

/**
 * f: sonar frequency (kHz)
 * c: sound speed in seawater (m/s)
 *
 * The correction terms are evaluated in xreal. For a degenerate gas (e.g.
 * Cp or K_th of zero) or for overflow of sinh/cosh they come out NaN, and
 * so does f_R.
 */
ResonanceInfo ResonanceFreq(real f, real c, const BubbleState &bubble, ErrState *errState);

/**
 * Total damping constant delta = delta_r + delta_t + delta_nu, using a
 * precomputed ResonanceInfo.
 */
real DampingConstant(real f, real c, const BubbleState &bubble, const ResonanceInfo &res);

inline real DampingConstant(real f, real c, const BubbleState &bubble, ErrState *errState)
{
    return DampingConstant(f, c, bubble, ResonanceFreq(f, c, bubble, errState));
}

/// Re-radiation plus viscous damping only
real FallbackDamping(real f, real c, const BubbleState &bubble);

/**
 * Resolves the corrected resonance, substituting the bare resonance and
 * the fallback damping when the corrections fail. Raises
 * SEAECHO_WARN_CORRECTION_FALLBACK when it does.
 */
EffectiveResonance GetEffectiveResonance(
    real f, real c, const BubbleState &bubble, ErrState *errState);

} // namespace seaecho
