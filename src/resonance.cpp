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
#include "resonance.hpp"

namespace seaecho {

real CheckKa(real f, real c, real a, ErrState *errState)
{
    real ka = RL(2.0) * REAL_PI * f * RL(1000.0) / c * a;
    if(ka > RL(1.0)) RunWarning(errState, SEAECHO_WARN_KA_GT_1);
    return ka;
}

ResonanceInfo ResonanceFreq(real f, real c, const BubbleState &bubble, ErrState *errState)
{
    const SeawaterState &water = bubble.water;
    real omega                 = RL(2.0) * REAL_PI * f * RL(1000.0);
    real a                     = bubble.d * RL(0.5);
    CheckKa(f, c, a, errState);

    ResonanceInfo res;
    res.f_b = BareResonance(bubble);

    // Most of the correction parameters are in cgs
    xreal P_dyn   = (xreal)water.P * XL(10.0);             // dyne/cm^2
    xreal rho_gA  = (xreal)bubble.rho_0 * XL(1e-3);        // g/cm^3, free gas at sea level
    xreal Cpg     = (xreal)bubble.Cp * XL(0.2388);         // cal/(g degC)
    xreal Kg      = (xreal)bubble.K_th * XL(0.0023900573613766683); // cal/(cm s degC)
    xreal tau     = (xreal)water.sigma * XL(1e3);          // dyne/cm
    xreal a_cm    = (xreal)a * XL(100.0);
    xreal gamma   = (xreal)bubble.gamma;

    xreal X  = a_cm * std::sqrt(XL(2.0) * (xreal)omega * rho_gA * Cpg / Kg);
    xreal sh = std::sinh(X), ch = std::cosh(X);
    xreal sn = std::sin(X), cs = std::cos(X);

    xreal t1  = X * (sh + sn) - XL(2.0) * (ch - cs);
    xreal t2  = X * X * (ch - cs) + XL(3.0) * (gamma - XL(1.0)) * X * (sh - sn);
    xreal d_b = XL(3.0) * (gamma - XL(1.0)) * t1 / t2;
    xreal t3  = (XL(1.0) + d_b * d_b)
        * (XL(1.0) + (XL(3.0) * gamma - XL(3.0)) / X * ((sh - sn) / (ch - cs)));
    xreal b    = XL(1.0) / t3;
    xreal beta = XL(1.0)
        + XL(2.0) * tau / (P_dyn * a_cm) * (XL(1.0) - XL(1.0) / (XL(3.0) * gamma * b));

    res.f_R  = res.f_b * (real)std::sqrt(b * beta);
    res.corr = vec3((real)b, (real)d_b, (real)beta);
    return res;
}

real DampingConstant(real f, real c, const BubbleState &bubble, const ResonanceInfo &res)
{
    real omega    = RL(2.0) * REAL_PI * f * RL(1000.0);
    real a        = bubble.d * RL(0.5);
    real delta_r  = omega * a / c; // re-radiation
    real delta_t  = res.corr.y * SQ(res.f_R / (f * RL(1000.0))); // thermal
    real delta_nu = RL(4.0) * bubble.water.mu / (bubble.water.rho * omega * SQ(a)); // viscous
    return delta_r + delta_t + delta_nu;
}

real FallbackDamping(real f, real c, const BubbleState &bubble)
{
    real omega = RL(2.0) * REAL_PI * f * RL(1000.0);
    real a     = bubble.d * RL(0.5);
    return omega * a / c + RL(4.0) * bubble.water.mu / (bubble.water.rho * omega * SQ(a));
}

EffectiveResonance GetEffectiveResonance(
    real f, real c, const BubbleState &bubble, ErrState *errState)
{
    ResonanceInfo res = ResonanceFreq(f, c, bubble, errState);
    EffectiveResonance eff;
    eff.f_b   = res.f_b;
    eff.delta = DampingConstant(f, c, bubble, res);
    if(std::isnan(res.f_R)) {
        RunWarning(errState, SEAECHO_WARN_CORRECTION_FALLBACK);
        eff.fallback = true;
        eff.f_res    = res.f_b;
        if(std::isnan(eff.delta)) eff.delta = FallbackDamping(f, c, bubble);
    } else {
        eff.fallback = false;
        eff.f_res    = res.f_R;
    }
    return eff;
}

} // namespace seaecho
