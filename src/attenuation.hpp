/*
seaecho - Acoustic target strength of gas bubbles and solid spheres in seawater
Copyright (C) 2021-2023 The Regents of the University of California
Marine Physical Lab at Scripps Oceanography, c/o Jules Jaffe, jjaffe@ucsd.edu

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
 * Francois Garrison formulas for attenuation
 *
 * Verified using F-G Table IV
 *
 * alpha = attenuation   (dB/km)
 * f     = frequency     (kHz)
 * T     = temperature   (deg C)
 * S     = salinity      (psu)
 * pH    = 7 for neutral water
 * z_bar = depth         (m)
 *
 *     Returns
 *        alpha = volume attenuation in dB/km
 */
inline real Franc_Garr(real f, real T, real S, real pH, real z_bar)
{
    real c, a1, a2, a3, p1, p2, p3, f1, f2;

    c = RL(1412.0) + RL(3.21) * T + RL(1.19) * S + RL(0.0167) * z_bar;

    // Boric acid contribution
    a1 = RL(8.86) / c * std::pow(RL(10.0), RL(0.78) * pH - RL(5.0));
    p1 = RL(1.0);
    f1 = RL(2.8) * std::sqrt(S / RL(35.0))
        * std::pow(RL(10.0), RL(4.0) - RL(1245.0) / (T + RL(273.0)));

    // Magnesium sulfate contribution
    a2 = RL(21.44) * S / c * (RL(1.0) + RL(0.025) * T);
    p2 = RL(1.0) - RL(1.37e-4) * z_bar + RL(6.2e-9) * SQ(z_bar);
    f2 = RL(8.17) * std::pow(RL(10.0), RL(8.0) - RL(1990.0) / (T + RL(273.0)))
        / (RL(1.0) + RL(0.0018) * (S - RL(35.0)));

    // Viscosity
    p3 = RL(1.0) - RL(3.83e-5) * z_bar + RL(4.9e-10) * SQ(z_bar);
    if(T < RL(20.0)) {
        a3 = RL(4.937e-4) - RL(2.59e-5) * T + RL(9.11e-7) * SQ(T) - RL(1.5e-8) * CUBE(T);
    } else {
        a3 = RL(3.964e-4) - RL(1.146e-5) * T + RL(1.45e-7) * SQ(T)
            - RL(6.5e-10) * CUBE(T);
    }

    return a1 * p1 * (f1 * SQ(f)) / (SQ(f1) + SQ(f))
        + a2 * p2 * (f2 * SQ(f)) / (SQ(f2) + SQ(f)) + a3 * p3 * SQ(f);
}

/**
 * Ainslie & McColm (1998), J. Acoust. Soc. Am. 103(3), 1671-1672.
 * Same arguments and units as Franc_Garr, with depth in km internally.
 */
inline real Ainslie_McColm(real f, real T, real S, real pH, real z_bar)
{
    real z  = z_bar / RL(1000.0);
    real f1 = RL(0.78) * std::sqrt(S / RL(35.0)) * std::exp(T / RL(26.0));
    real f2 = RL(42.0) * std::exp(T / RL(17.0));
    real f_sq = SQ(f);

    // Boric acid
    real boric = RL(0.106) * f1 * f_sq / (f_sq + SQ(f1))
        * std::exp((pH - RL(8.0)) / RL(0.56));
    // Magnesium sulfate
    real mgso4 = RL(0.52) * (RL(1.0) + T / RL(43.0)) * (S / RL(35.0)) * f2 * f_sq
        / (f_sq + SQ(f2)) * std::exp(-z / RL(6.0));
    // Pure water
    real water = RL(0.00049) * f_sq * std::exp(-(T / RL(27.0) + z / RL(17.0)));

    return boric + mgso4 + water;
}

/// Thorp (1967), f in kHz, returns dB/km. No environmental dependence.
inline real Thorp(real f)
{
    real f2 = SQ(f);
    return RL(3.3e-3) + RL(0.11) * f2 / (RL(1.0) + f2) + RL(44.0) * f2 / (RL(4100.0) + f2)
        + RL(3.0e-4) * f2;
}

inline bool IsValidAbsorptionOpt(char opt) { return opt == 'A' || opt == 'F' || opt == 'T'; }

/**
 * Volume absorption in dB/km at frequency f (kHz).
 *
 * formula
 * 'A' Ainslie & McColm (default)
 * 'F' Francois Garrison
 * 'T' Thorp
 *
 * Throws std::runtime_error for any other formula.
 */
inline real VolumeAbsorption(real f, const SeawaterState &water, char formula)
{
    switch(formula) {
    case 'A': return Ainslie_McColm(f, water.T, water.S, water.pH, water.z);
    case 'F': return Franc_Garr(f, water.T, water.S, water.pH, water.z);
    case 'T': return Thorp(f);
    default:
        throw std::runtime_error(
            std::string("Unknown absorption formula '") + formula + "'");
    }
}

} // namespace seaecho
