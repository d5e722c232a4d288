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
#include "seawater.hpp"

namespace seaecho {

bool SeawaterInRange(real T, real z, real S, real pH, std::string &reason)
{
    char buf[128];
    if(!(T >= RL(-2.0) && T <= RL(40.0))) {
        snprintf(buf, sizeof(buf), "temperature %g deg C outside [-2, 40]", (double)T);
    } else if(!(S >= RL(0.0) && S <= RL(45.0))) {
        snprintf(buf, sizeof(buf), "salinity %g psu outside [0, 45]", (double)S);
    } else if(!(z >= RL(0.0) && z <= RL(12000.0))) {
        snprintf(buf, sizeof(buf), "depth %g m outside [0, 12000]", (double)z);
    } else if(!(pH >= RL(0.0) && pH <= RL(14.0))) {
        snprintf(buf, sizeof(buf), "pH %g outside [0, 14]", (double)pH);
    } else {
        return true;
    }
    reason = buf;
    return false;
}

/**
 * Mackenzie, K.V. (1981) Nine-term equation for sound speed in the oceans.
 * J. Acoust. Soc. Am. 70(3), 807-812.
 */
real SoundSpeedMackenzie(real T, real S, real z)
{
    real dS = S - RL(35.0);
    return RL(1448.96) + RL(4.591) * T - RL(5.304e-2) * SQ(T) + RL(2.374e-4) * CUBE(T)
        + RL(1.340) * dS + RL(1.630e-2) * z + RL(1.675e-7) * SQ(z)
        - RL(1.025e-2) * T * dS - RL(7.139e-13) * T * CUBE(z);
}

/**
 * UNESCO (1981) EOS-80 density at one atmosphere. Pressure dependence is
 * neglected.
 */
real DensityEOS80(real T, real S)
{
    real T2 = SQ(T), T3 = T2 * T, T4 = T3 * T, T5 = T4 * T;
    real rho_w = RL(999.842594) + RL(6.793952e-2) * T - RL(9.095290e-3) * T2
        + RL(1.001685e-4) * T3 - RL(1.120083e-6) * T4 + RL(6.536332e-9) * T5;
    real A = RL(8.24493e-1) - RL(4.0899e-3) * T + RL(7.6438e-5) * T2
        - RL(8.2467e-7) * T3 + RL(5.3875e-9) * T4;
    real B = RL(-5.72466e-3) + RL(1.0227e-4) * T - RL(1.6546e-6) * T2;
    real C = RL(4.8314e-4);
    return rho_w + A * S + B * S * std::sqrt(S) + C * SQ(S);
}

/**
 * Pure water from the Vogel equation, with the Sharqawy et al. (2010)
 * salinity correction.
 */
real DynamicViscosity(real T, real S)
{
    real mu_w = RL(2.414e-5)
        * std::pow(RL(10.0), RL(247.8) / (T + KelvinOffset - RL(140.0)));
    real s = S / RL(1000.0); // kg/kg
    real A = RL(1.541) + RL(1.998e-2) * T - RL(9.52e-5) * SQ(T);
    real B = RL(7.974) - RL(7.561e-2) * T + RL(4.724e-4) * SQ(T);
    return mu_w * (RL(1.0) + A * s + B * SQ(s));
}

/**
 * Buck (1981) equation over pure water, lowered by Raoult's law for the
 * dissolved salts.
 */
real VaporPressure(real T, real S)
{
    real Pv_w = RL(611.21)
        * std::exp((RL(18.678) - T / RL(234.5)) * (T / (RL(257.14) + T)));
    return Pv_w / (RL(1.0) + RL(0.57357) * (S / (RL(1000.0) - S)));
}

/// IAPWS pure water surface tension with the Sharqawy salinity factor
real SurfaceTension(real T, real S)
{
    real tau     = RL(1.0) - (T + KelvinOffset) / RL(647.096);
    real sigma_w = RL(0.2358) * std::pow(tau, RL(1.256)) * (RL(1.0) - RL(0.625) * tau);
    return sigma_w * (RL(1.0) + RL(3.766e-4) * S + RL(2.347e-6) * S * T);
}

/// Millero et al. (1973), at one atmosphere
real SpecificHeat(real T, real S)
{
    real T2 = SQ(T), T3 = T2 * T, T4 = T3 * T;
    real cp0 = RL(4217.4) - RL(3.720283) * T + RL(0.1412855) * T2
        - RL(2.654387e-3) * T3 + RL(2.093236e-5) * T4;
    real A = RL(-7.643575) + RL(0.1072763) * T - RL(1.38385e-3) * T2;
    real B = RL(0.1770383) - RL(4.07718e-3) * T + RL(5.148e-5) * T2;
    return cp0 + A * S + B * S * std::sqrt(S);
}

SeawaterState SeawaterFromTSZ(real T, real z, real S, real pH)
{
    std::string reason;
    if(!SeawaterInRange(T, z, S, pH, reason)) {
        throw std::runtime_error("Seawater state out of range: " + reason);
    }
    SeawaterState w;
    w.T     = T;
    w.z     = z;
    w.S     = S;
    w.pH    = pH;
    w.rho   = DensityEOS80(T, S);
    w.c     = SoundSpeedMackenzie(T, S, z);
    w.mu    = DynamicViscosity(T, S);
    w.nu    = w.mu / w.rho;
    w.P     = AtmPressure + w.rho * GravAccel * z;
    w.Pv    = VaporPressure(T, S);
    w.sigma = SurfaceTension(T, S);
    w.cp    = SpecificHeat(T, S);
    return w;
}

} // namespace seaecho
