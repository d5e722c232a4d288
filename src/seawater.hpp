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
 * Returns false and fills in reason if any environmental input is out of
 * range.
 */
bool SeawaterInRange(real T, real z, real S, real pH, std::string &reason);

/// Mackenzie (1981) nine-term sound speed, m/s
real SoundSpeedMackenzie(real T, real S, real z);
/// UNESCO EOS-80 one-atmosphere density, kg/m^3
real DensityEOS80(real T, real S);
/// Dynamic viscosity, Pa s
real DynamicViscosity(real T, real S);
/// Saturation vapor pressure over seawater, Pa
real VaporPressure(real T, real S);
/// Surface tension of seawater against air, N/m
real SurfaceTension(real T, real S);
/// Specific heat at constant pressure, J/(kg K)
real SpecificHeat(real T, real S);

/**
 * Derives every seawater property used by the scatterer models from
 * (T, z, S, pH). Throws std::runtime_error if the inputs are outside
 * -2 <= T <= 40 deg C, 0 <= S <= 45 psu, 0 <= z <= 12000 m, 0 <= pH <= 14.
 */
SeawaterState SeawaterFromTSZ(real T, real z, real S, real pH);

} // namespace seaecho
