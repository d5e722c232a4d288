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
 * Elastic properties of the calibration sphere materials.
 *
 * TUNGSTENCARBIDE  MacLennan and Dunn (1984), Foote (1990)
 * COPPER           annealed, ~25 deg C
 * ALUMINUM
 * STAINLESS        stainless steel
 */
constexpr SolidMaterial SolidMaterials[] = {
    {"TUNGSTENCARBIDE", RL(14900.0), RL(6853.0), RL(4171.0)},
    {"COPPER", RL(8940.0), RL(4660.0), RL(2325.0)},
    {"ALUMINUM", RL(2700.0), RL(6260.0), RL(3080.0)},
    {"STAINLESS", RL(7800.0), RL(5610.0), RL(3120.0)},
};

/// Case-insensitive lookup. Returns nullptr for an unknown material.
const SolidMaterial *FindSolidMaterial(const char *name);

/// Space-separated list of the known materials, for error messages
std::string SolidMaterialList();

} // namespace seaecho
