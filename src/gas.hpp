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
 * Constant gas properties. Each species is a subclass; add new ones to the
 * species list in gas.cpp.
 */
class GasSpecies {
public:
    virtual ~GasSpecies() {}
    /// Upper case, as written in the env file
    virtual const char *Name() const = 0;
    virtual real MolarMass() const = 0;           // kg/mol
    virtual real ThermalConductivity() const = 0; // W/(m K)
    virtual real SpecificHeat() const = 0;        // kJ/(kg K)
    virtual real Gamma() const = 0;

    /**
     * Gas state inside a bubble of diameter d (m) at the depth of water.
     * The internal pressure includes the Laplace pressure and is reduced
     * by the vapor pressure.
     */
    BubbleState Derive(const SeawaterState &water, real d) const;
};

/**
 * Dry air. The thermal conductivity is Eq. 7 of Stephan and Laesecke (1985),
 * The Thermal Conductivity of Fluid Air.
 */
class Air : public GasSpecies {
public:
    const char *Name() const override { return "AIR"; }
    real MolarMass() const override { return RL(28.96e-3); }
    real ThermalConductivity() const override { return RL(4.358e-3); }
    real SpecificHeat() const override { return RL(1.005); }
    real Gamma() const override { return RL(1.4); }
};

class Methane : public GasSpecies {
public:
    const char *Name() const override { return "METHANE"; }
    real MolarMass() const override { return RL(16.04e-3); }
    real ThermalConductivity() const override { return RL(0.0343); }
    real SpecificHeat() const override { return RL(2.226); }
    real Gamma() const override { return RL(1.31); }
};

/// Case-insensitive lookup. Returns nullptr for an unknown species.
const GasSpecies *GetGasSpecies(const char *name);

/// Space-separated list of the known species, for error messages
std::string GasSpeciesList();

} // namespace seaecho
