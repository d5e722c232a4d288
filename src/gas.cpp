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
#include "gas.hpp"
#include "common_setup.hpp"

namespace seaecho {

namespace {
const Air air;
const Methane methane;
const GasSpecies *const species[] = {&air, &methane};
} // namespace

BubbleState GasSpecies::Derive(const SeawaterState &water, real d) const
{
    BubbleState b;
    b.d     = d;
    b.Mm    = MolarMass();
    b.K_th  = ThermalConductivity();
    b.Cp    = SpecificHeat();
    b.gamma = Gamma();
    b.water = water;
    b.Pg    = AtmPressure + water.rho * GravAccel * water.z
        + RL(2.0) * water.sigma / (d * RL(0.5)) - water.Pv;
    b.rho   = b.Pg * b.Mm / (GasConstant * (water.T + KelvinOffset));
    b.rho_0 = AtmPressure * b.Mm / (GasConstant * (RL(20.0) + KelvinOffset));
    return b;
}

const GasSpecies *GetGasSpecies(const char *name)
{
    if(name == nullptr) return nullptr;
    std::string n = toupper_copy(trim_copy(name));
    for(const GasSpecies *s : species) {
        if(n == s->Name()) return s;
    }
    return nullptr;
}

std::string GasSpeciesList()
{
    std::string ret;
    for(const GasSpecies *s : species) {
        if(!ret.empty()) ret += " ";
        ret += s->Name();
    }
    return ret;
}

} // namespace seaecho
