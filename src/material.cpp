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
#include "material.hpp"
#include "common_setup.hpp"

namespace seaecho {

const SolidMaterial *FindSolidMaterial(const char *name)
{
    if(name == nullptr) return nullptr;
    std::string n = toupper_copy(trim_copy(name));
    for(const SolidMaterial &m : SolidMaterials) {
        if(n == m.name) return &m;
    }
    return nullptr;
}

std::string SolidMaterialList()
{
    std::string ret;
    for(const SolidMaterial &m : SolidMaterials) {
        if(!ret.empty()) ret += " ";
        ret += m.name;
    }
    return ret;
}

} // namespace seaecho
