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
#include "../common_setup.hpp"
#include "../gas.hpp"
#include "../material.hpp"
#include "paramsmodule.hpp"

namespace seaecho { namespace module {

/**
 * Scatterer kind and the gas species or sphere material.
 */
class Scatterer : public ParamsModule {
public:
    Scatterer() {}
    virtual ~Scatterer() {}

    virtual void Default(seParams &params) const override
    {
        params.scat->Kind = 'B';
        SetName(params.scat->Name, "AIR");
    }
    virtual void Read(seParams &params, LDIFile &ENVFile) const override
    {
        std::string name;
        LIST(ENVFile);
        ENVFile.Read(params.scat->Kind);
        ENVFile.Read(name);
        SetName(params.scat->Name, toupper_copy(trim_copy(name)));
    }
    virtual void Validate(seParams &params) const override
    {
        const ScattererInfo *scat = params.scat;
        if(scat->Kind == 'B') {
            if(GetGasSpecies(scat->Name) == nullptr) {
                EXTERR(
                    "Scatterer: Unknown gas species %s (available: %s)", scat->Name,
                    GasSpeciesList().c_str());
            }
        } else if(scat->Kind == 'S') {
            if(FindSolidMaterial(scat->Name) == nullptr) {
                EXTERR(
                    "Scatterer: Unknown solid material %s (available: %s)", scat->Name,
                    SolidMaterialList().c_str());
            }
        } else {
            EXTERR(
                "Scatterer: Unknown scatterer kind '%c' (B bubble, S solid sphere)",
                scat->Kind);
        }
    }
    virtual void Echo(seParams &params) const override
    {
        PrintFileEmu &PRTFile = GetInternal(params)->PRTFile;
        const ScattererInfo *scat = params.scat;
        PRTFile << "\n   Scatterer: " << (scat->Kind == 'B' ? "gas bubble" : "solid sphere")
                << ", " << scat->Name << "\n";
        if(scat->Kind == 'S') {
            const SolidMaterial *mat = FindSolidMaterial(scat->Name);
            PRTFile << "   rho = " << mat->rho << " kg/m^3, c_lon = " << mat->c_lon
                    << " m/s, c_trans = " << mat->c_trans << " m/s\n";
        } else {
            const GasSpecies *gas = GetGasSpecies(scat->Name);
            PRTFile << "   Mm = " << gas->MolarMass() << " kg/mol, gamma = " << gas->Gamma()
                    << ", Cp = " << gas->SpecificHeat()
                    << " kJ/(kg K), K_th = " << gas->ThermalConductivity() << " W/(m K)\n";
        }
    }
};

}} // namespace seaecho::module
