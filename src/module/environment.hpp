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
#include "../seawater.hpp"
#include "../attenuation.hpp"
#include "paramsmodule.hpp"

namespace seaecho { namespace module {

/**
 * Water temperature, salinity, depth, pH, and the volume absorption formula.
 */
class Environment : public ParamsModule {
public:
    Environment() {}
    virtual ~Environment() {}

    virtual void SetupPre(seParams &params) const override
    {
        params.env->pH            = RL(8.0);
        params.env->AbsorptionOpt = 'A';
    }
    virtual void Default(seParams &params) const override
    {
        params.env->T = RL(10.0);
        params.env->S = RL(35.0);
        params.env->z = RL(100.0);
    }
    virtual void Read(seParams &params, LDIFile &ENVFile) const override
    {
        EnvInfo *env = params.env;
        LIST(ENVFile);
        ENVFile.Read(env->T);
        ENVFile.Read(env->S);
        ENVFile.Read(env->z);
        ENVFile.Read(env->pH);
        ENVFile.Read(env->AbsorptionOpt);
    }
    virtual void Validate(seParams &params) const override
    {
        const EnvInfo *env = params.env;
        std::string reason;
        if(!SeawaterInRange(env->T, env->z, env->S, env->pH, reason)) {
            EXTERR("Environment: %s", reason.c_str());
        }
        if(!IsValidAbsorptionOpt(env->AbsorptionOpt)) {
            EXTERR(
                "Environment: Unknown absorption formula '%c' (A, F, or T)",
                env->AbsorptionOpt);
        }
    }
    virtual void Echo(seParams &params) const override
    {
        PrintFileEmu &PRTFile = GetInternal(params)->PRTFile;
        const EnvInfo *env    = params.env;
        SeawaterState water   = SeawaterFromTSZ(env->T, env->z, env->S, env->pH);

        PRTFile << "\n   Temperature      = " << env->T << " deg C\n";
        PRTFile << "   Salinity         = " << env->S << " psu\n";
        PRTFile << "   Depth            = " << env->z << " m\n";
        PRTFile << "   pH               = " << env->pH << "\n";
        PRTFile << std::setprecision(6);
        PRTFile << "\n   Sound speed      = " << water.c << " m/s\n";
        PRTFile << "   Density          = " << water.rho << " kg/m^3\n";
        PRTFile << "   Pressure         = " << water.P << " Pa\n";
        PRTFile << "   Viscosity        = " << water.mu << " Pa s\n";
        PRTFile << "   Surface tension  = " << water.sigma << " N/m\n";
        PRTFile << "   Vapor pressure   = " << water.Pv << " Pa\n";
        PRTFile << "   Specific heat    = " << water.cp << " J/(kg K)\n";

        switch(env->AbsorptionOpt) {
        case 'A': PRTFile << "    Ainslie-McColm volume attenuation\n"; break;
        case 'F': PRTFile << "    Francois-Garrison volume attenuation\n"; break;
        case 'T': PRTFile << "    THORP volume attenuation\n"; break;
        }
    }
};

}} // namespace seaecho::module
