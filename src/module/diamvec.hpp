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
#include "paramsmodule.hpp"

namespace seaecho { namespace module {

/**
 * Scatterer diameters. Given in mm in the env file and stored in m after
 * Preprocess.
 */
class DiamVec : public ParamsModule {
public:
    DiamVec() {}
    virtual ~DiamVec() {}

    virtual void Init(seParams &params) const override { params.scat->diamVec = nullptr; }
    virtual void SetupPre(seParams &params) const override
    {
        params.scat->Ndiam    = 1;
        params.scat->diamInMM = false;
    }
    virtual void Default(seParams &params) const override
    {
        trackallocate(params, Description, params.scat->diamVec, params.scat->Ndiam);
        params.scat->diamVec[0] = RL(0.002);
    }
    virtual void Read(seParams &params, LDIFile &ENVFile) const override
    {
        ReadVector(params, params.scat->diamVec, params.scat->Ndiam, ENVFile, Description);
        params.scat->diamInMM = true;
    }
    void ExtSetup(seParams &params, int32_t Ndiam) const
    {
        params.scat->Ndiam    = Ndiam;
        params.scat->diamInMM = false;
        trackallocate(params, Description, params.scat->diamVec, params.scat->Ndiam);
    }
    virtual void Validate(seParams &params) const override
    {
        ValidateVector(params, params.scat->diamVec, params.scat->Ndiam, Description);
    }
    virtual void Echo(seParams &params) const override
    {
        EchoVectorWDescr(
            params, params.scat->diamVec, params.scat->Ndiam,
            params.scat->diamInMM ? RL(1.0) : RL(1000.0), Description, Units);
    }
    virtual void Preprocess(seParams &params) const override
    {
        ScattererInfo *scat = params.scat;
        if(!scat->diamInMM) return;
        for(int32_t i = 0; i < scat->Ndiam; ++i) scat->diamVec[i] *= RL(0.001);
        scat->diamInMM = false;
    }
    virtual void Finalize(seParams &params) const override
    {
        trackdeallocate(params, params.scat->diamVec);
    }

private:
    constexpr static const char *Description = "Diameters";
    constexpr static const char *Units       = "mm";
};

}} // namespace seaecho::module
