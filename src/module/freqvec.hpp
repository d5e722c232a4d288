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
#include "../common_setup.hpp"
#include "paramsmodule.hpp"

namespace seaecho { namespace module {

/**
 * Sweep frequencies in kHz. The order is kept as given; results come out
 * index-aligned to it.
 */
class FreqVec : public ParamsModule {
public:
    FreqVec() {}
    virtual ~FreqVec() {}

    virtual void Init(seParams &params) const override
    {
        params.freqinfo->freqVec = nullptr;
    }
    virtual void SetupPre(seParams &params) const override
    {
        params.freqinfo->Spacing = ' ';
        params.freqinfo->Nfreq   = 100;
    }
    virtual void Default(seParams &params) const override
    {
        FreqInfo *freqinfo = params.freqinfo;
        trackallocate(params, Description, freqinfo->freqVec, freqinfo->Nfreq);
        freqinfo->freqVec[0] = RL(1.0);
        freqinfo->freqVec[1] = RL(100.0);
        freqinfo->freqVec[2] = SubTabMarker;
        SubTab(freqinfo->freqVec, freqinfo->Nfreq, false);
    }
    virtual void Read(seParams &params, LDIFile &ENVFile) const override
    {
        FreqInfo *freqinfo = params.freqinfo;
        LIST(ENVFile);
        ENVFile.Read(freqinfo->Spacing);
        ENVFile.Read(freqinfo->Nfreq);
        if(freqinfo->Nfreq <= 0) {
            EXTERR("FreqVec: Number of %s must be positive", Description);
        }
        trackallocate(
            params, Description, freqinfo->freqVec, std::max(3, freqinfo->Nfreq));
        freqinfo->freqVec[1] = SubTabMarker;
        freqinfo->freqVec[2] = SubTabMarker;
        LIST(ENVFile);
        ENVFile.Read(freqinfo->freqVec, freqinfo->Nfreq);
        SubTab(freqinfo->freqVec, freqinfo->Nfreq, freqinfo->Spacing == 'L');
    }
    void ExtSetup(seParams &params, int32_t Nfreq) const
    {
        params.freqinfo->Nfreq = Nfreq;
        trackallocate(
            params, Description, params.freqinfo->freqVec, params.freqinfo->Nfreq);
    }
    virtual void Validate(seParams &params) const override
    {
        if(params.freqinfo->Spacing != ' ' && params.freqinfo->Spacing != 'L') {
            EXTERR(
                "FreqVec: Unknown frequency spacing '%c' (L log, blank linear)",
                params.freqinfo->Spacing);
        }
        ValidateVector(
            params, params.freqinfo->freqVec, params.freqinfo->Nfreq, Description);
    }
    virtual void Echo(seParams &params) const override
    {
        EchoVectorWDescr(
            params, params.freqinfo->freqVec, params.freqinfo->Nfreq, RL(1.0),
            Description, Units);
    }
    virtual void Finalize(seParams &params) const override
    {
        trackdeallocate(params, params.freqinfo->freqVec);
    }

private:
    constexpr static const char *Description = "Frequencies";
    constexpr static const char *Units       = "kHz";
};

}} // namespace seaecho::module
