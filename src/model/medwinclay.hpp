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
#include "scatmodel.hpp"

namespace seaecho { namespace model {

/**
 * Medwin and Clay (1998) Eq. 8.2.29, with the resonance corrected for
 * surface tension and thermal conductivity and the full damping constant.
 * The resonance enters linearly, as (f_R / f - 1)^2.
 */
class MedwinClay : public ScatteringModel {
public:
    MedwinClay() {}
    virtual ~MedwinClay() {}

    virtual const char *Name() const override { return "Medwin_Clay"; }
    virtual char Kind() const override { return 'B'; }
    virtual real Sigma(const ScatterInput &in, ErrState *errState) const override
    {
        EffectiveResonance eff = GetEffectiveResonance(in.f, in.c, *in.bubble, errState);
        return SQ(in.a) / (SQ(eff.f_res / (in.f * RL(1000.0)) - RL(1.0)) + SQ(eff.delta));
    }
};

}} // namespace seaecho::model
