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
 * Bare breathing mode: Minnaert resonance, re-radiation and viscous
 * damping only.
 */
class Breathing : public ScatteringModel {
public:
    Breathing() {}
    virtual ~Breathing() {}

    virtual const char *Name() const override { return "Breathing"; }
    virtual char Kind() const override { return 'B'; }
    virtual real Sigma(const ScatterInput &in, ErrState *errState) const override
    {
        CheckKa(in.f, in.c, in.a, errState);
        real f_b   = BareResonance(*in.bubble);
        real delta = FallbackDamping(in.f, in.c, *in.bubble);
        return SQ(in.a) / (SQ(SQ(f_b / (in.f * RL(1000.0))) - RL(1.0)) + SQ(delta));
    }
};

}} // namespace seaecho::model
