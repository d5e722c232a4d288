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
 * Single-resonance models of the form
 *     sigma = a^2 G(ka) / (((F / f)^2 - 1)^2 + delta^2)
 * with F and delta from the resonance engine. Subclasses supply G.
 */
class ResonantBubbleModel : public ScatteringModel {
public:
    ResonantBubbleModel() {}
    virtual ~ResonantBubbleModel() {}

    virtual char Kind() const override { return 'B'; }
    virtual real Sigma(const ScatterInput &in, ErrState *errState) const override
    {
        EffectiveResonance eff = GetEffectiveResonance(in.f, in.c, *in.bubble, errState);
        real ka = AngularFreq(in.f) / in.c * in.a;
        real denom = SQ(SQ(eff.f_res / (in.f * RL(1000.0))) - RL(1.0)) + SQ(eff.delta);
        return SQ(in.a) * SizeFactor(ka) / denom;
    }

protected:
    virtual real SizeFactor(real ka) const = 0;
};

/// Wildt (1946) / Medwin (1977), no finite-size correction
class WildtMedwin : public ResonantBubbleModel {
public:
    virtual const char *Name() const override { return "Wildt_Medwin"; }

protected:
    virtual real SizeFactor(real) const override { return RL(1.0); }
};

/// Thuraisingham (1997), sinc^2(ka) finite-size correction
class Thuraisingham : public ResonantBubbleModel {
public:
    virtual const char *Name() const override { return "Thuraisingham"; }

protected:
    virtual real SizeFactor(real ka) const override
    {
        if(ka == RL(0.0)) return RL(1.0);
        return SQ(std::sin(ka) / ka);
    }
};

/// Andreeva (1964) / Weston (1967), 1 / (1 + (ka)^2) geometric limit
class AndreevaWeston : public ResonantBubbleModel {
public:
    virtual const char *Name() const override { return "Andreeva_Weston"; }

protected:
    virtual real SizeFactor(real ka) const override { return RL(1.0) / (RL(1.0) + SQ(ka)); }
};

}} // namespace seaecho::model
