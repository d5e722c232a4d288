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
 * Ainslie and Leighton (2011), Eq. 35. Has its own resonance with the
 * radiation-mass correction, and a damping constant with viscous and
 * thermal parts; does not use the Medwin and Clay corrections.
 */
class AinslieLeighton : public ScatteringModel {
public:
    AinslieLeighton() {}
    virtual ~AinslieLeighton() {}

    virtual const char *Name() const override { return "Ainslie_Leighton"; }
    virtual char Kind() const override { return 'B'; }
    virtual real Sigma(const ScatterInput &in, ErrState *errState) const override
    {
        const BubbleState &bubble  = *in.bubble;
        const SeawaterState &water = bubble.water;
        real R                     = in.a;
        real omega                 = AngularFreq(in.f);
        CheckKa(in.f, in.c, R, errState);

        // Minnaert resonance
        real omega_M = std::sqrt(RL(3.0) * bubble.gamma * water.P / water.rho) / R;
        // Viscous and thermal damping
        real D_th   = bubble.K_th / (water.rho * water.cp);
        real beta_0 = RL(2.0) * water.mu / (water.rho * SQ(R))
            + RL(3.0) * (bubble.gamma - RL(1.0)) * D_th / SQ(R);
        // Radiation mass
        real eps_0   = omega_M * R / in.c;
        real omega_0 = omega_M / std::sqrt(RL(1.0) + SQ(eps_0));

        real eps = omega / in.c * R;
        real re  = SQ(omega_0) / SQ(omega) - RL(1.0) - RL(2.0) * beta_0 * eps / omega;
        real im  = RL(2.0) * beta_0 / omega + eps;
        return SQ(R) / (SQ(re) + SQ(im));
    }
};

}} // namespace seaecho::model
