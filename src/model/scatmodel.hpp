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
#include "../common.hpp"
#include "../resonance.hpp"

namespace seaecho { namespace model {

/**
 * Everything a model may need for one (frequency, size) evaluation. Only the
 * scatterer matching the model's Kind() is set; the other pointer is null.
 */
struct ScatterInput {
    real f; // kHz
    real c; // m/s
    const SeawaterState *water;
    const BubbleState *bubble;     // 'B' models
    const SolidMaterial *material; // 'S' models
    real a;                        // radius (m)
};

/**
 * A backscattering model. Models should not contain any member variables;
 * they are evaluated concurrently from all workers.
 */
class ScatteringModel {
public:
    ScatteringModel() {}
    virtual ~ScatteringModel() {}

    /// Name as written in the env file and the output
    virtual const char *Name() const = 0;
    /// 'B' gas bubble, 'S' solid sphere
    virtual char Kind() const = 0;
    /// Backscattering cross-section sigma_bs (m^2)
    virtual real Sigma(const ScatterInput &in, ErrState *errState) const = 0;

    /// Target strength (dB re 1 m^2)
    real TS(const ScatterInput &in, ErrState *errState) const
    {
        return TSFromSigma(Sigma(in, errState));
    }
};

inline real AngularFreq(real f_kHz) { return RL(2.0) * REAL_PI * f_kHz * RL(1000.0); }

}} // namespace seaecho::model
