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
 * Faran (1951) elastic solid sphere, backscatter form function in the
 * notation of Hickling (1962). Used for calibration spheres; the material
 * comes from the solid material catalog.
 */
class ElasticSphere : public ScatteringModel {
public:
    ElasticSphere() {}
    virtual ~ElasticSphere() {}

    virtual const char *Name() const override { return "Elastic_Sphere"; }
    virtual char Kind() const override { return 'S'; }
    virtual real Sigma(const ScatterInput &in, ErrState *errState) const override;
};

}} // namespace seaecho::model
