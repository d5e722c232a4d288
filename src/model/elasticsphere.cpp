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
#include "elasticsphere.hpp"
#include "../sphbessel.hpp"

namespace seaecho { namespace model {

constexpr real ElasticConvergenceTol = RL(1e-6);

real ElasticSphere::Sigma(const ScatterInput &in, ErrState *errState) const
{
    const SolidMaterial &mat = *in.material;
    real omega               = AngularFreq(in.f);
    real x                   = omega / in.c * in.a;        // ka in water
    real x1                  = omega / mat.c_lon * in.a;   // compressional
    real x2                  = omega / mat.c_trans * in.a; // shear
    // lambda / (2 mu) of the sphere, from the two wave speeds
    real lam2mu = (SQ(mat.c_lon) - RL(2.0) * SQ(mat.c_trans)) / (RL(2.0) * SQ(mat.c_trans));
    real rhoratio = in.water->rho / mat.rho;

    int32_t nmax = NumPartialWaves(std::max(x, std::max(x1, x2)));
    cpx sum(RL(0.0), RL(0.0)), term(RL(0.0), RL(0.0));
    for(int32_t n = 0; n <= nmax; ++n) {
        real nn  = (real)(n * (n + 1));
        real j1  = SphJ(n, x1), j1d = SphJd(n, x1), j1dd = SphJdd(n, x1);
        real j2  = SphJ(n, x2), j2d = SphJd(n, x2), j2dd = SphJdd(n, x2);
        real A   = x1 * j1d - j1;
        real B   = (nn - RL(2.0)) * j2 + SQ(x2) * j2dd;
        real num = x1 * j1d / A - RL(2.0) * nn * j2 / B;
        real den = SQ(x1) * (lam2mu * j1 - j1dd) / A - RL(2.0) * nn * (j2 - x2 * j2d) / B;
        real F_n = rhoratio * SQ(x2) * RL(0.5) * num / den;

        real j = SphJ(n, x), jd = SphJd(n, x);
        cpx hn(j, SphY(n, x)), hnd(jd, SphYd(n, x));
        cpx b_n = -(F_n * j - x * jd) / (F_n * hn - x * hnd);
        if(!std::isfinite(b_n.real()) || !std::isfinite(b_n.imag())) continue;
        real sign = (n % 2 == 0) ? RL(1.0) : RL(-1.0);
        term      = sign * (real)(2 * n + 1) * b_n;
        sum += term;
    }
    if(std::abs(term) > ElasticConvergenceTol * std::abs(sum)) {
        RunWarning(errState, SEAECHO_WARN_MODAL_NOT_CONVERGED);
    }

    real f_inf = RL(2.0) / x * std::abs(sum);
    return SQ(in.a) * SQ(f_inf) * RL(0.25);
}

}} // namespace seaecho::model
