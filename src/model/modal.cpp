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
#include "modal.hpp"
#include "../sphbessel.hpp"

namespace seaecho { namespace model {

// Last partial wave relative to the sum, above which the series is reported
// as not converged
constexpr real ModalConvergenceTol = RL(1e-6);

real Modal::Sigma(const ScatterInput &in, ErrState *errState) const
{
    const BubbleState &bubble = *in.bubble;
    real omega                = AngularFreq(in.f);
    real c_g = std::sqrt(bubble.gamma * bubble.Pg / bubble.rho); // adiabatic
    real k   = omega / in.c;
    real x   = k * in.a;            // ka in water
    real x1  = omega / c_g * in.a;  // ka in the gas
    real g   = bubble.rho / bubble.water.rho;
    real h   = c_g / in.c;
    real gh  = g * h;

    int32_t nmax = NumPartialWaves(std::max(x, x1));
    cpx sum(RL(0.0), RL(0.0)), term(RL(0.0), RL(0.0));
    for(int32_t n = 0; n <= nmax; ++n) {
        real r1  = SphJd(n, x1) / SphJ(n, x1);
        real jd  = SphJd(n, x);
        real C_n = (r1 * SphY(n, x) / jd - gh * SphYd(n, x) / jd)
            / (r1 * SphJ(n, x) / jd - gh);
        // Argument at a zero of j_n or j'_n: the term is indeterminate
        if(!std::isfinite(C_n)) continue;
        real sign = (n % 2 == 0) ? RL(1.0) : RL(-1.0);
        term      = cpx(sign * (real)(2 * n + 1), RL(0.0)) / cpx(RL(1.0), C_n);
        sum += term;
    }
    if(std::abs(term) > ModalConvergenceTol * std::abs(sum)) {
        RunWarning(errState, SEAECHO_WARN_MODAL_NOT_CONVERGED);
    }

    cpx f_bs = cpx(RL(0.0), -RL(1.0) / k) * sum;
    return std::norm(f_bs);
}

}} // namespace seaecho::model
