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
#include "common.hpp"

namespace seaecho {

// Spherical Bessel functions of the first (j) and second (y) kind, and their
// first derivatives via the recurrence
//     f'_n(x) = f_{n-1}(x) - (n+1)/x f_n(x),   f'_0(x) = -f_1(x)

inline real SphJ(int32_t n, real x) { return std::sph_bessel((unsigned)n, x); }
inline real SphY(int32_t n, real x) { return std::sph_neumann((unsigned)n, x); }

inline real SphJd(int32_t n, real x)
{
    if(n == 0) return -SphJ(1, x);
    return SphJ(n - 1, x) - (real)(n + 1) / x * SphJ(n, x);
}

inline real SphYd(int32_t n, real x)
{
    if(n == 0) return -SphY(1, x);
    return SphY(n - 1, x) - (real)(n + 1) / x * SphY(n, x);
}

/// Second derivative of j_n, from the spherical Bessel equation
inline real SphJdd(int32_t n, real x)
{
    return -RL(2.0) / x * SphJd(n, x) - (RL(1.0) - (real)(n * (n + 1)) / SQ(x)) * SphJ(n, x);
}

/// Number of partial waves for a series with the largest argument xmax
inline int32_t NumPartialWaves(real xmax) { return (int32_t)xmax + 10; }

} // namespace seaecho
