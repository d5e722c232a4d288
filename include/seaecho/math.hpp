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

#ifndef _SEAECHO_INCLUDED_
#error "This file must be included via #include <seaecho/seaecho.hpp>!"
#endif

#include <cfloat>
#include <complex>

#define GLM_FORCE_EXPLICIT_CTOR 1
#include <glm/vec3.hpp>

namespace seaecho {

#ifdef SEAECHO_USE_FLOATS
using real = float;
#else
using real = double;
#endif

/**
 * Precision used for the hyperbolic/trigonometric resonance correction terms.
 * For large bubbles at high frequency the correction parameter X reaches
 * several hundred and sinh/cosh overflow in double, so by default these are
 * evaluated in long double. Defining SEAECHO_DOUBLE_CORRECTIONS drops them to
 * double; overflowed corrections then come out as NaN and take the
 * uncorrected-resonance fallback.
 */
#ifdef SEAECHO_DOUBLE_CORRECTIONS
using xreal = double;
#else
using xreal = long double;
#endif

using vec3 = glm::vec<3, real, glm::defaultp>;

using cpx = std::complex<real>;

} // namespace seaecho
