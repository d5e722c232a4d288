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

#ifndef _SEAECHO_INCLUDING_COMPONENTS_
#error "Must be included from common.hpp!"
#endif

namespace seaecho {

/// Per-worker thread setup; names the thread "seaecho-w<N>" where supported.
void SetupThread(int32_t worker);

inline int32_t ModifyNumThreads(int32_t numThreads)
{
    if(numThreads >= 1) return numThreads;
    numThreads = std::thread::hardware_concurrency();
    if(numThreads < 1) numThreads = 1;
    return numThreads;
}

class Stopwatch {
public:
    Stopwatch(seInternal *internal_) : internal(internal_) {}
    inline void tick() { tstart = std::chrono::steady_clock::now(); }
    inline void tock(const char *label)
    {
        using namespace std::chrono;
        steady_clock::time_point tend = steady_clock::now();
        double dt = duration_cast<duration<double, std::milli>>(tend - tstart).count();
        ExternalWarning(internal, "%s: %f ms", label, dt);
    }

private:
    seInternal *internal;
    std::chrono::steady_clock::time_point tstart;
};

} // namespace seaecho
