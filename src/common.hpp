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

////////////////////////////////////////////////////////////////////////////////
// General headers
////////////////////////////////////////////////////////////////////////////////

#define _USE_MATH_DEFINES 1 // must be before anything which includes math.h
#include <math.h>

#ifdef _MSC_VER
#define NOMINMAX
#include <windows.h>
#endif

#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <cstdio>
#include <cstring>
#include <cinttypes>
#include <cstdarg>
#include <cmath>
#include <chrono>
#include <thread>
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <type_traits>

#define GLM_FORCE_EXPLICIT_CTOR 1
#include <glm/common.hpp>

#define SEAECHO_PROGRAMNAME "seaechots"

////////////////////////////////////////////////////////////////////////////////
// External headers
////////////////////////////////////////////////////////////////////////////////

#include <seaecho/seaecho.hpp>

namespace seaecho {

////////////////////////////////////////////////////////////////////////////////
// Real types
////////////////////////////////////////////////////////////////////////////////

#ifdef SEAECHO_USE_FLOATS
#define REAL_PI ((float)M_PI)
#else
#define REAL_PI M_PI
#endif

// "Real literal"--every floating-point literal in real expressions gets this
// macro so that float builds do not silently promote to double.
#ifdef SEAECHO_USE_FLOATS
#define RL(a) (a##f)
#else
#define RL(a) a
#endif
// "Extended literal", for the xreal resonance correction terms
#ifdef SEAECHO_DOUBLE_CORRECTIONS
#define XL(a) a
#else
#define XL(a) (a##L)
#endif

#define CHECK_REAL_T() \
    static_assert(std::is_floating_point<REAL>::value, "Invalid type for REAL!")

////////////////////////////////////////////////////////////////////////////////
// Misc math
////////////////////////////////////////////////////////////////////////////////

#define SQ(a) ((a) * (a)) // Square
#define CUBE(a) ((a) * (a) * (a))

// Physical constants shared by the environment and scatterer models
constexpr real GravAccel   = RL(9.81);             // m/s^2
constexpr real AtmPressure = RL(1.01e5);           // Pa, as used for Pg and rho_0
constexpr real GasConstant = RL(8.31446261815324); // J/(mol K)
constexpr real KelvinOffset = RL(273.15);

/// TS in dB re 1 m^2 from a backscattering cross-section in m^2
template<typename REAL> inline REAL TSFromSigma(REAL sigma_bs)
{
    CHECK_REAL_T();
    return (REAL)10 * std::log10(sigma_bs);
}

////////////////////////////////////////////////////////////////////////////////
// Indexing
////////////////////////////////////////////////////////////////////////////////

inline int32_t GetNumJobs(const seParams &params)
{
    return params.scat->Ndiam * params.freqinfo->Nfreq;
}

/**
 * Returns whether the job should continue.
 */
inline bool GetJobIndices(
    int32_t &idiam, int32_t &ifreq, int32_t job, const seParams &params)
{
    if(job < 0) return false;
    ifreq = job % params.freqinfo->Nfreq;
    idiam = job / params.freqinfo->Nfreq;
    return idiam < params.scat->Ndiam;
}

inline size_t GetKaAddr(int32_t idiam, int32_t ifreq, const TSInfo *tsinfo)
{
    return (size_t)idiam * (size_t)tsinfo->Nfreq + (size_t)ifreq;
}

inline size_t GetTSAddr(int32_t imodel, int32_t idiam, int32_t ifreq, const TSInfo *tsinfo)
{
    // clang-format off
    return ((size_t)imodel
        * (size_t)tsinfo->Ndiam + (size_t)idiam)
        * (size_t)tsinfo->Nfreq + (size_t)ifreq;
    // clang-format on
}

} // namespace seaecho

#define _SEAECHO_INCLUDING_COMPONENTS_ 1
#include "util/errors.hpp"
#include "util/prtfileemu.hpp"
#include "util/timing.hpp"
#undef _SEAECHO_INCLUDING_COMPONENTS_

namespace seaecho {

////////////////////////////////////////////////////////////////////////////////
// Internal
////////////////////////////////////////////////////////////////////////////////

struct seInternal {
    void (*outputCallback)(const char *message);
    std::string FileRoot;
    PrintFileEmu PRTFile;
    std::atomic<int32_t> sharedJobID;
    int32_t numThreads;
    size_t maxMemory;
    size_t usedMemory;
    bool noEnvFil;

    seInternal(const seInit &init)
        : outputCallback(init.outputCallback),
          FileRoot(
              init.FileRoot == nullptr ? "error_incorrect_use_of_" SEAECHO_PROGRAMNAME
                                       : init.FileRoot),
          PRTFile(this, this->FileRoot, init.prtCallback),
          numThreads(ModifyNumThreads(init.numThreads)), maxMemory(init.maxMemory),
          usedMemory(0), noEnvFil(init.FileRoot == nullptr)
    {}
};

inline seInternal *GetInternal(const seParams &params)
{
    return reinterpret_cast<seInternal *>(params.internal);
}

} // namespace seaecho
