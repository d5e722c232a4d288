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

#include <cstdint>
#include <cstddef>

namespace seaecho {

constexpr int32_t MaxNameLen = 32;

////////////////////////////////////////////////////////////////////////////////
// Environment
////////////////////////////////////////////////////////////////////////////////

/**
 * Seawater properties derived from (T, z, S). Produced by
 * DeriveSeawaterState() and never modified afterwards.
 */
struct SeawaterState {
    real T;     // temperature (deg C)
    real z;     // depth (m)
    real S;     // salinity (psu)
    real pH;
    real rho;   // density (kg/m^3)
    real c;     // sound speed (m/s)
    real mu;    // dynamic viscosity (Pa s)
    real nu;    // kinematic viscosity (m^2/s)
    real P;     // absolute hydrostatic pressure (Pa)
    real Pv;    // vapor pressure (Pa)
    real sigma; // surface tension (N/m)
    real cp;    // specific heat (J/(kg K))
};

struct EnvInfo {
    real T, S, z, pH;
    /// Volume absorption formula:
    /// 'A' Ainslie & McColm, 'F' Francois-Garrison, 'T' Thorp
    char AbsorptionOpt;
};

////////////////////////////////////////////////////////////////////////////////
// Scatterers
////////////////////////////////////////////////////////////////////////////////

/**
 * Gas bubble at depth. Holds its own copy of the seawater state it was
 * derived from.
 */
struct BubbleState {
    real d;     // diameter (m)
    real Pg;    // internal gas pressure (Pa)
    real rho;   // gas density at depth (kg/m^3)
    real rho_0; // gas density at 20 deg C, 1 atm (kg/m^3)
    real gamma; // ratio of specific heats
    real Mm;    // molar mass (kg/mol)
    real Cp;    // specific heat at constant pressure (kJ/(kg K))
    real K_th;  // thermal conductivity (W/(m K))
    SeawaterState water;
};

struct SolidMaterial {
    const char *name;
    real rho;     // density (kg/m^3)
    real c_lon;   // longitudinal (compressional) sound speed (m/s)
    real c_trans; // transverse (shear) sound speed (m/s)
};

struct ScattererInfo {
    /// 'B' gas bubble, 'S' solid sphere
    char Kind;
    /// Gas species (bubbles) or material (solid spheres), upper case
    char Name[MaxNameLen];
    int32_t Ndiam;
    real *diamVec;
    bool diamInMM; // diamVec in mm, will be automatically converted to m
};

////////////////////////////////////////////////////////////////////////////////
// Sweep
////////////////////////////////////////////////////////////////////////////////

struct FreqInfo {
    /// Subtabulation of the frequency vector when read from the env file:
    /// 'L' logarithmic, anything else linear
    char Spacing;
    int32_t Nfreq;
    real *freqVec; // kHz, in the order the results will be returned
};

struct ModelName {
    char s[MaxNameLen];
};

struct ModelInfo {
    int32_t NModels;
    ModelName *names;
};

////////////////////////////////////////////////////////////////////////////////
// Results
////////////////////////////////////////////////////////////////////////////////

/**
 * Sweep results. Arrays are only allocated and valid after a successful
 * run(); a failed run leaves them deallocated with valid == false.
 */
struct TSInfo {
    int32_t NModels, Ndiam, Nfreq;
    real *ka;    // [idiam * Nfreq + ifreq]
    real *ts;    // [(imodel * Ndiam + idiam) * Nfreq + ifreq], dB re 1 m^2
    real *alpha; // [ifreq], volume absorption (dB/km)
    real c;      // sound speed used for the sweep (m/s)
    SeawaterState water;
    BubbleState *bubbles; // [idiam], bubble runs only
    SolidMaterial material; // solid sphere runs only
    bool valid;
};

/**
 * One row of the flattened result table. model points into the params and
 * is valid until finalize().
 */
struct TSRow {
    real frequency_kHz;
    real TS_dB;
    const char *model;
    real diameter_m;
    real ka;
    real absorption_dBkm;
    real temperature_C;
    real salinity_psu;
    real depth_m;
    real soundspeed_mps;
    real density_kgm3;
};

////////////////////////////////////////////////////////////////////////////////
// Main structs
////////////////////////////////////////////////////////////////////////////////

struct seInit {
    /// Number of worker threads to run. -1 means "all logical cores".
    int32_t numThreads = -1;
    /// Maximum amount of memory (in bytes) this instance should use.
    size_t maxMemory = 4ull * 1024ull * 1024ull * 1024ull; // 4 GiB
    /**
     * If not null: Relative path to the environment file, without the .env
     * extension, e.g. path/to/bubble2mm for path/to/bubble2mm.env. The print
     * file and the CSV results are written next to it. The string is copied
     * internally and may be deleted by the caller after setup() returns.
     *
     * If null: Sets up a 2 mm air bubble in 10 deg C, 35 psu water at 100 m,
     * swept over 1-100 kHz with the Medwin_Clay model. prtCallback must not
     * be null in this case, because there is nowhere to put a print file.
     */
    const char *FileRoot = nullptr;
    /**
     * prtCallback receives the print file contents (echo of the inputs),
     * one line at a time. outputCallback receives terminal messages:
     * warnings, timing, and error text. If prtCallback is nullptr, a *.prt
     * file is created; if outputCallback is nullptr, messages go to stdout.
     *
     * Callbacks may be invoked from several instances in parallel if you run
     * several instances on different threads, so they must be thread-safe in
     * that case. The message is freed when the callback returns; copy it if
     * you need to keep it.
     */
    void (*prtCallback)(const char *message) = nullptr;
    /// See documentation for prtCallback above.
    void (*outputCallback)(const char *message) = nullptr;
};

struct seParams {
    char Title[80];
    EnvInfo *env;
    ScattererInfo *scat;
    FreqInfo *freqinfo;
    ModelInfo *models;
    /// Pointer to internal data structure for program (non-physics) state.
    void *internal;
};

struct seOutputs {
    TSInfo *tsinfo;
};

} // namespace seaecho
