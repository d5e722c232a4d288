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

#define _USE_MATH_DEFINES 1 // must be before anything which includes math.h
#include <math.h>

#define _SEAECHO_INCLUDED_ 1
#include "platform.hpp"
#include "math.hpp"
#include "structs.hpp"
#undef _SEAECHO_INCLUDED_

namespace seaecho {

/**
 * NOTE: If you are on Windows and writing a program which will link to the
 * seaecho DLL, you must define SEAECHO_DLL_IMPORT before including this header.
 *
 * Main setup from an environment file. Call this to create and initialize the
 * params. You may modify the params after calling this and before calling
 * run().
 *
 * You may use multiple instances of seaecho within the same process by calling
 * this (and the other functions below) with different params and outputs;
 * there are no global variables in the library.
 *
 * init: Initialization parameters. See the documentation of each of the members
 * of the struct for more info.
 *
 * params, outputs: Just create uninitialized structs and pass them in to be
 * initialized. You may modify params after setup.
 *
 * returns: false if an error occurred, true if no errors.
 */
SEAECHO_API bool setup(const seInit &init, seParams &params, seOutputs &outputs);

/*
 * You can modify params as desired before run, with one restriction: you must
 * not allocate or deallocate any of the arrays within params yourself. If you
 * need to change their size, use the functions below and then fill in the
 * data.
 *
 * Frequencies are always in kHz. They need not be monotonic; results come back
 * in the order you give them. Diameters are in meters unless you set
 * params.scat->diamInMM, in which case they are converted to meters (and the
 * flag cleared) by run().
 */

/// Reallocate the frequency vector (kHz) to the given size.
SEAECHO_API void extsetup_freqvec(seParams &params, int32_t Nfreq);
/// Reallocate the scatterer diameter vector to the given size.
SEAECHO_API void extsetup_diamvec(seParams &params, int32_t Ndiam);
/**
 * Reallocate the list of model names to the given size. After calling this,
 * write the NUL-terminated model names into params.models->names[i].s.
 */
SEAECHO_API void extsetup_models(seParams &params, int32_t NModels);

/**
 * Validates the state of params and writes a summary of the state to the
 * print file or callback. This is done automatically as part of setup() if you
 * started from an environment file, but if you started from defaults and then
 * wrote your own data in, you might want to check whether that data is
 * correct. (The validation step is also performed as part of run().)
 */
SEAECHO_API bool echo(seParams &params);

/**
 * Evaluates every requested model for every (diameter, frequency) pair and
 * places the results in outputs.tsinfo. Results are index-aligned with the
 * frequency and diameter vectors and do not depend on the number of threads.
 * If anything fails, no results are kept.
 *
 * returns: false if an error occurred, true if no errors.
 */
SEAECHO_API bool run(seParams &params, seOutputs &outputs);

/**
 * Write the results of the past run as a CSV table (one row per model,
 * diameter, and frequency) to FileRoot.csv. You can pass nullptr for FileRoot
 * to write next to the environment file.
 *
 * returns: false if an error occurred, true if no errors.
 */
SEAECHO_API bool writeout(
    const seParams &params, const seOutputs &outputs, const char *FileRoot);

/**
 * Flattened view of the results, for use by your own exporters. Rows are
 * ordered by model, then diameter, then frequency. export_numrows() returns 0
 * if there are no valid results.
 */
SEAECHO_API int32_t export_numrows(const seParams &params, const seOutputs &outputs);
SEAECHO_API bool export_row(
    const seParams &params, const seOutputs &outputs, int32_t i, TSRow &row);

/**
 * Frees memory. You may call run() many times (with changed parameters), you do
 * not have to call setup - run - finalize every time.
 */
SEAECHO_API void finalize(seParams &params, seOutputs &outputs);

////////////////////////////////////////////////////////////////////////////////
// Standalone physics
////////////////////////////////////////////////////////////////////////////////

/*
 * These do not need setup(). They throw std::runtime_error for unknown names.
 */

/// Seawater state at temperature T (deg C), depth z (m), salinity S (psu).
SEAECHO_API SeawaterState DeriveSeawaterState(real T, real z, real S, real pH = 8);
/// Volume absorption (dB/km) at frequency f (kHz); formula as EnvInfo::AbsorptionOpt.
SEAECHO_API real AbsorptionCoeff(real f, const SeawaterState &water, char formula = 'A');
/// Bubble of the given gas species ("AIR", "METHANE") and diameter (m).
SEAECHO_API BubbleState DeriveBubbleState(
    const SeawaterState &water, const char *species, real d);
/// Catalog lookup, e.g. "TUNGSTENCARBIDE", "COPPER", "ALUMINUM", "STAINLESS".
SEAECHO_API SolidMaterial GetSolidMaterial(const char *name);
/**
 * TS (dB) of a bubble or a solid sphere of radius a (m) at frequency f (kHz)
 * with sound speed c (m/s), using the named model. Non-fatal warnings from the
 * model (e.g. ka > 1) are printed to stdout. Throws std::runtime_error if the
 * TS comes out NaN or infinite.
 */
SEAECHO_API real ComputeTS(
    const char *modelName, real f, real c, const BubbleState &bubble);
SEAECHO_API real ComputeTS(
    const char *modelName, real f, real c, const SeawaterState &water,
    const SolidMaterial &material, real a);

} // namespace seaecho
