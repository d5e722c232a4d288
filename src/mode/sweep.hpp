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
#include "modemodule.hpp"

namespace seaecho { namespace mode {

/**
 * The TS sweep: every requested model at every (diameter, frequency), with
 * the water and scatterer states derived once up front.
 */
class Sweep : public ModeModule {
public:
    Sweep() {}
    virtual ~Sweep() {}

    virtual void Init(seOutputs &outputs) const override;
    virtual void Preprocess(seParams &params, seOutputs &outputs) const override;
    virtual void Run(seParams &params, seOutputs &outputs) const override;
    virtual void Writeout(const seParams &params, const seOutputs &outputs) const override;
    virtual void Finalize(seParams &params, seOutputs &outputs) const override;
};

/// Frees the result arrays and marks the results invalid
void DeallocateResults(const seParams &params, TSInfo *tsinfo);

/// One row per (model, diameter, frequency), model-major; 0 if no valid results
int32_t GetNumRows(const seOutputs &outputs);

/// Fills row i of the flattened results. Throws if i is out of range.
void GetRow(const seParams &params, const seOutputs &outputs, int32_t i, TSRow &row);

}} // namespace seaecho::mode
