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
#include "../common_setup.hpp"

namespace seaecho { namespace mode {

/**
 * Like ParamsModule, but for outputs, and fewer steps.
 */
class ModeModule {
public:
    ModeModule() {}
    virtual ~ModeModule() {}

    /// Initialization and defaults.
    virtual void Init(seOutputs &) const {}
    /// Preprocessing as part of run.
    virtual void Preprocess(seParams &, seOutputs &) const {}
    /// Run the computation.
    virtual void Run(seParams &, seOutputs &) const = 0;
    /// Postprocess after run is complete.
    virtual void Postprocess(seParams &, seOutputs &) const {}
    /// Write results to disk.
    virtual void Writeout(const seParams &, const seOutputs &) const {}
    /// Deallocate memory.
    virtual void Finalize(seParams &, seOutputs &) const {}
};

}} // namespace seaecho::mode
