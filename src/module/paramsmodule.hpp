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

namespace seaecho { namespace module {

/**
 * Child classes are responsible for the initialization, defaults, reading,
 * etc. of some set of parameters within params. In addition to the methods
 * here, modules may provide a ExtSetup method to, for example, allocate an
 * array of a given size from the external API. Modules should not contain any
 * member variables.
 */
class ParamsModule {
public:
    ParamsModule() {}
    virtual ~ParamsModule() {}

    /// True one-time initialization, e.g. set pointers to arrays to nullptr.
    virtual void Init(seParams &) const {}
    /// Called before Default or Read for common setup. Sets the defaults
    /// for values which may be omitted from the env file.
    virtual void SetupPre(seParams &) const {}
    /// Set the parameters to some reasonable default values in place of Read.
    virtual void Default(seParams &) const = 0;
    /// Read the parameters from the environment file.
    virtual void Read(seParams &, LDIFile &) const {}
    /// Called after Default or Read for common setup.
    virtual void SetupPost(seParams &) const {}
    /// Check if the parameters are valid values. Throws errors if not.
    virtual void Validate(seParams &) const {}
    /// Writes info about the parameters to the print file emulator.
    virtual void Echo(seParams &) const {}
    /// Modifies the parameters before processing, e.g. mm to m. Module must add
    /// flags to params to track whether this has been done or not.
    virtual void Preprocess(seParams &) const {}
    /// Deallocate memory.
    virtual void Finalize(seParams &) const {}
};

}} // namespace seaecho::module
