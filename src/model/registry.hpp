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
#include "scatmodel.hpp"

namespace seaecho { namespace model {

/**
 * All available models, looked up by name. Construct one where it is
 * needed; it owns the model objects.
 */
class ModelRegistry {
public:
    ModelRegistry();
    ~ModelRegistry();

    /// Exact (case-sensitive) name match, or nullptr
    const ScatteringModel *Find(const char *name) const;
    /// Space-separated list of the model names, for error messages
    std::string Names() const;

    const std::vector<ScatteringModel *> &list() const { return models; }

private:
    std::vector<ScatteringModel *> models;
};

}} // namespace seaecho::model
