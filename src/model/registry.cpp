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
#include "registry.hpp"
#include "medwinclay.hpp"
#include "breathing.hpp"
#include "resonantbubble.hpp"
#include "ainslieleighton.hpp"
#include "modal.hpp"
#include "elasticsphere.hpp"

namespace seaecho { namespace model {

ModelRegistry::ModelRegistry()
{
    models.push_back(new MedwinClay());
    models.push_back(new Breathing());
    models.push_back(new Thuraisingham());
    models.push_back(new Modal());
    models.push_back(new WildtMedwin());
    models.push_back(new AndreevaWeston());
    models.push_back(new AinslieLeighton());
    models.push_back(new ElasticSphere());
}

ModelRegistry::~ModelRegistry()
{
    for(auto *m : models) delete m;
}

const ScatteringModel *ModelRegistry::Find(const char *name) const
{
    if(name == nullptr) return nullptr;
    for(auto *m : models) {
        if(strcmp(m->Name(), name) == 0) return m;
    }
    return nullptr;
}

std::string ModelRegistry::Names() const
{
    std::string ret;
    for(auto *m : models) {
        if(!ret.empty()) ret += " ";
        ret += m->Name();
    }
    return ret;
}

}} // namespace seaecho::model
