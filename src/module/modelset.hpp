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
#include "../common_setup.hpp"
#include "../model/registry.hpp"
#include "paramsmodule.hpp"

namespace seaecho { namespace module {

/**
 * Names of the scattering models to evaluate. Every name must be known to
 * the model registry and match the scatterer kind.
 */
class ModelSet : public ParamsModule {
public:
    ModelSet() {}
    virtual ~ModelSet() {}

    virtual void Init(seParams &params) const override { params.models->names = nullptr; }
    virtual void SetupPre(seParams &params) const override { params.models->NModels = 1; }
    virtual void Default(seParams &params) const override
    {
        trackallocate(params, Description, params.models->names, params.models->NModels);
        SetName(params.models->names[0].s, "Medwin_Clay");
    }
    virtual void Read(seParams &params, LDIFile &ENVFile) const override
    {
        ModelInfo *models = params.models;
        LIST(ENVFile);
        ENVFile.Read(models->NModels);
        if(models->NModels <= 0) {
            EXTERR("ModelSet: Number of %s must be positive", Description);
        }
        trackallocate(params, Description, models->names, models->NModels);
        LIST(ENVFile);
        for(int32_t i = 0; i < models->NModels; ++i) {
            std::string name;
            ENVFile.Read(name);
            SetName(models->names[i].s, trim_copy(name));
        }
    }
    void ExtSetup(seParams &params, int32_t NModels) const
    {
        params.models->NModels = NModels;
        trackallocate(params, Description, params.models->names, NModels);
        for(int32_t i = 0; i < NModels; ++i) params.models->names[i].s[0] = 0;
    }
    virtual void Validate(seParams &params) const override
    {
        const ModelInfo *models = params.models;
        if(models->NModels <= 0 || models->names == nullptr) {
            EXTERR("ModelSet: No models requested");
        }
        model::ModelRegistry registry;
        std::string unknown, mismatched;
        for(int32_t i = 0; i < models->NModels; ++i) {
            const char *name                = models->names[i].s;
            const model::ScatteringModel *m = registry.Find(name);
            if(m != nullptr && m->Kind() == params.scat->Kind) continue;
            std::string &list = (m == nullptr) ? unknown : mismatched;
            if(!list.empty()) list += " ";
            list += name;
        }
        if(!unknown.empty()) {
            EXTERR(
                "ModelSet: Invalid model name(s): %s (available: %s)", unknown.c_str(),
                registry.Names().c_str());
        }
        if(!mismatched.empty()) {
            EXTERR(
                "ModelSet: Model(s) %s do not apply to %s", mismatched.c_str(),
                params.scat->Kind == 'B' ? "gas bubbles" : "solid spheres");
        }
    }
    virtual void Echo(seParams &params) const override
    {
        PrintFileEmu &PRTFile = GetInternal(params)->PRTFile;
        PRTFile << "\n   Models\n";
        for(int32_t i = 0; i < params.models->NModels; ++i) {
            PRTFile << "   " << params.models->names[i].s << "\n";
        }
    }
    virtual void Finalize(seParams &params) const override
    {
        trackdeallocate(params, params.models->names);
    }

private:
    constexpr static const char *Description = "Models";
};

}} // namespace seaecho::module
