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
#include "common_setup.hpp"
#include "seawater.hpp"
#include "attenuation.hpp"
#include "gas.hpp"
#include "material.hpp"

#include "module/paramsmodule.hpp"
#include "module/title.hpp"
#include "module/environment.hpp"
#include "module/scatterer.hpp"
#include "module/diamvec.hpp"
#include "module/freqvec.hpp"
#include "module/modelset.hpp"

#include "mode/sweep.hpp"
#include "model/registry.hpp"

namespace seaecho {

namespace module {

/// In the order the parameters appear in the env file
class ModulesList {
public:
    ModulesList()
    {
        modules.push_back(new Title());
        modules.push_back(new Environment());
        modules.push_back(new Scatterer());
        modules.push_back(new DiamVec());
        modules.push_back(new FreqVec());
        modules.push_back(new ModelSet());
    }
    ~ModulesList()
    {
        for(auto *module : modules) delete module;
    }

    const std::vector<ParamsModule *> &list() const { return modules; }

private:
    std::vector<ParamsModule *> modules;
};

} // namespace module

////////////////////////////////////////////////////////////////////////////////

bool setup(const seInit &init, seParams &params, seOutputs &outputs)
{
    params.internal = nullptr;
    params.env      = nullptr;
    params.scat     = nullptr;
    params.freqinfo = nullptr;
    params.models   = nullptr;
    outputs.tsinfo  = nullptr;
    try {
        params.internal = new seInternal(init);

        Stopwatch sw(GetInternal(params));
        sw.tick();

        if(GetInternal(params)->maxMemory < 8000000u) {
            EXTERR(
                "%zu bytes is an unreasonably small amount of memory to "
                "ask " SEAECHO_PROGRAMNAME " to limit itself to",
                GetInternal(params)->maxMemory);
        }

        // Allocate main structs
        trackallocate(params, "data structures", params.env);
        trackallocate(params, "data structures", params.scat);
        trackallocate(params, "data structures", params.freqinfo);
        trackallocate(params, "data structures", params.models);
        trackallocate(params, "data structures", outputs.tsinfo);

        module::ModulesList modules;
        mode::Sweep sweep;
        for(auto *m : modules.list()) m->Init(params);
        sweep.Init(outputs);

        if(GetInternal(params)->noEnvFil) {
            for(auto *m : modules.list()) {
                m->SetupPre(params);
                m->Default(params);
                m->SetupPost(params);
            }
            for(auto *m : modules.list()) { m->Validate(params); }
        } else {
            PrintFileEmu &PRTFile = GetInternal(params)->PRTFile;
            PRTFile << SEAECHO_PROGRAMNAME << "\n\n";

            // Open the environmental file
            LDIFile ENVFile(GetInternal(params), GetInternal(params)->FileRoot + ".env");
            if(!ENVFile.Good()) {
                PRTFile << "ENVFile = " << GetInternal(params)->FileRoot << ".env\n";
                EXTERR(SEAECHO_PROGRAMNAME
                       " - ReadEnvironment: Unable to open the environmental file");
            }

            for(auto *m : modules.list()) {
                m->SetupPre(params);
                m->Read(params, ENVFile);
                m->SetupPost(params);
            }
            for(auto *m : modules.list()) {
                m->Validate(params);
                m->Echo(params);
            }
        }

        sw.tock("setup");
    } catch(const std::exception &e) {
        EXTWARN("Exception caught in seaecho::setup(): %s\n", e.what());
        return false;
    }

    return true;
}

bool echo(seParams &params)
{
    try {
        module::ModulesList modules;
        for(auto *m : modules.list()) {
            m->Validate(params);
            m->Echo(params);
        }
    } catch(const std::exception &e) {
        EXTWARN("Exception caught in seaecho::echo(): %s\n", e.what());
        return false;
    }

    return true;
}

bool run(seParams &params, seOutputs &outputs)
{
    try {
        Stopwatch sw(GetInternal(params));

        sw.tick();
        module::ModulesList modules;
        for(auto *m : modules.list()) m->Validate(params);
        for(auto *m : modules.list()) m->Preprocess(params);
        mode::Sweep sweep;
        sweep.Preprocess(params, outputs);
        sw.tock("Preprocess");

        sw.tick();
        sweep.Run(params, outputs);
        sw.tock("RunSweep");
    } catch(const std::exception &e) {
        if(outputs.tsinfo != nullptr) mode::DeallocateResults(params, outputs.tsinfo);
        EXTWARN("Exception caught in seaecho::run(): %s\n", e.what());
        return false;
    }

    return true;
}

bool writeout(const seParams &params, const seOutputs &outputs, const char *FileRoot)
{
    try {
        Stopwatch sw(GetInternal(params));
        sw.tick();
        if(FileRoot != nullptr) { GetInternal(params)->FileRoot = FileRoot; }
        mode::Sweep sweep;
        sweep.Writeout(params, outputs);
        sw.tock("writeout");
    } catch(const std::exception &e) {
        EXTWARN("Exception caught in seaecho::writeout(): %s\n", e.what());
        return false;
    }
    return true;
}

int32_t export_numrows(const seParams &, const seOutputs &outputs)
{
    return mode::GetNumRows(outputs);
}

bool export_row(const seParams &params, const seOutputs &outputs, int32_t i, TSRow &row)
{
    try {
        mode::GetRow(params, outputs, i, row);
    } catch(const std::exception &e) {
        EXTWARN("Exception caught in seaecho::export_row(): %s\n", e.what());
        return false;
    }
    return true;
}

////////////////////////////////////////////////////////////////////////////////

void finalize(seParams &params, seOutputs &outputs)
{
    if(params.internal == nullptr) return;

    module::ModulesList modules;
    mode::Sweep sweep;
    // All five are allocated before any module is initialized
    if(outputs.tsinfo != nullptr) {
        for(auto *m : modules.list()) m->Finalize(params);
        sweep.Finalize(params, outputs);
    }

    trackdeallocate(params, params.env);
    trackdeallocate(params, params.scat);
    trackdeallocate(params, params.freqinfo);
    trackdeallocate(params, params.models);
    trackdeallocate(params, outputs.tsinfo);

    if(GetInternal(params)->usedMemory != 0) {
        EXTWARN(
            "Amount of memory leaked: %" PRIu64 " bytes",
            (uint64_t)GetInternal(params)->usedMemory);
    }

    delete GetInternal(params);
    params.internal = nullptr;
}

void extsetup_freqvec(seParams &params, int32_t Nfreq)
{
    module::FreqVec pm;
    pm.ExtSetup(params, Nfreq);
}

void extsetup_diamvec(seParams &params, int32_t Ndiam)
{
    module::DiamVec pm;
    pm.ExtSetup(params, Ndiam);
}

void extsetup_models(seParams &params, int32_t NModels)
{
    module::ModelSet pm;
    pm.ExtSetup(params, NModels);
}

////////////////////////////////////////////////////////////////////////////////

SeawaterState DeriveSeawaterState(real T, real z, real S, real pH)
{
    return SeawaterFromTSZ(T, z, S, pH);
}

real AbsorptionCoeff(real f, const SeawaterState &water, char formula)
{
    return VolumeAbsorption(f, water, formula);
}

BubbleState DeriveBubbleState(const SeawaterState &water, const char *species, real d)
{
    const GasSpecies *gas = GetGasSpecies(species);
    if(gas == nullptr) {
        throw std::runtime_error(
            std::string("Unknown gas species ") + (species == nullptr ? "(null)" : species)
            + " (available: " + GasSpeciesList() + ")");
    }
    if(!(d > RL(0.0))) throw std::runtime_error("Bubble diameter must be positive");
    return gas->Derive(water, d);
}

SolidMaterial GetSolidMaterial(const char *name)
{
    const SolidMaterial *mat = FindSolidMaterial(name);
    if(mat == nullptr) {
        throw std::runtime_error(
            std::string("Unknown solid material ") + (name == nullptr ? "(null)" : name)
            + " (available: " + SolidMaterialList() + ")");
    }
    return *mat;
}

static real ComputeTSCommon(
    const char *modelName, char kind, const model::ScatterInput &in)
{
    model::ModelRegistry registry;
    const model::ScatteringModel *m = registry.Find(modelName);
    if(m == nullptr) {
        throw std::runtime_error(
            std::string("Invalid model name ") + (modelName == nullptr ? "(null)" : modelName)
            + " (available: " + registry.Names() + ")");
    }
    if(m->Kind() != kind) {
        throw std::runtime_error(
            std::string("Model ") + modelName + " does not apply to "
            + (kind == 'B' ? "gas bubbles" : "solid spheres"));
    }
    ErrState errState;
    ResetErrState(&errState);
    real ts = m->TS(in, &errState);
    if(!std::isfinite(ts)) RunError(&errState, SEAECHO_ERR_TS_NOT_FINITE);
    // No instance here, so warnings go to stdout; errors throw
    CheckReportErrors(nullptr, &errState);
    return ts;
}

real ComputeTS(const char *modelName, real f, real c, const BubbleState &bubble)
{
    model::ScatterInput in;
    in.f        = f;
    in.c        = c;
    in.water    = &bubble.water;
    in.bubble   = &bubble;
    in.material = nullptr;
    in.a        = bubble.d * RL(0.5);
    return ComputeTSCommon(modelName, 'B', in);
}

real ComputeTS(
    const char *modelName, real f, real c, const SeawaterState &water,
    const SolidMaterial &material, real a)
{
    model::ScatterInput in;
    in.f        = f;
    in.c        = c;
    in.water    = &water;
    in.bubble   = nullptr;
    in.material = &material;
    in.a        = a;
    return ComputeTSCommon(modelName, 'S', in);
}

} // namespace seaecho
