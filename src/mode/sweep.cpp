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
#include "sweep.hpp"
#include "../seawater.hpp"
#include "../attenuation.hpp"
#include "../gas.hpp"
#include "../material.hpp"
#include "../model/registry.hpp"

#include <exception>
#include <functional>

namespace seaecho { namespace mode {

using ModelVec = std::vector<const model::ScatteringModel *>;

void DeallocateResults(const seParams &params, TSInfo *tsinfo)
{
    trackdeallocate(params, tsinfo->ka);
    trackdeallocate(params, tsinfo->ts);
    trackdeallocate(params, tsinfo->alpha);
    trackdeallocate(params, tsinfo->bubbles);
    tsinfo->valid = false;
}

void Sweep::Init(seOutputs &outputs) const
{
    TSInfo *tsinfo   = outputs.tsinfo;
    tsinfo->NModels  = 0;
    tsinfo->Ndiam    = 0;
    tsinfo->Nfreq    = 0;
    tsinfo->ka       = nullptr;
    tsinfo->ts       = nullptr;
    tsinfo->alpha    = nullptr;
    tsinfo->bubbles  = nullptr;
    tsinfo->material = SolidMaterial{nullptr, RL(0.0), RL(0.0), RL(0.0)};
    tsinfo->c        = RL(0.0);
    tsinfo->valid    = false;
}

void Sweep::Preprocess(seParams &params, seOutputs &outputs) const
{
    TSInfo *tsinfo            = outputs.tsinfo;
    const ScattererInfo *scat = params.scat;
    const EnvInfo *env        = params.env;
    DeallocateResults(params, tsinfo);

    tsinfo->NModels = params.models->NModels;
    tsinfo->Ndiam   = scat->Ndiam;
    tsinfo->Nfreq   = params.freqinfo->Nfreq;
    tsinfo->water   = SeawaterFromTSZ(env->T, env->z, env->S, env->pH);
    tsinfo->c       = tsinfo->water.c;

    size_t nka = (size_t)tsinfo->Ndiam * (size_t)tsinfo->Nfreq;
    trackallocate(params, "wavenumber-radius products", tsinfo->ka, nka);
    trackallocate(
        params, "target strengths", tsinfo->ts, (size_t)tsinfo->NModels * nka);
    trackallocate(params, "absorption coefficients", tsinfo->alpha, tsinfo->Nfreq);

    for(int32_t ifreq = 0; ifreq < tsinfo->Nfreq; ++ifreq) {
        tsinfo->alpha[ifreq] = VolumeAbsorption(
            params.freqinfo->freqVec[ifreq], tsinfo->water, env->AbsorptionOpt);
    }

    if(scat->Kind == 'B') {
        const GasSpecies *gas = GetGasSpecies(scat->Name);
        if(gas == nullptr) EXTERR("Sweep: Unknown gas species %s", scat->Name);
        trackallocate(params, "bubble states", tsinfo->bubbles, tsinfo->Ndiam);
        for(int32_t idiam = 0; idiam < tsinfo->Ndiam; ++idiam) {
            tsinfo->bubbles[idiam] = gas->Derive(tsinfo->water, scat->diamVec[idiam]);
        }
    } else {
        const SolidMaterial *mat = FindSolidMaterial(scat->Name);
        if(mat == nullptr) EXTERR("Sweep: Unknown solid material %s", scat->Name);
        tsinfo->material = *mat;
    }
}

static void RunJob(
    const seParams &params, TSInfo *tsinfo, const ModelVec &models, int32_t idiam,
    int32_t ifreq, ErrState *errState)
{
    if(idiam >= tsinfo->Ndiam || ifreq >= tsinfo->Nfreq) {
        RunError(errState, SEAECHO_ERR_JOBNUM);
        return;
    }
    model::ScatterInput in;
    in.f        = params.freqinfo->freqVec[ifreq];
    in.c        = tsinfo->c;
    in.water    = &tsinfo->water;
    in.a        = params.scat->diamVec[idiam] * RL(0.5);
    in.bubble   = params.scat->Kind == 'B' ? &tsinfo->bubbles[idiam] : nullptr;
    in.material = params.scat->Kind == 'S' ? &tsinfo->material : nullptr;

    tsinfo->ka[GetKaAddr(idiam, ifreq, tsinfo)] = model::AngularFreq(in.f) / in.c * in.a;
    for(int32_t imodel = 0; imodel < (int32_t)models.size(); ++imodel) {
        real ts = models[imodel]->TS(in, errState);
        if(!std::isfinite(ts)) RunError(errState, SEAECHO_ERR_TS_NOT_FINITE);
        tsinfo->ts[GetTSAddr(imodel, idiam, ifreq, tsinfo)] = ts;
    }
}

static void SweepWorker(
    const seParams &params, TSInfo *tsinfo, const ModelVec &models, int32_t worker,
    ErrState *errState, std::exception_ptr &exc)
{
    SetupThread(worker);
    try {
        while(true) {
            if(HasErrored(errState)) break;
            int32_t job = GetInternal(params)->sharedJobID++;
            int32_t idiam, ifreq;
            if(!GetJobIndices(idiam, ifreq, job, params)) break;
            RunJob(params, tsinfo, models, idiam, ifreq, errState);
        }
    } catch(const std::exception &) {
        exc = std::current_exception();
        RunError(errState, SEAECHO_ERR_WORKER_EXCEPTION);
    }
}

void Sweep::Run(seParams &params, seOutputs &outputs) const
{
    TSInfo *tsinfo = outputs.tsinfo;
    try {
        model::ModelRegistry registry;
        ModelVec models;
        for(int32_t imodel = 0; imodel < params.models->NModels; ++imodel) {
            const model::ScatteringModel *m = registry.Find(params.models->names[imodel].s);
            if(m == nullptr) {
                EXTERR("Sweep: Invalid model name %s", params.models->names[imodel].s);
            }
            models.push_back(m);
        }

        ErrState errState;
        ResetErrState(&errState);
        GetInternal(params)->sharedJobID = 0;
        int32_t numThreads = std::min(GetInternal(params)->numThreads, GetNumJobs(params));
        numThreads         = std::max(numThreads, 1);
        std::vector<std::exception_ptr> excs(numThreads);
        std::vector<std::thread> threads;
        for(int32_t i = 0; i < numThreads; ++i)
            threads.push_back(std::thread(
                SweepWorker, std::cref(params), tsinfo, std::cref(models), i, &errState,
                std::ref(excs[i])));
        for(int32_t i = 0; i < numThreads; ++i) threads[i].join();
        for(auto &exc : excs) {
            if(exc) std::rethrow_exception(exc);
        }
        CheckReportErrors(GetInternal(params), &errState);
    } catch(const std::exception &) {
        DeallocateResults(params, tsinfo);
        throw;
    }
    tsinfo->valid = true;
}

void Sweep::Finalize(seParams &params, seOutputs &outputs) const
{
    DeallocateResults(params, outputs.tsinfo);
}

}} // namespace seaecho::mode
