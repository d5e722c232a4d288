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

#ifndef _SEAECHO_INCLUDING_COMPONENTS_
#error "Must be included from common.hpp!"
#endif

namespace seaecho {

struct seInternal;

/**
 * Errors and warnings raised inside the sweep workers. Workers only set bits
 * and bump counts; the coordinator reports them once all workers are done.
 */
struct ErrState {
    std::atomic<uint32_t> error, warning, errCount, warnCount;
};

[[noreturn]] extern void ExternalError(seInternal *internal, const char *format, ...);
extern void ExternalWarning(seInternal *internal, const char *format, ...);
#define EXTERR(...) ExternalError(GetInternal(params), __VA_ARGS__)
#define EXTWARN(...) ExternalWarning(GetInternal(params), __VA_ARGS__)

inline void RunError(ErrState *errState, uint32_t code)
{
    errState->errCount.fetch_add(1u, std::memory_order_relaxed);
    errState->error.fetch_or(1u << code, std::memory_order_release);
}
inline void RunWarning(ErrState *errState, uint32_t code)
{
    errState->warnCount.fetch_add(1u, std::memory_order_relaxed);
    errState->warning.fetch_or(1u << code, std::memory_order_relaxed);
}
inline bool HasErrored(ErrState *errState)
{
    return errState->error.load(std::memory_order_acquire) != 0u;
}
inline bool HasWarned(ErrState *errState, uint32_t code)
{
    return (errState->warning.load(std::memory_order_acquire) & (1u << code)) != 0u;
}
inline void ResetErrState(ErrState *errState)
{
    errState->error     = 0u;
    errState->warning   = 0u;
    errState->errCount  = 0u;
    errState->warnCount = 0u;
}
extern void CheckReportErrors(seInternal *internal, const ErrState *errState);

#define SEAECHO_ERR_JOBNUM 0
#define SEAECHO_ERR_TS_NOT_FINITE 1
#define SEAECHO_ERR_WORKER_EXCEPTION 2
#define SEAECHO_ERR_MAX 3

#define SEAECHO_WARN_KA_GT_1 0
#define SEAECHO_WARN_CORRECTION_FALLBACK 1
#define SEAECHO_WARN_MODAL_NOT_CONVERGED 2
#define SEAECHO_WARN_MAX 3

} // namespace seaecho
