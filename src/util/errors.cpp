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
#include "../common.hpp"

namespace seaecho {

#define ERRBUFSIZE 1024

void ExternalCommon(seInternal *internal, const char *format, va_list *args)
{
    char *buf = new char[ERRBUFSIZE];
    vsnprintf(buf, ERRBUFSIZE, format, *args);
    if(internal == nullptr || internal->outputCallback == nullptr) {
        printf("%s\n", buf);
    } else {
        internal->outputCallback(buf);
    }
    delete[] buf;
}

[[noreturn]] void ExternalError(seInternal *internal, const char *format, ...)
{
    va_list args;
    va_start(args, format);
    ExternalCommon(internal, format, &args);
    va_end(args);
    throw std::runtime_error("See previous line(s) above for error message");
}

void ExternalWarning(seInternal *internal, const char *format, ...)
{
    va_list args;
    va_start(args, format);
    ExternalCommon(internal, format, &args);
    va_end(args);
}

static const char *const errorDescriptions[SEAECHO_ERR_MAX] = {
    "SEAECHO_ERR_JOBNUM: Job number for sweep out of range",
    "SEAECHO_ERR_TS_NOT_FINITE: A model produced a TS which is NaN or infinite, "
    "even after falling back to the uncorrected resonance frequency",
    "SEAECHO_ERR_WORKER_EXCEPTION: An exception was thrown while evaluating a "
    "model in a worker thread",
};

static const char *const warningDescriptions[SEAECHO_WARN_MAX] = {
    "SEAECHO_WARN_KA_GT_1: ka < 1 not satisfied, small-bubble models are being used "
    "outside their range of validity",
    "SEAECHO_WARN_CORRECTION_FALLBACK: Surface tension / thermal conductivity "
    "correction was singular, used the uncorrected resonance frequency and "
    "re-radiation + viscous damping only",
    "SEAECHO_WARN_MODAL_NOT_CONVERGED: Partial wave series had not converged when "
    "the maximum number of terms was reached",
};

void CheckReportErrors(seInternal *internal, const ErrState *errState)
{
    uint32_t error     = errState->error.load(std::memory_order_acquire);
    uint32_t warning   = errState->warning.load(std::memory_order_acquire);
    uint32_t errCount  = errState->errCount.load(std::memory_order_acquire);
    uint32_t warnCount = errState->warnCount.load(std::memory_order_acquire);
    if((error != 0) != (errCount != 0) || (warning != 0) != (warnCount != 0)) {
        ExternalError(
            internal, "Internal error with error counts in error tracking system");
    }
    if(warning != 0) {
        ExternalWarning(
            internal, "%u warning(s) thrown of the following type(s):", warnCount);
        for(int32_t i = 0; i < SEAECHO_WARN_MAX; ++i) {
            if((warning & (1u << i))) {
                ExternalWarning(internal, "%s", warningDescriptions[i]);
                warning &= ~(1u << i);
            }
        }
        if(warning != 0) {
            ExternalError(
                internal,
                "Internal error in error tracking system: unknown warning thrown");
        }
    }
    if(error != 0) {
        ExternalWarning(
            internal, "%u error(s) thrown of the following type(s):", errCount);
        for(int32_t i = 0; i < SEAECHO_ERR_MAX; ++i) {
            if((error & (1u << i))) {
                ExternalWarning(internal, "%s", errorDescriptions[i]);
                error &= ~(1u << i);
            }
        }
        if(error != 0) {
            ExternalError(
                internal,
                "Internal error in error tracking system: unknown error thrown");
        }
        ExternalError(internal, "Raising error(s) reported above to caller");
    }
}

} // namespace seaecho
