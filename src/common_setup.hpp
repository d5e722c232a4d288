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

#include "common.hpp"

#include <cctype>
#include <locale>
#include <exception>

// More includes below.

namespace seaecho {

////////////////////////////////////////////////////////////////////////////////
// String manipulation
////////////////////////////////////////////////////////////////////////////////

inline bool isInt(std::string str, bool allowNegative = true)
{
    if(str.empty()) return false;
    for(size_t i = 0; i < str.length(); ++i) {
        if(str[i] == '-') {
            if(i != 0 || !allowNegative || str.length() == 1) return false;
            continue;
        } else if(str[i] >= '0' && str[i] <= '9') {
            continue;
        } else {
            return false;
        }
    }
    return true;
}

inline bool isReal(std::string str)
{
    if(str.empty()) return false;
    char *ptr;
    strtod(str.c_str(), &ptr);
    return (*ptr) == '\0';
}

// trim from both ends (copying)
inline std::string trim_copy(std::string s)
{
    auto notspace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
    return s;
}

inline std::string toupper_copy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
        return (char)std::toupper(ch);
    });
    return s;
}

inline bool endswith(const std::string &source, const std::string &target)
{
    if(target.length() > source.length()) return false;
    size_t l = source.length() - target.length();
    return source.find(target, l) == l;
}

/**
 * Copies str into a fixed-size, NUL-terminated name field, truncating if
 * needed.
 */
template<size_t N> inline void SetName(char (&dst)[N], const std::string &str)
{
    size_t l = std::min(N - 1, str.size());
    memcpy(dst, str.c_str(), l);
    dst[l] = 0;
}

} // namespace seaecho

#define _SEAECHO_INCLUDING_COMPONENTS_ 1
#include "util/ldio.hpp"
#undef _SEAECHO_INCLUDING_COMPONENTS_

namespace seaecho {

////////////////////////////////////////////////////////////////////////////////
// Tracked memory
////////////////////////////////////////////////////////////////////////////////

template<typename T> inline void trackdeallocate(const seParams &params, T *&ptr)
{
    if(ptr == nullptr) return;
    // Size stored two 64-bit words before returned pointer. 16 byte aligned.
    uint64_t *ptr2 = (uint64_t *)ptr;
    ptr2 -= 2;
    GetInternal(params)->usedMemory -= *ptr2;
    free(ptr2);
    ptr = nullptr;
}

template<typename T> inline void trackallocate(
    const seParams &params, const char *description, T *&ptr, size_t n = 1)
{
    static_assert(
        std::is_trivially_copyable<T>::value, "trackallocate does not run constructors");
    if(ptr != nullptr) trackdeallocate(params, ptr);
    uint64_t *ptr2;
    uint64_t s  = ((n * sizeof(T)) + 15ull) & ~15ull; // Round up to 16 byte aligned
    uint64_t s2 = s + 16ull; // Total size to allocate, including size info
    if(GetInternal(params)->usedMemory + s2 > GetInternal(params)->maxMemory) {
        EXTERR(
            "Insufficient memory to allocate %s, need more than %" PRIu64 " MiB",
            description, (GetInternal(params)->usedMemory + s2) / (1024ull * 1024ull));
    }
    ptr2 = (uint64_t *)malloc(s2);
    if(ptr2 == nullptr) { EXTERR("Failed to allocate %s", description); }
    *ptr2 = s2;
    GetInternal(params)->usedMemory += s2;
    ptr = (T *)(ptr2 + 2);
#ifdef SEAECHO_DEBUG
    // Debugging: Fill memory with garbage data to help detect uninitialized vars
    memset(ptr, 0xFE, s);
#endif
}

////////////////////////////////////////////////////////////////////////////////
// Vector input related
////////////////////////////////////////////////////////////////////////////////

constexpr real SubTabMarker = RL(-999.9);

inline bool IsSubTabMarker(real x) { return std::abs(x - SubTabMarker) < RL(0.01); }

/**
 * If x[2] == -999.9 then subtabulation is performed
 * i.e., a vector is generated with Nx points in [x[0], x[1]]
 * If x[1] == -999.9 then x[0] is repeated into x[1]
 * With logspacing, the points are geometrically spaced, which needs
 * x[0], x[1] > 0.
 */
inline void SubTab(real *x, int32_t Nx, bool logspacing = false)
{
    if(Nx < 3 || !IsSubTabMarker(x[2])) return;
    if(IsSubTabMarker(x[1])) x[1] = x[0];
    real x0 = x[0], x1 = x[1];
    if(logspacing) {
        real lx0 = std::log(x0);
        real dlx = (std::log(x1) - lx0) / (real)(Nx - 1);
        for(int32_t i = 0; i < Nx; ++i) x[i] = std::exp(std::fma((real)i, dlx, lx0));
        // Pin the end points so they are exactly what was asked for
        x[0]      = x0;
        x[Nx - 1] = x1;
    } else {
        real deltax = (x1 - x0) / (real)(Nx - 1);
        for(int32_t i = 0; i < Nx; ++i) x[i] = std::fma((real)i, deltax, x0);
    }
}

/**
 * Read a vector x: a count record, then a values record which may be
 * abbreviated to "first last /" for subtabulation. The order of the values
 * is kept.
 */
inline void ReadVector(
    seParams &params, real *&x, int32_t &Nx, LDIFile &ENVFile, const char *Description,
    bool logspacing = false)
{
    LIST(ENVFile);
    ENVFile.Read(Nx);
    if(Nx <= 0) { EXTERR("ReadVector: Number of %s must be positive", Description); }
    trackallocate(params, Description, x, std::max(3, Nx));
    x[1] = SubTabMarker;
    x[2] = SubTabMarker;
    LIST(ENVFile);
    ENVFile.Read(x, Nx);
    SubTab(x, Nx, logspacing);
}

/**
 * Every entry must be finite and strictly positive. Unlike range or angle
 * vectors, these need not be monotonic.
 */
inline void ValidateVector(
    seParams &params, real *x, int32_t Nx, const char *Description)
{
    if(Nx <= 0 || x == nullptr) {
        EXTERR("ValidateVector: Number of %s must be positive", Description);
    }
    for(int32_t i = 0; i < Nx; ++i) {
        if(!std::isfinite(x[i]) || x[i] <= RL(0.0)) {
            EXTERR(
                "ValidateVector: %s must be positive, entry %d is %g", Description, i,
                (double)x[i]);
        }
    }
}

inline void EchoVector(
    const real *v, int32_t Nv, PrintFileEmu &PRTFile, int32_t NEcho = 10,
    const char *ExtraSpaces = "", real multiplier = RL(1.0))
{
    PRTFile << std::setprecision(6) << ExtraSpaces;
    for(int32_t i = 0, r = 0; i < std::min(Nv, NEcho); ++i) {
        PRTFile << std::setw(14) << (multiplier * v[i]) << " ";
        ++r;
        if(r == 5) {
            r = 0;
            PRTFile << "\n" << ExtraSpaces;
        }
    }
    if(Nv > NEcho) PRTFile << "... " << std::setw(14) << (multiplier * v[Nv - 1]);
    PRTFile << "\n";
}

/**
 * Echo vector with description
 * Description is something like 'frequencies'
 * Units       is something like 'kHz'
 */
inline void EchoVectorWDescr(
    seParams &params, const real *x, int32_t Nx, real multiplier,
    const char *Description, const char *Units)
{
    PrintFileEmu &PRTFile = GetInternal(params)->PRTFile;

    PRTFile << "\n_______________________________________________________________________"
               "___\n\n";
    PRTFile << "   Number of " << Description << " = " << Nx << "\n";
    PRTFile << "   " << Description << " (" << Units << ")\n";
    EchoVector(x, Nx, PRTFile, 10, "   ", multiplier);
    PRTFile << "\n";
}

} // namespace seaecho
