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

#ifndef _SEAECHO_INCLUDED_
#error "This file must be included via #include <seaecho/seaecho.hpp>!"
#endif

////////////////////////////////////////////////////////////////////////////////
// Shared library setup
////////////////////////////////////////////////////////////////////////////////

#ifdef _WIN32
#if defined(SEAECHO_DLL_EXPORT)
#define SEAECHO_API __declspec(dllexport)
#elif defined(SEAECHO_DLL_IMPORT)
#define SEAECHO_API __declspec(dllimport)
#else
#define SEAECHO_API
#endif
#else
#define SEAECHO_API
#endif
