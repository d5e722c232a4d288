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

#if defined(__linux__)
#include <pthread.h>
#endif

namespace seaecho {

void SetupThread(int32_t worker)
{
#if defined(__linux__)
    // Linux limits thread names to 15 characters plus the terminator
    char name[16];
    snprintf(name, sizeof(name), "seaecho-w%d", worker);
    if(pthread_setname_np(pthread_self(), name) != 0) {
        std::cout << "Could not set name of worker thread " << worker << "\n";
    }
#else
    (void)worker;
#endif
}

} // namespace seaecho
