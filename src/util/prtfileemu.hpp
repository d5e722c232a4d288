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
 * The print file: a human-readable echo of the inputs and derived quantities.
 * Goes to FileRoot.prt, or if a callback is given, to the callback one
 * complete line at a time.
 */
class PrintFileEmu {
public:
    PrintFileEmu(
        seInternal *internal, const std::string &FileRoot,
        void (*prtCallback)(const char *message))
        : callback(prtCallback)
    {
        if(callback == nullptr) {
            ofs.open(FileRoot + ".prt");
            if(!ofs.good()) {
                ExternalError(
                    internal, "Could not open print file: %s.prt", FileRoot.c_str());
            }
            ofs << std::unitbuf;
        }
    }
    ~PrintFileEmu()
    {
        if(callback != nullptr && !linebuf.empty()) callback(linebuf.c_str());
        if(ofs.is_open()) ofs.close();
    }

    template<typename T> PrintFileEmu &operator<<(const T &x)
    {
        if(callback != nullptr) {
            fmt.str("");
            fmt << x;
            linebuf += fmt.str();
            size_t nl;
            while((nl = linebuf.find('\n')) != std::string::npos) {
                callback(linebuf.substr(0, nl).c_str());
                linebuf.erase(0, nl + 1);
            }
        } else if(ofs.good()) {
            ofs << x;
        }
        return *this;
    }
private:
    std::ofstream ofs;
    std::stringstream fmt;
    std::string linebuf;
    void (*callback)(const char *message);
};

} // namespace seaecho
