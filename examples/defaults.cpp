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

#include <iostream>
#include <cstring>

// If you link to a DLL build on Windows, define SEAECHO_DLL_IMPORT before
// including the header. The default build is a static library.
#include <seaecho/seaecho.hpp>

void OutputCallback(const char *message)
{
    std::cout << "Out: " << message << std::endl << std::flush;
}

void PrtCallback(const char *message) { std::cout << message << std::endl; }

int main()
{
    seaecho::seParams params;
    seaecho::seOutputs outputs;
    seaecho::seInit init;
    init.FileRoot       = nullptr;
    init.outputCallback = OutputCallback;
    init.prtCallback    = PrtCallback;

    if(!seaecho::setup(init, params, outputs)) {
        seaecho::finalize(params, outputs);
        return 1;
    }

    // Compare the default Medwin_Clay with the bare breathing mode
    seaecho::extsetup_models(params, 2);
    strcpy(params.models->names[0].s, "Medwin_Clay");
    strcpy(params.models->names[1].s, "Breathing");

    if(!seaecho::echo(params) || !seaecho::run(params, outputs)) {
        seaecho::finalize(params, outputs);
        return 1;
    }

    std::cout << "TS (dB re 1 m^2):\n";
    seaecho::TSRow row;
    int32_t nrows = seaecho::export_numrows(params, outputs);
    for(int32_t i = 0; i < nrows; ++i) {
        if(!seaecho::export_row(params, outputs, i, row)) break;
        std::cout << row.model << " " << row.frequency_kHz << " kHz: " << row.TS_dB
                  << "\n";
    }

    // The physics is also available without a sweep
    seaecho::SeawaterState water = seaecho::DeriveSeawaterState(10.0, 100.0, 35.0);
    seaecho::SolidMaterial wc    = seaecho::GetSolidMaterial("TUNGSTENCARBIDE");
    std::cout << "38.1 mm tungsten carbide sphere at 38 kHz: "
              << seaecho::ComputeTS("Elastic_Sphere", 38.0, water.c, water, wc, 0.01905)
              << " dB\n";

    seaecho::finalize(params, outputs);
    return 0;
}
