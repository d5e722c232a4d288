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
#include "sweep.hpp"

namespace seaecho { namespace mode {

int32_t GetNumRows(const seOutputs &outputs)
{
    const TSInfo *tsinfo = outputs.tsinfo;
    if(tsinfo == nullptr || !tsinfo->valid) return 0;
    return tsinfo->NModels * tsinfo->Ndiam * tsinfo->Nfreq;
}

void GetRow(const seParams &params, const seOutputs &outputs, int32_t i, TSRow &row)
{
    const TSInfo *tsinfo = outputs.tsinfo;
    if(i < 0 || i >= GetNumRows(outputs)) {
        EXTERR("Result row %d out of range (%d rows)", i, GetNumRows(outputs));
    }
    // Same layout as the ts array
    int32_t ifreq  = i % tsinfo->Nfreq;
    int32_t idiam  = (i / tsinfo->Nfreq) % tsinfo->Ndiam;
    int32_t imodel = i / (tsinfo->Nfreq * tsinfo->Ndiam);

    row.frequency_kHz   = params.freqinfo->freqVec[ifreq];
    row.TS_dB           = tsinfo->ts[GetTSAddr(imodel, idiam, ifreq, tsinfo)];
    row.model           = params.models->names[imodel].s;
    row.diameter_m      = params.scat->diamVec[idiam];
    row.ka              = tsinfo->ka[GetKaAddr(idiam, ifreq, tsinfo)];
    row.absorption_dBkm = tsinfo->alpha[ifreq];
    row.temperature_C   = tsinfo->water.T;
    row.salinity_psu    = tsinfo->water.S;
    row.depth_m         = tsinfo->water.z;
    row.soundspeed_mps  = tsinfo->c;
    row.density_kgm3    = tsinfo->water.rho;
}

void Sweep::Writeout(const seParams &params, const seOutputs &outputs) const
{
    if(!outputs.tsinfo->valid) EXTERR("Sweep::Writeout: No valid results to write");

    std::string FileName = GetInternal(params)->FileRoot + ".csv";
    std::ofstream CSVFile(FileName);
    if(!CSVFile.good()) EXTERR("Could not open CSV file: %s", FileName.c_str());

    CSVFile << "frequency_kHz,TS_dB,model,diameter_m,ka,absorption_dBkm,"
               "temperature_C,salinity_psu,depth_m,soundspeed_mps,density_kgm3\n";
    CSVFile << std::setprecision(10);
    int32_t nrows = GetNumRows(outputs);
    TSRow row;
    for(int32_t i = 0; i < nrows; ++i) {
        GetRow(params, outputs, i, row);
        CSVFile << row.frequency_kHz << "," << row.TS_dB << "," << row.model << ","
                << row.diameter_m << "," << row.ka << "," << row.absorption_dBkm << ","
                << row.temperature_C << "," << row.salinity_psu << "," << row.depth_m
                << "," << row.soundspeed_mps << "," << row.density_kgm3 << "\n";
    }
    CSVFile.close();
    if(CSVFile.fail()) EXTERR("Error writing CSV file: %s", FileName.c_str());
}

}} // namespace seaecho::mode
