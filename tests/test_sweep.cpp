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
#include <gtest/gtest.h>

#include <seaecho/seaecho.hpp>
#include "resonance.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

using namespace seaecho;

namespace {

std::mutex outputMutex;
std::string outputText;

void PrtCallback(const char *) {}
void OutputCallback(const char *message)
{
    std::lock_guard<std::mutex> lock(outputMutex);
    outputText += message;
}

} // namespace

class SweepTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        outputText.clear();
        ASSERT_TRUE(Setup(params, outputs, -1));
    }
    void TearDown() override { finalize(params, outputs); }

    static bool Setup(seParams &p, seOutputs &o, int32_t numThreads)
    {
        seInit init;
        init.numThreads     = numThreads;
        init.prtCallback    = PrtCallback;
        init.outputCallback = OutputCallback;
        return setup(init, p, o);
    }

    static void SetModels(seParams &p, std::vector<const char *> names)
    {
        extsetup_models(p, (int32_t)names.size());
        for(size_t i = 0; i < names.size(); ++i) strcpy(p.models->names[i].s, names[i]);
    }

    static void SetLinearFreqs(seParams &p, int32_t Nfreq, real f0, real f1)
    {
        extsetup_freqvec(p, Nfreq);
        for(int32_t i = 0; i < Nfreq; ++i)
            p.freqinfo->freqVec[i] = f0 + (real)i * (f1 - f0) / (real)(Nfreq - 1);
    }

    seParams params;
    seOutputs outputs;
};

TEST_F(SweepTest, Defaults)
{
    EXPECT_EQ(params.env->T, real(10.0));
    EXPECT_EQ(params.env->S, real(35.0));
    EXPECT_EQ(params.env->z, real(100.0));
    EXPECT_EQ(params.env->pH, real(8.0));
    EXPECT_EQ(params.env->AbsorptionOpt, 'A');
    EXPECT_EQ(params.scat->Kind, 'B');
    EXPECT_STREQ(params.scat->Name, "AIR");
    ASSERT_EQ(params.scat->Ndiam, 1);
    EXPECT_EQ(params.scat->diamVec[0], real(0.002));
    ASSERT_EQ(params.freqinfo->Nfreq, 100);
    EXPECT_EQ(params.freqinfo->freqVec[0], real(1.0));
    EXPECT_EQ(params.freqinfo->freqVec[99], real(100.0));
    ASSERT_EQ(params.models->NModels, 1);
    EXPECT_STREQ(params.models->names[0].s, "Medwin_Clay");
    EXPECT_EQ(export_numrows(params, outputs), 0);
}

TEST_F(SweepTest, DefaultRunMatchesStandalone)
{
    ASSERT_TRUE(run(params, outputs));
    const TSInfo *tsinfo = outputs.tsinfo;
    ASSERT_TRUE(tsinfo->valid);
    ASSERT_EQ(export_numrows(params, outputs), 100);

    BubbleState bubble = DeriveBubbleState(tsinfo->water, "AIR", real(0.002));
    for(int32_t i = 0; i < 100; ++i) {
        real f = params.freqinfo->freqVec[i];
        EXPECT_NEAR(tsinfo->ts[i], ComputeTS("Medwin_Clay", f, tsinfo->c, bubble), 1e-9);
        EXPECT_EQ(tsinfo->alpha[i], AbsorptionCoeff(f, tsinfo->water, 'A'));
    }
    EXPECT_EQ(tsinfo->c, tsinfo->water.c);
    EXPECT_EQ(tsinfo->bubbles[0].d, real(0.002));
}

TEST_F(SweepTest, ResultsKeepInputOrder)
{
    extsetup_freqvec(params, 4);
    real freqs[] = {real(50.0), real(10.0), real(200.0), real(30.0)};
    for(int32_t i = 0; i < 4; ++i) params.freqinfo->freqVec[i] = freqs[i];
    extsetup_diamvec(params, 2);
    params.scat->diamVec[0] = real(0.004);
    params.scat->diamVec[1] = real(0.001);
    ASSERT_TRUE(run(params, outputs));

    const TSInfo *tsinfo = outputs.tsinfo;
    for(int32_t idiam = 0; idiam < 2; ++idiam) {
        BubbleState bubble
            = DeriveBubbleState(tsinfo->water, "AIR", params.scat->diamVec[idiam]);
        for(int32_t ifreq = 0; ifreq < 4; ++ifreq) {
            EXPECT_NEAR(
                tsinfo->ts[idiam * 4 + ifreq],
                ComputeTS("Medwin_Clay", freqs[ifreq], tsinfo->c, bubble), 1e-9);
        }
    }
}

TEST_F(SweepTest, ThreadCountDoesNotChangeResults)
{
    finalize(params, outputs);
    ASSERT_TRUE(Setup(params, outputs, 1));
    seParams p4;
    seOutputs o4;
    ASSERT_TRUE(Setup(p4, o4, 4));
    for(seParams *p : {&params, &p4}) {
        SetModels(*p, {"Medwin_Clay", "Breathing", "Modal", "Thuraisingham"});
        extsetup_diamvec(*p, 3);
        p->scat->diamVec[0] = real(0.0005);
        p->scat->diamVec[1] = real(0.002);
        p->scat->diamVec[2] = real(0.005);
    }

    ASSERT_TRUE(run(params, outputs));
    ASSERT_TRUE(run(p4, o4));
    int32_t n = export_numrows(params, outputs);
    ASSERT_EQ(n, 4 * 3 * 100);
    ASSERT_EQ(export_numrows(p4, o4), n);
    for(int32_t i = 0; i < n; ++i) {
        EXPECT_EQ(outputs.tsinfo->ts[i], o4.tsinfo->ts[i]) << i;
    }
    for(int32_t i = 0; i < 3 * 100; ++i) {
        EXPECT_EQ(outputs.tsinfo->ka[i], o4.tsinfo->ka[i]) << i;
    }
    finalize(p4, o4);
}

TEST_F(SweepTest, ExportRowsAreModelMajor)
{
    SetModels(params, {"Medwin_Clay", "Breathing"});
    extsetup_diamvec(params, 2);
    params.scat->diamVec[0] = real(0.001);
    params.scat->diamVec[1] = real(0.003);
    ASSERT_TRUE(run(params, outputs));
    ASSERT_EQ(export_numrows(params, outputs), 2 * 2 * 100);

    TSRow row;
    // model 1, diameter 0, frequency 7
    ASSERT_TRUE(export_row(params, outputs, (1 * 2 + 0) * 100 + 7, row));
    EXPECT_STREQ(row.model, "Breathing");
    EXPECT_EQ(row.diameter_m, real(0.001));
    EXPECT_EQ(row.frequency_kHz, params.freqinfo->freqVec[7]);
    EXPECT_EQ(row.TS_dB, outputs.tsinfo->ts[(1 * 2 + 0) * 100 + 7]);
    EXPECT_EQ(row.ka, outputs.tsinfo->ka[7]);
    EXPECT_EQ(row.temperature_C, real(10.0));
    EXPECT_EQ(row.salinity_psu, real(35.0));
    EXPECT_EQ(row.depth_m, real(100.0));
    EXPECT_EQ(row.soundspeed_mps, outputs.tsinfo->c);
    EXPECT_EQ(row.density_kgm3, outputs.tsinfo->water.rho);

    ASSERT_TRUE(export_row(params, outputs, (0 * 2 + 1) * 100 + 3, row));
    EXPECT_STREQ(row.model, "Medwin_Clay");
    EXPECT_EQ(row.diameter_m, real(0.003));

    EXPECT_FALSE(export_row(params, outputs, 400, row));
    EXPECT_FALSE(export_row(params, outputs, -1, row));
}

TEST_F(SweepTest, UnknownModelFailsWithoutResults)
{
    ASSERT_TRUE(run(params, outputs));
    ASSERT_TRUE(outputs.tsinfo->valid);

    SetModels(params, {"Medwin_Clay", "NotAModel"});
    outputText.clear();
    EXPECT_FALSE(run(params, outputs));
    EXPECT_FALSE(outputs.tsinfo->valid);
    EXPECT_EQ(outputs.tsinfo->ts, nullptr);
    EXPECT_EQ(export_numrows(params, outputs), 0);
    EXPECT_NE(outputText.find("NotAModel"), std::string::npos);
    EXPECT_NE(outputText.find("Medwin_Clay"), std::string::npos);

    // Recovers once the name is fixed
    strcpy(params.models->names[1].s, "Breathing");
    EXPECT_TRUE(run(params, outputs));
    EXPECT_EQ(export_numrows(params, outputs), 200);
}

TEST_F(SweepTest, ModelKindMustMatchScatterer)
{
    SetModels(params, {"Elastic_Sphere"});
    EXPECT_FALSE(run(params, outputs));
    EXPECT_FALSE(outputs.tsinfo->valid);
}

TEST_F(SweepTest, InvalidInputsFail)
{
    params.env->T = real(60.0);
    EXPECT_FALSE(run(params, outputs));
    params.env->T = real(10.0);

    params.freqinfo->freqVec[5] = real(-1.0);
    EXPECT_FALSE(run(params, outputs));
    params.freqinfo->freqVec[5] = real(6.0);

    params.env->AbsorptionOpt = 'Q';
    EXPECT_FALSE(run(params, outputs));
    params.env->AbsorptionOpt = 'F';

    strcpy(params.scat->Name, "HELIUM");
    EXPECT_FALSE(run(params, outputs));
    strcpy(params.scat->Name, "METHANE");

    EXPECT_TRUE(run(params, outputs));
    EXPECT_TRUE(echo(params));
}

TEST_F(SweepTest, SolidSphereSweep)
{
    params.scat->Kind = 'S';
    strcpy(params.scat->Name, "TUNGSTENCARBIDE");
    params.scat->diamVec[0] = real(0.0381);
    SetLinearFreqs(params, 3, real(18.0), real(38.0));
    SetModels(params, {"Elastic_Sphere"});
    ASSERT_TRUE(run(params, outputs));

    const TSInfo *tsinfo = outputs.tsinfo;
    EXPECT_EQ(tsinfo->bubbles, nullptr);
    EXPECT_STREQ(tsinfo->material.name, "TUNGSTENCARBIDE");
    SolidMaterial wc = GetSolidMaterial("TUNGSTENCARBIDE");
    for(int32_t i = 0; i < 3; ++i) {
        EXPECT_NEAR(
            tsinfo->ts[i],
            ComputeTS(
                "Elastic_Sphere", params.freqinfo->freqVec[i], tsinfo->c, tsinfo->water,
                wc, real(0.01905)),
            1e-9);
    }
}

TEST_F(SweepTest, MedwinClayStaysInRange)
{
    // Fresh shallow water, 2 mm bubble, 1 kHz to 1.2 MHz on a log grid fine
    // enough (0.36% steps) to resolve the resonance near 4.6 kHz
    const int32_t N = 2000;
    params.env->T   = real(20.0);
    params.env->S   = real(0.0);
    params.env->z   = real(10.0);
    extsetup_freqvec(params, N);
    for(int32_t i = 0; i < N; ++i)
        params.freqinfo->freqVec[i] = (real)std::pow(1200.0, (double)i / (double)(N - 1));
    ASSERT_TRUE(run(params, outputs));

    const TSInfo *tsinfo = outputs.tsinfo;
    const real *ts       = tsinfo->ts;
    real tsmax           = ts[0];
    int32_t imax = 0, nlocalmax = 0;
    for(int32_t i = 0; i < N; ++i) {
        ASSERT_TRUE(std::isfinite(ts[i])) << i;
        // The resonance peak sits just above -30 dB
        EXPECT_GE(ts[i], real(-110.0)) << i;
        EXPECT_LE(ts[i], real(-25.0)) << i;
        if(ts[i] > tsmax) {
            tsmax = ts[i];
            imax  = i;
        }
        if(i > 0 && i < N - 1 && ts[i] > ts[i - 1] && ts[i] > ts[i + 1]) ++nlocalmax;
    }
    EXPECT_EQ(nlocalmax, 1);
    EXPECT_NEAR(tsmax, -29.21, 0.1);

    // Peak lands on the corrected resonance
    ErrState errState;
    ResetErrState(&errState);
    real fpeak             = params.freqinfo->freqVec[imax];
    EffectiveResonance eff
        = GetEffectiveResonance(fpeak, tsinfo->c, tsinfo->bubbles[0], &errState);
    EXPECT_FALSE(eff.fallback);
    EXPECT_NEAR(fpeak * real(1000.0), eff.f_res, real(0.02) * eff.f_res);

    EXPECT_LE(ts[0], tsmax - real(15.0));
    EXPECT_LE(ts[N - 1], tsmax - real(15.0));
}

TEST_F(SweepTest, CorrectionFallbackIsReported)
{
    // 100 mm bubble: the thermal correction overflows at these frequencies
    extsetup_diamvec(params, 1);
    params.scat->diamVec[0] = real(100.0);
    SetLinearFreqs(params, 3, real(50.0), real(150.0));
    ASSERT_TRUE(run(params, outputs));
    for(int32_t i = 0; i < 3; ++i) EXPECT_TRUE(std::isfinite(outputs.tsinfo->ts[i])) << i;

    std::lock_guard<std::mutex> lock(outputMutex);
    EXPECT_NE(outputText.find("SEAECHO_WARN_CORRECTION_FALLBACK"), std::string::npos)
        << outputText;
    EXPECT_NE(outputText.find("SEAECHO_WARN_KA_GT_1"), std::string::npos) << outputText;
}

TEST_F(SweepTest, WriteoutCSV)
{
    SetModels(params, {"Medwin_Clay", "Modal"});
    ASSERT_TRUE(run(params, outputs));
    const char *root = "seaecho_test_writeout";
    ASSERT_TRUE(writeout(params, outputs, root));

    std::ifstream csv(std::string(root) + ".csv");
    ASSERT_TRUE(csv.good());
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(csv, line)));
    EXPECT_EQ(
        line,
        "frequency_kHz,TS_dB,model,diameter_m,ka,absorption_dBkm,"
        "temperature_C,salinity_psu,depth_m,soundspeed_mps,density_kgm3");
    int32_t nlines = 0;
    std::string first;
    while(std::getline(csv, line)) {
        if(nlines == 0) first = line;
        ++nlines;
    }
    EXPECT_EQ(nlines, 200);
    EXPECT_EQ(first.compare(0, 2, "1,"), 0);
    EXPECT_NE(first.find(",Medwin_Clay,"), std::string::npos);
    csv.close();
    EXPECT_EQ(std::remove((std::string(root) + ".csv").c_str()), 0);
}

TEST_F(SweepTest, WriteoutWithoutResultsFails)
{
    EXPECT_FALSE(writeout(params, outputs, "seaecho_test_noresults"));
    std::ifstream csv("seaecho_test_noresults.csv");
    EXPECT_FALSE(csv.good());
}

TEST(SweepSetupTest, TinyMemoryLimitFails)
{
    seInit init;
    init.maxMemory      = 1000;
    init.prtCallback    = PrtCallback;
    init.outputCallback = OutputCallback;
    seParams params;
    seOutputs outputs;
    EXPECT_FALSE(setup(init, params, outputs));
    finalize(params, outputs);
    EXPECT_EQ(params.internal, nullptr);
}
