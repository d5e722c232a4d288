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
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "common_setup.hpp"
#include "seawater.hpp"
#include "gas.hpp"
#include "material.hpp"
#include "model/registry.hpp"

using namespace seaecho;

class BubbleModelTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        water  = SeawaterFromTSZ(RL(10.0), RL(100.0), RL(35.0), RL(8.0));
        bubble = GetGasSpecies("AIR")->Derive(water, RL(0.002));
        ResetErrState(&errState);
    }

    real TS(const char *name, real f)
    {
        const model::ScatteringModel *m = registry.Find(name);
        EXPECT_NE(m, nullptr) << name;
        if(m == nullptr) return RL(0.0);
        model::ScatterInput in;
        in.f        = f;
        in.c        = water.c;
        in.water    = &water;
        in.bubble   = &bubble;
        in.material = nullptr;
        in.a        = bubble.d * RL(0.5);
        return m->TS(in, &errState);
    }

    model::ModelRegistry registry;
    SeawaterState water;
    BubbleState bubble;
    ErrState errState;
};

TEST_F(BubbleModelTest, TwoMillimeterAirBubbleAt50kHz)
{
    EXPECT_NEAR(TS("Medwin_Clay", RL(50.0)), -58.21, 0.05);
    EXPECT_NEAR(TS("Breathing", RL(50.0)), -59.80, 0.05);
    EXPECT_NEAR(TS("Wildt_Medwin", RL(50.0)), -59.80, 0.05);
    EXPECT_NEAR(TS("Modal", RL(50.0)), -60.03, 0.05);
    EXPECT_FALSE(HasWarned(&errState, SEAECHO_WARN_MODAL_NOT_CONVERGED));
    EXPECT_FALSE(HasWarned(&errState, SEAECHO_WARN_KA_GT_1));
}

TEST_F(BubbleModelTest, MedwinClayNearBreathingAboveResonance)
{
    EXPECT_NEAR(TS("Medwin_Clay", RL(50.0)), TS("Breathing", RL(50.0)), 3.0);
}

TEST_F(BubbleModelTest, ModalAgreesWithBreathingForSmallKa)
{
    for(real f : {RL(1.0), RL(5.0), RL(20.0), RL(50.0)}) {
        EXPECT_NEAR(TS("Modal", f), TS("Breathing", f), 1.0) << f << " kHz";
    }
}

TEST_F(BubbleModelTest, FiniteSizeCorrectionsOnlyReduce)
{
    for(real f : {RL(5.0), RL(50.0), RL(500.0)}) {
        real wm = TS("Wildt_Medwin", f);
        EXPECT_LE(TS("Thuraisingham", f), wm) << f << " kHz";
        EXPECT_LT(TS("Andreeva_Weston", f), wm) << f << " kHz";
    }
}

TEST_F(BubbleModelTest, AinslieLeightonNearBreathing)
{
    real al = TS("Ainslie_Leighton", RL(50.0));
    EXPECT_TRUE(std::isfinite(al));
    EXPECT_NEAR(al, TS("Breathing", RL(50.0)), 1.0);
}

TEST_F(BubbleModelTest, EveryBubbleModelPeaksNearResonance)
{
    for(const model::ScatteringModel *m : registry.list()) {
        if(m->Kind() != 'B') continue;
        real peak = TS(m->Name(), RL(10.7));
        EXPECT_GT(peak, TS(m->Name(), RL(1.0))) << m->Name();
        EXPECT_GT(peak, TS(m->Name(), RL(100.0))) << m->Name();
    }
}

TEST_F(BubbleModelTest, LargeKaWarns)
{
    real ts = TS("Medwin_Clay", RL(1200.0));
    EXPECT_TRUE(std::isfinite(ts));
    EXPECT_TRUE(HasWarned(&errState, SEAECHO_WARN_KA_GT_1));
    EXPECT_FALSE(HasErrored(&errState));
}

class ElasticSphereTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        water = SeawaterFromTSZ(RL(10.0), RL(100.0), RL(35.0), RL(8.0));
        ResetErrState(&errState);
    }

    real TS(const SeawaterState &w, real c, const char *material, real a, real f)
    {
        const model::ScatteringModel *m = registry.Find("Elastic_Sphere");
        EXPECT_NE(m, nullptr);
        if(m == nullptr) return RL(0.0);
        model::ScatterInput in;
        in.f        = f;
        in.c        = c;
        in.water    = &w;
        in.bubble   = nullptr;
        in.material = FindSolidMaterial(material);
        in.a        = a;
        return m->TS(in, &errState);
    }

    model::ModelRegistry registry;
    SeawaterState water;
    ErrState errState;
};

TEST_F(ElasticSphereTest, TungstenCarbideCalibrationSphere)
{
    // 38.1 mm WC sphere in c = 1494 m/s, rho = 1026 kg/m^3 water
    SeawaterState w = water;
    w.rho           = RL(1026.0);
    real a          = RL(0.01905);
    EXPECT_NEAR(TS(w, RL(1494.0), "TUNGSTENCARBIDE", a, RL(18.0)), -42.67, 0.1);
    EXPECT_NEAR(TS(w, RL(1494.0), "TUNGSTENCARBIDE", a, RL(38.0)), -42.40, 0.1);
    EXPECT_NEAR(TS(w, RL(1494.0), "TUNGSTENCARBIDE", a, RL(70.0)), -41.35, 0.1);
    EXPECT_NEAR(TS(w, RL(1494.0), "TUNGSTENCARBIDE", a, RL(120.0)), -39.49, 0.1);
    EXPECT_FALSE(HasErrored(&errState));
}

TEST_F(ElasticSphereTest, TSGrowsWithRadius)
{
    real small = TS(water, water.c, "TUNGSTENCARBIDE", RL(0.001), RL(18.0));
    real large = TS(water, water.c, "TUNGSTENCARBIDE", RL(0.01), RL(18.0));
    EXPECT_NEAR(small, -106.98, 0.1);
    EXPECT_NEAR(large, -49.76, 0.1);
    EXPECT_GT(large, small);
}

TEST_F(ElasticSphereTest, CopperSphere)
{
    EXPECT_NEAR(TS(water, water.c, "COPPER", RL(0.01905), RL(38.0)), -40.58, 0.1);
    EXPECT_FALSE(HasWarned(&errState, SEAECHO_WARN_MODAL_NOT_CONVERGED));
}

TEST(ModelRegistryTest, Names)
{
    model::ModelRegistry registry;
    EXPECT_EQ(
        registry.Names(),
        "Medwin_Clay Breathing Thuraisingham Modal Wildt_Medwin Andreeva_Weston "
        "Ainslie_Leighton Elastic_Sphere");
    ASSERT_NE(registry.Find("Elastic_Sphere"), nullptr);
    EXPECT_EQ(registry.Find("Elastic_Sphere")->Kind(), 'S');
    EXPECT_EQ(registry.Find("Modal")->Kind(), 'B');
    EXPECT_EQ(registry.Find("medwin_clay"), nullptr);
    EXPECT_EQ(registry.Find(nullptr), nullptr);
}

TEST(ComputeTSTest, StandaloneMatchesModels)
{
    SeawaterState water = DeriveSeawaterState(RL(10.0), RL(100.0), RL(35.0));
    BubbleState bubble  = DeriveBubbleState(water, "AIR", RL(0.002));
    EXPECT_NEAR(ComputeTS("Medwin_Clay", RL(50.0), water.c, bubble), -58.21, 0.05);

    SolidMaterial wc = GetSolidMaterial("TUNGSTENCARBIDE");
    EXPECT_NEAR(
        ComputeTS("Elastic_Sphere", RL(18.0), water.c, water, wc, RL(0.01)), -49.76, 0.1);
}

TEST(ComputeTSTest, Errors)
{
    SeawaterState water = DeriveSeawaterState(RL(10.0), RL(100.0), RL(35.0));
    BubbleState bubble  = DeriveBubbleState(water, "AIR", RL(0.002));
    SolidMaterial wc    = GetSolidMaterial("TUNGSTENCARBIDE");
    EXPECT_THROW(ComputeTS("NoSuchModel", RL(50.0), water.c, bubble), std::runtime_error);
    EXPECT_THROW(ComputeTS("Elastic_Sphere", RL(50.0), water.c, bubble), std::runtime_error);
    EXPECT_THROW(
        ComputeTS("Medwin_Clay", RL(50.0), water.c, water, wc, RL(0.01)), std::runtime_error);
}

TEST(ComputeTSTest, WarningsAreReported)
{
    // 10 cm bubble at 100 kHz: ka is about 21, and the thermal correction
    // overflows so the bare resonance is used
    SeawaterState water = DeriveSeawaterState(RL(10.0), RL(100.0), RL(35.0));
    BubbleState bubble  = DeriveBubbleState(water, "AIR", RL(0.1));
    ::testing::internal::CaptureStdout();
    real ts         = ComputeTS("Medwin_Clay", RL(100.0), water.c, bubble);
    std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_TRUE(std::isfinite(ts));
    EXPECT_NE(out.find("SEAECHO_WARN_KA_GT_1"), std::string::npos) << out;
    EXPECT_NE(out.find("SEAECHO_WARN_CORRECTION_FALLBACK"), std::string::npos) << out;
}

TEST(ComputeTSTest, NoOutputWithoutWarnings)
{
    SeawaterState water = DeriveSeawaterState(RL(10.0), RL(100.0), RL(35.0));
    BubbleState bubble  = DeriveBubbleState(water, "AIR", RL(0.002));
    ::testing::internal::CaptureStdout();
    ComputeTS("Medwin_Clay", RL(50.0), water.c, bubble);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
}

TEST(ComputeTSTest, NonFiniteTSThrows)
{
    SeawaterState water = DeriveSeawaterState(RL(10.0), RL(100.0), RL(35.0));
    BubbleState bubble  = DeriveBubbleState(water, "AIR", RL(0.002));
    bubble.water.mu     = std::numeric_limits<real>::quiet_NaN();
    ::testing::internal::CaptureStdout();
    EXPECT_THROW(ComputeTS("Medwin_Clay", RL(50.0), water.c, bubble), std::runtime_error);
    std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("SEAECHO_ERR_TS_NOT_FINITE"), std::string::npos) << out;
}
