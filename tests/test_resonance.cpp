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

#include "common_setup.hpp"
#include "seawater.hpp"
#include "gas.hpp"
#include "resonance.hpp"
#include "model/registry.hpp"

using namespace seaecho;

class ResonanceTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        water  = SeawaterFromTSZ(RL(10.0), RL(100.0), RL(35.0), RL(8.0));
        bubble = GetGasSpecies("AIR")->Derive(water, RL(0.002));
        ResetErrState(&errState);
    }

    SeawaterState water;
    BubbleState bubble;
    ErrState errState;
};

TEST_F(ResonanceTest, CorrectedResonance)
{
    ResonanceInfo res = ResonanceFreq(RL(50.0), water.c, bubble, &errState);
    EXPECT_NEAR(res.f_b, 10715.8, 0.5);
    EXPECT_NEAR(res.f_R, 10700.9, 0.5);
    EXPECT_NEAR(res.corr.x, 0.99712, 1e-4);
    EXPECT_NEAR(res.corr.y, 0.002857, 1e-5);
    EXPECT_NEAR(res.corr.z, 1.0001034, 1e-6);
    EXPECT_EQ(res.f_b, BareResonance(bubble));
    EXPECT_FALSE(HasWarned(&errState, SEAECHO_WARN_KA_GT_1));
    EXPECT_EQ(errState.warnCount.load(), 0u);
}

TEST_F(ResonanceTest, DampingTerms)
{
    real f                = RL(50.0);
    ResonanceInfo res     = ResonanceFreq(f, water.c, bubble, &errState);
    real delta            = DampingConstant(f, water.c, bubble, res);
    real delta_no_thermal = FallbackDamping(f, water.c, bubble);
    EXPECT_GT(delta, delta_no_thermal);
    EXPECT_NEAR(
        delta - delta_no_thermal, res.corr.y * SQ(res.f_R / (f * RL(1000.0))), 1e-12);
    EXPECT_EQ(DampingConstant(f, water.c, bubble, &errState), delta);
}

TEST_F(ResonanceTest, KaWarning)
{
    // ka is about 5 at 1.2 MHz
    real ka = CheckKa(RL(1200.0), water.c, RL(0.001), &errState);
    EXPECT_NEAR(ka, 2.0 * M_PI * 1.2e6 / water.c * 0.001, 1e-9);
    EXPECT_TRUE(HasWarned(&errState, SEAECHO_WARN_KA_GT_1));
    EXPECT_FALSE(HasErrored(&errState));
}

TEST_F(ResonanceTest, NoFallbackNormally)
{
    EffectiveResonance eff = GetEffectiveResonance(RL(50.0), water.c, bubble, &errState);
    EXPECT_FALSE(eff.fallback);
    EXPECT_NEAR(eff.f_res, 10700.9, 0.5);
    EXPECT_FALSE(HasWarned(&errState, SEAECHO_WARN_CORRECTION_FALLBACK));
}

TEST_F(ResonanceTest, FallbackForDegenerateGas)
{
    BubbleState degenerate = bubble;
    degenerate.Cp          = RL(0.0);
    ResonanceInfo res      = ResonanceFreq(RL(50.0), water.c, degenerate, &errState);
    EXPECT_TRUE(std::isnan(res.f_R));

    EffectiveResonance eff = GetEffectiveResonance(RL(50.0), water.c, degenerate, &errState);
    EXPECT_TRUE(eff.fallback);
    EXPECT_EQ(eff.f_res, BareResonance(degenerate));
    EXPECT_EQ(eff.delta, FallbackDamping(RL(50.0), water.c, degenerate));
    EXPECT_TRUE(HasWarned(&errState, SEAECHO_WARN_CORRECTION_FALLBACK));
}

TEST_F(ResonanceTest, MedwinClayMatchesClosedForm)
{
    model::ModelRegistry registry;
    const model::ScatteringModel *mc = registry.Find("Medwin_Clay");
    ASSERT_NE(mc, nullptr);

    BubbleState degenerate = bubble;
    degenerate.Cp          = RL(0.0);
    for(const BubbleState *b : {&bubble, &degenerate}) {
        for(real f : {RL(5.0), RL(10.7), RL(50.0), RL(200.0)}) {
            model::ScatterInput in;
            in.f        = f;
            in.c        = water.c;
            in.water    = &water;
            in.bubble   = b;
            in.material = nullptr;
            in.a        = b->d * RL(0.5);

            EffectiveResonance eff = GetEffectiveResonance(f, water.c, *b, &errState);
            real expected = SQ(in.a)
                / (SQ(eff.f_res / (f * RL(1000.0)) - RL(1.0)) + SQ(eff.delta));
            real sigma = mc->Sigma(in, &errState);
            EXPECT_TRUE(std::isfinite(sigma));
            EXPECT_NEAR(sigma, expected, expected * 1e-12);
        }
    }
}
