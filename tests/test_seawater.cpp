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
#include "attenuation.hpp"

using namespace seaecho;

class SeawaterTest : public ::testing::Test {
protected:
    void SetUp() override { water = SeawaterFromTSZ(RL(10.0), RL(100.0), RL(35.0), RL(8.0)); }

    SeawaterState water;
};

TEST_F(SeawaterTest, DerivedProperties)
{
    EXPECT_NEAR(water.c, 1491.435, 0.01);
    EXPECT_NEAR(water.rho, 1026.952, 0.01);
    EXPECT_NEAR(water.cp, 3986.34, 0.1);
    EXPECT_NEAR(water.mu, 1.38985e-3, 1e-7);
    EXPECT_NEAR(water.nu, water.mu / water.rho, 1e-12);
    EXPECT_NEAR(water.sigma, 0.07526, 1e-4);
    EXPECT_NEAR(water.Pv, 1202.8, 0.5);
    EXPECT_NEAR(water.P, AtmPressure + water.rho * GravAccel * RL(100.0), 1e-6);
}

TEST_F(SeawaterTest, InputsAreKept)
{
    EXPECT_EQ(water.T, RL(10.0));
    EXPECT_EQ(water.z, RL(100.0));
    EXPECT_EQ(water.S, RL(35.0));
    EXPECT_EQ(water.pH, RL(8.0));
}

TEST_F(SeawaterTest, SoundSpeedIncreasesWithDepth)
{
    SeawaterState deep = SeawaterFromTSZ(RL(10.0), RL(1000.0), RL(35.0), RL(8.0));
    EXPECT_GT(deep.c, water.c);
    EXPECT_GT(deep.P, water.P);
}

TEST(SeawaterRange, OutOfRangeThrows)
{
    EXPECT_THROW(SeawaterFromTSZ(RL(50.0), RL(100.0), RL(35.0), RL(8.0)), std::runtime_error);
    EXPECT_THROW(SeawaterFromTSZ(RL(-5.0), RL(100.0), RL(35.0), RL(8.0)), std::runtime_error);
    EXPECT_THROW(SeawaterFromTSZ(RL(10.0), RL(-1.0), RL(35.0), RL(8.0)), std::runtime_error);
    EXPECT_THROW(SeawaterFromTSZ(RL(10.0), RL(100.0), RL(50.0), RL(8.0)), std::runtime_error);
    EXPECT_THROW(SeawaterFromTSZ(RL(10.0), RL(100.0), RL(35.0), RL(15.0)), std::runtime_error);
    EXPECT_THROW(DeriveSeawaterState(RL(10.0), RL(100.0), RL(-1.0)), std::runtime_error);
}

TEST(SeawaterRange, ReasonNamesTheInput)
{
    std::string reason;
    EXPECT_TRUE(SeawaterInRange(RL(10.0), RL(0.0), RL(0.0), RL(8.0), reason));
    EXPECT_FALSE(SeawaterInRange(RL(10.0), RL(20000.0), RL(35.0), RL(8.0), reason));
    EXPECT_NE(reason.find("depth"), std::string::npos);
}

TEST_F(SeawaterTest, AbsorptionFormulas)
{
    for(char opt : {'A', 'F', 'T'}) {
        real a10  = AbsorptionCoeff(RL(10.0), water, opt);
        real a100 = AbsorptionCoeff(RL(100.0), water, opt);
        EXPECT_GT(a10, RL(0.0)) << opt;
        EXPECT_GT(a100, a10) << opt;
        EXPECT_EQ(a100, VolumeAbsorption(RL(100.0), water, opt)) << opt;
    }
    // The formulas agree to within a factor of two at 38 kHz
    real aA = AbsorptionCoeff(RL(38.0), water, 'A');
    real aF = AbsorptionCoeff(RL(38.0), water, 'F');
    EXPECT_LT(aA / aF, RL(2.0));
    EXPECT_GT(aA / aF, RL(0.5));
}

TEST_F(SeawaterTest, UnknownAbsorptionFormulaThrows)
{
    EXPECT_FALSE(IsValidAbsorptionOpt('X'));
    EXPECT_THROW(AbsorptionCoeff(RL(10.0), water, 'X'), std::runtime_error);
}
