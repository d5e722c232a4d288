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
#include "material.hpp"

using namespace seaecho;

class GasTest : public ::testing::Test {
protected:
    void SetUp() override { water = SeawaterFromTSZ(RL(10.0), RL(100.0), RL(35.0), RL(8.0)); }

    SeawaterState water;
};

TEST_F(GasTest, LookupIsCaseInsensitive)
{
    ASSERT_NE(GetGasSpecies("AIR"), nullptr);
    EXPECT_EQ(GetGasSpecies("air"), GetGasSpecies("AIR"));
    EXPECT_EQ(GetGasSpecies(" Methane "), GetGasSpecies("METHANE"));
    EXPECT_EQ(GetGasSpecies("HELIUM"), nullptr);
    EXPECT_EQ(GetGasSpecies(nullptr), nullptr);
    EXPECT_EQ(GasSpeciesList(), "AIR METHANE");
}

TEST_F(GasTest, AirBubbleState)
{
    BubbleState b = GetGasSpecies("AIR")->Derive(water, RL(0.002));
    EXPECT_EQ(b.d, RL(0.002));
    EXPECT_EQ(b.gamma, RL(1.4));
    EXPECT_EQ(b.Mm, RL(28.96e-3));
    EXPECT_EQ(b.water.c, water.c);

    // Hydrostatic plus Laplace pressure, less the vapor pressure
    real Pg = water.P + RL(2.0) * water.sigma / RL(0.001) - water.Pv;
    EXPECT_NEAR(b.Pg, Pg, 1e-6);
    EXPECT_NEAR(b.Pg, 1107388.0, 5.0);
    EXPECT_NEAR(b.rho, 13.62, 0.01);
    EXPECT_NEAR(b.rho_0, 1.200, 0.001);
}

TEST_F(GasTest, SmallerBubblesHaveHigherPressure)
{
    const GasSpecies *air = GetGasSpecies("AIR");
    BubbleState small = air->Derive(water, RL(1e-5));
    BubbleState large = air->Derive(water, RL(1e-2));
    EXPECT_GT(small.Pg, large.Pg);
    EXPECT_GT(small.rho, large.rho);
}

TEST_F(GasTest, MethaneIsLighterThanAir)
{
    BubbleState air     = DeriveBubbleState(water, "AIR", RL(0.002));
    BubbleState methane = DeriveBubbleState(water, "methane", RL(0.002));
    EXPECT_EQ(methane.Pg, air.Pg);
    EXPECT_LT(methane.rho, air.rho);
    EXPECT_EQ(methane.gamma, RL(1.31));
}

TEST_F(GasTest, DeriveBubbleStateErrors)
{
    EXPECT_THROW(DeriveBubbleState(water, "XENON", RL(0.002)), std::runtime_error);
    EXPECT_THROW(DeriveBubbleState(water, "AIR", RL(0.0)), std::runtime_error);
    EXPECT_THROW(DeriveBubbleState(water, "AIR", RL(-0.001)), std::runtime_error);
}

TEST(MaterialTest, Catalog)
{
    const SolidMaterial *wc = FindSolidMaterial("tungstencarbide");
    ASSERT_NE(wc, nullptr);
    EXPECT_EQ(wc->rho, RL(14900.0));
    EXPECT_EQ(wc->c_lon, RL(6853.0));
    EXPECT_EQ(wc->c_trans, RL(4171.0));
    for(const SolidMaterial &m : SolidMaterials) {
        EXPECT_GT(m.c_lon, m.c_trans) << m.name;
        EXPECT_EQ(FindSolidMaterial(m.name), &m);
    }
    EXPECT_EQ(FindSolidMaterial("GOLD"), nullptr);
}

TEST(MaterialTest, GetSolidMaterial)
{
    SolidMaterial cu = GetSolidMaterial("Copper");
    EXPECT_STREQ(cu.name, "COPPER");
    EXPECT_EQ(cu.rho, RL(8940.0));
    EXPECT_THROW(GetSolidMaterial("GOLD"), std::runtime_error);
    EXPECT_THROW(GetSolidMaterial(nullptr), std::runtime_error);
}
