/******************************************************************************
**
**  This file is part of Met.MC -- a processor for the Monte Carlo simulation
**  of measurement uncertainty in gridded geophysical datasets.
**
**  Copyright 2026 The Met.MC developers
**
**  Met.MC is free software: you can redistribute it and/or modify
**  it under the terms of the GNU General Public License as published by
**  the Free Software Foundation, either version 3 of the License, or
**  (at your option) any later version.
**
**  Met.MC is distributed in the hope that it will be useful,
**  but WITHOUT ANY WARRANTY; without even the implied warranty of
**  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
**  GNU General Public License for more details.
**
**  You should have received a copy of the GNU General Public License
**  along with Met.MC.  If not, see <http://www.gnu.org/licenses/>.
**
*******************************************************************************/
// standard library imports
#include <cmath>
#include <limits>

// related third party imports
#include <gtest/gtest.h>

// local application imports
#include "data/cfcodec.h"

using namespace MetMC;


class CFCodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Packed sea surface temperature as found in ESA CCI products.
        packed.hasScaleFactor = true;
        packed.scaleFactor = 0.01;
        packed.hasAddOffset = true;
        packed.addOffset = 273.15;
        packed.hasFillValue = true;
        packed.fillValue = -32768.;
        packed.hasValidMin = true;
        packed.validMin = -300.;
        packed.hasValidMax = true;
        packed.validMax = 4500.;
        packed.integerStorage = true;
    }

    MCFEncoding packed;
};


TEST_F(CFCodecTest, DecodeAppliesScaleAndOffset)
{
    float values[] = { 0.f, 1000.f, -250.f };
    packed.decode(values, 3);

    EXPECT_NEAR(values[0], 273.15f, 1.e-4);
    EXPECT_NEAR(values[1], 283.15f, 1.e-4);
    EXPECT_NEAR(values[2], 270.65f, 1.e-4);
}


TEST_F(CFCodecTest, DecodeMarksMissingValues)
{
    float values[] = { -32768.f, -301.f, 4501.f,
                       std::numeric_limits<float>::quiet_NaN() };
    packed.decode(values, 4);

    for (int i = 0; i < 4; i++) EXPECT_TRUE(std::isnan(values[i])) << i;
}


TEST_F(CFCodecTest, EncodeRoundsIntegerStorage)
{
    float values[] = { 273.15f, 283.156f };
    packed.encode(values, 2);

    EXPECT_EQ(values[0], 0.f);
    EXPECT_EQ(values[1], 1001.f);
}


TEST_F(CFCodecTest, EncodeWritesFillValueForMissingValues)
{
    float values[] = { std::numeric_limits<float>::quiet_NaN() };
    packed.encode(values, 1);

    EXPECT_EQ(values[0], -32768.f);
    EXPECT_EQ(packed.packedMissingValue(), -32768.f);
}


TEST_F(CFCodecTest, EncodeClampsToValidRange)
{
    float values[] = { 400.f, 200.f };
    packed.encode(values, 2);

    EXPECT_EQ(values[0], 4500.f);
    EXPECT_EQ(values[1], -300.f);
}


TEST(CFEncodingTest, DefaultEncodingIsIdentity)
{
    MCFEncoding encoding;
    float values[] = { 1.5f, -2.25f, 1.e6f };
    encoding.decode(values, 3);
    EXPECT_EQ(values[0], 1.5f);
    EXPECT_EQ(values[1], -2.25f);
    EXPECT_EQ(values[2], 1.e6f);

    encoding.encode(values, 3);
    EXPECT_EQ(values[0], 1.5f);
    EXPECT_EQ(values[1], -2.25f);
    EXPECT_EQ(values[2], 1.e6f);

    EXPECT_TRUE(std::isnan(encoding.packedMissingValue()));
}
