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

// related third party imports
#include <gtest/gtest.h>

// local application imports
#include "data/datarequest.h"

using namespace MetMC;


TEST(DataRequestTest, KeysAreSorted)
{
    MDataRequestHelper rh;
    rh.insert("VARIABLE", QString("sst"));
    rh.insert("CHUNK", QVector<int>() << 0 << 1 << 2);
    rh.insert("MEMBER", 3);

    EXPECT_EQ(rh.request(), QString("CHUNK=0/1/2;MEMBER=3;VARIABLE=sst;"));
}


TEST(DataRequestTest, ParsesRequest)
{
    MDataRequestHelper rh("CHUNK=0/1/2;MEMBER=3;VARIABLE=sst;");

    EXPECT_TRUE(rh.contains("VARIABLE"));
    EXPECT_FALSE(rh.contains("QUANTITY"));
    EXPECT_EQ(rh.value("VARIABLE"), QString("sst"));
    EXPECT_EQ(rh.intValue("MEMBER"), 3);
    EXPECT_EQ(rh.intVectorValue("CHUNK"), (QVector<int>() << 0 << 1 << 2));
    EXPECT_TRUE(rh.intVectorValue("QUANTITY").isEmpty());
}


TEST(DataRequestTest, DoubleValuesSurviveTheRequestString)
{
    MDataRequestHelper rh;
    rh.insert("FWHM", 0.1 + 0.2);

    MDataRequestHelper parsed(rh.request());
    EXPECT_EQ(parsed.doubleValue("FWHM"), 0.1 + 0.2);
}


TEST(DataRequestTest, RemoveAllKeysExcept)
{
    MDataRequestHelper rh("CHUNK=0/0/1;QUANTITY=VARIANCE;SOURCE=reducer;"
                          "VARIABLE=sst;");
    rh.removeAllKeysExcept(QStringList() << "VARIABLE" << "CHUNK");

    EXPECT_EQ(rh.request(), QString("CHUNK=0/0/1;VARIABLE=sst;"));
    EXPECT_TRUE(rh.containsAll(QStringList() << "VARIABLE" << "CHUNK"));
    EXPECT_FALSE(rh.containsAll(QStringList() << "VARIABLE" << "SOURCE"));
}


TEST(DataRequestTest, EqualRequestsHaveEqualStrings)
{
    MDataRequestHelper a;
    a.insert("VARIABLE", QString("chl"));
    a.insert("CHUNK", QVector<int>() << 0 << 0 << 0);

    MDataRequestHelper b;
    b.insert("CHUNK", QVector<int>() << 0 << 0 << 0);
    b.insert("VARIABLE", QString("chl"));

    EXPECT_EQ(a.request(), b.request());
}
