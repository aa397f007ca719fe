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
#include <vector>

// related third party imports
#include <gtest/gtest.h>
#include <QtCore>

// local application imports
#include "data/griddataset.h"
#include "data/griddatasetwriter.h"
#include "util/mexception.h"
#include "testdatasets.h"

using namespace MetMC;


class GridDatasetTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmpDir.isValid());
        sourcePath = tmpDir.filePath("source.nc");
        Test::writeSyntheticDataset(sourcePath);
    }

    MChunkRegion fullRegion(const MGridVariableInfo &info) const
    {
        MChunkRegion region;
        for (int d = 0; d < info.dimensionSizes.size(); d++)
        {
            region.start << 0;
            region.count << info.dimensionSizes[d];
        }
        return region;
    }

    QTemporaryDir tmpDir;
    QString sourcePath;
};


TEST_F(GridDatasetTest, VariablesAndDimensions)
{
    MGridDataset dataset(sourcePath, NETCDF4_ENGINE);

    EXPECT_EQ(dataset.getVariableNames(),
              QStringList() << "chl" << "depth" << "lat" << "lon" << "mask"
              << "sst" << "sst_total" << "sst_uncertainty" << "time");
    EXPECT_EQ(dataset.getDataVariableNames(),
              QStringList() << "chl" << "depth" << "mask" << "sst"
              << "sst_total" << "sst_uncertainty");
    EXPECT_TRUE(dataset.hasVariable("sst"));
    EXPECT_FALSE(dataset.hasVariable("analysed_sst"));

    EXPECT_EQ(dataset.getDimensionSize("lat"), size_t(Test::numLat));
    EXPECT_EQ(dataset.getDimensionSize("lon"), size_t(Test::numLon));

    QVector<double> lons = dataset.getCoordinateValues("lon");
    ASSERT_EQ(lons.size(), Test::numLon);
    EXPECT_DOUBLE_EQ(lons[3], 90.);
    QVector<double> lats = dataset.getCoordinateValues("lat");
    EXPECT_DOUBLE_EQ(lats[0], -52.5);
}


TEST_F(GridDatasetTest, VariableInfo)
{
    MGridDataset dataset(sourcePath, NETCDF4_ENGINE);

    MGridVariableInfo sst = dataset.getVariableInfo("sst");
    EXPECT_EQ(sst.dimensionNames, QStringList() << "time" << "lat" << "lon");
    EXPECT_EQ(sst.dimensionSizes, QVector<size_t>() << 1 << Test::numLat
              << Test::numLon);
    EXPECT_EQ(sst.nativeChunkSizes, QVector<size_t>() << 1 << Test::chunkLat
              << Test::chunkLon);
    EXPECT_EQ(sst.latDimension, 1);
    EXPECT_EQ(sst.lonDimension, 2);
    EXPECT_FALSE(sst.isCoordinateVariable);
    EXPECT_TRUE(sst.encoding.hasFillValue);
    EXPECT_EQ(sst.encoding.fillValue, double(Test::fillValue));
    EXPECT_TRUE(dataset.isCyclicInLongitude(sst));

    MGridVariableInfo depth = dataset.getVariableInfo("depth");
    EXPECT_EQ(depth.latDimension, 0);
    EXPECT_EQ(depth.lonDimension, 1);

    EXPECT_TRUE(dataset.getVariableInfo("lat").isCoordinateVariable);
    EXPECT_THROW(dataset.getVariableInfo("analysed_sst"), MKeyError);

    // The layout resolved with the native chunking uses the stored chunks.
    MChunkLayout layout = sst.chunkLayout(MChunkingScheme(0, 0));
    EXPECT_EQ(layout.getChunkSizes(), sst.nativeChunkSizes);
    EXPECT_EQ(layout.totalNumChunks(), 4);
}


TEST_F(GridDatasetTest, ReadChunkDecodesMissingValues)
{
    MGridDataset dataset(sourcePath, NETCDF4_ENGINE);
    MGridVariableInfo info = dataset.getVariableInfo("sst");
    MChunkLayout layout = info.chunkLayout(MChunkingScheme(0, 0));

    // Chunk (0, 1, 1) covers lat 4..7 and lon 6..11.
    QVector<int> coordinates;
    coordinates << 0 << 1 << 1;
    QScopedPointer<MGridChunk> chunk(
                dataset.readChunk("sst", layout.region(coordinates)));
    ASSERT_EQ(chunk->getNumValues(), size_t(Test::chunkLat * Test::chunkLon));

    for (int j = 0; j < Test::chunkLat; j++)
    {
        for (int i = 0; i < Test::chunkLon; i++)
        {
            int cell = (4 + j) * Test::numLon + 6 + i;
            float value = chunk->data[j * Test::chunkLon + i];
            if (Test::missingCells().contains(cell))
                EXPECT_TRUE(std::isnan(value)) << "cell " << cell;
            else
                EXPECT_EQ(value, Test::nominalSST(cell)) << "cell " << cell;
        }
    }

    // Byte variables are decoded to float.
    QScopedPointer<MGridChunk> mask(
                dataset.readChunk("mask", fullRegion(
                                      dataset.getVariableInfo("mask"))));
    EXPECT_EQ(mask->data[0], 1.f);
    EXPECT_EQ(mask->data[5], 0.f);
}


TEST_F(GridDatasetTest, MissingDatasetIsRejected)
{
    EXPECT_THROW(MGridDataset(tmpDir.filePath("missing.nc"), NETCDF4_ENGINE),
                 MIOError);
}


TEST_F(GridDatasetTest, GridComparison)
{
    QString samePath = tmpDir.filePath("same.nc");
    QString otherPath = tmpDir.filePath("other.nc");
    Test::writeSyntheticDataset(samePath, 1.f);
    Test::writeDatasetOnOtherGrid(otherPath);

    MGridDataset dataset(sourcePath, NETCDF4_ENGINE);
    MGridDataset same(samePath, NETCDF4_ENGINE);
    MGridDataset other(otherPath, NETCDF4_ENGINE);

    QString reason;
    EXPECT_TRUE(dataset.hasSameGridAs(same, &reason));
    EXPECT_FALSE(dataset.hasSameGridAs(other, &reason));
    EXPECT_TRUE(reason.contains("lat")) << reason.toStdString();
}


TEST_F(GridDatasetTest, EngineResolution)
{
    EXPECT_EQ(MDatasetFile::resolveEngine("member.nc", ""), NETCDF4_ENGINE);
    EXPECT_EQ(MDatasetFile::resolveEngine("member.zarr", ""), ZARR_ENGINE);
    EXPECT_EQ(MDatasetFile::resolveEngine("member.nc", "h5netcdf"),
              H5NETCDF_ENGINE);
    EXPECT_THROW(MDatasetFile::resolveEngine("member.nc", "grib"),
                 MConfigurationError);

    EXPECT_EQ(stringToDatasetEngine("zarr"), ZARR_ENGINE);
    EXPECT_EQ(stringToDatasetEngine("hdf4"), INVALID_ENGINE);
    EXPECT_EQ(datasetEngineToString(NETCDF4_ENGINE), QString("netcdf4"));

    EXPECT_EQ(MDatasetFile::fileStem("/data/sst/20100101-sst.nc"),
              QString("20100101-sst"));
    EXPECT_EQ(MDatasetFile::netCDFPath("a.nc", NETCDF4_ENGINE),
              QString("a.nc"));
}


TEST_F(GridDatasetTest, WriterCommitsCompleteDataset)
{
    QString targetPath = tmpDir.filePath("target.nc");
    MGridDataset source(sourcePath, NETCDF4_ENGINE);
    MGridVariableInfo info = source.getVariableInfo("sst");
    MChunkLayout layout = info.chunkLayout(MChunkingScheme(-1, -1));

    {
        MGridDatasetWriter writer(targetPath, NETCDF4_ENGINE,
                                  MWriterSettings());
        EXPECT_EQ(writer.getIncompletePath(), targetPath + ".incomplete");
        EXPECT_TRUE(QFileInfo(writer.getIncompletePath()).exists());
        EXPECT_FALSE(QFileInfo(targetPath).exists());

        writer.copyDimensionsAndGlobalAttributes(source);
        writer.defineVariable(source, "sst", "sst_unc", &layout,
                              QStringList() << "valid_min" << "valid_max",
                              QList< QPair<QString, QString> >()
                              << qMakePair(QString("long_name"),
                                           QString("sst uncertainty")));
        EXPECT_TRUE(writer.hasVariable("sst_unc"));
        EXPECT_FALSE(writer.hasVariable("sst"));

        std::vector<long long> seed;
        seed.push_back(42);
        seed.push_back(7);
        writer.setVariableAttribute("sst_unc", "seed", seed);
        writer.setGlobalAttribute("monte_carlo_ensemble_size", 3);

        MGridChunk chunk("sst_unc", layout.region(QVector<int>() << 0 << 0
                                                  << 0));
        for (size_t i = 0; i < chunk.getNumValues(); i++)
            chunk.data[i] = Test::nominalSST(int(i));
        writer.writeChunk("sst_unc", chunk);

        MWrittenValueStatistics statistics = writer.getStatistics("sst_unc");
        EXPECT_EQ(statistics.count, size_t(Test::numLat * Test::numLon
                                           - Test::missingCells().size()));
        EXPECT_FLOAT_EQ(float(statistics.min), 271.5f);
        EXPECT_GT(statistics.stddev(), 0.);

        writer.commit();
        EXPECT_TRUE(writer.isCommitted());
    }

    EXPECT_TRUE(QFileInfo(targetPath).exists());
    EXPECT_FALSE(QFileInfo(targetPath + ".incomplete").exists());

    QVector<float> values = Test::readVariable(targetPath, "sst_unc");
    QVector<float> raw = Test::readRawVariable(targetPath, "sst_unc");
    for (int i = 0; i < values.size(); i++)
    {
        if (Test::missingCells().contains(i))
        {
            EXPECT_TRUE(std::isnan(values[i]));
            EXPECT_EQ(raw[i], Test::fillValue);
        }
        else
        {
            EXPECT_EQ(values[i], Test::nominalSST(i));
        }
    }

    EXPECT_EQ(Test::variableTextAttribute(targetPath, "sst_unc", "long_name"),
              QString("sst uncertainty"));
    EXPECT_EQ(Test::variableTextAttribute(targetPath, "sst_unc", "units"),
              QString("kelvin"));
    EXPECT_FALSE(Test::hasVariableAttribute(targetPath, "sst_unc",
                                            "valid_min"));
    EXPECT_EQ(Test::variableIntegerAttribute(targetPath, "sst_unc", "seed"),
              QVector<long long>() << 42 << 7);
    EXPECT_EQ(Test::globalIntegerAttribute(targetPath,
                                           "monte_carlo_ensemble_size"), 3);
    EXPECT_EQ(Test::globalTextAttribute(targetPath, "Conventions"),
              QString("CF-1.7"));
}


TEST_F(GridDatasetTest, UncommittedWriterLeavesNothingBehind)
{
    QString targetPath = tmpDir.filePath("target.nc");
    MGridDataset source(sourcePath, NETCDF4_ENGINE);

    {
        MGridDatasetWriter writer(targetPath, NETCDF4_ENGINE,
                                  MWriterSettings());
        writer.copyDimensionsAndGlobalAttributes(source);
        writer.defineVariable(source, "sst", "sst");
        EXPECT_THROW(writer.defineVariable(source, "analysed_sst", "x"),
                     MKeyError);
    }

    EXPECT_FALSE(QFileInfo(targetPath).exists());
    EXPECT_FALSE(QFileInfo(targetPath + ".incomplete").exists());
}


TEST_F(GridDatasetTest, CommitReplacesExistingTarget)
{
    QString targetPath = tmpDir.filePath("target.nc");
    Test::writeSyntheticDataset(targetPath, 10.f);

    MGridDataset source(sourcePath, NETCDF4_ENGINE);
    {
        MGridDatasetWriter writer(targetPath, NETCDF4_ENGINE,
                                  MWriterSettings());
        writer.copyDimensionsAndGlobalAttributes(source);
        writer.defineVariable(source, "sst", "sst");
        writer.copyVariableData(source, "sst");

        // The existing target is untouched until the commit.
        EXPECT_EQ(Test::readVariable(targetPath, "sst")[0],
                  Test::nominalSST(0) + 10.f);
        writer.commit();
    }

    EXPECT_EQ(Test::readVariable(targetPath, "sst")[0], Test::nominalSST(0));
    EXPECT_EQ(Test::readRawVariable(targetPath, "sst")[5], Test::fillValue);
}
