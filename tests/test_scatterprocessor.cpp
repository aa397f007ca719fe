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
#include <memory>

// related third party imports
#include <gtest/gtest.h>
#include <QtCore>

// local application imports
#include "data/scheduler.h"
#include "processors/scatterprocessor.h"
#include "util/mexception.h"
#include "testdatasets.h"

using namespace MetMC;


class ScatterProcessorTest : public ::testing::Test
{
protected:
    ScatterProcessorTest()
        : registry(Test::shippedRegistry())
    {}

    void SetUp() override
    {
        ASSERT_TRUE(tmpDir.isValid());
        MAbstractScheduler::clearInterruption();
        sourcePath = tmpDir.filePath("20100101-synthetic.nc");
        Test::writeSyntheticDataset(sourcePath);
    }

    void TearDown() override
    {
        MAbstractScheduler::clearInterruption();
    }

    MProcessorConfiguration configuration(int selector,
                                          const QString &targetName)
    {
        MProcessorConfiguration config(SCATTER_OPERATION);
        config.sourcePath = sourcePath;
        config.targetPath = tmpDir.filePath(targetName);
        config.sourceType = "synthetic";
        config.selector = selector;
        config.mode = SYNCHRONOUS_MODE;
        config.memoryLimit_MB = 64;
        return config;
    }

    /**
      Runs the scatter processor with @p numWorkers worker threads (0 for
      the single thread scheduler) and returns the target path.
     */
    QString scatter(const MProcessorConfiguration &config, int numWorkers = 0)
    {
        std::unique_ptr<MAbstractScheduler> scheduler;
        if (numWorkers == 0) scheduler.reset(new MSingleThreadScheduler());
        else scheduler.reset(new MMultiThreadScheduler(numWorkers));

        MScatterProcessor processor(config, registry, scheduler.get());
        processor.run();
        EXPECT_EQ(processor.getState(), CLOSED_STATE);
        return config.targetPath;
    }

    MSourceTypeRegistry registry;
    QTemporaryDir tmpDir;
    QString sourcePath;
};


TEST_F(ScatterProcessorTest, ResultDoesNotDependOnTheScheduler)
{
    QString reference = scatter(configuration(3, "reference.nc"));
    QVector<float> sst = Test::readRawVariable(reference, "sst");
    QVector<float> chl = Test::readRawVariable(reference, "chl");

    QList<int> workerCounts;
    workerCounts << 1 << 2 << 4 << 8;
    foreach (int numWorkers, workerCounts)
    {
        MProcessorConfiguration config = configuration(
                    3, QString("workers%1.nc").arg(numWorkers));
        config.mode = MULTITHREADING_MODE;
        config.workers = numWorkers;
        QString target = scatter(config, numWorkers);

        EXPECT_EQ(Test::readRawVariable(target, "sst"), sst)
                << numWorkers << " workers";
        EXPECT_EQ(Test::readRawVariable(target, "chl"), chl)
                << numWorkers << " workers";
    }
}


TEST_F(ScatterProcessorTest, SelectorsYieldDifferentMembers)
{
    QVector<float> a = Test::readVariable(
                scatter(configuration(1, "a.nc")), "chl");
    QVector<float> b = Test::readVariable(
                scatter(configuration(2, "b.nc")), "chl");
    QVector<float> nominal = Test::readVariable(sourcePath, "chl");

    int numDifferent = 0;
    for (int i = 0; i < a.size(); i++)
    {
        if (std::isnan(nominal[i])) continue;
        EXPECT_GT(a[i], 0.f);
        EXPECT_NE(a[i], nominal[i]);
        if (a[i] != b[i]) numDifferent++;
    }
    EXPECT_EQ(numDifferent, a.size() - Test::missingCells().size());
}


TEST_F(ScatterProcessorTest, SelectorZeroCopiesTheSource)
{
    QString target = scatter(configuration(0, "nominal.nc"));

    MGridDataset source(sourcePath, NETCDF4_ENGINE);
    foreach (QString variableName, source.getVariableNames())
    {
        EXPECT_EQ(Test::readRawVariable(target, variableName),
                  Test::readRawVariable(sourcePath, variableName))
                << variableName.toStdString();
    }

    EXPECT_EQ(Test::globalIntegerAttribute(target, "monte_carlo_selector"),
              0);
    EXPECT_FALSE(Test::hasVariableAttribute(target, "sst", "seed"));
    EXPECT_EQ(Test::globalTextAttribute(target, "title"),
              QString("synthetic sea surface temperature"));
}


TEST_F(ScatterProcessorTest, ConstraintsAndMissingValues)
{
    int numClipped = 0;
    for (int selector = 1; selector <= 5; selector++)
    {
        QString target = scatter(configuration(
                                     selector,
                                     QString("member%1.nc").arg(selector)));
        QVector<float> sst = Test::readVariable(target, "sst");
        QVector<float> raw = Test::readRawVariable(target, "sst");

        for (int i = 0; i < sst.size(); i++)
        {
            if (Test::missingCells().contains(i))
            {
                EXPECT_TRUE(std::isnan(sst[i]));
                EXPECT_EQ(raw[i], Test::fillValue);
                continue;
            }
            EXPECT_GE(sst[i], 271.35f) << "cell " << i;
            if (sst[i] == 271.35f) numClipped++;
        }
    }

    // Cells close to the freezing point are clipped frequently.
    EXPECT_GT(numClipped, 0);
}


TEST_F(ScatterProcessorTest, TotalSumsThePerturbationsOfItsComponents)
{
    QString target = scatter(configuration(4, "member.nc"));

    QVector<float> sst = Test::readVariable(target, "sst");
    QVector<float> total = Test::readVariable(target, "sst_total");
    for (int i = 0; i < sst.size(); i++)
    {
        if (Test::missingCells().contains(i))
        {
            EXPECT_TRUE(std::isnan(total[i]));
            continue;
        }
        EXPECT_NEAR(total[i], sst[i] + 0.3f, 1.e-3) << "cell " << i;
    }

    // Sums do not draw random numbers of their own.
    EXPECT_TRUE(Test::hasVariableAttribute(target, "sst", "seed"));
    EXPECT_FALSE(Test::hasVariableAttribute(target, "sst_total", "seed"));
}


TEST_F(ScatterProcessorTest, AntitheticPairsAreMirrored)
{
    MProcessorConfiguration odd = configuration(5, "odd.nc");
    odd.antithetic = true;
    MProcessorConfiguration even = configuration(6, "even.nc");
    even.antithetic = true;

    QVector<float> a = Test::readVariable(scatter(odd), "sst");
    QVector<float> b = Test::readVariable(scatter(even), "sst");
    QVector<float> nominal = Test::readVariable(sourcePath, "sst");

    int numCompared = 0;
    for (int i = Test::numLon; i < a.size(); i++)
    {
        // The rows above the first are far from the constraint.
        if (std::isnan(nominal[i])) continue;
        EXPECT_NEAR(a[i] - nominal[i], -(b[i] - nominal[i]), 1.e-3)
                << "cell " << i;
        numCompared++;
    }
    EXPECT_GT(numCompared, 0);

    QVector<long long> seedOdd = Test::variableIntegerAttribute(
                odd.targetPath, "sst", "seed");
    QVector<long long> seedEven = Test::variableIntegerAttribute(
                even.targetPath, "sst", "seed");
    ASSERT_EQ(seedOdd.size(), 5);
    EXPECT_EQ(seedOdd, seedEven);
    EXPECT_EQ(seedOdd.last(), 3);
    EXPECT_EQ(Test::globalIntegerAttribute(even.targetPath,
                                           "monte_carlo_antithetic"), 1);
}


TEST_F(ScatterProcessorTest, MetadataOfTheMember)
{
    MProcessorConfiguration config = configuration(7, "member.nc");
    std::unique_ptr<MAbstractScheduler> scheduler(new MSingleThreadScheduler());
    MScatterProcessor processor(config, registry, scheduler.get());
    processor.run();

    EXPECT_EQ(processor.getPerturbedVariables(),
              QStringList() << "chl" << "sst" << "sst_total");
    EXPECT_EQ(processor.getGraphNames(), processor.getPerturbedVariables());

    QString target = config.targetPath;
    EXPECT_EQ(Test::globalIntegerAttribute(target, "monte_carlo_selector"),
              7);
    EXPECT_EQ(Test::globalIntegerAttribute(target, "monte_carlo_antithetic"),
              0);
    EXPECT_EQ(Test::variableIntegerAttribute(target, "sst", "seed").last(),
              7);
    EXPECT_EQ(Test::variableTextAttribute(target, "sst", "units"),
              QString("kelvin"));
    EXPECT_NE(Test::variableIntegerAttribute(target, "sst", "seed"),
              Test::variableIntegerAttribute(target, "chl", "seed"));
}


TEST_F(ScatterProcessorTest, UnperturbedVariablesAreCopied)
{
    QString target = scatter(configuration(2, "member.nc"));

    QStringList copied;
    copied << "mask" << "depth" << "sst_uncertainty" << "lat" << "lon"
           << "time";
    foreach (QString variableName, copied)
    {
        EXPECT_EQ(Test::readRawVariable(target, variableName),
                  Test::readRawVariable(sourcePath, variableName))
                << variableName.toStdString();
    }
}


TEST_F(ScatterProcessorTest, SourceWithoutSchemaVariablesIsCopied)
{
    MProcessorConfiguration config = configuration(3, "member.nc");
    config.sourceType = "esa-cci-oc";

    std::unique_ptr<MAbstractScheduler> scheduler(new MSingleThreadScheduler());
    MScatterProcessor processor(config, registry, scheduler.get());
    processor.run();

    EXPECT_TRUE(processor.getPerturbedVariables().isEmpty());
    EXPECT_EQ(Test::readRawVariable(config.targetPath, "sst"),
              Test::readRawVariable(sourcePath, "sst"));
}


TEST_F(ScatterProcessorTest, UnknownSourceTypeFails)
{
    MProcessorConfiguration config = configuration(1, "member.nc");
    config.sourceType = "esa-cci-salinity";

    MSingleThreadScheduler scheduler;
    MScatterProcessor processor(config, registry, &scheduler);
    EXPECT_THROW(processor.run(), MConfigurationError);
    EXPECT_EQ(processor.getState(), FAILED_STATE);
    EXPECT_FALSE(QFileInfo(config.targetPath).exists());

    // A processor can only be run once.
    EXPECT_THROW(processor.run(), MInitialisationError);
}


TEST_F(ScatterProcessorTest, InvalidInputFails)
{
    MSingleThreadScheduler scheduler;

    MProcessorConfiguration missing = configuration(1, "member.nc");
    missing.sourcePath = tmpDir.filePath("missing.nc");
    MScatterProcessor missingSource(missing, registry, &scheduler);
    EXPECT_THROW(missingSource.run(), MIOError);
    EXPECT_EQ(missingSource.getState(), FAILED_STATE);

    MProcessorConfiguration same = configuration(1, "member.nc");
    same.targetPath = sourcePath;
    MScatterProcessor sameTarget(same, registry, &scheduler);
    EXPECT_THROW(sameTarget.run(), MConfigurationError);
    EXPECT_TRUE(QFileInfo(sourcePath).exists());

    MProcessorConfiguration negative = configuration(-1, "member.nc");
    MScatterProcessor negativeSelector(negative, registry, &scheduler);
    EXPECT_THROW(negativeSelector.run(), MConfigurationError);

    MProcessorConfiguration collect(COLLECT_OPERATION);
    EXPECT_THROW(MScatterProcessor(collect, registry, &scheduler),
                 MValueError);
}


TEST_F(ScatterProcessorTest, InterruptionRemovesPartialOutput)
{
    MProcessorConfiguration config = configuration(1, "member.nc");
    MMultiThreadScheduler scheduler(2);
    MScatterProcessor processor(config, registry, &scheduler);

    MAbstractScheduler::requestInterruption();
    EXPECT_THROW(processor.run(), MInterruptError);
    EXPECT_EQ(processor.getState(), FAILED_STATE);

    EXPECT_FALSE(QFileInfo(config.targetPath).exists());
    EXPECT_FALSE(QFileInfo(config.targetPath + ".incomplete").exists());
}


TEST_F(ScatterProcessorTest, ExistingTargetIsReplaced)
{
    MProcessorConfiguration config = configuration(1, "member.nc");
    Test::writeDatasetOnOtherGrid(config.targetPath);

    scatter(config);

    MGridDataset target(config.targetPath, NETCDF4_ENGINE);
    EXPECT_EQ(target.getDimensionSize("lat"), size_t(Test::numLat));
    EXPECT_FALSE(QFileInfo(config.targetPath + ".incomplete").exists());
}
