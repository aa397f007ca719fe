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

// related third party imports
#include <gtest/gtest.h>
#include <QtCore>

// local application imports
#include "data/chunkreadersource.h"
#include "data/chunkstore.h"
#include "data/ensemblereducersource.h"
#include "data/randomstream.h"
#include "data/scheduler.h"
#include "util/mexception.h"
#include "testdatasets.h"

using namespace MetMC;


class EnsembleReducerTest : public ::testing::Test
{
protected:
    EnsembleReducerTest()
        : store("reducer-test", 256 * 1024),
          layout(QStringList() << "time" << "lat" << "lon",
                 QVector<size_t>() << 1 << Test::numLat << Test::numLon,
                 QVector<size_t>() << 1 << Test::chunkLat << Test::chunkLon)
    {}

    void SetUp() override
    {
        ASSERT_TRUE(tmpDir.isValid());
    }

    void TearDown() override
    {
        qDeleteAll(readers);
        qDeleteAll(datasets);
    }

    /**
      Writes the nominal dataset followed by one member per offset and
      returns a reader for each of them.
     */
    QList<MChunkReaderSource*> createEnsemble(const QList<float> &offsets)
    {
        QList<float> allOffsets;
        allOffsets << 0.f << offsets;

        for (int m = 0; m < allOffsets.size(); m++)
        {
            QString path = tmpDir.filePath(QString("member%1.nc").arg(m));
            Test::writeSyntheticDataset(path, allOffsets[m]);

            MGridDataset *dataset = new MGridDataset(path, NETCDF4_ENGINE);
            datasets << dataset;

            MChunkReaderSource *reader = new MChunkReaderSource(
                        QString("member%1").arg(m), dataset);
            reader->setChunkStore(&store);
            reader->setChunkLayout("sst", layout);
            readers << reader;
        }
        return readers;
    }

    /**
      Writes the nominal dataset followed by @p numVariants members whose
      "sst" is perturbed by independent normal noise of standard deviation
      @p sigma, and returns a reader for each of them. Readers of a previous
      ensemble are deleted.
     */
    QList<MChunkReaderSource*> createNoisyEnsemble(int numVariants,
                                                   float sigma)
    {
        qDeleteAll(readers);
        readers.clear();
        qDeleteAll(datasets);
        datasets.clear();

        QString directory = QString("noisy%1").arg(numVariants);
        EXPECT_TRUE(QDir(tmpDir.path()).mkdir(directory));
        QUuid noiseId = MStreamGenerator::variableIdentity("sst", directory);

        for (int m = 0; m <= numVariants; m++)
        {
            QString path = tmpDir.filePath(
                        QString("%1/member%2.nc").arg(directory).arg(m));
            if (m == 0)
            {
                Test::writeSyntheticDataset(path);
            }
            else
            {
                MRandomStream stream = MStreamGenerator::derive(
                            m, noiseId, QVector<int>());
                QVector<float> noise(Test::numLat * Test::numLon);
                for (int i = 0; i < noise.size(); i++)
                    noise[i] = sigma * float(stream.nextNormal());
                Test::writeSyntheticDataset(path, noise);
            }

            MGridDataset *dataset = new MGridDataset(path, NETCDF4_ENGINE);
            datasets << dataset;

            MChunkReaderSource *reader = new MChunkReaderSource(
                        QString("member%1").arg(m), dataset);
            reader->setChunkStore(&store);
            reader->setChunkLayout("sst", layout);
            readers << reader;
        }
        return readers;
    }

    QVector<float> reduce(MEnsembleReducerSource *reducer,
                          const QString &quantity, int numWorkers = 1)
    {
        reducer->setChunkStore(&store);

        MDataRequestHelper rh;
        rh.insert("VARIABLE", QString("sst"));
        rh.insert("QUANTITY", quantity);
        Test::MFieldCollector collector(reducer, layout, rh.request());
        collector.setChunkStore(&store);

        MTaskGraph graph;
        collector.addToTaskGraph(&graph);
        MMultiThreadScheduler scheduler(numWorkers);
        scheduler.executeTaskGraph(&graph);

        EXPECT_EQ(store.numStoredItems(), 0);
        return collector.getField();
    }

    QTemporaryDir tmpDir;
    MChunkStore store;
    MChunkLayout layout;
    QList<MGridDataset*> datasets;
    QList<MChunkReaderSource*> readers;
};


TEST_F(EnsembleReducerTest, UnbiasedSampleVariance)
{
    MEnsembleReducerSource reducer(
                "reducer", createEnsemble(QList<float>() << 0.1f << -0.1f
                                          << 0.3f));
    EXPECT_EQ(reducer.numVariants(), 3);

    QVector<float> variance = reduce(&reducer, "VARIANCE", 4);
    ASSERT_EQ(variance.size(), Test::numLat * Test::numLon);

    for (int i = 0; i < variance.size(); i++)
    {
        if (Test::missingCells().contains(i))
        {
            EXPECT_TRUE(std::isnan(variance[i])) << "cell " << i;
        }
        else
        {
            // Deviations from the mean are 0, -0.2 and 0.2.
            EXPECT_NEAR(variance[i], 0.04, 1.e-4) << "cell " << i;
        }
    }

    // The ensemble mean departs from the nominal value by less than one
    // standard error.
    EXPECT_EQ(reducer.numInconsistentCells("sst"), 0);
}


TEST_F(EnsembleReducerTest, UncertaintyConvergesToInjectedNoise)
{
    const float sigma = 0.3f;
    QList<int> ensembleSizes;
    ensembleSizes << 10 << 100 << 400;

    QList<double> meanErrors;
    foreach (int numVariants, ensembleSizes)
    {
        MEnsembleReducerSource reducer(
                    "reducer", createNoisyEnsemble(numVariants, sigma));
        ASSERT_EQ(reducer.numVariants(), numVariants);

        QVector<float> uncertainty = reduce(&reducer, "UNCERTAINTY", 4);

        // Relative standard error of the sample standard deviation.
        double standardError = 1. / std::sqrt(2. * (numVariants - 1));
        double sumOfErrors = 0.;
        int n = 0;
        for (int i = 0; i < uncertainty.size(); i++)
        {
            if (Test::missingCells().contains(i))
            {
                EXPECT_TRUE(std::isnan(uncertainty[i]));
                continue;
            }
            double error = std::fabs(uncertainty[i] / sigma - 1.);
            EXPECT_LT(error, 5. * standardError)
                    << "cell " << i << ", N = " << numVariants;
            sumOfErrors += error;
            n++;
        }
        meanErrors << sumOfErrors / n;

        // The noise has zero mean; a single cell beyond four standard
        // errors is within chance.
        EXPECT_LE(reducer.numInconsistentCells("sst"), 1)
                << "N = " << numVariants;
    }

    EXPECT_LT(meanErrors[1], meanErrors[0]);
    EXPECT_LT(meanErrors[2], meanErrors[1]);
    EXPECT_LT(meanErrors[2], 0.05);
}


TEST_F(EnsembleReducerTest, UncertaintyIsSquareRootOfVariance)
{
    MEnsembleReducerSource reducer(
                "reducer", createEnsemble(QList<float>() << 0.1f << -0.1f
                                          << 0.3f));

    QVector<float> uncertainty = reduce(&reducer, "UNCERTAINTY", 2);
    for (int i = 0; i < uncertainty.size(); i++)
    {
        if (Test::missingCells().contains(i))
            EXPECT_TRUE(std::isnan(uncertainty[i]));
        else
            EXPECT_NEAR(uncertainty[i], 0.2, 5.e-4);
    }
}


TEST_F(EnsembleReducerTest, SingleVariantYieldsMissingValues)
{
    MEnsembleReducerSource reducer(
                "reducer", createEnsemble(QList<float>() << 0.1f));
    EXPECT_EQ(reducer.numVariants(), 1);

    QVector<float> variance = reduce(&reducer, "VARIANCE");
    foreach (float v, variance) EXPECT_TRUE(std::isnan(v));
}


TEST_F(EnsembleReducerTest, BiasedEnsembleIsReportedAsInconsistent)
{
    MEnsembleReducerSource reducer(
                "reducer", createEnsemble(QList<float>() << 1.f << 1.1f
                                          << 0.9f));

    QVector<float> variance = reduce(&reducer, "VARIANCE", 3);
    EXPECT_NEAR(variance[0], 0.01, 1.e-4);

    // All cells with values are offset by ten standard errors.
    EXPECT_EQ(reducer.numInconsistentCells("sst"),
              qint64(Test::numLat * Test::numLon
                     - Test::missingCells().size()));
    EXPECT_EQ(reducer.numInconsistentCells("chl"), 0);
}


TEST_F(EnsembleReducerTest, EnsembleNeedsAtLeastOneVariant)
{
    QList<MChunkReaderSource*> members = createEnsemble(QList<float>());
    ASSERT_EQ(members.size(), 1);
    EXPECT_THROW(MEnsembleReducerSource("reducer", members),
                 MConfigurationError);
}


TEST_F(EnsembleReducerTest, UnknownQuantityIsRejected)
{
    MEnsembleReducerSource reducer(
                "reducer", createEnsemble(QList<float>() << 0.1f << 0.2f));
    reducer.setChunkStore(&store);

    MDataRequestHelper rh;
    rh.insert("VARIABLE", QString("sst"));
    rh.insert("QUANTITY", QString("MEAN"));
    rh.insert("CHUNK", QVector<int>() << 0 << 0 << 0);

    MTaskGraph graph;
    EXPECT_THROW(reducer.getTaskGraph(rh.request(), &graph), MValueError);
    EXPECT_EQ(graph.numTasks(), 0);
}
