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
#include <new>
#include <stdexcept>

// related third party imports
#include <gtest/gtest.h>
#include <QtCore>

// local application imports
#include "data/scheduler.h"
#include "system/applicationrunner.h"
#include "util/mexception.h"
#include "testdatasets.h"

using namespace MetMC;


TEST(ExitCodeTest, ErrorsAreMappedToExitCodes)
{
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  MConfigurationError("x", __FILE__, __LINE__)), 128);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  MKeyError("x", __FILE__, __LINE__)), 128);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  MValueError("x", __FILE__, __LINE__)), 128);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  MInterruptError("x", __FILE__, __LINE__)), 130);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  MMemoryError("x", __FILE__, __LINE__)), 131);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(std::bad_alloc()), 131);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  MIOError("x", __FILE__, __LINE__)), 132);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  MComputationError("x", __FILE__, __LINE__)), 133);
    EXPECT_EQ(MApplicationRunner::exitCodeFor(
                  std::runtime_error("x")), 255);
}


class EndToEndTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmpDir.isValid());
        ASSERT_TRUE(QDir(tmpDir.path()).mkdir("ensemble"));

        sourcePath = tmpDir.filePath("20100101-synthetic.nc");
        Test::writeSyntheticDataset(sourcePath);

        configFile = tmpDir.filePath("metmc.cfg");
        QSettings config(configFile, QSettings::IniFormat);
        config.setValue("Processing/mode", "multithreading");
        config.setValue("Processing/workers", 3);
        config.setValue("Processing/memoryLimit_MB", 64);
        config.setValue("SourceTypes/schemaFile", Test::shippedSchemaFile());
        config.setValue("Logging/level", "error");
        config.sync();
        ASSERT_EQ(config.status(), QSettings::NoError);
    }

    void TearDown() override
    {
        MAbstractScheduler::clearInterruption();
    }

    int scatter(int selector, const QString &target,
                const QStringList &options = QStringList())
    {
        QStringList arguments;
        arguments << "metmc-scatter" << "--config" << configFile
                  << "--source-type" << "synthetic"
                  << "--selector" << QString::number(selector)
                  << options << sourcePath << target;
        return MApplicationRunner(SCATTER_OPERATION).run(arguments);
    }

    int collect(const QString &glob, const QString &target)
    {
        QStringList arguments;
        arguments << "metmc-collect" << "--config" << configFile
                  << "--source-type" << "synthetic" << glob << target;
        return MApplicationRunner(COLLECT_OPERATION).run(arguments);
    }

    QString memberPath(int selector) const
    {
        return tmpDir.filePath(QString("ensemble/member-%1.nc")
                               .arg(selector, 3, 10, QChar('0')));
    }

    QTemporaryDir tmpDir;
    QString sourcePath;
    QString configFile;
};


TEST_F(EndToEndTest, ScatterAndCollect)
{
    // The synthetic dataset is stored in 2 x 2 chunks per time step.
    QString first = memberPath(17);
    QString second = tmpDir.filePath("selector17-synchronous.nc");
    ASSERT_EQ(scatter(17, first), 0);
    ASSERT_EQ(scatter(17, second, QStringList() << "--mode"
                      << "synchronous"), 0);
    EXPECT_EQ(Test::readRawVariable(first, "sst"),
              Test::readRawVariable(second, "sst"));

    // Perturbed values stay within six standard deviations (0.5 K) of the
    // nominal values.
    QVector<float> nominal = Test::readVariable(sourcePath, "sst");
    QVector<float> perturbed = Test::readVariable(first, "sst");
    ASSERT_EQ(perturbed.size(), nominal.size());
    int numChanged = 0;
    for (int i = 0; i < nominal.size(); i++)
    {
        if (Test::missingCells().contains(i))
        {
            EXPECT_TRUE(std::isnan(perturbed[i]));
            continue;
        }
        EXPECT_LE(std::fabs(perturbed[i] - nominal[i]), 6. * 0.5)
                << "cell " << i;
        EXPECT_GE(perturbed[i], 271.35f) << "cell " << i;
        if (perturbed[i] != nominal[i]) numChanged++;
    }
    EXPECT_GT(numChanged, 0);

    // Nominal member and the variants 17 to 26.
    ASSERT_EQ(scatter(0, memberPath(0)), 0);
    const int numVariants = 10;
    for (int selector = 18; selector < 17 + numVariants; selector++)
    {
        ASSERT_EQ(scatter(selector, memberPath(selector)), 0)
                << "selector " << selector;
    }

    QString target = tmpDir.filePath("uncertainty.nc");
    ASSERT_EQ(collect(tmpDir.filePath("ensemble/member-*.nc"), target), 0);

    EXPECT_EQ(Test::globalIntegerAttribute(target,
                                           "monte_carlo_ensemble_size"),
              numVariants);

    QVector<float> sstUnc = Test::readVariable(target, "sst_unc");
    QVector<float> filtered = Test::readVariable(target, "sst_unc_filtered");
    QVector<float> chlUnc = Test::readVariable(target, "chl_unc");

    double sumSST = 0.;
    double sumRelativeChl = 0.;
    double minRaw = 1.e30, maxRaw = -1.e30;
    double minFiltered = 1.e30, maxFiltered = -1.e30;
    int n = 0;
    for (int i = 0; i < sstUnc.size(); i++)
    {
        if (Test::missingCells().contains(i))
        {
            EXPECT_TRUE(std::isnan(sstUnc[i]));
            EXPECT_TRUE(std::isnan(chlUnc[i]));
            continue;
        }
        ASSERT_FALSE(std::isnan(sstUnc[i])) << "cell " << i;
        ASSERT_FALSE(std::isnan(filtered[i])) << "cell " << i;
        ASSERT_FALSE(std::isnan(chlUnc[i])) << "cell " << i;
        EXPECT_GT(sstUnc[i], 0.f);
        EXPECT_GT(chlUnc[i], 0.f);

        sumSST += sstUnc[i];
        sumRelativeChl += chlUnc[i] / Test::nominalChl(i);
        minRaw = qMin(minRaw, double(sstUnc[i]));
        maxRaw = qMax(maxRaw, double(sstUnc[i]));
        minFiltered = qMin(minFiltered, double(filtered[i]));
        maxFiltered = qMax(maxFiltered, double(filtered[i]));
        n++;
    }

    // The simulated errors have a standard deviation of 0.5 K (sst) and
    // of 10 per cent (chl).
    EXPECT_NEAR(sumSST / n, 0.5, 0.1);
    EXPECT_NEAR(sumRelativeChl / n, 0.1, 0.03);
    EXPECT_LT(maxFiltered - minFiltered, maxRaw - minRaw);

    // The nominal dataset is passed through.
    EXPECT_EQ(Test::readRawVariable(target, "sst"),
              Test::readRawVariable(sourcePath, "sst"));
}


TEST_F(EndToEndTest, AntitheticOptionIsRecorded)
{
    QString target = tmpDir.filePath("member.nc");
    ASSERT_EQ(scatter(2, target, QStringList() << "--antithetic"
                      << "--mode" << "synchronous"), 0);

    EXPECT_EQ(Test::globalIntegerAttribute(target, "monte_carlo_selector"),
              2);
    EXPECT_EQ(Test::globalIntegerAttribute(target, "monte_carlo_antithetic"),
              1);
}


TEST_F(EndToEndTest, ErrorsAreReportedByExitCode)
{
    QString target = tmpDir.filePath("member.nc");

    // Argument errors.
    EXPECT_EQ(scatter(1, target, QStringList() << "--unknown-option"), 128);
    EXPECT_EQ(scatter(1, target, QStringList() << "--workers" << "0"), 128);
    EXPECT_EQ(scatter(-3, target), 128);

    // Configuration errors.
    QStringList arguments;
    arguments << "metmc-scatter" << "--config" << configFile
              << "--source-type" << "unknown" << "--selector" << "1"
              << sourcePath << target;
    EXPECT_EQ(MApplicationRunner(SCATTER_OPERATION).run(arguments), 128);
    EXPECT_EQ(collect(tmpDir.filePath("ensemble/member-*.nc"), target), 128);

    // I/O errors.
    QStringList missing;
    missing << "metmc-scatter" << "--config" << configFile
            << "--source-type" << "synthetic" << "--selector" << "1"
            << tmpDir.filePath("missing.nc") << target;
    EXPECT_EQ(MApplicationRunner(SCATTER_OPERATION).run(missing), 132);

    EXPECT_FALSE(QFileInfo(target).exists());
}


TEST_F(EndToEndTest, HelpAndVersion)
{
    EXPECT_EQ(MApplicationRunner(SCATTER_OPERATION).run(
                  QStringList() << "metmc-scatter" << "--help"), 0);
    EXPECT_EQ(MApplicationRunner(COLLECT_OPERATION).run(
                  QStringList() << "metmc-collect" << "--version"), 0);
}
