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
#include <QtCore>

// local application imports
#include "system/sourcetypeschema.h"
#include "util/mexception.h"
#include "testdatasets.h"

using namespace MetMC;


class SourceTypeSchemaTest : public ::testing::Test
{
protected:
    SourceTypeSchemaTest() : numFiles(0) {}

    void SetUp() override
    {
        ASSERT_TRUE(tmpDir.isValid());
    }

    QString writeSchemaFile(const QString &content)
    {
        // QSettings caches parsed files by name.
        QString filename = tmpDir.filePath(
                    QString("sourcetypes%1.cfg").arg(numFiles++));
        QFile file(filename);
        file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text);
        file.write(content.toUtf8());
        file.close();
        return filename;
    }

    QTemporaryDir tmpDir;
    int numFiles;
};


TEST_F(SourceTypeSchemaTest, ReadsScatterAndCollectArrays)
{
    QString filename = writeSchemaFile(
                "[esa-cci-oc]\n"
                "scatter\\size=2\n"
                "scatter\\1\\name=chlor_a\n"
                "scatter\\1\\distribution=chlorophyll\n"
                "scatter\\1\\bias=chlor_a_log10_bias\n"
                "scatter\\1\\rmsd=chlor_a_log10_rmsd\n"
                "scatter\\1\\clipMin=0\n"
                "scatter\\2\\name=Rrs_443\n"
                "scatter\\2\\uncertainty=0.002\n"
                "scatter\\2\\coverage=2\n"
                "collect\\size=1\n"
                "collect\\1\\name=chlor_a\n"
                "collect\\1\\filter=true\n"
                "collect\\1\\attrsPop=valid_min, valid_max\n"
                "collect\\1\\attrs=\"long_name=chlorophyll uncertainty\", "
                "\"units=mg m-3\"\n");

    MSourceTypeRegistry registry;
    registry.loadFromFile(filename);

    ASSERT_TRUE(registry.contains("esa-cci-oc"));
    MSourceTypeSchema schema = registry.resolve("esa-cci-oc");
    EXPECT_EQ(schema.getTag(), QString("esa-cci-oc"));
    ASSERT_EQ(schema.getScatterVariables().size(), 2);

    const MScatterVariableSchema *chl = schema.findScatterVariable("chlor_a");
    ASSERT_NE(chl, nullptr);
    EXPECT_EQ(chl->distribution, CHLOROPHYLL_DISTRIBUTION);
    EXPECT_EQ(chl->uncertaintySource,
              MScatterVariableSchema::UNCERTAINTY_BIAS_RMSD);
    EXPECT_EQ(chl->biasVariable, QString("chlor_a_log10_bias"));
    EXPECT_EQ(chl->rmsdVariable, QString("chlor_a_log10_rmsd"));
    EXPECT_TRUE(chl->hasClipMin);
    EXPECT_EQ(chl->clipMin, 0.);
    EXPECT_FALSE(chl->hasClipMax);
    EXPECT_EQ(chl->inputVariables(),
              QStringList() << "chlor_a_log10_bias" << "chlor_a_log10_rmsd");

    const MScatterVariableSchema *rrs = schema.findScatterVariable("Rrs_443");
    ASSERT_NE(rrs, nullptr);
    EXPECT_EQ(rrs->distribution, NORMAL_DISTRIBUTION);
    EXPECT_EQ(rrs->uncertaintySource,
              MScatterVariableSchema::UNCERTAINTY_CONSTANT);
    EXPECT_DOUBLE_EQ(rrs->uncertaintyConstant, 0.002);
    EXPECT_EQ(rrs->coverage, 2.);
    EXPECT_FALSE(rrs->relative);
    EXPECT_TRUE(rrs->inputVariables().isEmpty());

    const MCollectVariableSchema *collect =
            schema.findCollectVariable("chlor_a");
    ASSERT_NE(collect, nullptr);
    EXPECT_EQ(collect->uncertaintyName, QString("chlor_a_unc"));
    EXPECT_EQ(collect->filteredUncertaintyName(),
              QString("chlor_a_unc_filtered"));
    EXPECT_TRUE(collect->filter);
    EXPECT_EQ(collect->attributesToRemove,
              QStringList() << "valid_min" << "valid_max");
    ASSERT_EQ(collect->attributesToAdd.size(), 2);
    EXPECT_EQ(collect->attributesToAdd[0].first, QString("long_name"));
    EXPECT_EQ(collect->attributesToAdd[0].second,
              QString("chlorophyll uncertainty"));
    EXPECT_EQ(collect->attributesToAdd[1].first, QString("units"));
    EXPECT_EQ(collect->attributesToAdd[1].second, QString("mg m-3"));

    EXPECT_EQ(schema.findScatterVariable("Rrs_555"), nullptr);
    EXPECT_EQ(schema.findCollectVariable("Rrs_443"), nullptr);
}


TEST_F(SourceTypeSchemaTest, UncertaintyVariableAndTotal)
{
    QString filename = writeSchemaFile(
                "[synthetic]\n"
                "scatter\\size=2\n"
                "scatter\\1\\name=sst\n"
                "scatter\\1\\uncertainty=sst_uncertainty\n"
                "scatter\\2\\name=sst_total\n"
                "scatter\\2\\total=sst\n"
                "collect\\size=1\n"
                "collect\\1\\name=sst\n"
                "collect\\1\\uncertainty=sst_std\n");

    MSourceTypeRegistry registry;
    registry.loadFromFile(filename);
    MSourceTypeSchema schema = registry.resolve("synthetic");

    const MScatterVariableSchema *sst = schema.findScatterVariable("sst");
    ASSERT_NE(sst, nullptr);
    EXPECT_EQ(sst->uncertaintySource,
              MScatterVariableSchema::UNCERTAINTY_VARIABLE);
    EXPECT_EQ(sst->uncertaintyVariable, QString("sst_uncertainty"));

    const MScatterVariableSchema *total =
            schema.findScatterVariable("sst_total");
    ASSERT_NE(total, nullptr);
    EXPECT_EQ(total->uncertaintySource,
              MScatterVariableSchema::TOTAL_PERTURBATION);
    EXPECT_EQ(total->totalVariables, QStringList() << "sst");

    EXPECT_EQ(schema.findCollectVariable("sst")->uncertaintyName,
              QString("sst_std"));
    EXPECT_FALSE(schema.findCollectVariable("sst")->filter);
}


TEST_F(SourceTypeSchemaTest, NestedTotalIsRejected)
{
    QString filename = writeSchemaFile(
                "[synthetic]\n"
                "scatter\\size=3\n"
                "scatter\\1\\name=a\n"
                "scatter\\1\\uncertainty=0.1\n"
                "scatter\\2\\name=b\n"
                "scatter\\2\\total=a\n"
                "scatter\\3\\name=c\n"
                "scatter\\3\\total=b\n");

    MSourceTypeRegistry registry;
    EXPECT_THROW(registry.loadFromFile(filename), MConfigurationError);
}


TEST_F(SourceTypeSchemaTest, TotalOfUnknownVariableIsRejected)
{
    MSourceTypeSchema schema("synthetic");
    MScatterVariableSchema total;
    total.name = "sst_total";
    total.uncertaintySource = MScatterVariableSchema::TOTAL_PERTURBATION;
    total.totalVariables << "sst";
    schema.addScatterVariable(total);

    MSourceTypeRegistry registry;
    EXPECT_THROW(registry.registerSchema(schema), MConfigurationError);
    EXPECT_FALSE(registry.contains("synthetic"));
}


TEST_F(SourceTypeSchemaTest, InvalidEntriesAreRejected)
{
    MSourceTypeRegistry registry;

    EXPECT_THROW(registry.loadFromFile(writeSchemaFile(
                     "[t]\nscatter\\size=1\nscatter\\1\\name=x\n"
                     "scatter\\1\\distribution=uniform\n"
                     "scatter\\1\\uncertainty=0.1\n")),
                 MConfigurationError);

    EXPECT_THROW(registry.loadFromFile(writeSchemaFile(
                     "[t]\nscatter\\size=1\nscatter\\1\\name=x\n")),
                 MConfigurationError);

    EXPECT_THROW(registry.loadFromFile(writeSchemaFile(
                     "[t]\nscatter\\size=1\nscatter\\1\\name=x\n"
                     "scatter\\1\\uncertainty=0.1\n"
                     "scatter\\1\\clipMin=1\nscatter\\1\\clipMax=0\n")),
                 MConfigurationError);

    EXPECT_THROW(registry.loadFromFile(writeSchemaFile(
                     "[t]\nscatter\\size=1\nscatter\\1\\name=x\n"
                     "scatter\\1\\uncertainty=0.1\n"
                     "scatter\\1\\coverage=0\n")),
                 MConfigurationError);

    EXPECT_THROW(registry.loadFromFile(writeSchemaFile(
                     "[t]\ncollect\\size=1\ncollect\\1\\name=x\n"
                     "collect\\1\\attrs=no_separator\n")),
                 MConfigurationError);

    EXPECT_THROW(registry.loadFromFile(writeSchemaFile(
                     "[t]\nscatter\\size=2\nscatter\\1\\name=x\n"
                     "scatter\\1\\uncertainty=0.1\n"
                     "scatter\\2\\name=x\n"
                     "scatter\\2\\uncertainty=0.2\n")),
                 MConfigurationError);
}


TEST_F(SourceTypeSchemaTest, MissingFileIsRejected)
{
    MSourceTypeRegistry registry;
    EXPECT_THROW(registry.loadFromFile(tmpDir.filePath("missing.cfg")),
                 MConfigurationError);
}


TEST_F(SourceTypeSchemaTest, UnknownSourceTypeIsRejected)
{
    MSourceTypeRegistry registry;
    registry.registerSchema(MSourceTypeSchema("synthetic"));

    EXPECT_TRUE(registry.contains("synthetic"));
    EXPECT_THROW(registry.resolve("esa-cci-sst"), MConfigurationError);
}


TEST_F(SourceTypeSchemaTest, ShippedSchemasAreValid)
{
    MSourceTypeRegistry registry = Test::shippedRegistry();

    EXPECT_TRUE(registry.contains("esa-cci-sst"));
    EXPECT_TRUE(registry.contains("esa-cci-oc"));
    EXPECT_TRUE(registry.contains("cmems-bgc"));
    EXPECT_TRUE(registry.contains("synthetic"));

    MSourceTypeSchema sst = registry.resolve("esa-cci-sst");
    const MScatterVariableSchema *analysed =
            sst.findScatterVariable("analysed_sst");
    ASSERT_NE(analysed, nullptr);
    EXPECT_EQ(analysed->uncertaintyVariable,
              QString("analysed_sst_uncertainty"));
    EXPECT_TRUE(analysed->hasClipMin);
    EXPECT_DOUBLE_EQ(analysed->clipMin, 271.35);

    const MScatterVariableSchema *ice =
            sst.findScatterVariable("sea_ice_fraction");
    ASSERT_NE(ice, nullptr);
    EXPECT_TRUE(ice->hasClipMin);
    EXPECT_TRUE(ice->hasClipMax);
    EXPECT_EQ(ice->clipMax, 1.);

    MSourceTypeSchema oc = registry.resolve("esa-cci-oc");
    ASSERT_NE(oc.findScatterVariable("chlor_a"), nullptr);
    EXPECT_EQ(oc.findScatterVariable("chlor_a")->distribution,
              CHLOROPHYLL_DISTRIBUTION);

    MSourceTypeSchema synthetic = registry.resolve("synthetic");
    EXPECT_EQ(synthetic.getScatterVariables().size(), 3);
    EXPECT_EQ(synthetic.getCollectVariables().size(), 2);
    EXPECT_TRUE(synthetic.findScatterVariable("chl")->relative);
}
