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
#include "collectprocessor.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "data/datarequest.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MCollectProcessor::MCollectProcessor(const MProcessorConfiguration &config,
                                     const MSourceTypeRegistry &registry,
                                     MAbstractScheduler *scheduler)
    : MAbstractProcessor(config, registry, scheduler),
      readerEngine(INVALID_ENGINE),
      writerEngine(INVALID_ENGINE)
{
    if (config.operation != COLLECT_OPERATION)
        throw MValueError("collect processor requires a collect "
                          "configuration", __FILE__, __LINE__);
}


MCollectProcessor::~MCollectProcessor()
{
    // Sources need to be deleted before the datasets they read from.
    filteredWriterSource.reset();
    uncertaintyWriterSource.reset();
    filterSource.reset();
    reducerSource.reset();
    writer.reset();
    qDeleteAll(memberSources);
    qDeleteAll(members);
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

QStringList MCollectProcessor::expandSourceGlob(const QString &pattern)
{
    if (pattern.trimmed().isEmpty())
    {
        throw MConfigurationError("empty source glob", __FILE__, __LINE__);
    }

    QFileInfo info(pattern);
    QString directory = info.path();
    QString filePattern = info.fileName();

    QRegExp wildcard("[*?\\[]");
    if (directory.contains(wildcard))
    {
        throw MConfigurationError(
                    QString("malformed source glob '%1': wildcards are only "
                            "allowed in the file name").arg(pattern)
                    .toStdString(), __FILE__, __LINE__);
    }
    if (filePattern.isEmpty())
    {
        throw MConfigurationError(
                    QString("malformed source glob '%1': no file name "
                            "pattern").arg(pattern).toStdString(),
                    __FILE__, __LINE__);
    }

    QDir dir(directory);
    if (!dir.exists())
    {
        throw MConfigurationError(
                    QString("directory '%1' of source glob does not exist")
                    .arg(directory).toStdString(), __FILE__, __LINE__);
    }

    // Zarr stores are directories.
    QStringList names = dir.entryList(
                QStringList() << filePattern,
                QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot,
                QDir::Unsorted);
    qSort(names);

    if (names.isEmpty())
    {
        throw MConfigurationError(
                    QString("source glob '%1' does not match any dataset")
                    .arg(pattern).toStdString(), __FILE__, __LINE__);
    }

    QStringList paths;
    foreach (QString name, names) paths << dir.filePath(name);
    return paths;
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

void MCollectProcessor::validateInput()
{
    memberPaths = expandSourceGlob(config.sourcePath);
    if (memberPaths.size() < 2)
    {
        throw MConfigurationError(
                    QString("source glob '%1' matches only the nominal "
                            "dataset; at least one simulated variant is "
                            "required").arg(config.sourcePath).toStdString(),
                    __FILE__, __LINE__);
    }

    QString target = QFileInfo(config.targetPath).absoluteFilePath();
    foreach (QString path, memberPaths)
    {
        if (QFileInfo(path).absoluteFilePath() == target)
        {
            throw MConfigurationError("target dataset must not be a member "
                                      "of the ensemble", __FILE__, __LINE__);
        }
    }

    readerEngine = MDatasetFile::resolveEngine(memberPaths.first(),
                                               config.readerEngine);
    writerEngine = MDatasetFile::resolveEngine(config.targetPath,
                                               config.writerEngine);

    LOG4CPLUS_INFO(mlog, "ensemble of " << memberPaths.size() - 1
                   << " simulated variant(s), nominal dataset "
                   << memberPaths.first().toStdString());

    foreach (QString path, memberPaths)
    {
        LOG4CPLUS_DEBUG(mlog, "  member " << members.size() << ": "
                        << path.toStdString());
        members << new MGridDataset(path, readerEngine);
    }

    MGridDataset *nominal = members.first();

    // All members need to share the grid of the nominal dataset.
    for (int m = 1; m < members.size(); m++)
    {
        QString reason;
        if (!nominal->hasSameGridAs(*members[m], &reason))
        {
            throw MConfigurationError(
                        QString("ensemble member %1 does not match the "
                                "nominal dataset: %2").arg(memberPaths[m])
                        .arg(reason).toStdString(), __FILE__, __LINE__);
        }
    }

    foreach (QString variableName, nominal->getDataVariableNames())
    {
        const MCollectVariableSchema *variable =
                schema.findCollectVariable(variableName);
        if (variable == nullptr) continue;

        if (nominal->hasVariable(variable->uncertaintyName))
        {
            LOG4CPLUS_WARN(mlog, "nominal dataset already contains variable "
                           << variable->uncertaintyName.toStdString()
                           << "; skipping " << variableName.toStdString());
            continue;
        }

        MChunkLayout layout = nominal->getVariableInfo(variableName)
                .chunkLayout(config.chunking);

        for (int m = 1; m < members.size(); m++)
        {
            if (!members[m]->hasVariable(variableName))
            {
                throw MConfigurationError(
                            QString("ensemble member %1 does not contain "
                                    "variable '%2'").arg(memberPaths[m])
                            .arg(variableName).toStdString(),
                            __FILE__, __LINE__);
            }

            MChunkLayout memberLayout = members[m]->getVariableInfo(
                        variableName).chunkLayout(config.chunking);
            if (memberLayout != layout)
            {
                throw MConfigurationError(
                            QString("chunk layout of variable '%1' in "
                                    "ensemble member %2 (%3) differs from "
                                    "the nominal dataset (%4)")
                            .arg(variableName).arg(memberPaths[m])
                            .arg(memberLayout.toString())
                            .arg(layout.toString()).toStdString(),
                            __FILE__, __LINE__);
            }
        }

        collectedVariables << variableName;
        layouts.insert(variableName, layout);
        LOG4CPLUS_DEBUG(mlog, "layout of " << variableName.toStdString()
                        << ": " << layout.toString().toStdString());
    }

    if (collectedVariables.isEmpty())
    {
        LOG4CPLUS_WARN(mlog, "nominal dataset contains no variable of source "
                       "type " << config.sourceType.toStdString());
    }

    if (members.size() == 2 && !collectedVariables.isEmpty())
    {
        LOG4CPLUS_WARN(mlog, "ensemble contains a single simulated variant; "
                       "standard uncertainties are undefined (missing)");
    }
}


void MCollectProcessor::buildGraphs()
{
    MGridDataset *nominal = members.first();

    writer.reset(new MGridDatasetWriter(config.targetPath, writerEngine,
                                        config.writerSettings));
    writer->copyDimensionsAndGlobalAttributes(*nominal);

    foreach (QString variableName, nominal->getVariableNames())
    {
        writer->defineVariable(*nominal, variableName, variableName);
    }

    foreach (QString variableName, collectedVariables)
    {
        const MCollectVariableSchema *variable =
                schema.findCollectVariable(variableName);
        MChunkLayout layout = layouts.value(variableName);

        writer->defineVariable(*nominal, variableName,
                               variable->uncertaintyName, &layout,
                               variable->attributesToRemove,
                               uncertaintyAttributes(*variable, false));
        if (variable->filter)
        {
            writer->defineVariable(*nominal, variableName,
                                   variable->filteredUncertaintyName(),
                                   &layout, variable->attributesToRemove,
                                   uncertaintyAttributes(*variable, true));
        }
    }

    setSoftwareAttributes(writer.data());
    writer->setGlobalAttribute("monte_carlo_ensemble_size",
                               members.size() - 1);

    if (collectedVariables.isEmpty()) return;

    for (int m = 0; m < members.size(); m++)
    {
        MChunkReaderSource *memberSource = new MChunkReaderSource(
                    QString("member%1").arg(m), members[m]);
        memberSources << memberSource;
        memberSource->setChunkStore(getChunkStore());
        foreach (QString variableName, collectedVariables)
        {
            memberSource->setChunkLayout(variableName,
                                         layouts.value(variableName));
        }
    }

    reducerSource.reset(new MEnsembleReducerSource("reducer", memberSources));
    reducerSource->setChunkStore(getChunkStore());

    filterSource.reset(new MSmoothFilter("filter", reducerSource.data(),
                                         config.filterFwhm));
    filterSource->setChunkStore(getChunkStore());

    uncertaintyWriterSource.reset(new MChunkWriterSource(
                                      "uncertaintyTarget", writer.data(),
                                      reducerSource.data()));
    uncertaintyWriterSource->setChunkStore(getChunkStore());
    uncertaintyWriterSource->setProgressSink(getProgressSink());

    filteredWriterSource.reset(new MChunkWriterSource(
                                   "filteredTarget", writer.data(),
                                   filterSource.data()));
    filteredWriterSource->setChunkStore(getChunkStore());
    filteredWriterSource->setProgressSink(getProgressSink());

    foreach (QString variableName, collectedVariables)
    {
        const MCollectVariableSchema *variable =
                schema.findCollectVariable(variableName);
        const MChunkLayout &layout = layouts[variableName];
        MGridVariableInfo info = nominal->getVariableInfo(variableName);

        if (variable->filter)
        {
            MFilterGeometry geometry;
            geometry.layout = layout;
            geometry.latDimension = info.latDimension;
            geometry.lonDimension = info.lonDimension;
            geometry.cyclicInLongitude = nominal->isCyclicInLongitude(info);
            filterSource->setFilterGeometry(variableName, geometry);

            if (info.latDimension < 0 && info.lonDimension < 0)
            {
                LOG4CPLUS_WARN(mlog, "variable " << variableName.toStdString()
                               << " has no horizontal dimensions; filtered "
                                  "uncertainty equals the uncertainty");
            }
        }

        MTaskGraph *graph = new MTaskGraph();
        int numChunks = 0;
        try
        {
            for (int i = 0; i < layout.totalNumChunks(); i++)
            {
                QVector<int> chunkCoordinates = layout.chunkCoordinates(i);

                MDataRequestHelper rh;
                rh.insert("VARIABLE", variableName);
                rh.insert("CHUNK", chunkCoordinates);
                rh.insert("QUANTITY", QString("UNCERTAINTY"));
                rh.insert("TARGET_VARIABLE", variable->uncertaintyName);
                uncertaintyWriterSource->getTaskGraph(rh.request(), graph);
                numChunks++;

                if (variable->filter)
                {
                    rh.insert("TARGET_VARIABLE",
                              variable->filteredUncertaintyName());
                    filteredWriterSource->getTaskGraph(rh.request(), graph);
                    numChunks++;
                }
            }
        }
        catch (MException &)
        {
            delete graph;
            throw;
        }

        addTaskGraph(variable->uncertaintyName, graph, numChunks);
    }
}


void MCollectProcessor::graphsExecuted()
{
    foreach (QString variableName, collectedVariables)
    {
        const MCollectVariableSchema *variable =
                schema.findCollectVariable(variableName);

        LOG4CPLUS_DEBUG(mlog, "standard uncertainty of "
                        << variableName.toStdString() << ":");
        logStatistics(writer.data(), variable->uncertaintyName);
        if (variable->filter)
        {
            LOG4CPLUS_DEBUG(mlog, "filtered standard uncertainty of "
                            << variableName.toStdString() << ":");
            logStatistics(writer.data(), variable->filteredUncertaintyName());
        }

        qint64 inconsistent = reducerSource->numInconsistentCells(
                    variableName);
        if (inconsistent > 0)
        {
            LOG4CPLUS_WARN(mlog, "ensemble mean of " << variableName
                           .toStdString() << " departs from the nominal "
                           "value by more than "
                           << MEnsembleReducerSource::consistencyThreshold
                           << " standard errors in " << inconsistent
                           << " cell(s)");
        }
    }
}


void MCollectProcessor::writeOutput()
{
    MGridDataset *nominal = members.first();

    foreach (QString variableName, nominal->getVariableNames())
    {
        writer->copyVariableData(*nominal, variableName);
    }

    writer->updateActualRanges();
    writer->commit();

    LOG4CPLUS_INFO(mlog, "wrote target dataset "
                   << config.targetPath.toStdString());
}


void MCollectProcessor::abortOutput()
{
    if (writer && !writer->isCommitted()) writer->abort();
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

QList< QPair<QString, QString> > MCollectProcessor::uncertaintyAttributes(
        const MCollectVariableSchema &variable, bool filtered) const
{
    const MGridDataset *nominal = members.first();
    const QString &name = variable.name;

    QList< QPair<QString, QString> > attributes;

    if (filtered)
    {
        attributes << qMakePair(QString("comment"), QString(
                                    "filtered variant of standard "
                                    "uncertainty"));
    }

    // Dimension coordinates first, then auxiliary coordinates.
    QStringList coordinates;
    foreach (QString dimension, nominal->getVariableInfo(name).dimensionNames)
    {
        if (nominal->hasVariable(dimension)) coordinates << dimension;
    }
    foreach (QString c, writer->getVariableAttribute(name, "coordinates")
             .split(" ", QString::SkipEmptyParts))
    {
        if (!coordinates.contains(c)) coordinates << c;
    }
    if (!coordinates.isEmpty())
    {
        attributes << qMakePair(QString("coordinates"),
                                coordinates.join(" "));
    }

    QString standardName = writer->getVariableAttribute(name,
                                                        "standard_name");
    if (!standardName.isEmpty())
    {
        attributes << qMakePair(QString("standard_name"),
                                standardName + " standard_error");
    }

    QString title = writer->getVariableAttribute(name, "title");
    if (!title.isEmpty())
    {
        attributes << qMakePair(QString("title"),
                                "standard uncertainty of " + title);
    }

    // Attributes removed by the schema are not added again, attributes
    // added by the schema take precedence.
    QList< QPair<QString, QString> > result;
    for (int i = 0; i < attributes.size(); i++)
    {
        if (!variable.attributesToRemove.contains(attributes[i].first))
            result << attributes[i];
    }
    result << variable.attributesToAdd;

    return result;
}

} // namespace MetMC
