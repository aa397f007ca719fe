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
#include "scatterprocessor.h"

// standard library imports
#include <vector>

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

MScatterProcessor::MScatterProcessor(const MProcessorConfiguration &config,
                                     const MSourceTypeRegistry &registry,
                                     MAbstractScheduler *scheduler)
    : MAbstractProcessor(config, registry, scheduler),
      readerEngine(INVALID_ENGINE),
      writerEngine(INVALID_ENGINE)
{
    if (config.operation != SCATTER_OPERATION)
        throw MValueError("scatter processor requires a scatter "
                          "configuration", __FILE__, __LINE__);
}


MScatterProcessor::~MScatterProcessor()
{
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

void MScatterProcessor::validateInput()
{
    readerEngine = MDatasetFile::resolveEngine(config.sourcePath,
                                               config.readerEngine);
    writerEngine = MDatasetFile::resolveEngine(config.targetPath,
                                               config.writerEngine);

    if (QFileInfo(config.sourcePath).absoluteFilePath()
            == QFileInfo(config.targetPath).absoluteFilePath())
    {
        throw MConfigurationError("source and target dataset must differ",
                                  __FILE__, __LINE__);
    }

    source.reset(new MGridDataset(config.sourcePath, readerEngine));

    if (config.selector == 0)
    {
        LOG4CPLUS_INFO(mlog, "selector 0: target is an unperturbed copy of "
                       "the source dataset");
        return;
    }

    foreach (QString variableName, source->getDataVariableNames())
    {
        if (schema.findScatterVariable(variableName))
            perturbedVariables << variableName;
    }

    if (perturbedVariables.isEmpty())
    {
        LOG4CPLUS_WARN(mlog, "source dataset contains no variable of source "
                       "type " << config.sourceType.toStdString()
                       << "; target is an unperturbed copy");
        return;
    }

    // Perturbed variables are processed in their own chunk layout.
    foreach (QString variableName, perturbedVariables)
    {
        MGridVariableInfo info = source->getVariableInfo(variableName);
        MChunkLayout layout = info.chunkLayout(config.chunking);
        layouts.insert(variableName, layout);
        LOG4CPLUS_DEBUG(mlog, "layout of " << variableName.toStdString()
                        << ": " << layout.toString().toStdString());
    }

    // Inputs are read in the layout of the variable that uses them.
    foreach (QString variableName, perturbedVariables)
    {
        const MScatterVariableSchema *variable =
                schema.findScatterVariable(variableName);

        if (variable->uncertaintySource
                == MScatterVariableSchema::TOTAL_PERTURBATION)
        {
            foreach (QString reference, variable->totalVariables)
            {
                if (!perturbedVariables.contains(reference))
                {
                    throw MConfigurationError(
                                QString("variable '%1' sums the perturbations "
                                        "of '%2', which is not perturbed")
                                .arg(variableName).arg(reference)
                                .toStdString(), __FILE__, __LINE__);
                }

                const MScatterVariableSchema *referenced =
                        schema.findScatterVariable(reference);
                if (referenced->uncertaintySource
                        == MScatterVariableSchema::TOTAL_PERTURBATION)
                {
                    throw MConfigurationError(
                                QString("variable '%1' sums the perturbations "
                                        "of '%2', which is a sum itself")
                                .arg(variableName).arg(reference)
                                .toStdString(), __FILE__, __LINE__);
                }

                if (layouts.value(reference) != layouts.value(variableName))
                {
                    throw MConfigurationError(
                                QString("chunk layouts of '%1' and '%2' "
                                        "differ").arg(variableName)
                                .arg(reference).toStdString(),
                                __FILE__, __LINE__);
                }
            }
        }
        else
        {
            foreach (QString input, variable->inputVariables())
            {
                registerInputLayout(variableName, input,
                                    layouts.value(variableName));
            }
        }
    }
}


void MScatterProcessor::buildGraphs()
{
    writer.reset(new MGridDatasetWriter(config.targetPath, writerEngine,
                                        config.writerSettings));
    writer->copyDimensionsAndGlobalAttributes(*source);

    foreach (QString variableName, source->getVariableNames())
    {
        if (perturbedVariables.contains(variableName))
        {
            MChunkLayout layout = layouts.value(variableName);
            writer->defineVariable(*source, variableName, variableName,
                                   &layout);
        }
        else
        {
            writer->defineVariable(*source, variableName, variableName);
        }
    }

    setSoftwareAttributes(writer.data());
    writer->setGlobalAttribute("monte_carlo_selector", config.selector);
    writer->setGlobalAttribute("monte_carlo_antithetic",
                               config.antithetic ? 1 : 0);

    if (perturbedVariables.isEmpty()) return;

    readerSource.reset(new MChunkReaderSource("source", source.data()));
    readerSource->setChunkStore(getChunkStore());
    QMapIterator<QString, MChunkLayout> it(layouts);
    while (it.hasNext())
    {
        it.next();
        readerSource->setChunkLayout(it.key(), it.value());
    }

    constraints.reset(new MConstraintEvaluator(registry));

    perturbationSource.reset(new MPerturbationSource(
                                 "perturbation", readerSource.data(), schema,
                                 constraints.data(), config.selector,
                                 config.antithetic,
                                 MDatasetFile::fileStem(config.sourcePath)));
    perturbationSource->setChunkStore(getChunkStore());

    writerSource.reset(new MChunkWriterSource("target", writer.data(),
                                              perturbationSource.data()));
    writerSource->setChunkStore(getChunkStore());
    writerSource->setProgressSink(getProgressSink());

    foreach (QString variableName, perturbedVariables)
    {
        if (perturbationSource->drawsRandomNumbers(variableName))
        {
            vector<quint32> words = perturbationSource->streamGenerator(
                        variableName).rootSeed();
            vector<long long> seed(words.begin(), words.end());
            writer->setVariableAttribute(variableName, "seed", seed);

            QStringList s;
            for (size_t i = 0; i < words.size(); i++)
                s << QString::number(words[i]);
            LOG4CPLUS_DEBUG(mlog, "seed of " << variableName.toStdString()
                            << ": " << s.join(" ").toStdString());
        }

        const MChunkLayout &layout = layouts[variableName];
        MTaskGraph *graph = new MTaskGraph();
        try
        {
            for (int i = 0; i < layout.totalNumChunks(); i++)
            {
                MDataRequestHelper rh;
                rh.insert("VARIABLE", variableName);
                rh.insert("CHUNK", layout.chunkCoordinates(i));
                rh.insert("TARGET_VARIABLE", variableName);
                writerSource->getTaskGraph(rh.request(), graph);
            }
        }
        catch (MException &)
        {
            delete graph;
            throw;
        }

        addTaskGraph(variableName, graph, layout.totalNumChunks());
    }
}


void MScatterProcessor::graphsExecuted()
{
    foreach (QString variableName, perturbedVariables)
    {
        LOG4CPLUS_DEBUG(mlog, "perturbed values of "
                        << variableName.toStdString() << ":");
        logStatistics(writer.data(), variableName);
    }
}


void MScatterProcessor::writeOutput()
{
    foreach (QString variableName, source->getVariableNames())
    {
        if (perturbedVariables.contains(variableName)) continue;
        writer->copyVariableData(*source, variableName);
    }

    writer->updateActualRanges();
    writer->commit();

    LOG4CPLUS_INFO(mlog, "wrote target dataset "
                   << config.targetPath.toStdString());
}


void MScatterProcessor::abortOutput()
{
    if (writer && !writer->isCommitted()) writer->abort();
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

void MScatterProcessor::registerInputLayout(const QString &variableName,
                                            const QString &inputVariable,
                                            const MChunkLayout &layout)
{
    if (!source->hasVariable(inputVariable))
    {
        throw MConfigurationError(
                    QString("input variable '%1' of '%2' does not exist in "
                            "source dataset").arg(inputVariable)
                    .arg(variableName).toStdString(), __FILE__, __LINE__);
    }

    MGridVariableInfo info = source->getVariableInfo(inputVariable);
    if (info.dimensionNames != layout.getDimensionNames()
            || info.dimensionSizes != layout.getDimensionSizes())
    {
        throw MConfigurationError(
                    QString("input variable '%1' is not defined on the grid "
                            "of '%2'").arg(inputVariable).arg(variableName)
                    .toStdString(), __FILE__, __LINE__);
    }

    if (layouts.contains(inputVariable)
            && layouts.value(inputVariable) != layout)
    {
        throw MConfigurationError(
                    QString("input variable '%1' of '%2' is used in "
                            "different chunk layouts").arg(inputVariable)
                    .arg(variableName).toStdString(), __FILE__, __LINE__);
    }

    layouts.insert(inputVariable, layout);
}

} // namespace MetMC
