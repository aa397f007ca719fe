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
#include "perturbationsource.h"

// standard library imports
#include <cmath>

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "data/perturbation.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MPerturbationSource::MPerturbationSource(
        const QString &identifier, MChunkReaderSource *nominalSource,
        const MSourceTypeSchema &schema,
        const MConstraintEvaluator *constraints,
        int selector, bool antithetic, const QString &sourceFileStem)
    : MScheduledDataSource(identifier),
      nominalSource(nominalSource),
      schema(schema),
      constraints(constraints),
      selector(selector),
      antithetic(antithetic),
      sourceFileStem(sourceFileStem)
{
    if (nominalSource == nullptr || constraints == nullptr)
        throw MValueError("no valid input source or constraint evaluator "
                          "passed", __FILE__, __LINE__);

    if (selector < 0)
    {
        throw MConfigurationError(QString("invalid selector %1, selectors "
                                          "must be non-negative")
                                  .arg(selector).toStdString(),
                                  __FILE__, __LINE__);
    }
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

MStreamGenerator MPerturbationSource::streamGenerator(
        const QString &variableName) const
{
    return MStreamGenerator(
                MStreamGenerator::variableIdentity(variableName,
                                                   sourceFileStem),
                selector, antithetic);
}


bool MPerturbationSource::drawsRandomNumbers(const QString &variableName) const
{
    const MScatterVariableSchema *variable =
            schema.findScatterVariable(variableName);
    return variable != nullptr && variable->uncertaintySource
            != MScatterVariableSchema::TOTAL_PERTURBATION;
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

MTask* MPerturbationSource::createTaskGraph(MDataRequest request,
                                            MTaskGraph *graph)
{
    MDataRequestHelper rh(request);
    QString variableName = rh.value("VARIABLE");
    QVector<int> chunkCoordinates = rh.intVectorValue("CHUNK");

    const MScatterVariableSchema &variable = scatterVariable(variableName);

    MTask *task = new MTask(request, this);

    task->addParent(nominalSource->getTaskGraph(
                        chunkRequest(variableName, chunkCoordinates), graph));

    // The nominal member only copies the nominal values.
    if (selector == 0) return task;

    if (variable.uncertaintySource
            == MScatterVariableSchema::TOTAL_PERTURBATION)
    {
        foreach (QString ref, variable.totalVariables)
        {
            task->addParent(getTaskGraph(
                                chunkRequest(ref, chunkCoordinates), graph));
            task->addParent(nominalSource->getTaskGraph(
                                chunkRequest(ref, chunkCoordinates), graph));
        }
    }
    else
    {
        foreach (QString input, variable.inputVariables())
        {
            if (input == variableName) continue;
            task->addParent(nominalSource->getTaskGraph(
                                chunkRequest(input, chunkCoordinates), graph));
        }
    }

    return task;
}


MGridChunk* MPerturbationSource::produceData(MDataRequest request)
{
    MDataRequestHelper rh(request);
    QString variableName = rh.value("VARIABLE");
    QVector<int> chunkCoordinates = rh.intVectorValue("CHUNK");

    const MScatterVariableSchema &variable = scatterVariable(variableName);

    MDataRequest nominalRequest = chunkRequest(variableName, chunkCoordinates);
    MGridChunk *nominal = nominalSource->getData(nominalRequest);

    MGridChunk *result = nullptr;
    try
    {
        result = new MGridChunk(variableName, nominal->getRegion());
        for (size_t i = 0; i < result->getNumValues(); i++)
            result->data[i] = nominal->data[i];

        if (selector == 0)
        {
            // The nominal member is not perturbed.
        }
        else if (variable.uncertaintySource
                 == MScatterVariableSchema::TOTAL_PERTURBATION)
        {
            sumPerturbations(variable, chunkCoordinates, result);
        }
        else
        {
            perturbChunk(variable, chunkCoordinates, result);
        }
    }
    catch (MException &)
    {
        delete result;
        nominalSource->releaseData(nominalRequest);
        throw;
    }

    nominalSource->releaseData(nominalRequest);
    return result;
}


const QStringList MPerturbationSource::locallyRequiredKeys() const
{
    return (QStringList() << "VARIABLE" << "CHUNK");
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

const MScatterVariableSchema& MPerturbationSource::scatterVariable(
        const QString &variableName) const
{
    const MScatterVariableSchema *variable =
            schema.findScatterVariable(variableName);
    if (variable == nullptr)
    {
        throw MKeyError(QString("variable '%1' is not perturbed for source "
                                "type %2").arg(variableName)
                        .arg(schema.getTag()).toStdString(),
                        __FILE__, __LINE__);
    }
    return *variable;
}


MDataRequest MPerturbationSource::chunkRequest(
        const QString &variableName, const QVector<int> &chunkCoordinates) const
{
    MDataRequestHelper rh;
    rh.insert("VARIABLE", variableName);
    rh.insert("CHUNK", chunkCoordinates);
    return rh.request();
}


void MPerturbationSource::perturbChunk(const MScatterVariableSchema &variable,
                                       const QVector<int> &chunkCoordinates,
                                       MGridChunk *result)
{
    // Uncertainty inputs of the chunk.
    QList<MDataRequest> inputRequests;
    MGridChunk *uncertainty = nullptr;
    MGridChunk *bias = nullptr;
    MGridChunk *rmsd = nullptr;

    switch (variable.uncertaintySource)
    {
    case MScatterVariableSchema::UNCERTAINTY_VARIABLE:
        inputRequests << chunkRequest(variable.uncertaintyVariable,
                                      chunkCoordinates);
        uncertainty = nominalSource->getData(inputRequests.last());
        break;
    case MScatterVariableSchema::UNCERTAINTY_BIAS_RMSD:
        inputRequests << chunkRequest(variable.biasVariable,
                                      chunkCoordinates);
        bias = nominalSource->getData(inputRequests.last());
        inputRequests << chunkRequest(variable.rmsdVariable,
                                      chunkCoordinates);
        rmsd = nominalSource->getData(inputRequests.last());
        break;
    default:
        break;
    }

    MStreamGenerator generator = streamGenerator(variable.name);
    MRandomStream stream = generator.stream(chunkCoordinates);
    MConstraintRule rule = constraints->rule(schema.getTag(), variable.name);

    const size_t n = result->getNumValues();
    for (size_t i = 0; i < n; i++)
    {
        // One deviate per cell, also for missing values, so that the
        // deviate of a cell only depends on its position in the chunk.
        double z = stream.nextNormal();
        double x = result->data[i];
        if (std::isnan(x)) continue;

        double u;
        if (uncertainty) u = uncertainty->data[i];
        else if (rmsd) u = uncertaintyFromBiasAndRMSD(bias->data[i],
                                                      rmsd->data[i]);
        else u = variable.uncertaintyConstant;

        u = standardUncertainty(x, u, variable.coverage, variable.relative);
        double y = perturbValue(variable.distribution, x, u, z);
        result->data[i] = float(rule.apply(x, y));
    }

    foreach (MDataRequest inputRequest, inputRequests)
    {
        nominalSource->releaseData(inputRequest);
    }
}


void MPerturbationSource::sumPerturbations(
        const MScatterVariableSchema &variable,
        const QVector<int> &chunkCoordinates, MGridChunk *result)
{
    MConstraintRule rule = constraints->rule(schema.getTag(), variable.name);
    const size_t n = result->getNumValues();

    // Nominal values of the variable.
    QVector<double> x(int(n));
    QVector<double> y(int(n));
    for (size_t i = 0; i < n; i++) x[i] = y[i] = result->data[i];

    foreach (QString ref, variable.totalVariables)
    {
        MDataRequest refRequest = chunkRequest(ref, chunkCoordinates);
        MGridChunk *perturbed = getData(refRequest);
        MGridChunk *nominal = nominalSource->getData(refRequest);

        if (perturbed->getNumValues() != n || nominal->getNumValues() != n)
        {
            releaseData(refRequest);
            nominalSource->releaseData(refRequest);
            throw MComputationError(
                        QString("chunk %1 of variable '%2' does not match "
                                "the chunk of variable '%3'")
                        .arg(MDataRequestHelper::intVectorToString(
                                 chunkCoordinates))
                        .arg(ref).arg(variable.name).toStdString(),
                        __FILE__, __LINE__);
        }

        for (size_t i = 0; i < n; i++)
        {
            y[i] += double(perturbed->data[i]) - double(nominal->data[i]);
        }

        releaseData(refRequest);
        nominalSource->releaseData(refRequest);
    }

    for (size_t i = 0; i < n; i++)
    {
        if (std::isnan(x[i])) continue;
        result->data[i] = float(rule.apply(x[i], y[i]));
    }
}

} // namespace MetMC
