/******************************************************************************
**
**  This file is part of Met.MC -- a processor for the Monte Carlo simulation
**  of measurement uncertainty in gridded geophysical datasets.
**
**  Copyright 2015 Marc Rautenhaus
**  Copyright 2026 The Met.MC developers
**
**  Met.MC is derived from Met.3D (Computer Graphics and Visualization Group,
**  Technische Universitaet Muenchen, Garching, Germany).
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
#include "ensemblereducersource.h"

// standard library imports
#include <cmath>
#include <limits>

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

const double MEnsembleReducerSource::consistencyThreshold = 4.;

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MEnsembleReducerSource::MEnsembleReducerSource(
        const QString &identifier, const QList<MChunkReaderSource*> &members)
    : MScheduledDataSource(identifier),
      members(members)
{
    if (members.size() < 2)
    {
        throw MConfigurationError("an ensemble needs the nominal dataset and "
                                  "at least one simulated variant",
                                  __FILE__, __LINE__);
    }
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

qint64 MEnsembleReducerSource::numInconsistentCells(
        const QString &variableName) const
{
    QMutexLocker locker(&inconsistentCellsMutex);
    return inconsistentCells.value(variableName, 0);
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

MTask* MEnsembleReducerSource::createTaskGraph(MDataRequest request,
                                               MTaskGraph *graph)
{
    MDataRequestHelper rh(request);
    QString variableName = rh.value("VARIABLE");
    QVector<int> chunkCoordinates = rh.intVectorValue("CHUNK");
    QString quantity = rh.value("QUANTITY");

    MTask *task = new MTask(request, this);

    if (quantity == "VARIANCE")
    {
        foreach (MChunkReaderSource *member, members)
        {
            task->addParent(member->getTaskGraph(
                                memberRequest(variableName, chunkCoordinates),
                                graph));
        }
    }
    else if (quantity == "UNCERTAINTY")
    {
        task->addParent(getTaskGraph(
                            varianceRequest(variableName, chunkCoordinates),
                            graph));
    }
    else
    {
        delete task;
        throw MValueError("unknown ensemble quantity "
                          + quantity.toStdString(), __FILE__, __LINE__);
    }

    return task;
}


MGridChunk* MEnsembleReducerSource::produceData(MDataRequest request)
{
    MDataRequestHelper rh(request);
    QString variableName = rh.value("VARIABLE");
    QVector<int> chunkCoordinates = rh.intVectorValue("CHUNK");
    QString quantity = rh.value("QUANTITY");

    if (quantity == "VARIANCE")
        return computeVariance(variableName, chunkCoordinates);
    else
        return computeUncertainty(variableName, chunkCoordinates);
}


const QStringList MEnsembleReducerSource::locallyRequiredKeys() const
{
    return (QStringList() << "VARIABLE" << "CHUNK" << "QUANTITY");
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

MGridChunk* MEnsembleReducerSource::computeVariance(
        const QString &variableName, const QVector<int> &chunkCoordinates)
{
    MDataRequest request = memberRequest(variableName, chunkCoordinates);

    QList<MGridChunk*> memberChunks;
    foreach (MChunkReaderSource *member, members)
    {
        memberChunks << member->getData(request);
    }

    const MGridChunk *nominal = memberChunks[0];
    const size_t n = nominal->getNumValues();

    MGridChunk *variance = nullptr;
    qint64 numInconsistent = 0;

    try
    {
        for (int m = 1; m < memberChunks.size(); m++)
        {
            if (memberChunks[m]->getNumValues() != n)
            {
                throw MComputationError(
                            QString("chunk %1 of variable '%2' differs in "
                                    "size between ensemble members 0 and %3")
                            .arg(MDataRequestHelper::intVectorToString(
                                     chunkCoordinates))
                            .arg(variableName).arg(m).toStdString(),
                            __FILE__, __LINE__);
            }
        }

        variance = new MGridChunk(variableName, nominal->getRegion());

        for (size_t i = 0; i < n; i++)
        {
            /*
            Incremental computation of mean and variance in a single pass
            (Knuth, TAOCP Vol. 2, section 4.2.2):

            M(1) = x(1), M(k) = M(k-1) + (x(k) - M(k-1)) / k
            S(1) = 0,    S(k) = S(k-1) + (x(k) - M(k-1)) * (x(k) - M(k))

            var = S(n) / (n - 1)
            */
            int k = 0;
            double mean = 0.;
            double s = 0.;
            for (int m = 1; m < memberChunks.size(); m++)
            {
                double x = memberChunks[m]->data[i];
                if (std::isnan(x)) continue;
                k++;
                double prevMean = mean;
                mean += (x - prevMean) / k;
                s += (x - prevMean) * (x - mean);
            }

            if (k < 2)
            {
                variance->data[i] = numeric_limits<float>::quiet_NaN();
                continue;
            }

            double var = s / double(k - 1);
            variance->data[i] = float(var);

            double x0 = nominal->data[i];
            if (!std::isnan(x0)
                    && fabs(mean - x0) > consistencyThreshold
                    * sqrt(var / double(k)))
            {
                numInconsistent++;
            }
        }
    }
    catch (MException &)
    {
        delete variance;
        foreach (MChunkReaderSource *member, members)
            member->releaseData(request);
        throw;
    }

    foreach (MChunkReaderSource *member, members)
        member->releaseData(request);

    if (numInconsistent > 0)
    {
        QMutexLocker locker(&inconsistentCellsMutex);
        inconsistentCells[variableName] += numInconsistent;
    }

    return variance;
}


MGridChunk* MEnsembleReducerSource::computeUncertainty(
        const QString &variableName, const QVector<int> &chunkCoordinates)
{
    MDataRequest request = varianceRequest(variableName, chunkCoordinates);
    MGridChunk *variance = getData(request);

    MGridChunk *uncertainty = nullptr;
    try
    {
        uncertainty = new MGridChunk(variableName, variance->getRegion());
    }
    catch (MMemoryError &)
    {
        releaseData(request);
        throw;
    }

    for (size_t i = 0; i < uncertainty->getNumValues(); i++)
    {
        // NaN stays NaN.
        uncertainty->data[i] = sqrt(variance->data[i]);
    }

    releaseData(request);
    return uncertainty;
}


MDataRequest MEnsembleReducerSource::memberRequest(
        const QString &variableName, const QVector<int> &chunkCoordinates) const
{
    MDataRequestHelper rh;
    rh.insert("VARIABLE", variableName);
    rh.insert("CHUNK", chunkCoordinates);
    return rh.request();
}


MDataRequest MEnsembleReducerSource::varianceRequest(
        const QString &variableName, const QVector<int> &chunkCoordinates) const
{
    MDataRequestHelper rh;
    rh.insert("VARIABLE", variableName);
    rh.insert("CHUNK", chunkCoordinates);
    rh.insert("QUANTITY", QString("VARIANCE"));
    return rh.request();
}

} // namespace MetMC
