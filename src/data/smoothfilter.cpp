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
#include "smoothfilter.h"

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

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MSmoothFilter::MSmoothFilter(const QString &identifier,
                             MEnsembleReducerSource *inputSource, double fwhm)
    : MScheduledDataSource(identifier),
      inputSource(inputSource),
      fwhm(fwhm)
{
    if (inputSource == nullptr)
        throw MValueError("no valid input source passed", __FILE__, __LINE__);

    if (!(fwhm > 0.))
    {
        throw MConfigurationError(QString("invalid filter width %1, the full "
                                          "width at half maximum must be "
                                          "positive").arg(fwhm).toStdString(),
                                  __FILE__, __LINE__);
    }
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

double MSmoothFilter::getStandardDeviation() const
{
    // FWHM = 2 sqrt(2 ln 2) sigma
    return fwhm / 2.35482;
}


void MSmoothFilter::setFilterGeometry(const QString &variableName,
                                      const MFilterGeometry &geometry)
{
    geometries.insert(variableName, geometry);
}


int MSmoothFilter::significantRadius(double stdDev_gp)
{
    return int(ceil(stdDev_gp * 2.576));
}


QVector<double> MSmoothFilter::gaussianWeights(double stdDev_gp)
{
    int r = significantRadius(stdDev_gp);
    QVector<double> weights(2 * r + 1);
    for (int k = -r; k <= r; k++)
    {
        weights[k + r] = exp(-double(k * k) / (2. * stdDev_gp * stdDev_gp));
    }
    return weights;
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

MTask* MSmoothFilter::createTaskGraph(MDataRequest request, MTaskGraph *graph)
{
    MDataRequestHelper rh(request);
    QString variableName = rh.value("VARIABLE");
    QVector<int> chunkCoordinates = rh.intVectorValue("CHUNK");

    const MFilterGeometry &geometry = filterGeometry(variableName);

    MTask *task = new MTask(request, this);
    foreach (QVector<int> coordinates, haloChunks(geometry, chunkCoordinates))
    {
        task->addParent(inputSource->getTaskGraph(
                            varianceRequest(variableName, coordinates),
                            graph));
    }
    return task;
}


MGridChunk* MSmoothFilter::produceData(MDataRequest request)
{
    MDataRequestHelper rh(request);
    QString variableName = rh.value("VARIABLE");
    QVector<int> chunkCoordinates = rh.intVectorValue("CHUNK");

    const MFilterGeometry &geometry = filterGeometry(variableName);
    const MChunkLayout &layout = geometry.layout;
    const int latDim = geometry.latDimension;
    const int lonDim = geometry.lonDimension;
    const MChunkRegion region = layout.region(chunkCoordinates);

    const double stdDev = getStandardDeviation();
    const QVector<double> weights = gaussianWeights(stdDev);
    const int radius = significantRadius(stdDev);

    // Extent of the chunk and of the window (chunk plus halo).
    const int rLat = (latDim >= 0) ? radius : 0;
    const int rLon = (lonDim >= 0) ? radius : 0;
    const int nLat = (latDim >= 0) ? int(region.count[latDim]) : 1;
    const int nLon = (lonDim >= 0) ? int(region.count[lonDim]) : 1;
    const qint64 lat0 = (latDim >= 0) ? qint64(region.start[latDim]) : 0;
    const qint64 lon0 = (lonDim >= 0) ? qint64(region.start[lonDim]) : 0;
    const qint64 latSize = (latDim >= 0)
            ? qint64(layout.getDimensionSizes()[latDim]) : 1;
    const qint64 lonSize = (lonDim >= 0)
            ? qint64(layout.getDimensionSizes()[lonDim]) : 1;
    const int nLatW = nLat + 2 * rLat;
    const int nLonW = nLon + 2 * rLon;

    // Fetch the variance chunks of the window.
    QList< QVector<int> > inputCoordinates =
            haloChunks(geometry, chunkCoordinates);
    QHash<int, MGridChunk*> inputChunks;
    foreach (QVector<int> coordinates, inputCoordinates)
    {
        inputChunks.insert(layout.linearIndex(coordinates),
                           inputSource->getData(
                               varianceRequest(variableName, coordinates)));
    }

    // Copy the window into a contiguous array, missing outside the grid.
    const float missing = numeric_limits<float>::quiet_NaN();
    QVector<float> window(nLatW * nLonW, missing);
    QVector<size_t> index = region.start;
    QVector<int> coordinates = chunkCoordinates;

    for (int j = 0; j < nLatW; j++)
    {
        qint64 gLat = lat0 - rLat + j;
        if (gLat < 0 || gLat >= latSize) continue;

        for (int i = 0; i < nLonW; i++)
        {
            qint64 gLon = lon0 - rLon + i;
            if (geometry.cyclicInLongitude)
                gLon = ((gLon % lonSize) + lonSize) % lonSize;
            else if (gLon < 0 || gLon >= lonSize)
                continue;

            if (latDim >= 0) index[latDim] = size_t(gLat);
            if (lonDim >= 0) index[lonDim] = size_t(gLon);

            for (int d = 0; d < index.size(); d++)
            {
                coordinates[d] = int(index[d] / layout.getChunkSizes()[d]);
            }

            const MGridChunk *chunk = inputChunks.value(
                        layout.linearIndex(coordinates), nullptr);
            if (chunk == nullptr) continue;

            // Row-major offset of the value in its chunk.
            const MChunkRegion &chunkRegion = chunk->getRegion();
            size_t offset = 0;
            for (int d = 0; d < index.size(); d++)
            {
                offset = offset * chunkRegion.count[d]
                        + (index[d] - chunkRegion.start[d]);
            }
            window[j * nLonW + i] = chunk->data[offset];
        }
    }

    foreach (QVector<int> c, inputCoordinates)
    {
        inputSource->releaseData(varianceRequest(variableName, c));
    }

    // Separable normalized convolution: first along longitude for all rows
    // of the window, then along latitude.
    QVector<double> lonNumerator(nLatW * nLon, 0.);
    QVector<double> lonDenominator(nLatW * nLon, 0.);
    for (int j = 0; j < nLatW; j++)
    {
        for (int i = 0; i < nLon; i++)
        {
            double numerator = 0.;
            double denominator = 0.;
            for (int k = 0; k <= 2 * rLon; k++)
            {
                float v = window[j * nLonW + i + k];
                if (std::isnan(v)) continue;
                numerator += weights[k + radius - rLon] * v;
                denominator += weights[k + radius - rLon];
            }
            lonNumerator[j * nLon + i] = numerator;
            lonDenominator[j * nLon + i] = denominator;
        }
    }

    MGridChunk *result = new MGridChunk(variableName, region);

    // Strides of latitude and longitude in the result chunk.
    size_t latStride = 0;
    size_t lonStride = 0;
    size_t stride = 1;
    for (int d = region.count.size() - 1; d >= 0; d--)
    {
        if (d == latDim) latStride = stride;
        if (d == lonDim) lonStride = stride;
        stride *= region.count[d];
    }

    for (int j = 0; j < nLat; j++)
    {
        for (int i = 0; i < nLon; i++)
        {
            size_t offset = j * latStride + i * lonStride;

            if (std::isnan(window[(j + rLat) * nLonW + i + rLon]))
            {
                result->data[offset] = missing;
                continue;
            }

            double numerator = 0.;
            double denominator = 0.;
            for (int k = 0; k <= 2 * rLat; k++)
            {
                numerator += weights[k + radius - rLat]
                        * lonNumerator[(j + k) * nLon + i];
                denominator += weights[k + radius - rLat]
                        * lonDenominator[(j + k) * nLon + i];
            }

            result->data[offset] = (denominator > 0.)
                    ? float(sqrt(numerator / denominator)) : missing;
        }
    }

    return result;
}


const QStringList MSmoothFilter::locallyRequiredKeys() const
{
    return (QStringList() << "VARIABLE" << "CHUNK");
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

const MFilterGeometry& MSmoothFilter::filterGeometry(
        const QString &variableName) const
{
    QMap<QString, MFilterGeometry>::const_iterator it =
            geometries.constFind(variableName);
    if (it == geometries.constEnd())
    {
        throw MKeyError(QString("no filter geometry registered for variable "
                                "'%1'").arg(variableName).toStdString(),
                        __FILE__, __LINE__);
    }
    return it.value();
}


QList< QVector<int> > MSmoothFilter::haloChunks(
        const MFilterGeometry &geometry,
        const QVector<int> &chunkCoordinates) const
{
    const MChunkLayout &layout = geometry.layout;
    const MChunkRegion region = layout.region(chunkCoordinates);
    const int radius = significantRadius(getStandardDeviation());

    // Chunk indices per dimension.
    QVector< QVector<int> > indices(layout.numDimensions());
    for (int d = 0; d < layout.numDimensions(); d++)
    {
        if (d == geometry.latDimension || d == geometry.lonDimension)
        {
            qint64 first = qint64(region.start[d]) - radius;
            qint64 last = qint64(region.start[d] + region.count[d]) - 1
                    + radius;
            bool cyclic = (d == geometry.lonDimension)
                    && geometry.cyclicInLongitude;
            indices[d] = layout.chunkIndicesCovering(d, first, last, cyclic);
        }
        else
        {
            indices[d] << chunkCoordinates[d];
        }
    }

    // Cartesian product of the indices.
    QList< QVector<int> > chunks;
    chunks << QVector<int>();
    for (int d = 0; d < indices.size(); d++)
    {
        QList< QVector<int> > extended;
        foreach (QVector<int> prefix, chunks)
        {
            foreach (int index, indices[d])
            {
                extended << (QVector<int>(prefix) << index);
            }
        }
        chunks = extended;
    }
    return chunks;
}


MDataRequest MSmoothFilter::varianceRequest(
        const QString &variableName, const QVector<int> &chunkCoordinates) const
{
    MDataRequestHelper rh;
    rh.insert("VARIABLE", variableName);
    rh.insert("CHUNK", chunkCoordinates);
    rh.insert("QUANTITY", QString("VARIANCE"));
    return rh.request();
}

} // namespace MetMC
