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
#include "chunklayout.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                             MChunkRegion                                ***
*******************************************************************************/

size_t MChunkRegion::numValues() const
{
    size_t n = 1;
    for (int i = 0; i < count.size(); i++) n *= count[i];
    return n;
}


vector<size_t> MChunkRegion::startVector() const
{
    return vector<size_t>(start.begin(), start.end());
}


vector<size_t> MChunkRegion::countVector() const
{
    return vector<size_t>(count.begin(), count.end());
}


QString MChunkRegion::toString() const
{
    QStringList items;
    for (int i = 0; i < start.size(); i++)
    {
        items << QString("%1:%2").arg(start[i]).arg(start[i] + count[i]);
    }
    return QString("[%1]").arg(items.join(", "));
}


/******************************************************************************
***                             MChunkLayout                                ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MChunkLayout::MChunkLayout()
{
}


MChunkLayout::MChunkLayout(const QStringList &dimensionNames,
                           const QVector<size_t> &dimensionSizes,
                           const QVector<size_t> &chunkSizes)
    : dimensionNames(dimensionNames),
      dimensionSizes(dimensionSizes),
      chunkSizes(chunkSizes)
{
    if (dimensionNames.size() != dimensionSizes.size()
            || dimensionSizes.size() != chunkSizes.size())
    {
        throw MValueError("number of dimension names, dimension sizes and "
                          "chunk sizes differ", __FILE__, __LINE__);
    }

    for (int i = 0; i < chunkSizes.size(); i++)
    {
        if (chunkSizes[i] == 0)
        {
            throw MValueError("chunk size of dimension '"
                              + dimensionNames[i].toStdString()
                              + "' must be positive", __FILE__, __LINE__);
        }
    }
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

MChunkLayout MChunkLayout::resolve(const QStringList &dimensionNames,
                                   const QVector<size_t> &dimensionSizes,
                                   const QVector<size_t> &nativeChunkSizes,
                                   int latDimension, int lonDimension,
                                   const MChunkingScheme &scheme)
{
    QVector<size_t> chunkSizes(dimensionSizes.size(), 1);
    bool nativeAvailable = (nativeChunkSizes.size() == dimensionSizes.size());

    for (int i = 0; i < dimensionSizes.size(); i++)
    {
        size_t dimSize = qMax(dimensionSizes[i], size_t(1));

        int requested;
        if (i == latDimension) requested = scheme.chunkSizeLat;
        else if (i == lonDimension) requested = scheme.chunkSizeLon;
        else continue;

        if (requested < -1)
        {
            throw MConfigurationError(
                        QString("invalid chunk size %1 requested for "
                                "dimension '%2'").arg(requested)
                        .arg(dimensionNames[i]).toStdString(),
                        __FILE__, __LINE__);
        }
        else if (requested == -1)
        {
            chunkSizes[i] = dimSize;
        }
        else if (requested == 0)
        {
            chunkSizes[i] = nativeAvailable ? nativeChunkSizes[i] : dimSize;
        }
        else
        {
            chunkSizes[i] = size_t(requested);
        }

        chunkSizes[i] = qMin(qMax(chunkSizes[i], size_t(1)), dimSize);
    }

    MChunkLayout layout(dimensionNames, dimensionSizes, chunkSizes);

    if (nativeAvailable)
    {
        for (int i = 0; i < dimensionSizes.size(); i++)
        {
            if (chunkSizes[i] != nativeChunkSizes[i])
            {
                LOG4CPLUS_DEBUG(mlog, "re-chunking dimension '"
                                << dimensionNames[i].toStdString()
                                << "' from native chunk size "
                                << nativeChunkSizes[i] << " to "
                                << chunkSizes[i]);
            }
        }
    }

    return layout;
}


int MChunkLayout::numChunks(int dimension) const
{
    size_t size = dimensionSizes[dimension];
    size_t chunk = chunkSizes[dimension];
    if (size == 0) return 0;
    return int((size + chunk - 1) / chunk);
}


int MChunkLayout::totalNumChunks() const
{
    if (dimensionSizes.isEmpty()) return 0;

    int n = 1;
    for (int i = 0; i < dimensionSizes.size(); i++) n *= numChunks(i);
    return n;
}


size_t MChunkLayout::totalNumValues() const
{
    size_t n = 1;
    for (int i = 0; i < dimensionSizes.size(); i++) n *= dimensionSizes[i];
    return n;
}


QVector<int> MChunkLayout::chunkCoordinates(int linearIndex) const
{
    QVector<int> coordinates(dimensionSizes.size(), 0);
    for (int i = dimensionSizes.size() - 1; i >= 0; i--)
    {
        int n = numChunks(i);
        coordinates[i] = linearIndex % n;
        linearIndex /= n;
    }
    return coordinates;
}


int MChunkLayout::linearIndex(const QVector<int> &chunkCoordinates) const
{
    int index = 0;
    for (int i = 0; i < dimensionSizes.size(); i++)
    {
        index = index * numChunks(i) + chunkCoordinates[i];
    }
    return index;
}


MChunkRegion MChunkLayout::region(const QVector<int> &chunkCoordinates) const
{
    if (chunkCoordinates.size() != dimensionSizes.size())
    {
        throw MValueError("chunk coordinates do not match the number of "
                          "dimensions of the layout", __FILE__, __LINE__);
    }

    MChunkRegion r;
    for (int i = 0; i < dimensionSizes.size(); i++)
    {
        if (chunkCoordinates[i] < 0 || chunkCoordinates[i] >= numChunks(i))
        {
            throw MValueError(QString("chunk coordinate %1 out of range for "
                                      "dimension '%2'")
                              .arg(chunkCoordinates[i])
                              .arg(dimensionNames[i]).toStdString(),
                              __FILE__, __LINE__);
        }

        size_t start = size_t(chunkCoordinates[i]) * chunkSizes[i];
        r.start << start;
        r.count << qMin(chunkSizes[i], dimensionSizes[i] - start);
    }
    return r;
}


QVector<int> MChunkLayout::chunkIndicesCovering(int dimension, qint64 first,
                                                qint64 last, bool cyclic) const
{
    const qint64 size = qint64(dimensionSizes[dimension]);
    const qint64 chunk = qint64(chunkSizes[dimension]);

    QVector<int> indices;
    if (size == 0) return indices;

    // A window covering more than the whole dimension covers every chunk.
    if (cyclic && last - first + 1 >= size)
    {
        for (int i = 0; i < numChunks(dimension); i++) indices << i;
        return indices;
    }

    for (qint64 k = first; k <= last; k++)
    {
        qint64 index = k;
        if (cyclic) index = ((k % size) + size) % size;
        else if (k < 0 || k >= size) continue;

        int chunkIndex = int(index / chunk);
        if (!indices.contains(chunkIndex)) indices << chunkIndex;
    }

    qSort(indices);
    return indices;
}


bool MChunkLayout::operator==(const MChunkLayout &other) const
{
    return dimensionNames == other.dimensionNames
            && dimensionSizes == other.dimensionSizes
            && chunkSizes == other.chunkSizes;
}


QString MChunkLayout::toString() const
{
    QStringList dims, chunks;
    for (int i = 0; i < dimensionSizes.size(); i++)
    {
        dims << QString("%1=%2").arg(dimensionNames[i]).arg(dimensionSizes[i]);
        chunks << QString::number(chunkSizes[i]);
    }
    return QString("(%1) in chunks of (%2), %3 chunks")
            .arg(dims.join(", ")).arg(chunks.join(", ")).arg(totalNumChunks());
}

} // namespace MetMC
