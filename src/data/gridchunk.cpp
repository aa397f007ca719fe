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
#include "gridchunk.h"

// standard library imports
#include <cmath>
#include <limits>
#include <new>

// related third party imports

// local application imports
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MGridChunk::MGridChunk(const QString &variableName, const MChunkRegion &region)
    : MAbstractDataItem(),
      data(nullptr),
      variableName(variableName),
      region(region),
      numValues(region.numValues())
{
    try
    {
        data = new float[numValues];
    }
    catch (std::bad_alloc &)
    {
        throw MMemoryError(QString("cannot allocate %1 values for a chunk "
                                   "of variable '%2'").arg(numValues)
                           .arg(variableName).toStdString(),
                           __FILE__, __LINE__);
    }
}


MGridChunk::~MGridChunk()
{
    delete[] data;
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

unsigned int MGridChunk::getMemorySize_kb()
{
    return (sizeof(MGridChunk) + numValues * sizeof(float)) / 1024.;
}


void MGridChunk::setToMissing()
{
    for (size_t i = 0; i < numValues; i++)
        data[i] = numeric_limits<float>::quiet_NaN();
}


size_t MGridChunk::computeStatistics(double *min, double *max,
                                     double *mean, double *stddev) const
{
    size_t n = 0;
    double m = 0., s = 0.;
    *min = numeric_limits<double>::max();
    *max = -numeric_limits<double>::max();

    for (size_t i = 0; i < numValues; i++)
    {
        double x = data[i];
        if (std::isnan(x)) continue;

        n++;
        if (x < *min) *min = x;
        if (x > *max) *max = x;

        double prevMean = m;
        m += (x - prevMean) / n;
        s += (x - prevMean) * (x - m);
    }

    *mean = (n > 0) ? m : numeric_limits<double>::quiet_NaN();
    *stddev = (n > 1) ? sqrt(s / (n - 1)) : numeric_limits<double>::quiet_NaN();
    if (n == 0) *min = *max = numeric_limits<double>::quiet_NaN();

    return n;
}

} // namespace MetMC
