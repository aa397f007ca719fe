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
#ifndef GRIDCHUNK_H
#define GRIDCHUNK_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "abstractdataitem.h"
#include "chunklayout.h"


namespace MetMC
{

/**
  @brief MGridChunk stores the (decoded) values of one chunk of a gridded
  variable. Values are stored in row-major order of the chunk region; missing
  values are NaN.
  */
class MGridChunk : public MAbstractDataItem
{
public:
    /**
      Allocates memory for the values of @p region. Throws an @ref
      MMemoryError if the memory cannot be allocated.
     */
    MGridChunk(const QString &variableName, const MChunkRegion &region);

    ~MGridChunk();

    unsigned int getMemorySize_kb() override;

    const QString& getVariableName() const { return variableName; }

    const MChunkRegion& getRegion() const { return region; }

    size_t getNumValues() const { return numValues; }

    float getValue(size_t index) const { return data[index]; }

    void setValue(size_t index, float value) { data[index] = value; }

    /**
      Sets all values to NaN.
     */
    void setToMissing();

    /**
      Computes minimum, maximum, mean and standard deviation of the non-missing
      values. Returns the number of non-missing values.
     */
    size_t computeStatistics(double *min, double *max,
                             double *mean, double *stddev) const;

    // Data field, public for efficient access.
    float *data;

private:
    QString variableName;
    MChunkRegion region;
    size_t numValues;

    Q_DISABLE_COPY(MGridChunk)
};

} // namespace MetMC

#endif // GRIDCHUNK_H
