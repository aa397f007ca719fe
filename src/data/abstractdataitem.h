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
#ifndef ABSTRACTDATAITEM_H
#define ABSTRACTDATAITEM_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "datarequest.h"


namespace MetMC
{

/**
  @brief MAbstractDataItem is the abstract base class for all classes that
  represent a data item produced by a chunk operation and held in the
  @ref MChunkStore until all consuming operations have used it.
  */
class MAbstractDataItem
{
public:
    MAbstractDataItem();

    virtual ~MAbstractDataItem();

    virtual unsigned int getMemorySize_kb() = 0;

    MDataRequest getGeneratingRequest() const { return generatingRequest; }

    void setGeneratingRequest(MDataRequest r) { generatingRequest = r; }

private:
    // The request that generated this data item.
    MDataRequest generatingRequest;
};

} // namespace MetMC

#endif // ABSTRACTDATAITEM_H
