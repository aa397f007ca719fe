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
#ifndef CHUNKSTORE_H
#define CHUNKSTORE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "abstractdataitem.h"
#include "datarequest.h"

namespace MetMC
{

/**
  @brief MChunkStore holds the data items produced by chunk operations until
  all consuming operations of the task graph have used them.

  Each item is stored with a reference counter that equals the number of
  consumers. Every consumer calls @ref releaseData() after it has used the
  item; the item is deleted when its counter drops to zero.

  Always follow the order

  1. @ref storeData()
  2. @ref getData()
  3. @ref releaseData()

  All methods are thread-safe.
  */
class MChunkStore
{
public:
    MChunkStore(QString identifier, unsigned int allowedMemoryUsage_kb);

    virtual ~MChunkStore();

    /**
      Store the data item under its generating request, to be used by
      @p numConsumers consumers. Returns @p false if an item is already stored
      with the given item's request key (the passed item is not taken over in
      this case). Throws an @ref MMemoryError if the memory limit would be
      exceeded. Items with zero consumers are deleted immediately.
     */
    bool storeData(MAbstractDataItem *item, int numConsumers);

    bool containsData(MDataRequest request);

    /**
      Returns the item stored under the given request. Throws an @ref
      MKeyError if no such item exists.
     */
    MAbstractDataItem* getData(MDataRequest request);

    /**
      Decrements the reference counter of the item stored under @p request
      and deletes the item if the counter reaches zero.
     */
    void releaseData(MDataRequest request);

    /**
      Deletes all stored items, regardless of their reference counters. Used
      after a failed graph execution.
     */
    void clear();

    int numStoredItems();

    unsigned int getMemoryUsage_kb();

    unsigned int getPeakMemoryUsage_kb();

protected:
    QString identifier;

    /** Dictionary of active data items. */
    QHash<MDataRequest, MAbstractDataItem*> activeDataItems;
    /** Reference counter for each data item, if 0 data item is deleted. */
    QHash<MDataRequest, int> referenceCounter;

    /** Amount of system memory in kb the store is allowed to consume. */
    unsigned int systemMemoryLimit_kb;
    /** Amount of currently consumed memory. */
    unsigned int systemMemoryUsage_kb;
    unsigned int peakSystemMemoryUsage_kb;

    /** Mutex to protect the above defined dictionaries. A single mutex is
        sufficient, as all QHash and int objects need to be in sync and hence
        need to be protected together. */
    QMutex memoryCacheMutex;
};

} // namespace MetMC

#endif // CHUNKSTORE_H
