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
#include "chunkstore.h"

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
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MChunkStore::MChunkStore(QString identifier,
                         unsigned int allowedMemoryUsage_kb)
    : identifier(identifier),
      systemMemoryLimit_kb(allowedMemoryUsage_kb),
      systemMemoryUsage_kb(0),
      peakSystemMemoryUsage_kb(0)
{
    LOG4CPLUS_DEBUG(mlog, "initializing chunk store <"
                    << identifier.toStdString() << "> with memory limit "
                    << systemMemoryLimit_kb << " kb");
}


MChunkStore::~MChunkStore()
{
    clear();
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

bool MChunkStore::storeData(MAbstractDataItem *item, int numConsumers)
{
    MDataRequest request = item->getGeneratingRequest();

    if (numConsumers <= 0)
    {
        // Nobody will ever ask for this item.
        delete item;
        return true;
    }

    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );

    // Items that are already stored cannot be stored again.
    if (activeDataItems.contains(request))
    {
        LOG4CPLUS_WARN(mlog, "WARNING: storeData() for request "
                       << request.toStdString()
                       << " declined, request key already exists.");
        return false;
    }

    unsigned int itemMemoryUsage_kb = item->getMemorySize_kb();
    if ( systemMemoryUsage_kb + itemMemoryUsage_kb >= systemMemoryLimit_kb )
    {
        QString msg = QString("memory limit of chunk store <%1> (%2 kb) "
                              "exceeded, cannot store %3")
                .arg(identifier).arg(systemMemoryLimit_kb).arg(request);
        throw MMemoryError(msg.toStdString(), __FILE__, __LINE__);
    }

    activeDataItems.insert(request, item);
    referenceCounter.insert(request, numConsumers);
    systemMemoryUsage_kb += itemMemoryUsage_kb;
    peakSystemMemoryUsage_kb = max(peakSystemMemoryUsage_kb,
                                   systemMemoryUsage_kb);
    return true;
}


bool MChunkStore::containsData(MDataRequest request)
{
    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );
    return activeDataItems.contains(request);
}


MAbstractDataItem *MChunkStore::getData(MDataRequest request)
{
    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );

    if ( !activeDataItems.contains(request) )
    {
        QString msg = QString("chunk store <%1> does not contain an item for "
                              "request %2").arg(identifier).arg(request);
        LOG4CPLUS_ERROR(mlog, "ERROR: " << msg.toStdString());
        throw MKeyError(msg.toStdString(), __FILE__, __LINE__);
    }

    return activeDataItems.value(request);
}


void MChunkStore::releaseData(MDataRequest request)
{
    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );

    if (activeDataItems.contains(request))
    {
        // Decrement reference counter. If it is zero afterwards, no consumer
        // requires the item anymore.
        referenceCounter[request] -= 1;

        if (referenceCounter[request] == 0)
        {
            referenceCounter.remove(request);
            MAbstractDataItem *item = activeDataItems.take(request);
            systemMemoryUsage_kb -= item->getMemorySize_kb();
            delete item;
        }
    }
    else
    {
        QString msg = QString("You shouldn't release a data item that is not "
                              "currently active: %1").arg(request);
        LOG4CPLUS_ERROR(mlog, "ERROR: " << msg.toStdString());
        throw MMemoryError(msg.toStdString(), __FILE__, __LINE__);
    }
}


void MChunkStore::clear()
{
    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );

    foreach (MAbstractDataItem *item, activeDataItems) delete item;
    activeDataItems.clear();
    referenceCounter.clear();
    systemMemoryUsage_kb = 0;
}


int MChunkStore::numStoredItems()
{
    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );
    return activeDataItems.size();
}


unsigned int MChunkStore::getMemoryUsage_kb()
{
    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );
    return systemMemoryUsage_kb;
}


unsigned int MChunkStore::getPeakMemoryUsage_kb()
{
    QMutexLocker memoryCacheLocker( &(this->memoryCacheMutex) );
    return peakSystemMemoryUsage_kb;
}

} // namespace MetMC
