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
#include "scheduleddatasource.h"

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

MScheduledDataSource::MScheduledDataSource(const QString &identifier)
    : identifier(identifier),
      chunkStore(nullptr)
{
}


MScheduledDataSource::~MScheduledDataSource()
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MScheduledDataSource::setChunkStore(MChunkStore *store)
{
    if (chunkStore != nullptr)
        throw MInitialisationError("chunk store of data source " +
                                   identifier.toStdString() +
                                   " has already been set",
                                   __FILE__, __LINE__);
    if (store == nullptr)
        throw MValueError("no valid pointer to a chunk store passed",
                          __FILE__, __LINE__);
    chunkStore = store;
}


MDataRequest MScheduledDataSource::normalizeRequest(MDataRequest request) const
{
    // Check if all required keys are present in the request.
    MDataRequestHelper rh(request);
    QStringList requiredKeys = locallyRequiredKeys();
    if (!rh.containsAll(requiredKeys))
    {
        QString msg = QString(
                    "Request %1 is missing required keys. Required are: %2")
                .arg(request).arg(requiredKeys.join(";"));

        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MKeyError(msg.toStdString(), __FILE__, __LINE__);
    }

    // Remove all keys that are not required in the request to create a unique
    // key for the chunk store and the task graph.
    rh.removeAllKeysExcept(requiredKeys);
    rh.insert("SOURCE", identifier);
    return rh.request();
}


MTask *MScheduledDataSource::getTaskGraph(MDataRequest request,
                                          MTaskGraph *graph)
{
    MDataRequest normalizedRequest = normalizeRequest(request);

    // An operation that is required by several consumers is only executed
    // once; all consumers become children of the same task.
    if (MTask *task = graph->findTask(normalizedRequest)) return task;

    // Recursively create a task graph of a task representing this data source
    // and the tasks that compute the inputs.
    MTask *task = createTaskGraph(normalizedRequest, graph);
    graph->addTask(task);
    return task;
}


void MScheduledDataSource::processRequest(MDataRequest request,
                                          MTask *handlingTask)
{
    if (chunkStore == nullptr)
        throw MInitialisationError("no chunk store set for data source " +
                                   identifier.toStdString(),
                                   __FILE__, __LINE__);

    // Thread-safety: The chunk store cannot be changed during the lifetime
    // of this data source (see setChunkStore()). As the chunk store itself
    // provides thread-safe methods, this method can access it without
    // blocking.

    // produceData() needs to be implemented in a thread-safe manner in
    // derived classes.
    MAbstractDataItem *item = produceData(request);
    if (item)
    {
        item->setGeneratingRequest(request);

        // The item is kept until each child task has released it.
        bool stored;
        try
        {
            stored = chunkStore->storeData(item, handlingTask->numChildren());
        }
        catch (MMemoryError &)
        {
            delete item;
            throw;
        }

        if ( !stored )
        {
            LOG4CPLUS_WARN(mlog, "data item for request "
                           << request.toStdString()
                           << " has already been stored; discarding "
                              "duplicate");
            delete item;
        }
    }
}


MAbstractDataItem *MScheduledDataSource::getData(MDataRequest request)
{
    return chunkStore->getData(normalizeRequest(request));
}


void MScheduledDataSource::releaseData(MDataRequest request)
{
    chunkStore->releaseData(normalizeRequest(request));
}

} // namespace MetMC
