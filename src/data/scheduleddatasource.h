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
#ifndef SCHEDULEDDATASOURCE_H
#define SCHEDULEDDATASOURCE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "abstractdataitem.h"
#include "chunkstore.h"
#include "datarequest.h"
#include "task.h"


namespace MetMC
{

/**
  @brief MScheduledDataSource is the base class for all data sources whose
  chunk operations are executed as tasks of a task graph by a scheduler
  (@ref MAbstractScheduler). The results of the operations are passed from
  producing to consuming tasks through a @ref MChunkStore.

  A data source is identified by a name that is added to all requests it
  handles (key "SOURCE"), hence requests of different sources never collide
  in the chunk store or in a task graph.

  @note Currently (only) processRequest() is thread-safe.
  */
class MScheduledDataSource
{
public:
    explicit MScheduledDataSource(const QString &identifier);

    virtual ~MScheduledDataSource();

    const QString& getIdentifier() const { return identifier; }

    /**
      Specify the chunk store that receives the data items of this source.
      The store can only be specified once.
     */
    void setChunkStore(MChunkStore *store);

    MChunkStore* getChunkStore() const { return chunkStore; }

    /**
      Returns @p request reduced to the keys required by this source and
      tagged with the identifier of the source. This is the key under which
      the data item produced for @p request is stored.

      Throws an @ref MKeyError if a required key is missing.
     */
    MDataRequest normalizeRequest(MDataRequest request) const;

    /**
      Returns the keys required by this source.
     */
    const QStringList requiredKeys() const { return locallyRequiredKeys(); }

    /**
      Returns the task that handles @p request in @p graph. If the graph does
      not contain such a task yet, the implementation of @ref
      createTaskGraph() is called to create the task and the tasks of its
      inputs, and the new task is added to the graph.
     */
    MTask* getTaskGraph(MDataRequest request, MTaskGraph *graph);

    /**
      Calls the implementation of @ref produceData() to produce the requested
      data item and, if an item is produced, stores it in the chunk store for
      the children of @p handlingTask.

      @note This function is thread-safe. It is usually called from
      @ref MTask::run(), which may be executed by a multi-threaded scheduler
      (e.g. @ref MMultiThreadScheduler).
     */
    void processRequest(MDataRequest request, MTask *handlingTask);

    /**
      Returns the data item this source produced for @p request from the
      chunk store. Consumers need to call @ref releaseData() when finished.
     */
    MAbstractDataItem* getData(MDataRequest request);

    void releaseData(MDataRequest request);

protected:
    /**
      Creates a task for the normalized @p request and connects it to the
      tasks of its inputs (which are obtained from the input sources with
      @ref getTaskGraph()). Must be implemented in derived classes.
     */
    virtual MTask* createTaskGraph(MDataRequest request,
                                   MTaskGraph *graph) = 0;

    /**
     Produces the data item corresponding to @p request. Sinks (e.g. writers)
     return a @p nullptr.

     @note This function needs to be implemented in a <em> thread-safe </em>
     manner, i.e. all access to shared data/resources within this class needs
     to be serialized.
     */
    virtual MAbstractDataItem* produceData(MDataRequest request) = 0;

    /**
      Needs to be implemented in derived classes. Returns a list with the
      keys required by the data source.
     */
    virtual const QStringList locallyRequiredKeys() const = 0;

    QString identifier;
    MChunkStore *chunkStore;
};

} // namespace MetMC

#endif // SCHEDULEDDATASOURCE_H
