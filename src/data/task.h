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
#ifndef TASK_H
#define TASK_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "datarequest.h"


namespace MetMC
{

class MScheduledDataSource;

/**
  @brief MTask implements a node of a task graph. MTask references a single
  chunk operation (defined by a request to a data source and executed by
  calling run()) and can have parents and children to store a task graph.
  Parents are the operations whose results this task consumes.

  @note The MTask class itself is NOT thread-safe. However, an instance
  should only be handled by a single thread (see @ref
  MMultiThreadScheduler::executeTasks()). Care needs to be taken with respect
  to @ref removeFromTaskGraph(), which affects other tasks in a task graph
  (make sure that only one instance of removeFromTaskGraph() is executed
  simultaneously in a task graph).
  */
class MTask
{
public:
    MTask(MDataRequest request, MScheduledDataSource* dataSource);

    virtual ~MTask();

    bool isScheduled() { return scheduled; }

    void setScheduled();

    void setDiskReaderTask() { diskReaderTask = true; }

    void setDiskWriterTask() { diskWriterTask = true; }

    /**
      Adds @p task as a dependency of this task. Adding the same parent twice
      has no effect.
     */
    void addParent(MTask *task);

    MDataRequest getRequest() const { return request; }

    MScheduledDataSource* getDataSource() const { return dataSource; }

    /**
      Executes the task by calling @ref MScheduledDataSource::processRequest().
     */
    void run();

    bool isDiskReaderTask() const { return diskReaderTask; }

    bool isDiskWriterTask() const { return diskWriterTask; }

    const QList<MTask*>& getAndLockParents();

    void unlockParents();

    bool hasParents();

    int numChildren();

    /**
      Removes the links to parent and children tasks.
     */
    void removeFromTaskGraph();

protected:
    void addChild(MTask *task);

    void removeChild(MTask *task);

    void removeParent(MTask *task);

private:
    bool scheduled;

    // The request that is processed by this task.
    MDataRequest request;

    MScheduledDataSource *dataSource;

    QList<MTask*> parents;
    QMutex parentsMutex;
    QList<MTask*> children;
    QMutex childrenMutex;

    // Information for the task scheduler: Is this task reading data from disk
    // or writing data to disk? The scheduler can decide how many tasks that
    // access a certain resource can be executed simultaneously.
    bool diskReaderTask;
    bool diskWriterTask;
};


/**
  @brief MTaskGraph owns all tasks of a task graph and provides lookup of
  tasks by their request, so that a chunk operation required by several
  consumers is represented by a single task.

  The graph is built by a single thread; it is not modified during execution
  apart from the task links (see @ref MTask::removeFromTaskGraph()).
  */
class MTaskGraph
{
public:
    MTaskGraph();

    ~MTaskGraph();

    /**
      Returns the task that processes @p request, or a @p nullptr.
     */
    MTask* findTask(const MDataRequest &request) const;

    /**
      Takes ownership of @p task. Throws an @ref MKeyError if a task with the
      same request is already part of the graph.
     */
    void addTask(MTask *task);

    /**
      Marks @p task as a sink, i.e. a task whose execution is the purpose of
      the graph (e.g. writing a chunk to the target dataset). Schedulers
      traverse the graph starting from the sinks.
     */
    void addSink(MTask *task);

    const QList<MTask*>& getSinks() const { return sinks; }

    const QList<MTask*>& getTasks() const { return tasks; }

    int numTasks() const { return tasks.size(); }

private:
    QHash<MDataRequest, MTask*> taskDictionary;
    QList<MTask*> tasks;
    QList<MTask*> sinks;

    Q_DISABLE_COPY(MTaskGraph)
};


} // namespace MetMC

#endif // TASK_H
