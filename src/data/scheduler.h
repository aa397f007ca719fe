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
#ifndef SCHEDULER_H
#define SCHEDULER_H

// standard library imports
#include <atomic>
#include <exception>

// related third party imports
#include <QtCore>

// local application imports
#include "task.h"


namespace MetMC
{

/**
  @brief MAbstractScheduler is the base class for task schedulers. Derived
  classes must implement @ref executeTaskGraph().
  */
class MAbstractScheduler
{
public:
    MAbstractScheduler() {}
    virtual ~MAbstractScheduler() {}

    /**
      Executes all tasks of @p graph that are required by its sinks and
      returns when execution has finished. A task is only started after all
      its parents have finished.

      If a task fails, no further tasks are started; the exception of the
      first failing task is rethrown after all running tasks have finished.
      Must be reimplemented in derived classes.
     */
    virtual void executeTaskGraph(MTaskGraph *graph) = 0;

    /**
      Returns the number of tasks that can be executed simultaneously.
     */
    virtual int getNumWorkers() const = 0;

    /**
      Requests all schedulers to stop starting new tasks. Graph execution
      then fails with an @ref MInterruptError. Safe to call from a signal
      handler.
     */
    static void requestInterruption() { interruptionRequested = true; }

    static bool isInterruptionRequested() { return interruptionRequested; }

    static void clearInterruption() { interruptionRequested = false; }

private:
    static std::atomic<bool> interruptionRequested;
};


/**
  @brief MSingleThreadScheduler executes a task graph in the calling thread
  (simple recursive depth first graph traversal).
  */
class MSingleThreadScheduler : public MAbstractScheduler
{
public:
    MSingleThreadScheduler();
    virtual ~MSingleThreadScheduler();

    void executeTaskGraph(MTaskGraph *graph) override;

    int getNumWorkers() const override { return 1; }

private:   
    void executeTaskGraphDepthFirst(MTask *task, int level);
};


/**
  @brief MMultiThreadScheduler employs a fixed number of worker threads (from
  a thread pool owned by the scheduler) to execute the tasks of a task graph.
  The calling thread waits until all workers have finished.
  */
class MMultiThreadScheduler : public MAbstractScheduler
{
public:
    /**
      @p numWorkers needs to be positive. @p maxActiveDiskReaderTasks limits
      the number of tasks that read from disk simultaneously. Tasks that write
      to disk are executed one at a time.
     */
    MMultiThreadScheduler(int numWorkers, int maxActiveDiskReaderTasks = 2);
    virtual ~MMultiThreadScheduler();

    void executeTaskGraph(MTaskGraph *graph) override;

    int getNumWorkers() const override { return numWorkers; }

private:
    /**
      Recursive depth-first traversal of a task graph.
     */
    void traverseAndEnqueueDepthFirst(MTask *task, QList<MTask*> *queue);

    /**
      Take the first task from @ref taskQueue that does not have any dependency
      (i.e. parent task) that needs to be executed before the task.
     */
    MTask* dequeueFirstTaskWithoutDependency(uint execThreadID);

    /**
      This method is started for each worker thread by @ref
      executeTaskGraph(). Queries the @ref taskQueue for an item without
      dependency (via @ref dequeueFirstTaskWithoutDependency() and executes
      the task. Returns when the queue is empty or a task has failed.
     */
    void executeTasks(uint execThreadID);

    /**
      Stores the first error of a task and stops the scheduling of new tasks.
     */
    void recordTaskError(std::exception_ptr error, MTask *task);

    int numWorkers;
    QThreadPool workerPool;

    // Task queue-related member variables. All access must be blocked with
    // taskQueueMutex.
    QMutex taskQueueMutex;
    QWaitCondition taskExecutionWaitCondition;
    QList<MTask*> taskQueue;
    int numCurrentlyActiveTasks;
    int maxActiveDiskReaderTasks;
    int currentlyActiveDiskReaderTasks;
    int currentlyActiveDiskWriterTasks;
    bool exitAllThreads;
    std::exception_ptr firstTaskError;
};

} // namespace MetMC

#endif // SCHEDULER_H
