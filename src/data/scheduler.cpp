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
#include "scheduler.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>
#include <QtConcurrentRun>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;


namespace MetMC
{

std::atomic<bool> MAbstractScheduler::interruptionRequested(false);


/******************************************************************************
***                      MSingleThreadScheduler                             ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MSingleThreadScheduler::MSingleThreadScheduler()
    : MAbstractScheduler()
{
}


MSingleThreadScheduler::~MSingleThreadScheduler()
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MSingleThreadScheduler::executeTaskGraph(MTaskGraph *graph)
{
    LOG4CPLUS_DEBUG(mlog, "Executing task graph with " << graph->numTasks()
                    << " tasks in the calling thread.");

    foreach (MTask *sink, graph->getSinks())
    {
        executeTaskGraphDepthFirst(sink, 0);
    }
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

void MSingleThreadScheduler::executeTaskGraphDepthFirst(MTask *task, int level)
{
    // Tasks with several children are reached more than once.
    if (task->isScheduled()) return;
    task->setScheduled();

    // First execute all parents on which "task" is dependent. Qt's foreach
    // iterates over a copy of the list, hence parents can remove themselves
    // from the graph during the loop.
    foreach (MTask *parent, task->getAndLockParents())
    {
        executeTaskGraphDepthFirst(parent, level + 1);
    }
    task->unlockParents();

    if (isInterruptionRequested())
    {
        throw MInterruptError("processing has been interrupted",
                              __FILE__, __LINE__);
    }

    LOG4CPLUS_TRACE(mlog, "Level " << level << ": "
                    << task->getRequest().toStdString());

    // Run the task and remove it from the graph. Tasks are owned by the
    // graph.
    task->run();
    task->removeFromTaskGraph();
}


/******************************************************************************
***                       MMultiThreadScheduler                             ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MMultiThreadScheduler::MMultiThreadScheduler(int numWorkers,
                                             int maxActiveDiskReaderTasks)
    : MAbstractScheduler(),
      numWorkers(numWorkers),
      numCurrentlyActiveTasks(0),
      maxActiveDiskReaderTasks(maxActiveDiskReaderTasks),
      currentlyActiveDiskReaderTasks(0),
      currentlyActiveDiskWriterTasks(0),
      exitAllThreads(false)
{
    if (numWorkers < 1)
    {
        throw MValueError(QString("invalid number of worker threads: %1")
                          .arg(numWorkers).toStdString(), __FILE__, __LINE__);
    }

    if (maxActiveDiskReaderTasks < 1) this->maxActiveDiskReaderTasks = 1;

    LOG4CPLUS_DEBUG(mlog, "Initializing new multithread scheduler with "
                    << numWorkers << " worker threads.");

    workerPool.setMaxThreadCount(numWorkers);
}


MMultiThreadScheduler::~MMultiThreadScheduler()
{
    workerPool.waitForDone();
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MMultiThreadScheduler::executeTaskGraph(MTaskGraph *graph)
{
    // Traverse the graph in depth-first order and enqueue its tasks in the
    // task queue. Tasks hence become available roughly in the order in which
    // their results are consumed, which limits the number of data items that
    // are held in the chunk store at the same time.
    taskQueueMutex.lock();
    taskQueue.clear();
    numCurrentlyActiveTasks = 0;
    currentlyActiveDiskReaderTasks = 0;
    currentlyActiveDiskWriterTasks = 0;
    exitAllThreads = false;
    firstTaskError = exception_ptr();

    foreach (MTask *sink, graph->getSinks())
    {
        traverseAndEnqueueDepthFirst(sink, &taskQueue);
    }
    LOG4CPLUS_DEBUG(mlog, "Executing task graph with " << taskQueue.size()
                    << " tasks on " << numWorkers << " worker threads.");
    taskQueueMutex.unlock();

    // Start the worker threads and wait for them to finish.
    QList< QFuture<void> > workerThreadFutures;
    for (int i = 0; i < numWorkers; i++)
    {
        workerThreadFutures.append(
                    QtConcurrent::run(
                        &workerPool, [this, i]() { executeTasks(uint(i)); }));
    }
    foreach (QFuture<void> future, workerThreadFutures)
        future.waitForFinished();

    QMutexLocker locker(&taskQueueMutex);
    if (firstTaskError)
    {
        LOG4CPLUS_DEBUG(mlog, "Task graph execution stopped; "
                        << taskQueue.size() << " tasks have not been run.");
        taskQueue.clear();
        exception_ptr error = firstTaskError;
        firstTaskError = exception_ptr();
        rethrow_exception(error);
    }
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

void MMultiThreadScheduler::traverseAndEnqueueDepthFirst(
        MTask *task, QList<MTask *> *queue)
{
    // Tasks with several children are reached more than once. Don't schedule
    // them again.
    if (task->isScheduled()) return;

    // Enqueue all parents (i.e. the dependencies) of this task first.
    foreach (MTask *parent, task->getAndLockParents())
    {
        traverseAndEnqueueDepthFirst(parent, queue);
    }
    task->unlockParents();

    // Enqueue this task.
    queue->append(task);
    task->setScheduled();
}


MTask* MMultiThreadScheduler::dequeueFirstTaskWithoutDependency(
        uint execThreadID)
{
    Q_UNUSED(execThreadID);

    // NOTE: taskQueueMutex needs to be locked by the caller.
    for (int i = 0; i < taskQueue.size(); i++)
    {
        MTask *task = taskQueue[i];

        // Parents remove themselves from the graph once they have finished.
        if (task->hasParents()) continue;

        if (task->isDiskReaderTask()
                && currentlyActiveDiskReaderTasks >= maxActiveDiskReaderTasks)
        {
            continue;
        }

        // Writes to the target dataset are serialized anyway; a second
        // writer would only block a worker.
        if (task->isDiskWriterTask() && currentlyActiveDiskWriterTasks > 0)
        {
            continue;
        }

        taskQueue.removeAt(i);
        return task;
    }

    return nullptr;
}


void MMultiThreadScheduler::executeTasks(uint execThreadID)
{
    QMutexLocker locker(&taskQueueMutex);

    forever
    {
        // Check if the thread should be exited: either a task has failed, or
        // all tasks have been executed.
        if (!exitAllThreads && isInterruptionRequested())
        {
            recordTaskError(make_exception_ptr(
                                MInterruptError("processing has been "
                                                "interrupted",
                                                __FILE__, __LINE__)),
                            nullptr);
            taskExecutionWaitCondition.wakeAll();
        }
        if (exitAllThreads)
        {
            break;
        }
        if (taskQueue.isEmpty() && numCurrentlyActiveTasks == 0)
        {
            taskExecutionWaitCondition.wakeAll();
            break;
        }

        MTask *task = dequeueFirstTaskWithoutDependency(execThreadID);

        if (task == nullptr)
        {
            // All remaining tasks depend on currently active tasks. Wait
            // until one of them has finished.
            taskExecutionWaitCondition.wait(&taskQueueMutex);
            continue;
        }

        numCurrentlyActiveTasks++;
        if (task->isDiskReaderTask()) currentlyActiveDiskReaderTasks++;
        if (task->isDiskWriterTask()) currentlyActiveDiskWriterTasks++;
        locker.unlock();

        LOG4CPLUS_TRACE(mlog, "Scheduler THREAD# " << execThreadID
                        << " executing task: "
                        << task->getRequest().toStdString());

        exception_ptr error;
        try
        {
            task->run();
        }
        catch (...)
        {
            // Keep the exception to rethrow it in the calling thread.
            error = current_exception();
        }

        locker.relock();
        if (error) recordTaskError(error, task);
        numCurrentlyActiveTasks--;
        if (task->isDiskReaderTask()) currentlyActiveDiskReaderTasks--;
        if (task->isDiskWriterTask()) currentlyActiveDiskWriterTasks--;
        task->removeFromTaskGraph();

        // Children of the finished task may have become executable.
        taskExecutionWaitCondition.wakeAll();
    }

    LOG4CPLUS_TRACE(mlog, "Scheduler THREAD# " << execThreadID
                    << " finishes execution.");
}


void MMultiThreadScheduler::recordTaskError(exception_ptr error, MTask *task)
{
    // NOTE: taskQueueMutex needs to be locked by the caller.
    if (firstTaskError) return;

    firstTaskError = error;
    exitAllThreads = true;

    if (task)
    {
        LOG4CPLUS_ERROR(mlog, "Task failed: "
                        << task->getRequest().toStdString()
                        << "; no further tasks will be started.");
    }
    else
    {
        LOG4CPLUS_WARN(mlog, "Interruption requested; no further tasks will "
                       "be started.");
    }
}

} // namespace MetMC
