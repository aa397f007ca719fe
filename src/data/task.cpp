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
#include "task.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "scheduleddatasource.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                                MTask                                    ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MTask::MTask(MDataRequest request, MScheduledDataSource *dataSource)
    : scheduled(false),
      request(request),
      dataSource(dataSource),
      parentsMutex(QMutex::Recursive),
      diskReaderTask(false),
      diskWriterTask(false)
{
}


MTask::~MTask()
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MTask::setScheduled()
{
    scheduled = true;
}


void MTask::addParent(MTask *task)
{
    QMutexLocker locker(&parentsMutex);
    if (parents.contains(task)) return;

    parents.append(task);
    task->addChild(this);
}


void MTask::run()
{
    dataSource->processRequest(request, this);
}


const QList<MTask*> &MTask::getAndLockParents()
{
    parentsMutex.lock();
    return parents;
}


void MTask::unlockParents()
{
    parentsMutex.unlock();
}


bool MTask::hasParents()
{
    QMutexLocker locker(&parentsMutex);
    return parents.size() > 0;
}


int MTask::numChildren()
{
    QMutexLocker locker(&childrenMutex);
    return children.size();
}


void MTask::removeFromTaskGraph()
{
    QMutexLocker lockerP(&parentsMutex);
    for (int i = 0; i < parents.size(); i++) parents[i]->removeChild(this);
    parents.clear();
    lockerP.unlock();

    QMutexLocker lockerC(&childrenMutex);
    for (int i = 0; i < children.size(); i++) children[i]->removeParent(this);
    children.clear();
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

void MTask::addChild(MTask *task)
{
    QMutexLocker locker(&childrenMutex);
    children.append(task);
}


void MTask::removeChild(MTask *task)
{
    QMutexLocker locker(&childrenMutex);
    if (children.contains(task)) children.removeAll(task);
}


void MTask::removeParent(MTask *task)
{
    QMutexLocker locker(&parentsMutex);
    if (parents.contains(task)) parents.removeAll(task);
}


/******************************************************************************
***                              MTaskGraph                                 ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MTaskGraph::MTaskGraph()
{
}


MTaskGraph::~MTaskGraph()
{
    foreach (MTask *task, tasks) delete task;
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

MTask *MTaskGraph::findTask(const MDataRequest &request) const
{
    return taskDictionary.value(request, nullptr);
}


void MTaskGraph::addTask(MTask *task)
{
    if (taskDictionary.contains(task->getRequest()))
    {
        QString msg = QString("task graph already contains a task for "
                              "request %1").arg(task->getRequest());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MKeyError(msg.toStdString(), __FILE__, __LINE__);
    }

    taskDictionary.insert(task->getRequest(), task);
    tasks.append(task);
}


void MTaskGraph::addSink(MTask *task)
{
    if (!sinks.contains(task)) sinks.append(task);
}

} // namespace MetMC
