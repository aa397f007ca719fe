/******************************************************************************
**
**  This file is part of Met.MC -- a processor for the Monte Carlo simulation
**  of measurement uncertainty in gridded geophysical datasets.
**
**  Copyright 2026 The Met.MC developers
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
#include "progresssink.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MLoggingProgressSink::MLoggingProgressSink()
    : numVariables(0),
      numVariablesFinished(0)
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MLoggingProgressSink::runStarted(const QString &operation,
                                      int numVariables)
{
    QMutexLocker locker(&progressMutex);
    this->numVariables = numVariables;
    numVariablesFinished = 0;
    progress.clear();
    LOG4CPLUS_INFO(mlog, operation.toStdString() << ": processing "
                   << numVariables << " variable(s)");
}


void MLoggingProgressSink::variableStarted(const QString &variableName,
                                           int numChunks)
{
    QMutexLocker locker(&progressMutex);
    Progress p;
    p.numChunks = numChunks;
    progress.insert(variableName, p);
}


void MLoggingProgressSink::chunkWritten(const QString &variableName)
{
    QMutexLocker locker(&progressMutex);
    Progress &p = progress[variableName];
    p.numWritten++;
    if (p.numChunks <= 0) return;

    int percent = (100 * p.numWritten) / p.numChunks;
    if (percent / 10 > p.lastReportedPercent / 10)
    {
        p.lastReportedPercent = percent;
        LOG4CPLUS_INFO(mlog, "  " << variableName.toStdString() << ": "
                       << p.numWritten << "/" << p.numChunks
                       << " chunks (" << percent << "%)");
    }
}


void MLoggingProgressSink::variableFinished(const QString &variableName)
{
    QMutexLocker locker(&progressMutex);
    numVariablesFinished++;
    LOG4CPLUS_INFO(mlog, "variable " << variableName.toStdString()
                   << " done (" << numVariablesFinished << "/"
                   << numVariables << ")");
}


void MLoggingProgressSink::runFinished(bool success)
{
    LOG4CPLUS_INFO(mlog, (success ? "run finished" : "run failed"));
}


void MLoggingProgressSink::error(const QString &message)
{
    LOG4CPLUS_ERROR(mlog, message.toStdString());
}


int MLoggingProgressSink::numChunksWritten(const QString &variableName)
{
    QMutexLocker locker(&progressMutex);
    return progress.value(variableName).numWritten;
}

} // namespace MetMC
