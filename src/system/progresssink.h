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
#ifndef PROGRESSSINK_H
#define PROGRESSSINK_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports


namespace MetMC
{

/**
  @brief MProgressSink receives progress events of a processor run. Sinks
  are optional; processors skip all notifications if no sink is set.

  @ref chunkWritten() is called from worker threads and hence needs to be
  thread-safe in derived classes. All other methods are called from the
  thread that runs the processor.
  */
class MProgressSink
{
public:
    MProgressSink() {}
    virtual ~MProgressSink() {}

    virtual void runStarted(const QString &operation, int numVariables)
    { Q_UNUSED(operation); Q_UNUSED(numVariables); }

    virtual void variableStarted(const QString &variableName, int numChunks)
    { Q_UNUSED(variableName); Q_UNUSED(numChunks); }

    virtual void chunkWritten(const QString &variableName)
    { Q_UNUSED(variableName); }

    virtual void variableFinished(const QString &variableName)
    { Q_UNUSED(variableName); }

    virtual void runFinished(bool success) { Q_UNUSED(success); }

    virtual void error(const QString &message) { Q_UNUSED(message); }
};


/**
  @brief MLoggingProgressSink reports progress events to the application
  logger. Chunk progress is logged in steps of 10 percent per variable.
  */
class MLoggingProgressSink : public MProgressSink
{
public:
    MLoggingProgressSink();

    void runStarted(const QString &operation, int numVariables) override;

    void variableStarted(const QString &variableName, int numChunks) override;

    void chunkWritten(const QString &variableName) override;

    void variableFinished(const QString &variableName) override;

    void runFinished(bool success) override;

    void error(const QString &message) override;

    int numChunksWritten(const QString &variableName);

private:
    struct Progress
    {
        Progress() : numChunks(0), numWritten(0), lastReportedPercent(0) {}
        int numChunks;
        int numWritten;
        int lastReportedPercent;
    };

    QMutex progressMutex;
    QHash<QString, Progress> progress;
    int numVariables;
    int numVariablesFinished;
};

} // namespace MetMC

#endif // PROGRESSSINK_H
