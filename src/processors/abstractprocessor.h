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
#ifndef ABSTRACTPROCESSOR_H
#define ABSTRACTPROCESSOR_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "data/chunkstore.h"
#include "data/griddatasetwriter.h"
#include "data/scheduler.h"
#include "data/task.h"
#include "system/processorconfiguration.h"
#include "system/processorstate.h"
#include "system/progresssink.h"
#include "system/sourcetypeschema.h"


namespace MetMC
{

/**
  @brief MAbstractProcessor is the base class of the scatter and collect
  processors. It runs the stages of a processor invocation

  1. validateInput()
  2. buildGraphs()
  3. execution of the task graphs with the injected scheduler
  4. writeOutput()

  and tracks them with an @ref MProcessorStateMachine. The first error
  terminates the run: the chunk store is cleared, @ref abortOutput() removes
  the partial target and the error is rethrown to the caller.

  Derived classes implement the stages and add one task graph per output
  variable with @ref addTaskGraph().
  */
class MAbstractProcessor
{
public:
    /**
      @p scheduler executes the task graphs and is not owned by the
      processor.
     */
    MAbstractProcessor(const MProcessorConfiguration &config,
                       const MSourceTypeRegistry &registry,
                       MAbstractScheduler *scheduler);

    virtual ~MAbstractProcessor();

    /**
      Set an optional sink that receives progress events (may be a
      @p nullptr).
     */
    void setProgressSink(MProgressSink *sink) { progressSink = sink; }

    /**
      Runs the processor. Throws the first error that occurred; the state
      is FAILED in this case and CLOSED otherwise. A processor can only be
      run once.
     */
    void run();

    MProcessorState getState() const { return stateMachine.getState(); }

    const MProcessorConfiguration& getConfiguration() const { return config; }

    /**
      Returns the names of the output variables in the order their task
      graphs are executed.
     */
    QStringList getGraphNames() const;

protected:
    virtual void validateInput() = 0;

    virtual void buildGraphs() = 0;

    /**
      Called after all task graphs have been executed successfully.
     */
    virtual void graphsExecuted() {}

    virtual void writeOutput() = 0;

    /**
      Removes the partial output after a failure. Must not throw.
     */
    virtual void abortOutput() = 0;

    /**
      Adds the task graph of output variable @p name, which writes
      @p numChunks chunks. The processor takes ownership of @p graph.
     */
    void addTaskGraph(const QString &name, MTaskGraph *graph, int numChunks);

    /**
      Logs the statistics of the values written to @p variableName (debug
      level).
     */
    void logStatistics(const MGridDatasetWriter *writer,
                       const QString &variableName) const;

    /**
      Sets the global attributes that identify the software that wrote the
      target dataset.
     */
    void setSoftwareAttributes(MGridDatasetWriter *writer) const;

    MChunkStore* getChunkStore() const { return chunkStore.data(); }

    MProgressSink* getProgressSink() const { return progressSink; }

    MProcessorConfiguration config;
    const MSourceTypeRegistry &registry;
    MSourceTypeSchema schema;

private:
    struct MGraphJob
    {
        QString name;
        MTaskGraph *graph;
        int numChunks;
    };

    void executeGraphs();

    void handleFailure(const QString &message);

    MAbstractScheduler *scheduler;
    MProgressSink *progressSink;
    MProcessorStateMachine stateMachine;
    QScopedPointer<MChunkStore> chunkStore;
    QList<MGraphJob> graphJobs;
};

} // namespace MetMC

#endif // ABSTRACTPROCESSOR_H
