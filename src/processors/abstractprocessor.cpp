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
#include "abstractprocessor.h"

// standard library imports
#include <new>

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"
#include "util/mstopwatch.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MAbstractProcessor::MAbstractProcessor(const MProcessorConfiguration &config,
                                       const MSourceTypeRegistry &registry,
                                       MAbstractScheduler *scheduler)
    : config(config),
      registry(registry),
      scheduler(scheduler),
      progressSink(nullptr)
{
    if (scheduler == nullptr)
        throw MValueError("no valid scheduler passed", __FILE__, __LINE__);
}


MAbstractProcessor::~MAbstractProcessor()
{
    foreach (MGraphJob job, graphJobs) delete job.graph;
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MAbstractProcessor::run()
{
    if (stateMachine.getState() != INIT_STATE)
    {
        throw MInitialisationError("processor has already been run",
                                   __FILE__, __LINE__);
    }

    MStopwatch stopwatch;

    try
    {
        stateMachine.transitionTo(VALIDATING_INPUT_STATE);
        config.validate();
        config.log();
        schema = registry.resolve(config.sourceType);
        validateInput();

        stateMachine.transitionTo(BUILDING_GRAPH_STATE);
        chunkStore.reset(new MChunkStore(
                             processorOperationToString(config.operation),
                             uint(config.memoryLimit_MB) * 1024));
        buildGraphs();

        stateMachine.transitionTo(EXECUTING_STATE);
        executeGraphs();
        graphsExecuted();

        stateMachine.transitionTo(WRITING_STATE);
        writeOutput();

        stateMachine.transitionTo(CLOSED_STATE);
    }
    catch (MException &e)
    {
        handleFailure(QString::fromStdString(e.getComplaint()));
        throw;
    }
    catch (std::bad_alloc &)
    {
        handleFailure("out of memory");
        throw;
    }
    catch (std::exception &e)
    {
        handleFailure(e.what());
        throw;
    }

    stopwatch.split();
    LOG4CPLUS_INFO(mlog, processorOperationToString(config.operation)
                   .toStdString() << " finished in "
                   << stopwatch.getElapsedTime(MStopwatch::SECONDS)
                   << " seconds");
    if (progressSink) progressSink->runFinished(true);
}


QStringList MAbstractProcessor::getGraphNames() const
{
    QStringList names;
    foreach (MGraphJob job, graphJobs) names << job.name;
    return names;
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

void MAbstractProcessor::addTaskGraph(const QString &name, MTaskGraph *graph,
                                      int numChunks)
{
    MGraphJob job;
    job.name = name;
    job.graph = graph;
    job.numChunks = numChunks;
    graphJobs << job;

    LOG4CPLUS_DEBUG(mlog, "task graph for variable " << name.toStdString()
                    << ": " << graph->numTasks() << " tasks, "
                    << graph->getSinks().size() << " sinks");
}


void MAbstractProcessor::logStatistics(const MGridDatasetWriter *writer,
                                       const QString &variableName) const
{
    if (!mlog.isEnabledFor(log4cplus::DEBUG_LOG_LEVEL)) return;

    MWrittenValueStatistics s = writer->getStatistics(variableName);
    if (s.count == 0)
    {
        LOG4CPLUS_DEBUG(mlog, "  " << variableName.toStdString()
                        << ": no valid values");
        return;
    }

    LOG4CPLUS_DEBUG(mlog, "  min:  " << s.min);
    LOG4CPLUS_DEBUG(mlog, "  max:  " << s.max);
    LOG4CPLUS_DEBUG(mlog, "  mean: " << s.mean());
    LOG4CPLUS_DEBUG(mlog, "  std:  " << s.stddev());
}


void MAbstractProcessor::setSoftwareAttributes(
        MGridDatasetWriter *writer) const
{
    writer->setGlobalAttribute("monte_carlo_software", metmcSoftwareName);
    writer->setGlobalAttribute("monte_carlo_software_version",
                               metmcVersionString);
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

void MAbstractProcessor::executeGraphs()
{
    if (progressSink)
        progressSink->runStarted(processorOperationToString(config.operation),
                                 graphJobs.size());

    LOG4CPLUS_DEBUG(mlog, "executing task graphs with "
                    << scheduler->getNumWorkers() << " worker(s)");

    for (int i = 0; i < graphJobs.size(); i++)
    {
        MGraphJob &job = graphJobs[i];

        if (MAbstractScheduler::isInterruptionRequested())
        {
            throw MInterruptError("processing has been interrupted",
                                  __FILE__, __LINE__);
        }

        LOG4CPLUS_INFO(mlog, "starting graph for variable: "
                       << job.name.toStdString());
        if (progressSink) progressSink->variableStarted(job.name,
                                                        job.numChunks);

        MStopwatch stopwatch;
        scheduler->executeTaskGraph(job.graph);
        stopwatch.split();

        LOG4CPLUS_INFO(mlog, "finished graph for variable: "
                       << job.name.toStdString());
        LOG4CPLUS_DEBUG(mlog, "  elapsed: "
                        << stopwatch.getElapsedTime(MStopwatch::SECONDS)
                        << " seconds, peak chunk store usage "
                        << chunkStore->getPeakMemoryUsage_kb() << " kb");
        if (progressSink) progressSink->variableFinished(job.name);

        if (chunkStore->numStoredItems() > 0)
        {
            LOG4CPLUS_WARN(mlog, chunkStore->numStoredItems()
                           << " data item(s) left in chunk store after "
                              "executing graph for variable "
                           << job.name.toStdString());
            chunkStore->clear();
        }

        delete job.graph;
        job.graph = nullptr;
    }
}


void MAbstractProcessor::handleFailure(const QString &message)
{
    LOG4CPLUS_ERROR(mlog, processorOperationToString(config.operation)
                    .toStdString() << " failed in state "
                    << processorStateToString(stateMachine.getState())
                       .toStdString());

    stateMachine.fail();
    if (chunkStore) chunkStore->clear();
    abortOutput();

    if (progressSink)
    {
        progressSink->error(message);
        progressSink->runFinished(false);
    }
}

} // namespace MetMC
