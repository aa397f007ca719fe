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
#include "chunkwritersource.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "data/gridchunk.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MChunkWriterSource::MChunkWriterSource(const QString &identifier,
                                       MGridDatasetWriter *writer,
                                       MScheduledDataSource *inputSource)
    : MScheduledDataSource(identifier),
      writer(writer),
      inputSource(inputSource),
      progressSink(nullptr)
{
    if (writer == nullptr || inputSource == nullptr)
        throw MValueError("no valid writer or input source passed",
                          __FILE__, __LINE__);
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

MTask* MChunkWriterSource::createTaskGraph(MDataRequest request,
                                           MTaskGraph *graph)
{
    MTask *task = new MTask(request, this);
    task->setDiskWriterTask();
    task->addParent(inputSource->getTaskGraph(request, graph));
    graph->addSink(task);
    return task;
}


MAbstractDataItem* MChunkWriterSource::produceData(MDataRequest request)
{
    MDataRequestHelper rh(request);
    QString targetVariable = rh.value("TARGET_VARIABLE");

    MAbstractDataItem *item = inputSource->getData(request);
    MGridChunk *chunk = dynamic_cast<MGridChunk*>(item);
    if (chunk == nullptr)
    {
        inputSource->releaseData(request);
        throw MValueError("input of writer " + identifier.toStdString()
                          + " did not produce a grid chunk",
                          __FILE__, __LINE__);
    }

    try
    {
        writer->writeChunk(targetVariable, *chunk);
    }
    catch (MException &)
    {
        inputSource->releaseData(request);
        throw;
    }

    inputSource->releaseData(request);

    if (progressSink) progressSink->chunkWritten(targetVariable);
    return nullptr;
}


const QStringList MChunkWriterSource::locallyRequiredKeys() const
{
    return (QStringList() << "TARGET_VARIABLE" << inputSource->requiredKeys());
}

} // namespace MetMC
