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
#ifndef CHUNKWRITERSOURCE_H
#define CHUNKWRITERSOURCE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "scheduleddatasource.h"
#include "griddatasetwriter.h"
#include "system/progresssink.h"


namespace MetMC
{

/**
  @brief MChunkWriterSource writes the chunks produced by an input source to
  a variable of a @ref MGridDatasetWriter. Requests need to contain the key
  TARGET_VARIABLE and all keys required by the input source.

  Writer tasks are the sinks of a task graph; they do not produce data
  items.
  */
class MChunkWriterSource : public MScheduledDataSource
{
public:
    MChunkWriterSource(const QString &identifier, MGridDatasetWriter *writer,
                       MScheduledDataSource *inputSource);

    MGridDatasetWriter* getWriter() const { return writer; }

    /**
      Set a sink that is notified after each written chunk (may be a
      @p nullptr).
     */
    void setProgressSink(MProgressSink *sink) { progressSink = sink; }

protected:
    MTask* createTaskGraph(MDataRequest request, MTaskGraph *graph) override;

    MAbstractDataItem* produceData(MDataRequest request) override;

    const QStringList locallyRequiredKeys() const override;

private:
    MGridDatasetWriter *writer;
    MScheduledDataSource *inputSource;
    MProgressSink *progressSink;
};

} // namespace MetMC

#endif // CHUNKWRITERSOURCE_H
