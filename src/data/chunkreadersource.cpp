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
#include "chunkreadersource.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MChunkReaderSource::MChunkReaderSource(const QString &identifier,
                                       MGridDataset *dataset)
    : MScheduledDataSource(identifier),
      dataset(dataset)
{
    if (dataset == nullptr)
        throw MValueError("no valid pointer to a dataset passed",
                          __FILE__, __LINE__);
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MChunkReaderSource::setChunkLayout(const QString &variableName,
                                        const MChunkLayout &layout)
{
    layouts.insert(variableName, layout);
}


const MChunkLayout& MChunkReaderSource::getChunkLayout(
        const QString &variableName) const
{
    QMap<QString, MChunkLayout>::const_iterator it =
            layouts.constFind(variableName);
    if (it == layouts.constEnd())
    {
        throw MKeyError(QString("no chunk layout registered for variable "
                                "'%1' of %2").arg(variableName)
                        .arg(dataset->getPath()).toStdString(),
                        __FILE__, __LINE__);
    }
    return it.value();
}


/******************************************************************************
***                          PROTECTED METHODS                              ***
*******************************************************************************/

MTask* MChunkReaderSource::createTaskGraph(MDataRequest request,
                                           MTaskGraph *graph)
{
    Q_UNUSED(graph);

    MTask *task = new MTask(request, this);
    task->setDiskReaderTask();
    return task;
}


MGridChunk* MChunkReaderSource::produceData(MDataRequest request)
{
    MDataRequestHelper rh(request);
    QString variableName = rh.value("VARIABLE");
    QVector<int> chunkCoordinates = rh.intVectorValue("CHUNK");

    MChunkRegion region = getChunkLayout(variableName)
            .region(chunkCoordinates);

    LOG4CPLUS_DEBUG(mlog, "reading " << variableName.toStdString()
                    << region.toString().toStdString() << " from "
                    << dataset->getPath().toStdString());

    return dataset->readChunk(variableName, region);
}


const QStringList MChunkReaderSource::locallyRequiredKeys() const
{
    return (QStringList() << "VARIABLE" << "CHUNK");
}

} // namespace MetMC
