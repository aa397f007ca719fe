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
#ifndef CHUNKREADERSOURCE_H
#define CHUNKREADERSOURCE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "scheduleddatasource.h"
#include "griddataset.h"
#include "gridchunk.h"
#include "chunklayout.h"


namespace MetMC
{

/**
  @brief MChunkReaderSource reads single chunks of the variables of a
  @ref MGridDataset. Requests need to contain the keys VARIABLE and CHUNK
  (the chunk coordinates in the layout registered for the variable with
  @ref setChunkLayout(), e.g. "CHUNK=0/1/0").

  Reader tasks are marked as disk reader tasks and have no parents.
  */
class MChunkReaderSource : public MScheduledDataSource
{
public:
    /**
      The dataset is not owned by the source and needs to be kept open
      until the task graphs using the source have been executed.
     */
    MChunkReaderSource(const QString &identifier, MGridDataset *dataset);

    MGridDataset* getDataset() const { return dataset; }

    void setChunkLayout(const QString &variableName,
                        const MChunkLayout &layout);

    /**
      Returns the layout of @p variableName. Throws an @ref MKeyError if no
      layout has been registered for the variable.
     */
    const MChunkLayout& getChunkLayout(const QString &variableName) const;

    bool hasChunkLayout(const QString &variableName) const
    { return layouts.contains(variableName); }

    MGridChunk* getData(MDataRequest request)
    { return static_cast<MGridChunk*>(MScheduledDataSource::getData(request)); }

protected:
    MTask* createTaskGraph(MDataRequest request, MTaskGraph *graph) override;

    MGridChunk* produceData(MDataRequest request) override;

    const QStringList locallyRequiredKeys() const override;

private:
    MGridDataset *dataset;
    QMap<QString, MChunkLayout> layouts;
};

} // namespace MetMC

#endif // CHUNKREADERSOURCE_H
