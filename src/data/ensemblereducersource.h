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
#ifndef ENSEMBLEREDUCERSOURCE_H
#define ENSEMBLEREDUCERSOURCE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "scheduleddatasource.h"
#include "chunkreadersource.h"
#include "gridchunk.h"


namespace MetMC
{

/**
  @brief MEnsembleReducerSource reduces the chunks of an ensemble of datasets
  to the standard uncertainty of a variable. The ensemble is given by one
  reader per member; member 0 is the nominal dataset, members 1..N are the
  simulated variants.

  Requests need to contain the keys VARIABLE, CHUNK and QUANTITY:
  QUANTITY=VARIANCE yields the unbiased sample variance over the members
  1..N (divisor N-1), QUANTITY=UNCERTAINTY its square root. Cells with less
  than two valid member values are missing.

  While computing the variance, the sample mean of the members is compared
  with the nominal value. Cells where the mean departs from the nominal value
  by more than @ref consistencyThreshold standard errors are counted and can
  be queried with @ref numInconsistentCells().
  */
class MEnsembleReducerSource : public MScheduledDataSource
{
public:
    MEnsembleReducerSource(const QString &identifier,
                           const QList<MChunkReaderSource*> &members);

    /** Number of simulated variants N (members without the nominal one). */
    int numVariants() const { return members.size() - 1; }

    /**
      Returns the number of cells of @p variableName whose ensemble mean is
      inconsistent with the nominal value, accumulated over all chunks
      processed so far.
     */
    qint64 numInconsistentCells(const QString &variableName) const;

    MGridChunk* getData(MDataRequest request)
    { return static_cast<MGridChunk*>(MScheduledDataSource::getData(request)); }

    static const double consistencyThreshold;

protected:
    MTask* createTaskGraph(MDataRequest request, MTaskGraph *graph) override;

    MGridChunk* produceData(MDataRequest request) override;

    const QStringList locallyRequiredKeys() const override;

private:
    MGridChunk* computeVariance(const QString &variableName,
                                const QVector<int> &chunkCoordinates);

    MGridChunk* computeUncertainty(const QString &variableName,
                                   const QVector<int> &chunkCoordinates);

    MDataRequest memberRequest(const QString &variableName,
                               const QVector<int> &chunkCoordinates) const;

    MDataRequest varianceRequest(const QString &variableName,
                                 const QVector<int> &chunkCoordinates) const;

    QList<MChunkReaderSource*> members;

    mutable QMutex inconsistentCellsMutex;
    QMap<QString, qint64> inconsistentCells;
};

} // namespace MetMC

#endif // ENSEMBLEREDUCERSOURCE_H
