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
#ifndef PERTURBATIONSOURCE_H
#define PERTURBATIONSOURCE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "scheduleddatasource.h"
#include "chunkreadersource.h"
#include "constraint.h"
#include "gridchunk.h"
#include "randomstream.h"
#include "system/sourcetypeschema.h"


namespace MetMC
{

/**
  @brief MPerturbationSource produces the perturbed values of a chunk of a
  variable of the scatter schema. Requests need to contain the keys VARIABLE
  and CHUNK.

  The task of a chunk depends on the reader tasks of the nominal values and
  of the uncertainty inputs of the same chunk. Variables that are the sum of
  the perturbations of other variables (@ref
  MScatterVariableSchema::TOTAL_PERTURBATION) additionally depend on the
  perturbation tasks of the referenced variables.

  Each chunk draws one standard normal deviate per grid cell, in row-major
  order, from the stream derived for the member selector, the identity of the
  variable and the chunk coordinates. The perturbed values hence do not
  depend on the order in which chunks are processed.
  */
class MPerturbationSource : public MScheduledDataSource
{
public:
    /**
      @p nominalSource reads the variables of the source dataset whose base
      name is @p sourceFileStem. @p constraints needs to outlive the source.
     */
    MPerturbationSource(const QString &identifier,
                        MChunkReaderSource *nominalSource,
                        const MSourceTypeSchema &schema,
                        const MConstraintEvaluator *constraints,
                        int selector, bool antithetic,
                        const QString &sourceFileStem);

    int getSelector() const { return selector; }

    bool isAntithetic() const { return antithetic; }

    /**
      Returns the stream generator of the member for @p variableName.
     */
    MStreamGenerator streamGenerator(const QString &variableName) const;

    /**
      Returns true if perturbed values of @p variableName are drawn from a
      random stream (i.e. the variable is perturbed and is not the sum of
      other perturbations).
     */
    bool drawsRandomNumbers(const QString &variableName) const;

    MGridChunk* getData(MDataRequest request)
    { return static_cast<MGridChunk*>(MScheduledDataSource::getData(request)); }

protected:
    MTask* createTaskGraph(MDataRequest request, MTaskGraph *graph) override;

    MGridChunk* produceData(MDataRequest request) override;

    const QStringList locallyRequiredKeys() const override;

private:
    const MScatterVariableSchema& scatterVariable(
            const QString &variableName) const;

    MDataRequest chunkRequest(const QString &variableName,
                              const QVector<int> &chunkCoordinates) const;

    void perturbChunk(const MScatterVariableSchema &variable,
                      const QVector<int> &chunkCoordinates,
                      MGridChunk *result);

    void sumPerturbations(const MScatterVariableSchema &variable,
                          const QVector<int> &chunkCoordinates,
                          MGridChunk *result);

    MChunkReaderSource *nominalSource;
    MSourceTypeSchema schema;
    const MConstraintEvaluator *constraints;
    int selector;
    bool antithetic;
    QString sourceFileStem;
};

} // namespace MetMC

#endif // PERTURBATIONSOURCE_H
