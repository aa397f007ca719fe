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
#ifndef SCATTERPROCESSOR_H
#define SCATTERPROCESSOR_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "abstractprocessor.h"
#include "data/chunklayout.h"
#include "data/chunkreadersource.h"
#include "data/chunkwritersource.h"
#include "data/constraint.h"
#include "data/griddataset.h"
#include "data/griddatasetwriter.h"
#include "data/perturbationsource.h"


namespace MetMC
{

/**
  @brief MScatterProcessor writes one simulated member of a source dataset.

  The variables of the source dataset that are listed in the scatter schema
  of the source type are perturbed chunk by chunk (see @ref
  MPerturbationSource); one task graph is built per perturbed variable. All
  other variables, as well as all variables for selector 0, are copied to
  the target dataset without decoding.
  */
class MScatterProcessor : public MAbstractProcessor
{
public:
    MScatterProcessor(const MProcessorConfiguration &config,
                      const MSourceTypeRegistry &registry,
                      MAbstractScheduler *scheduler);

    ~MScatterProcessor();

    /**
      Names of the perturbed variables, available after input validation.
     */
    const QStringList& getPerturbedVariables() const
    { return perturbedVariables; }

protected:
    void validateInput() override;

    void buildGraphs() override;

    void graphsExecuted() override;

    void writeOutput() override;

    void abortOutput() override;

private:
    /**
      Registers @p layout as the layout in which @p inputVariable is read to
      perturb @p variableName.
     */
    void registerInputLayout(const QString &variableName,
                             const QString &inputVariable,
                             const MChunkLayout &layout);

    MDatasetEngine readerEngine;
    MDatasetEngine writerEngine;

    QScopedPointer<MGridDataset> source;
    QScopedPointer<MGridDatasetWriter> writer;
    QScopedPointer<MConstraintEvaluator> constraints;
    QScopedPointer<MChunkReaderSource> readerSource;
    QScopedPointer<MPerturbationSource> perturbationSource;
    QScopedPointer<MChunkWriterSource> writerSource;

    QStringList perturbedVariables;
    QMap<QString, MChunkLayout> layouts;
};

} // namespace MetMC

#endif // SCATTERPROCESSOR_H
