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
#ifndef COLLECTPROCESSOR_H
#define COLLECTPROCESSOR_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "abstractprocessor.h"
#include "data/chunklayout.h"
#include "data/chunkreadersource.h"
#include "data/chunkwritersource.h"
#include "data/ensemblereducersource.h"
#include "data/griddataset.h"
#include "data/griddatasetwriter.h"
#include "data/smoothfilter.h"


namespace MetMC
{

/**
  @brief MCollectProcessor reduces an ensemble of simulated members to the
  standard uncertainty of the variables listed in the collect schema of the
  source type.

  The ensemble is given by a glob pattern; the matches are sorted
  lexicographically, the first match is the nominal dataset and the others
  are the simulated variants. The target dataset contains all variables of
  the nominal dataset (copied without decoding), and for each collected
  variable the standard uncertainty and, if configured, its filtered
  variant.
  */
class MCollectProcessor : public MAbstractProcessor
{
public:
    MCollectProcessor(const MProcessorConfiguration &config,
                      const MSourceTypeRegistry &registry,
                      MAbstractScheduler *scheduler);

    ~MCollectProcessor();

    /**
      Expands the glob pattern @p pattern. Wildcards are only allowed in the
      file name part of the pattern. Returns the matching paths in
      lexicographic order. Throws an @ref MConfigurationError if the pattern
      is malformed or nothing matches.
     */
    static QStringList expandSourceGlob(const QString &pattern);

    /**
      Paths of the ensemble members, available after input validation.
     */
    const QStringList& getMemberPaths() const { return memberPaths; }

    /**
      Names of the collected variables, available after input validation.
     */
    const QStringList& getCollectedVariables() const
    { return collectedVariables; }

protected:
    void validateInput() override;

    void buildGraphs() override;

    void graphsExecuted() override;

    void writeOutput() override;

    void abortOutput() override;

private:
    /**
      Attributes added to the uncertainty variables of @p variable, derived
      from the attributes of the nominal variable.
     */
    QList< QPair<QString, QString> > uncertaintyAttributes(
            const MCollectVariableSchema &variable, bool filtered) const;

    MDatasetEngine readerEngine;
    MDatasetEngine writerEngine;

    QStringList memberPaths;
    QList<MGridDataset*> members;
    QScopedPointer<MGridDatasetWriter> writer;
    QList<MChunkReaderSource*> memberSources;
    QScopedPointer<MEnsembleReducerSource> reducerSource;
    QScopedPointer<MSmoothFilter> filterSource;
    QScopedPointer<MChunkWriterSource> uncertaintyWriterSource;
    QScopedPointer<MChunkWriterSource> filteredWriterSource;

    QStringList collectedVariables;
    QMap<QString, MChunkLayout> layouts;
};

} // namespace MetMC

#endif // COLLECTPROCESSOR_H
