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
#ifndef GRIDDATASETWRITER_H
#define GRIDDATASETWRITER_H

// standard library imports
#include <vector>

// related third party imports
#include <QtCore>
#include <netcdf>

// local application imports
#include "datasetfile.h"
#include "cfcodec.h"
#include "chunklayout.h"
#include "gridchunk.h"


namespace MetMC
{

class MGridDataset;

/**
  @brief Storage settings of written variables.
  */
struct MWriterSettings
{
    MWriterSettings() : deflateLevel(1), shuffle(true) {}

    // Deflate level 0..9, 0 disables compression.
    int deflateLevel;
    bool shuffle;
};


/**
  @brief Statistics of the (decoded) values written to a variable.
  */
struct MWrittenValueStatistics
{
    MWrittenValueStatistics();

    void add(const float *values, size_t n);

    double mean() const;
    double stddev() const;

    size_t count;
    double min;
    double max;
    double sum;
    double sumOfSquares;
};


/**
  @brief MGridDatasetWriter creates a gridded dataset. All data are written
  to "<target>.incomplete"; the dataset is moved to the target path by
  @ref commit(). If the writer is destroyed without commit, the incomplete
  dataset is removed.

  Dimensions and variables need to be defined before data are written.
  @ref writeChunk() is thread-safe and may be called by multiple tasks
  writing disjoint regions.
  */
class MGridDatasetWriter : public MDatasetFile
{
public:
    /**
      Creates the incomplete dataset for @p targetPath. Throws an @ref
      MIOError if the dataset cannot be created.
     */
    MGridDatasetWriter(const QString &targetPath, MDatasetEngine engine,
                       const MWriterSettings &settings);

    ~MGridDatasetWriter();

    /**
      Path of the dataset while it is written.
     */
    QString getIncompletePath() const;

    /**
      Copies all dimensions and global attributes of @p source.
     */
    void copyDimensionsAndGlobalAttributes(const MGridDataset &source);

    /**
      Defines @p targetVariable with type, dimensions and attributes of
      @p sourceVariable in @p source. If @p layout is given, the variable is
      stored with the chunk sizes of the layout, otherwise with the native
      chunk sizes of the source variable. Attributes listed in
      @p attributesToRemove are not copied; @p attributesToAdd are set as
      text attributes.
     */
    void defineVariable(const MGridDataset &source,
                        const QString &sourceVariable,
                        const QString &targetVariable,
                        const MChunkLayout *layout = nullptr,
                        const QStringList &attributesToRemove = QStringList(),
                        const QList< QPair<QString, QString> > &attributesToAdd
                        = QList< QPair<QString, QString> >());

    bool hasVariable(const QString &variableName) const;

    void setGlobalAttribute(const QString &name, const QString &value);

    void setGlobalAttribute(const QString &name, int value);

    void setVariableAttribute(const QString &variableName,
                              const QString &name, const QString &value);

    void setVariableAttribute(const QString &variableName,
                              const QString &name,
                              const std::vector<long long> &values);

    /**
      Returns the text attribute @p name of @p variableName, or an empty
      string.
     */
    QString getVariableAttribute(const QString &variableName,
                                 const QString &name) const;

    /**
      Copies the stored (not decoded) values of @p variableName from
      @p source, one slice of the leading dimension at a time.
     */
    void copyVariableData(const MGridDataset &source,
                          const QString &variableName);

    /**
      Encodes the values of @p chunk according to the CF attributes of
      @p variableName and writes them to the chunk's region.
     */
    void writeChunk(const QString &variableName, const MGridChunk &chunk);

    /**
      Returns the statistics of the values written with @p writeChunk() to
      @p variableName.
     */
    MWrittenValueStatistics getStatistics(const QString &variableName) const;

    /**
      Updates the attribute "actual_range" of all variables written with
      @p writeChunk() that carry this attribute.
     */
    void updateActualRanges();

    /**
      Closes the dataset and moves it to the target path. Throws an @ref
      MIOError on failure.
     */
    void commit();

    /**
      Closes and removes the incomplete dataset.
     */
    void abort();

    bool isCommitted() const { return committed; }

private:
    netCDF::NcVar getVariable(const QString &variableName) const;

    void close();

    MWriterSettings settings;
    netCDF::NcFile *ncFile;
    bool committed;

    mutable QMutex statisticsMutex;
    QMap<QString, MWrittenValueStatistics> statistics;
    QMap<QString, MCFEncoding> encodings;
};

} // namespace MetMC

#endif // GRIDDATASETWRITER_H
