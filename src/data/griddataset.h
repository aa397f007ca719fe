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
#ifndef GRIDDATASET_H
#define GRIDDATASET_H

// standard library imports

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

/**
  @brief Metadata of a variable of a gridded dataset.
  */
struct MGridVariableInfo
{
    MGridVariableInfo();

    QString name;
    QStringList dimensionNames;
    QVector<size_t> dimensionSizes;
    // Native chunk sizes of the variable, empty for contiguous storage.
    QVector<size_t> nativeChunkSizes;
    int latDimension;
    int lonDimension;
    bool isCoordinateVariable;
    MCFEncoding encoding;

    /**
      Resolves the chunk layout used to process the variable.
     */
    MChunkLayout chunkLayout(const MChunkingScheme &scheme) const;
};


/**
  @brief MGridDataset provides read access to a gridded dataset stored in a
  NetCDF4/HDF5 file or a Zarr store. The dataset is opened by the constructor
  and closed by the destructor.

  All methods are thread-safe; access to the netCDF library is serialized.
  Values read by @ref readChunk() are decoded according to the CF conventions
  (see @ref MCFEncoding).
  */
class MGridDataset : public MDatasetFile
{
public:
    /**
      Opens the dataset at @p path. Throws an @ref MIOError if the dataset
      cannot be opened.
     */
    MGridDataset(const QString &path, MDatasetEngine engine);

    ~MGridDataset();

    /**
      Returns the names of all variables in alphabetical order.
     */
    QStringList getVariableNames() const;

    /**
      Returns the names of all variables that are not coordinate variables,
      in alphabetical order.
     */
    QStringList getDataVariableNames() const;

    bool hasVariable(const QString &variableName) const;

    /**
      Returns the metadata of @p variableName. Throws an @ref MKeyError if
      the variable does not exist.
     */
    MGridVariableInfo getVariableInfo(const QString &variableName) const;

    QStringList getDimensionNames() const;

    size_t getDimensionSize(const QString &dimensionName) const;

    /**
      Returns the values of the coordinate variable of dimension
      @p dimensionName, or an empty vector if there is no such variable.
     */
    QVector<double> getCoordinateValues(const QString &dimensionName) const;

    /**
      Returns true if the longitude coordinate of @p variable covers the full
      circle, so that its first grid point follows its last one.
     */
    bool isCyclicInLongitude(const MGridVariableInfo &variable) const;

    /**
      Checks that @p other has the same dimensions and coordinates as this
      dataset. Returns false and a description in @p reason otherwise.
     */
    bool hasSameGridAs(const MGridDataset &other, QString *reason) const;

    /**
      Reads and decodes the values of @p variableName in @p region. The
      caller takes ownership of the returned chunk. Throws an @ref MIOError
      if the values cannot be read.
     */
    MGridChunk* readChunk(const QString &variableName,
                          const MChunkRegion &region) const;

    /**
      Returns the netCDF file. Callers need to hold the lock returned by
      @ref netCDFAccessMutex() while accessing the file.
     */
    const netCDF::NcFile& getNcFile() const { return *ncFile; }

    static QMutex* netCDFAccessMutex() { return &staticNetCDFAccessMutex; }

private:
    netCDF::NcFile *ncFile;
};

} // namespace MetMC

#endif // GRIDDATASET_H
