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
#ifndef DATASETFILE_H
#define DATASETFILE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports


namespace MetMC
{

/**
  Storage backends of gridded datasets. All backends are accessed through
  the netCDF library.
  */
enum MDatasetEngine
{
    INVALID_ENGINE  = 0,
    // NetCDF4 (HDF5) file.
    NETCDF4_ENGINE  = 1,
    // HDF5 file written with netCDF4 conventions; same backend as
    // NETCDF4_ENGINE.
    H5NETCDF_ENGINE = 2,
    // Zarr directory store (NCZarr).
    ZARR_ENGINE     = 3
};

MDatasetEngine stringToDatasetEngine(const QString &name);

QString datasetEngineToString(MDatasetEngine engine);


/**
  @brief MDatasetFile is the base class of dataset readers and writers. It
  provides the mapping of file paths and engines to netCDF paths and the
  global netCDF access mutex.
  */
class MDatasetFile
{
public:
    MDatasetFile(const QString &path, MDatasetEngine engine);
    virtual ~MDatasetFile();

    const QString& getPath() const { return path; }

    MDatasetEngine getEngine() const { return engine; }

    /**
      Returns the engine to be used for @p path. If @p engineName is empty,
      paths ending in ".zarr" use @ref ZARR_ENGINE and all other paths
      @ref NETCDF4_ENGINE. Throws an @ref MConfigurationError for unknown
      engine names.
     */
    static MDatasetEngine resolveEngine(const QString &path,
                                        const QString &engineName);

    /**
      Returns the path that is passed to the netCDF library to open @p path
      with @p engine (Zarr stores are addressed by an NCZarr URL).
     */
    static QString netCDFPath(const QString &path, MDatasetEngine engine);

    /**
      Returns the name of @p path without directory and last extension.
     */
    static QString fileStem(const QString &path);

    /**
      Removes the file or directory store at @p path. Returns @p true if
      nothing is left at @p path.
     */
    static bool removeDataset(const QString &path);

protected:
    QString path;
    MDatasetEngine engine;

    /** Global NetCDF access mutex, as the NetCDF (C++) library is not
        thread-safe. This mutex must be used to protect ALL access to NetCDF
        files! */
    static QMutex staticNetCDFAccessMutex;
};

} // namespace MetMC

#endif // DATASETFILE_H
