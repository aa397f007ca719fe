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
#include "datasetfile.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

QMutex MDatasetFile::staticNetCDFAccessMutex;


MDatasetEngine stringToDatasetEngine(const QString &name)
{
    QString s = name.trimmed().toLower();
    if (s == "netcdf4") return NETCDF4_ENGINE;
    else if (s == "h5netcdf") return H5NETCDF_ENGINE;
    else if (s == "zarr") return ZARR_ENGINE;
    else return INVALID_ENGINE;
}


QString datasetEngineToString(MDatasetEngine engine)
{
    switch (engine)
    {
    case NETCDF4_ENGINE:
        return "netcdf4";
    case H5NETCDF_ENGINE:
        return "h5netcdf";
    case ZARR_ENGINE:
        return "zarr";
    default:
        return "invalid";
    }
}


/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MDatasetFile::MDatasetFile(const QString &path, MDatasetEngine engine)
    : path(path),
      engine(engine)
{
}


MDatasetFile::~MDatasetFile()
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

MDatasetEngine MDatasetFile::resolveEngine(const QString &path,
                                           const QString &engineName)
{
    if (engineName.isEmpty())
    {
        QString p = path;
        while (p.endsWith('/')) p.chop(1);
        if (p.endsWith(".zarr", Qt::CaseInsensitive)) return ZARR_ENGINE;
        return NETCDF4_ENGINE;
    }

    MDatasetEngine engine = stringToDatasetEngine(engineName);
    if (engine == INVALID_ENGINE)
    {
        throw MConfigurationError(
                    QString("unknown engine '%1', available engines are "
                            "netcdf4, h5netcdf and zarr").arg(engineName)
                    .toStdString(), __FILE__, __LINE__);
    }
    return engine;
}


QString MDatasetFile::netCDFPath(const QString &path, MDatasetEngine engine)
{
    if (engine == ZARR_ENGINE)
    {
        return QString("file://%1#mode=nczarr,file")
                .arg(QFileInfo(path).absoluteFilePath());
    }
    return path;
}


QString MDatasetFile::fileStem(const QString &path)
{
    QString p = path;
    while (p.endsWith('/')) p.chop(1);
    return QFileInfo(p).completeBaseName();
}


bool MDatasetFile::removeDataset(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists()) return true;

    bool removed;
    if (info.isDir()) removed = QDir(path).removeRecursively();
    else removed = QFile::remove(path);

    if (!removed)
    {
        LOG4CPLUS_WARN(mlog, "cannot remove " << path.toStdString());
    }
    return removed;
}

} // namespace MetMC
