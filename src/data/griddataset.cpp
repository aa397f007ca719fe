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
#include "griddataset.h"

// standard library imports
#include <cmath>

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "data/nccfvar.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;
using namespace netCDF;
using namespace netCDF::exceptions;

namespace MetMC
{

/******************************************************************************
***                          MGridVariableInfo                              ***
*******************************************************************************/

MGridVariableInfo::MGridVariableInfo()
    : latDimension(-1),
      lonDimension(-1),
      isCoordinateVariable(false)
{
}


MChunkLayout MGridVariableInfo::chunkLayout(
        const MChunkingScheme &scheme) const
{
    return MChunkLayout::resolve(dimensionNames, dimensionSizes,
                                 nativeChunkSizes, latDimension, lonDimension,
                                 scheme);
}


/******************************************************************************
***                             MGridDataset                                ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MGridDataset::MGridDataset(const QString &path, MDatasetEngine engine)
    : MDatasetFile(path, engine),
      ncFile(nullptr)
{
    QString ncPath = netCDFPath(path, engine);

    LOG4CPLUS_DEBUG(mlog, "opening dataset " << path.toStdString()
                    << " (engine " << datasetEngineToString(engine)
                    .toStdString() << ")");

    if (engine != ZARR_ENGINE && !QFileInfo(path).isFile())
    {
        QString msg = QString("cannot open dataset %1: file does not "
                              "exist").arg(path);
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }

    try
    {
        // NetCDF library is not thread-safe (at least the regular C/C++
        // interface is not); hence all NetCDF calls need to be serialized.
        QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
        ncFile = new NcFile(ncPath.toStdString(), NcFile::read);
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot open dataset %1 -- %2")
                .arg(path).arg(e.what());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }
}


MGridDataset::~MGridDataset()
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    try
    {
        ncFile->close();
    }
    catch (NcException& e)
    {
        LOG4CPLUS_WARN(mlog, "cannot close dataset " << path.toStdString()
                       << " -- " << e.what());
    }
    delete ncFile;
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

QStringList MGridDataset::getVariableNames() const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    QStringList names;
    multimap<string, NcVar> ncVariables = ncFile->getVars();
    for (multimap<string, NcVar>::iterator it = ncVariables.begin();
         it != ncVariables.end(); ++it)
    {
        names << QString::fromStdString(it->first);
    }

    names.sort();
    return names;
}


QStringList MGridDataset::getDataVariableNames() const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    QStringList names;
    multimap<string, NcVar> ncVariables = ncFile->getVars();
    for (multimap<string, NcVar>::iterator it = ncVariables.begin();
         it != ncVariables.end(); ++it)
    {
        if (NcCFVar(it->second).isCoordinateVariable()) continue;
        names << QString::fromStdString(it->first);
    }

    names.sort();
    return names;
}


bool MGridDataset::hasVariable(const QString &variableName) const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    return !ncFile->getVar(variableName.toStdString()).isNull();
}


MGridVariableInfo MGridDataset::getVariableInfo(
        const QString &variableName) const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    NcCFVar var(ncFile->getVar(variableName.toStdString()));
    if (var.isNull())
    {
        QString msg = QString("dataset %1 does not contain variable '%2'")
                .arg(path).arg(variableName);
        throw MKeyError(msg.toStdString(), __FILE__, __LINE__);
    }

    MGridVariableInfo info;
    info.name = variableName;

    try
    {
        for (int i = 0; i < var.getDimCount(); i++)
        {
            NcDim dim = var.getDim(i);
            info.dimensionNames << QString::fromStdString(dim.getName());
            info.dimensionSizes << dim.getSize();
        }

        NcVar::ChunkMode chunkMode;
        vector<size_t> chunkSizes;
        var.getChunkingParameters(chunkMode, chunkSizes);
        if (chunkMode == NcVar::nc_CHUNKED
                && int(chunkSizes.size()) == var.getDimCount())
        {
            for (size_t i = 0; i < chunkSizes.size(); i++)
                info.nativeChunkSizes << chunkSizes[i];
        }

        info.latDimension = var.getLatitudeDimensionIndex();
        info.lonDimension = var.getLongitudeDimensionIndex();
        info.isCoordinateVariable = var.isCoordinateVariable();
        info.encoding = MCFEncoding::fromVariable(var);
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot read metadata of variable '%1' in %2 "
                              "-- %3").arg(variableName).arg(path)
                .arg(e.what());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }

    return info;
}


QStringList MGridDataset::getDimensionNames() const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    QStringList names;
    multimap<string, NcDim> ncDims = ncFile->getDims();
    for (multimap<string, NcDim>::iterator it = ncDims.begin();
         it != ncDims.end(); ++it)
    {
        names << QString::fromStdString(it->first);
    }

    names.sort();
    return names;
}


size_t MGridDataset::getDimensionSize(const QString &dimensionName) const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    NcDim dim = ncFile->getDim(dimensionName.toStdString());
    if (dim.isNull())
    {
        QString msg = QString("dataset %1 does not contain dimension '%2'")
                .arg(path).arg(dimensionName);
        throw MKeyError(msg.toStdString(), __FILE__, __LINE__);
    }
    return dim.getSize();
}


QVector<double> MGridDataset::getCoordinateValues(
        const QString &dimensionName) const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    QVector<double> values;
    NcCFVar var(ncFile->getVar(dimensionName.toStdString()));
    if (var.isNull() || !var.isCoordinateVariable()) return values;

    try
    {
        // Text coordinates cannot be compared numerically.
        NcType::ncType typeClass = var.getType().getTypeClass();
        if (typeClass == NcType::nc_CHAR || typeClass == NcType::nc_STRING)
            return values;

        values.resize(int(var.getDim(0).getSize()));
        if (!values.isEmpty()) var.getVar(values.data());
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot read coordinate '%1' of %2 -- %3")
                .arg(dimensionName).arg(path).arg(e.what());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }

    return values;
}


bool MGridDataset::isCyclicInLongitude(const MGridVariableInfo &variable) const
{
    if (variable.lonDimension < 0) return false;

    QVector<double> lons = getCoordinateValues(
                variable.dimensionNames[variable.lonDimension]);
    int n = lons.size();
    if (n < 2) return false;

    // The grid is cyclic if one more grid point with the same spacing would
    // reach the first point shifted by 360 degrees.
    double delta = lons[1] - lons[0];
    double span = fabs(lons[n - 1] - lons[0] + delta);
    return fabs(span - 360.) <= fabs(delta) * 1.e-3 + M_LONLAT_RESOLUTION;
}


bool MGridDataset::hasSameGridAs(const MGridDataset &other,
                                 QString *reason) const
{
    QStringList dims = getDimensionNames();
    QStringList otherDims = other.getDimensionNames();
    if (dims != otherDims)
    {
        *reason = QString("dimensions (%1) differ from (%2)")
                .arg(dims.join(", ")).arg(otherDims.join(", "));
        return false;
    }

    foreach (QString dim, dims)
    {
        if (getDimensionSize(dim) != other.getDimensionSize(dim))
        {
            *reason = QString("size of dimension '%1' differs (%2 vs. %3)")
                    .arg(dim).arg(getDimensionSize(dim))
                    .arg(other.getDimensionSize(dim));
            return false;
        }

        QVector<double> coordinates = getCoordinateValues(dim);
        QVector<double> otherCoordinates = other.getCoordinateValues(dim);
        if (coordinates.size() != otherCoordinates.size())
        {
            *reason = QString("coordinate variable '%1' is not present in "
                              "both datasets").arg(dim);
            return false;
        }
        for (int i = 0; i < coordinates.size(); i++)
        {
            if (fabs(coordinates[i] - otherCoordinates[i])
                    > M_LONLAT_RESOLUTION
                    && !(std::isnan(coordinates[i])
                         && std::isnan(otherCoordinates[i])))
            {
                *reason = QString("coordinate '%1' differs at index %2 "
                                  "(%3 vs. %4)").arg(dim).arg(i)
                        .arg(coordinates[i]).arg(otherCoordinates[i]);
                return false;
            }
        }
    }

    return true;
}


MGridChunk *MGridDataset::readChunk(const QString &variableName,
                                    const MChunkRegion &region) const
{
    MGridChunk *chunk = new MGridChunk(variableName, region);

    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    try
    {
        NcCFVar var(ncFile->getVar(variableName.toStdString()));
        if (var.isNull())
        {
            throw MKeyError(QString("dataset %1 does not contain variable "
                                    "'%2'").arg(path).arg(variableName)
                            .toStdString(), __FILE__, __LINE__);
        }

        // netCDF converts the stored values to float.
        var.getVar(region.startVector(), region.countVector(), chunk->data);
        MCFEncoding encoding = MCFEncoding::fromVariable(var);
        ncAccessMutexLocker.unlock();

        encoding.decode(chunk->data, chunk->getNumValues());
    }
    catch (NcException& e)
    {
        delete chunk;
        QString msg = QString("cannot read region %1 of variable '%2' from "
                              "%3 -- %4").arg(region.toString())
                .arg(variableName).arg(path).arg(e.what());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }
    catch (MException &)
    {
        delete chunk;
        throw;
    }

    return chunk;
}

} // namespace MetMC
