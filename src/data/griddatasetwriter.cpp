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
#include "griddatasetwriter.h"

// standard library imports
#include <algorithm>
#include <cmath>
#include <limits>

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "data/griddataset.h"
#include "data/nccfvar.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;
using namespace netCDF;
using namespace netCDF::exceptions;

namespace MetMC
{

/******************************************************************************
***                          UTILITY FUNCTIONS                              ***
*******************************************************************************/

static bool isAtomicType(const NcType &type)
{
    NcType::ncType typeClass = type.getTypeClass();
    return typeClass != NcType::nc_VLEN && typeClass != NcType::nc_OPAQUE
            && typeClass != NcType::nc_ENUM && typeClass != NcType::nc_COMPOUND;
}


/**
  Copies attribute @p att to @p target, which is either a group or a
  variable. Returns false if the attribute has a user-defined type.
  */
template<class T> bool copyAttribute(const NcAtt &att, T *target)
{
    NcType type = att.getType();
    size_t len = att.getAttLength();

    if (!isAtomicType(type)) return false;

    if (type.getTypeClass() == NcType::nc_CHAR)
    {
        string value;
        att.getValues(value);
        target->putAtt(att.getName(), value);
    }
    else if (type.getTypeClass() == NcType::nc_STRING)
    {
        vector<char*> values(len, nullptr);
        att.getValues(values.data());
        target->putAtt(att.getName(), len, (const char**) values.data());
        nc_free_string(len, values.data());
    }
    else
    {
        vector<char> buffer(len * type.getSize());
        att.getValues((void*) buffer.data());
        target->putAtt(att.getName(), type, len,
                       (const void*) buffer.data());
    }
    return true;
}


/******************************************************************************
***                       MWrittenValueStatistics                           ***
*******************************************************************************/

MWrittenValueStatistics::MWrittenValueStatistics()
    : count(0),
      min(numeric_limits<double>::quiet_NaN()),
      max(numeric_limits<double>::quiet_NaN()),
      sum(0.),
      sumOfSquares(0.)
{
}


void MWrittenValueStatistics::add(const float *values, size_t n)
{
    for (size_t i = 0; i < n; i++)
    {
        double v = values[i];
        if (!std::isfinite(v)) continue;

        if (count == 0 || v < min) min = v;
        if (count == 0 || v > max) max = v;
        sum += v;
        sumOfSquares += v * v;
        count++;
    }
}


double MWrittenValueStatistics::mean() const
{
    if (count == 0) return numeric_limits<double>::quiet_NaN();
    return sum / double(count);
}


double MWrittenValueStatistics::stddev() const
{
    if (count == 0) return numeric_limits<double>::quiet_NaN();
    double m = mean();
    return sqrt(std::max(0., sumOfSquares / double(count) - m * m));
}


/******************************************************************************
***                         MGridDatasetWriter                              ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MGridDatasetWriter::MGridDatasetWriter(const QString &targetPath,
                                       MDatasetEngine engine,
                                       const MWriterSettings &settings)
    : MDatasetFile(targetPath, engine),
      settings(settings),
      ncFile(nullptr),
      committed(false)
{
    QString incompletePath = getIncompletePath();

    // Remove the leftovers of a previous failed run.
    if (!removeDataset(incompletePath))
    {
        QString msg = QString("cannot create dataset %1: cannot remove "
                              "existing incomplete dataset").arg(targetPath);
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }

    LOG4CPLUS_DEBUG(mlog, "creating dataset " << incompletePath.toStdString()
                    << " (engine " << datasetEngineToString(engine)
                    .toStdString() << ")");

    try
    {
        QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
        ncFile = new NcFile(netCDFPath(incompletePath, engine).toStdString(),
                            NcFile::replace, NcFile::nc4);
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot create dataset %1 -- %2")
                .arg(incompletePath).arg(e.what());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }
}


MGridDatasetWriter::~MGridDatasetWriter()
{
    if (!committed) abort();
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

QString MGridDatasetWriter::getIncompletePath() const
{
    QString p = path;
    while (p.endsWith('/')) p.chop(1);
    return p + ".incomplete";
}


void MGridDatasetWriter::copyDimensionsAndGlobalAttributes(
        const MGridDataset &source)
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    try
    {
        const NcFile &sourceFile = source.getNcFile();

        multimap<string, NcDim> dims = sourceFile.getDims();
        for (multimap<string, NcDim>::iterator it = dims.begin();
             it != dims.end(); ++it)
        {
            if (it->second.isUnlimited()) ncFile->addDim(it->first);
            else ncFile->addDim(it->first, it->second.getSize());
        }

        multimap<string, NcGroupAtt> atts = sourceFile.getAtts();
        for (multimap<string, NcGroupAtt>::iterator it = atts.begin();
             it != atts.end(); ++it)
        {
            if (!copyAttribute(it->second, ncFile))
            {
                LOG4CPLUS_WARN(mlog, "global attribute " << it->first
                               << " has a user-defined type; not copied");
            }
        }
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot copy dimensions and attributes from %1 "
                              "to %2 -- %3").arg(source.getPath())
                .arg(getIncompletePath()).arg(e.what());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }
}


void MGridDatasetWriter::defineVariable(
        const MGridDataset &source, const QString &sourceVariable,
        const QString &targetVariable, const MChunkLayout *layout,
        const QStringList &attributesToRemove,
        const QList< QPair<QString, QString> > &attributesToAdd)
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    try
    {
        NcVar sourceVar = source.getNcFile().getVar(
                    sourceVariable.toStdString());
        if (sourceVar.isNull())
        {
            throw MKeyError(QString("dataset %1 does not contain variable "
                                    "'%2'").arg(source.getPath())
                            .arg(sourceVariable).toStdString(),
                            __FILE__, __LINE__);
        }

        NcType type = sourceVar.getType();
        if (!isAtomicType(type))
        {
            LOG4CPLUS_WARN(mlog, "variable " << sourceVariable.toStdString()
                           << " has a user-defined type; not copied");
            return;
        }

        vector<NcDim> dims;
        for (int i = 0; i < sourceVar.getDimCount(); i++)
        {
            dims.push_back(ncFile->getDim(sourceVar.getDim(i).getName()));
        }

        NcVar targetVar = ncFile->addVar(targetVariable.toStdString(),
                                         type, dims);

        // Chunking and compression.
        if (!dims.empty())
        {
            vector<size_t> chunkSizes;
            if (layout)
            {
                const QVector<size_t> &sizes = layout->getChunkSizes();
                chunkSizes.assign(sizes.begin(), sizes.end());
            }
            else
            {
                NcVar::ChunkMode chunkMode;
                sourceVar.getChunkingParameters(chunkMode, chunkSizes);
                if (chunkMode != NcVar::nc_CHUNKED) chunkSizes.clear();
            }

            // Chunk sizes must be positive, also for empty dimensions.
            for (size_t i = 0; i < chunkSizes.size(); i++)
            {
                if (chunkSizes[i] == 0) chunkSizes[i] = 1;
            }

            if (!chunkSizes.empty())
            {
                targetVar.setChunking(NcVar::nc_CHUNKED, chunkSizes);
            }

            NcType::ncType typeClass = type.getTypeClass();
            if (settings.deflateLevel > 0 && engine != ZARR_ENGINE
                    && typeClass != NcType::nc_STRING
                    && typeClass != NcType::nc_CHAR)
            {
                targetVar.setCompression(settings.shuffle, true,
                                         settings.deflateLevel);
            }
        }

        map<string, NcVarAtt> atts = sourceVar.getAtts();
        for (map<string, NcVarAtt>::iterator it = atts.begin();
             it != atts.end(); ++it)
        {
            if (attributesToRemove.contains(QString::fromStdString(it->first)))
                continue;

            if (!copyAttribute(it->second, &targetVar))
            {
                LOG4CPLUS_WARN(mlog, "attribute " << it->first
                               << " of variable "
                               << sourceVariable.toStdString()
                               << " has a user-defined type; not copied");
            }
        }

        for (int i = 0; i < attributesToAdd.size(); i++)
        {
            targetVar.putAtt(attributesToAdd[i].first.toStdString(),
                             attributesToAdd[i].second.toStdString());
        }
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot define variable '%1' in %2 -- %3")
                .arg(targetVariable).arg(getIncompletePath()).arg(e.what());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }
}


bool MGridDatasetWriter::hasVariable(const QString &variableName) const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    return !ncFile->getVar(variableName.toStdString()).isNull();
}


void MGridDatasetWriter::setGlobalAttribute(const QString &name,
                                            const QString &value)
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    try
    {
        ncFile->putAtt(name.toStdString(), value.toStdString());
    }
    catch (NcException& e)
    {
        throw MIOError(QString("cannot write global attribute '%1' -- %2")
                       .arg(name).arg(e.what()).toStdString(),
                       __FILE__, __LINE__);
    }
}


void MGridDatasetWriter::setGlobalAttribute(const QString &name, int value)
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    try
    {
        ncFile->putAtt(name.toStdString(), ncInt, value);
    }
    catch (NcException& e)
    {
        throw MIOError(QString("cannot write global attribute '%1' -- %2")
                       .arg(name).arg(e.what()).toStdString(),
                       __FILE__, __LINE__);
    }
}


void MGridDatasetWriter::setVariableAttribute(const QString &variableName,
                                              const QString &name,
                                              const QString &value)
{
    NcVar var = getVariable(variableName);

    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    try
    {
        var.putAtt(name.toStdString(), value.toStdString());
    }
    catch (NcException& e)
    {
        throw MIOError(QString("cannot write attribute '%1' of variable "
                               "'%2' -- %3").arg(name).arg(variableName)
                       .arg(e.what()).toStdString(), __FILE__, __LINE__);
    }
}


void MGridDatasetWriter::setVariableAttribute(const QString &variableName,
                                              const QString &name,
                                              const vector<long long> &values)
{
    NcVar var = getVariable(variableName);

    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    try
    {
        var.putAtt(name.toStdString(), ncInt64, values.size(), values.data());
    }
    catch (NcException& e)
    {
        throw MIOError(QString("cannot write attribute '%1' of variable "
                               "'%2' -- %3").arg(name).arg(variableName)
                       .arg(e.what()).toStdString(), __FILE__, __LINE__);
    }
}


QString MGridDatasetWriter::getVariableAttribute(const QString &variableName,
                                                 const QString &name) const
{
    NcVar var = getVariable(variableName);

    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    return QString::fromStdString(
                NcCFVar(var).getStringAttribute(name.toStdString()));
}


void MGridDatasetWriter::copyVariableData(const MGridDataset &source,
                                          const QString &variableName)
{
    NcVar targetVar = getVariable(variableName);

    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    try
    {
        NcVar sourceVar = source.getNcFile().getVar(
                    variableName.toStdString());
        NcType type = sourceVar.getType();
        if (!isAtomicType(type)) return;

        // One slice of the leading dimension is copied at a time.
        int numDims = sourceVar.getDimCount();
        vector<size_t> start(numDims, 0);
        vector<size_t> count(numDims, 0);
        size_t numSlices = 1;
        size_t sliceSize = 1;
        for (int i = 0; i < numDims; i++)
        {
            size_t dimSize = sourceVar.getDim(i).getSize();
            if (i == 0)
            {
                numSlices = dimSize;
                count[i] = 1;
            }
            else
            {
                count[i] = dimSize;
                sliceSize *= dimSize;
            }
        }
        if (sliceSize == 0) return;

        bool isString = (type.getTypeClass() == NcType::nc_STRING);
        vector<char> buffer(isString ? 0 : sliceSize * type.getSize());
        vector<char*> strings(isString ? sliceSize : 0, nullptr);

        for (size_t slice = 0; slice < numSlices; slice++)
        {
            if (numDims > 0) start[0] = slice;

            if (isString)
            {
                sourceVar.getVar(start, count, strings.data());
                targetVar.putVar(start, count, (const char**) strings.data());
                nc_free_string(sliceSize, strings.data());
            }
            else
            {
                sourceVar.getVar(start, count, (void*) buffer.data());
                targetVar.putVar(start, count, (const void*) buffer.data());
            }
        }
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot copy variable '%1' from %2 -- %3")
                .arg(variableName).arg(source.getPath()).arg(e.what());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }
}


void MGridDatasetWriter::writeChunk(const QString &variableName,
                                    const MGridChunk &chunk)
{
    NcVar var = getVariable(variableName);
    const size_t n = chunk.getNumValues();

    // Encoding and statistics of the variable.
    MCFEncoding encoding;
    {
        QMutexLocker statisticsLocker(&statisticsMutex);
        if (!encodings.contains(variableName))
        {
            QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
            encodings.insert(variableName, MCFEncoding::fromVariable(var));
        }
        encoding = encodings.value(variableName);
        statistics[variableName].add(chunk.data, n);
    }

    vector<float> packed(chunk.data, chunk.data + n);
    encoding.encode(packed.data(), n);

    const MChunkRegion &region = chunk.getRegion();

    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    try
    {
        var.putVar(region.startVector(), region.countVector(),
                   packed.data());
    }
    catch (NcException& e)
    {
        QString msg = QString("cannot write region %1 of variable '%2' to "
                              "%3 -- %4").arg(region.toString())
                .arg(variableName).arg(getIncompletePath()).arg(e.what());
        LOG4CPLUS_ERROR(mlog, msg.toStdString());
        throw MIOError(msg.toStdString(), __FILE__, __LINE__);
    }
}


MWrittenValueStatistics MGridDatasetWriter::getStatistics(
        const QString &variableName) const
{
    QMutexLocker statisticsLocker(&statisticsMutex);
    return statistics.value(variableName);
}


void MGridDatasetWriter::updateActualRanges()
{
    QMutexLocker statisticsLocker(&statisticsMutex);
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    for (QMap<QString, MWrittenValueStatistics>::const_iterator it =
         statistics.constBegin(); it != statistics.constEnd(); ++it)
    {
        NcVar var = ncFile->getVar(it.key().toStdString());
        if (var.isNull() || !NcCFVar(var).hasAttribute("actual_range"))
            continue;

        double range[2] = { it.value().min, it.value().max };
        try
        {
            // The attribute keeps its type; netCDF converts the values.
            NcType type = var.getAtt("actual_range").getType();
            var.putAtt("actual_range", type, 2, range);
        }
        catch (NcException& e)
        {
            throw MIOError(QString("cannot update actual_range of variable "
                                   "'%1' -- %2").arg(it.key()).arg(e.what())
                           .toStdString(), __FILE__, __LINE__);
        }
    }
}


void MGridDatasetWriter::commit()
{
    close();

    QString incompletePath = getIncompletePath();
    if (!removeDataset(path))
    {
        throw MIOError(QString("cannot replace existing dataset %1")
                       .arg(path).toStdString(), __FILE__, __LINE__);
    }
    if (!QDir().rename(incompletePath, path))
    {
        throw MIOError(QString("cannot move %1 to %2")
                       .arg(incompletePath).arg(path).toStdString(),
                       __FILE__, __LINE__);
    }

    committed = true;
    LOG4CPLUS_DEBUG(mlog, "dataset " << path.toStdString() << " written");
}


void MGridDatasetWriter::abort()
{
    try
    {
        close();
    }
    catch (MIOError &)
    {
        // The incomplete dataset is removed anyway.
    }

    if (removeDataset(getIncompletePath()))
    {
        LOG4CPLUS_DEBUG(mlog, "removed incomplete dataset "
                        << getIncompletePath().toStdString());
    }
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

NcVar MGridDatasetWriter::getVariable(const QString &variableName) const
{
    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);

    if (ncFile == nullptr)
    {
        throw MIOError(QString("dataset %1 has already been closed")
                       .arg(path).toStdString(), __FILE__, __LINE__);
    }

    NcVar var = ncFile->getVar(variableName.toStdString());
    if (var.isNull())
    {
        throw MKeyError(QString("variable '%1' has not been defined in %2")
                        .arg(variableName).arg(getIncompletePath())
                        .toStdString(), __FILE__, __LINE__);
    }
    return var;
}


void MGridDatasetWriter::close()
{
    if (ncFile == nullptr) return;

    QMutexLocker ncAccessMutexLocker(&staticNetCDFAccessMutex);
    NcFile *file = ncFile;
    ncFile = nullptr;
    try
    {
        file->close();
        delete file;
    }
    catch (NcException& e)
    {
        delete file;
        throw MIOError(QString("cannot close dataset %1 -- %2")
                       .arg(getIncompletePath()).arg(e.what()).toStdString(),
                       __FILE__, __LINE__);
    }
}

} // namespace MetMC
