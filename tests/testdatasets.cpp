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
#include "testdatasets.h"

// standard library imports
#include <cmath>
#include <limits>
#include <string>
#include <vector>

// related third party imports
#include <netcdf>

// local application imports
#include "data/griddataset.h"
#include "data/gridchunk.h"
#include "util/mexception.h"

using namespace std;
using namespace netCDF;

namespace MetMC
{
namespace Test
{

namespace
{

void writeDataset(const QString &path, int nLat, float sstOffset,
                  float sstSpread, const QVector<float> &sstNoise,
                  size_t nativeChunkLat, size_t nativeChunkLon)
{
    QMutexLocker ncAccessMutexLocker(MGridDataset::netCDFAccessMutex());

    NcFile file(path.toStdString(), NcFile::replace, NcFile::nc4);

    file.putAtt("title", "synthetic sea surface temperature");
    file.putAtt("Conventions", "CF-1.7");

    NcDim timeDim = file.addDim("time", 1);
    NcDim latDim = file.addDim("lat", size_t(nLat));
    NcDim lonDim = file.addDim("lon", size_t(numLon));

    NcVar timeVar = file.addVar("time", ncDouble, timeDim);
    timeVar.putAtt("units", "days since 1981-01-01 00:00:00");
    timeVar.putAtt("standard_name", "time");

    NcVar latVar = file.addVar("lat", ncFloat, latDim);
    latVar.putAtt("units", "degrees_north");
    latVar.putAtt("standard_name", "latitude");

    NcVar lonVar = file.addVar("lon", ncFloat, lonDim);
    lonVar.putAtt("units", "degrees_east");
    lonVar.putAtt("standard_name", "longitude");

    vector<NcDim> dims3D;
    dims3D.push_back(timeDim);
    dims3D.push_back(latDim);
    dims3D.push_back(lonDim);
    vector<size_t> chunks3D;
    chunks3D.push_back(1);
    chunks3D.push_back(nativeChunkLat);
    chunks3D.push_back(nativeChunkLon);

    NcVar sstVar = file.addVar("sst", ncFloat, dims3D);
    sstVar.setChunking(NcVar::nc_CHUNKED, chunks3D);
    sstVar.putAtt("_FillValue", ncFloat, fillValue);
    sstVar.putAtt("standard_name", "sea_surface_temperature");
    sstVar.putAtt("long_name", "sea surface temperature");
    sstVar.putAtt("units", "kelvin");
    sstVar.putAtt("valid_min", ncFloat, 200.f);
    sstVar.putAtt("valid_max", ncFloat, 350.f);

    NcVar uncVar = file.addVar("sst_uncertainty", ncFloat, dims3D);
    uncVar.setChunking(NcVar::nc_CHUNKED, chunks3D);
    uncVar.putAtt("_FillValue", ncFloat, fillValue);
    uncVar.putAtt("long_name", "total uncertainty of sea surface "
                               "temperature");
    uncVar.putAtt("units", "kelvin");

    NcVar chlVar = file.addVar("chl", ncFloat, dims3D);
    chlVar.setChunking(NcVar::nc_CHUNKED, chunks3D);
    chlVar.putAtt("_FillValue", ncFloat, fillValue);
    chlVar.putAtt("standard_name",
                  "mass_concentration_of_chlorophyll_a_in_sea_water");
    chlVar.putAtt("units", "mg m-3");

    NcVar totalVar = file.addVar("sst_total", ncFloat, dims3D);
    totalVar.setChunking(NcVar::nc_CHUNKED, chunks3D);
    totalVar.putAtt("_FillValue", ncFloat, fillValue);
    totalVar.putAtt("long_name", "skin temperature");
    totalVar.putAtt("units", "kelvin");

    NcVar maskVar = file.addVar("mask", ncByte, dims3D);
    maskVar.putAtt("long_name", "sea mask");

    vector<NcDim> dims2D;
    dims2D.push_back(latDim);
    dims2D.push_back(lonDim);
    NcVar depthVar = file.addVar("depth", ncFloat, dims2D);
    depthVar.putAtt("units", "m");

    double time = 14000.;
    timeVar.putVar(&time);

    vector<float> lats(nLat), lons(numLon);
    for (int j = 0; j < nLat; j++) lats[j] = -52.5f + 15.f * j;
    for (int i = 0; i < numLon; i++) lons[i] = 30.f * i;
    latVar.putVar(lats.data());
    lonVar.putVar(lons.data());

    const int n = nLat * numLon;
    vector<float> sst(n), unc(n), chl(n), total(n), depth(n);
    vector<signed char> mask(n);
    for (int i = 0; i < n; i++)
    {
        float x = nominalSST(i);
        bool missing = std::isnan(x);
        sst[i] = missing ? fillValue
                         : x + sstOffset + sstSpread * float(i % 7);
        if (!missing && !sstNoise.isEmpty()) sst[i] += sstNoise[i];
        unc[i] = missing ? fillValue : 0.5f;
        chl[i] = missing ? fillValue : nominalChl(i);
        total[i] = missing ? fillValue : x + 0.3f;
        mask[i] = missing ? 0 : 1;
        depth[i] = 100.f + float(i);
    }
    sstVar.putVar(sst.data());
    uncVar.putVar(unc.data());
    chlVar.putVar(chl.data());
    totalVar.putVar(total.data());
    maskVar.putVar(mask.data());
    depthVar.putVar(depth.data());

    file.close();
}

} // namespace


QList<int> missingCells()
{
    return (QList<int>() << 5 << 30 << 77);
}


float nominalSST(int index)
{
    if (missingCells().contains(index))
        return numeric_limits<float>::quiet_NaN();

    // The first row is close to the freezing point of sea water.
    if (index < numLon) return 271.5f + 0.05f * float(index % 3);
    return 285.f + 5.f * float(sin(0.3 * index));
}


float nominalChl(int index)
{
    if (missingCells().contains(index))
        return numeric_limits<float>::quiet_NaN();
    return 0.2f + 0.05f * float(index % 9);
}


void writeSyntheticDataset(const QString &path, float sstOffset,
                           float sstSpread)
{
    writeDataset(path, numLat, sstOffset, sstSpread, QVector<float>(),
                 chunkLat, chunkLon);
}


void writeSyntheticDataset(const QString &path,
                           const QVector<float> &sstNoise)
{
    writeDataset(path, numLat, 0.f, 0.f, sstNoise, chunkLat, chunkLon);
}


void writeDatasetOnOtherGrid(const QString &path)
{
    writeDataset(path, 6, 0.f, 0.f, QVector<float>(), chunkLat, chunkLon);
}


void writeDatasetWithOtherChunking(const QString &path)
{
    writeDataset(path, numLat, 0.f, 0.f, QVector<float>(), chunkLat / 2,
                 numLon);
}


QVector<float> readVariable(const QString &path, const QString &variableName)
{
    MGridDataset dataset(path, MDatasetFile::resolveEngine(path, ""));
    MGridVariableInfo info = dataset.getVariableInfo(variableName);

    MChunkRegion region;
    for (int i = 0; i < info.dimensionSizes.size(); i++)
    {
        region.start << 0;
        region.count << info.dimensionSizes[i];
    }

    QScopedPointer<MGridChunk> chunk(dataset.readChunk(variableName, region));
    QVector<float> values(int(chunk->getNumValues()));
    for (int i = 0; i < values.size(); i++) values[i] = chunk->data[i];
    return values;
}


QVector<float> readRawVariable(const QString &path,
                               const QString &variableName)
{
    QMutexLocker ncAccessMutexLocker(MGridDataset::netCDFAccessMutex());

    NcFile file(MDatasetFile::netCDFPath(
                    path, MDatasetFile::resolveEngine(path, ""))
                .toStdString(), NcFile::read);
    NcVar var = file.getVar(variableName.toStdString());

    size_t n = 1;
    for (int i = 0; i < var.getDimCount(); i++) n *= var.getDim(i).getSize();

    QVector<float> values(int(n));
    var.getVar(values.data());
    file.close();
    return values;
}


QString variableTextAttribute(const QString &path,
                              const QString &variableName,
                              const QString &attributeName)
{
    QMutexLocker ncAccessMutexLocker(MGridDataset::netCDFAccessMutex());

    NcFile file(path.toStdString(), NcFile::read);
    NcVar var = file.getVar(variableName.toStdString());
    string value;
    var.getAtt(attributeName.toStdString()).getValues(value);
    file.close();
    return QString::fromStdString(value);
}


bool hasVariableAttribute(const QString &path, const QString &variableName,
                          const QString &attributeName)
{
    QMutexLocker ncAccessMutexLocker(MGridDataset::netCDFAccessMutex());

    NcFile file(path.toStdString(), NcFile::read);
    NcVar var = file.getVar(variableName.toStdString());
    bool found = var.getAtts().count(attributeName.toStdString()) > 0;
    file.close();
    return found;
}


QVector<long long> variableIntegerAttribute(const QString &path,
                                            const QString &variableName,
                                            const QString &attributeName)
{
    QMutexLocker ncAccessMutexLocker(MGridDataset::netCDFAccessMutex());

    NcFile file(path.toStdString(), NcFile::read);
    NcVarAtt att = file.getVar(variableName.toStdString())
            .getAtt(attributeName.toStdString());
    QVector<long long> values(int(att.getAttLength()));
    if (!values.isEmpty()) att.getValues(values.data());
    file.close();
    return values;
}


int globalIntegerAttribute(const QString &path, const QString &attributeName)
{
    QMutexLocker ncAccessMutexLocker(MGridDataset::netCDFAccessMutex());

    NcFile file(path.toStdString(), NcFile::read);
    int value = 0;
    file.getAtt(attributeName.toStdString()).getValues(&value);
    file.close();
    return value;
}


QString globalTextAttribute(const QString &path, const QString &attributeName)
{
    QMutexLocker ncAccessMutexLocker(MGridDataset::netCDFAccessMutex());

    NcFile file(path.toStdString(), NcFile::read);
    string value;
    file.getAtt(attributeName.toStdString()).getValues(value);
    file.close();
    return QString::fromStdString(value);
}


QString shippedSchemaFile()
{
    return QString(METMC_SOURCE_DIR) + "/config/sourcetypes.cfg";
}


MSourceTypeRegistry shippedRegistry()
{
    MSourceTypeRegistry registry;
    registry.loadFromFile(shippedSchemaFile());
    return registry;
}


/******************************************************************************
***                           MFieldCollector                               ***
*******************************************************************************/

MFieldCollector::MFieldCollector(MScheduledDataSource *input,
                                 const MChunkLayout &layout,
                                 const MDataRequest &baseRequest)
    : MScheduledDataSource(QString("collector/%1").arg(input->getIdentifier())),
      input(input),
      layout(layout),
      baseRequest(baseRequest),
      field(int(layout.totalNumValues()),
            numeric_limits<float>::quiet_NaN())
{
}


void MFieldCollector::addToTaskGraph(MTaskGraph *graph)
{
    for (int c = 0; c < layout.totalNumChunks(); c++)
    {
        MDataRequestHelper rh;
        rh.insert("CHUNK", layout.chunkCoordinates(c));
        getTaskGraph(rh.request(), graph);
    }
}


QVector<float> MFieldCollector::getField() const
{
    QMutexLocker locker(&fieldMutex);
    return field;
}


MTask* MFieldCollector::createTaskGraph(MDataRequest request,
                                        MTaskGraph *graph)
{
    QVector<int> chunkCoordinates =
            MDataRequestHelper(request).intVectorValue("CHUNK");

    MTask *task = new MTask(request, this);
    task->addParent(input->getTaskGraph(inputRequest(chunkCoordinates),
                                        graph));
    graph->addSink(task);
    return task;
}


MAbstractDataItem* MFieldCollector::produceData(MDataRequest request)
{
    QVector<int> chunkCoordinates =
            MDataRequestHelper(request).intVectorValue("CHUNK");
    MDataRequest r = inputRequest(chunkCoordinates);

    MGridChunk *chunk = dynamic_cast<MGridChunk*>(input->getData(r));
    if (chunk == nullptr)
    {
        input->releaseData(r);
        throw MValueError("input did not produce a grid chunk",
                          __FILE__, __LINE__);
    }

    const MChunkRegion &region = chunk->getRegion();
    const QVector<size_t> &sizes = layout.getDimensionSizes();
    const int nDims = sizes.size();

    QMutexLocker locker(&fieldMutex);
    for (size_t i = 0; i < chunk->getNumValues(); i++)
    {
        // Position of value i in the complete array.
        size_t remainder = i;
        size_t target = 0;
        size_t stride = 1;
        for (int d = nDims - 1; d >= 0; d--)
        {
            size_t index = region.start[d] + remainder % region.count[d];
            remainder /= region.count[d];
            target += index * stride;
            stride *= sizes[d];
        }
        field[int(target)] = chunk->data[i];
    }
    locker.unlock();

    input->releaseData(r);
    return nullptr;
}


const QStringList MFieldCollector::locallyRequiredKeys() const
{
    return (QStringList() << "CHUNK");
}


MDataRequest MFieldCollector::inputRequest(
        const QVector<int> &chunkCoordinates) const
{
    MDataRequestHelper rh(baseRequest);
    rh.insert("CHUNK", chunkCoordinates);
    return rh.request();
}

} // namespace Test
} // namespace MetMC
