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
#ifndef SMOOTHFILTER_H
#define SMOOTHFILTER_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "scheduleddatasource.h"
#include "ensemblereducersource.h"
#include "chunklayout.h"
#include "gridchunk.h"


namespace MetMC
{

/**
  @brief Horizontal geometry of a variable that is smoothed by @ref
  MSmoothFilter.
  */
struct MFilterGeometry
{
    MFilterGeometry() : latDimension(-1), lonDimension(-1),
        cyclicInLongitude(false) {}

    MChunkLayout layout;
    int latDimension;
    int lonDimension;
    bool cyclicInLongitude;
};


/**
  @brief MSmoothFilter implements the Gaussian low-pass filter of the
  standard uncertainty. The filter is applied to the ensemble variance
  provided by an @ref MEnsembleReducerSource along the latitude and longitude
  dimensions; the result is the square root of the filtered variance.

  Missing values are handled by normalized convolution, i.e. the weights of
  missing neighbours are dropped. Cells that are missing at the centre stay
  missing. Beyond the edges of the grid values are treated as missing,
  except in longitude if the grid is cyclic.

  Requests need to contain the keys VARIABLE and CHUNK. The task of a chunk
  depends on the variance tasks of all chunks that overlap with the chunk
  extended by the filter radius, hence the result does not depend on the
  chunk layout.
  */
class MSmoothFilter : public MScheduledDataSource
{
public:
    /**
      @p fwhm is the full width at half maximum of the Gaussian kernel in
      grid points.
     */
    MSmoothFilter(const QString &identifier,
                  MEnsembleReducerSource *inputSource, double fwhm);

    double getFullWidthAtHalfMaximum() const { return fwhm; }

    /**
      Standard deviation of the kernel in grid points.
     */
    double getStandardDeviation() const;

    void setFilterGeometry(const QString &variableName,
                           const MFilterGeometry &geometry);

    /**
      Significant radius (in grid points) of a Gaussian kernel with standard
      deviation @p stdDev_gp: all grid points within the 99% quantile of a
      Gaussian distribution are considered. The 99% quantile is the standard
      deviation multiplied by 2.576.
     */
    static int significantRadius(double stdDev_gp);

    /**
      Returns the (unnormalized) kernel weights for the offsets -r..r, where
      r is the significant radius.
     */
    static QVector<double> gaussianWeights(double stdDev_gp);

    MGridChunk* getData(MDataRequest request)
    { return static_cast<MGridChunk*>(MScheduledDataSource::getData(request)); }

protected:
    MTask* createTaskGraph(MDataRequest request, MTaskGraph *graph) override;

    MGridChunk* produceData(MDataRequest request) override;

    const QStringList locallyRequiredKeys() const override;

private:
    const MFilterGeometry& filterGeometry(const QString &variableName) const;

    /**
      Returns the coordinates of the chunks that are required to filter the
      chunk at @p chunkCoordinates.
     */
    QList< QVector<int> > haloChunks(
            const MFilterGeometry &geometry,
            const QVector<int> &chunkCoordinates) const;

    MDataRequest varianceRequest(const QString &variableName,
                                 const QVector<int> &chunkCoordinates) const;

    MEnsembleReducerSource *inputSource;
    double fwhm;
    QMap<QString, MFilterGeometry> geometries;
};

} // namespace MetMC

#endif // SMOOTHFILTER_H
