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
#ifndef CHUNKLAYOUT_H
#define CHUNKLAYOUT_H

// standard library imports
#include <cstddef>
#include <vector>

// related third party imports
#include <QtCore>

// local application imports


namespace MetMC
{

/**
  @brief MChunkRegion describes a hyperslab (start index and count per
  dimension) of an N-dimensional array.
  */
struct MChunkRegion
{
    QVector<size_t> start;
    QVector<size_t> count;

    size_t numValues() const;

    std::vector<size_t> startVector() const;
    std::vector<size_t> countVector() const;

    QString toString() const;
};


/**
  @brief Requested chunk sizes for the horizontal dimensions. A value of -1
  requests the full dimension as a single chunk, 0 requests the native
  chunking of the source variable, a positive value requests chunks of this
  size.
  */
struct MChunkingScheme
{
    MChunkingScheme() : chunkSizeLat(0), chunkSizeLon(0) {}
    MChunkingScheme(int lat, int lon) : chunkSizeLat(lat), chunkSizeLon(lon) {}

    int chunkSizeLat;
    int chunkSizeLon;
};


/**
  @brief MChunkLayout partitions each dimension of an N-dimensional array into
  contiguous blocks of a fixed size (the last block of a dimension may be
  smaller). Chunks are identified by their chunk coordinates, i.e. the block
  index in each dimension.

  Chunks are enumerated in row-major order (the last dimension varies
  fastest). The layout only depends on the dimension sizes and chunk sizes,
  hence the same chunk coordinates always refer to the same region of the
  array.
  */
class MChunkLayout
{
public:
    MChunkLayout();

    MChunkLayout(const QStringList &dimensionNames,
                 const QVector<size_t> &dimensionSizes,
                 const QVector<size_t> &chunkSizes);

    /**
      Resolves the chunk sizes requested by @p scheme for an array with the
      given dimensions. @p latDimension and @p lonDimension are the indices of
      the horizontal dimensions (-1 if not present); all other dimensions are
      chunked with size 1. @p nativeChunkSizes contains the native chunking
      of the source variable (empty for contiguous storage).

      If the resolved layout does not match the native chunking the re-chunking
      is logged; chunk edges are realigned, values are never resampled.
     */
    static MChunkLayout resolve(const QStringList &dimensionNames,
                                const QVector<size_t> &dimensionSizes,
                                const QVector<size_t> &nativeChunkSizes,
                                int latDimension, int lonDimension,
                                const MChunkingScheme &scheme);

    int numDimensions() const { return dimensionSizes.size(); }

    const QStringList& getDimensionNames() const { return dimensionNames; }

    const QVector<size_t>& getDimensionSizes() const { return dimensionSizes; }

    const QVector<size_t>& getChunkSizes() const { return chunkSizes; }

    int numChunks(int dimension) const;

    int totalNumChunks() const;

    size_t totalNumValues() const;

    /**
      Returns the chunk coordinates of the chunk with row-major index
      @p linearIndex.
     */
    QVector<int> chunkCoordinates(int linearIndex) const;

    int linearIndex(const QVector<int> &chunkCoordinates) const;

    /**
      Returns the array region covered by the chunk at @p chunkCoordinates.
      Throws an @ref MValueError if the coordinates are outside the layout.
     */
    MChunkRegion region(const QVector<int> &chunkCoordinates) const;

    /**
      Returns the indices of the chunks along @p dimension that contain at
      least one of the array indices in [@p first, @p last]. If @p cyclic is
      true, indices outside the dimension wrap around; otherwise they are
      ignored. The returned indices are unique and sorted.
     */
    QVector<int> chunkIndicesCovering(int dimension, qint64 first,
                                      qint64 last, bool cyclic) const;

    /**
      Two layouts are equal if dimension names, sizes and chunk sizes agree.
     */
    bool operator==(const MChunkLayout &other) const;
    bool operator!=(const MChunkLayout &other) const
    { return !(*this == other); }

    QString toString() const;

private:
    QStringList dimensionNames;
    QVector<size_t> dimensionSizes;
    QVector<size_t> chunkSizes;
};

} // namespace MetMC

#endif // CHUNKLAYOUT_H
