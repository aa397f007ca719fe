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
#ifndef CFCODEC_H
#define CFCODEC_H

// standard library imports
#include <cstddef>

// related third party imports

// local application imports


namespace netCDF
{
class NcCFVar;
}

namespace MetMC
{

/**
  @brief MCFEncoding describes how the values of a variable are packed on disk
  according to the CF conventions (scale_factor, add_offset, _FillValue,
  valid_min, valid_max).

  @ref decode() converts raw values read from disk (as float) into physical
  values with missing values set to NaN, @ref encode() performs the inverse
  operation before values are written.
  */
class MCFEncoding
{
public:
    MCFEncoding();

    /**
      Reads the encoding attributes of @p var. Integer storage types are
      detected from the variable type.
      */
    static MCFEncoding fromVariable(const netCDF::NcCFVar& var);

    /**
      Decodes @p n raw values in place.
     */
    void decode(float *values, size_t n) const;

    /**
      Encodes @p n physical values in place. For integer storage types the
      packed values are rounded to the nearest integer; packed values outside
      the valid range are clamped to the range.
     */
    void encode(float *values, size_t n) const;

    /**
      Returns the value that is written for missing values (the fill value,
      or NaN for floating point variables without fill value).
     */
    float packedMissingValue() const;

    bool hasScaleFactor;
    double scaleFactor;
    bool hasAddOffset;
    double addOffset;
    bool hasFillValue;
    double fillValue;
    bool hasValidMin;
    double validMin;
    bool hasValidMax;
    double validMax;
    bool integerStorage;
};

} // namespace MetMC

#endif // CFCODEC_H
