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
#include "cfcodec.h"

// standard library imports
#include <cmath>
#include <limits>

// related third party imports

// local application imports
#include "data/nccfvar.h"

using namespace std;
using namespace netCDF;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MCFEncoding::MCFEncoding()
    : hasScaleFactor(false),
      scaleFactor(1.),
      hasAddOffset(false),
      addOffset(0.),
      hasFillValue(false),
      fillValue(0.),
      hasValidMin(false),
      validMin(0.),
      hasValidMax(false),
      validMax(0.),
      integerStorage(false)
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

MCFEncoding MCFEncoding::fromVariable(const NcCFVar &var)
{
    MCFEncoding encoding;

    encoding.hasScaleFactor = var.hasAttribute("scale_factor");
    encoding.scaleFactor = var.getDoubleAttribute("scale_factor", 1.);
    encoding.hasAddOffset = var.hasAttribute("add_offset");
    encoding.addOffset = var.getDoubleAttribute("add_offset", 0.);

    // Older files use "missing_value" instead of "_FillValue".
    if (var.hasAttribute("_FillValue"))
    {
        encoding.hasFillValue = true;
        encoding.fillValue = var.getDoubleAttribute("_FillValue", 0.);
    }
    else if (var.hasAttribute("missing_value"))
    {
        encoding.hasFillValue = true;
        encoding.fillValue = var.getDoubleAttribute("missing_value", 0.);
    }

    encoding.hasValidMin = var.hasAttribute("valid_min");
    encoding.validMin = var.getDoubleAttribute("valid_min", 0.);
    encoding.hasValidMax = var.hasAttribute("valid_max");
    encoding.validMax = var.getDoubleAttribute("valid_max", 0.);

    NcType type = var.getType();
    encoding.integerStorage = (type == ncByte || type == ncUbyte
                               || type == ncShort || type == ncUshort
                               || type == ncInt || type == ncUint
                               || type == ncInt64 || type == ncUint64);

    return encoding;
}


void MCFEncoding::decode(float *values, size_t n) const
{
    const float fill = float(fillValue);

    for (size_t i = 0; i < n; i++)
    {
        float raw = values[i];

        if (std::isnan(raw)
                || (hasFillValue && raw == fill)
                || (hasValidMin && raw < validMin)
                || (hasValidMax && raw > validMax))
        {
            values[i] = numeric_limits<float>::quiet_NaN();
            continue;
        }

        values[i] = float(double(raw) * scaleFactor + addOffset);
    }
}


void MCFEncoding::encode(float *values, size_t n) const
{
    const float missing = packedMissingValue();

    for (size_t i = 0; i < n; i++)
    {
        if (std::isnan(values[i]))
        {
            values[i] = missing;
            continue;
        }

        double packed = (double(values[i]) - addOffset) / scaleFactor;
        if (integerStorage) packed = floor(packed + 0.5);
        if (hasValidMin && packed < validMin) packed = validMin;
        if (hasValidMax && packed > validMax) packed = validMax;

        values[i] = float(packed);
    }
}


float MCFEncoding::packedMissingValue() const
{
    if (hasFillValue) return float(fillValue);
    return numeric_limits<float>::quiet_NaN();
}

} // namespace MetMC
