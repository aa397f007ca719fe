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
#ifndef NCCFVAR_H
#define NCCFVAR_H

// standard library imports
#include <string>
#include <vector>

// related third party imports
#include <netcdf>
#include <QtCore>

// local application imports


// C++ API for netCDF4.
namespace netCDF
{

/**
  @brief NcCFVar represents a NetCDF variable compliant with the CF-conventions
  (http://cfconventions.org/).

  NcCFVar inherits the NcVar class to add methods that provide CF-functionality
  (e.g. to determine which of the dimensions of the variable are latitude,
  longitude and time and to read attributes with default values).
  */
class NcCFVar : public NcVar
{
public:
    /**
      Default constructur, generates a "null object".
      */
    NcCFVar();

    /**
      Constructs a new NcCFVar object from an existing NcVar object.
      */
    NcCFVar(const NcVar& rhs);

    /**
      Returns the index of the latitude dimension of the variable, or -1 if
      the variable does not have a latitude dimension. The latitude dimension
      is identified by the 'units' or 'standard_name' attribute of its
      coordinate variable; if no coordinate variable exists, dimensions whose
      name starts with "lat" are accepted.
      */
    int getLatitudeDimensionIndex() const;

    /**
      Same as @ref getLatitudeDimensionIndex() for the longitude dimension.
      */
    int getLongitudeDimensionIndex() const;

    /**
      Returns the index of the time dimension of the variable (identified by
      a "<units> since <date>" units attribute), or -1.
      */
    int getTimeDimensionIndex() const;

    /**
      Returns @p true if the variable has an attribute @p name.
      */
    bool hasAttribute(const std::string& name) const;

    /**
      Returns the value of the text attribute @p name, or @p defaultValue if
      the attribute does not exist.
      */
    std::string getStringAttribute(const std::string& name,
                                   const std::string& defaultValue = "") const;

    /**
      Returns the first value of the numerical attribute @p name converted to
      double, or @p defaultValue if the attribute does not exist.
      */
    double getDoubleAttribute(const std::string& name,
                              double defaultValue) const;

    /**
      Returns @p true if the variable is a coordinate variable, i.e. a
      one-dimensional variable with the same name as its dimension.
      */
    bool isCoordinateVariable() const;

private:
    /**
      Returns the index of the first dimension whose coordinate variable
      matches one of @p units or @p standardNames, or -1.
      */
    int getCFCoordinateDimensionIndex(
            const std::vector<std::string>& units,
            const std::vector<std::string>& standardNames,
            const QString& fallbackNamePrefix) const;

    QRegExp reTimeUnits;
};

} // namespace netCDF

#endif // NCCFVAR_H
