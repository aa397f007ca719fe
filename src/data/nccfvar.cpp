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
#include "nccfvar.h"

// standard library imports

// related third party imports
#include <QRegExp>
#include <QString>

// local application imports
#include "util/mutil.h"

using namespace std;
using namespace netCDF;
using namespace netCDF::exceptions;


/******************************************************************************
***                          UTILITY FUNCTIONS                              ***
*******************************************************************************/

/**
  Fixes a C++ string object that still contains a zero termination character at
  the end. Some attributes read from NetCDF files can show such a behaviour.
  For instance, the time units attribute read with a statement such as 'string
  attribute; var.getAtt("units").getValues(attribute);' could still have a '0'
  value at the last position.

  This method checks if the last character of the given string s is a valid
  ASCII character (value >= 32). If not, the last character is removed.
  */
inline void fixZeroTermination(string *s)
{
    if (s->length() > 0)
        if (s->at(s->length()-1) < 32) s->resize(s->length()-1);
}


/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

NcCFVar::NcCFVar()
    : NcVar()
{
    // Matches valid time units strings from the "units" attribute of the time
    // variable, cf.
    // http://cfconventions.org/cf-conventions/v1.6.0/cf-conventions.html#time-coordinate .
    reTimeUnits.setPattern("(second|sec|s|minute|min|hour|hr|h|day|d|year|yr)s? since (\\d+)-(\\d+)-(\\d+)"
                           "(?:[T\\s](\\d+)(?::(\\d+)(?::(\\d+(?:\\.\\d+)?))?)?)?[Z\\s]?"
                           "(?:UTC|(-?\\d+):?(\\d+)?)?$");
    reTimeUnits.setCaseSensitivity(Qt::CaseInsensitive);
}


NcCFVar::NcCFVar(const NcVar& rhs)
    : NcVar(rhs)
{
    reTimeUnits.setPattern("(second|sec|s|minute|min|hour|hr|h|day|d|year|yr)s? since (\\d+)-(\\d+)-(\\d+)"
                           "(?:[T\\s](\\d+)(?::(\\d+)(?::(\\d+(?:\\.\\d+)?))?)?)?[Z\\s]?"
                           "(?:UTC|(-?\\d+):?(\\d+)?)?$");
    reTimeUnits.setCaseSensitivity(Qt::CaseInsensitive);
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

int NcCFVar::getLatitudeDimensionIndex() const
{
    // List of units from which the latitude variable can be recognised
    // (http://cfconventions.org/cf-conventions/v1.6.0/cf-conventions.html#latitude-coordinate).
    vector<string> units = {"degrees_north", "degree_north", "degree_N",
                            "degrees_N", "degreeN", "degreesN"};

    vector<string> standardNames = {"latitude", "grid_latitude"};

    return getCFCoordinateDimensionIndex(units, standardNames, "lat");
}


int NcCFVar::getLongitudeDimensionIndex() const
{
    // List of units from which the longitude variable can be recognised
    // (http://cfconventions.org/cf-conventions/v1.6.0/cf-conventions.html#longitude-coordinate).
    vector<string> units = {"degrees_east", "degree_east", "degree_E",
                            "degrees_E", "degreeE", "degreesE"};

    vector<string> standardNames = {"longitude", "grid_longitude"};

    return getCFCoordinateDimensionIndex(units, standardNames, "lon");
}


int NcCFVar::getTimeDimensionIndex() const
{
    for (int i = 0; i < getDimCount(); i++)
    {
        NcVar var = getParentGroup().getVar(getDim(i).getName());
        // Check if the variable for the current dimension is defined. Every
        // dimension should correspond to a variable in CF compliant files.
        if (var.isNull()) continue;

        string attribute = NcCFVar(var).getStringAttribute("units");
        if (reTimeUnits.indexIn(QString::fromStdString(attribute)) >= 0)
        {
            return i;
        }
    }

    return -1;
}


bool NcCFVar::hasAttribute(const string &name) const
{
    map<string, NcVarAtt> attributes = getAtts();
    return attributes.find(name) != attributes.end();
}


string NcCFVar::getStringAttribute(const string &name,
                                   const string &defaultValue) const
{
    if (!hasAttribute(name)) return defaultValue;

    NcVarAtt att = getAtt(name);
    if (att.getType() != ncChar && att.getType() != ncString)
    {
        return defaultValue;
    }

    string attribute;
    att.getValues(attribute);
    fixZeroTermination(&attribute);
    return attribute;
}


double NcCFVar::getDoubleAttribute(const string &name,
                                   double defaultValue) const
{
    if (!hasAttribute(name)) return defaultValue;

    NcVarAtt att = getAtt(name);
    if (att.getType() == ncChar || att.getType() == ncString
            || att.getAttLength() < 1)
    {
        return defaultValue;
    }

    // netCDF converts numerical attributes of any type to the requested type.
    vector<double> values(att.getAttLength());
    att.getValues(values.data());
    return values[0];
}


bool NcCFVar::isCoordinateVariable() const
{
    return (getDimCount() == 1) && (getDim(0).getName() == getName());
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

int NcCFVar::getCFCoordinateDimensionIndex(
        const vector<string>& units, const vector<string>& standardNames,
        const QString &fallbackNamePrefix) const
{
    // Loop over all coordinate (=dimension) variables of this variable.
    for (int i = 0; i < getDimCount(); i++)
    {
        NcVar var = getParentGroup().getVar(getDim(i).getName());
        if (var.isNull()) continue;

        NcCFVar cfVar(var);

        // Try to match one of the values of the 'units' vector to the units
        // attribute of the variable, if available.
        string attribute = cfVar.getStringAttribute("units");
        for (unsigned int j = 0; j < units.size(); j++)
        {
            if (attribute == units[j]) return i;
        }

        // Test if the standard name of the variable (if available) equals one
        // of the standard names we're looking for.
        attribute = cfVar.getStringAttribute("standard_name");
        for (unsigned int j = 0; j < standardNames.size(); j++)
        {
            if (attribute == standardNames[j]) return i;
        }
    }

    // No CF coordinate variable found. Fall back to the dimension name.
    for (int i = 0; i < getDimCount(); i++)
    {
        QString dimName = QString::fromStdString(getDim(i).getName());
        if (dimName.startsWith(fallbackNamePrefix, Qt::CaseInsensitive))
        {
            return i;
        }
    }

    return -1;
}
