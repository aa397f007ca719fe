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
#ifndef MUTIL_H
#define MUTIL_H

// standard library imports

// related third party imports
#include <QtCore>
#include "log4cplus/logger.h"

// local application imports


/******************************************************************************
***                      VERSION INFORMATION                                ***
*******************************************************************************/

// Fill this with your own ID, e.g., "-research-my-name".
const QString metmcVersionBranchID = "";
// Set to "-devel" for development versions.
const QString metmcVersionDevelID = "";

const QString metmcVersionString = "1.2.0" + metmcVersionDevelID
        + metmcVersionBranchID;
const QString metmcSoftwareName = "Met.MC";
const QString metmcBuildDate = QString("built on %1 %2").arg(__DATE__).arg(__TIME__);


/******************************************************************************
***                             LOGGING                                     ***
*******************************************************************************/

// Global reference to the Met.MC application logger (defined in mutil.cpp).
extern log4cplus::Logger mlog;


/******************************************************************************
***                 DEFINES COMMON TO THE ENTIRE SYSTEM                     ***
*******************************************************************************/

// Absolute tolerance used when comparing coordinate values of different
// datasets (e.g. an ensemble member against the nominal dataset). Coordinate
// arrays written by different tools can differ in the last digits.
#define M_LONLAT_RESOLUTION 0.00001

// Maximum number of worker threads accepted for the multi-threaded scheduler.
#define METMC_MAX_WORKERS 256

// Largest chunk store limit; the limit is kept in kb as an unsigned int.
#define METMC_MAX_MEMORY_LIMIT_MB 4194303


/******************************************************************************
***                            FUNCTIONS                                    ***
*******************************************************************************/

/**
  Expands environment variables of format $VARIABLE in the string @p path.
  Example: If the envrionment variable "METMC_HOME" is set to
  "/home/user/metmc", the path "$METMC_HOME/config/metmc.cfg" would be
  expanded to "/home/user/metmc/config/metmc.cfg".
 */
QString expandEnvironmentVariables(QString path);

/**
  Parses a comma-separated list of strings (e.g. "sst, sst_uncertainty") and
  returns the trimmed, non-empty items.
 */
QStringList parseStringList(QString list);

#endif // MUTIL_H
