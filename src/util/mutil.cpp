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
#include "mutil.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports

using namespace std;


/******************************************************************************
***                             LOGGING                                     ***
*******************************************************************************/

// Global reference to the Met.MC application logger.
log4cplus::Logger mlog =
        log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("metmc"));


/******************************************************************************
***                          UTILITY FUNCTIONS                              ***
*******************************************************************************/

QString expandEnvironmentVariables(QString path)
{
    QRegExp regExpEnvVar("\\$([A-Za-z0-9_]+)");

    int i;
    while ((i = regExpEnvVar.indexIn(path)) != -1)
    {
        QString envVar = regExpEnvVar.cap(1);
        QString expansion;
        if (envVar == "HOME")
        {
            // Special case "$HOME" environment variable: use QDir::homePath()
            // to obtain correct home directory on all platforms.
            expansion = QDir::homePath();
        }
        else
        {
            expansion = QProcessEnvironment::systemEnvironment().value(
                                envVar);
        }

        if (expansion.isEmpty())
        {
            LOG4CPLUS_ERROR(mlog, "ERROR: Environment variable "
                            << envVar.toStdString()
                            << " has not been defined. Cannot expand variable.");
            break;
        }
        else
        {
            path.remove(i, regExpEnvVar.matchedLength());
            path.insert(i, expansion);
        }
    }

    return path;
}


QStringList parseStringList(QString list)
{
    QStringList items;
    foreach (QString item, list.split(",", QString::SkipEmptyParts))
    {
        item = item.trimmed();
        if (!item.isEmpty()) items << item;
    }
    return items;
}

