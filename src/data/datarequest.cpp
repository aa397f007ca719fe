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
#include "datarequest.h"

// standard library imports

// related third party imports

// local application imports

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MDataRequestHelper::MDataRequestHelper()
    : modified(true)
{
}


MDataRequestHelper::MDataRequestHelper(const MDataRequest &request)
    : modified(true)
{
    QStringList requestList = request.split(";", QString::SkipEmptyParts);

    QStringListIterator it(requestList);
    while (it.hasNext())
    {
        QString keyValuePair = it.next();
        QString key   = keyValuePair.section("=", 0, 0);
        QString value = keyValuePair.section("=", 1);
        requestMap.insert(key, value);
    }
}


MDataRequestHelper::~MDataRequestHelper()
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

bool MDataRequestHelper::contains(const QString &key) const
{
    return requestMap.contains(key);
}


bool MDataRequestHelper::containsAll(const QList<QString> &keys) const
{
    for (int i = 0; i < keys.size(); i++)
        if (!requestMap.contains(keys.at(i))) return false;
    return true;
}


double MDataRequestHelper::doubleValue(const QString &key) const
{
    return requestMap.value(key, QString()).toDouble();
}


int MDataRequestHelper::intValue(const QString &key) const
{
    return requestMap.value(key, QString()).toInt();
}


void MDataRequestHelper::insert(const QString &key, const QString &value)
{
    modified = true;
    requestMap.insert(key, value);
}


void MDataRequestHelper::insert(const QString &key, const int &value)
{
    modified = true;
    requestMap.insert(key, QString("%1").arg(value));
}


void MDataRequestHelper::insert(const QString &key, const double &value)
{
    modified = true;
    // 17 significant digits restore the same double when parsed.
    requestMap.insert(key, QString::number(value, 'g', 17));
}


QString MDataRequestHelper::intVectorToString(const QVector<int> &value)
{
    QStringList items;
    foreach (int i, value) items << QString::number(i);
    return items.join("/");
}


void MDataRequestHelper::insert(const QString &key, const QVector<int> &value)
{
    modified = true;
    requestMap.insert(key, intVectorToString(value));
}


void MDataRequestHelper::removeAllKeysExcept(const QStringList &keepTheseKeys)
{
    modified = true;

    QList<QString> keys = requestMap.keys();
    for (int i = 0; i < keys.size(); i++)
    {
        QString key = keys[i];
        if (!keepTheseKeys.contains(key)) requestMap.remove(key);
    }
}


MDataRequest MDataRequestHelper::request()
{
    if (modified) updateRequestString();
    return requestString;
}


QString MDataRequestHelper::value(const QString &key) const
{
    return requestMap.value(key, QString());
}


QVector<int> MDataRequestHelper::intVectorValue(const QString &key) const
{
    QVector<int> vector;
    QString s = value(key);
    if (s.isEmpty()) return vector;

    foreach (QString item, s.split("/"))
    {
        bool ok = false;
        int i = item.toInt(&ok);
        if (ok) vector << i;
    }

    return vector;
}


/******************************************************************************
***                            PRIVATE METHODS                              ***
*******************************************************************************/

void MDataRequestHelper::updateRequestString()
{
    requestString = "";

    QMapIterator<QString, QString> i(requestMap);
    while (i.hasNext())
    {
        i.next();
        requestString += QString("%1=%2;").arg(i.key()).arg(i.value());
    }

    modified = false;
}

} // namespace MetMC
