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
#ifndef DATAREQUEST_H
#define DATAREQUEST_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports


namespace MetMC
{

/**
  Data requests are encoded in a string. A request identifies a single chunk
  operation, e.g. "CHUNK=0/1/0;MEMBER=0;OP=READ;VARIABLE=analysed_sst;".
 */
typedef QString MDataRequest;


/**
  @brief MDataRequestHelper provides convenience methods to generate and to
  parse a request.
  */
class MDataRequestHelper
{
public:
    /**
      Creates an empty request.
     */
    MDataRequestHelper();

    /**
      Parses @p request.
     */
    MDataRequestHelper(const MDataRequest &request);

    virtual ~MDataRequestHelper();

    bool contains(const QString &key) const;

    bool containsAll(const QList<QString> &keys) const;

    double doubleValue(const QString &key) const;

    int intValue(const QString &key) const;

    void insert(const QString &key, const QString &value);

    void insert(const QString &key, const int &value);

    void insert(const QString &key, const double &value);

    void insert(const QString &key, const QVector<int> &value);

    void removeAllKeysExcept(const QStringList &keepTheseKeys);

    MDataRequest request();

    QString value(const QString &key) const;

    QVector<int> intVectorValue(const QString &key) const;

    static QString intVectorToString(const QVector<int> &value);

private:
    /** Map that stores all key/value pairs of the request. QMap is used as
        this class returns all key/value pairs sorted according to the key
        (in contrast to QHash, which returns the items in arbitrary order. */
    QMap<QString, QString> requestMap;

    /** String that encodes the key/value pairs similar to a WMS request. */
    QString requestString;
    bool modified;

    /**
      Regenerates the request string from the @ref requestMap.
     */
    void updateRequestString();
};

} // namespace MetMC

#endif // DATAREQUEST_H
