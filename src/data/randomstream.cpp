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
#include "randomstream.h"

// standard library imports

// related third party imports
#include <gsl/gsl_cdf.h>

// local application imports
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                            MRandomStream                                ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MRandomStream::MRandomStream(const vector<quint32> &seedWords, bool mirrored)
    : seedWords(seedWords),
      mirrored(mirrored)
{
    restart();
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

double MRandomStream::nextUniform()
{
    double u = nextRawUniform();
    return mirrored ? 1. - u : u;
}


double MRandomStream::nextNormal()
{
    double z = gsl_cdf_ugaussian_Pinv(nextRawUniform());
    return mirrored ? -z : z;
}


void MRandomStream::fillNormal(float *values, size_t n)
{
    for (size_t i = 0; i < n; i++) values[i] = float(nextNormal());
}


void MRandomStream::restart()
{
    seed_seq sequence(seedWords.begin(), seedWords.end());
    engine.seed(sequence);
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

double MRandomStream::nextRawUniform()
{
    // The upper 53 bits give a double in [0, 1); the half-step offset keeps
    // the deviate away from 0 and 1, where the inverse normal CDF diverges.
    quint64 bits = engine() >> 11;
    return (double(bits) + 0.5) * (1.0 / 9007199254740992.0);
}


/******************************************************************************
***                           MStreamGenerator                              ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MStreamGenerator::MStreamGenerator(const QUuid &variableId, int selector,
                                   bool antithetic)
    : variableId(variableId),
      selector(selector),
      antithetic(antithetic)
{
    if (selector < 0)
    {
        throw MConfigurationError(QString("invalid selector %1, selectors "
                                          "must be non-negative")
                                  .arg(selector).toStdString(),
                                  __FILE__, __LINE__);
    }
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

QUuid MStreamGenerator::variableIdentity(const QString &variableName,
                                         const QString &sourceFileStem)
{
    // RFC 4122 name space for URLs.
    const QUuid namespaceURL("{6ba7b811-9dad-11d1-80b4-00c04fd430c8}");
    return QUuid::createUuidV5(namespaceURL,
                               QString("%1-%2").arg(variableName)
                               .arg(sourceFileStem));
}


MRandomStream MStreamGenerator::stream(
        const QVector<int> &chunkCoordinates) const
{
    return MRandomStream(seedWords(streamIndex(), variableId,
                                   chunkCoordinates),
                         usesMirroredStream());
}


vector<quint32> MStreamGenerator::rootSeed() const
{
    return seedWords(streamIndex(), variableId, QVector<int>());
}


int MStreamGenerator::streamIndex() const
{
    if (!antithetic) return selector;
    // (selector + 1) / 2 without overflow for INT_MAX.
    return selector / 2 + selector % 2;
}


bool MStreamGenerator::usesMirroredStream() const
{
    return antithetic && selector > 0 && (selector % 2 == 0);
}


MRandomStream MStreamGenerator::derive(int selector, const QUuid &variableId,
                                       const QVector<int> &chunkCoordinates)
{
    if (selector < 0)
    {
        throw MConfigurationError(QString("invalid selector %1, selectors "
                                          "must be non-negative")
                                  .arg(selector).toStdString(),
                                  __FILE__, __LINE__);
    }
    return MRandomStream(seedWords(selector, variableId, chunkCoordinates),
                         false);
}


QPair<MRandomStream, MRandomStream> MStreamGenerator::derivePair(
        int selector, const QUuid &variableId,
        const QVector<int> &chunkCoordinates)
{
    MRandomStream a = derive(selector, variableId, chunkCoordinates);
    MRandomStream b(a.getSeedWords(), true);
    return qMakePair(a, b);
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

vector<quint32> MStreamGenerator::seedWords(
        int selector, const QUuid &variableId,
        const QVector<int> &chunkCoordinates)
{
    vector<quint32> words;
    for (int i = 0; i < chunkCoordinates.size(); i++)
    {
        words.push_back(quint32(chunkCoordinates[i]));
    }

    // The 128 bits of the variable identity in network byte order.
    QByteArray bytes = variableId.toRfc4122();
    for (int i = 0; i < 4; i++)
    {
        quint32 word = 0;
        for (int j = 0; j < 4; j++)
        {
            word = (word << 8) | quint32(quint8(bytes[4 * i + j]));
        }
        words.push_back(word);
    }

    words.push_back(quint32(selector));
    return words;
}

} // namespace MetMC
