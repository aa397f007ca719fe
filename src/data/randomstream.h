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
#ifndef RANDOMSTREAM_H
#define RANDOMSTREAM_H

// standard library imports
#include <random>
#include <vector>

// related third party imports
#include <QtCore>
#include <QUuid>

// local application imports


namespace MetMC
{

/**
  @brief MRandomStream is a restartable sequence of pseudo-random numbers for
  a single chunk of a single variable. The sequence only depends on the seed
  words passed to the constructor.

  A mirrored stream returns 1 - u instead of the uniform deviate u and -z
  instead of the standard normal deviate z of the stream with the same seed.
  */
class MRandomStream
{
public:
    MRandomStream(const std::vector<quint32> &seedWords, bool mirrored);

    /**
      Returns the next uniform deviate in the open interval (0, 1).
     */
    double nextUniform();

    /**
      Returns the next standard normal deviate. Normal deviates are obtained
      by inversion of the normal cumulative distribution function, so each
      normal deviate consumes exactly one uniform deviate.
     */
    double nextNormal();

    /**
      Fills @p values with @p n standard normal deviates.
     */
    void fillNormal(float *values, size_t n);

    /**
      Restarts the stream at its first deviate.
     */
    void restart();

    bool isMirrored() const { return mirrored; }

    const std::vector<quint32>& getSeedWords() const { return seedWords; }

private:
    double nextRawUniform();

    std::vector<quint32> seedWords;
    bool mirrored;
    std::mt19937_64 engine;
};


/**
  @brief MStreamGenerator derives the random streams of the chunks of a
  variable from a selector, the identity of the variable and the chunk
  coordinates.

  The derivation is a pure function of its arguments: identical arguments
  yield identical streams, independent of the order in which chunks are
  processed and of the number of threads.
  */
class MStreamGenerator
{
public:
    /**
      Creates a generator for the ensemble member @p selector. In antithetic
      mode the members 2k-1 and 2k share the base index k; the even member
      uses the mirrored stream.

      Throws an @ref MConfigurationError if @p selector is negative.
     */
    MStreamGenerator(const QUuid &variableId, int selector, bool antithetic);

    /**
      Returns the identity of variable @p variableName of a source file with
      base name @p sourceFileStem: a name-based (version 5) UUID of
      "<variableName>-<sourceFileStem>" in the URL namespace.
     */
    static QUuid variableIdentity(const QString &variableName,
                                  const QString &sourceFileStem);

    /**
      Returns the stream of the chunk at @p chunkCoordinates for this
      generator's member.
     */
    MRandomStream stream(const QVector<int> &chunkCoordinates) const;

    /**
      Returns the root seed words of this generator's member (the words of
      the variable identity followed by the stream index).
     */
    std::vector<quint32> rootSeed() const;

    int getSelector() const { return selector; }

    bool isAntithetic() const { return antithetic; }

    /**
      Index of the stream pair used by the member (the selector if not in
      antithetic mode).
     */
    int streamIndex() const;

    /**
      True if the member uses the mirrored stream of its pair.
     */
    bool usesMirroredStream() const;

    /**
      Derives the stream of chunk @p chunkCoordinates of variable
      @p variableId for stream index @p selector.
     */
    static MRandomStream derive(int selector, const QUuid &variableId,
                                const QVector<int> &chunkCoordinates);

    /**
      Derives the pair of streams of chunk @p chunkCoordinates. The second
      stream is the mirror of the first.
     */
    static QPair<MRandomStream, MRandomStream> derivePair(
            int selector, const QUuid &variableId,
            const QVector<int> &chunkCoordinates);

private:
    static std::vector<quint32> seedWords(
            int selector, const QUuid &variableId,
            const QVector<int> &chunkCoordinates);

    QUuid variableId;
    int selector;
    bool antithetic;
};

} // namespace MetMC

#endif // RANDOMSTREAM_H
