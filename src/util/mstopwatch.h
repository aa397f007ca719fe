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
#ifndef MSTOPWATCH_H
#define MSTOPWATCH_H

// standard library imports

// related third party imports
#include <QElapsedTimer>

namespace MetMC
{

/**
   @brief MStopwatch implements a stopwatch to measure the elapsed time at
   different points in a program.

   It is used to report the wall time spent in the processing stages of an
   engine run. Uses a monotonic clock (@ref QElapsedTimer) with nanosecond
   resolution.
 */
class MStopwatch
{
public:
    enum TimeUnits
    {
        MICROSECONDS = 0,
        MILLISECONDS = 1,
        SECONDS = 2
    };

    /**
     Constructs a new stopwatch and starts it. Time elapsed from the time the
     constructor was called can be obtained with a call to @ref split(),
     followed by a call to @ref getElapsedTime().
     */
    MStopwatch();

    /**
     Record the time of a split mark that can be queried with @ref
     getElapsedTime().
     */
    void split();

    /**
     Returns the time elapsed between the call to the constructor and the last
     call to @ref split().
     */
    double getElapsedTime(const TimeUnits units) const;

private:
    static double convert(qint64 nanoseconds, const TimeUnits units);

    QElapsedTimer timer;
    qint64 lastSplitTime;
};

} // namespace MetMC

#endif // MSTOPWATCH_H
