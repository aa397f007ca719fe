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
#include "perturbation.h"

// standard library imports
#include <cmath>
#include <limits>

// related third party imports

// local application imports

using namespace std;

namespace MetMC
{

MPerturbationDistribution stringToPerturbationDistribution(
        const QString &name)
{
    QString s = name.trimmed().toLower();
    if (s == "normal") return NORMAL_DISTRIBUTION;
    else if (s == "lognormal") return LOGNORMAL_DISTRIBUTION;
    else if (s == "chlorophyll") return CHLOROPHYLL_DISTRIBUTION;
    else return INVALID_DISTRIBUTION;
}


QString perturbationDistributionToString(
        MPerturbationDistribution distribution)
{
    switch (distribution)
    {
    case NORMAL_DISTRIBUTION:
        return "normal";
    case LOGNORMAL_DISTRIBUTION:
        return "lognormal";
    case CHLOROPHYLL_DISTRIBUTION:
        return "chlorophyll";
    default:
        return "invalid";
    }
}


double standardUncertainty(double x, double u, double coverage, bool relative)
{
    if (coverage != 1.) u /= coverage;
    if (relative) u *= x;
    return u;
}


double uncertaintyFromBiasAndRMSD(double bias, double rmsd)
{
    double v = rmsd * rmsd - bias * bias;
    if (v < 0.) return numeric_limits<double>::quiet_NaN();
    return sqrt(v);
}


double perturbValue(MPerturbationDistribution distribution,
                    double x, double u, double z)
{
    switch (distribution)
    {
    case NORMAL_DISTRIBUTION:
        return x + u * z;

    case CHLOROPHYLL_DISTRIBUTION:
        // Convert the log10 uncertainty into a linear one.
        u = x * sqrt(exp(pow(log(10.) * u, 2)) - 1.);
        // fall through
    case LOGNORMAL_DISTRIBUTION:
    {
        // Mean and variance of the underlying normal distribution are chosen
        // such that the log-normal distribution has mean x and standard
        // deviation u.
        double v = log(1. + pow(u / x, 2));
        double m = log(x) - 0.5 * v;
        return exp(m + sqrt(v) * z);
    }

    default:
        return x;
    }
}

} // namespace MetMC
