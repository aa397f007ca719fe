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
#ifndef PERTURBATION_H
#define PERTURBATION_H

// standard library imports

// related third party imports
#include <QString>

// local application imports


namespace MetMC
{

/**
  Shape of the measurement error distribution of a variable.
  */
enum MPerturbationDistribution
{
    INVALID_DISTRIBUTION     = 0,
    NORMAL_DISTRIBUTION      = 1,
    LOGNORMAL_DISTRIBUTION   = 2,
    // Log-normal errors of ocean colour chlorophyll, the uncertainty is
    // given in log10 units.
    CHLOROPHYLL_DISTRIBUTION = 3
};

MPerturbationDistribution stringToPerturbationDistribution(
        const QString &name);

QString perturbationDistributionToString(
        MPerturbationDistribution distribution);


/**
  Returns the standard uncertainty obtained from an expanded uncertainty
  @p u with coverage factor @p coverage. If @p relative is true, @p u is
  relative to the nominal value @p x.
  */
double standardUncertainty(double x, double u, double coverage, bool relative);

/**
  Returns the standard uncertainty obtained from a bias and a root mean
  square difference, sqrt(rmsd^2 - bias^2). Returns NaN if the bias exceeds
  the rmsd.
  */
double uncertaintyFromBiasAndRMSD(double bias, double rmsd);

/**
  Perturbs the nominal value @p x with standard uncertainty @p u using the
  standard normal deviate @p z. The result is not constrained; it may be
  non-finite (e.g. for non-positive @p x with log-normal distributions).
  */
double perturbValue(MPerturbationDistribution distribution,
                    double x, double u, double z);

} // namespace MetMC

#endif // PERTURBATION_H
