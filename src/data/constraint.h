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
#ifndef CONSTRAINT_H
#define CONSTRAINT_H

// standard library imports
#include <cmath>

// related third party imports
#include <QtCore>

// local application imports


namespace MetMC
{

class MSourceTypeRegistry;

/**
  @brief MConstraintRule clips perturbed values to the physical bounds of a
  variable. The default rule is the identity.
  */
struct MConstraintRule
{
    MConstraintRule();
    MConstraintRule(bool hasMin, double min, bool hasMax, double max);

    /**
      Returns the constrained value of the perturbed value @p perturbed.
      Non-finite values are replaced by the nominal value @p nominal.
     */
    inline double apply(double nominal, double perturbed) const
    {
        double y = perturbed;
        if (hasMin && y < min) y = min;
        if (hasMax && y > max) y = max;
        if (std::isfinite(y)) return y;
        return nominal;
    }

    bool isIdentity() const { return !hasMin && !hasMax; }

    bool hasMin;
    double min;
    bool hasMax;
    double max;
};


/**
  @brief MConstraintEvaluator resolves the constraint rule of a variable of a
  source type. The rules are fixed when the evaluator is constructed; all
  methods are const and may be called from multiple threads.
  */
class MConstraintEvaluator
{
public:
    MConstraintEvaluator();

    /**
      Collects the clipping bounds of all scatter variables in @p registry.
     */
    explicit MConstraintEvaluator(const MSourceTypeRegistry &registry);

    void setRule(const QString &sourceType, const QString &variableName,
                 const MConstraintRule &rule);

    /**
      Returns the rule of (@p sourceType, @p variableName), or the identity
      rule for unknown pairs.
     */
    MConstraintRule rule(const QString &sourceType,
                         const QString &variableName) const;

    double apply(const QString &sourceType, const QString &variableName,
                 double nominal, double perturbed) const;

private:
    QHash<QString, MConstraintRule> rules;
};

} // namespace MetMC

#endif // CONSTRAINT_H
