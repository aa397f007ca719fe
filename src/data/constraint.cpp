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
#include "constraint.h"

// standard library imports

// related third party imports

// local application imports
#include "system/sourcetypeschema.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                           MConstraintRule                               ***
*******************************************************************************/

MConstraintRule::MConstraintRule()
    : hasMin(false),
      min(0.),
      hasMax(false),
      max(0.)
{
}


MConstraintRule::MConstraintRule(bool hasMin, double min,
                                 bool hasMax, double max)
    : hasMin(hasMin),
      min(min),
      hasMax(hasMax),
      max(max)
{
}


/******************************************************************************
***                         MConstraintEvaluator                            ***
*******************************************************************************/

static QString ruleKey(const QString &sourceType, const QString &variableName)
{
    return sourceType + "/" + variableName;
}


MConstraintEvaluator::MConstraintEvaluator()
{
}


MConstraintEvaluator::MConstraintEvaluator(
        const MSourceTypeRegistry &registry)
{
    foreach (QString tag, registry.getSourceTypes())
    {
        MSourceTypeSchema schema = registry.resolve(tag);
        foreach (const MScatterVariableSchema &variable,
                 schema.getScatterVariables())
        {
            if (!variable.hasClipMin && !variable.hasClipMax) continue;

            setRule(tag, variable.name,
                    MConstraintRule(variable.hasClipMin, variable.clipMin,
                                    variable.hasClipMax, variable.clipMax));
        }
    }
}


void MConstraintEvaluator::setRule(const QString &sourceType,
                                   const QString &variableName,
                                   const MConstraintRule &rule)
{
    rules.insert(ruleKey(sourceType, variableName), rule);
}


MConstraintRule MConstraintEvaluator::rule(const QString &sourceType,
                                           const QString &variableName) const
{
    return rules.value(ruleKey(sourceType, variableName), MConstraintRule());
}


double MConstraintEvaluator::apply(const QString &sourceType,
                                   const QString &variableName,
                                   double nominal, double perturbed) const
{
    return rule(sourceType, variableName).apply(nominal, perturbed);
}

} // namespace MetMC
