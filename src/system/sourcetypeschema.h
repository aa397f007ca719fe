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
#ifndef SOURCETYPESCHEMA_H
#define SOURCETYPESCHEMA_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports
#include "data/perturbation.h"


namespace MetMC
{

/**
  @brief Perturbation settings of a variable of a source type.
  */
struct MScatterVariableSchema
{
    MScatterVariableSchema();

    enum UncertaintySource
    {
        // Per-cell uncertainty read from another variable of the dataset.
        UNCERTAINTY_VARIABLE  = 0,
        // Uncertainty given by a constant.
        UNCERTAINTY_CONSTANT  = 1,
        // Uncertainty computed from bias and rmsd variables.
        UNCERTAINTY_BIAS_RMSD = 2,
        // The perturbations of other variables are summed up.
        TOTAL_PERTURBATION    = 3
    };

    /**
      Names of the variables whose nominal (or perturbed, for @ref
      TOTAL_PERTURBATION) values are required to perturb this variable.
     */
    QStringList inputVariables() const;

    QString name;
    MPerturbationDistribution distribution;
    UncertaintySource uncertaintySource;
    QString uncertaintyVariable;
    double uncertaintyConstant;
    QString biasVariable;
    QString rmsdVariable;
    QStringList totalVariables;
    double coverage;
    bool relative;
    bool hasClipMin;
    double clipMin;
    bool hasClipMax;
    double clipMax;
};


/**
  @brief Uncertainty outputs of a variable of a source type.
  */
struct MCollectVariableSchema
{
    MCollectVariableSchema();

    QString filteredUncertaintyName() const
    { return uncertaintyName + "_filtered"; }

    QString name;
    QString uncertaintyName;
    bool filter;
    QStringList attributesToRemove;
    QList< QPair<QString, QString> > attributesToAdd;
};


/**
  @brief MSourceTypeSchema lists the variables of a source type that are
  perturbed by scatter and reduced by collect.
  */
class MSourceTypeSchema
{
public:
    MSourceTypeSchema();
    explicit MSourceTypeSchema(const QString &tag);

    const QString& getTag() const { return tag; }

    const QList<MScatterVariableSchema>& getScatterVariables() const
    { return scatterVariables; }

    const QList<MCollectVariableSchema>& getCollectVariables() const
    { return collectVariables; }

    /**
      Returns the perturbation settings of @p variableName, or a @p nullptr
      if the variable is not perturbed.
     */
    const MScatterVariableSchema* findScatterVariable(
            const QString &variableName) const;

    const MCollectVariableSchema* findCollectVariable(
            const QString &variableName) const;

    void addScatterVariable(const MScatterVariableSchema &variable);

    void addCollectVariable(const MCollectVariableSchema &variable);

private:
    QString tag;
    QList<MScatterVariableSchema> scatterVariables;
    QList<MCollectVariableSchema> collectVariables;
};


/**
  @brief MSourceTypeRegistry holds the schemas of all known source types. The
  registry is loaded once from an INI file with one group per source type;
  each group contains the arrays "scatter" and "collect":

  @code
  [esa-cci-sst]
  scatter\size=1
  scatter\1\name=analysed_sst
  scatter\1\distribution=normal
  scatter\1\uncertainty=analysed_sst_uncertainty
  scatter\1\clipMin=271.35
  collect\size=1
  collect\1\name=analysed_sst
  collect\1\filter=true
  collect\1\attrsPop=valid_min, valid_max
  collect\1\attrs="long_name=standard uncertainty"
  @endcode
  */
class MSourceTypeRegistry
{
public:
    MSourceTypeRegistry();

    /**
      Loads all source types from @p filename. Throws an @ref
      MConfigurationError if the file does not exist or a schema is invalid.
     */
    void loadFromFile(const QString &filename);

    void registerSchema(const MSourceTypeSchema &schema);

    QStringList getSourceTypes() const;

    bool contains(const QString &tag) const;

    /**
      Returns the schema of source type @p tag. Throws an @ref
      MConfigurationError if the tag is unknown.
     */
    MSourceTypeSchema resolve(const QString &tag) const;

private:
    MScatterVariableSchema readScatterVariable(QSettings *config,
                                               const QString &tag);

    MCollectVariableSchema readCollectVariable(QSettings *config,
                                               const QString &tag);

    QMap<QString, MSourceTypeSchema> schemas;
};

} // namespace MetMC

#endif // SOURCETYPESCHEMA_H
