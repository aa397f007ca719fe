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
#include "sourcetypeschema.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

/******************************************************************************
***                        MScatterVariableSchema                           ***
*******************************************************************************/

MScatterVariableSchema::MScatterVariableSchema()
    : distribution(NORMAL_DISTRIBUTION),
      uncertaintySource(UNCERTAINTY_CONSTANT),
      uncertaintyConstant(0.),
      coverage(1.),
      relative(false),
      hasClipMin(false),
      clipMin(0.),
      hasClipMax(false),
      clipMax(0.)
{
}


QStringList MScatterVariableSchema::inputVariables() const
{
    switch (uncertaintySource)
    {
    case UNCERTAINTY_VARIABLE:
        return QStringList() << uncertaintyVariable;
    case UNCERTAINTY_BIAS_RMSD:
        return QStringList() << biasVariable << rmsdVariable;
    case TOTAL_PERTURBATION:
        return totalVariables;
    default:
        return QStringList();
    }
}


/******************************************************************************
***                        MCollectVariableSchema                           ***
*******************************************************************************/

MCollectVariableSchema::MCollectVariableSchema()
    : filter(false)
{
}


/******************************************************************************
***                          MSourceTypeSchema                              ***
*******************************************************************************/

MSourceTypeSchema::MSourceTypeSchema()
{
}


MSourceTypeSchema::MSourceTypeSchema(const QString &tag)
    : tag(tag)
{
}


const MScatterVariableSchema *MSourceTypeSchema::findScatterVariable(
        const QString &variableName) const
{
    for (int i = 0; i < scatterVariables.size(); i++)
    {
        if (scatterVariables[i].name == variableName)
            return &scatterVariables[i];
    }
    return nullptr;
}


const MCollectVariableSchema *MSourceTypeSchema::findCollectVariable(
        const QString &variableName) const
{
    for (int i = 0; i < collectVariables.size(); i++)
    {
        if (collectVariables[i].name == variableName)
            return &collectVariables[i];
    }
    return nullptr;
}


void MSourceTypeSchema::addScatterVariable(
        const MScatterVariableSchema &variable)
{
    if (findScatterVariable(variable.name))
    {
        throw MConfigurationError(
                    QString("source type '%1' defines scatter variable '%2' "
                            "more than once").arg(tag).arg(variable.name)
                    .toStdString(), __FILE__, __LINE__);
    }
    scatterVariables.append(variable);
}


void MSourceTypeSchema::addCollectVariable(
        const MCollectVariableSchema &variable)
{
    if (findCollectVariable(variable.name))
    {
        throw MConfigurationError(
                    QString("source type '%1' defines collect variable '%2' "
                            "more than once").arg(tag).arg(variable.name)
                    .toStdString(), __FILE__, __LINE__);
    }
    collectVariables.append(variable);
}


/******************************************************************************
***                         MSourceTypeRegistry                             ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MSourceTypeRegistry::MSourceTypeRegistry()
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MSourceTypeRegistry::loadFromFile(const QString &filename)
{
    LOG4CPLUS_DEBUG(mlog, "Loading source type schemas from file "
                    << filename.toStdString() << "...");

    if ( !QFile::exists(filename) )
    {
        QString errMsg = QString(
                    "Cannot open file %1: file does not exist.").arg(filename);
        LOG4CPLUS_ERROR(mlog, errMsg.toStdString());
        throw MConfigurationError(errMsg.toStdString(), __FILE__, __LINE__);
    }

    QSettings config(filename, QSettings::IniFormat);
    if (config.status() != QSettings::NoError)
    {
        QString errMsg = QString(
                    "Cannot parse source type file %1.").arg(filename);
        LOG4CPLUS_ERROR(mlog, errMsg.toStdString());
        throw MConfigurationError(errMsg.toStdString(), __FILE__, __LINE__);
    }

    foreach (QString tag, config.childGroups())
    {
        MSourceTypeSchema schema(tag);
        config.beginGroup(tag);

        int size = config.beginReadArray("scatter");
        for (int i = 0; i < size; i++)
        {
            config.setArrayIndex(i);
            schema.addScatterVariable(readScatterVariable(&config, tag));
        }
        config.endArray();

        size = config.beginReadArray("collect");
        for (int i = 0; i < size; i++)
        {
            config.setArrayIndex(i);
            schema.addCollectVariable(readCollectVariable(&config, tag));
        }
        config.endArray();

        config.endGroup();

        registerSchema(schema);

        LOG4CPLUS_DEBUG(mlog, "  source type " << tag.toStdString() << ": "
                        << schema.getScatterVariables().size()
                        << " scatter variables, "
                        << schema.getCollectVariables().size()
                        << " collect variables");
    }
}


void MSourceTypeRegistry::registerSchema(const MSourceTypeSchema &schema)
{
    // Sums of perturbations may only refer to directly perturbed variables.
    foreach (const MScatterVariableSchema &variable,
             schema.getScatterVariables())
    {
        if (variable.uncertaintySource
                != MScatterVariableSchema::TOTAL_PERTURBATION) continue;

        foreach (QString ref, variable.totalVariables)
        {
            const MScatterVariableSchema *refVariable =
                    schema.findScatterVariable(ref);
            if (refVariable == nullptr || refVariable->uncertaintySource
                    == MScatterVariableSchema::TOTAL_PERTURBATION)
            {
                throw MConfigurationError(
                            QString("source type '%1': variable '%2' sums up "
                                    "the perturbation of '%3', which is not a "
                                    "directly perturbed variable")
                            .arg(schema.getTag()).arg(variable.name).arg(ref)
                            .toStdString(), __FILE__, __LINE__);
            }
        }
    }

    schemas.insert(schema.getTag(), schema);
}


QStringList MSourceTypeRegistry::getSourceTypes() const
{
    return schemas.keys();
}


bool MSourceTypeRegistry::contains(const QString &tag) const
{
    return schemas.contains(tag);
}


MSourceTypeSchema MSourceTypeRegistry::resolve(const QString &tag) const
{
    if ( !schemas.contains(tag) )
    {
        QString errMsg = QString("unknown source type '%1', available source "
                                 "types are: %2")
                .arg(tag).arg(getSourceTypes().join(", "));
        LOG4CPLUS_ERROR(mlog, errMsg.toStdString());
        throw MConfigurationError(errMsg.toStdString(), __FILE__, __LINE__);
    }
    return schemas.value(tag);
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

MScatterVariableSchema MSourceTypeRegistry::readScatterVariable(
        QSettings *config, const QString &tag)
{
    MScatterVariableSchema variable;
    variable.name = config->value("name").toString();

    if (variable.name.isEmpty())
    {
        throw MConfigurationError(
                    QString("source type '%1': scatter variable without name")
                    .arg(tag).toStdString(), __FILE__, __LINE__);
    }

    QString context = QString("source type '%1', scatter variable '%2'")
            .arg(tag).arg(variable.name);

    if (config->contains("total"))
    {
        variable.uncertaintySource = MScatterVariableSchema::TOTAL_PERTURBATION;
        variable.totalVariables = parseStringList(
                config->value("total").toStringList().join(","));
        if (variable.totalVariables.isEmpty())
        {
            throw MConfigurationError((context + ": empty list of summed "
                                       "variables").toStdString(),
                                      __FILE__, __LINE__);
        }
    }
    else
    {
        QString distribution =
                config->value("distribution", "normal").toString();
        variable.distribution = stringToPerturbationDistribution(distribution);
        if (variable.distribution == INVALID_DISTRIBUTION)
        {
            throw MConfigurationError(
                        QString("%1: unknown distribution '%2'")
                        .arg(context).arg(distribution).toStdString(),
                        __FILE__, __LINE__);
        }

        if (config->contains("uncertainty"))
        {
            QString uncertainty = config->value("uncertainty").toString();
            bool isConstant = false;
            double constant = uncertainty.toDouble(&isConstant);
            if (isConstant)
            {
                variable.uncertaintySource =
                        MScatterVariableSchema::UNCERTAINTY_CONSTANT;
                variable.uncertaintyConstant = constant;
            }
            else
            {
                variable.uncertaintySource =
                        MScatterVariableSchema::UNCERTAINTY_VARIABLE;
                variable.uncertaintyVariable = uncertainty;
            }
        }
        else if (config->contains("bias") && config->contains("rmsd"))
        {
            variable.uncertaintySource =
                    MScatterVariableSchema::UNCERTAINTY_BIAS_RMSD;
            variable.biasVariable = config->value("bias").toString();
            variable.rmsdVariable = config->value("rmsd").toString();
        }
        else
        {
            throw MConfigurationError(
                        (context + ": neither an uncertainty nor bias and "
                         "rmsd are specified").toStdString(),
                        __FILE__, __LINE__);
        }

        bool ok = true;
        variable.coverage = config->value("coverage", 1.).toDouble(&ok);
        if (!ok || variable.coverage <= 0.)
        {
            throw MConfigurationError((context + ": invalid coverage factor")
                                      .toStdString(), __FILE__, __LINE__);
        }
        variable.relative = config->value("relative", false).toBool();
    }

    bool ok = true;
    if (config->contains("clipMin"))
    {
        variable.hasClipMin = true;
        variable.clipMin = config->value("clipMin").toDouble(&ok);
    }
    if (ok && config->contains("clipMax"))
    {
        variable.hasClipMax = true;
        variable.clipMax = config->value("clipMax").toDouble(&ok);
    }
    if (!ok || (variable.hasClipMin && variable.hasClipMax
                && variable.clipMin > variable.clipMax))
    {
        throw MConfigurationError((context + ": invalid clipping bounds")
                                  .toStdString(), __FILE__, __LINE__);
    }

    return variable;
}


MCollectVariableSchema MSourceTypeRegistry::readCollectVariable(
        QSettings *config, const QString &tag)
{
    MCollectVariableSchema variable;
    variable.name = config->value("name").toString();

    if (variable.name.isEmpty())
    {
        throw MConfigurationError(
                    QString("source type '%1': collect variable without name")
                    .arg(tag).toStdString(), __FILE__, __LINE__);
    }

    variable.uncertaintyName =
            config->value("uncertainty", variable.name + "_unc").toString();
    variable.filter = config->value("filter", false).toBool();
    variable.attributesToRemove = parseStringList(
            config->value("attrsPop").toStringList().join(","));

    // Attributes are given as "name=value" items.
    foreach (QString item, config->value("attrs").toStringList())
    {
        int separator = item.indexOf('=');
        if (separator <= 0)
        {
            throw MConfigurationError(
                        QString("source type '%1', collect variable '%2': "
                                "invalid attribute '%3'")
                        .arg(tag).arg(variable.name).arg(item).toStdString(),
                        __FILE__, __LINE__);
        }
        variable.attributesToAdd.append(
                    qMakePair(item.left(separator).trimmed(),
                              item.mid(separator + 1).trimmed()));
    }

    return variable;
}

} // namespace MetMC
