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
#include "processorconfiguration.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "data/datasetfile.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;

namespace MetMC
{

QString processorOperationToString(MProcessorOperation operation)
{
    return (operation == SCATTER_OPERATION) ? "scatter" : "collect";
}


MExecutionMode stringToExecutionMode(const QString &name)
{
    QString s = name.trimmed().toLower();
    if (s == "synchronous") return SYNCHRONOUS_MODE;
    else if (s == "multithreading") return MULTITHREADING_MODE;
    else return INVALID_MODE;
}


QString executionModeToString(MExecutionMode mode)
{
    switch (mode)
    {
    case SYNCHRONOUS_MODE:
        return "synchronous";
    case MULTITHREADING_MODE:
        return "multithreading";
    default:
        return "invalid";
    }
}


/******************************************************************************
***                       MProcessorConfiguration                           ***
*******************************************************************************/

MProcessorConfiguration::MProcessorConfiguration(
        MProcessorOperation operation)
    : operation(operation),
      selector(-1),
      antithetic(false),
      mode(MULTITHREADING_MODE),
      workers(0),
      memoryLimit_MB(4096),
      chunking(0, 0),
      schemaFile("config/sourcetypes.cfg"),
      filterFwhm(4.),
      showProgress(false),
      logLevel("info"),
      stackTraces(false)
{
}


void MProcessorConfiguration::loadFromFile(const QString &filename)
{
    LOG4CPLUS_DEBUG(mlog, "Loading processor configuration from file "
                    << filename.toStdString() << "...");

    if ( !QFile::exists(filename) )
    {
        QString errMsg = QString(
                    "Cannot open file %1: file does not exist.").arg(filename);
        LOG4CPLUS_ERROR(mlog, errMsg.toStdString());
        throw MConfigurationError(errMsg.toStdString(), __FILE__, __LINE__);
    }

    QSettings config(filename, QSettings::IniFormat);
    QDir configDir = QFileInfo(filename).absoluteDir();

    config.beginGroup("Reader");
    readerEngine = config.value("engine", readerEngine).toString();
    chunking.chunkSizeLat = config.value("chunkSizeLat",
                                         chunking.chunkSizeLat).toInt();
    chunking.chunkSizeLon = config.value("chunkSizeLon",
                                         chunking.chunkSizeLon).toInt();
    config.endGroup();

    config.beginGroup("Writer");
    writerEngine = config.value("engine", writerEngine).toString();
    writerSettings.deflateLevel = config.value(
                "deflateLevel", writerSettings.deflateLevel).toInt();
    writerSettings.shuffle = config.value(
                "shuffle", writerSettings.shuffle).toBool();
    config.endGroup();

    config.beginGroup("Processing");
    if (config.contains("mode"))
        mode = stringToExecutionMode(config.value("mode").toString());
    workers = config.value("workers", workers).toInt();
    memoryLimit_MB = config.value("memoryLimit_MB", memoryLimit_MB).toInt();
    showProgress = config.value("progress", showProgress).toBool();
    config.endGroup();

    config.beginGroup("SourceTypes");
    if (config.contains("schemaFile"))
    {
        QString path = expandEnvironmentVariables(
                    config.value("schemaFile").toString());
        schemaFile = QDir::cleanPath(configDir.absoluteFilePath(path));
    }
    config.endGroup();

    config.beginGroup("Collect");
    filterFwhm = config.value("filterFwhm", filterFwhm).toDouble();
    config.endGroup();

    config.beginGroup("Logging");
    logLevel = config.value("level", logLevel).toString();
    stackTraces = config.value("stackTraces", stackTraces).toBool();
    if (config.contains("config"))
    {
        QString path = expandEnvironmentVariables(
                    config.value("config").toString());
        logConfigFile = QDir::cleanPath(configDir.absoluteFilePath(path));
    }
    config.endGroup();
}


void MProcessorConfiguration::validate() const
{
    QStringList errors;

    if (sourcePath.isEmpty())
        errors << "no source dataset specified";
    if (targetPath.isEmpty())
        errors << "no target dataset specified";
    if (sourceType.isEmpty())
        errors << "no source type specified";

    if (operation == SCATTER_OPERATION && selector < 0)
        errors << QString("invalid selector %1, selectors must be "
                          "non-negative").arg(selector);

    if (!readerEngine.isEmpty()
            && stringToDatasetEngine(readerEngine) == INVALID_ENGINE)
        errors << QString("unknown reader engine '%1'").arg(readerEngine);
    if (!writerEngine.isEmpty()
            && stringToDatasetEngine(writerEngine) == INVALID_ENGINE)
        errors << QString("unknown writer engine '%1'").arg(writerEngine);

    if (mode == INVALID_MODE)
        errors << "unknown execution mode";
    if (workers < 0 || workers > METMC_MAX_WORKERS)
        errors << QString("invalid number of workers %1 (1..%2)")
                  .arg(workers).arg(METMC_MAX_WORKERS);
    if (memoryLimit_MB <= 0 || memoryLimit_MB > METMC_MAX_MEMORY_LIMIT_MB)
        errors << QString("invalid memory limit %1 MB (1..%2)")
                  .arg(memoryLimit_MB).arg(METMC_MAX_MEMORY_LIMIT_MB);

    if (chunking.chunkSizeLat < -1)
        errors << QString("invalid latitudinal chunk size %1")
                  .arg(chunking.chunkSizeLat);
    if (chunking.chunkSizeLon < -1)
        errors << QString("invalid longitudinal chunk size %1")
                  .arg(chunking.chunkSizeLon);

    if (writerSettings.deflateLevel < 0 || writerSettings.deflateLevel > 9)
        errors << QString("invalid deflate level %1 (0..9)")
                  .arg(writerSettings.deflateLevel);

    if (operation == COLLECT_OPERATION && !(filterFwhm > 0.))
        errors << QString("invalid filter width %1").arg(filterFwhm);

    QStringList logLevels;
    logLevels << "debug" << "info" << "warning" << "error" << "off";
    if (!logLevels.contains(logLevel.toLower()))
        errors << QString("invalid log level '%1'").arg(logLevel);

    if (!errors.isEmpty())
    {
        throw MConfigurationError(errors.join("; ").toStdString(),
                                  __FILE__, __LINE__);
    }
}


int MProcessorConfiguration::effectiveNumWorkers() const
{
    if (mode == SYNCHRONOUS_MODE) return 1;
    if (workers > 0) return workers;
    return qMax(1, QThread::idealThreadCount());
}


void MProcessorConfiguration::log() const
{
    LOG4CPLUS_DEBUG(mlog, "processor configuration:");
    LOG4CPLUS_DEBUG(mlog, "  operation     = "
                    << processorOperationToString(operation).toStdString());
    LOG4CPLUS_DEBUG(mlog, "  source        = " << sourcePath.toStdString());
    LOG4CPLUS_DEBUG(mlog, "  target        = " << targetPath.toStdString());
    LOG4CPLUS_DEBUG(mlog, "  source type   = " << sourceType.toStdString());
    if (operation == SCATTER_OPERATION)
    {
        LOG4CPLUS_DEBUG(mlog, "  selector      = " << selector);
        LOG4CPLUS_DEBUG(mlog, "  antithetic    = " << antithetic);
    }
    else
    {
        LOG4CPLUS_DEBUG(mlog, "  filter fwhm   = " << filterFwhm);
    }
    LOG4CPLUS_DEBUG(mlog, "  engines       = "
                    << (readerEngine.isEmpty() ? "auto" :
                        readerEngine.toStdString()) << " / "
                    << (writerEngine.isEmpty() ? "auto" :
                        writerEngine.toStdString()));
    LOG4CPLUS_DEBUG(mlog, "  mode          = "
                    << executionModeToString(mode).toStdString()
                    << " (" << effectiveNumWorkers() << " workers)");
    LOG4CPLUS_DEBUG(mlog, "  chunking      = " << chunking.chunkSizeLat
                    << " x " << chunking.chunkSizeLon);
    LOG4CPLUS_DEBUG(mlog, "  schema file   = " << schemaFile.toStdString());
}


/******************************************************************************
***                        MProcessorCommandLine                            ***
*******************************************************************************/
/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MProcessorCommandLine::MProcessorCommandLine(MProcessorOperation operation)
    : operation(operation),
      helpOption(QStringList() << "h" << "help",
                 "Displays this help."),
      versionOption(QStringList() << "v" << "version",
                    "Displays version information."),
      sourceTypeOption("source-type",
                       "The source type of the source dataset(s).", "type"),
      selectorOption("selector",
                     "The selector of the simulated member (0 copies the "
                     "source dataset).", "selector"),
      antitheticOption("antithetic",
                       "Use antithetic pairs of random numbers."),
      engineReaderOption("engine-reader",
                         "The engine used to read the source dataset(s) "
                         "(h5netcdf, netcdf4, zarr).", "engine"),
      engineWriterOption("engine-writer",
                         "The engine used to write the target dataset "
                         "(h5netcdf, netcdf4, zarr).", "engine"),
      modeOption("mode",
                 "The operating mode (multithreading, synchronous).", "mode"),
      workersOption("workers",
                    "The number of workers in multithreading mode "
                    "(default: number of logical processors).", "workers"),
      chunkSizeLatOption("chunk-size-lat",
                         "The chunk size along the latitudinal dimension "
                         "(-1: full dimension, 0: chunk size of the source "
                         "dataset).", "size"),
      chunkSizeLonOption("chunk-size-lon",
                         "The chunk size along the longitudinal dimension "
                         "(-1: full dimension, 0: chunk size of the source "
                         "dataset).", "size"),
      filterFwhmOption("filter-fwhm",
                       "Full width at half maximum of the uncertainty "
                       "filter (grid points).", "fwhm"),
      progressOption("progress", "Enable progress reports."),
      noProgressOption("no-progress", "Disable progress reports."),
      stackTracesOption("stack-traces",
                        "Report the source location of errors."),
      noStackTracesOption("no-stack-traces",
                          "Do not report the source location of errors."),
      logLevelOption("log-level",
                     "The log level (debug, info, warning, error, off).",
                     "level"),
      configOption("config", "The processor configuration file.", "file"),
      logConfigOption("log-config", "The log4cplus configuration file.",
                      "file"),
      helpRequested(false),
      versionRequested(false)
{
    parser.setApplicationDescription(
                (operation == SCATTER_OPERATION)
                ? "Simulates measurement errors of a gridded dataset."
                : "Computes the standard uncertainty of an ensemble of "
                  "simulated datasets.");

    parser.addPositionalArgument(
                (operation == SCATTER_OPERATION) ? "source_file"
                                                 : "source_glob",
                (operation == SCATTER_OPERATION)
                ? "The path of the source dataset."
                : "The glob pattern of the ensemble member datasets; the "
                  "first match is the nominal dataset.");
    parser.addPositionalArgument("target_file",
                                 "The path of the target dataset.");

    parser.addOption(helpOption);
    parser.addOption(versionOption);
    parser.addOption(sourceTypeOption);
    if (operation == SCATTER_OPERATION)
    {
        parser.addOption(selectorOption);
        parser.addOption(antitheticOption);
    }
    else
    {
        parser.addOption(filterFwhmOption);
    }
    parser.addOption(engineReaderOption);
    parser.addOption(engineWriterOption);
    parser.addOption(modeOption);
    parser.addOption(workersOption);
    parser.addOption(chunkSizeLatOption);
    parser.addOption(chunkSizeLonOption);
    parser.addOption(progressOption);
    parser.addOption(noProgressOption);
    parser.addOption(stackTracesOption);
    parser.addOption(noStackTracesOption);
    parser.addOption(logLevelOption);
    parser.addOption(configOption);
    parser.addOption(logConfigOption);
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

MProcessorConfiguration MProcessorCommandLine::parse(
        const QStringList &arguments)
{
    if (!parser.parse(arguments))
    {
        throw MConfigurationError("argument error: "
                                  + parser.errorText().toStdString(),
                                  __FILE__, __LINE__);
    }

    MProcessorConfiguration config(operation);

    helpRequested = parser.isSet(helpOption);
    versionRequested = parser.isSet(versionOption);
    if (helpRequested || versionRequested) return config;

    // Defaults from the configuration file.
    QString configFile = parser.isSet(configOption)
            ? expandEnvironmentVariables(parser.value(configOption))
            : defaultConfigFile();
    if (!configFile.isEmpty()) config.loadFromFile(configFile);

    QStringList positional = parser.positionalArguments();
    if (positional.size() != 2)
    {
        throw MConfigurationError(
                    QString("argument error: expected 2 positional "
                            "arguments, got %1").arg(positional.size())
                    .toStdString(), __FILE__, __LINE__);
    }
    config.sourcePath = positional[0];
    config.targetPath = positional[1];

    if (parser.isSet(sourceTypeOption))
        config.sourceType = parser.value(sourceTypeOption);

    if (operation == SCATTER_OPERATION)
    {
        if (!parser.isSet(selectorOption))
        {
            throw MConfigurationError("argument error: the option "
                                      "--selector is required",
                                      __FILE__, __LINE__);
        }
        config.selector = intValue(selectorOption, 0);
        config.antithetic = parser.isSet(antitheticOption);
    }
    else if (parser.isSet(filterFwhmOption))
    {
        bool ok = false;
        config.filterFwhm = parser.value(filterFwhmOption).toDouble(&ok);
        if (!ok || !(config.filterFwhm > 0.))
        {
            throw MConfigurationError("argument error: invalid value for "
                                      "--filter-fwhm",
                                      __FILE__, __LINE__);
        }
    }

    if (parser.isSet(engineReaderOption))
        config.readerEngine = parser.value(engineReaderOption);
    if (parser.isSet(engineWriterOption))
        config.writerEngine = parser.value(engineWriterOption);
    if (parser.isSet(modeOption))
        config.mode = stringToExecutionMode(parser.value(modeOption));
    if (parser.isSet(workersOption))
        config.workers = intValue(workersOption, 1);
    if (parser.isSet(chunkSizeLatOption))
        config.chunking.chunkSizeLat = intValue(chunkSizeLatOption, -1);
    if (parser.isSet(chunkSizeLonOption))
        config.chunking.chunkSizeLon = intValue(chunkSizeLonOption, -1);
    if (parser.isSet(progressOption)) config.showProgress = true;
    if (parser.isSet(noProgressOption)) config.showProgress = false;
    if (parser.isSet(stackTracesOption)) config.stackTraces = true;
    if (parser.isSet(noStackTracesOption)) config.stackTraces = false;
    if (parser.isSet(logLevelOption))
        config.logLevel = parser.value(logLevelOption);
    if (parser.isSet(logConfigOption))
        config.logConfigFile = expandEnvironmentVariables(
                    parser.value(logConfigOption));

    return config;
}


QString MProcessorCommandLine::defaultConfigFile()
{
    QString metmcHome = QProcessEnvironment::systemEnvironment().value(
                "METMC_HOME");
    if (!metmcHome.isEmpty())
    {
        QString filename = QDir(metmcHome).filePath("config/metmc.cfg");
        if (QFile::exists(filename)) return filename;
    }
    if (QFile::exists("config/metmc.cfg")) return "config/metmc.cfg";
    return QString();
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

int MProcessorCommandLine::intValue(const QCommandLineOption &option,
                                    int minValue) const
{
    bool ok = false;
    int value = parser.value(option).toInt(&ok);
    if (!ok || value < minValue)
    {
        throw MConfigurationError(
                    QString("argument error: invalid value '%1' for --%2")
                    .arg(parser.value(option)).arg(option.names().last())
                    .toStdString(), __FILE__, __LINE__);
    }
    return value;
}

} // namespace MetMC
