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
#ifndef PROCESSORCONFIGURATION_H
#define PROCESSORCONFIGURATION_H

// standard library imports

// related third party imports
#include <QtCore>
#include <QCommandLineParser>

// local application imports
#include "data/chunklayout.h"
#include "data/griddatasetwriter.h"


namespace MetMC
{

enum MProcessorOperation
{
    SCATTER_OPERATION = 0,
    COLLECT_OPERATION = 1
};

QString processorOperationToString(MProcessorOperation operation);


enum MExecutionMode
{
    INVALID_MODE        = 0,
    // Tasks are executed in the calling thread.
    SYNCHRONOUS_MODE    = 1,
    // Tasks are executed by a pool of worker threads.
    MULTITHREADING_MODE = 2
};

MExecutionMode stringToExecutionMode(const QString &name);

QString executionModeToString(MExecutionMode mode);


/**
  @brief MProcessorConfiguration contains all settings of a single scatter
  or collect invocation. The configuration is assembled from the processor
  configuration file and the command line (see @ref MProcessorCommandLine)
  and passed to the processor; there is no global configuration state.
  */
struct MProcessorConfiguration
{
    explicit MProcessorConfiguration(
            MProcessorOperation operation = SCATTER_OPERATION);

    /**
      Reads the default settings from the INI file @p filename. Keys missing
      in the file keep their current values. Relative paths in the file are
      resolved against the directory of the file. Throws an @ref
      MConfigurationError if the file does not exist.
     */
    void loadFromFile(const QString &filename);

    /**
      Checks all settings. Throws an @ref MConfigurationError describing the
      first invalid setting.
     */
    void validate() const;

    /**
      Number of worker threads to be used (1 in synchronous mode).
     */
    int effectiveNumWorkers() const;

    /**
      Writes the configuration to the log (debug level).
     */
    void log() const;

    MProcessorOperation operation;

    // Source dataset (scatter) or glob of ensemble members (collect).
    QString sourcePath;
    QString targetPath;
    QString sourceType;

    int selector;
    bool antithetic;

    // Engine names, empty to derive the engine from the path.
    QString readerEngine;
    QString writerEngine;

    MExecutionMode mode;
    // Number of worker threads in multithreading mode, 0 for the number of
    // logical processors.
    int workers;
    int memoryLimit_MB;

    MChunkingScheme chunking;
    MWriterSettings writerSettings;

    QString schemaFile;
    double filterFwhm;
    bool showProgress;

    QString logLevel;
    QString logConfigFile;
    // Log the source location of errors at error level.
    bool stackTraces;
};


/**
  @brief MProcessorCommandLine parses the command line of the scatter and
  collect executables:

  @code
  metmc-scatter SOURCE_FILE TARGET_FILE --source-type T --selector S
                [--antithetic] [options]
  metmc-collect SOURCE_GLOB TARGET_FILE --source-type T [--filter-fwhm F]
                [options]
  @endcode

  Settings are taken from the processor configuration file (option
  --config, default config/metmc.cfg if present) and overridden by the
  command line options.
  */
class MProcessorCommandLine
{
public:
    explicit MProcessorCommandLine(MProcessorOperation operation);

    /**
      Parses @p arguments (the first argument is the program name) and
      returns the resulting configuration. Throws an @ref
      MConfigurationError if the arguments cannot be parsed.
     */
    MProcessorConfiguration parse(const QStringList &arguments);

    bool isHelpRequested() const { return helpRequested; }

    bool isVersionRequested() const { return versionRequested; }

    QString helpText() const { return parser.helpText(); }

    /**
      Returns the configuration file used if --config is not given, or an
      empty string.
     */
    static QString defaultConfigFile();

private:
    int intValue(const QCommandLineOption &option, int minValue) const;

    MProcessorOperation operation;
    QCommandLineParser parser;

    QCommandLineOption helpOption;
    QCommandLineOption versionOption;
    QCommandLineOption sourceTypeOption;
    QCommandLineOption selectorOption;
    QCommandLineOption antitheticOption;
    QCommandLineOption engineReaderOption;
    QCommandLineOption engineWriterOption;
    QCommandLineOption modeOption;
    QCommandLineOption workersOption;
    QCommandLineOption chunkSizeLatOption;
    QCommandLineOption chunkSizeLonOption;
    QCommandLineOption filterFwhmOption;
    QCommandLineOption progressOption;
    QCommandLineOption noProgressOption;
    QCommandLineOption stackTracesOption;
    QCommandLineOption noStackTracesOption;
    QCommandLineOption logLevelOption;
    QCommandLineOption configOption;
    QCommandLineOption logConfigOption;

    bool helpRequested;
    bool versionRequested;
};

} // namespace MetMC

#endif // PROCESSORCONFIGURATION_H
