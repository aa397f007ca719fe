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
#ifndef APPLICATIONRUNNER_H
#define APPLICATIONRUNNER_H

// standard library imports
#include <exception>

// related third party imports
#include <QtCore>

// local application imports
#include "system/processorconfiguration.h"


namespace MetMC
{

/**
  Exit codes of the processor executables.
  */
enum MExitCode
{
    EXITCODE_SUCCESS             = 0,
    EXITCODE_CONFIGURATION_ERROR = 128,
    EXITCODE_INTERRUPTED         = 130,
    EXITCODE_MEMORY_ERROR        = 131,
    EXITCODE_IO_ERROR            = 132,
    EXITCODE_COMPUTATION_ERROR   = 133,
    EXITCODE_UNSPECIFIC_ERROR    = 255
};


/**
  @brief MApplicationRunner implements the main function of the scatter and
  collect executables: it parses the command line, configures logging,
  installs the signal handlers, runs the processor and maps errors to exit
  codes.
  */
class MApplicationRunner
{
public:
    explicit MApplicationRunner(MProcessorOperation operation);

    /**
      Runs the processor with the command line @p arguments (the first
      argument is the program name) and returns the exit code.
     */
    int run(const QStringList &arguments);

    /**
      Returns the exit code reported for error @p e.
     */
    static int exitCodeFor(const std::exception &e);

    /**
      Configures log4cplus from the properties file @p configFile. If the
      file is empty or does not exist, all messages are written to stderr.
      The level of the application logger is set to @p logLevel (debug,
      info, warning, error or off).
     */
    static void initializeLogging(const QString &configFile,
                                  const QString &logLevel);

    /**
      Installs handlers for SIGINT and SIGTERM that request the interruption
      of the running task graph. A second signal terminates the process
      immediately.
     */
    static void installSignalHandlers();

private:
    void logBanner() const;

    MProcessorOperation operation;
};

} // namespace MetMC

#endif // APPLICATIONRUNNER_H
