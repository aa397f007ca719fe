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
#include "applicationrunner.h"

// standard library imports
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <new>

// related third party imports
#include <log4cplus/configurator.h>
#include <log4cplus/helpers/property.h>
#include <log4cplus/loggingmacros.h>

// local application imports
#include "data/scheduler.h"
#include "processors/collectprocessor.h"
#include "processors/scatterprocessor.h"
#include "system/progresssink.h"
#include "system/sourcetypeschema.h"
#include "util/mutil.h"
#include "util/mexception.h"

using namespace std;


/******************************************************************************
***                          UTILITY FUNCTIONS                              ***
*******************************************************************************/

static volatile sig_atomic_t numSignalsReceived = 0;

extern "C" void metmcSignalHandler(int signal)
{
    numSignalsReceived = numSignalsReceived + 1;
    if (numSignalsReceived > 1) _Exit(MetMC::EXITCODE_INTERRUPTED);

    Q_UNUSED(signal);
    MetMC::MAbstractScheduler::requestInterruption();
}


namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MApplicationRunner::MApplicationRunner(MProcessorOperation operation)
    : operation(operation)
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

int MApplicationRunner::run(const QStringList &arguments)
{
    MProcessorCommandLine commandLine(operation);
    MProcessorConfiguration config(operation);

    try
    {
        config = commandLine.parse(arguments);
    }
    catch (MException &e)
    {
        initializeLogging(QString(), "info");
        LOG4CPLUS_ERROR(mlog, e.getComplaint());
        cerr << commandLine.helpText().toStdString();
        return exitCodeFor(e);
    }

    if (commandLine.isHelpRequested())
    {
        cout << commandLine.helpText().toStdString();
        return EXITCODE_SUCCESS;
    }
    if (commandLine.isVersionRequested())
    {
        cout << metmcSoftwareName.toStdString() << " "
             << metmcVersionString.toStdString() << endl;
        return EXITCODE_SUCCESS;
    }

    initializeLogging(config.logConfigFile, config.logLevel);
    logBanner();
    installSignalHandlers();

    try
    {
        config.validate();

        MSourceTypeRegistry registry;
        registry.loadFromFile(config.schemaFile);

        QScopedPointer<MAbstractScheduler> scheduler;
        if (config.mode == SYNCHRONOUS_MODE)
            scheduler.reset(new MSingleThreadScheduler());
        else
            scheduler.reset(new MMultiThreadScheduler(
                                config.effectiveNumWorkers()));

        QScopedPointer<MProgressSink> progressSink;
        if (config.showProgress) progressSink.reset(new MLoggingProgressSink());

        QScopedPointer<MAbstractProcessor> processor;
        if (operation == SCATTER_OPERATION)
            processor.reset(new MScatterProcessor(config, registry,
                                                  scheduler.data()));
        else
            processor.reset(new MCollectProcessor(config, registry,
                                                  scheduler.data()));

        processor->setProgressSink(progressSink.data());
        processor->run();
    }
    catch (MException &e)
    {
        if (config.stackTraces) LOG4CPLUS_ERROR(mlog, e.what());
        else LOG4CPLUS_ERROR(mlog, e.getComplaint());
        return exitCodeFor(e);
    }
    catch (std::exception &e)
    {
        LOG4CPLUS_ERROR(mlog, e.what());
        return exitCodeFor(e);
    }

    return EXITCODE_SUCCESS;
}


int MApplicationRunner::exitCodeFor(const std::exception &e)
{
    if (dynamic_cast<const MConfigurationError*>(&e)
            || dynamic_cast<const MKeyError*>(&e)
            || dynamic_cast<const MValueError*>(&e))
        return EXITCODE_CONFIGURATION_ERROR;
    if (dynamic_cast<const MInterruptError*>(&e))
        return EXITCODE_INTERRUPTED;
    if (dynamic_cast<const MMemoryError*>(&e)
            || dynamic_cast<const std::bad_alloc*>(&e))
        return EXITCODE_MEMORY_ERROR;
    if (dynamic_cast<const MIOError*>(&e))
        return EXITCODE_IO_ERROR;
    if (dynamic_cast<const MComputationError*>(&e))
        return EXITCODE_COMPUTATION_ERROR;
    return EXITCODE_UNSPECIFIC_ERROR;
}


void MApplicationRunner::initializeLogging(const QString &configFile,
                                           const QString &logLevel)
{
    if (!configFile.isEmpty() && QFile::exists(configFile))
    {
        // See http://log4cplus.sourceforge.net/index.html.
        log4cplus::PropertyConfigurator::doConfigure(
                    LOG4CPLUS_STRING_TO_TSTRING(configFile.toStdString()));
    }
    else
    {
        log4cplus::helpers::Properties properties;
        properties.setProperty(LOG4CPLUS_TEXT("log4cplus.rootLogger"),
                               LOG4CPLUS_TEXT("INFO, STDERR"));
        properties.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.STDERR"),
                               LOG4CPLUS_TEXT("log4cplus::ConsoleAppender"));
        properties.setProperty(
                    LOG4CPLUS_TEXT("log4cplus.appender.STDERR.logToStdErr"),
                    LOG4CPLUS_TEXT("true"));
        properties.setProperty(
                    LOG4CPLUS_TEXT("log4cplus.appender.STDERR.layout"),
                    LOG4CPLUS_TEXT("log4cplus::PatternLayout"));
        properties.setProperty(
                    LOG4CPLUS_TEXT("log4cplus.appender.STDERR.layout."
                                   "ConversionPattern"),
                    LOG4CPLUS_TEXT("%D{%Y-%m-%dT%H:%M:%S} %-5p %m%n"));
        log4cplus::PropertyConfigurator configurator(properties);
        configurator.configure();
    }

    QString level = logLevel.trimmed().toLower();
    if (level == "debug") mlog.setLogLevel(log4cplus::DEBUG_LOG_LEVEL);
    else if (level == "warning") mlog.setLogLevel(log4cplus::WARN_LOG_LEVEL);
    else if (level == "error") mlog.setLogLevel(log4cplus::ERROR_LOG_LEVEL);
    else if (level == "off") mlog.setLogLevel(log4cplus::OFF_LOG_LEVEL);
    else mlog.setLogLevel(log4cplus::INFO_LOG_LEVEL);
}


void MApplicationRunner::installSignalHandlers()
{
    numSignalsReceived = 0;
    MAbstractScheduler::clearInterruption();
    signal(SIGINT, metmcSignalHandler);
    signal(SIGTERM, metmcSignalHandler);
}


/******************************************************************************
***                           PRIVATE METHODS                               ***
*******************************************************************************/

void MApplicationRunner::logBanner() const
{
    LOG4CPLUS_INFO(mlog, "===================================================="
                   "============================");
    LOG4CPLUS_INFO(mlog, metmcSoftwareName.toStdString() << " "
                   << processorOperationToString(operation).toStdString()
                   << " -- Monte Carlo simulation of measurement "
                      "uncertainty");
    LOG4CPLUS_INFO(mlog, "version " << metmcVersionString.toStdString()
                   << ", " << metmcBuildDate.toStdString());
    LOG4CPLUS_INFO(mlog, "===================================================="
                   "============================");
    LOG4CPLUS_INFO(mlog, "");
    LOG4CPLUS_INFO(mlog, metmcSoftwareName.toStdString() << " is free "
                   "software under the GNU General Public License.");
    LOG4CPLUS_INFO(mlog, "It is distributed in the hope that it will be "
                   "useful, but WITHOUT ANY WARRANTY.");
    LOG4CPLUS_INFO(mlog, "");
}

} // namespace MetMC
