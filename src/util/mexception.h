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
#ifndef MEXCEPTION_H
#define MEXCEPTION_H

#include <exception>
#include <string>

namespace MetMC
{

/**
  Base class for all exceptions occuring in Met.MC.
  */
class MException : public std::exception
{
public:
    MException(const std::string& exceptionName, const std::string& complaint,
               const char* file, int line);
    virtual ~MException() throw();
    const char* what() const throw();

    /**
      Returns the complaint without file and line information.
     */
    const std::string& getComplaint() const { return message; }

    const std::string& getExceptionName() const { return exceptionName; }

private:
    std::string message;
    std::string exceptionName;
    std::string fileName;
    int lineNumber;
    std::string formattedMessage;
};


/**
  Thrown if a class in the Met.MC framework could not be correctly initialised.
  */
class MInitialisationError : public MException
{
public:
    MInitialisationError(const std::string& complaint,
                         const char* file, int line);
};


/**
  Invalid keys have been requested (e.g. request keys, variable names, ...).
  */
class MKeyError : public MException
{
public:
    MKeyError(const std::string& complaint,
              const char* file, int line);
};


/**
  Invalid values have been specified (e.g. a constant, ...).
  */
class MValueError : public MException
{
public:
    MValueError(const std::string& complaint,
                const char* file, int line);
};


/**
  Memory for a data field could not be allocated.
  */
class MMemoryError : public MException
{
public:
    MMemoryError(const std::string& complaint,
                 const char* file, int line);
};


/**
  The processor configuration or the input data are inconsistent (invalid
  selector, unknown source type, malformed glob, mismatching ensemble
  members, ...). Detected before any computation starts.
  */
class MConfigurationError : public MException
{
public:
    MConfigurationError(const std::string& complaint,
                        const char* file, int line);
};


/**
  Something goes wrong when accessing a dataset (unreadable source,
  unwritable target, netCDF library errors, ...).
  */
class MIOError : public MException
{
public:
    MIOError(const std::string& complaint,
             const char* file, int line);
};


/**
  A computation has produced an undefined result that must not be written.
  */
class MComputationError : public MException
{
public:
    MComputationError(const std::string& complaint,
                      const char* file, int line);
};


/**
  Processing has been interrupted by a signal (SIGINT, SIGTERM).
  */
class MInterruptError : public MException
{
public:
    MInterruptError(const std::string& complaint,
                    const char* file, int line);
};

} // namespace MetMC

#endif // MEXCEPTION_H
