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
#include "mexception.h"

#include <sstream>

using namespace std;

namespace MetMC
{

MException::MException(const std::string& exceptionName, const std::string& complaint,
                       const char* file, int line)
    : message(complaint),
      exceptionName(exceptionName),
      fileName(file),
      lineNumber(line)
{
    if (complaint.length() == 0) message = "A Met.MC exception has occured";

    // The formatted message is kept as a member so that the pointer returned
    // by what() stays valid during the lifetime of the exception.
    stringstream s;
    s << "in " << fileName << " (line " << lineNumber << "), exception "
      << exceptionName << " has been thrown: " << message;
    formattedMessage = s.str();
}


MException::~MException() throw()
{
}


const char* MException::what() const throw()
{
    return formattedMessage.c_str();
}


MInitialisationError::MInitialisationError(const std::string &complaint,
                                           const char *file, int line)
    : MException("MInitialisationError", complaint, file, line)
{
}


MKeyError::MKeyError(const std::string &complaint,
                     const char *file, int line)
    : MException("MKeyError", complaint, file, line)
{
}


MValueError::MValueError(const std::string &complaint,
                         const char *file, int line)
    : MException("MValueError", complaint, file, line)
{
}


MMemoryError::MMemoryError(const std::string &complaint,
                           const char *file, int line)
    : MException("MMemoryError", complaint, file, line)
{
}


MConfigurationError::MConfigurationError(const std::string &complaint,
                                         const char *file, int line)
    : MException("MConfigurationError", complaint, file, line)
{
}


MIOError::MIOError(const std::string &complaint,
                   const char *file, int line)
    : MException("MIOError", complaint, file, line)
{
}


MComputationError::MComputationError(const std::string &complaint,
                                     const char *file, int line)
    : MException("MComputationError", complaint, file, line)
{
}


MInterruptError::MInterruptError(const std::string &complaint,
                                 const char *file, int line)
    : MException("MInterruptError", complaint, file, line)
{
}

} // namespace MetMC
