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
#include "processorstate.h"

// standard library imports

// related third party imports
#include <log4cplus/loggingmacros.h>

// local application imports
#include "util/mutil.h"
#include "util/mexception.h"

namespace MetMC
{

QString processorStateToString(MProcessorState state)
{
    switch (state)
    {
    case INIT_STATE:
        return "INIT";
    case VALIDATING_INPUT_STATE:
        return "VALIDATING_INPUT";
    case BUILDING_GRAPH_STATE:
        return "BUILDING_GRAPH";
    case EXECUTING_STATE:
        return "EXECUTING";
    case WRITING_STATE:
        return "WRITING";
    case CLOSED_STATE:
        return "CLOSED";
    case FAILED_STATE:
        return "FAILED";
    }
    return "UNKNOWN";
}


/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MProcessorStateMachine::MProcessorStateMachine()
    : state(INIT_STATE)
{
}


/******************************************************************************
***                            PUBLIC METHODS                               ***
*******************************************************************************/

void MProcessorStateMachine::transitionTo(MProcessorState next)
{
    if (!isTransitionAllowed(state, next))
    {
        throw MValueError(QString("invalid processor state transition "
                                  "%1 -> %2")
                          .arg(processorStateToString(state))
                          .arg(processorStateToString(next)).toStdString(),
                          __FILE__, __LINE__);
    }

    LOG4CPLUS_DEBUG(mlog, "processor state "
                    << processorStateToString(state).toStdString() << " -> "
                    << processorStateToString(next).toStdString());
    state = next;
}


bool MProcessorStateMachine::fail()
{
    if (isTerminal()) return false;
    transitionTo(FAILED_STATE);
    return true;
}


bool MProcessorStateMachine::isTerminal() const
{
    return state == CLOSED_STATE || state == FAILED_STATE;
}


bool MProcessorStateMachine::isTransitionAllowed(MProcessorState from,
                                                 MProcessorState to)
{
    if (from == CLOSED_STATE || from == FAILED_STATE) return false;
    if (to == FAILED_STATE) return true;
    return int(to) == int(from) + 1;
}

} // namespace MetMC
