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
#ifndef PROCESSORSTATE_H
#define PROCESSORSTATE_H

// standard library imports

// related third party imports
#include <QtCore>

// local application imports


namespace MetMC
{

enum MProcessorState
{
    INIT_STATE             = 0,
    VALIDATING_INPUT_STATE = 1,
    BUILDING_GRAPH_STATE   = 2,
    EXECUTING_STATE        = 3,
    WRITING_STATE          = 4,
    CLOSED_STATE           = 5,
    FAILED_STATE           = 6
};

QString processorStateToString(MProcessorState state);


/**
  @brief MProcessorStateMachine tracks the stage of a processor run.

  States advance in the order INIT, VALIDATING_INPUT, BUILDING_GRAPH,
  EXECUTING, WRITING, CLOSED; stages may not be skipped or revisited. FAILED
  can be entered from any state except CLOSED and FAILED. CLOSED and FAILED
  are terminal.
  */
class MProcessorStateMachine
{
public:
    MProcessorStateMachine();

    MProcessorState getState() const { return state; }

    /**
      Advances to @p next. Throws an @ref MValueError if the transition is
      not allowed.
     */
    void transitionTo(MProcessorState next);

    /**
      Enters FAILED. Returns false (and leaves the state unchanged) if the
      current state is terminal.
     */
    bool fail();

    bool isTerminal() const;

    static bool isTransitionAllowed(MProcessorState from, MProcessorState to);

private:
    MProcessorState state;
};

} // namespace MetMC

#endif // PROCESSORSTATE_H
