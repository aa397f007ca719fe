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
#include "abstractdataitem.h"

// standard library imports

// related third party imports

// local application imports

using namespace std;

namespace MetMC
{

/******************************************************************************
***                     CONSTRUCTOR / DESTRUCTOR                            ***
*******************************************************************************/

MAbstractDataItem::MAbstractDataItem()
    : generatingRequest("")
{
}


MAbstractDataItem::~MAbstractDataItem()
{
}

} // namespace MetMC
