/*  This file is part of PKDGRAV3 (http://www.pkdgrav.org/).
 *  Copyright (c) 2001-2018 Joachim Stadel & Douglas Potter
 *
 *  PKDGRAV3 is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  PKDGRAV3 is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with PKDGRAV3.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef SMOOTH_DENSITY_H
#define SMOOTH_DENSITY_H
#include "core/partition.h"

namespace hopchain {

// Attach a kd-tree over the particles of the partition as its index.
void BuildNeighborIndex(Partition &part, int nSmooth);

// Fill density, the neighbour lists and densestNN for every local
// particle from the index attached to the partition.
void ComputeDensity(Partition &part);

} // namespace hopchain

#endif
