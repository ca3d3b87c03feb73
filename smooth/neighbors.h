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

#ifndef SMOOTH_NEIGHBORS_H
#define SMOOTH_NEIGHBORS_H
#include <cstdint>

namespace hopchain {

/*
** A spatial index over the local particles of a partition. Indices are
** local particle indices. The neighbour list is ordered by increasing
** distance and starts with the particle itself.
*/
class NeighborIndex {
public:
    virtual ~NeighborIndex() = default;
    virtual int maxNeighbors() const = 0;
    virtual double density(int i) = 0;
    // Fills list with up to maxNeighbors() entries and returns how many.
    virtual int neighbors(int i, std::int32_t *list) = 0;
};

} // namespace hopchain

#endif
