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

#ifndef CORE_DECOMP_H
#define CORE_DECOMP_H
#include <array>
#include "bound.h"

namespace hopchain {

// Passed around inside service messages so it must stay trivial.
struct DecompParameters {
    int    nGrid[3];    // domains per axis; all zero to factorise the thread count
    int    bPeriodic[3];
    double dBoxSize;
    double dPadding;
};

/*
** Regular grid decomposition of the box [0,dBoxSize)^3 into one domain
** per thread. Domain ids run x-major: id = (ix*ny + iy)*nz + iz.
*/
class Decomposition {
protected:
    std::array<int,3> nGrid;
    std::array<bool,3> bPeriodic;
    double dBoxSize;
    double dPadding;
public:
    Decomposition() = default;
    Decomposition(const DecompParameters &params, int nDomains);

    static std::array<int,3> factorise(int nDomains);

    int domains() const {return nGrid[0]*nGrid[1]*nGrid[2];}
    int grid(int d) const {return nGrid[d];}
    bool periodic(int d) const {return bPeriodic[d];}
    double box() const {return dBoxSize;}
    double padding() const {return dPadding;}

    std::array<int,3> coords(int iDomain) const;
    int id(const std::array<int,3> &c) const;
    Bound bound(int iDomain) const;
    int neighbor(int iDomain, int iShift) const;
    int owner(Bound::coord_type r) const;
};

} // namespace hopchain

#endif
