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

#ifndef SERVICE_SMOOTHDENSITY_H
#define SERVICE_SMOOTHDENSITY_H
#include <cstdint>
#include <algorithm>
#include "TraversePST.h"

struct DensityCounts {
    std::uint64_t nInside;   // owned particles
    std::uint64_t nAbove;    // owned particles at or above the threshold
    std::uint64_t nPeaks;    // owned particles that are their own densest neighbour
    double dMaxDensity;
    DensityCounts &operator+=(const DensityCounts &rhs) {
        nInside += rhs.nInside;
        nAbove += rhs.nAbove;
        nPeaks += rhs.nPeaks;
        dMaxDensity = std::max(dMaxDensity,rhs.dMaxDensity);
        return *this;
    }
};

struct DensityInput {
    int nSmooth;
    int nMerge;       // checked here so a bad value fails before any index is built
    double dThreshold;
};

// Builds the neighbour index of every partition and computes densities.
class ServiceDensity : public TraversePartition<DensityInput,DensityCounts> {
public:
    explicit ServiceDensity(PST pst)
        : TraversePartition(pst,PST_DENSITY,"Density") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override;
};
#endif
